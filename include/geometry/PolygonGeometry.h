#ifndef POLYGONGEOMETRY_H
#define POLYGONGEOMETRY_H

#include <QPointF>
#include <QPolygonF>
#include <QRectF>
#include <optional>

#include "geometry/LayerTypes.h"

/**
 * @brief Vertex synthesis for regular polygons and stars.
 *
 * All shapes start with a vertex at the top (angle -PI/2) and proceed
 * clockwise in screen coordinates. No rotation is applied here.
 */
class PolygonGeometry
{
public:
    PolygonGeometry() = delete;

    // Regular polygon with max(3, sides) vertices; empty above Shape::kMaxSides
    static QPolygonF getPolygonVertices(const QPointF& center, qreal radius, int sides);

    // Star with 2 * max(3, points) vertices alternating outer and inner radius;
    // empty above Shape::kMaxStarPoints
    static QPolygonF getStarVertices(const QPointF& center, qreal outerRadius,
                                     qreal innerRadius, int points);

    /**
     * @brief Outline of a polygon, star or path layer.
     *
     * Polygons with a points array use the points that carry both
     * coordinates. Polygons without one are synthesized from x, y,
     * radius (or outerRadius) and sides. Stars are synthesized from
     * x, y, outerRadius (or radius), innerRadius and starPoints.
     *
     * @return The vertices, or nullopt when required fields are missing
     */
    static std::optional<QPolygonF> layerVertices(const Layer& layer);

    // Points of a points array that have both coordinates, in order
    static QPolygonF validPoints(const QVector<PointRecord>& points);

    // Envelope of the vertices; nullopt for an empty polygon
    static std::optional<QRectF> getBoundsFromVertices(const QPolygonF& vertices);

    // Even-odd containment; fewer than 3 vertices never contain anything
    static bool isPointInPolygon(const QPointF& point, const QPolygonF& vertices);

private:
    static std::optional<QPolygonF> regularPolygonVertices(const Layer& layer);
    static std::optional<QPolygonF> starVertices(const Layer& layer);
};

#endif // POLYGONGEOMETRY_H
