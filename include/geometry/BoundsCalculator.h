#ifndef BOUNDSCALCULATOR_H
#define BOUNDSCALCULATOR_H

#include <QPointF>
#include <QRectF>
#include <QVector>
#include <optional>

#include "geometry/LayerTypes.h"

/**
 * @brief Axis-aligned bounds for layer records and set algebra over bounds.
 *
 * Every bounds value returned here is normalized (non-negative width and
 * height). Missing or non-finite required fields yield std::nullopt.
 * Layers are never modified.
 *
 * Edge tests are inclusive on all sides. Zero-size bounds are valid
 * values and take part in merges and intersections like any other.
 */
class BoundsCalculator
{
public:
    BoundsCalculator() = delete;

    /**
     * @brief Bounds of any layer, dispatched on its type.
     *
     * Rectangle, blur, textbox and image use rectangularBounds(); line and
     * arrow use lineBounds(); circle and ellipse use ellipseBounds(); path
     * and point-array polygons use polygonBounds(); stars and radius-defined
     * polygons use the envelope of their synthesized vertices; text uses
     * textBounds(). Groups and unknown types have no bounds.
     */
    static std::optional<QRectF> getLayerBounds(const Layer& layer);

    // x, y, width, height; negative extents shift the origin
    static std::optional<QRectF> getRectangularBounds(const Layer& layer);

    // Rectangle spanning (x1, y1) and (x2, y2)
    static std::optional<QRectF> getLineBounds(const Layer& layer);

    // Center x, y with radiusX/radiusY, each falling back to radius
    static std::optional<QRectF> getEllipseBounds(const Layer& layer);

    // Envelope of a points array with at least two entries
    static std::optional<QRectF> getPolygonBounds(const Layer& layer);

    // Explicit width and height give a plain rectangle at (x, y); otherwise a
    // single-line estimate anchored at the text baseline
    static std::optional<QRectF> getTextBounds(const Layer& layer);

    // Union of the present entries; nullopt when none are present
    static std::optional<QRectF> mergeBounds(const QVector<std::optional<QRectF>>& boundsList);
    static std::optional<QRectF> mergeBounds(const QVector<QRectF>& boundsList);

    static std::optional<QRectF> getMultiLayerBounds(const QVector<Layer>& layers);

    // Inclusive on all four edges
    static bool isPointInBounds(const QPointF& point, const std::optional<QRectF>& bounds);

    // Closed-interval overlap, so touching edges intersect
    static bool boundsIntersect(const std::optional<QRectF>& a, const std::optional<QRectF>& b);

    /**
     * @brief Grow (or, for a negative amount, shrink) on all four sides.
     *
     * Shrinking past the center collapses that axis to zero extent at
     * the center, so the result is always normalized.
     * @return The input unchanged when amount is not finite
     */
    static QRectF expandBounds(const QRectF& bounds, qreal amount);

    static std::optional<QPointF> getBoundsCenter(const std::optional<QRectF>& bounds);

private:
    static std::optional<QRectF> getVertexBounds(const Layer& layer);
};

#endif // BOUNDSCALCULATOR_H
