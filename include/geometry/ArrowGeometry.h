#ifndef ARROWGEOMETRY_H
#define ARROWGEOMETRY_H

#include <QPointF>
#include <QPolygonF>

#include "Constants.h"
#include "geometry/LayerTypes.h"

/**
 * @brief Builds closed outlines for arrow and line layers.
 *
 * Outlines are ordered vertex lists whose last vertex connects back to the
 * first. A head's tip lands exactly on its endpoint. Head extent scales
 * with arrowSize and headScale; the number of vertices per head depends
 * only on the head type:
 * - Pointed: 2 per side (5 per head)
 * - Chevron: 3 per side (7 per head)
 * - Standard: 4 per side (9 per head)
 */
class ArrowGeometry
{
public:
    ArrowGeometry() = delete;

    /**
     * @brief Outline of a straight arrow from (x1, y1) to (x2, y2).
     * @param angle Direction of the segment in radians
     * @param perpAngle angle +/- PI/2, selects the side treated as "+"
     * @param halfShaftWidth Half of the shaft thickness
     * @param arrowSize Base length of a head before headScale
     * @param headScale Multiplier on head extent; non-positive means 1
     * @param tailWidth Extra width at (x1, y1); ignored for double heads
     * @return Empty polygon when any coordinate or size is not finite
     */
    static QPolygonF buildArrowVertices(qreal x1, qreal y1, qreal x2, qreal y2,
                                        qreal angle, qreal perpAngle,
                                        qreal halfShaftWidth, qreal arrowSize,
                                        ArrowStyle arrowStyle, ArrowHeadType headType,
                                        qreal headScale = 1.0, qreal tailWidth = 0.0);

    // One head ordered +perp side, tip, -perp side
    static QPolygonF buildHeadVertices(const QPointF& tip, qreal angle, qreal perpAngle,
                                       qreal halfShaftWidth, qreal arrowSize,
                                       qreal headScale, ArrowHeadType headType);

    /**
     * @brief Outline along the quadratic curve p0 -> control -> p1.
     *
     * Heads are oriented by the curve tangent at t=0 and t=1. Shaft samples
     * that a head would cover are dropped.
     */
    static QPolygonF buildCurvedArrowVertices(const QPointF& p0, const QPointF& control,
                                              const QPointF& p1, qreal halfShaftWidth,
                                              qreal arrowSize, ArrowStyle arrowStyle,
                                              ArrowHeadType headType, qreal headScale = 1.0,
                                              qreal tailWidth = 0.0,
                                              int samples = LayerKit::Arrow::kCurveSegments);

    // Outline for an arrow or line layer using its style fields; empty if invalid
    static QPolygonF buildLayerOutline(const Layer& layer);

    // Tangent direction (radians) of a quadratic Bezier at parameter t
    static qreal getBezierTangent(qreal t, qreal x0, qreal y0, qreal cx, qreal cy,
                                  qreal x1, qreal y1);

    static QPointF bezierPoint(qreal t, const QPointF& p0, const QPointF& control,
                               const QPointF& p1);

    // True when the control point is off the chord midpoint by more than the curve threshold
    static bool isCurved(const Layer& layer);

    static qreal shaftWidth(qreal arrowSize, qreal strokeWidth);

    // Distance from the tip back to where a head meets the shaft
    static qreal headDepth(qreal arrowSize, qreal headScale);

private:
    static qreal effectiveHeadScale(qreal headScale);
    static QPointF toWorld(const QPointF& origin, qreal angle, qreal perpAngle,
                           qreal along, qreal across);
};

#endif // ARROWGEOMETRY_H
