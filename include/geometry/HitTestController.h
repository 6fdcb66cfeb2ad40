#ifndef HITTESTCONTROLLER_H
#define HITTESTCONTROLLER_H

#include <QPointF>
#include <QRectF>
#include <QVector>

#include "Constants.h"
#include "geometry/ILayerSource.h"

// Tunables for line-like containment, in layer units
struct HitTestOptions
{
    qreal minLineTolerance = LayerKit::HitTest::kMinLineTolerance;
    int curveSamples = LayerKit::HitTest::kCurveSamples;
};

/**
 * @brief Finds the layer under a point.
 *
 * Layers are scanned in source order and the first visible, unlocked
 * layer whose shape contains the point wins. Shapes are tested in their
 * own coordinate space; rotation is not applied. Groups and unknown
 * types never match.
 */
class HitTestController
{
public:
    explicit HitTestController(const ILayerSource* source,
                               const HitTestOptions& options = HitTestOptions());

    /**
     * @brief First eligible layer containing the point.
     * @return Pointer into the source's layer list, or nullptr if nothing matches
     */
    const Layer* getLayerAtPoint(const QPointF& point) const;

    /**
     * @brief Visible, unlocked layers whose bounds meet a drag rectangle.
     *
     * The rectangle is normalized first and touching edges count as
     * overlap. Results keep source order.
     * @return Pointers into the source's layer list; empty when nothing meets it
     */
    QVector<const Layer*> getLayersInRect(const QRectF& rect) const;

    // Shape test only; visible/locked are not considered here
    bool containsPoint(const Layer& layer, const QPointF& point) const;

    // max(minLineTolerance, strokeWidth + padding)
    qreal lineTolerance(const Layer& layer) const;

    void setOptions(const HitTestOptions& options) { m_options = options; }
    HitTestOptions options() const { return m_options; }

    // Distance to the nearest point of the finite segment a-b
    static qreal pointToSegmentDistance(const QPointF& point, const QPointF& a, const QPointF& b);

    // Distance to a quadratic Bezier approximated by `samples` chords
    static qreal pointToQuadraticBezierDistance(const QPointF& point, const QPointF& p0,
                                                const QPointF& control, const QPointF& p1,
                                                int samples);

private:
    bool hitRectangle(const Layer& layer, const QPointF& point) const;
    bool hitCircle(const Layer& layer, const QPointF& point) const;
    bool hitEllipse(const Layer& layer, const QPointF& point) const;
    bool hitLine(const Layer& layer, const QPointF& point) const;
    bool hitPath(const Layer& layer, const QPointF& point) const;
    bool hitPolygon(const Layer& layer, const QPointF& point) const;
    bool hitBounds(const Layer& layer, const QPointF& point) const;

    const ILayerSource* m_source;
    HitTestOptions m_options;
};

#endif // HITTESTCONTROLLER_H
