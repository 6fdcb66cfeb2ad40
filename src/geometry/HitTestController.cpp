#include "geometry/HitTestController.h"
#include "geometry/ArrowGeometry.h"
#include "geometry/BoundsCalculator.h"
#include "geometry/PolygonGeometry.h"

#include <QLineF>
#include <QtMath>
#include <algorithm>
#include <cmath>
#include <limits>

using namespace LayerKit;

HitTestController::HitTestController(const ILayerSource* source, const HitTestOptions& options)
    : m_source(source)
    , m_options(options)
{
}

const Layer* HitTestController::getLayerAtPoint(const QPointF& point) const
{
    if (!m_source || !std::isfinite(point.x()) || !std::isfinite(point.y())) {
        return nullptr;
    }

    for (const Layer& layer : m_source->layers()) {
        if (!layer.visible || layer.locked) {
            continue;
        }
        if (containsPoint(layer, point)) {
            return &layer;
        }
    }
    return nullptr;
}

QVector<const Layer*> HitTestController::getLayersInRect(const QRectF& rect) const
{
    QVector<const Layer*> hits;
    if (!m_source || !std::isfinite(rect.x()) || !std::isfinite(rect.y()) ||
        !std::isfinite(rect.width()) || !std::isfinite(rect.height())) {
        return hits;
    }

    const QRectF marquee = rect.normalized();
    for (const Layer& layer : m_source->layers()) {
        if (!layer.visible || layer.locked) {
            continue;
        }
        if (BoundsCalculator::boundsIntersect(marquee, m_source->getLayerBounds(layer))) {
            hits.append(&layer);
        }
    }
    return hits;
}

bool HitTestController::containsPoint(const Layer& layer, const QPointF& point) const
{
    switch (layer.type) {
    case LayerType::Rectangle:
    case LayerType::TextBox:
    case LayerType::Image:
        return hitRectangle(layer, point);
    case LayerType::Circle:
        return hitCircle(layer, point);
    case LayerType::Ellipse:
        return hitEllipse(layer, point);
    case LayerType::Line:
    case LayerType::Arrow:
        return hitLine(layer, point);
    case LayerType::Path:
        return hitPath(layer, point);
    case LayerType::Polygon:
    case LayerType::Star:
        return hitPolygon(layer, point);
    case LayerType::Text:
    case LayerType::Blur:
        return hitBounds(layer, point);
    case LayerType::Group:
    case LayerType::Unknown:
        break;
    }
    return false;
}

qreal HitTestController::lineTolerance(const Layer& layer) const
{
    const qreal strokeWidth = qAbs(LayerFields::valueOr(layer.strokeWidth, Arrow::kDefaultStrokeWidth));
    return std::max(m_options.minLineTolerance, strokeWidth + HitTest::kStrokePadding);
}

qreal HitTestController::pointToSegmentDistance(const QPointF& point, const QPointF& a, const QPointF& b)
{
    const qreal dx = b.x() - a.x();
    const qreal dy = b.y() - a.y();
    const qreal lengthSquared = dx * dx + dy * dy;
    if (lengthSquared == 0.0) {
        return QLineF(point, a).length();
    }

    // Project onto the segment and clamp to its extent
    qreal t = ((point.x() - a.x()) * dx + (point.y() - a.y()) * dy) / lengthSquared;
    t = qBound(0.0, t, 1.0);
    const QPointF nearest(a.x() + t * dx, a.y() + t * dy);
    return QLineF(point, nearest).length();
}

qreal HitTestController::pointToQuadraticBezierDistance(const QPointF& point, const QPointF& p0,
                                                        const QPointF& control, const QPointF& p1,
                                                        int samples)
{
    const int count = qBound(HitTest::kMinCurveSamples, samples, HitTest::kMaxCurveSamples);
    qreal best = std::numeric_limits<qreal>::max();
    QPointF previous = p0;
    for (int i = 1; i <= count; ++i) {
        const QPointF current = ArrowGeometry::bezierPoint(static_cast<qreal>(i) / count,
                                                           p0, control, p1);
        best = std::min(best, pointToSegmentDistance(point, previous, current));
        previous = current;
    }
    return best;
}

bool HitTestController::hitRectangle(const Layer& layer, const QPointF& point) const
{
    return BoundsCalculator::isPointInBounds(point, BoundsCalculator::getRectangularBounds(layer));
}

bool HitTestController::hitCircle(const Layer& layer, const QPointF& point) const
{
    if (!LayerFields::allUsable({layer.x, layer.y, layer.radius})) {
        // A circle described by radiusX/radiusY is measured like an ellipse
        return hitEllipse(layer, point);
    }

    return QLineF(point, QPointF(*layer.x, *layer.y)).length() <= qAbs(*layer.radius);
}

bool HitTestController::hitEllipse(const Layer& layer, const QPointF& point) const
{
    if (!LayerFields::allUsable({layer.x, layer.y})) {
        return false;
    }

    const qreal fallback = LayerFields::valueOr(layer.radius, 0.0);
    const qreal rx = qAbs(LayerFields::valueOr(layer.radiusX, fallback));
    const qreal ry = qAbs(LayerFields::valueOr(layer.radiusY, fallback));
    if (rx == 0.0 || ry == 0.0) {
        return false;
    }

    const qreal nx = (point.x() - *layer.x) / rx;
    const qreal ny = (point.y() - *layer.y) / ry;
    return nx * nx + ny * ny <= 1.0;
}

bool HitTestController::hitLine(const Layer& layer, const QPointF& point) const
{
    if (!LayerFields::allUsable({layer.x1, layer.y1, layer.x2, layer.y2})) {
        return false;
    }

    const QPointF start(*layer.x1, *layer.y1);
    const QPointF end(*layer.x2, *layer.y2);
    const qreal tolerance = lineTolerance(layer);

    if (ArrowGeometry::isCurved(layer)) {
        const QPointF control(*layer.controlX, *layer.controlY);
        return pointToQuadraticBezierDistance(point, start, control, end,
                                              m_options.curveSamples) <= tolerance;
    }
    return pointToSegmentDistance(point, start, end) <= tolerance;
}

bool HitTestController::hitPath(const Layer& layer, const QPointF& point) const
{
    const QPolygonF points = PolygonGeometry::validPoints(layer.points);
    if (points.size() < 2) {
        return false;
    }

    const qreal tolerance = lineTolerance(layer);
    for (int i = 1; i < points.size(); ++i) {
        if (pointToSegmentDistance(point, points[i - 1], points[i]) <= tolerance) {
            return true;
        }
    }
    return false;
}

bool HitTestController::hitPolygon(const Layer& layer, const QPointF& point) const
{
    const std::optional<QPolygonF> vertices = PolygonGeometry::layerVertices(layer);
    return vertices && PolygonGeometry::isPointInPolygon(point, *vertices);
}

bool HitTestController::hitBounds(const Layer& layer, const QPointF& point) const
{
    const std::optional<QRectF> bounds = m_source ? m_source->getLayerBounds(layer)
                                                  : BoundsCalculator::getLayerBounds(layer);
    return BoundsCalculator::isPointInBounds(point, bounds);
}
