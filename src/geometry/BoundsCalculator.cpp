#include "geometry/BoundsCalculator.h"
#include "geometry/PolygonGeometry.h"
#include "Constants.h"

#include <QtMath>
#include <algorithm>
#include <cmath>

using namespace LayerKit;

namespace {

QRectF rectFromExtents(qreal minX, qreal minY, qreal maxX, qreal maxY)
{
    return QRectF(minX, minY, maxX - minX, maxY - minY);
}

} // namespace

std::optional<QRectF> BoundsCalculator::getLayerBounds(const Layer& layer)
{
    switch (layer.type) {
    case LayerType::Rectangle:
    case LayerType::Blur:
    case LayerType::TextBox:
    case LayerType::Image:
        return getRectangularBounds(layer);
    case LayerType::Line:
    case LayerType::Arrow:
        return getLineBounds(layer);
    case LayerType::Circle:
    case LayerType::Ellipse:
        return getEllipseBounds(layer);
    case LayerType::Path:
        return getPolygonBounds(layer);
    case LayerType::Polygon:
        if (!layer.points.isEmpty()) {
            return getPolygonBounds(layer);
        }
        return getVertexBounds(layer);
    case LayerType::Star:
        return getVertexBounds(layer);
    case LayerType::Text:
        return getTextBounds(layer);
    case LayerType::Group:
    case LayerType::Unknown:
        break;
    }
    return std::nullopt;
}

std::optional<QRectF> BoundsCalculator::getRectangularBounds(const Layer& layer)
{
    if (!LayerFields::allUsable({layer.x, layer.y, layer.width, layer.height})) {
        return std::nullopt;
    }

    // Drawn right-to-left or bottom-to-top
    const qreal minX = std::min(*layer.x, *layer.x + *layer.width);
    const qreal minY = std::min(*layer.y, *layer.y + *layer.height);
    return QRectF(minX, minY, qAbs(*layer.width), qAbs(*layer.height));
}

std::optional<QRectF> BoundsCalculator::getLineBounds(const Layer& layer)
{
    if (!LayerFields::allUsable({layer.x1, layer.y1, layer.x2, layer.y2})) {
        return std::nullopt;
    }

    return rectFromExtents(std::min(*layer.x1, *layer.x2), std::min(*layer.y1, *layer.y2),
                           std::max(*layer.x1, *layer.x2), std::max(*layer.y1, *layer.y2));
}

std::optional<QRectF> BoundsCalculator::getEllipseBounds(const Layer& layer)
{
    if (!LayerFields::allUsable({layer.x, layer.y})) {
        return std::nullopt;
    }

    const bool hasRadius = LayerFields::isUsable(layer.radius);
    const bool hasRadiusX = LayerFields::isUsable(layer.radiusX);
    const bool hasRadiusY = LayerFields::isUsable(layer.radiusY);
    if (!hasRadius && !hasRadiusX && !hasRadiusY) {
        return std::nullopt;
    }

    const qreal fallback = hasRadius ? *layer.radius : 0.0;
    const qreal rx = qAbs(hasRadiusX ? *layer.radiusX : fallback);
    const qreal ry = qAbs(hasRadiusY ? *layer.radiusY : fallback);

    return QRectF(*layer.x - rx, *layer.y - ry, rx * 2.0, ry * 2.0);
}

std::optional<QRectF> BoundsCalculator::getPolygonBounds(const Layer& layer)
{
    if (layer.points.size() < 2) {
        return std::nullopt;
    }

    // Points missing a coordinate are skipped, not zero-filled
    return PolygonGeometry::getBoundsFromVertices(PolygonGeometry::validPoints(layer.points));
}

std::optional<QRectF> BoundsCalculator::getTextBounds(const Layer& layer)
{
    if (layer.type != LayerType::Text || !LayerFields::allUsable({layer.x, layer.y})) {
        return std::nullopt;
    }

    // A sized text box is placed at (x, y) like any rectangle
    if (LayerFields::allUsable({layer.width, layer.height})) {
        return getRectangularBounds(layer);
    }

    qreal fontSize = LayerFields::valueOr(layer.fontSize, Text::kDefaultFontSize);
    if (fontSize <= 0.0) {
        fontSize = Text::kDefaultFontSize;
    }

    qreal width = fontSize * Text::kFallbackWidthEms;
    if (LayerFields::isUsable(layer.width) && *layer.width != 0.0) {
        width = *layer.width;
    } else if (!layer.text.isEmpty()) {
        width = layer.text.length() * fontSize * Text::kCharWidthRatio;
    }

    qreal height = fontSize * Text::kLineHeightRatio;
    if (LayerFields::isUsable(layer.height) && *layer.height != 0.0) {
        height = *layer.height;
    }

    // Estimated boxes hang above the baseline at y
    const qreal top = *layer.y - fontSize;
    return QRectF(std::min(*layer.x, *layer.x + width), std::min(top, top + height),
                  qAbs(width), qAbs(height));
}

std::optional<QRectF> BoundsCalculator::mergeBounds(const QVector<std::optional<QRectF>>& boundsList)
{
    bool found = false;
    qreal minX = 0.0;
    qreal minY = 0.0;
    qreal maxX = 0.0;
    qreal maxY = 0.0;

    for (const auto& bounds : boundsList) {
        if (!bounds) {
            continue;
        }
        if (!found) {
            minX = bounds->left();
            minY = bounds->top();
            maxX = bounds->left() + bounds->width();
            maxY = bounds->top() + bounds->height();
            found = true;
            continue;
        }
        minX = std::min(minX, bounds->left());
        minY = std::min(minY, bounds->top());
        maxX = std::max(maxX, bounds->left() + bounds->width());
        maxY = std::max(maxY, bounds->top() + bounds->height());
    }

    if (!found) {
        return std::nullopt;
    }
    return rectFromExtents(minX, minY, maxX, maxY);
}

std::optional<QRectF> BoundsCalculator::mergeBounds(const QVector<QRectF>& boundsList)
{
    QVector<std::optional<QRectF>> wrapped;
    wrapped.reserve(boundsList.size());
    for (const QRectF& bounds : boundsList) {
        wrapped.append(bounds);
    }
    return mergeBounds(wrapped);
}

std::optional<QRectF> BoundsCalculator::getMultiLayerBounds(const QVector<Layer>& layers)
{
    QVector<std::optional<QRectF>> boundsList;
    boundsList.reserve(layers.size());
    for (const Layer& layer : layers) {
        boundsList.append(getLayerBounds(layer));
    }
    return mergeBounds(boundsList);
}

bool BoundsCalculator::isPointInBounds(const QPointF& point, const std::optional<QRectF>& bounds)
{
    if (!bounds) {
        return false;
    }

    return point.x() >= bounds->left() &&
           point.x() <= bounds->left() + bounds->width() &&
           point.y() >= bounds->top() &&
           point.y() <= bounds->top() + bounds->height();
}

bool BoundsCalculator::boundsIntersect(const std::optional<QRectF>& a, const std::optional<QRectF>& b)
{
    if (!a || !b) {
        return false;
    }

    return !(a->left() + a->width() < b->left() ||
             b->left() + b->width() < a->left() ||
             a->top() + a->height() < b->top() ||
             b->top() + b->height() < a->top());
}

QRectF BoundsCalculator::expandBounds(const QRectF& bounds, qreal amount)
{
    if (!std::isfinite(amount)) {
        return bounds;
    }

    qreal left = bounds.left() - amount;
    qreal top = bounds.top() - amount;
    qreal width = bounds.width() + amount * 2.0;
    qreal height = bounds.height() + amount * 2.0;
    if (width < 0.0) {
        left = bounds.left() + bounds.width() / 2.0;
        width = 0.0;
    }
    if (height < 0.0) {
        top = bounds.top() + bounds.height() / 2.0;
        height = 0.0;
    }
    return QRectF(left, top, width, height);
}

std::optional<QPointF> BoundsCalculator::getBoundsCenter(const std::optional<QRectF>& bounds)
{
    if (!bounds) {
        return std::nullopt;
    }

    return QPointF(bounds->left() + bounds->width() / 2.0,
                   bounds->top() + bounds->height() / 2.0);
}

std::optional<QRectF> BoundsCalculator::getVertexBounds(const Layer& layer)
{
    const std::optional<QPolygonF> vertices = PolygonGeometry::layerVertices(layer);
    if (!vertices) {
        return std::nullopt;
    }
    return PolygonGeometry::getBoundsFromVertices(*vertices);
}
