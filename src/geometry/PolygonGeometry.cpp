#include "geometry/PolygonGeometry.h"
#include "Constants.h"

#include <QtMath>
#include <algorithm>

using namespace LayerKit;

QPolygonF PolygonGeometry::getPolygonVertices(const QPointF& center, qreal radius, int sides)
{
    QPolygonF vertices;
    if (sides > Shape::kMaxSides) {
        return vertices;
    }

    const int count = qMax(Shape::kMinSides, sides);
    vertices.reserve(count);

    for (int i = 0; i < count; ++i) {
        const qreal angle = (i * 2.0 * M_PI) / count - M_PI / 2.0;
        vertices.append(QPointF(center.x() + radius * qCos(angle),
                                center.y() + radius * qSin(angle)));
    }
    return vertices;
}

QPolygonF PolygonGeometry::getStarVertices(const QPointF& center, qreal outerRadius,
                                           qreal innerRadius, int points)
{
    QPolygonF vertices;
    if (points > Shape::kMaxStarPoints) {
        return vertices;
    }

    const int count = qMax(Shape::kMinSides, points);
    vertices.reserve(count * 2);

    // Outer vertices are 2*PI/count apart, inner ones sit halfway between
    for (int i = 0; i < count * 2; ++i) {
        const qreal angle = (i * M_PI) / count - M_PI / 2.0;
        const qreal r = (i % 2 == 0) ? outerRadius : innerRadius;
        vertices.append(QPointF(center.x() + r * qCos(angle),
                                center.y() + r * qSin(angle)));
    }
    return vertices;
}

std::optional<QPolygonF> PolygonGeometry::layerVertices(const Layer& layer)
{
    switch (layer.type) {
    case LayerType::Polygon:
        if (!layer.points.isEmpty()) {
            const QPolygonF vertices = validPoints(layer.points);
            if (vertices.isEmpty()) {
                return std::nullopt;
            }
            return vertices;
        }
        return regularPolygonVertices(layer);
    case LayerType::Star:
        return starVertices(layer);
    case LayerType::Path: {
        const QPolygonF vertices = validPoints(layer.points);
        if (vertices.isEmpty()) {
            return std::nullopt;
        }
        return vertices;
    }
    default:
        return std::nullopt;
    }
}

QPolygonF PolygonGeometry::validPoints(const QVector<PointRecord>& points)
{
    QPolygonF vertices;
    vertices.reserve(points.size());
    for (const PointRecord& p : points) {
        if (LayerFields::isUsable(p.x) && LayerFields::isUsable(p.y)) {
            vertices.append(QPointF(*p.x, *p.y));
        }
    }
    return vertices;
}

std::optional<QRectF> PolygonGeometry::getBoundsFromVertices(const QPolygonF& vertices)
{
    if (vertices.isEmpty()) {
        return std::nullopt;
    }

    qreal minX = vertices.first().x();
    qreal minY = vertices.first().y();
    qreal maxX = minX;
    qreal maxY = minY;
    for (const QPointF& v : vertices) {
        minX = std::min(minX, v.x());
        minY = std::min(minY, v.y());
        maxX = std::max(maxX, v.x());
        maxY = std::max(maxY, v.y());
    }
    return QRectF(minX, minY, maxX - minX, maxY - minY);
}

bool PolygonGeometry::isPointInPolygon(const QPointF& point, const QPolygonF& vertices)
{
    if (vertices.size() < 3) {
        return false;
    }

    // Ray cast towards +x, toggling on each crossed edge
    bool inside = false;
    const int n = vertices.size();
    for (int i = 0, j = n - 1; i < n; j = i++) {
        const QPointF& vi = vertices.at(i);
        const QPointF& vj = vertices.at(j);
        if (((vi.y() > point.y()) != (vj.y() > point.y())) &&
            (point.x() < (vj.x() - vi.x()) * (point.y() - vi.y()) / (vj.y() - vi.y()) + vi.x())) {
            inside = !inside;
        }
    }
    return inside;
}

std::optional<QPolygonF> PolygonGeometry::regularPolygonVertices(const Layer& layer)
{
    if (!LayerFields::allUsable({layer.x, layer.y})) {
        return std::nullopt;
    }

    std::optional<qreal> radius = LayerFields::usable(layer.radius);
    if (!radius) {
        radius = LayerFields::usable(layer.outerRadius);
    }
    if (!radius) {
        return std::nullopt;
    }

    const int sides = layer.sides.value_or(Shape::kDefaultPolygonSides);
    if (sides > Shape::kMaxSides) {
        return std::nullopt;
    }
    return getPolygonVertices(QPointF(*layer.x, *layer.y), qAbs(*radius), sides);
}

std::optional<QPolygonF> PolygonGeometry::starVertices(const Layer& layer)
{
    if (!LayerFields::allUsable({layer.x, layer.y})) {
        return std::nullopt;
    }

    std::optional<qreal> outer = LayerFields::usable(layer.outerRadius);
    if (!outer) {
        outer = LayerFields::usable(layer.radius);
    }
    if (!outer) {
        return std::nullopt;
    }

    const qreal outerRadius = qAbs(*outer);
    const qreal innerRadius = qAbs(LayerFields::valueOr(layer.innerRadius,
                                                        outerRadius * Shape::kStarInnerRadiusRatio));
    const int points = layer.starPoints.value_or(Shape::kDefaultStarPoints);
    if (points > Shape::kMaxStarPoints) {
        return std::nullopt;
    }
    return getStarVertices(QPointF(*layer.x, *layer.y), outerRadius, innerRadius, points);
}
