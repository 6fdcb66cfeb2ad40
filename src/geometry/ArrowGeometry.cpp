#include "geometry/ArrowGeometry.h"

#include <QLineF>
#include <QVector>
#include <QtMath>
#include <algorithm>
#include <cmath>

using namespace LayerKit;

namespace {

bool allFinite(std::initializer_list<qreal> values)
{
    for (qreal value : values) {
        if (!std::isfinite(value)) {
            return false;
        }
    }
    return true;
}

/**
 * Vertices of the +perp half of a head in the head's local frame,
 * x along the direction of travel (tip at the origin, so x <= 0) and
 * y across it. Ordered from the shaft outward toward the tip.
 */
QVector<QPointF> headHalfProfile(ArrowHeadType headType, qreal length, qreal depth,
                                 qreal halfShaft)
{
    const qreal halfAngle = qDegreesToRadians(Arrow::kHeadHalfAngleDegrees);
    const qreal cosA = qCos(halfAngle);
    const qreal sinA = qSin(halfAngle);
    const qreal thickness = halfShaft * Arrow::kHeadThicknessRatio;
    const QPointF barb(-length * cosA, length * sinA);

    switch (headType) {
    case ArrowHeadType::Chevron: {
        // Inner edge runs parallel to the flank, offset by the thickness
        const QPointF inner = barb + QPointF(-sinA, -cosA) * thickness;
        const qreal t = std::max<qreal>(0.0, (inner.y() - halfShaft) / sinA);
        const QPointF notch = inner + QPointF(cosA, -sinA) * t;
        return {notch, inner, barb};
    }
    case ArrowHeadType::Standard: {
        const qreal base = length * sinA + thickness;
        const qreal ease = thickness / 2.0;
        const QPointF corner(-depth, base);
        const qreal flank = std::hypot(depth, base);
        const QPointF toTip = flank > 0.0 ? QPointF(depth / flank, -base / flank) : QPointF();
        return {QPointF(-depth - ease, halfShaft),
                QPointF(-depth, halfShaft + ease),
                QPointF(-depth, base - ease),
                corner + toTip * ease};
    }
    case ArrowHeadType::Pointed:
        break;
    }
    return {QPointF(-depth, halfShaft), barb};
}

} // namespace

QPolygonF ArrowGeometry::buildArrowVertices(qreal x1, qreal y1, qreal x2, qreal y2,
                                            qreal angle, qreal perpAngle,
                                            qreal halfShaftWidth, qreal arrowSize,
                                            ArrowStyle arrowStyle, ArrowHeadType headType,
                                            qreal headScale, qreal tailWidth)
{
    if (!allFinite({x1, y1, x2, y2, angle, perpAngle, halfShaftWidth, arrowSize})) {
        return QPolygonF();
    }

    const QPointF start(x1, y1);
    const QPointF end(x2, y2);
    const QPointF perp(qCos(perpAngle), qSin(perpAngle));
    const qreal half = qAbs(halfShaftWidth);
    const qreal tailExtra = (std::isfinite(tailWidth) && tailWidth > 0.0) ? tailWidth / 2.0 : 0.0;

    QPolygonF outline;
    switch (arrowStyle) {
    case ArrowStyle::None:
        outline << start + perp * (half + tailExtra)
                << end + perp * half
                << end - perp * half
                << start - perp * (half + tailExtra);
        break;
    case ArrowStyle::Single:
        outline << start + perp * (half + tailExtra);
        outline += buildHeadVertices(end, angle, perpAngle, half, arrowSize, headScale, headType);
        outline << start - perp * (half + tailExtra);
        break;
    case ArrowStyle::Double:
        // Tail head faces backwards, so its +perp side is the outline's -perp side
        outline += buildHeadVertices(start, angle + M_PI, perpAngle + M_PI, half, arrowSize,
                                     headScale, headType);
        outline += buildHeadVertices(end, angle, perpAngle, half, arrowSize, headScale, headType);
        break;
    }
    return outline;
}

QPolygonF ArrowGeometry::buildHeadVertices(const QPointF& tip, qreal angle, qreal perpAngle,
                                           qreal halfShaftWidth, qreal arrowSize,
                                           qreal headScale, ArrowHeadType headType)
{
    const qreal scale = effectiveHeadScale(headScale);
    const qreal length = qAbs(arrowSize) * Arrow::kHeadLengthRatio * scale;
    const qreal depth = headDepth(arrowSize, scale);
    const QVector<QPointF> profile = headHalfProfile(headType, length, depth, qAbs(halfShaftWidth));

    QPolygonF head;
    head.reserve(profile.size() * 2 + 1);
    for (const QPointF& p : profile) {
        head << toWorld(tip, angle, perpAngle, p.x(), p.y());
    }
    head << tip;
    for (auto it = profile.crbegin(); it != profile.crend(); ++it) {
        head << toWorld(tip, angle, perpAngle, it->x(), -it->y());
    }
    return head;
}

QPolygonF ArrowGeometry::buildCurvedArrowVertices(const QPointF& p0, const QPointF& control,
                                                  const QPointF& p1, qreal halfShaftWidth,
                                                  qreal arrowSize, ArrowStyle arrowStyle,
                                                  ArrowHeadType headType, qreal headScale,
                                                  qreal tailWidth, int samples)
{
    if (!allFinite({p0.x(), p0.y(), control.x(), control.y(), p1.x(), p1.y(),
                    halfShaftWidth, arrowSize})) {
        return QPolygonF();
    }

    const int count = qBound(HitTest::kMinCurveSamples, samples, HitTest::kMaxCurveSamples);
    const bool headAtStart = arrowStyle == ArrowStyle::Double;
    const bool headAtEnd = arrowStyle != ArrowStyle::None;
    const qreal half = qAbs(halfShaftWidth);
    const qreal depth = headDepth(arrowSize, effectiveHeadScale(headScale));
    const qreal tailExtra = (!headAtStart && std::isfinite(tailWidth) && tailWidth > 0.0)
                                ? tailWidth / 2.0 : 0.0;

    auto tangentAt = [&](qreal t) {
        return getBezierTangent(t, p0.x(), p0.y(), control.x(), control.y(), p1.x(), p1.y());
    };

    QPolygonF plusSide;
    QPolygonF minusSide;
    for (int i = 0; i <= count; ++i) {
        const qreal t = static_cast<qreal>(i) / count;
        const QPointF p = bezierPoint(t, p0, control, p1);
        if (headAtStart && (i == 0 || QLineF(p, p0).length() < depth)) {
            continue;
        }
        if (headAtEnd && (i == count || QLineF(p, p1).length() < depth)) {
            continue;
        }

        // Tail width tapers linearly to the plain shaft at the far end
        const qreal normal = tangentAt(t) + M_PI / 2.0;
        const qreal width = half + tailExtra * (1.0 - t);
        const QPointF offset(width * qCos(normal), width * qSin(normal));
        plusSide << p + offset;
        minusSide << p - offset;
    }

    QPolygonF outline;
    if (headAtStart) {
        const qreal back = tangentAt(0.0) + M_PI;
        outline += buildHeadVertices(p0, back, back + M_PI / 2.0, half, arrowSize, headScale,
                                     headType);
    }
    outline += plusSide;
    if (headAtEnd) {
        const qreal forward = tangentAt(1.0);
        outline += buildHeadVertices(p1, forward, forward + M_PI / 2.0, half, arrowSize,
                                     headScale, headType);
    }
    for (auto it = minusSide.crbegin(); it != minusSide.crend(); ++it) {
        outline << *it;
    }
    return outline;
}

QPolygonF ArrowGeometry::buildLayerOutline(const Layer& layer)
{
    if (layer.type != LayerType::Arrow && layer.type != LayerType::Line) {
        return QPolygonF();
    }
    if (!LayerFields::allUsable({layer.x1, layer.y1, layer.x2, layer.y2})) {
        return QPolygonF();
    }

    qreal arrowSize = LayerFields::valueOr(layer.arrowSize, Arrow::kDefaultArrowSize);
    if (arrowSize <= 0.0) {
        arrowSize = Arrow::kDefaultArrowSize;
    }
    const qreal strokeWidth = qAbs(LayerFields::valueOr(layer.strokeWidth, Arrow::kDefaultStrokeWidth));
    const qreal headScale = LayerFields::valueOr(layer.headScale, Arrow::kDefaultHeadScale);
    const qreal tailWidth = LayerFields::valueOr(layer.tailWidth, 0.0);
    const ArrowStyle style = layer.type == LayerType::Line ? ArrowStyle::None : layer.arrowStyle;
    const qreal half = shaftWidth(arrowSize, strokeWidth) / 2.0;

    const QPointF start(*layer.x1, *layer.y1);
    const QPointF end(*layer.x2, *layer.y2);

    if (isCurved(layer)) {
        return buildCurvedArrowVertices(start, QPointF(*layer.controlX, *layer.controlY), end,
                                        half, arrowSize, style, layer.arrowHeadType,
                                        headScale, tailWidth);
    }

    const qreal angle = qAtan2(end.y() - start.y(), end.x() - start.x());
    return buildArrowVertices(start.x(), start.y(), end.x(), end.y(), angle, angle + M_PI / 2.0,
                              half, arrowSize, style, layer.arrowHeadType, headScale, tailWidth);
}

qreal ArrowGeometry::getBezierTangent(qreal t, qreal x0, qreal y0, qreal cx, qreal cy,
                                      qreal x1, qreal y1)
{
    const qreal dx = 2.0 * (1.0 - t) * (cx - x0) + 2.0 * t * (x1 - cx);
    const qreal dy = 2.0 * (1.0 - t) * (cy - y0) + 2.0 * t * (y1 - cy);
    return qAtan2(dy, dx);
}

QPointF ArrowGeometry::bezierPoint(qreal t, const QPointF& p0, const QPointF& control,
                                   const QPointF& p1)
{
    const qreal mt = 1.0 - t;
    return p0 * (mt * mt) + control * (2.0 * mt * t) + p1 * (t * t);
}

bool ArrowGeometry::isCurved(const Layer& layer)
{
    if (!LayerFields::allUsable({layer.x1, layer.y1, layer.x2, layer.y2,
                                 layer.controlX, layer.controlY})) {
        return false;
    }

    const QPointF midpoint((*layer.x1 + *layer.x2) / 2.0, (*layer.y1 + *layer.y2) / 2.0);
    return QLineF(midpoint, QPointF(*layer.controlX, *layer.controlY)).length()
           > Arrow::kCurveThreshold;
}

qreal ArrowGeometry::shaftWidth(qreal arrowSize, qreal strokeWidth)
{
    return std::max({arrowSize * Arrow::kShaftSizeRatio,
                     strokeWidth * Arrow::kShaftStrokeRatio,
                     Arrow::kMinShaftWidth});
}

qreal ArrowGeometry::headDepth(qreal arrowSize, qreal headScale)
{
    return qAbs(arrowSize) * Arrow::kHeadDepthRatio * effectiveHeadScale(headScale);
}

qreal ArrowGeometry::effectiveHeadScale(qreal headScale)
{
    if (!std::isfinite(headScale) || headScale <= 0.0) {
        return Arrow::kDefaultHeadScale;
    }
    return headScale;
}

QPointF ArrowGeometry::toWorld(const QPointF& origin, qreal angle, qreal perpAngle,
                               qreal along, qreal across)
{
    return origin + QPointF(qCos(angle), qSin(angle)) * along
                  + QPointF(qCos(perpAngle), qSin(perpAngle)) * across;
}
