#include "geometry/SelectionHandles.h"
#include "geometry/BoundsCalculator.h"

#include <cmath>

namespace {

SelectionHandle makeHandle(HandleType type, const QPointF& anchor, qreal size)
{
    SelectionHandle handle;
    handle.type = type;
    handle.anchor = anchor;
    handle.rect = QRectF(anchor.x() - size / 2.0, anchor.y() - size / 2.0, size, size);
    return handle;
}

} // namespace

QVector<SelectionHandle> SelectionHandles::create(const QRectF& bounds,
                                                  const SelectionHandleOptions& options)
{
    if (!std::isfinite(bounds.x()) || !std::isfinite(bounds.y()) ||
        !std::isfinite(bounds.width()) || !std::isfinite(bounds.height())) {
        return {};
    }

    const QRectF box = bounds.normalized();
    const qreal size = qAbs(options.handleSize);
    const qreal left = box.left();
    const qreal top = box.top();
    const qreal right = box.left() + box.width();
    const qreal bottom = box.top() + box.height();
    const qreal centerX = left + box.width() / 2.0;
    const qreal centerY = top + box.height() / 2.0;

    QVector<SelectionHandle> handles;
    handles.reserve(9);
    handles.append(makeHandle(HandleType::TopLeft, QPointF(left, top), size));
    handles.append(makeHandle(HandleType::TopRight, QPointF(right, top), size));
    handles.append(makeHandle(HandleType::BottomRight, QPointF(right, bottom), size));
    handles.append(makeHandle(HandleType::BottomLeft, QPointF(left, bottom), size));

    if (options.multiSelection) {
        return handles;
    }

    if (options.edgeHandles) {
        handles.append(makeHandle(HandleType::Top, QPointF(centerX, top), size));
        handles.append(makeHandle(HandleType::Right, QPointF(right, centerY), size));
        handles.append(makeHandle(HandleType::Bottom, QPointF(centerX, bottom), size));
        handles.append(makeHandle(HandleType::Left, QPointF(left, centerY), size));
    }

    if (options.rotationHandle) {
        handles.append(makeHandle(HandleType::Rotation,
                                  QPointF(centerX, top - options.rotationOffset), size));
    }
    return handles;
}

HandleType SelectionHandles::hitTest(const QPointF& point, const QVector<SelectionHandle>& handles,
                                     qreal tolerance)
{
    const qreal grow = std::isfinite(tolerance) ? qMax(0.0, tolerance) : 0.0;
    for (const SelectionHandle& handle : handles) {
        if (BoundsCalculator::isPointInBounds(point, BoundsCalculator::expandBounds(handle.rect, grow))) {
            return handle.type;
        }
    }
    return HandleType::None;
}

QString SelectionHandles::handleName(HandleType type)
{
    switch (type) {
    case HandleType::TopLeft:     return QStringLiteral("nw");
    case HandleType::TopRight:    return QStringLiteral("ne");
    case HandleType::BottomRight: return QStringLiteral("se");
    case HandleType::BottomLeft:  return QStringLiteral("sw");
    case HandleType::Top:         return QStringLiteral("n");
    case HandleType::Right:       return QStringLiteral("e");
    case HandleType::Bottom:      return QStringLiteral("s");
    case HandleType::Left:        return QStringLiteral("w");
    case HandleType::Rotation:    return QStringLiteral("rotate");
    case HandleType::None:        break;
    }
    return QString();
}
