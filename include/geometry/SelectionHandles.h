#ifndef SELECTIONHANDLES_H
#define SELECTIONHANDLES_H

#include <QPointF>
#include <QRectF>
#include <QString>
#include <QVector>

#include "Constants.h"

// Handle types for hit-testing selection handles
enum class HandleType {
    None = 0,
    TopLeft,      // Corner resize handles
    TopRight,
    BottomRight,
    BottomLeft,
    Top,          // Edge resize handles
    Right,
    Bottom,
    Left,
    Rotation      // Above the top edge
};

struct SelectionHandle
{
    HandleType type = HandleType::None;
    QPointF anchor;   // Point on (or above) the selection bounds
    QRectF rect;      // Square centered on the anchor
};

struct SelectionHandleOptions
{
    bool edgeHandles = true;
    bool rotationHandle = true;
    bool multiSelection = false;   // Corners only
    qreal handleSize = LayerKit::Handles::kSize;
    qreal rotationOffset = LayerKit::Handles::kRotationOffset;
};

/**
 * @brief Placement and hit-testing of resize/rotate handles around a selection.
 */
class SelectionHandles
{
public:
    SelectionHandles() = delete;

    /**
     * @brief Handles for a selection box.
     * @param bounds Selection bounds, normalized before use
     * @return Corners (nw, ne, se, sw), then edges (n, e, s, w), then
     *         rotation; empty when bounds are not finite
     */
    static QVector<SelectionHandle> create(const QRectF& bounds,
                                           const SelectionHandleOptions& options = SelectionHandleOptions());

    /**
     * @brief First handle whose rect, grown by tolerance, contains the point.
     * @return HandleType::None if no handle is hit
     */
    static HandleType hitTest(const QPointF& point, const QVector<SelectionHandle>& handles,
                              qreal tolerance = LayerKit::Handles::kHitTolerance);

    // Short compass name ("nw", "n", ..., "rotate"); empty for None
    static QString handleName(HandleType type);
};

#endif // SELECTIONHANDLES_H
