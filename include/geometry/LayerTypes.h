#ifndef LAYERTYPES_H
#define LAYERTYPES_H

#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>
#include <cmath>
#include <initializer_list>
#include <optional>

// Shape family of a layer record. Unknown never produces geometry.
enum class LayerType {
    Unknown = 0,
    Rectangle,
    Circle,
    Ellipse,
    Line,
    Arrow,
    Polygon,
    Star,
    Text,
    TextBox,
    Path,
    Blur,
    Image,
    Group
};

// Which ends of an arrow carry a head
enum class ArrowStyle {
    None = 0,
    Single,     // Head at (x2, y2)
    Double      // Heads at both ends
};

enum class ArrowHeadType {
    Pointed = 0,  // Barbed triangular tip
    Chevron,      // Open, notched tip
    Standard      // Filled head with a wide base
};

/**
 * @brief One vertex of a path or polygon as stored by the layer store.
 *
 * Either coordinate may be absent; such points are skipped by the
 * geometry code rather than treated as zero.
 */
struct PointRecord
{
    std::optional<qreal> x;
    std::optional<qreal> y;

    PointRecord() = default;
    PointRecord(qreal px, qreal py) : x(px), y(py) {}
};

/**
 * @brief Plain shape record consumed by the geometry kernel.
 *
 * Only the fields relevant to the layer's type are expected to be set.
 * The kernel never mutates a Layer; derived geometry is always returned
 * as new values.
 */
struct Layer
{
    QString id;
    LayerType type = LayerType::Unknown;
    bool visible = true;
    bool locked = false;

    // Rectangular extent, or center for circles/ellipses/polygons/stars
    std::optional<qreal> x;
    std::optional<qreal> y;
    std::optional<qreal> width;
    std::optional<qreal> height;

    // Line and arrow endpoints, optional quadratic control point
    std::optional<qreal> x1;
    std::optional<qreal> y1;
    std::optional<qreal> x2;
    std::optional<qreal> y2;
    std::optional<qreal> controlX;
    std::optional<qreal> controlY;

    std::optional<qreal> radius;
    std::optional<qreal> radiusX;
    std::optional<qreal> radiusY;
    std::optional<qreal> outerRadius;
    std::optional<qreal> innerRadius;
    std::optional<int> sides;
    std::optional<int> starPoints;

    std::optional<qreal> fontSize;
    QString text;

    std::optional<qreal> strokeWidth;
    std::optional<qreal> rotation;

    // Arrow style
    ArrowStyle arrowStyle = ArrowStyle::Single;
    ArrowHeadType arrowHeadType = ArrowHeadType::Pointed;
    std::optional<qreal> arrowSize;
    std::optional<qreal> headScale;
    std::optional<qreal> tailWidth;

    QVector<PointRecord> points;

    // Group linkage (owned by the group manager)
    QStringList children;
    QString parentGroup;
};

namespace LayerFields {

// A numeric field is usable only when present and finite.
inline bool isUsable(const std::optional<qreal>& value)
{
    return value.has_value() && std::isfinite(*value);
}

inline std::optional<qreal> usable(const std::optional<qreal>& value)
{
    if (isUsable(value)) {
        return value;
    }
    return std::nullopt;
}

inline qreal valueOr(const std::optional<qreal>& value, qreal fallback)
{
    return isUsable(value) ? *value : fallback;
}

inline bool allUsable(std::initializer_list<std::optional<qreal>> values)
{
    for (const auto& value : values) {
        if (!isUsable(value)) {
            return false;
        }
    }
    return true;
}

} // namespace LayerFields

#endif // LAYERTYPES_H
