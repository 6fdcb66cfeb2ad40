#include "serialization/LayerJson.h"

#include <QDebug>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QtMath>
#include <limits>

namespace {

struct TypeName
{
    LayerType type;
    const char* name;
};

constexpr TypeName kTypeNames[] = {
    {LayerType::Rectangle, "rectangle"},
    {LayerType::Circle, "circle"},
    {LayerType::Ellipse, "ellipse"},
    {LayerType::Line, "line"},
    {LayerType::Arrow, "arrow"},
    {LayerType::Polygon, "polygon"},
    {LayerType::Star, "star"},
    {LayerType::Text, "text"},
    {LayerType::TextBox, "textbox"},
    {LayerType::Path, "path"},
    {LayerType::Blur, "blur"},
    {LayerType::Image, "image"},
    {LayerType::Group, "group"},
};

// Non-numeric values decode as missing
std::optional<qreal> readNumber(const QJsonObject& obj, const char* key)
{
    const QJsonValue value = obj.value(QLatin1String(key));
    if (!value.isDouble()) {
        return std::nullopt;
    }
    return value.toDouble();
}

std::optional<int> readInt(const QJsonObject& obj, const char* key)
{
    const std::optional<qreal> value = readNumber(obj, key);
    // Counts outside the int range cannot be represented
    if (!LayerFields::isUsable(value) ||
        *value < std::numeric_limits<int>::min() || *value > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return qRound(*value);
}

bool readBool(const QJsonObject& obj, const char* key, bool fallback)
{
    const QJsonValue value = obj.value(QLatin1String(key));
    return value.isBool() ? value.toBool() : fallback;
}

void writeNumber(QJsonObject& obj, const char* key, const std::optional<qreal>& value)
{
    if (LayerFields::isUsable(value)) {
        obj[QLatin1String(key)] = *value;
    }
}

void writeInt(QJsonObject& obj, const char* key, const std::optional<int>& value)
{
    if (value) {
        obj[QLatin1String(key)] = *value;
    }
}

bool hasNumbers(const QJsonObject& obj, std::initializer_list<const char*> keys)
{
    for (const char* key : keys) {
        if (!obj.value(QLatin1String(key)).isDouble()) {
            return false;
        }
    }
    return true;
}

} // namespace

std::optional<Layer> LayerJson::fromJson(const QJsonValue& value)
{
    if (!value.isObject()) {
        qWarning() << "LayerJson: expected a layer object, got" << value;
        return std::nullopt;
    }

    const QJsonObject obj = value.toObject();
    Layer layer;
    layer.id = obj.value(QLatin1String("id")).toString();

    const QJsonValue typeValue = obj.value(QLatin1String("type"));
    if (typeValue.isUndefined() || typeValue.isNull()) {
        layer.type = inferLegacyType(obj);
    } else {
        layer.type = typeFromString(typeValue.toString());
    }

    layer.visible = readBool(obj, "visible", true);
    layer.locked = readBool(obj, "locked", false);

    layer.x = readNumber(obj, "x");
    layer.y = readNumber(obj, "y");
    layer.width = readNumber(obj, "width");
    layer.height = readNumber(obj, "height");

    layer.x1 = readNumber(obj, "x1");
    layer.y1 = readNumber(obj, "y1");
    layer.x2 = readNumber(obj, "x2");
    layer.y2 = readNumber(obj, "y2");
    layer.controlX = readNumber(obj, "controlX");
    layer.controlY = readNumber(obj, "controlY");

    layer.radius = readNumber(obj, "radius");
    layer.radiusX = readNumber(obj, "radiusX");
    layer.radiusY = readNumber(obj, "radiusY");
    layer.outerRadius = readNumber(obj, "outerRadius");
    layer.innerRadius = readNumber(obj, "innerRadius");
    layer.sides = readInt(obj, "sides");
    layer.starPoints = readInt(obj, "starPoints");

    layer.fontSize = readNumber(obj, "fontSize");
    layer.text = obj.value(QLatin1String("text")).toString();
    layer.strokeWidth = readNumber(obj, "strokeWidth");
    layer.rotation = readNumber(obj, "rotation");

    if (obj.contains(QLatin1String("arrowStyle"))) {
        layer.arrowStyle = arrowStyleFromString(obj.value(QLatin1String("arrowStyle")).toString());
    }
    if (obj.contains(QLatin1String("arrowHeadType"))) {
        layer.arrowHeadType = headTypeFromString(obj.value(QLatin1String("arrowHeadType")).toString());
    }
    layer.arrowSize = readNumber(obj, "arrowSize");
    layer.headScale = readNumber(obj, "headScale");
    layer.tailWidth = readNumber(obj, "tailWidth");

    // Stars may store their vertex count under "points"
    const QJsonValue pointsValue = obj.value(QLatin1String("points"));
    if (pointsValue.isArray()) {
        const QJsonArray pointsArray = pointsValue.toArray();
        layer.points.reserve(pointsArray.size());
        for (const QJsonValue& entry : pointsArray) {
            const QJsonObject pointObj = entry.toObject();
            PointRecord point;
            point.x = readNumber(pointObj, "x");
            point.y = readNumber(pointObj, "y");
            layer.points.append(point);
        }
    } else if (pointsValue.isDouble() && !layer.starPoints) {
        layer.starPoints = readInt(obj, "points");
    }

    const QJsonArray children = obj.value(QLatin1String("children")).toArray();
    for (const QJsonValue& child : children) {
        if (child.isString()) {
            layer.children.append(child.toString());
        }
    }
    layer.parentGroup = obj.value(QLatin1String("parentGroup")).toString();

    return layer;
}

QJsonObject LayerJson::toJson(const Layer& layer)
{
    QJsonObject obj;
    if (!layer.id.isEmpty()) {
        obj["id"] = layer.id;
    }
    if (layer.type != LayerType::Unknown) {
        obj["type"] = typeToString(layer.type);
    }
    if (!layer.visible) {
        obj["visible"] = false;
    }
    if (layer.locked) {
        obj["locked"] = true;
    }

    writeNumber(obj, "x", layer.x);
    writeNumber(obj, "y", layer.y);
    writeNumber(obj, "width", layer.width);
    writeNumber(obj, "height", layer.height);
    writeNumber(obj, "x1", layer.x1);
    writeNumber(obj, "y1", layer.y1);
    writeNumber(obj, "x2", layer.x2);
    writeNumber(obj, "y2", layer.y2);
    writeNumber(obj, "controlX", layer.controlX);
    writeNumber(obj, "controlY", layer.controlY);
    writeNumber(obj, "radius", layer.radius);
    writeNumber(obj, "radiusX", layer.radiusX);
    writeNumber(obj, "radiusY", layer.radiusY);
    writeNumber(obj, "outerRadius", layer.outerRadius);
    writeNumber(obj, "innerRadius", layer.innerRadius);
    writeInt(obj, "sides", layer.sides);
    writeInt(obj, "starPoints", layer.starPoints);
    writeNumber(obj, "fontSize", layer.fontSize);
    if (!layer.text.isEmpty()) {
        obj["text"] = layer.text;
    }
    writeNumber(obj, "strokeWidth", layer.strokeWidth);
    writeNumber(obj, "rotation", layer.rotation);

    if (layer.type == LayerType::Arrow) {
        obj["arrowStyle"] = arrowStyleToString(layer.arrowStyle);
        obj["arrowHeadType"] = headTypeToString(layer.arrowHeadType);
    }
    writeNumber(obj, "arrowSize", layer.arrowSize);
    writeNumber(obj, "headScale", layer.headScale);
    writeNumber(obj, "tailWidth", layer.tailWidth);

    if (!layer.points.isEmpty()) {
        QJsonArray points;
        for (const PointRecord& point : layer.points) {
            QJsonObject pointObj;
            writeNumber(pointObj, "x", point.x);
            writeNumber(pointObj, "y", point.y);
            points.append(pointObj);
        }
        obj["points"] = points;
    }

    if (!layer.children.isEmpty()) {
        obj["children"] = QJsonArray::fromStringList(layer.children);
    }
    if (!layer.parentGroup.isEmpty()) {
        obj["parentGroup"] = layer.parentGroup;
    }
    return obj;
}

QVector<Layer> LayerJson::fromJsonArray(const QJsonArray& array)
{
    QVector<Layer> layers;
    layers.reserve(array.size());
    for (int i = 0; i < array.size(); ++i) {
        const std::optional<Layer> layer = fromJson(array.at(i));
        if (!layer) {
            qWarning() << "LayerJson: skipping entry" << i;
            continue;
        }
        layers.append(*layer);
    }
    return layers;
}

QJsonArray LayerJson::toJsonArray(const QVector<Layer>& layers)
{
    QJsonArray array;
    for (const Layer& layer : layers) {
        array.append(toJson(layer));
    }
    return array;
}

QVector<Layer> LayerJson::fromDocument(const QByteArray& data)
{
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &error);
    if (error.error != QJsonParseError::NoError) {
        qWarning() << "LayerJson: parse error:" << error.errorString();
        return {};
    }

    if (doc.isArray()) {
        return fromJsonArray(doc.array());
    }

    const QJsonValue layers = doc.object().value(QLatin1String("layers"));
    if (!layers.isArray()) {
        qWarning() << "LayerJson: document has no layers array";
        return {};
    }
    return fromJsonArray(layers.toArray());
}

QByteArray LayerJson::toDocument(const QVector<Layer>& layers)
{
    return QJsonDocument(toJsonArray(layers)).toJson(QJsonDocument::Compact);
}

LayerType LayerJson::inferLegacyType(const QJsonObject& obj)
{
    if (hasNumbers(obj, {"x", "y", "width", "height"})) {
        return LayerType::Rectangle;
    }
    if (hasNumbers(obj, {"x1", "y1", "x2", "y2"})) {
        return LayerType::Line;
    }
    if (hasNumbers(obj, {"x", "y", "radius"})) {
        return LayerType::Circle;
    }
    return LayerType::Unknown;
}

LayerType LayerJson::typeFromString(const QString& name)
{
    for (const TypeName& entry : kTypeNames) {
        if (name == QLatin1String(entry.name)) {
            return entry.type;
        }
    }
    return LayerType::Unknown;
}

QString LayerJson::typeToString(LayerType type)
{
    for (const TypeName& entry : kTypeNames) {
        if (entry.type == type) {
            return QString::fromLatin1(entry.name);
        }
    }
    return QString();
}

ArrowStyle LayerJson::arrowStyleFromString(const QString& name)
{
    if (name == QLatin1String("none")) {
        return ArrowStyle::None;
    }
    if (name == QLatin1String("double")) {
        return ArrowStyle::Double;
    }
    return ArrowStyle::Single;
}

QString LayerJson::arrowStyleToString(ArrowStyle style)
{
    switch (style) {
    case ArrowStyle::None:   return QStringLiteral("none");
    case ArrowStyle::Double: return QStringLiteral("double");
    case ArrowStyle::Single: break;
    }
    return QStringLiteral("single");
}

ArrowHeadType LayerJson::headTypeFromString(const QString& name)
{
    if (name == QLatin1String("chevron")) {
        return ArrowHeadType::Chevron;
    }
    if (name == QLatin1String("standard")) {
        return ArrowHeadType::Standard;
    }
    return ArrowHeadType::Pointed;
}

QString LayerJson::headTypeToString(ArrowHeadType headType)
{
    switch (headType) {
    case ArrowHeadType::Chevron:  return QStringLiteral("chevron");
    case ArrowHeadType::Standard: return QStringLiteral("standard");
    case ArrowHeadType::Pointed:  break;
    }
    return QStringLiteral("pointed");
}
