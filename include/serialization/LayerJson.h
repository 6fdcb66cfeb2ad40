#ifndef LAYERJSON_H
#define LAYERJSON_H

#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QVector>
#include <optional>

#include "geometry/LayerTypes.h"

/**
 * @brief Converts layer records to and from their JSON form.
 *
 * This is the only place where a record's shape family is inferred from
 * the fields it carries. Records without a "type" key are tagged once
 * here (rectangular, then line-like, then circular) and everything
 * downstream dispatches on Layer::type.
 */
class LayerJson
{
public:
    LayerJson() = delete;

    /**
     * @brief Decode one layer.
     * @return nullopt when the value is not a JSON object
     */
    static std::optional<Layer> fromJson(const QJsonValue& value);

    // Writes only the fields the layer actually carries
    static QJsonObject toJson(const Layer& layer);

    // Non-object entries are skipped
    static QVector<Layer> fromJsonArray(const QJsonArray& array);
    static QJsonArray toJsonArray(const QVector<Layer>& layers);

    /**
     * @brief Decode a serialized layer set.
     *
     * Accepts either a bare array of layers or an object with a "layers"
     * array. Malformed input yields an empty list.
     */
    static QVector<Layer> fromDocument(const QByteArray& data);
    static QByteArray toDocument(const QVector<Layer>& layers);

    // Shape family for a record without a "type" key
    static LayerType inferLegacyType(const QJsonObject& obj);

    static LayerType typeFromString(const QString& name);
    static QString typeToString(LayerType type);
    static ArrowStyle arrowStyleFromString(const QString& name);
    static QString arrowStyleToString(ArrowStyle style);
    static ArrowHeadType headTypeFromString(const QString& name);
    static QString headTypeToString(ArrowHeadType headType);
};

#endif // LAYERJSON_H
