#include "geometry/LayerSnapshot.h"

LayerSnapshot::LayerSnapshot(const QVector<Layer>& layers)
    : m_layers(layers)
{
}

void LayerSnapshot::setLayers(const QVector<Layer>& layers)
{
    m_layers = layers;
}

const Layer* LayerSnapshot::findLayer(const QString& id) const
{
    for (const Layer& layer : m_layers) {
        if (layer.id == id) {
            return &layer;
        }
    }
    return nullptr;
}
