#ifndef LAYERSNAPSHOT_H
#define LAYERSNAPSHOT_H

#include "geometry/ILayerSource.h"

// Layer source that owns a copy of the layer list
class LayerSnapshot : public ILayerSource
{
public:
    LayerSnapshot() = default;
    explicit LayerSnapshot(const QVector<Layer>& layers);

    const QVector<Layer>& layers() const override { return m_layers; }
    void setLayers(const QVector<Layer>& layers);

    // nullptr when no layer has the id
    const Layer* findLayer(const QString& id) const;

private:
    QVector<Layer> m_layers;
};

#endif // LAYERSNAPSHOT_H
