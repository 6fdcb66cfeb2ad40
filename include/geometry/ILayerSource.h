#ifndef ILAYERSOURCE_H
#define ILAYERSOURCE_H

#include <QRectF>
#include <QVector>
#include <optional>

#include "geometry/LayerTypes.h"

/**
 * @brief Read-only view of an ordered layer collection.
 *
 * Implemented by whatever owns the layer list. The geometry code only
 * reads from it and never keeps references past a single call.
 */
class ILayerSource
{
public:
    virtual ~ILayerSource() = default;

    // Candidate layers in store order
    virtual const QVector<Layer>& layers() const = 0;

    /**
     * @brief Bounds used for layers without a tighter containment test.
     *
     * Defaults to BoundsCalculator::getLayerBounds().
     */
    virtual std::optional<QRectF> getLayerBounds(const Layer& layer) const;
};

#endif // ILAYERSOURCE_H
