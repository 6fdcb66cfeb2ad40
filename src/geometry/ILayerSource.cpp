#include "geometry/ILayerSource.h"
#include "geometry/BoundsCalculator.h"

std::optional<QRectF> ILayerSource::getLayerBounds(const Layer& layer) const
{
    return BoundsCalculator::getLayerBounds(layer);
}
