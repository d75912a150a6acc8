#include "geo_mosaic/geo/georeference.hpp"

#include <algorithm>

namespace geo_mosaic::geo {

Extent compute_extent(const GeoTransform& gt, int width, int height) {
    const double w = static_cast<double>(width);
    const double h = static_cast<double>(height);

    Extent e;
    e.left = gt[0];
    e.right = gt[0] + w * gt[1] + h * gt[2];
    e.bottom = gt[3] + w * gt[4] + h * gt[5];
    e.top = gt[3];
    return e;
}

Extent compute_extent(const RasterTile& tile) {
    return compute_extent(tile.geotransform, tile.width, tile.height);
}

Extent axis_aligned(const Extent& extent) {
    Extent e;
    e.left = std::min(extent.left, extent.right);
    e.right = std::max(extent.left, extent.right);
    e.bottom = std::min(extent.bottom, extent.top);
    e.top = std::max(extent.bottom, extent.top);
    return e;
}

} // namespace geo_mosaic::geo
