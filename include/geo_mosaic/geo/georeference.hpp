#pragma once

#include "geo_mosaic/core/types.hpp"

namespace geo_mosaic::geo {

/**
 * Tile extent from an affine geotransform (GDAL geotransform convention):
 *
 *   left   = x0
 *   right  = x0 + W*a + H*b
 *   bottom = y0 + W*c + H*d
 *   top    = y0
 *
 * for gt = [x0, a, b, y0, c, d]. The four values are not min/max ordered
 * for rotated, skewed or south-up transforms; use axis_aligned() where a
 * bounding box is required.
 */
Extent compute_extent(const GeoTransform& gt, int width, int height);
Extent compute_extent(const RasterTile& tile);

// Same rectangle with left <= right and bottom <= top.
Extent axis_aligned(const Extent& extent);

} // namespace geo_mosaic::geo
