#pragma once

#include "geo_mosaic/core/types.hpp"

#include <string>
#include <vector>

namespace geo_mosaic::io {

struct RasterInfo {
    int width = 0;
    int height = 0;
    int band_count = 0;
    GeoTransform geotransform{0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
    std::string driver;
};

// Metadata only: dimensions, band count and geotransform. No pixel reads.
RasterInfo read_raster_info(const fs::path& path);

// Opens the file and reads every band in full. Each call returns a fresh tile.
RasterTile load_raster(const fs::path& path);

// Writes a float32 GeoTIFF, one band per matrix.
void write_raster_float(const fs::path& path, const std::vector<Matrix2Df>& bands,
                        const GeoTransform& geotransform);

} // namespace geo_mosaic::io
