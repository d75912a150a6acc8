#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <string>
#include <vector>

namespace geo_mosaic {

namespace fs = std::filesystem;

// Matrix type (row-major, matches raster scanline order)
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Affine geotransform: [originX, pixelWidthX, rowRotation, originY, colRotation, pixelHeightY]
using GeoTransform = std::array<double, 6>;

// Raster product kind
enum class RasterKind {
    PAN,    // single-band panchromatic
    PSRGB   // pan-sharpened multi-band RGB
};

inline std::string raster_kind_to_string(RasterKind kind) {
    switch (kind) {
        case RasterKind::PAN: return "PAN";
        case RasterKind::PSRGB: return "PSRGB";
        default: return "UNKNOWN";
    }
}

inline bool string_to_raster_kind(const std::string& s, RasterKind& out) {
    std::string norm = s;
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    norm.erase(norm.begin(),
               std::find_if(norm.begin(), norm.end(), not_space));
    norm.erase(std::find_if(norm.rbegin(), norm.rend(), not_space).base(),
               norm.end());
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    norm.erase(std::remove(norm.begin(), norm.end(), '-'), norm.end());

    if (norm == "PAN") {
        out = RasterKind::PAN;
        return true;
    }
    if (norm == "PSRGB") {
        out = RasterKind::PSRGB;
        return true;
    }
    return false;
}

// Decoded raster tile. bands[i] has `height` rows and `width` columns.
struct RasterTile {
    fs::path path;
    int band_count = 0;
    int width = 0;
    int height = 0;
    std::vector<Matrix2Df> bands;
    GeoTransform geotransform{0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
};

// World-coordinate bounding rectangle of one tile. Ordering is not guaranteed.
struct Extent {
    double left = 0.0;
    double right = 0.0;
    double bottom = 0.0;
    double top = 0.0;
};

// A single world-space vertex
struct Point2D {
    double x = 0.0;
    double y = 0.0;
};

using Polyline = std::vector<Point2D>;

// Mosaic run phases
enum class Phase {
    SCAN_INPUT = 0,
    BOUNDS = 1,
    RENDER_TILES = 2,
    OVERLAY = 3,
    WRITE = 4,
    DONE = 5
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::SCAN_INPUT: return "SCAN_INPUT";
        case Phase::BOUNDS: return "BOUNDS";
        case Phase::RENDER_TILES: return "RENDER_TILES";
        case Phase::OVERLAY: return "OVERLAY";
        case Phase::WRITE: return "WRITE";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace geo_mosaic
