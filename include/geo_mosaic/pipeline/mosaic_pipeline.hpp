#pragma once

#include "geo_mosaic/config/configuration.hpp"
#include "geo_mosaic/core/events.hpp"
#include "geo_mosaic/core/types.hpp"
#include "geo_mosaic/pipeline/mosaic_bounds.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace geo_mosaic::pipeline {

struct MosaicInputs {
    std::vector<fs::path> rasters;
    std::vector<fs::path> overlays;
};

struct MosaicRunResult {
    bool success = false;
    MosaicBounds bounds;
    int tiles_total = 0;
    int tiles_ok = 0;
    int tiles_failed = 0;
    int overlays_ok = 0;
    int overlays_failed = 0;
    size_t polylines = 0;
    size_t skipped_features = 0;
    fs::path png_path;
    fs::path geotiff_path;
    std::string error_message;
};

// Raster and overlay files from the configured directories, in directory
// order and sorted within each directory. max_tiles > 0 truncates the rasters.
MosaicInputs discover_inputs(const config::InputConfig& input);

struct BoundsScan {
    MosaicBounds bounds;
    std::vector<fs::path> usable;     // rasters whose metadata decoded
    std::vector<std::string> failures;
};

// Metadata-only pass: folds every readable raster's extent. Throws the first
// decode error when abort_on_fail is set.
BoundsScan scan_bounds(const std::vector<fs::path>& rasters, bool abort_on_fail);

// Runs the full mosaic: bounds pass, per-tile render pass, road overlays,
// outputs under run_dir/outputs. Events go to `log`.
MosaicRunResult run_mosaic(const config::Config& cfg,
                           const std::string& run_id,
                           const fs::path& run_dir,
                           core::EventEmitter& emitter,
                           std::ostream& log);

core::json bounds_to_json(const MosaicBounds& bounds);

} // namespace geo_mosaic::pipeline
