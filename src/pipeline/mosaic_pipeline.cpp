#include "geo_mosaic/pipeline/mosaic_pipeline.hpp"
#include "geo_mosaic/core/errors.hpp"
#include "geo_mosaic/core/utils.hpp"
#include "geo_mosaic/geo/georeference.hpp"
#include "geo_mosaic/image/normalization.hpp"
#include "geo_mosaic/io/overlay_io.hpp"
#include "geo_mosaic/io/raster_io.hpp"
#include "geo_mosaic/render/mosaic_canvas.hpp"

#include <cmath>
#include <memory>
#include <new>

namespace geo_mosaic::pipeline {

using json = nlohmann::json;

static json paths_to_json(const std::vector<fs::path>& paths) {
    json arr = json::array();
    for (const auto& p : paths) {
        arr.push_back(p.string());
    }
    return arr;
}

// Infinite sentinel values are not representable in JSON.
static json finite_or_null(double v) {
    return std::isfinite(v) ? json(v) : json(nullptr);
}

json bounds_to_json(const MosaicBounds& bounds) {
    return {
        {"x_min", finite_or_null(bounds.x_min)},
        {"x_max", finite_or_null(bounds.x_max)},
        {"y_min", finite_or_null(bounds.y_min)},
        {"y_max", finite_or_null(bounds.y_max)},
        {"empty", is_empty(bounds)}
    };
}

MosaicInputs discover_inputs(const config::InputConfig& input) {
    MosaicInputs out;

    // Any file the glob selects is a candidate; GDAL decides what it can read.
    for (const auto& dir : input.raster_dirs) {
        auto found = core::discover_files(dir, input.raster_pattern);
        out.rasters.insert(out.rasters.end(), found.begin(), found.end());
    }
    if (input.max_tiles > 0 && out.rasters.size() > static_cast<size_t>(input.max_tiles)) {
        out.rasters.resize(static_cast<size_t>(input.max_tiles));
    }

    for (const auto& dir : input.overlay_dirs) {
        for (const auto& p : core::discover_files(dir, input.overlay_pattern)) {
            if (io::is_overlay_path(p)) {
                out.overlays.push_back(p);
            }
        }
    }

    return out;
}

BoundsScan scan_bounds(const std::vector<fs::path>& rasters, bool abort_on_fail) {
    BoundsScan scan;
    for (const auto& path : rasters) {
        try {
            io::RasterInfo info = io::read_raster_info(path);
            scan.bounds = fold(scan.bounds, geo::compute_extent(info.geotransform, info.width, info.height));
            scan.usable.push_back(path);
        } catch (const RasterDecodeError& e) {
            if (abort_on_fail) throw;
            scan.failures.push_back(e.what());
        }
    }
    return scan;
}

MosaicRunResult run_mosaic(const config::Config& cfg,
                           const std::string& run_id,
                           const fs::path& run_dir,
                           core::EventEmitter& emitter,
                           std::ostream& log) {
    MosaicRunResult result;

    RasterKind kind = RasterKind::PAN;
    string_to_raster_kind(cfg.input.raster_kind, kind);
    image::ConstantChannelPolicy policy = image::ConstantChannelPolicy::Zero;
    image::string_to_constant_channel_policy(cfg.normalization.constant_channel, policy);

    const fs::path out_dir = run_dir / "outputs";
    const bool abort_on_fail = cfg.pipeline.abort_on_fail;

    YAML::Emitter cfg_yaml;
    cfg_yaml << cfg.to_yaml();
    const std::string cfg_text = cfg_yaml.c_str();

    emitter.run_start(run_id, {{"run_dir", run_dir.string()},
                               {"config_hash", core::sha256_bytes(std::vector<uint8_t>(cfg_text.begin(), cfg_text.end()))},
                               {"raster_kind", raster_kind_to_string(kind)},
                               {"raster_dirs", cfg.input.raster_dirs},
                               {"overlay_dirs", cfg.input.overlay_dirs},
                               {"abort_on_fail", abort_on_fail}},
                      log);

    auto fail = [&](Phase phase, const std::string& message) {
        result.success = false;
        result.error_message = message;
        emitter.error(run_id, message, log);
        emitter.phase_end(run_id, phase, "error", {{"error", message}}, log);
        emitter.run_end(run_id, false, "error", log);
        return result;
    };

    // --- SCAN_INPUT ---
    emitter.phase_start(run_id, Phase::SCAN_INPUT, log);
    MosaicInputs inputs = discover_inputs(cfg.input);
    result.tiles_total = static_cast<int>(inputs.rasters.size());
    emitter.phase_end(run_id, Phase::SCAN_INPUT, "ok",
                      {{"n_rasters", inputs.rasters.size()},
                       {"n_overlays", inputs.overlays.size()},
                       {"rasters", paths_to_json(inputs.rasters)},
                       {"overlays", paths_to_json(inputs.overlays)}},
                      log);

    // --- BOUNDS ---
    emitter.phase_start(run_id, Phase::BOUNDS, log);
    BoundsScan scan;
    try {
        scan = scan_bounds(inputs.rasters, abort_on_fail);
    } catch (const RasterDecodeError& e) {
        result.tiles_failed = 1;
        return fail(Phase::BOUNDS, e.what());
    }
    for (const auto& msg : scan.failures) {
        emitter.warning(run_id, msg, log);
    }
    result.tiles_failed = static_cast<int>(scan.failures.size());
    result.bounds = scan.bounds;
    if (is_empty(result.bounds)) {
        return fail(Phase::BOUNDS, EmptyMosaicError().what());
    }
    emitter.phase_end(run_id, Phase::BOUNDS, "ok",
                      {{"bounds", bounds_to_json(result.bounds)},
                       {"usable", scan.usable.size()},
                       {"failed", scan.failures.size()}},
                      log);

    std::unique_ptr<render::MosaicCanvas> canvas;
    if (cfg.render.enabled) {
        try {
            canvas = std::make_unique<render::MosaicCanvas>(result.bounds, cfg.render.width_px,
                                                            cfg.render.background);
        } catch (const GeoMosaicError& e) {
            emitter.phase_start(run_id, Phase::RENDER_TILES, log);
            return fail(Phase::RENDER_TILES, e.what());
        } catch (const std::bad_alloc&) {
            emitter.phase_start(run_id, Phase::RENDER_TILES, log);
            return fail(Phase::RENDER_TILES, "Render error: out of memory allocating the canvas");
        }
    }

    // --- RENDER_TILES ---
    // One tile alive at a time: load, extent, normalize, draw, discard.
    emitter.phase_start(run_id, Phase::RENDER_TILES, log);
    const int n_usable = static_cast<int>(scan.usable.size());
    for (int i = 0; i < n_usable; ++i) {
        const fs::path& path = scan.usable[static_cast<size_t>(i)];
        try {
            RasterTile tile = io::load_raster(path);
            const Extent extent = geo::compute_extent(tile);
            image::NormalizedImage img = image::normalize_tile(tile, kind, policy);
            if (canvas) {
                canvas->draw_tile(img, extent);
            }
            ++result.tiles_ok;
            emitter.tile_processed(run_id, i, n_usable, path.string(), extent, log);
        } catch (const GeoMosaicError& e) {
            ++result.tiles_failed;
            if (abort_on_fail) {
                return fail(Phase::RENDER_TILES, e.what());
            }
            emitter.warning(run_id, e.what(), log);
        }
        emitter.phase_progress(run_id, Phase::RENDER_TILES, i + 1, n_usable, path.filename().string(), log);
    }
    emitter.phase_end(run_id, Phase::RENDER_TILES, "ok",
                      {{"tiles_ok", result.tiles_ok}, {"tiles_failed", result.tiles_failed}},
                      log);

    // --- OVERLAY ---
    emitter.phase_start(run_id, Phase::OVERLAY, log);
    for (const auto& path : inputs.overlays) {
        try {
            io::RoadOverlay overlay = io::load_road_overlay(path);
            result.polylines += overlay.polylines.size();
            result.skipped_features += overlay.skipped_features.size();
            ++result.overlays_ok;
            if (!overlay.skipped_features.empty()) {
                emitter.warning(run_id,
                                std::to_string(overlay.skipped_features.size()) +
                                    " feature(s) skipped in " + path.string() +
                                    " (first: " +
                                    io::skip_reason_to_string(overlay.skipped_features.front().reason) + ")",
                                log);
            }
            if (canvas) {
                canvas->draw_roads(overlay, cfg.render.road_color, cfg.render.road_thickness_px);
            }
        } catch (const OverlayDecodeError& e) {
            ++result.overlays_failed;
            if (abort_on_fail) {
                return fail(Phase::OVERLAY, e.what());
            }
            emitter.warning(run_id, e.what(), log);
        }
    }
    emitter.phase_end(run_id, Phase::OVERLAY, "ok",
                      {{"overlays_ok", result.overlays_ok},
                       {"overlays_failed", result.overlays_failed},
                       {"polylines", result.polylines},
                       {"skipped_features", result.skipped_features}},
                      log);

    // --- WRITE ---
    emitter.phase_start(run_id, Phase::WRITE, log);
    try {
        fs::create_directories(out_dir);

        json summary;
        summary["run_id"] = run_id;
        summary["raster_kind"] = raster_kind_to_string(kind);
        summary["bounds"] = bounds_to_json(result.bounds);
        summary["tiles_total"] = result.tiles_total;
        summary["tiles_ok"] = result.tiles_ok;
        summary["tiles_failed"] = result.tiles_failed;
        summary["polylines"] = result.polylines;
        summary["skipped_features"] = result.skipped_features;
        core::write_text(out_dir / "bounds.json", summary.dump(2, ' ', false, json::error_handler_t::replace));

        if (canvas) {
            result.png_path = out_dir / cfg.render.output_png;
            canvas->save_png(result.png_path);
            if (!cfg.render.output_geotiff.empty()) {
                result.geotiff_path = out_dir / cfg.render.output_geotiff;
                io::write_raster_float(result.geotiff_path, canvas->to_bands(), canvas->geotransform());
            }
        }
    } catch (const GeoMosaicError& e) {
        return fail(Phase::WRITE, e.what());
    } catch (const fs::filesystem_error& e) {
        return fail(Phase::WRITE, e.what());
    }
    json written = {{"bounds_json", (out_dir / "bounds.json").string()}};
    if (!result.png_path.empty()) written["png"] = result.png_path.string();
    if (!result.geotiff_path.empty()) written["geotiff"] = result.geotiff_path.string();
    emitter.phase_end(run_id, Phase::WRITE, "ok", written, log);

    emitter.phase_start(run_id, Phase::DONE, log);
    emitter.phase_end(run_id, Phase::DONE, "ok", {}, log);
    emitter.run_end(run_id, true, "ok", log);

    result.success = true;
    return result;
}

} // namespace geo_mosaic::pipeline
