#include "geo_mosaic/config/configuration.hpp"
#include "geo_mosaic/core/errors.hpp"
#include "geo_mosaic/core/events.hpp"
#include "geo_mosaic/core/types.hpp"
#include "geo_mosaic/core/utils.hpp"
#include "geo_mosaic/geo/georeference.hpp"
#include "geo_mosaic/io/overlay_io.hpp"
#include "geo_mosaic/io/raster_io.hpp"
#include "geo_mosaic/pipeline/mosaic_bounds.hpp"
#include "geo_mosaic/pipeline/mosaic_pipeline.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace geo_mosaic;

static void print_json(const json& j) {
  std::cout << j.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
}

static int run_command(const std::string& config_path, const std::string& runs_dir_override,
                       const std::vector<std::string>& input_dirs, int max_tiles) {
  config::Config cfg = config::Config::load(config_path);
  if (!input_dirs.empty()) {
    cfg.input.raster_dirs = input_dirs;
  }
  if (!runs_dir_override.empty()) {
    cfg.output.runs_dir = runs_dir_override;
  }
  if (max_tiles > 0) {
    cfg.input.max_tiles = max_tiles;
  }
  cfg.validate();

  const std::string run_id = core::get_run_id();
  const fs::path run_dir = fs::path(cfg.output.runs_dir) / run_id;
  fs::create_directories(run_dir / "logs");
  cfg.save(run_dir / "config.yaml");

  std::ofstream log_file(run_dir / "logs" / "run_events.jsonl");
  if (!log_file) {
    throw IOError("Cannot create event log in " + run_dir.string());
  }

  core::EventEmitter emitter(&std::cout);
  pipeline::MosaicRunResult result =
      pipeline::run_mosaic(cfg, run_id, run_dir, emitter, log_file);

  if (!result.success) {
    std::cerr << "Error: " << result.error_message << std::endl;
    return 1;
  }
  return 0;
}

static int bounds_command(const std::vector<std::string>& dirs, const std::string& pattern,
                          bool abort_on_fail) {
  config::InputConfig input;
  input.raster_dirs = dirs;
  input.raster_pattern = pattern;
  pipeline::MosaicInputs inputs = pipeline::discover_inputs(input);

  pipeline::BoundsScan scan = pipeline::scan_bounds(inputs.rasters, abort_on_fail);
  for (const auto& msg : scan.failures) {
    std::cerr << "Warning: " << msg << std::endl;
  }

  json out;
  out["n_rasters"] = inputs.rasters.size();
  out["n_usable"] = scan.usable.size();
  out["bounds"] = pipeline::bounds_to_json(scan.bounds);
  print_json(out);

  // Validates the range the way a renderer would before plotting.
  pipeline::drawable_range(scan.bounds);
  return 0;
}

static int inspect_command(const std::string& path) {
  io::RasterInfo info = io::read_raster_info(path);
  Extent extent = geo::compute_extent(info.geotransform, info.width, info.height);

  json out;
  out["path"] = path;
  out["driver"] = info.driver;
  out["sha256"] = core::sha256_file(path);
  out["width"] = info.width;
  out["height"] = info.height;
  out["band_count"] = info.band_count;
  out["geotransform"] = info.geotransform;
  out["extent"] = core::extent_to_json(extent);
  out["extent_axis_aligned"] = core::extent_to_json(geo::axis_aligned(extent));
  print_json(out);
  return 0;
}

static int roads_command(const std::string& path) {
  io::RoadOverlay overlay = io::load_road_overlay(path);

  json skipped = json::array();
  for (const auto& s : overlay.skipped_features) {
    skipped.push_back({{"index", s.index}, {"reason", io::skip_reason_to_string(s.reason)}});
  }
  size_t vertices = 0;
  for (const auto& line : overlay.polylines) {
    vertices += line.size();
  }

  json out;
  out["path"] = path;
  out["polylines"] = overlay.polylines.size();
  out["vertices"] = vertices;
  out["skipped"] = skipped;
  print_json(out);
  return 0;
}

int main(int argc, char* argv[]) {
  CLI::App app{"GeoMosaic - georeferenced raster tile mosaic with road overlays"};
  app.require_subcommand(1);

  std::string config_path, runs_dir;
  std::vector<std::string> input_dirs;
  int max_tiles = 0;

  auto run_cmd = app.add_subcommand("run", "Run a full mosaic from a YAML config");
  run_cmd->add_option("--config", config_path, "Path to config.yaml")->required();
  run_cmd->add_option("--runs-dir", runs_dir, "Override output.runs_dir");
  run_cmd->add_option("--input-dir", input_dirs, "Override input.raster_dirs (repeatable)");
  run_cmd->add_option("--max-tiles", max_tiles, "Limit number of tiles (0 = no limit)");

  std::vector<std::string> bounds_dirs;
  std::string bounds_pattern = "*.tif";
  bool bounds_abort = false;
  auto bounds_cmd = app.add_subcommand("bounds", "Fold tile extents into mosaic bounds");
  bounds_cmd->add_option("dirs", bounds_dirs, "Raster directories")->required();
  bounds_cmd->add_option("--pattern", bounds_pattern, "Raster file glob");
  bounds_cmd->add_flag("--abort-on-fail", bounds_abort, "Stop at the first unreadable raster");

  std::string inspect_path;
  auto inspect_cmd = app.add_subcommand("inspect", "Print raster metadata and extent");
  inspect_cmd->add_option("raster", inspect_path, "Raster file")->required();

  std::string roads_path;
  auto roads_cmd = app.add_subcommand("roads", "Parse a GeoJSON road overlay");
  roads_cmd->add_option("geojson", roads_path, "GeoJSON file")->required();

  auto schema_cmd = app.add_subcommand("schema", "Print the configuration JSON schema");

  CLI11_PARSE(app, argc, argv);

  try {
    if (run_cmd->parsed()) {
      return run_command(config_path, runs_dir, input_dirs, max_tiles);
    }
    if (bounds_cmd->parsed()) {
      return bounds_command(bounds_dirs, bounds_pattern, bounds_abort);
    }
    if (inspect_cmd->parsed()) {
      return inspect_command(inspect_path);
    }
    if (roads_cmd->parsed()) {
      return roads_command(roads_path);
    }
    if (schema_cmd->parsed()) {
      std::cout << config::get_schema_json() << std::endl;
      return 0;
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::cerr << app.help() << std::endl;
  return 1;
}
