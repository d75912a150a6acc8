#pragma once

#include <array>
#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace geo_mosaic::config {

namespace fs = std::filesystem;

struct PipelineConfig {
  bool abort_on_fail = false;
};

struct InputConfig {
  std::vector<std::string> raster_dirs;
  std::string raster_kind = "PAN"; // PAN | PSRGB
  std::string raster_pattern = "*.tif";
  std::vector<std::string> overlay_dirs;
  std::string overlay_pattern = "*.geojson";
  int max_tiles = 0; // 0 = all
};

struct NormalizationConfig {
  std::string constant_channel = "zero"; // zero | half | error
};

struct RenderConfig {
  bool enabled = true;
  int width_px = 2400;
  std::string output_png = "mosaic.png";
  std::string output_geotiff;           // empty = disabled
  std::array<int, 3> road_color{255, 255, 255};
  int road_thickness_px = 1;
  std::array<int, 3> background{0, 0, 0};
};

struct OutputConfig {
  std::string runs_dir = "runs";
};

struct Config {
  PipelineConfig pipeline;
  InputConfig input;
  NormalizationConfig normalization;
  RenderConfig render;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace geo_mosaic::config
