#include "geo_mosaic/config/configuration.hpp"
#include "geo_mosaic/core/errors.hpp"
#include "geo_mosaic/core/types.hpp"
#include "geo_mosaic/image/normalization.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

namespace geo_mosaic::config {

static void read_rgb(const YAML::Node& n, std::array<int, 3>& out) {
    if (n && n.IsSequence() && n.size() == 3) {
        out[0] = n[0].as<int>();
        out[1] = n[1].as<int>();
        out[2] = n[2].as<int>();
    }
}

static void read_string_list(const YAML::Node& n, std::vector<std::string>& out) {
    if (!n) return;
    out.clear();
    if (n.IsSequence()) {
        for (const auto& it : n) {
            out.push_back(it.as<std::string>());
        }
    } else if (n.IsScalar()) {
        out.push_back(n.as<std::string>());
    }
}

static YAML::Node rgb_node(const std::array<int, 3>& rgb) {
    YAML::Node n;
    n.SetStyle(YAML::EmitterStyle::Flow);
    n.push_back(rgb[0]);
    n.push_back(rgb[1]);
    n.push_back(rgb[2]);
    return n;
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["pipeline"]) {
        auto p = node["pipeline"];
        if (p["abort_on_fail"]) cfg.pipeline.abort_on_fail = p["abort_on_fail"].as<bool>();
    }

    if (node["input"]) {
        auto in = node["input"];
        read_string_list(in["raster_dirs"], cfg.input.raster_dirs);
        if (in["raster_kind"]) cfg.input.raster_kind = in["raster_kind"].as<std::string>();
        if (in["raster_pattern"]) cfg.input.raster_pattern = in["raster_pattern"].as<std::string>();
        read_string_list(in["overlay_dirs"], cfg.input.overlay_dirs);
        if (in["overlay_pattern"]) cfg.input.overlay_pattern = in["overlay_pattern"].as<std::string>();
        if (in["max_tiles"]) cfg.input.max_tiles = in["max_tiles"].as<int>();
    }

    if (node["normalization"]) {
        auto n = node["normalization"];
        if (n["constant_channel"]) cfg.normalization.constant_channel = n["constant_channel"].as<std::string>();
    }

    if (node["render"]) {
        auto r = node["render"];
        if (r["enabled"]) cfg.render.enabled = r["enabled"].as<bool>();
        if (r["width_px"]) cfg.render.width_px = r["width_px"].as<int>();
        if (r["output_png"]) cfg.render.output_png = r["output_png"].as<std::string>();
        if (r["output_geotiff"]) cfg.render.output_geotiff = r["output_geotiff"].as<std::string>();
        read_rgb(r["road_color"], cfg.render.road_color);
        if (r["road_thickness_px"]) cfg.render.road_thickness_px = r["road_thickness_px"].as<int>();
        read_rgb(r["background"], cfg.render.background);
    }

    if (node["output"]) {
        auto o = node["output"];
        if (o["runs_dir"]) cfg.output.runs_dir = o["runs_dir"].as<std::string>();
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["pipeline"]["abort_on_fail"] = pipeline.abort_on_fail;

    node["input"]["raster_dirs"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& d : input.raster_dirs) node["input"]["raster_dirs"].push_back(d);
    node["input"]["raster_kind"] = input.raster_kind;
    node["input"]["raster_pattern"] = input.raster_pattern;
    node["input"]["overlay_dirs"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& d : input.overlay_dirs) node["input"]["overlay_dirs"].push_back(d);
    node["input"]["overlay_pattern"] = input.overlay_pattern;
    node["input"]["max_tiles"] = input.max_tiles;

    node["normalization"]["constant_channel"] = normalization.constant_channel;

    node["render"]["enabled"] = render.enabled;
    node["render"]["width_px"] = render.width_px;
    node["render"]["output_png"] = render.output_png;
    node["render"]["output_geotiff"] = render.output_geotiff;
    node["render"]["road_color"] = rgb_node(render.road_color);
    node["render"]["road_thickness_px"] = render.road_thickness_px;
    node["render"]["background"] = rgb_node(render.background);

    node["output"]["runs_dir"] = output.runs_dir;

    return node;
}

static bool valid_rgb(const std::array<int, 3>& rgb) {
    for (int v : rgb) {
        if (v < 0 || v > 255) return false;
    }
    return true;
}

void Config::validate() const {
    RasterKind kind;
    if (!string_to_raster_kind(input.raster_kind, kind)) {
        throw ValidationError("input.raster_kind must be 'PAN' or 'PSRGB'");
    }
    if (input.raster_pattern.empty()) {
        throw ValidationError("input.raster_pattern must not be empty");
    }
    if (input.overlay_pattern.empty()) {
        throw ValidationError("input.overlay_pattern must not be empty");
    }
    if (input.max_tiles < 0) {
        throw ValidationError("input.max_tiles must be >= 0");
    }

    image::ConstantChannelPolicy policy;
    if (!image::string_to_constant_channel_policy(normalization.constant_channel, policy)) {
        throw ValidationError("normalization.constant_channel must be 'zero', 'half' or 'error'");
    }

    if (render.width_px < 16 || render.width_px > 32768) {
        throw ValidationError("render.width_px must be in [16,32768]");
    }
    if (render.enabled && render.output_png.empty()) {
        throw ValidationError("render.output_png must be set when render.enabled is true");
    }
    if (render.road_thickness_px < 1 || render.road_thickness_px > 64) {
        throw ValidationError("render.road_thickness_px must be in [1,64]");
    }
    if (!valid_rgb(render.road_color) || !valid_rgb(render.background)) {
        throw ValidationError("render.road_color and render.background must be [r,g,b] in [0,255]");
    }

    if (output.runs_dir.empty()) {
        throw ValidationError("output.runs_dir must not be empty");
    }
}

std::string get_schema_json() {
    using json = nlohmann::json;

    json rgb = {
        {"type", "array"},
        {"items", {{"type", "integer"}, {"minimum", 0}, {"maximum", 255}}},
        {"minItems", 3},
        {"maxItems", 3}
    };
    json string_list = {{"type", "array"}, {"items", {{"type", "string"}}}};

    json schema = {
        {"$schema", "http://json-schema.org/draft-07/schema#"},
        {"title", "geo_mosaic configuration"},
        {"type", "object"},
        {"properties", {
            {"pipeline", {
                {"type", "object"},
                {"properties", {
                    {"abort_on_fail", {{"type", "boolean"}, {"default", false}}}
                }}
            }},
            {"input", {
                {"type", "object"},
                {"properties", {
                    {"raster_dirs", string_list},
                    {"raster_kind", {{"type", "string"}, {"enum", json::array({"PAN", "PSRGB"})}, {"default", "PAN"}}},
                    {"raster_pattern", {{"type", "string"}, {"default", "*.tif"}}},
                    {"overlay_dirs", string_list},
                    {"overlay_pattern", {{"type", "string"}, {"default", "*.geojson"}}},
                    {"max_tiles", {{"type", "integer"}, {"minimum", 0}, {"default", 0}}}
                }}
            }},
            {"normalization", {
                {"type", "object"},
                {"properties", {
                    {"constant_channel", {{"type", "string"}, {"enum", json::array({"zero", "half", "error"})}, {"default", "zero"}}}
                }}
            }},
            {"render", {
                {"type", "object"},
                {"properties", {
                    {"enabled", {{"type", "boolean"}, {"default", true}}},
                    {"width_px", {{"type", "integer"}, {"minimum", 16}, {"maximum", 32768}, {"default", 2400}}},
                    {"output_png", {{"type", "string"}, {"default", "mosaic.png"}}},
                    {"output_geotiff", {{"type", "string"}, {"default", ""}}},
                    {"road_color", rgb},
                    {"road_thickness_px", {{"type", "integer"}, {"minimum", 1}, {"maximum", 64}, {"default", 1}}},
                    {"background", rgb}
                }}
            }},
            {"output", {
                {"type", "object"},
                {"properties", {
                    {"runs_dir", {{"type", "string"}, {"default", "runs"}}}
                }}
            }}
        }}
    };
    return schema.dump(2);
}

} // namespace geo_mosaic::config
