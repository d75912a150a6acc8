#include "geo_mosaic/io/overlay_io.hpp"
#include "geo_mosaic/core/errors.hpp"
#include "geo_mosaic/core/utils.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>

namespace geo_mosaic::io {

using json = nlohmann::json;

namespace {

enum class CoordShape {
    Flat,
    Nested,
    Invalid
};

// A vertex is an array of at least two numbers; ordinates past y are ignored.
std::optional<Point2D> parse_vertex(const json& v) {
    if (!v.is_array() || v.size() < 2) return std::nullopt;
    if (!v[0].is_number() || !v[1].is_number()) return std::nullopt;
    Point2D p;
    p.x = v[0].get<double>();
    p.y = v[1].get<double>();
    return p;
}

CoordShape classify(const json& coords) {
    if (!coords.is_array() || coords.empty()) return CoordShape::Invalid;
    for (const auto& v : coords) {
        if (!v.is_array()) return CoordShape::Invalid;
        if (!v.empty() && v[0].is_array()) return CoordShape::Nested;
    }
    return CoordShape::Flat;
}

void record_skip(RoadOverlay& overlay, size_t index, SkipReason reason) {
    overlay.skipped_features.push_back({index, reason});
    std::cerr << "[ROADS] Skipping feature " << index << " ("
              << skip_reason_to_string(reason) << ") in "
              << (overlay.source.empty() ? std::string("<memory>") : overlay.source.string())
              << std::endl;
}

} // namespace

std::string skip_reason_to_string(SkipReason reason) {
    switch (reason) {
        case SkipReason::MultiPart: return "multi-part geometry";
        case SkipReason::MissingGeometry: return "missing geometry";
        case SkipReason::NotALine: return "not a line geometry";
        default: return "unknown";
    }
}

bool is_overlay_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".geojson" || ext == ".json";
}

RoadOverlay load_road_overlay(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw OverlayDecodeError("Cannot open overlay: " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return parse_road_overlay(text, path);
}

RoadOverlay parse_road_overlay(const std::string& text, const fs::path& source) {
    const std::string name = source.empty() ? std::string("<memory>") : source.string();

    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw OverlayDecodeError("Invalid JSON in " + name + ": " + e.what());
    }

    if (!doc.is_object()) {
        throw OverlayDecodeError("Top-level value is not an object: " + name);
    }
    auto features = doc.find("features");
    if (features == doc.end() || !features->is_array()) {
        throw OverlayDecodeError("Missing 'features' array: " + name);
    }

    RoadOverlay overlay;
    overlay.source = source;
    overlay.polylines.reserve(features->size());

    for (size_t i = 0; i < features->size(); ++i) {
        const json& feature = (*features)[i];
        if (!feature.is_object()) {
            record_skip(overlay, i, SkipReason::MissingGeometry);
            continue;
        }

        auto geometry = feature.find("geometry");
        if (geometry == feature.end() || !geometry->is_object()) {
            record_skip(overlay, i, SkipReason::MissingGeometry);
            continue;
        }
        auto coords = geometry->find("coordinates");
        if (coords == geometry->end()) {
            record_skip(overlay, i, SkipReason::MissingGeometry);
            continue;
        }

        switch (classify(*coords)) {
            case CoordShape::Nested:
                record_skip(overlay, i, SkipReason::MultiPart);
                continue;
            case CoordShape::Invalid:
                record_skip(overlay, i, SkipReason::NotALine);
                continue;
            case CoordShape::Flat:
                break;
        }

        Polyline line;
        line.reserve(coords->size());
        bool valid = true;
        for (const auto& v : *coords) {
            auto p = parse_vertex(v);
            if (!p) {
                valid = false;
                break;
            }
            line.push_back(*p);
        }
        if (!valid) {
            record_skip(overlay, i, SkipReason::NotALine);
            continue;
        }

        overlay.polylines.push_back(std::move(line));
    }

    return overlay;
}

} // namespace geo_mosaic::io
