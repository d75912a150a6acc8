#pragma once

#include "geo_mosaic/core/types.hpp"

#include <string>
#include <vector>

namespace geo_mosaic::io {

enum class SkipReason {
    MultiPart,        // nested sub-paths (MultiLineString, Polygon rings)
    MissingGeometry,  // no geometry object or no coordinates array
    NotALine          // point-shaped or malformed vertices
};

std::string skip_reason_to_string(SkipReason reason);

struct SkippedFeature {
    size_t index = 0;
    SkipReason reason = SkipReason::MultiPart;
};

struct RoadOverlay {
    fs::path source;
    std::vector<Polyline> polylines;
    std::vector<SkippedFeature> skipped_features;
};

RoadOverlay load_road_overlay(const fs::path& path);

// `source` names the document in error messages and in RoadOverlay::source.
RoadOverlay parse_road_overlay(const std::string& text, const fs::path& source = {});

bool is_overlay_path(const fs::path& path);

} // namespace geo_mosaic::io
