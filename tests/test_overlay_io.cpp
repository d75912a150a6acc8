#include "geo_mosaic/io/overlay_io.hpp"
#include "geo_mosaic/core/errors.hpp"
#include "geo_mosaic/core/utils.hpp"

#include <filesystem>
#include <string>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;
using geo_mosaic::io::SkipReason;

namespace {

const char* kFlatAndMultipart = R"({
  "type": "FeatureCollection",
  "features": [
    {"type": "Feature", "properties": {"name": "main st"},
     "geometry": {"type": "LineString", "coordinates": [[100.0, 190.0], [110.0, 195.0], [120.0, 200.0]]}},
    {"type": "Feature", "properties": {},
     "geometry": {"type": "MultiLineString", "coordinates": [[[0.0, 0.0], [1.0, 1.0]], [[2.0, 2.0], [3.0, 3.0]]]}}
  ]
})";

} // namespace

TEST_CASE("parse_road_overlay_skips_multipart_feature") {
    auto overlay = geo_mosaic::io::parse_road_overlay(kFlatAndMultipart);

    REQUIRE(overlay.polylines.size() == 1);
    REQUIRE(overlay.polylines[0].size() == 3);
    REQUIRE(overlay.polylines[0][1].x == Catch::Approx(110.0));
    REQUIRE(overlay.polylines[0][1].y == Catch::Approx(195.0));

    REQUIRE(overlay.skipped_features.size() == 1);
    REQUIRE(overlay.skipped_features[0].index == 1);
    REQUIRE(overlay.skipped_features[0].reason == SkipReason::MultiPart);
}

TEST_CASE("parse_road_overlay_skips_missing_geometry") {
    const char* doc = R"({"features": [
        {"type": "Feature", "geometry": null},
        {"type": "Feature"},
        {"type": "Feature", "geometry": {"type": "LineString"}},
        {"type": "Feature", "geometry": {"type": "LineString", "coordinates": [[0, 0], [1, 1]]}}
    ]})";

    auto overlay = geo_mosaic::io::parse_road_overlay(doc);

    REQUIRE(overlay.polylines.size() == 1);
    REQUIRE(overlay.skipped_features.size() == 3);
    for (const auto& s : overlay.skipped_features) {
        REQUIRE(s.reason == SkipReason::MissingGeometry);
    }
    REQUIRE(overlay.skipped_features[2].index == 2);
}

TEST_CASE("parse_road_overlay_skips_point_geometry") {
    const char* doc = R"({"features": [
        {"type": "Feature", "geometry": {"type": "Point", "coordinates": [5.0, 6.0]}},
        {"type": "Feature", "geometry": {"type": "LineString", "coordinates": [[0, 0], ["a", 1]]}}
    ]})";

    auto overlay = geo_mosaic::io::parse_road_overlay(doc);

    REQUIRE(overlay.polylines.empty());
    REQUIRE(overlay.skipped_features.size() == 2);
    REQUIRE(overlay.skipped_features[0].reason == SkipReason::NotALine);
    REQUIRE(overlay.skipped_features[1].reason == SkipReason::NotALine);
}

TEST_CASE("parse_road_overlay_ignores_elevation") {
    const char* doc = R"({"features": [
        {"type": "Feature", "geometry": {"type": "LineString", "coordinates": [[1, 2, 300], [4, 5, 301]]}}
    ]})";

    auto overlay = geo_mosaic::io::parse_road_overlay(doc);

    REQUIRE(overlay.polylines.size() == 1);
    REQUIRE(overlay.polylines[0][0].x == Catch::Approx(1.0));
    REQUIRE(overlay.polylines[0][0].y == Catch::Approx(2.0));
    REQUIRE(overlay.polylines[0][1].x == Catch::Approx(4.0));
    REQUIRE(overlay.polylines[0][1].y == Catch::Approx(5.0));
}

TEST_CASE("parse_road_overlay_empty_collection") {
    auto overlay = geo_mosaic::io::parse_road_overlay(R"({"type": "FeatureCollection", "features": []})");

    REQUIRE(overlay.polylines.empty());
    REQUIRE(overlay.skipped_features.empty());
}

TEST_CASE("parse_road_overlay_rejects_malformed_documents") {
    REQUIRE_THROWS_AS(geo_mosaic::io::parse_road_overlay("{ not json"), geo_mosaic::OverlayDecodeError);
    REQUIRE_THROWS_AS(geo_mosaic::io::parse_road_overlay("[1, 2, 3]"), geo_mosaic::OverlayDecodeError);
    REQUIRE_THROWS_AS(geo_mosaic::io::parse_road_overlay(R"({"type": "FeatureCollection"})"),
                      geo_mosaic::OverlayDecodeError);
}

TEST_CASE("load_road_overlay_reads_file") {
    fs::path dir = fs::temp_directory_path() / ("geo_mosaic_overlay_" + geo_mosaic::core::get_run_id());
    fs::create_directories(dir);
    fs::path file = dir / "roads.geojson";
    geo_mosaic::core::write_text(file, kFlatAndMultipart);

    auto overlay = geo_mosaic::io::load_road_overlay(file);

    REQUIRE(overlay.source == file);
    REQUIRE(overlay.polylines.size() == 1);
    REQUIRE(overlay.skipped_features.size() == 1);

    REQUIRE_THROWS_AS(geo_mosaic::io::load_road_overlay(dir / "missing.geojson"),
                      geo_mosaic::OverlayDecodeError);

    fs::remove_all(dir);
}

TEST_CASE("is_overlay_path_matches_geojson_extensions") {
    REQUIRE(geo_mosaic::io::is_overlay_path("roads.geojson"));
    REQUIRE(geo_mosaic::io::is_overlay_path("ROADS.JSON"));
    REQUIRE_FALSE(geo_mosaic::io::is_overlay_path("roads.shp"));
}
