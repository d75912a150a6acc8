#include "geo_mosaic/core/errors.hpp"
#include "geo_mosaic/core/utils.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;

TEST_CASE("glob_match_wildcards_and_case") {
    using geo_mosaic::core::glob_match;

    REQUIRE(glob_match("*.tif", "tile_001.tif"));
    REQUIRE(glob_match("*.tif", "TILE_001.TIF"));
    REQUIRE(glob_match("tile_??.tif", "tile_07.tif"));
    REQUIRE_FALSE(glob_match("tile_??.tif", "tile_007.tif"));
    REQUIRE_FALSE(glob_match("*.tif", "tile.tiff"));
    // '.' is literal
    REQUIRE_FALSE(glob_match("*.tif", "tile_tif"));
}

TEST_CASE("discover_files_sorted_and_filtered") {
    fs::path dir = fs::temp_directory_path() / ("geo_mosaic_utils_" + geo_mosaic::core::get_run_id());
    fs::create_directories(dir / "sub.tif");
    geo_mosaic::core::write_text(dir / "b.tif", "");
    geo_mosaic::core::write_text(dir / "a.tif", "");
    geo_mosaic::core::write_text(dir / "notes.txt", "");

    auto files = geo_mosaic::core::discover_files(dir, "*.tif");

    REQUIRE(files.size() == 2);
    REQUIRE(files[0].filename() == "a.tif");
    REQUIRE(files[1].filename() == "b.tif");

    REQUIRE(geo_mosaic::core::discover_files(dir / "missing", "*").empty());

    fs::remove_all(dir);
}

TEST_CASE("write_text_and_read_bytes") {
    fs::path dir = fs::temp_directory_path() / ("geo_mosaic_utils_" + geo_mosaic::core::get_run_id());
    fs::create_directories(dir);

    geo_mosaic::core::write_text(dir / "x.json", "{\"a\": 1}");

    std::vector<uint8_t> bytes = geo_mosaic::core::read_bytes(dir / "x.json");
    REQUIRE(std::string(bytes.begin(), bytes.end()) == "{\"a\": 1}");
    REQUIRE_THROWS_AS(geo_mosaic::core::read_bytes(dir / "missing.json"), geo_mosaic::IOError);

    fs::remove_all(dir);
}

TEST_CASE("sha256_known_digest") {
    std::vector<uint8_t> abc{'a', 'b', 'c'};

    REQUIRE(geo_mosaic::core::sha256_bytes(abc) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    fs::path dir = fs::temp_directory_path() / ("geo_mosaic_utils_" + geo_mosaic::core::get_run_id());
    fs::create_directories(dir);
    geo_mosaic::core::write_text(dir / "abc.txt", "abc");
    REQUIRE(geo_mosaic::core::sha256_file(dir / "abc.txt") == geo_mosaic::core::sha256_bytes(abc));
    fs::remove_all(dir);
}

TEST_CASE("run_id_has_timestamp_and_suffix") {
    std::string id = geo_mosaic::core::get_run_id();

    // YYYYMMDD_HHMMSS_xxxxxxxx
    REQUIRE(id.size() == 24);
    REQUIRE(id[8] == '_');
    REQUIRE(id[15] == '_');
}
