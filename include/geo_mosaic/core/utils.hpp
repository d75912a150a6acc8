#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace geo_mosaic::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<fs::path> discover_files(const fs::path& input_dir, const std::string& pattern = "*");
std::vector<uint8_t> read_bytes(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// Hashing (hex digest)
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);

// String utilities
std::string to_lower(const std::string& s);

// Glob pattern matching (case-insensitive, '*' and '?')
bool glob_match(const std::string& pattern, const std::string& str);

} // namespace geo_mosaic::core
