#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace geo_mosaic::core {

using json = nlohmann::json;

/**
 * JSON-lines event log for mosaic runs. Every event is written to the
 * stream passed per call and, when set, mirrored to a second stream
 * (stdout for the CLI).
 */
class EventEmitter {
public:
    explicit EventEmitter(std::ostream* mirror = nullptr);

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status, std::ostream& out);

    void phase_start(const std::string& run_id, Phase phase, std::ostream& out);
    void phase_progress(const std::string& run_id, Phase phase, int current, int total,
                        const std::string& message, std::ostream& out);
    void phase_end(const std::string& run_id, Phase phase, const std::string& status,
                   const json& extra, std::ostream& out);

    void tile_processed(const std::string& run_id, int tile_idx, int total_tiles,
                        const std::string& tile_path, const Extent& extent, std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& run_id);

    std::ostream* mirror_;
};

json extent_to_json(const Extent& extent);

} // namespace geo_mosaic::core
