#include "geo_mosaic/core/events.hpp"
#include "geo_mosaic/core/utils.hpp"

namespace geo_mosaic::core {

EventEmitter::EventEmitter(std::ostream* mirror)
    : mirror_(mirror) {}

json EventEmitter::base_event(const std::string& type, const std::string& run_id) {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event, std::ostream& out) {
    // File names are raw bytes; invalid UTF-8 becomes U+FFFD instead of throwing.
    const std::string line = event.dump(-1, ' ', false, json::error_handler_t::replace);
    out << line << "\n";
    out.flush();
    if (mirror_ && mirror_ != &out) {
        (*mirror_) << line << "\n";
        mirror_->flush();
    }
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    json event = base_event("run_start", run_id);
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, std::ostream& out) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    emit(event, out);
}

void EventEmitter::phase_start(const std::string& run_id, Phase phase, std::ostream& out) {
    json event = base_event("phase_start", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    emit(event, out);
}

void EventEmitter::phase_progress(const std::string& run_id, Phase phase, int current,
                                  int total, const std::string& message, std::ostream& out) {
    json event = base_event("phase_progress", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["current"] = current;
    event["total"] = total;
    event["progress"] = total > 0 ? static_cast<float>(current) / static_cast<float>(total) : 1.0f;
    event["substep"] = message;
    emit(event, out);
}

void EventEmitter::phase_end(const std::string& run_id, Phase phase,
                             const std::string& status, const json& extra, std::ostream& out) {
    json event = base_event("phase_end", run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::tile_processed(const std::string& run_id, int tile_idx, int total_tiles,
                                  const std::string& tile_path, const Extent& extent,
                                  std::ostream& out) {
    json event = base_event("tile_processed", run_id);
    event["tile_idx"] = tile_idx;
    event["total_tiles"] = total_tiles;
    event["tile_path"] = tile_path;
    event["extent"] = extent_to_json(extent);
    emit(event, out);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           std::ostream& out) {
    json event = base_event("warning", run_id);
    event["message"] = message;
    emit(event, out);
}

void EventEmitter::error(const std::string& run_id, const std::string& message,
                         std::ostream& out) {
    json event = base_event("error", run_id);
    event["message"] = message;
    emit(event, out);
}

json extent_to_json(const Extent& extent) {
    return {
        {"left", extent.left},
        {"right", extent.right},
        {"bottom", extent.bottom},
        {"top", extent.top}
    };
}

} // namespace geo_mosaic::core
