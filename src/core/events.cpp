#include "tid_music/core/events.hpp"
#include "tid_music/core/utils.hpp"

namespace tid_music::core {

json EventEmitter::base_event(const std::string& type, const std::string& run_id) const {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::write(const json& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << event.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    out_.flush();
}

void EventEmitter::run_start(const std::string& run_id, const json& extra) {
    json event = base_event("run_start", run_id);
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    write(event);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, const json& extra) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    write(event);
}

void EventEmitter::stage_start(const std::string& run_id, ProcessLevel stage,
                               const std::string& event_key) {
    json event = base_event("stage_start", run_id);
    event["stage"] = process_level_to_string(stage);
    event["event"] = event_key;
    write(event);
}

void EventEmitter::stage_end(const std::string& run_id, ProcessLevel stage,
                             const std::string& event_key, const std::string& status,
                             const json& extra) {
    json event = base_event("stage_end", run_id);
    event["stage"] = process_level_to_string(stage);
    event["event"] = event_key;
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    write(event);
}

void EventEmitter::event_result(const std::string& run_id, const std::string& event_key,
                                const std::string& status, const json& extra) {
    json event = base_event("event_result", run_id);
    event["event"] = event_key;
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    write(event);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           const json& extra) {
    json event = base_event("warning", run_id);
    event["message"] = message;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    write(event);
}

void EventEmitter::error(const std::string& run_id, const std::string& message,
                         const json& extra) {
    json event = base_event("error", run_id);
    event["message"] = message;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    write(event);
}

void EventEmitter::emit(const std::string& type, const std::string& run_id,
                        const json& data) {
    json event = base_event(type, run_id);
    for (auto& [key, value] : data.items()) {
        event[key] = value;
    }
    write(event);
}

} // namespace tid_music::core
