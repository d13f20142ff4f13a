#pragma once

#include "process_state.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <ostream>
#include <string>

namespace tid_music::core {

using json = nlohmann::json;

// Writes one JSON object per line. Calls may come from concurrent workers.
// Invalid UTF-8 in strings is replaced rather than rejected.
class EventEmitter {
public:
    explicit EventEmitter(std::ostream& out) : out_(out) {}

    void run_start(const std::string& run_id, const json& extra);
    void run_end(const std::string& run_id, bool success, const std::string& status,
                 const json& extra = json::object());

    void stage_start(const std::string& run_id, ProcessLevel stage,
                     const std::string& event_key);
    void stage_end(const std::string& run_id, ProcessLevel stage,
                   const std::string& event_key, const std::string& status,
                   const json& extra = json::object());

    void event_result(const std::string& run_id, const std::string& event_key,
                      const std::string& status, const json& extra = json::object());

    void warning(const std::string& run_id, const std::string& message,
                 const json& extra = json::object());
    void error(const std::string& run_id, const std::string& message,
               const json& extra = json::object());

    void emit(const std::string& type, const std::string& run_id, const json& data);

private:
    void write(const json& event);
    json base_event(const std::string& type, const std::string& run_id) const;

    std::ostream& out_;
    std::mutex mutex_;
};

} // namespace tid_music::core
