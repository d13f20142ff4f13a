#include "tid_music/catalog/event_list.hpp"
#include "tid_music/core/errors.hpp"

namespace tid_music::catalog {

std::vector<core::EventId> generate_event_windows(const std::vector<std::string>& radars,
                                                  EpochSeconds start, EpochSeconds end,
                                                  EpochSeconds duration_s, EpochSeconds step_s) {
    if (radars.empty()) {
        throw ConfigurationError("no radars given for event generation");
    }
    if (end <= start) {
        throw ConfigurationError("event range end must be after start");
    }
    if (duration_s <= 0 || step_s <= 0) {
        throw ConfigurationError("event duration and step must be positive");
    }

    std::vector<core::EventId> windows;
    for (const auto& radar : radars) {
        for (EpochSeconds t = start; t + duration_s <= end; t += step_s) {
            windows.push_back({radar, t, t + duration_s});
        }
    }
    return windows;
}

} // namespace tid_music::catalog
