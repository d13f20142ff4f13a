#pragma once

#include "types.hpp"

#include <string>

namespace tid_music::core {

// Identity of an observation window.
struct EventId {
    std::string radar;
    EpochSeconds start = 0;
    EpochSeconds end = 0;

    // "<YYYYmmdd.HHMM>-<YYYYmmdd.HHMM>"
    std::string window_name() const;
    // "<radar>/<window_name>"
    std::string key() const;

    bool operator==(const EventId& o) const {
        return radar == o.radar && start == o.start && end == o.end;
    }
    bool operator!=(const EventId& o) const { return !(*this == o); }
    bool operator<(const EventId& o) const {
        if (radar != o.radar) return radar < o.radar;
        if (start != o.start) return start < o.start;
        return end < o.end;
    }
};

} // namespace tid_music::core
