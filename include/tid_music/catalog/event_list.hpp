#pragma once

#include "tid_music/core/event_id.hpp"

#include <string>
#include <vector>

namespace tid_music::catalog {

// Fixed-duration windows [t, t + duration) for t = start, start + step, ...
// while t + duration <= end, for every radar. Throws ConfigurationError for
// an empty radar list, an inverted or empty range, or a non-positive
// duration or step.
std::vector<core::EventId> generate_event_windows(const std::vector<std::string>& radars,
                                                  EpochSeconds start, EpochSeconds end,
                                                  EpochSeconds duration_s, EpochSeconds step_s);

} // namespace tid_music::catalog
