#pragma once

#include <string>

namespace tid_music::core {

// Furthest pipeline stage completed for an event. Ordered.
enum class ProcessLevel {
  NONE = 0,
  RTI_INTERP = 1,
  FFT = 2,
  MUSIC = 3
};

std::string process_level_to_string(ProcessLevel level);

// Throws ValidationError for an unknown name.
ProcessLevel string_to_process_level(const std::string &s);

inline int process_level_to_int(ProcessLevel level) {
  return static_cast<int>(level);
}

// Guarded state of one event: none -> rti_interp -> fft -> music.
//
// A stage can be entered only when its predecessor has completed. Entering
// a stage that was already completed (recompute) moves the level back to
// that stage, since everything derived from the replaced output is stale.
class ProcessState {
public:
  ProcessState() = default;
  explicit ProcessState(ProcessLevel level) : level_(level) {}

  ProcessLevel level() const { return level_; }

  bool has_completed(ProcessLevel stage) const {
    return process_level_to_int(level_) >= process_level_to_int(stage);
  }

  bool can_enter(ProcessLevel stage) const;

  // Returns the state after `stage` completed. Throws PreconditionError if
  // the stage cannot be entered from the current level.
  ProcessState complete(ProcessLevel stage) const;

  // Throws PreconditionError describing why `stage` cannot be entered.
  void require_can_enter(ProcessLevel stage) const;

private:
  ProcessLevel level_ = ProcessLevel::NONE;
};

ProcessLevel predecessor(ProcessLevel stage);

} // namespace tid_music::core
