#include "tid_music/core/process_state.hpp"
#include "tid_music/core/errors.hpp"
#include "tid_music/core/utils.hpp"

namespace tid_music::core {

std::string process_level_to_string(ProcessLevel level) {
  switch (level) {
  case ProcessLevel::NONE: return "none";
  case ProcessLevel::RTI_INTERP: return "rti_interp";
  case ProcessLevel::FFT: return "fft";
  case ProcessLevel::MUSIC: return "music";
  default: return "unknown";
  }
}

ProcessLevel string_to_process_level(const std::string &s) {
  const std::string norm = to_lower(s);
  if (norm == "none" || norm.empty()) return ProcessLevel::NONE;
  if (norm == "rti_interp") return ProcessLevel::RTI_INTERP;
  if (norm == "fft") return ProcessLevel::FFT;
  if (norm == "music") return ProcessLevel::MUSIC;
  throw ValidationError("unknown process level '" + s + "'");
}

ProcessLevel predecessor(ProcessLevel stage) {
  switch (stage) {
  case ProcessLevel::MUSIC: return ProcessLevel::FFT;
  case ProcessLevel::FFT: return ProcessLevel::RTI_INTERP;
  default: return ProcessLevel::NONE;
  }
}

bool ProcessState::can_enter(ProcessLevel stage) const {
  if (stage == ProcessLevel::NONE)
    return false;
  return has_completed(predecessor(stage));
}

void ProcessState::require_can_enter(ProcessLevel stage) const {
  if (stage == ProcessLevel::NONE) {
    throw PreconditionError("'none' is not a runnable stage");
  }
  if (!can_enter(stage)) {
    throw PreconditionError("stage '" + process_level_to_string(stage) +
                            "' requires '" +
                            process_level_to_string(predecessor(stage)) +
                            "', event is at '" +
                            process_level_to_string(level_) + "'");
  }
}

ProcessState ProcessState::complete(ProcessLevel stage) const {
  require_can_enter(stage);
  return ProcessState(stage);
}

} // namespace tid_music::core
