#include "tid_music/core/errors.hpp"
#include "tid_music/core/process_state.hpp"

#include <catch2/catch_test_macros.hpp>

using tid_music::core::ProcessLevel;
using tid_music::core::ProcessState;

TEST_CASE("process_level_names_round_trip") {
  for (ProcessLevel l : {ProcessLevel::NONE, ProcessLevel::RTI_INTERP,
                         ProcessLevel::FFT, ProcessLevel::MUSIC}) {
    REQUIRE(tid_music::core::string_to_process_level(
                tid_music::core::process_level_to_string(l)) == l);
  }
  REQUIRE(tid_music::core::process_level_to_string(ProcessLevel::RTI_INTERP) ==
          "rti_interp");
  REQUIRE_THROWS_AS(tid_music::core::string_to_process_level("stack"),
                    tid_music::ValidationError);
}

TEST_CASE("stages_enter_only_after_their_predecessor") {
  ProcessState none;
  REQUIRE(none.can_enter(ProcessLevel::RTI_INTERP));
  REQUIRE_FALSE(none.can_enter(ProcessLevel::FFT));
  REQUIRE_FALSE(none.can_enter(ProcessLevel::MUSIC));
  REQUIRE_THROWS_AS(none.require_can_enter(ProcessLevel::MUSIC),
                    tid_music::PreconditionError);
  REQUIRE_THROWS_AS(none.complete(ProcessLevel::FFT),
                    tid_music::PreconditionError);

  ProcessState s = none.complete(ProcessLevel::RTI_INTERP)
                       .complete(ProcessLevel::FFT)
                       .complete(ProcessLevel::MUSIC);
  REQUIRE(s.level() == ProcessLevel::MUSIC);
  REQUIRE(s.has_completed(ProcessLevel::RTI_INTERP));
  REQUIRE(s.has_completed(ProcessLevel::FFT));
}

TEST_CASE("recompute_moves_the_level_back_to_the_recomputed_stage") {
  ProcessState s(ProcessLevel::MUSIC);
  REQUIRE(s.can_enter(ProcessLevel::RTI_INTERP));
  REQUIRE(s.complete(ProcessLevel::RTI_INTERP).level() ==
          ProcessLevel::RTI_INTERP);
  REQUIRE(s.complete(ProcessLevel::FFT).level() == ProcessLevel::FFT);
}
