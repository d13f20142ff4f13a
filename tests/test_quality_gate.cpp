#include "test_support.hpp"

#include "tid_music/core/utils.hpp"
#include "tid_music/geo/solar.hpp"
#include "tid_music/quality/quality_gate.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace tid_music;

TEST_CASE("uptime_counts_distinct_minutes_inside_the_window") {
  std::vector<io::RawSample> samples(4);
  samples[0].time = 1000 * 60;
  samples[1].time = 1000 * 60 + 10;
  samples[2].time = 1001 * 60 + 59;
  samples[3].time = 2000 * 60; // outside
  REQUIRE(quality::compute_uptime_minutes(samples, 1000 * 60, 1100 * 60) ==
          Catch::Approx(2.0));
}

TEST_CASE("short_uptime_alone_fails_only_the_uptime_check") {
  config::QualityConfig cfg;
  cfg.uptime_min_minutes = 110.0;
  cfg.rti_fraction_threshold = 0.5;
  cfg.terminator_fraction_threshold = 1.0;

  quality::QualityMetrics m;
  m.uptime_minutes = 100.0;
  m.coverage = 0.9;
  m.daylight_fraction = 1.0;
  auto v = quality::evaluate_quality(m, cfg);
  REQUIRE_FALSE(v.accepted);
  REQUIRE(v.failed_checks == std::vector<std::string>{"uptime"});

  m.uptime_minutes = 110.0;
  v = quality::evaluate_quality(m, cfg);
  REQUIRE(v.accepted);
  REQUIRE(v.failed_checks.empty());
}

TEST_CASE("failures_accumulate_in_fixed_order") {
  config::QualityConfig cfg;
  quality::QualityMetrics m;
  m.uptime_minutes = 0.0;
  m.coverage = 0.0;
  m.daylight_fraction = 0.5;
  auto v = quality::evaluate_quality(m, cfg);
  REQUIRE(v.failed_checks ==
          std::vector<std::string>{"uptime", "rti_fraction",
                                   "terminator_fraction"});
}

TEST_CASE("daylight_fraction_follows_the_terminator_model") {
  grid::Grid g;
  g.time_step_s = 60.0;
  g.times = {0.0, 60.0, 120.0};
  REQUIRE(quality::daylight_fraction(g, testing::FixedTerminator(true)) ==
          Catch::Approx(1.0));
  REQUIRE(quality::daylight_fraction(g, testing::FixedTerminator(false)) ==
          Catch::Approx(0.0));
}

TEST_CASE("solar_terminator_separates_noon_and_midnight") {
  geo::SolarTerminator term(250.0);
  REQUIRE(term.horizon_zenith_deg() > 90.0);
  const auto noon = core::parse_utc("2012-03-20T12:00:00Z");
  const auto midnight = core::parse_utc("2012-03-20T00:00:00Z");
  REQUIRE(term.is_daylight(noon, 0.0, 0.0));
  REQUIRE_FALSE(term.is_daylight(midnight, 0.0, 0.0));
  REQUIRE(geo::solar_zenith_deg(noon, 0.0, 0.0) < 10.0);
  REQUIRE(geo::solar_local_time(noon, 0.0) == Catch::Approx(12.0).margin(0.25));
}
