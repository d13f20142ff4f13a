#include "tid_music/classify/classifier.hpp"
#include "tid_music/core/errors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

using namespace tid_music;

TEST_CASE("percentile_threshold_labels_top_tenth_disturbed") {
  config::ClassifierConfig cfg;
  cfg.mode = "percentile";
  cfg.percentile = 90.0;

  std::vector<double> values;
  for (int i = 1; i <= 100; ++i)
    values.push_back(static_cast<double>(i));

  const classify::Threshold thr = classify::compute_threshold(values, cfg);
  REQUIRE(thr.value == Catch::Approx(90.1));
  REQUIRE(thr.batch_size == 100);
  REQUIRE(thr.mode == "percentile");

  const auto labels = classify::label_all(values, thr);
  const auto disturbed =
      std::count(labels.begin(), labels.end(), Category::DISTURBED);
  REQUIRE(disturbed == 10);
  REQUIRE(labels.front() == Category::QUIET);
  REQUIRE(labels.back() == Category::DISTURBED);
}

TEST_CASE("value_equal_to_threshold_is_quiet") {
  classify::Threshold thr;
  thr.value = 5.0;
  REQUIRE(classify::label(5.0, thr) == Category::QUIET);
  REQUIRE(classify::label(5.0001, thr) == Category::DISTURBED);
}

TEST_CASE("absolute_mode_ignores_the_batch") {
  config::ClassifierConfig cfg;
  cfg.mode = "absolute";
  cfg.absolute_threshold = 3.5;
  const auto thr = classify::compute_threshold({}, cfg);
  REQUIRE(thr.value == Catch::Approx(3.5));
}

TEST_CASE("percentile_mode_needs_finite_values") {
  config::ClassifierConfig cfg;
  REQUIRE_THROWS_AS(classify::compute_threshold({}, cfg),
                    InsufficientDataError);
  REQUIRE_THROWS_AS(
      classify::compute_threshold({std::numeric_limits<double>::quiet_NaN()}, cfg),
      InsufficientDataError);
}
