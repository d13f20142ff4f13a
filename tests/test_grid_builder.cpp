#include "test_support.hpp"

#include "tid_music/core/errors.hpp"
#include "tid_music/geo/fov.hpp"
#include "tid_music/grid/grid_builder.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>

using namespace tid_music;

namespace {

constexpr EpochSeconds kStart = 1354370400; // 2012-12-01T14:00:00Z

std::vector<io::RawSample> series(int beam, int gate, int n, int step_s,
                                  double base) {
  std::vector<io::RawSample> out;
  for (int j = 0; j < n; ++j) {
    io::RawSample s;
    s.time = kStart + static_cast<EpochSeconds>(j) * step_s;
    s.beam = beam;
    s.gate = gate;
    s.power_db = base + j;
    s.scatter = ScatterType::GROUND;
    out.push_back(s);
  }
  return out;
}

} // namespace

TEST_CASE("detect_time_step_uses_median_spacing") {
  auto s = series(0, 0, 10, 60, 0.0);
  REQUIRE(grid::detect_time_step(s) == Catch::Approx(60.0));
  REQUIRE(grid::detect_time_step({}) == 0.0);
}

TEST_CASE("grid_axes_and_time_axis_are_regular") {
  const auto site = testing::test_site();
  config::GridConfig cfg;
  cfg.time_resolution_s = 60.0;
  geo::GroundScatterFov fov(cfg.reflection_height_km, cfg.bad_range_km);

  auto samples = series(1, 2, 60, 60, 10.0);
  grid::Grid g =
      grid::GridBuilder(cfg, site, fov).build(samples, kStart, kStart + 3600);

  REQUIRE(g.n_beams() == 4);
  REQUIRE(g.n_gates() == 6);
  REQUIRE(g.n_times() == 60);
  for (size_t j = 1; j < g.times.size(); ++j) {
    REQUIRE(g.times[j] - g.times[j - 1] == Catch::Approx(60.0));
  }
  for (size_t i = 1; i < g.slant_range_km.size(); ++i) {
    REQUIRE(g.slant_range_km[i] > g.slant_range_km[i - 1]);
  }

  const int row = g.cell_index(1, 2);
  REQUIRE(g.cell_complete(row));
  REQUIRE(g.power(row, 5) == Catch::Approx(15.0));
  REQUIRE(std::isnan(g.power(g.cell_index(0, 0), 0)));
  REQUIRE(g.coverage == Catch::Approx(1.0 / 24.0));
  REQUIRE(g.geometry_valid.cast<int>().sum() == 24);
}

TEST_CASE("short_gaps_interpolate_and_long_gaps_stay_empty") {
  const auto site = testing::test_site();
  config::GridConfig cfg;
  cfg.time_resolution_s = 60.0;
  cfg.max_gap_s = 300.0;
  geo::GroundScatterFov fov(cfg.reflection_height_km, cfg.bad_range_km);

  auto all = series(0, 0, 60, 60, 0.0);
  std::vector<io::RawSample> samples;
  for (const auto &s : all) {
    const auto j = (s.time - kStart) / 60;
    if (j == 10)
      continue; // one missing step
    if (j >= 30 && j < 40)
      continue; // ten minute gap
    samples.push_back(s);
  }

  grid::Grid g = grid::GridBuilder(cfg, site, fov)
                     .build(samples, kStart, kStart + 3600);
  const int row = g.cell_index(0, 0);
  REQUIRE(g.valid(row, 10) == 1);
  REQUIRE(g.power(row, 10) == Catch::Approx(10.0));
  REQUIRE(g.valid(row, 35) == 0);
  REQUIRE_FALSE(g.cell_complete(row));
}

TEST_CASE("unselected_scatter_leaves_no_data") {
  const auto site = testing::test_site();
  config::GridConfig cfg;
  cfg.gscat = 0;
  geo::GroundScatterFov fov(cfg.reflection_height_km, cfg.bad_range_km);
  auto samples = series(0, 0, 60, 60, 0.0);
  REQUIRE_THROWS_AS(grid::GridBuilder(cfg, site, fov)
                        .build(samples, kStart, kStart + 3600),
                    InsufficientDataError);
}

TEST_CASE("beam_and_gate_limits_restrict_the_grid") {
  const auto site = testing::test_site();
  config::GridConfig cfg;
  cfg.beam_limits = {1, 2};
  cfg.gate_limits = {3, -1};
  cfg.time_resolution_s = 60.0;
  geo::GroundScatterFov fov(cfg.reflection_height_km, cfg.bad_range_km);

  auto samples = series(2, 4, 60, 60, 0.0);
  auto outside = series(0, 4, 60, 60, 0.0);
  samples.insert(samples.end(), outside.begin(), outside.end());

  grid::Grid g = grid::GridBuilder(cfg, site, fov)
                     .build(samples, kStart, kStart + 3600);
  REQUIRE(g.beams == std::vector<int>{1, 2});
  REQUIRE(g.gates == std::vector<int>{3, 4, 5});
  REQUIRE(g.cell_complete(g.cell_index(1, 1)));
  REQUIRE(g.coverage == Catch::Approx(1.0 / 6.0));
}

TEST_CASE("fully_sampled_ground_scatter_grid_has_full_coverage") {
  geo::RadarSite site = testing::test_site();
  site.first_range_km = 180.0; // gates 0-8 fall inside the near-range cut
  site.n_gates = 12;
  config::GridConfig cfg;
  cfg.time_resolution_s = 60.0;
  geo::GroundScatterFov fov(cfg.reflection_height_km, cfg.bad_range_km);

  std::vector<io::RawSample> samples;
  for (int b = 0; b < site.n_beams; ++b) {
    for (int g = 0; g < site.n_gates; ++g) {
      auto s = series(b, g, 60, 60, 0.0);
      samples.insert(samples.end(), s.begin(), s.end());
    }
  }

  grid::Grid g =
      grid::GridBuilder(cfg, site, fov).build(samples, kStart, kStart + 3600);
  REQUIRE(g.geometry_valid.cast<int>().sum() == 12);
  REQUIRE_FALSE(g.geometry_valid(0, 0));
  REQUIRE(g.coverage == Catch::Approx(1.0));
}

TEST_CASE("grid_without_mappable_cells_has_zero_coverage") {
  grid::Grid g;
  g.beams = {0};
  g.gates = {0, 1};
  g.times = {0.0, 60.0};
  g.valid = MaskMatrix::Ones(2, 2);
  g.geometry_valid = MaskMatrix::Zero(1, 2);
  REQUIRE(g.compute_coverage() == 0.0);
}

TEST_CASE("ionospheric_view_maps_near_range_cells") {
  geo::RadarSite site = testing::test_site();
  site.first_range_km = 180.0;
  site.n_gates = 12;
  geo::IonosphericFov is_fov(300.0);
  geo::GroundScatterFov gs_fov(300.0, 500.0);

  // Gate 9 maps in both views; the ionospheric point lies farther out.
  const geo::GeoPoint gs = gs_fov.locate(site, 0, 9);
  const geo::GeoPoint is = is_fov.locate(site, 0, 9);
  REQUIRE(gs.valid);
  REQUIRE(is.valid);
  REQUIRE(std::fabs(is.lat - site.lat) > std::fabs(gs.lat - site.lat));

  REQUIRE(is_fov.locate(site, 0, 3).valid);
  REQUIRE_FALSE(gs_fov.locate(site, 0, 3).valid);
  // Slant range below the reflection height never reaches the layer.
  site.first_range_km = 0.0;
  REQUIRE_FALSE(is_fov.locate(site, 0, 0).valid);

  config::GridConfig cfg;
  cfg.fov_model = "IS";
  cfg.gscat = 0;
  cfg.time_resolution_s = 60.0;
  auto samples = series(0, 3, 60, 60, 0.0);
  for (auto &s : samples)
    s.scatter = ScatterType::IONOSPHERIC;
  site.first_range_km = 180.0;
  grid::Grid g =
      grid::GridBuilder(cfg, site, is_fov).build(samples, kStart, kStart + 3600);
  REQUIRE(g.fov_model == "IS");
  REQUIRE(g.cell_complete(g.cell_index(0, 3)));
}

TEST_CASE("nearest_interpolation_copies_the_closest_sample") {
  const auto site = testing::test_site();
  config::GridConfig cfg;
  cfg.time_resolution_s = 60.0;
  cfg.interpolation = "nearest";
  cfg.max_gap_s = 300.0;
  geo::GroundScatterFov fov(cfg.reflection_height_km, cfg.bad_range_km);

  // Samples every 120 s, offset by 20 s from the grid steps.
  std::vector<io::RawSample> samples;
  for (int j = 0; j < 30; ++j) {
    io::RawSample s;
    s.time = kStart + 20 + static_cast<EpochSeconds>(j) * 120;
    s.beam = 0;
    s.gate = 0;
    s.power_db = static_cast<double>(j);
    s.scatter = ScatterType::GROUND;
    samples.push_back(s);
  }

  grid::Grid g =
      grid::GridBuilder(cfg, site, fov).build(samples, kStart, kStart + 3600);
  const int row = g.cell_index(0, 0);
  // t = 60 s sits 40 s after sample 0 and 80 s before sample 1.
  REQUIRE(g.power(row, 1) == Catch::Approx(0.0));
  // t = 120 s sits 20 s before sample 1.
  REQUIRE(g.power(row, 2) == Catch::Approx(1.0));
  REQUIRE(g.cell_complete(row));
}

TEST_CASE("hanning_taper_pulls_edge_cells_towards_the_mean") {
  const auto site = testing::test_site();
  config::GridConfig cfg;
  cfg.time_resolution_s = 60.0;
  cfg.spatial_taper = "hanning";
  geo::GroundScatterFov fov(cfg.reflection_height_km, cfg.bad_range_km);

  auto samples = series(0, 0, 10, 60, 100.0);
  auto centre = series(1, 2, 10, 60, 0.0);
  samples.insert(samples.end(), centre.begin(), centre.end());
  for (auto &s : samples)
    s.power_db = s.beam == 0 ? 10.0 : 0.0;

  grid::Grid g =
      grid::GridBuilder(cfg, site, fov).build(samples, kStart, kStart + 600);
  const double w_edge =
      grid::edge_taper_weight(0, 4) * grid::edge_taper_weight(0, 6);
  const double w_centre =
      grid::edge_taper_weight(1, 4) * grid::edge_taper_weight(2, 6);
  REQUIRE(w_edge < w_centre);
  REQUIRE(g.power(g.cell_index(0, 0), 0) ==
          Catch::Approx(5.0 + w_edge * 5.0));
  REQUIRE(g.power(g.cell_index(1, 2), 0) ==
          Catch::Approx(5.0 - w_centre * 5.0));
  REQUIRE(grid::edge_taper_weight(0, 1) == 1.0);
}
