#include "test_support.hpp"

#include "tid_music/config/configuration.hpp"
#include "tid_music/core/errors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <fstream>

using tid_music::config::Config;

TEST_CASE("config_from_yaml_reads_sections_and_radars") {
  YAML::Node node = YAML::Load(R"(
pipeline:
  nprocs: 6
  category_filter: disturbed
grid:
  fov_model: IS
  gscat: 3
  beam_limits: [2, 9]
quality:
  uptime_min_minutes: 100
music:
  subspace_mode: fixed
  n_signals: 2
radars:
  bks:
    lat: 37.1
    lon: -77.95
    boresight_deg: -40
)");
  Config cfg = Config::from_yaml(node);
  REQUIRE(cfg.pipeline.nprocs == 6);
  REQUIRE(cfg.pipeline.category_filter == "disturbed");
  REQUIRE(cfg.grid.fov_model == "IS");
  REQUIRE(cfg.grid.gscat == 3);
  REQUIRE(cfg.grid.beam_limits[0] == 2);
  REQUIRE(cfg.grid.beam_limits[1] == 9);
  REQUIRE(cfg.grid.gate_limits[0] == -1);
  REQUIRE(cfg.quality.uptime_min_minutes == Catch::Approx(100.0));
  REQUIRE(cfg.music.n_signals == 2);
  REQUIRE(cfg.radar("bks").lat == Catch::Approx(37.1));
  REQUIRE(cfg.radar("bks").code == "bks");
  REQUIRE_NOTHROW(cfg.validate());
  REQUIRE_THROWS_AS(cfg.radar("fhe"), tid_music::ConfigurationError);
}

TEST_CASE("config_save_then_load_keeps_values") {
  tid_music::testing::TempDir dir;
  Config cfg = tid_music::testing::test_config(dir.path());
  cfg.classifier.percentile = 75.0;
  const auto path = dir.path() / "tid_music.yaml";
  cfg.save(path);

  Config loaded = Config::load(path);
  REQUIRE(loaded.classifier.percentile == Catch::Approx(75.0));
  REQUIRE(loaded.spectral.window == "none");
  REQUIRE(loaded.radar("tst").n_gates == 6);
}

TEST_CASE("config_load_reports_missing_and_malformed_files") {
  tid_music::testing::TempDir dir;
  REQUIRE_THROWS_AS(Config::load(dir.path() / "nope.yaml"),
                    tid_music::ConfigurationError);

  const auto path = dir.path() / "bad.yaml";
  {
    std::ofstream out(path);
    out << "pipeline:\n  nprocs: [unterminated\n";
  }
  REQUIRE_THROWS_AS(Config::load(path), tid_music::ConfigurationError);

  REQUIRE_THROWS_AS(Config::from_yaml(YAML::Load("pipeline:\n  nprocs: many\n")),
                    tid_music::ConfigurationError);
}

TEST_CASE("config_validate_rejects_out_of_range_values") {
  tid_music::testing::TempDir dir;
  const Config base = tid_music::testing::test_config(dir.path());
  REQUIRE_NOTHROW(base.validate());

  Config c = base;
  c.pipeline.nprocs = 0;
  REQUIRE_THROWS_AS(c.validate(), tid_music::ValidationError);

  c = base;
  c.pipeline.category_filter = "noisy";
  REQUIRE_THROWS_AS(c.validate(), tid_music::ValidationError);

  c = base;
  c.quality.rti_fraction_threshold = 1.5;
  REQUIRE_THROWS_AS(c.validate(), tid_music::ValidationError);

  c = base;
  c.spectral.band_min_hz = 0.002;
  REQUIRE_THROWS_AS(c.validate(), tid_music::ValidationError);

  c = base;
  c.spectral.filter_numtaps = 100;
  REQUIRE_THROWS_AS(c.validate(), tid_music::ValidationError);

  c = base;
  c.music.dk = 0.0;
  REQUIRE_THROWS_AS(c.validate(), tid_music::ValidationError);

  c = base;
  c.music.min_channels = 1;
  REQUIRE_THROWS_AS(c.validate(), tid_music::ValidationError);

  c = base;
  c.grid.fov_model = "XS";
  REQUIRE_THROWS_AS(c.validate(), tid_music::ConfigurationError);
}

TEST_CASE("worker_count_honours_multiproc") {
  Config cfg;
  cfg.pipeline.nprocs = 8;
  REQUIRE(cfg.worker_count() == 8);
  cfg.pipeline.multiproc = false;
  REQUIRE(cfg.worker_count() == 1);
}
