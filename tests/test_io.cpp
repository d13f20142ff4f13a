#include "test_support.hpp"

#include "tid_music/core/errors.hpp"
#include "tid_music/core/events.hpp"
#include "tid_music/core/utils.hpp"
#include "tid_music/geo/fov.hpp"
#include "tid_music/grid/grid_builder.hpp"
#include "tid_music/io/array_store.hpp"
#include "tid_music/io/fits_io.hpp"
#include "tid_music/io/raw_source.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <fstream>
#include <sstream>

using namespace tid_music;

namespace {

constexpr EpochSeconds kStart = 1354370400; // 2012-12-01T14:00:00Z

} // namespace

TEST_CASE("csv_source_reads_back_appended_samples_across_days") {
  testing::TempDir dir;
  io::CsvRawDataSource raw(dir.path());

  std::vector<io::RawSample> samples(3);
  samples[0].time = kStart;
  samples[0].beam = 3;
  samples[0].gate = 12;
  samples[0].power_db = 17.25;
  samples[0].velocity = -120.5;
  samples[0].scatter = ScatterType::GROUND;
  samples[1] = samples[0];
  samples[1].time = kStart + 60;
  samples[1].velocity.reset();
  samples[2] = samples[0];
  samples[2].time = kStart + 12 * 3600; // next UTC day
  raw.append("bks", samples);

  REQUIRE(std::filesystem::exists(raw.day_file("bks", kStart)));
  REQUIRE(std::filesystem::exists(raw.day_file("bks", kStart + 12 * 3600)));

  auto got = raw.read("bks", kStart, kStart + 86400);
  REQUIRE(got.size() == 3);
  REQUIRE(got[0].beam == 3);
  REQUIRE(got[0].gate == 12);
  REQUIRE(got[0].power_db == Catch::Approx(17.25));
  REQUIRE(got[0].velocity.has_value());
  REQUIRE(*got[0].velocity == Catch::Approx(-120.5));
  REQUIRE_FALSE(got[1].velocity.has_value());
  REQUIRE(got[0].scatter == ScatterType::GROUND);

  REQUIRE(raw.read("bks", kStart + 30, kStart + 120).size() == 1);
  REQUIRE(raw.read("fhe", kStart, kStart + 86400).empty());
}

TEST_CASE("csv_source_accepts_utc_strings_and_rejects_bad_rows") {
  testing::TempDir dir;
  io::CsvRawDataSource raw(dir.path());
  const auto path = raw.day_file("bks", kStart);
  std::filesystem::create_directories(path.parent_path());
  {
    std::ofstream out(path);
    out << "time,beam,gate,power,velocity,gflg\n";
    out << "2012-12-01T14:01:00Z,0,5,10.0,nan,0\n";
  }
  auto got = raw.read("bks", kStart, kStart + 3600);
  REQUIRE(got.size() == 1);
  REQUIRE(got[0].time == kStart + 60);
  REQUIRE(got[0].scatter == ScatterType::IONOSPHERIC);

  {
    std::ofstream out(path, std::ios::app);
    out << "1354370700,0,5,ten,,1\n";
  }
  REQUIRE_THROWS_AS(raw.read("bks", kStart, kStart + 3600), StorageError);
}

TEST_CASE("fits_bundle_round_trips_arrays_and_attributes") {
  testing::TempDir dir;
  io::ArrayBundle bundle;
  bundle.arrays["cube"] = io::NdArray({2, 3, 4}, std::vector<double>(24));
  for (size_t i = 0; i < 24; ++i)
    bundle.arrays["cube"].data[i] = 0.5 * static_cast<double>(i);
  bundle.arrays["empty"] = io::NdArray({0, 11}, {});
  bundle.attrs.set("RADAR", "bks");
  bundle.attrs.set("DT", 60.0);
  bundle.attrs.set("NTIMES", 120);

  const auto path = dir.path() / "x" / "bundle.fits";
  io::write_bundle(path, bundle);
  io::ArrayBundle back = io::read_bundle(path);

  const auto &cube = back.array("cube");
  REQUIRE(cube.shape == std::vector<long>{2, 3, 4});
  REQUIRE(cube.data[23] == Catch::Approx(11.5));
  REQUIRE(back.array("empty").shape == std::vector<long>{0, 11});
  REQUIRE(back.attrs.get_string("RADAR").value() == "bks");
  REQUIRE(back.attrs.get_double("DT").value() == Catch::Approx(60.0));
  REQUIRE(back.attrs.get_int("NTIMES").value() == 120);
  REQUIRE_THROWS_AS(back.array("missing"), StorageError);

  io::ArrayBundle bad;
  bad.attrs.set("TOOLONGKEY", 1.0);
  REQUIRE_THROWS_AS(io::write_bundle(dir.path() / "bad.fits", bad), FitsError);
}

TEST_CASE("fits_array_store_keeps_a_grid_per_event_and_stage") {
  testing::TempDir dir;
  const auto site = testing::test_site();
  config::GridConfig cfg;
  cfg.time_resolution_s = 60.0;
  geo::GroundScatterFov fov(cfg.reflection_height_km, cfg.bad_range_km);

  std::vector<io::RawSample> samples;
  for (int j = 0; j < 30; ++j) {
    io::RawSample s;
    s.time = kStart + j * 60;
    s.beam = 2;
    s.gate = 1;
    s.power_db = 5.0 + j;
    s.scatter = ScatterType::GROUND;
    samples.push_back(s);
  }
  grid::Grid g =
      grid::GridBuilder(cfg, site, fov).build(samples, kStart, kStart + 1800);

  io::FitsArrayStore store(dir.path());
  core::EventId id{"tst", kStart, kStart + 1800};
  REQUIRE_FALSE(store.exists(id, "rti_interp"));
  REQUIRE_THROWS_AS(store.read(id, "rti_interp"), StorageError);

  store.write(id, "rti_interp", grid::to_bundle(g));
  REQUIRE(store.exists(id, "rti_interp"));
  REQUIRE(store.path_for(id, "rti_interp").filename() == "rti_interp.fits");

  grid::Grid back = grid::grid_from_bundle(store.read(id, "rti_interp"));
  REQUIRE(back.radar == g.radar);
  REQUIRE(back.n_times() == 30);
  REQUIRE(back.beams == g.beams);
  REQUIRE(back.coverage == Catch::Approx(g.coverage));
  const int row = back.cell_index(2, 1);
  REQUIRE(back.power(row, 7) == Catch::Approx(12.0));
  REQUIRE(std::isnan(back.power(0, 0)));
  REQUIRE(back.valid(row, 7) == 1);
  REQUIRE(back.cell_lat(2, 1) == Catch::Approx(g.cell_lat(2, 1)));
}

TEST_CASE("event_emitter_writes_one_json_object_per_line") {
  std::ostringstream out;
  core::EventEmitter emitter(out);
  emitter.run_start("r1", {{"events", 3}});
  emitter.stage_end("r1", core::ProcessLevel::FFT, "bks/x", "ok",
                    core::json::object());
  emitter.run_end("r1", true, "ok", core::json::object());

  std::istringstream in(out.str());
  std::string line;
  std::vector<core::json> events;
  while (std::getline(in, line))
    events.push_back(core::json::parse(line));

  REQUIRE(events.size() == 3);
  REQUIRE(events[0]["type"] == "run_start");
  REQUIRE(events[0]["events"] == 3);
  REQUIRE(events[1]["stage"] == "fft");
  REQUIRE(events[1]["event"] == "bks/x");
  REQUIRE(events[2]["success"] == true);
  REQUIRE(events[2]["run_id"] == "r1");
}

TEST_CASE("event_emitter_writes_warnings_and_errors_with_context") {
  std::ostringstream out;
  core::EventEmitter emitter(out);
  emitter.warning("r1", "frequency bin skipped", {{"event", "bks/x"}, {"bin", 4}});
  REQUIRE_NOTHROW(emitter.error("r1", std::string("bad byte \xff here"),
                                {{"error_type", "StorageError"}}));

  std::istringstream in(out.str());
  std::string line;
  std::vector<core::json> events;
  while (std::getline(in, line))
    events.push_back(core::json::parse(line));

  REQUIRE(events.size() == 2);
  REQUIRE(events[0]["type"] == "warning");
  REQUIRE(events[0]["bin"] == 4);
  REQUIRE(events[0]["event"] == "bks/x");
  REQUIRE(events[1]["type"] == "error");
  REQUIRE(events[1]["error_type"] == "StorageError");
  REQUIRE(events[1]["message"].get<std::string>().find("bad byte") == 0);
}
