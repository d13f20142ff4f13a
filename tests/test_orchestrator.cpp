#include "test_support.hpp"

#include "tid_music/catalog/event_catalog.hpp"
#include "tid_music/core/errors.hpp"
#include "tid_music/core/events.hpp"
#include "tid_music/geo/fov.hpp"
#include "tid_music/pipeline/orchestrator.hpp"
#include "tid_music/synthetic/plane_wave.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <sstream>

using namespace tid_music;
using catalog::json;
using core::EventId;
using core::ProcessLevel;
using pipeline::EventStatus;

namespace {

constexpr EpochSeconds kStart = 1354370400; // 2012-12-01T14:00:00Z
constexpr EpochSeconds kLength = 6000;      // 100 steps of 60 s

std::vector<io::RawSample> plane_wave_samples(EpochSeconds start) {
  synthetic::SimulationParams params;
  params.site = testing::test_site();
  params.start = start;
  params.end = start + kLength;
  params.time_step_s = 60.0;
  params.waves.push_back({0.003, 0.004, 0.0005, 1.0, 0.0});
  geo::GroundScatterFov fov(300.0, 500.0);
  return synthetic::simulate_samples(params, fov);
}

struct Harness {
  explicit Harness(std::vector<io::RawSample> samples)
      : cfg(testing::test_config(dir.path())), raw(std::move(samples)),
        cat(dir.path() / "catalog"), terminator(true), emitter(events),
        services{raw, cat, store, terminator, &emitter, "test-run"},
        orchestrator(cfg, services) {}

  EventId add_event(EpochSeconds start) {
    EventId id{"tst", start, start + kLength};
    cat.insert_many({catalog::new_event_document(id)});
    return id;
  }

  json doc(const EventId &id) { return *cat.get(id); }

  testing::TempDir dir;
  config::Config cfg;
  testing::VectorRawSource raw;
  catalog::JsonEventCatalog cat;
  testing::MemoryArrayStore store;
  testing::FixedTerminator terminator;
  std::ostringstream events;
  core::EventEmitter emitter;
  pipeline::PipelineServices services;
  pipeline::PipelineOrchestrator orchestrator;
};

} // namespace

TEST_CASE("plane_wave_runs_through_every_stage") {
  Harness h(plane_wave_samples(kStart));
  const EventId id = h.add_event(kStart);

  auto r = h.orchestrator.run_event(id, ProcessLevel::RTI_INTERP, false);
  REQUIRE(r.status == EventStatus::OK);
  REQUIRE(r.level == ProcessLevel::RTI_INTERP);
  json doc = h.doc(id);
  REQUIRE(doc["good_period"].get<bool>());
  REQUIRE(doc["rti_fraction"].get<double>() == Catch::Approx(1.0));
  REQUIRE(doc["uptime_minutes"].get<double>() == Catch::Approx(100.0));
  REQUIRE(doc["time_step_s"].get<double>() == Catch::Approx(60.0));

  r = h.orchestrator.run_event(id, ProcessLevel::FFT, false);
  REQUIRE(r.status == EventStatus::OK);
  doc = h.doc(id);
  REQUIRE(doc["process_level"] == "fft");
  REQUIRE(doc["n_channels"].get<int>() == 24);
  REQUIRE(doc["psd_sum"].get<double>() > 0.0);

  auto cls = h.orchestrator.classify_batch({id});
  REQUIRE(cls.quiet == 1);
  REQUIRE(cls.thresholds.count("tst") == 1);
  REQUIRE(h.doc(id)["category"] == "quiet");

  r = h.orchestrator.run_event(id, ProcessLevel::MUSIC, false, "disturbed");
  REQUIRE(r.status == EventStatus::SKIPPED);
  REQUIRE(h.store.writes["music"] == 0);

  r = h.orchestrator.run_event(id, ProcessLevel::MUSIC, false, "quiet");
  REQUIRE(r.status == EventStatus::OK);
  doc = h.doc(id);
  REQUIRE(doc["process_level"] == "music");
  REQUIRE(doc["signals"].size() == 1);

  const json &s = doc["signals"][0];
  REQUIRE(s["rank"] == 1);
  REQUIRE(s["wavelength_km"].get<double>() == Catch::Approx(1256.6).epsilon(0.05));
  REQUIRE(s["azimuth_deg"].get<double>() == Catch::Approx(36.87).margin(2.0));
  REQUIRE(s["freq_hz"].get<double>() == Catch::Approx(0.0005));
  REQUIRE(doc["category"] == "quiet");

  const std::string log = h.events.str();
  REQUIRE(log.find("\"stage_start\"") != std::string::npos);
  REQUIRE(log.find("\"classify_end\"") != std::string::npos);
}

TEST_CASE("completed_stages_are_not_recomputed") {
  Harness h(plane_wave_samples(kStart));
  const EventId id = h.add_event(kStart);
  REQUIRE(h.orchestrator.run_event(id, ProcessLevel::RTI_INTERP, false).status ==
          EventStatus::OK);
  REQUIRE(h.orchestrator.run_event(id, ProcessLevel::FFT, false).status ==
          EventStatus::OK);
  REQUIRE(h.orchestrator.run_event(id, ProcessLevel::MUSIC, false).status ==
          EventStatus::OK);

  const int raw_reads = h.raw.reads;
  const int store_calls = h.store.total_calls();
  for (ProcessLevel stage :
       {ProcessLevel::RTI_INTERP, ProcessLevel::FFT, ProcessLevel::MUSIC}) {
    auto r = h.orchestrator.run_event(id, stage, false);
    REQUIRE(r.status == EventStatus::SKIPPED);
    REQUIRE(r.level == ProcessLevel::MUSIC);
  }
  REQUIRE(h.raw.reads == raw_reads);
  REQUIRE(h.store.total_calls() == store_calls);

  // Recompute replaces the grid and marks later stages stale.
  auto r = h.orchestrator.run_event(id, ProcessLevel::RTI_INTERP, true);
  REQUIRE(r.status == EventStatus::OK);
  REQUIRE(h.raw.reads == raw_reads + 1);
  json doc = h.doc(id);
  REQUIRE(doc["process_level"] == "rti_interp");
  REQUIRE(doc["signals"].empty());
  REQUIRE_FALSE(doc.contains("psd_sum"));
}

TEST_CASE("low_coverage_window_is_rejected_and_stays_rejected") {
  std::vector<io::RawSample> beam0;
  for (const auto &s : plane_wave_samples(kStart)) {
    if (s.beam == 0)
      beam0.push_back(s);
  }
  Harness h(beam0);
  const EventId id = h.add_event(kStart);

  auto r = h.orchestrator.run_event(id, ProcessLevel::RTI_INTERP, false);
  REQUIRE(r.status == EventStatus::REJECTED);
  REQUIRE(r.level == ProcessLevel::RTI_INTERP);

  json doc = h.doc(id);
  REQUIRE_FALSE(doc["good_period"].get<bool>());
  REQUIRE(doc["reject_reasons"] == json::array({"rti_fraction"}));
  REQUIRE(doc["rti_fraction"].get<double>() == Catch::Approx(0.25));

  REQUIRE(h.orchestrator.run_event(id, ProcessLevel::FFT, false).status ==
          EventStatus::REJECTED);
  REQUIRE(h.orchestrator.run_event(id, ProcessLevel::MUSIC, false).status ==
          EventStatus::REJECTED);
  REQUIRE(h.store.reads["rti_interp"] == 0);
  REQUIRE(h.store.writes["fft"] == 0);
  REQUIRE(h.store.writes["music"] == 0);
  REQUIRE(h.doc(id)["process_level"] == "rti_interp");

  auto cls = h.orchestrator.classify_batch({id});
  REQUIRE(cls.ineligible == 1);
  REQUIRE(h.doc(id)["category"] == "unclassified");
}

TEST_CASE("stage_before_its_predecessor_leaves_the_event_untouched") {
  Harness h(plane_wave_samples(kStart));
  const EventId id = h.add_event(kStart);
  const std::string before = h.doc(id).dump();

  REQUIRE_THROWS_AS(h.orchestrator.run_event(id, ProcessLevel::MUSIC, false),
                    PreconditionError);
  REQUIRE_THROWS_AS(h.orchestrator.run_event(id, ProcessLevel::FFT, false),
                    PreconditionError);
  REQUIRE(h.doc(id).dump() == before);
  REQUIRE(h.store.total_calls() == 0);

  auto report = h.orchestrator.run_batch({id}, ProcessLevel::MUSIC, 1, false);
  REQUIRE(report.failed == 1);
  REQUIRE(report.results[0].error_type == "PreconditionError");
  REQUIRE(report.failed_ids() == std::vector<EventId>{id});
  REQUIRE(h.doc(id).dump() == before);
}

TEST_CASE("window_without_samples_is_marked_no_data") {
  Harness h(std::vector<io::RawSample>{});
  const EventId id = h.add_event(kStart);
  auto r = h.orchestrator.run_event(id, ProcessLevel::RTI_INTERP, false);
  REQUIRE(r.status == EventStatus::NO_DATA);
  REQUIRE(r.level == ProcessLevel::NONE);

  json doc = h.doc(id);
  REQUIRE(doc["no_data"].get<bool>());
  REQUIRE(doc["process_level"] == "none");
  REQUIRE(doc["last_error"]["type"] == "InsufficientDataError");
  REQUIRE(doc["last_error"]["stage"] == "rti_interp");
}

TEST_CASE("batch_runs_events_in_parallel_and_isolates_failures") {
  std::vector<io::RawSample> samples;
  for (int i = 0; i < 3; ++i) {
    auto part = plane_wave_samples(kStart + i * kLength);
    samples.insert(samples.end(), part.begin(), part.end());
  }
  Harness h(samples);
  std::vector<EventId> ids;
  for (int i = 0; i < 4; ++i)
    ids.push_back(h.add_event(kStart + i * kLength));

  auto report = h.orchestrator.run_batch(ids, ProcessLevel::RTI_INTERP, 3, false);
  REQUIRE(report.results.size() == 4);
  REQUIRE(report.succeeded == 3);
  REQUIRE(report.no_data == 1);
  REQUIRE(report.results[3].status == EventStatus::NO_DATA);
  for (int i = 0; i < 4; ++i)
    REQUIRE(report.results[static_cast<size_t>(i)].id == ids[static_cast<size_t>(i)]);

  report = h.orchestrator.run_batch(ids, ProcessLevel::FFT, 3, false);
  REQUIRE(report.succeeded == 3);
  REQUIRE(report.failed == 1); // no grid for the empty window

  auto cls = h.orchestrator.classify_batch(ids);
  REQUIRE(cls.quiet + cls.disturbed == 3);
  REQUIRE(cls.ineligible == 1);
  REQUIRE(cls.thresholds.at("tst").batch_size == 3);
}

TEST_CASE("batch_configuration_errors_abort_before_work") {
  Harness h(plane_wave_samples(kStart));
  const EventId id = h.add_event(kStart);
  const EventId unknown{"zzz", kStart, kStart + kLength};

  REQUIRE_THROWS_AS(h.orchestrator.run_batch({id}, ProcessLevel::RTI_INTERP, 0, false),
                    ConfigurationError);
  REQUIRE_THROWS_AS(h.orchestrator.run_batch({id, unknown}, ProcessLevel::RTI_INTERP, 1,
                                             false),
                    ConfigurationError);
  REQUIRE_THROWS_AS(h.orchestrator.run_batch({id}, ProcessLevel::MUSIC, 1, false, "noisy"),
                    ConfigurationError);
  REQUIRE_THROWS_AS(h.orchestrator.run_batch({id}, ProcessLevel::NONE, 1, false),
                    ConfigurationError);
  REQUIRE(h.raw.reads == 0);
  REQUIRE(h.doc(id)["process_level"] == "none");
}

TEST_CASE("hundred_event_batch_has_ten_disturbed_at_the_90th_percentile") {
  Harness h(std::vector<io::RawSample>{});
  std::vector<EventId> ids;
  for (int i = 0; i < 100; ++i) {
    const EventId id = h.add_event(kStart + i * kLength);
    h.cat.update_fields(id, {{"process_level", "fft"},
                             {"good_period", true},
                             {"psd_sum", static_cast<double>(i + 1)}});
    ids.push_back(id);
  }

  auto report = h.orchestrator.classify_batch(ids);
  REQUIRE(report.disturbed == 10);
  REQUIRE(report.quiet == 90);
  REQUIRE(report.thresholds.at("tst").value == Catch::Approx(90.1));

  json doc = h.doc(ids.back());
  REQUIRE(doc["category"] == "disturbed");
  REQUIRE(doc["classifier"]["batch_size"] == 100);
  REQUIRE(doc["classifier"]["run_id"] == "test-run");
  REQUIRE(doc["process_level"] == "fft");
}

TEST_CASE("music_failure_in_a_batch_is_recorded_and_isolated") {
  std::vector<io::RawSample> samples;
  for (int i = 0; i < 3; ++i) {
    for (const auto &s : plane_wave_samples(kStart + i * kLength)) {
      // The middle window only sees two cells.
      if (i == 1 && (s.beam != 0 || s.gate > 1))
        continue;
      samples.push_back(s);
    }
  }
  Harness h(samples);
  h.cfg.quality.rti_fraction_threshold = 0.0;
  std::vector<EventId> ids;
  for (int i = 0; i < 3; ++i)
    ids.push_back(h.add_event(kStart + i * kLength));

  REQUIRE(h.orchestrator.run_batch(ids, ProcessLevel::RTI_INTERP, 2, false).succeeded == 3);
  REQUIRE(h.orchestrator.run_batch(ids, ProcessLevel::FFT, 2, false).succeeded == 3);
  REQUIRE(h.doc(ids[1])["n_channels"] == 2);

  auto report = h.orchestrator.run_batch(ids, ProcessLevel::MUSIC, 2, false);
  REQUIRE(report.succeeded == 2);
  REQUIRE(report.failed == 1);
  REQUIRE(report.failed_ids() == std::vector<EventId>{ids[1]});

  const auto &failed = report.results[1];
  REQUIRE(failed.status == EventStatus::FAILED);
  REQUIRE(failed.error_type == "InsufficientChannelsError");
  REQUIRE(failed.level == ProcessLevel::FFT);

  json doc = h.doc(ids[1]);
  REQUIRE(doc["process_level"] == "fft");
  REQUIRE(doc["last_error"]["stage"] == "music");
  REQUIRE(doc["last_error"]["type"] == "InsufficientChannelsError");
  REQUIRE(doc["last_error"]["run_id"] == "test-run");
  REQUIRE(h.store.writes["music"] == 2);

  for (size_t i : {size_t{0}, size_t{2}}) {
    REQUIRE(report.results[i].status == EventStatus::OK);
    REQUIRE(h.doc(ids[i])["process_level"] == "music");
    REQUIRE(h.doc(ids[i])["signals"].size() == 1);
  }

  const std::string log = h.events.str();
  REQUIRE(log.find("\"type\":\"error\"") != std::string::npos);
  REQUIRE(log.find("\"error_type\":\"InsufficientChannelsError\"") != std::string::npos);
}

TEST_CASE("tenth_coverage_is_rejected_at_a_quarter_threshold") {
  // 240 of 2400 samples: two full cells and 40 steps of a third.
  std::vector<io::RawSample> sparse;
  for (const auto &s : plane_wave_samples(kStart)) {
    if (s.beam != 0)
      continue;
    if (s.gate < 2 || (s.gate == 2 && s.time < kStart + 40 * 60))
      sparse.push_back(s);
  }
  Harness h(sparse);
  h.cfg.quality.rti_fraction_threshold = 0.25;
  const EventId id = h.add_event(kStart);

  auto report = h.orchestrator.run_batch({id}, ProcessLevel::RTI_INTERP, 1, false);
  REQUIRE(report.rejected == 1);
  json doc = h.doc(id);
  REQUIRE(doc["rti_fraction"].get<double>() == Catch::Approx(0.10));
  REQUIRE(doc["reject_reasons"] == json::array({"rti_fraction"}));

  for (ProcessLevel stage : {ProcessLevel::FFT, ProcessLevel::MUSIC}) {
    report = h.orchestrator.run_batch({id}, stage, 1, false);
    REQUIRE(report.rejected == 1);
  }
  REQUIRE(h.doc(id)["process_level"] == "rti_interp");
  REQUIRE(h.store.writes["music"] == 0);
  REQUIRE(h.store.reads["fft"] == 0);
}

TEST_CASE("batch_failure_reports_the_stored_level") {
  Harness h(plane_wave_samples(kStart));
  const EventId id = h.add_event(kStart);
  REQUIRE(h.orchestrator.run_event(id, ProcessLevel::RTI_INTERP, false).status ==
          EventStatus::OK);

  auto report = h.orchestrator.run_batch({id}, ProcessLevel::MUSIC, 1, false);
  REQUIRE(report.failed == 1);
  REQUIRE(report.results[0].error_type == "PreconditionError");
  REQUIRE(report.results[0].level == ProcessLevel::RTI_INTERP);
  REQUIRE(h.events.str().find("\"level\":\"rti_interp\"") != std::string::npos);
}
