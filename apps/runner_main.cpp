#include "runner_shared.hpp"

#include "tid_music/catalog/event_catalog.hpp"
#include "tid_music/catalog/event_list.hpp"
#include "tid_music/config/configuration.hpp"
#include "tid_music/core/errors.hpp"
#include "tid_music/core/events.hpp"
#include "tid_music/core/utils.hpp"
#include "tid_music/geo/fov.hpp"
#include "tid_music/geo/solar.hpp"
#include "tid_music/io/array_store.hpp"
#include "tid_music/io/raw_source.hpp"
#include "tid_music/pipeline/orchestrator.hpp"
#include "tid_music/synthetic/plane_wave.hpp"

#include <CLI/CLI.hpp>

#include <fstream>
#include <iostream>
#include <map>

namespace {

namespace fs = std::filesystem;
namespace core = tid_music::core;
namespace config = tid_music::config;
namespace catalog = tid_music::catalog;
namespace pipeline = tid_music::pipeline;
namespace runner = tid_music::runner;

using core::ProcessLevel;

config::Config load_config(const std::string &path) {
  config::Config cfg = config::Config::load(path);
  cfg.validate();
  return cfg;
}

int generate_command(const std::string &config_path,
                     const std::vector<std::string> &radars,
                     const std::string &start, const std::string &end) {
  config::Config cfg = load_config(config_path);
  for (const auto &r : radars)
    cfg.radar(r);

  const auto windows = catalog::generate_event_windows(
      radars, core::parse_utc(start), core::parse_utc(end),
      static_cast<tid_music::EpochSeconds>(cfg.events.duration_minutes) * 60,
      static_cast<tid_music::EpochSeconds>(cfg.events.step_minutes) * 60);

  std::vector<catalog::json> docs;
  docs.reserve(windows.size());
  for (const auto &id : windows) {
    docs.push_back(catalog::new_event_document(id));
  }

  catalog::JsonEventCatalog cat(cfg.storage.catalog_dir);
  const size_t inserted = cat.insert_many(docs);
  std::cout << "[generate] " << windows.size() << " windows, " << inserted
            << " new events" << std::endl;
  return 0;
}

int run_command(const std::string &config_path,
                const std::vector<std::string> &radars,
                const std::string &start, const std::string &end,
                const std::string &stage, int nprocs, bool recompute,
                const std::string &category) {
  config::Config cfg = load_config(config_path);
  const std::vector<std::string> stages = runner::expand_stage_argument(stage);
  for (const auto &r : radars)
    cfg.radar(r);

  const int workers = nprocs > 0 ? nprocs : cfg.worker_count();
  const bool force = recompute || cfg.pipeline.recompute;
  const std::string filter =
      category.empty() ? cfg.pipeline.category_filter : category;

  catalog::JsonEventCatalog cat(cfg.storage.catalog_dir);
  tid_music::io::FitsArrayStore arrays(cfg.storage.array_dir);
  tid_music::io::CsvRawDataSource raw(cfg.storage.raw_dir);
  tid_music::geo::SolarTerminator terminator(cfg.quality.terminator_height_km);

  const auto ids = runner::select_events(cat, radars, core::parse_utc(start),
                                         core::parse_utc(end));

  const std::string run_id = core::get_run_id();
  fs::create_directories(cfg.storage.log_dir);
  std::ofstream event_log_file(fs::path(cfg.storage.log_dir) /
                               (run_id + ".jsonl"));
  if (!event_log_file) {
    throw tid_music::IOError("Cannot open event log in " +
                             cfg.storage.log_dir);
  }
  runner::TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
  std::ostream log_file(&tee_buf);

  core::EventEmitter emitter(log_file);
  emitter.run_start(run_id, {{"config_path", config_path},
                             {"config_hash", core::sha256_file(config_path)},
                             {"radars", radars},
                             {"start", start},
                             {"end", end},
                             {"stage", stage},
                             {"events", ids.size()},
                             {"nprocs", workers},
                             {"recompute", force},
                             {"category_filter", filter}});

  pipeline::PipelineServices services{raw, cat, arrays, terminator, &emitter,
                                      run_id};
  pipeline::PipelineOrchestrator orchestrator(cfg, services);

  size_t failed = 0;
  for (const auto &s : stages) {
    if (s == "classify") {
      runner::print_classify_report(std::cerr, orchestrator.classify_batch(ids));
      continue;
    }
    const ProcessLevel level = core::string_to_process_level(s);
    const pipeline::BatchReport report = orchestrator.run_batch(
        ids, level, workers, force,
        level == ProcessLevel::MUSIC ? filter : std::string());
    runner::print_batch_report(std::cerr, report);
    failed += report.failed;
  }

  emitter.run_end(run_id, failed == 0, failed == 0 ? "ok" : "partial",
                  {{"failed", failed}});
  return failed == 0 ? 0 : 1;
}

int classify_command(const std::string &config_path,
                     const std::vector<std::string> &radars,
                     const std::string &start, const std::string &end) {
  config::Config cfg = load_config(config_path);
  catalog::JsonEventCatalog cat(cfg.storage.catalog_dir);
  tid_music::io::FitsArrayStore arrays(cfg.storage.array_dir);
  tid_music::io::CsvRawDataSource raw(cfg.storage.raw_dir);
  tid_music::geo::SolarTerminator terminator(cfg.quality.terminator_height_km);

  const auto ids = runner::select_events(cat, radars, core::parse_utc(start),
                                         core::parse_utc(end));
  const std::string run_id = core::get_run_id();
  core::EventEmitter emitter(std::cout);
  pipeline::PipelineServices services{raw, cat, arrays, terminator, &emitter,
                                      run_id};
  pipeline::PipelineOrchestrator orchestrator(cfg, services);
  runner::print_classify_report(std::cerr, orchestrator.classify_batch(ids));
  return 0;
}

int status_command(const std::string &config_path, const std::string &radar) {
  config::Config cfg = load_config(config_path);
  catalog::JsonEventCatalog cat(cfg.storage.catalog_dir);

  catalog::EventQuery q;
  if (!radar.empty())
    q.where("radar", catalog::FilterOp::EQ, radar);
  const auto docs = cat.query(q);

  std::map<std::string, size_t> by_level;
  std::map<std::string, size_t> by_category;
  size_t rejected = 0;
  size_t no_data = 0;
  for (const auto &doc : docs) {
    by_level[doc.value("process_level", std::string("none"))]++;
    by_category[doc.value("category", std::string("unclassified"))]++;
    if (doc.contains("good_period") && doc["good_period"].is_boolean() &&
        !doc["good_period"].get<bool>())
      ++rejected;
    if (doc.value("no_data", false))
      ++no_data;
  }

  std::cout << "Events: " << docs.size() << std::endl;
  for (const char *level : {"none", "rti_interp", "fft", "music"}) {
    std::cout << "  " << level << ": " << by_level[level] << std::endl;
  }
  for (const auto &[cat_name, n] : by_category) {
    std::cout << "  " << cat_name << ": " << n << std::endl;
  }
  std::cout << "  rejected: " << rejected << std::endl;
  std::cout << "  no data: " << no_data << std::endl;
  return 0;
}

int simulate_command(const std::string &config_path, const std::string &radar,
                     const std::string &start, const std::string &end,
                     double kx, double ky, double freq, double amplitude,
                     double noise, double dt, unsigned seed) {
  config::Config cfg = load_config(config_path);

  tid_music::synthetic::SimulationParams params;
  params.site = cfg.radar(radar);
  params.start = core::parse_utc(start);
  params.end = core::parse_utc(end);
  params.time_step_s = dt;
  params.noise_db = noise;
  params.seed = seed;
  params.scatter = cfg.grid.gscat == 0 ? tid_music::ScatterType::IONOSPHERIC
                                     : tid_music::ScatterType::GROUND;
  params.waves.push_back({kx, ky, freq, amplitude, 0.0});

  tid_music::FovModel model = tid_music::FovModel::GS;
  tid_music::string_to_fov_model(cfg.grid.fov_model, model);
  auto fov = tid_music::geo::make_fov(model, cfg.grid.reflection_height_km,
                                      cfg.grid.bad_range_km);

  const auto samples = tid_music::synthetic::simulate_samples(params, *fov);
  tid_music::io::CsvRawDataSource raw(cfg.storage.raw_dir);
  raw.append(radar, samples);
  std::cout << "[simulate] wrote " << samples.size() << " samples for "
            << radar << std::endl;
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"TID MUSIC Runner"};
  app.require_subcommand(1);

  std::string config_path = "tid_music.yaml";
  std::vector<std::string> radars;
  std::string start, end;
  std::string stage = "all";
  std::string category;
  int nprocs = 0;
  bool recompute = false;
  std::string status_radar;
  double kx = 0.003, ky = 0.004, freq = 0.0005, amplitude = 1.0, noise = 0.0;
  double dt = 60.0;
  unsigned seed = 12345;

  auto gen_cmd = app.add_subcommand("generate", "Insert event windows");
  gen_cmd->add_option("--config", config_path, "Path to config.yaml");
  gen_cmd->add_option("--radar", radars, "Radar code (repeatable)")->required();
  gen_cmd->add_option("--start", start, "Start (UTC)")->required();
  gen_cmd->add_option("--end", end, "End (UTC)")->required();

  auto run_cmd = app.add_subcommand("run", "Run pipeline stages");
  run_cmd->add_option("--config", config_path, "Path to config.yaml");
  run_cmd->add_option("--radar", radars, "Radar code (repeatable)")->required();
  run_cmd->add_option("--start", start, "Start (UTC)")->required();
  run_cmd->add_option("--end", end, "End (UTC)")->required();
  run_cmd->add_option("--stage", stage,
                      "rti_interp|fft|classify|music|all")
      ->default_val("all");
  run_cmd->add_option("--nprocs", nprocs, "Worker count (0 = from config)");
  run_cmd->add_flag("--recompute", recompute, "Re-run completed stages");
  run_cmd->add_option("--category", category,
                      "Only run music for this category");

  auto cls_cmd = app.add_subcommand("classify", "Classify events");
  cls_cmd->add_option("--config", config_path, "Path to config.yaml");
  cls_cmd->add_option("--radar", radars, "Radar code (repeatable)")->required();
  cls_cmd->add_option("--start", start, "Start (UTC)")->required();
  cls_cmd->add_option("--end", end, "End (UTC)")->required();

  auto status_cmd = app.add_subcommand("status", "Summarize the catalog");
  status_cmd->add_option("--config", config_path, "Path to config.yaml");
  status_cmd->add_option("--radar", status_radar, "Radar code");

  std::string sim_radar;
  auto sim_cmd = app.add_subcommand("simulate", "Write synthetic raw data");
  sim_cmd->add_option("--config", config_path, "Path to config.yaml");
  sim_cmd->add_option("--radar", sim_radar, "Radar code")->required();
  sim_cmd->add_option("--start", start, "Start (UTC)")->required();
  sim_cmd->add_option("--end", end, "End (UTC)")->required();
  sim_cmd->add_option("--kx", kx, "Wavenumber east (rad/km)");
  sim_cmd->add_option("--ky", ky, "Wavenumber north (rad/km)");
  sim_cmd->add_option("--freq", freq, "Frequency (Hz)");
  sim_cmd->add_option("--amplitude", amplitude, "Amplitude (dB)");
  sim_cmd->add_option("--noise", noise, "Noise standard deviation (dB)");
  sim_cmd->add_option("--dt", dt, "Sample interval (s)");
  sim_cmd->add_option("--seed", seed, "Random seed");

  CLI11_PARSE(app, argc, argv);

  try {
    if (gen_cmd->parsed())
      return generate_command(config_path, radars, start, end);
    if (run_cmd->parsed())
      return run_command(config_path, radars, start, end, stage, nprocs,
                         recompute, category);
    if (cls_cmd->parsed())
      return classify_command(config_path, radars, start, end);
    if (status_cmd->parsed())
      return status_command(config_path, status_radar);
    if (sim_cmd->parsed())
      return simulate_command(config_path, sim_radar, start, end, kx, ky, freq,
                              amplitude, noise, dt, seed);
  } catch (const tid_music::ConfigurationError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::cerr << app.help() << std::endl;
  return 1;
}
