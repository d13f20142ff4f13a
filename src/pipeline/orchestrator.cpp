#include "tid_music/pipeline/orchestrator.hpp"
#include "tid_music/core/errors.hpp"
#include "tid_music/core/utils.hpp"
#include "tid_music/geo/fov.hpp"
#include "tid_music/geo/solar.hpp"
#include "tid_music/grid/grid_builder.hpp"
#include "tid_music/music/music.hpp"
#include "tid_music/quality/quality_gate.hpp"
#include "tid_music/spectral/spectral.hpp"

#include <atomic>
#include <iostream>
#include <thread>

namespace tid_music::pipeline {

using catalog::json;

namespace {

json signals_to_json(const std::vector<music::DetectedSignal>& signals) {
    json arr = json::array();
    for (const auto& s : signals) {
        arr.push_back({{"rank", s.rank},
                       {"kx", s.kx},
                       {"ky", s.ky},
                       {"k", s.k},
                       {"wavelength_km", s.wavelength_km},
                       {"azimuth_deg", s.azimuth_deg},
                       {"freq_hz", s.freq_hz},
                       {"period_s", s.period_s},
                       {"velocity_mps", s.velocity_mps},
                       {"value", s.value},
                       {"strength", s.strength}});
    }
    return arr;
}

std::string stage_name(ProcessLevel stage) {
    return core::process_level_to_string(stage);
}

EventRunResult make_result(const EventId& id, ProcessLevel stage, EventStatus status,
                           ProcessLevel level, std::string reason = "") {
    EventRunResult r;
    r.id = id;
    r.stage = stage;
    r.status = status;
    r.level = level;
    r.reason = std::move(reason);
    return r;
}

} // namespace

std::string event_status_to_string(EventStatus s) {
    switch (s) {
        case EventStatus::OK: return "ok";
        case EventStatus::SKIPPED: return "skipped";
        case EventStatus::REJECTED: return "rejected";
        case EventStatus::NO_DATA: return "no_data";
        case EventStatus::FAILED: return "failed";
        default: return "unknown";
    }
}

std::vector<EventId> BatchReport::failed_ids() const {
    std::vector<EventId> ids;
    for (const auto& r : results) {
        if (r.status == EventStatus::FAILED) ids.push_back(r.id);
    }
    return ids;
}

PipelineOrchestrator::PipelineOrchestrator(const config::Config& cfg, PipelineServices services)
    : cfg_(cfg), services_(std::move(services)) {
    cfg_.validate();
}

void PipelineOrchestrator::log(ProcessLevel stage, const EventId& id, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    std::cerr << "[" << stage_name(stage) << "] " << id.key() << ": " << message << std::endl;
}

void PipelineOrchestrator::record_failure(const EventId& id, ProcessLevel stage,
                                          const std::exception& e, json extra) {
    log(stage, id, e.what());
    json patch = std::move(extra);
    patch["last_error"] = {{"stage", stage_name(stage)},
                           {"type", error_type_name(e)},
                           {"message", e.what()},
                           {"run_id", services_.run_id}};
    services_.catalog.update_fields(id, patch);

    if (services_.emitter) {
        services_.emitter->error(services_.run_id, e.what(),
                                 {{"event", id.key()},
                                  {"stage", stage_name(stage)},
                                  {"error_type", error_type_name(e)}});
    }
}

ProcessLevel PipelineOrchestrator::stored_level(const EventId& id) {
    try {
        auto doc = services_.catalog.get(id);
        return doc ? catalog::level_of(*doc) : ProcessLevel::NONE;
    } catch (const std::exception& e) {
        log(ProcessLevel::NONE, id, std::string("level not readable: ") + e.what());
        return ProcessLevel::NONE;
    }
}

EventRunResult PipelineOrchestrator::run_event(const EventId& id, ProcessLevel stage,
                                               bool recompute,
                                               const std::string& category_filter) {
    if (stage == ProcessLevel::NONE) {
        throw PreconditionError("'none' is not a runnable stage");
    }
    cfg_.radar(id.radar);

    auto doc = services_.catalog.get(id);
    if (!doc) {
        throw StorageError("no catalog entry for " + id.key());
    }
    const core::ProcessState state(catalog::level_of(*doc));

    // Quality-rejected events never advance past rti_interp.
    if (stage != ProcessLevel::RTI_INTERP && doc->contains("good_period") &&
        (*doc)["good_period"].is_boolean() && !(*doc)["good_period"].get<bool>()) {
        return make_result(id, stage, EventStatus::REJECTED, state.level(), "quality rejected");
    }

    if (!recompute && state.has_completed(stage) &&
        services_.arrays.exists(id, stage_name(stage))) {
        return make_result(id, stage, EventStatus::SKIPPED, state.level(), "already complete");
    }

    state.require_can_enter(stage);

    if (stage == ProcessLevel::MUSIC && !category_filter.empty() &&
        category_to_string(catalog::category_of(*doc)) != core::to_lower(category_filter)) {
        return make_result(id, stage, EventStatus::SKIPPED, state.level(),
                           "category is " + category_to_string(catalog::category_of(*doc)));
    }

    if (services_.emitter) {
        services_.emitter->stage_start(services_.run_id, stage, id.key());
    }

    EventRunResult result;
    try {
        switch (stage) {
            case ProcessLevel::RTI_INTERP: result = run_rti_interp(id, state); break;
            case ProcessLevel::FFT: result = run_fft(id, state); break;
            case ProcessLevel::MUSIC: result = run_music(id, state); break;
            default: throw PipelineError("unknown stage");
        }
    } catch (const std::exception& e) {
        record_failure(id, stage, e);
        result = make_result(id, stage, EventStatus::FAILED, state.level(), e.what());
        result.error_type = error_type_name(e);
    }

    if (services_.emitter) {
        json extra;
        if (!result.reason.empty()) extra["reason"] = result.reason;
        services_.emitter->stage_end(services_.run_id, stage, id.key(),
                                     event_status_to_string(result.status), extra);
    }
    return result;
}

EventRunResult PipelineOrchestrator::run_rti_interp(const EventId& id,
                                                    const core::ProcessState& state) {
    const geo::RadarSite& site = cfg_.radar(id.radar);
    FovModel model = FovModel::GS;
    string_to_fov_model(cfg_.grid.fov_model, model);
    auto fov = geo::make_fov(model, cfg_.grid.reflection_height_km, cfg_.grid.bad_range_km);

    const std::vector<io::RawSample> samples = services_.raw.read(id.radar, id.start, id.end);
    const double uptime = quality::compute_uptime_minutes(samples, id.start, id.end);

    grid::GridBuilder builder(cfg_.grid, site, *fov);
    grid::Grid grid;
    try {
        grid = builder.build(samples, id.start, id.end);
    } catch (const InsufficientDataError& e) {
        json extra;
        extra["no_data"] = true;
        extra["uptime_minutes"] = uptime;
        record_failure(id, ProcessLevel::RTI_INTERP, e, extra);
        EventRunResult r = make_result(id, ProcessLevel::RTI_INTERP, EventStatus::NO_DATA,
                                       state.level(), e.what());
        r.error_type = error_type_name(e);
        return r;
    }

    const quality::QualityVerdict verdict =
        quality::evaluate_quality(grid, uptime, services_.terminator, cfg_.quality);

    services_.arrays.write(id, stage_name(ProcessLevel::RTI_INTERP), grid::to_bundle(grid));

    const core::ProcessState next = state.complete(ProcessLevel::RTI_INTERP);
    const EpochSeconds mid = id.start + (id.end - id.start) / 2;

    json patch;
    patch["process_level"] = stage_name(next.level());
    patch["no_data"] = false;
    patch["good_period"] = verdict.accepted;
    patch["reject_reasons"] = verdict.failed_checks;
    patch["rti_fraction"] = verdict.metrics.coverage;
    patch["terminator_fraction"] = verdict.metrics.daylight_fraction;
    patch["uptime_minutes"] = verdict.metrics.uptime_minutes;
    patch["center_lat"] = grid.center_lat;
    patch["center_lon"] = grid.center_lon;
    patch["slt_hours"] = geo::solar_local_time(mid, grid.center_lon);
    patch["time_step_s"] = grid.time_step_s;
    // Results derived from a replaced grid are stale.
    patch["psd_sum"] = nullptr;
    patch["psd_mean"] = nullptr;
    patch["psd_max"] = nullptr;
    patch["category"] = category_to_string(Category::UNCLASSIFIED);
    patch["classifier"] = nullptr;
    patch["signals"] = json::array();
    patch["music_failed_bins"] = nullptr;
    patch["last_error"] = nullptr;
    services_.catalog.update_fields(id, patch);

    if (!verdict.accepted) {
        log(ProcessLevel::RTI_INTERP, id,
            "rejected: " + core::join(verdict.failed_checks, ", "));
        return make_result(id, ProcessLevel::RTI_INTERP, EventStatus::REJECTED, next.level(),
                           core::join(verdict.failed_checks, ","));
    }
    return make_result(id, ProcessLevel::RTI_INTERP, EventStatus::OK, next.level());
}

EventRunResult PipelineOrchestrator::run_fft(const EventId& id, const core::ProcessState& state) {
    const grid::Grid grid =
        grid::grid_from_bundle(services_.arrays.read(id, stage_name(ProcessLevel::RTI_INTERP)));
    const spectral::SpectralResult spectrum = spectral::compute_spectrum(grid, cfg_.spectral);

    services_.arrays.write(id, stage_name(ProcessLevel::FFT), spectral::to_bundle(spectrum));

    const core::ProcessState next = state.complete(ProcessLevel::FFT);
    json patch;
    patch["process_level"] = stage_name(next.level());
    patch["psd_sum"] = spectrum.psd_sum;
    patch["psd_mean"] = spectrum.psd_mean;
    patch["psd_max"] = spectrum.psd_max;
    patch["n_channels"] = spectrum.n_valid;
    patch["category"] = category_to_string(Category::UNCLASSIFIED);
    patch["classifier"] = nullptr;
    patch["signals"] = json::array();
    patch["music_failed_bins"] = nullptr;
    patch["last_error"] = nullptr;
    services_.catalog.update_fields(id, patch);

    return make_result(id, ProcessLevel::FFT, EventStatus::OK, next.level());
}

EventRunResult PipelineOrchestrator::run_music(const EventId& id,
                                               const core::ProcessState& state) {
    const grid::Grid grid =
        grid::grid_from_bundle(services_.arrays.read(id, stage_name(ProcessLevel::RTI_INTERP)));
    const spectral::SpectralResult spectrum =
        spectral::spectrum_from_bundle(services_.arrays.read(id, stage_name(ProcessLevel::FFT)));

    music::MusicDetector detector(cfg_.music);
    const music::MusicResult result = detector.detect(grid, spectrum, cfg_.spectral.band_min_hz,
                                                      cfg_.spectral.band_max_hz);

    services_.arrays.write(id, stage_name(ProcessLevel::MUSIC), music::to_bundle(result));

    json failed = json::array();
    for (const auto& f : result.failed_bins) {
        failed.push_back({{"bin", f.bin}, {"freq_hz", f.freq_hz}, {"reason", f.reason}});
        log(ProcessLevel::MUSIC, id, "bin " + std::to_string(f.bin) + ": " + f.reason);
        if (services_.emitter) {
            services_.emitter->warning(services_.run_id,
                                       "frequency bin skipped: " + f.reason,
                                       {{"event", id.key()},
                                        {"stage", stage_name(ProcessLevel::MUSIC)},
                                        {"bin", f.bin},
                                        {"freq_hz", f.freq_hz}});
        }
    }

    const core::ProcessState next = state.complete(ProcessLevel::MUSIC);
    json patch;
    patch["process_level"] = stage_name(next.level());
    patch["signals"] = signals_to_json(result.signals);
    patch["music_failed_bins"] = failed;
    patch["last_error"] = nullptr;
    services_.catalog.update_fields(id, patch);

    return make_result(id, ProcessLevel::MUSIC, EventStatus::OK, next.level(),
                       std::to_string(result.signals.size()) + " signals");
}

ClassifyReport PipelineOrchestrator::classify_batch(const std::vector<EventId>& ids) {
    ClassifyReport report;

    std::map<std::string, std::vector<std::pair<EventId, double>>> by_radar;
    for (const auto& id : ids) {
        auto doc = services_.catalog.get(id);
        if (!doc) {
            ++report.ineligible;
            continue;
        }
        const bool at_fft = catalog::level_of(*doc) >= ProcessLevel::FFT;
        const bool good = doc->value("good_period", false);
        const json psd = catalog::field_at(*doc, "psd_sum");
        if (!at_fft || !good || !psd.is_number()) {
            ++report.ineligible;
            continue;
        }
        by_radar[id.radar].emplace_back(id, psd.get<double>());
    }

    for (const auto& [radar, members] : by_radar) {
        std::vector<double> values;
        values.reserve(members.size());
        for (const auto& m : members) values.push_back(m.second);

        const classify::Threshold thr = classify::compute_threshold(values, cfg_.classifier);
        report.thresholds[radar] = thr;

        for (const auto& [id, value] : members) {
            const Category c = classify::label(value, thr);
            if (c == Category::DISTURBED) ++report.disturbed; else ++report.quiet;

            json patch;
            patch["category"] = category_to_string(c);
            patch["classifier"] = {{"threshold", thr.value},
                                   {"mode", thr.mode},
                                   {"percentile", thr.percentile},
                                   {"batch_size", thr.batch_size},
                                   {"run_id", services_.run_id}};
            services_.catalog.update_fields(id, patch);
        }

        if (services_.emitter) {
            services_.emitter->emit("classify_end", services_.run_id,
                                    {{"radar", radar},
                                     {"threshold", thr.value},
                                     {"mode", thr.mode},
                                     {"batch_size", thr.batch_size}});
        }
    }
    return report;
}

void PipelineOrchestrator::validate_batch(const std::vector<EventId>& ids, ProcessLevel stage,
                                          int nprocs, const std::string& category_filter) const {
    if (stage == ProcessLevel::NONE) {
        throw ConfigurationError("'none' is not a runnable stage");
    }
    if (nprocs < 1) {
        throw ConfigurationError("nprocs must be >= 1");
    }
    if (!category_filter.empty() &&
        string_to_category(category_filter) == Category::UNCLASSIFIED) {
        throw ConfigurationError("category filter must be 'quiet' or 'disturbed'");
    }
    for (const auto& id : ids) {
        if (id.end <= id.start) {
            throw ConfigurationError("inverted window for " + id.key());
        }
        cfg_.radar(id.radar);
    }
}

BatchReport PipelineOrchestrator::run_batch(const std::vector<EventId>& ids, ProcessLevel stage,
                                            int nprocs, bool recompute,
                                            const std::string& category_filter) {
    validate_batch(ids, stage, nprocs, category_filter);

    BatchReport report;
    report.stage = stage;
    report.results.resize(ids.size());

    auto process_event = [&](size_t i) {
        try {
            report.results[i] = run_event(ids[i], stage, recompute, category_filter);
        } catch (const std::exception& e) {
            log(stage, ids[i], e.what());
            EventRunResult r = make_result(ids[i], stage, EventStatus::FAILED,
                                           stored_level(ids[i]), e.what());
            r.error_type = error_type_name(e);
            report.results[i] = r;
        }
        if (!services_.emitter) return;
        try {
            const EventRunResult& r = report.results[i];
            json extra = {{"stage", stage_name(stage)}, {"level", stage_name(r.level)}};
            if (!r.reason.empty()) extra["reason"] = r.reason;
            if (!r.error_type.empty()) extra["error_type"] = r.error_type;
            services_.emitter->event_result(services_.run_id, ids[i].key(),
                                            event_status_to_string(r.status), extra);
        } catch (const std::exception& e) {
            log(stage, ids[i], std::string("event_result not written: ") + e.what());
        }
    };

    const int workers_n = std::min<int>(nprocs, static_cast<int>(std::max<size_t>(1, ids.size())));
    if (workers_n > 1) {
        std::vector<std::thread> workers;
        std::atomic<size_t> next{0};
        for (int w = 0; w < workers_n; ++w) {
            workers.emplace_back([&]() {
                while (true) {
                    size_t i = next.fetch_add(1);
                    if (i >= ids.size())
                        break;
                    process_event(i);
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
    } else {
        for (size_t i = 0; i < ids.size(); ++i) {
            process_event(i);
        }
    }

    for (const auto& r : report.results) {
        switch (r.status) {
            case EventStatus::OK: ++report.succeeded; break;
            case EventStatus::SKIPPED: ++report.skipped; break;
            case EventStatus::REJECTED: ++report.rejected; break;
            case EventStatus::NO_DATA: ++report.no_data; break;
            case EventStatus::FAILED: ++report.failed; break;
        }
    }
    return report;
}

} // namespace tid_music::pipeline
