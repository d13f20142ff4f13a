#pragma once

#include "tid_music/catalog/event_catalog.hpp"
#include "tid_music/classify/classifier.hpp"
#include "tid_music/config/configuration.hpp"
#include "tid_music/core/event_id.hpp"
#include "tid_music/core/events.hpp"
#include "tid_music/core/process_state.hpp"
#include "tid_music/geo/solar.hpp"
#include "tid_music/io/array_store.hpp"
#include "tid_music/io/raw_source.hpp"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace tid_music::pipeline {

using core::EventId;
using core::ProcessLevel;

// Collaborators used by the orchestrator. Not owned.
struct PipelineServices {
    io::RawDataSource& raw;
    catalog::EventCatalog& catalog;
    io::ArrayStore& arrays;
    const geo::TerminatorModel& terminator;
    core::EventEmitter* emitter = nullptr;
    std::string run_id;
};

enum class EventStatus {
    OK,
    SKIPPED,   // already complete, or excluded by the category filter
    REJECTED,  // failed the quality gate
    NO_DATA,
    FAILED
};

std::string event_status_to_string(EventStatus s);

struct EventRunResult {
    EventId id;
    ProcessLevel stage = ProcessLevel::NONE;
    EventStatus status = EventStatus::FAILED;
    ProcessLevel level = ProcessLevel::NONE;  // after the run
    std::string reason;
    std::string error_type;
};

struct BatchReport {
    ProcessLevel stage = ProcessLevel::NONE;
    std::vector<EventRunResult> results;  // same order as the input
    size_t succeeded = 0;
    size_t skipped = 0;
    size_t rejected = 0;
    size_t no_data = 0;
    size_t failed = 0;

    std::vector<EventId> failed_ids() const;
};

struct ClassifyReport {
    std::map<std::string, classify::Threshold> thresholds;  // per radar
    size_t disturbed = 0;
    size_t quiet = 0;
    size_t ineligible = 0;  // not at fft, rejected or without a PSD sum
};

class PipelineOrchestrator {
public:
    // Throws ConfigurationError for an invalid configuration.
    PipelineOrchestrator(const config::Config& cfg, PipelineServices services);

    // Runs exactly one stage for one event. Throws PreconditionError, with
    // the catalog untouched, when the previous stage has not completed.
    // Stage failures are recorded on the event and returned as FAILED.
    EventRunResult run_event(const EventId& id, ProcessLevel stage, bool recompute,
                             const std::string& category_filter = "");

    // Two-phase, per radar: threshold from the batch, then labels.
    ClassifyReport classify_batch(const std::vector<EventId>& ids);

    // One stage over many events on `nprocs` workers. Per-event errors are
    // isolated; configuration errors abort before any work starts.
    BatchReport run_batch(const std::vector<EventId>& ids, ProcessLevel stage, int nprocs,
                          bool recompute, const std::string& category_filter = "");

private:
    EventRunResult run_rti_interp(const EventId& id, const core::ProcessState& state);
    EventRunResult run_fft(const EventId& id, const core::ProcessState& state);
    EventRunResult run_music(const EventId& id, const core::ProcessState& state);

    void record_failure(const EventId& id, ProcessLevel stage, const std::exception& e,
                        catalog::json extra = catalog::json::object());
    void validate_batch(const std::vector<EventId>& ids, ProcessLevel stage, int nprocs,
                        const std::string& category_filter) const;
    void log(ProcessLevel stage, const EventId& id, const std::string& message);
    // Catalog level of an event; NONE when it cannot be read.
    ProcessLevel stored_level(const EventId& id);

    const config::Config& cfg_;
    PipelineServices services_;
    std::mutex log_mutex_;
};

} // namespace tid_music::pipeline
