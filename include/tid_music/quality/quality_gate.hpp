#pragma once

#include "tid_music/config/configuration.hpp"
#include "tid_music/geo/solar.hpp"
#include "tid_music/grid/grid.hpp"
#include "tid_music/io/raw_source.hpp"

#include <string>
#include <vector>

namespace tid_music::quality {

struct QualityMetrics {
    double uptime_minutes = 0.0;
    double coverage = 0.0;
    double daylight_fraction = 0.0;
};

struct QualityVerdict {
    bool accepted = false;
    std::vector<std::string> failed_checks;  // "uptime", "rti_fraction", "terminator_fraction"
    QualityMetrics metrics;
};

// Distinct whole UTC minutes inside [start, end) with at least one sample.
double compute_uptime_minutes(const std::vector<io::RawSample>& samples, EpochSeconds start,
                              EpochSeconds end);

// Fraction of the grid's time steps sunlit at the grid centre.
double daylight_fraction(const grid::Grid& grid, const geo::TerminatorModel& terminator);

// All checks are evaluated; failures accumulate in a fixed order.
QualityVerdict evaluate_quality(const QualityMetrics& metrics, const config::QualityConfig& cfg);

QualityVerdict evaluate_quality(const grid::Grid& grid, double uptime_minutes,
                                const geo::TerminatorModel& terminator,
                                const config::QualityConfig& cfg);

} // namespace tid_music::quality
