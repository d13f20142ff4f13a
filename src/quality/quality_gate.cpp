#include "tid_music/quality/quality_gate.hpp"

#include <cmath>
#include <set>

namespace tid_music::quality {

double compute_uptime_minutes(const std::vector<io::RawSample>& samples, EpochSeconds start,
                              EpochSeconds end) {
    std::set<EpochSeconds> minutes;
    for (const auto& s : samples) {
        if (s.time < start || s.time >= end) continue;
        EpochSeconds m = s.time / 60;
        if (s.time < 0 && s.time % 60 != 0) --m;
        minutes.insert(m);
    }
    return static_cast<double>(minutes.size());
}

double daylight_fraction(const grid::Grid& grid, const geo::TerminatorModel& terminator) {
    if (grid.times.empty()) return 0.0;
    int lit = 0;
    for (double t : grid.times) {
        auto ts = static_cast<EpochSeconds>(std::llround(t + 0.5 * grid.time_step_s));
        if (terminator.is_daylight(ts, grid.center_lat, grid.center_lon)) ++lit;
    }
    return static_cast<double>(lit) / static_cast<double>(grid.times.size());
}

QualityVerdict evaluate_quality(const QualityMetrics& metrics, const config::QualityConfig& cfg) {
    QualityVerdict v;
    v.metrics = metrics;

    if (metrics.uptime_minutes < cfg.uptime_min_minutes) {
        v.failed_checks.push_back("uptime");
    }
    if (metrics.coverage < cfg.rti_fraction_threshold) {
        v.failed_checks.push_back("rti_fraction");
    }
    if (metrics.daylight_fraction < cfg.terminator_fraction_threshold) {
        v.failed_checks.push_back("terminator_fraction");
    }
    v.accepted = v.failed_checks.empty();
    return v;
}

QualityVerdict evaluate_quality(const grid::Grid& grid, double uptime_minutes,
                                const geo::TerminatorModel& terminator,
                                const config::QualityConfig& cfg) {
    QualityMetrics m;
    m.uptime_minutes = uptime_minutes;
    m.coverage = grid.coverage;
    m.daylight_fraction = daylight_fraction(grid, terminator);
    return evaluate_quality(m, cfg);
}

} // namespace tid_music::quality
