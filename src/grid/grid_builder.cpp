#include "tid_music/grid/grid_builder.hpp"
#include "tid_music/core/errors.hpp"
#include "tid_music/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>

namespace tid_music::grid {

namespace {

constexpr double kPi = 3.14159265358979323846;
const double kNaN = std::numeric_limits<double>::quiet_NaN();

// Sorts by time and averages samples sharing a timestamp.
void merge_duplicates(std::vector<std::pair<double, double>>& series) {
    std::sort(series.begin(), series.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    std::vector<std::pair<double, double>> merged;
    merged.reserve(series.size());
    size_t i = 0;
    while (i < series.size()) {
        size_t j = i;
        double sum = 0.0;
        while (j < series.size() && series[j].first == series[i].first) {
            sum += series[j].second;
            ++j;
        }
        merged.emplace_back(series[i].first, sum / static_cast<double>(j - i));
        i = j;
    }
    series.swap(merged);
}

} // namespace

double detect_time_step(const std::vector<io::RawSample>& samples) {
    std::vector<EpochSeconds> t;
    t.reserve(samples.size());
    for (const auto& s : samples) t.push_back(s.time);
    std::sort(t.begin(), t.end());
    t.erase(std::unique(t.begin(), t.end()), t.end());
    if (t.size() < 2) {
        return 0.0;
    }

    std::vector<double> diffs;
    diffs.reserve(t.size() - 1);
    for (size_t i = 1; i < t.size(); ++i) {
        diffs.push_back(static_cast<double>(t[i] - t[i - 1]));
    }
    return core::compute_median(diffs);
}

double edge_taper_weight(int i, int n) {
    if (n <= 1) return 1.0;
    return 0.5 - 0.5 * std::cos(2.0 * kPi * static_cast<double>(i + 1) /
                                static_cast<double>(n + 1));
}

std::vector<int> GridBuilder::axis(int n, const std::array<int, 2>& limits) const {
    int lo = limits[0] >= 0 ? limits[0] : 0;
    int hi = limits[1] >= 0 ? std::min(limits[1], n - 1) : n - 1;
    std::vector<int> out;
    for (int i = lo; i <= hi; ++i) out.push_back(i);
    return out;
}

void GridBuilder::fill_series(std::vector<std::pair<double, double>>& series, const Grid& grid,
                              int row, Matrix2Dd& values, MaskMatrix* mask) const {
    if (series.empty()) return;
    merge_duplicates(series);

    const double dt = grid.time_step_s;
    const bool linear = cfg_.interpolation == "linear";
    const double nearest_tol = linear ? 0.5 * dt : std::max(0.5 * dt, 0.5 * cfg_.max_gap_s);
    const double bridge = std::max(cfg_.max_gap_s, dt);

    for (int j = 0; j < grid.n_times(); ++j) {
        const double tg = grid.times[static_cast<size_t>(j)];
        auto it = std::lower_bound(series.begin(), series.end(), tg,
                                   [](const auto& s, double t) { return s.first < t; });

        double value = kNaN;
        const bool has_next = it != series.end();
        const bool has_prev = it != series.begin();

        if (has_next && std::fabs(it->first - tg) < 1e-6) {
            value = it->second;
        } else {
            const auto* prev = has_prev ? &*(it - 1) : nullptr;
            const auto* next = has_next ? &*it : nullptr;

            if (linear && prev && next && (next->first - prev->first) <= bridge) {
                const double w = (tg - prev->first) / (next->first - prev->first);
                value = prev->second + w * (next->second - prev->second);
            } else {
                double best = std::numeric_limits<double>::infinity();
                if (prev && tg - prev->first < best) {
                    best = tg - prev->first;
                    value = prev->second;
                }
                if (next && next->first - tg < best) {
                    best = next->first - tg;
                    value = next->second;
                }
                if (best > nearest_tol) value = kNaN;
            }
        }

        values(row, j) = value;
        if (mask) (*mask)(row, j) = std::isfinite(value) ? 1 : 0;
    }
}

void GridBuilder::apply_taper(Grid& grid) const {
    double sum = 0.0;
    long n = 0;
    for (Eigen::Index i = 0; i < grid.power.size(); ++i) {
        if (grid.valid.data()[i]) {
            sum += grid.power.data()[i];
            ++n;
        }
    }
    if (n == 0) return;
    const double mean = sum / static_cast<double>(n);

    for (int b = 0; b < grid.n_beams(); ++b) {
        const double wb = edge_taper_weight(b, grid.n_beams());
        for (int g = 0; g < grid.n_gates(); ++g) {
            const double w = wb * edge_taper_weight(g, grid.n_gates());
            const int row = grid.cell_index(b, g);
            for (int j = 0; j < grid.n_times(); ++j) {
                if (grid.valid(row, j)) {
                    grid.power(row, j) = mean + w * (grid.power(row, j) - mean);
                }
            }
        }
    }
}

Grid GridBuilder::build(const std::vector<io::RawSample>& samples, EpochSeconds start,
                        EpochSeconds end) const {
    if (end <= start) {
        throw ConfigurationError("grid window end must be after start");
    }

    Grid grid;
    grid.radar = site_.code;
    grid.start = start;
    grid.end = end;
    grid.fov_model = fov_model_to_string(fov_.model());
    grid.beams = axis(site_.n_beams, cfg_.beam_limits);
    grid.gates = axis(site_.n_gates, cfg_.gate_limits);
    for (int g : grid.gates) grid.slant_range_km.push_back(site_.slant_range_km(g));

    const int nb = grid.n_beams();
    const int ng = grid.n_gates();

    // Footprint
    grid.cell_lat = Matrix2Dd::Constant(nb, ng, kNaN);
    grid.cell_lon = Matrix2Dd::Constant(nb, ng, kNaN);
    grid.geometry_valid = MaskMatrix::Zero(nb, ng);
    double lat_sum = 0.0, lon_sum = 0.0;
    int n_geo = 0;
    for (int b = 0; b < nb; ++b) {
        for (int g = 0; g < ng; ++g) {
            geo::GeoPoint p = fov_.locate(site_, grid.beams[b], grid.gates[g]);
            if (!p.valid) continue;
            grid.cell_lat(b, g) = p.lat;
            grid.cell_lon(b, g) = p.lon;
            grid.geometry_valid(b, g) = 1;
            lat_sum += p.lat;
            lon_sum += p.lon;
            ++n_geo;
        }
    }
    if (n_geo > 0) {
        grid.center_lat = lat_sum / n_geo;
        grid.center_lon = lon_sum / n_geo;
    } else {
        grid.center_lat = site_.lat;
        grid.center_lon = site_.lon;
    }

    // Selection
    const int beam_lo = nb > 0 ? grid.beams.front() : 0;
    const int gate_lo = ng > 0 ? grid.gates.front() : 0;
    std::map<int, std::vector<std::pair<double, double>>> power_series;
    std::map<int, std::vector<std::pair<double, double>>> velocity_series;
    std::vector<io::RawSample> selected;
    for (const auto& s : samples) {
        if (s.time < start || s.time >= end) continue;
        if (!scatter_selected(s.scatter, cfg_.gscat)) continue;
        const int b = s.beam - beam_lo;
        const int g = s.gate - gate_lo;
        if (b < 0 || b >= nb || g < 0 || g >= ng) continue;
        if (!grid.geometry_valid(b, g)) continue;

        const int row = grid.cell_index(b, g);
        power_series[row].emplace_back(static_cast<double>(s.time), s.power_db);
        if (s.velocity) {
            velocity_series[row].emplace_back(static_cast<double>(s.time), *s.velocity);
        }
        selected.push_back(s);
    }

    if (selected.empty()) {
        throw InsufficientDataError("no usable samples for " + site_.code + " " +
                                    core::format_utc(start) + " - " + core::format_utc(end));
    }

    // Time axis at the native cadence
    double dt = cfg_.time_resolution_s;
    if (dt <= 0.0) {
        dt = detect_time_step(selected);
    }
    const double duration = static_cast<double>(end - start);
    if (dt <= 0.0 || dt > duration) {
        dt = duration;
    }
    const int nt = std::max(1, static_cast<int>(std::floor(duration / dt + 1e-9)));
    grid.time_step_s = dt;
    grid.times.resize(static_cast<size_t>(nt));
    for (int j = 0; j < nt; ++j) {
        grid.times[static_cast<size_t>(j)] = static_cast<double>(start) + j * dt;
    }

    grid.power = Matrix2Dd::Constant(grid.n_cells(), nt, kNaN);
    grid.velocity = Matrix2Dd::Constant(grid.n_cells(), nt, kNaN);
    grid.valid = MaskMatrix::Zero(grid.n_cells(), nt);

    for (auto& [row, series] : power_series) {
        fill_series(series, grid, row, grid.power, &grid.valid);
    }
    for (auto& [row, series] : velocity_series) {
        fill_series(series, grid, row, grid.velocity, nullptr);
    }

    if (cfg_.spatial_taper == "hanning") {
        apply_taper(grid);
    }

    grid.coverage = grid.compute_coverage();
    return grid;
}

} // namespace tid_music::grid
