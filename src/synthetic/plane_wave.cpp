#include "tid_music/synthetic/plane_wave.hpp"
#include "tid_music/core/errors.hpp"

#include <cmath>
#include <random>

namespace tid_music::synthetic {

namespace {

constexpr double kPi = 3.14159265358979323846;

struct CellPosition {
    int beam;
    int gate;
    double x_km;
    double y_km;
};

std::vector<CellPosition> mappable_cells(const geo::RadarSite& site, const geo::FieldOfView& fov) {
    std::vector<std::pair<int, int>> idx;
    std::vector<geo::GeoPoint> pts;
    double lat0 = 0.0, lon0 = 0.0;
    for (int b = 0; b < site.n_beams; ++b) {
        for (int g = 0; g < site.n_gates; ++g) {
            geo::GeoPoint p = fov.locate(site, b, g);
            if (!p.valid) continue;
            idx.emplace_back(b, g);
            pts.push_back(p);
            lat0 += p.lat;
            lon0 += p.lon;
        }
    }

    std::vector<CellPosition> cells;
    if (pts.empty()) return cells;
    lat0 /= static_cast<double>(pts.size());
    lon0 /= static_cast<double>(pts.size());

    for (size_t i = 0; i < pts.size(); ++i) {
        CellPosition c{idx[i].first, idx[i].second, 0.0, 0.0};
        geo::local_xy(pts[i].lat, pts[i].lon, lat0, lon0, c.x_km, c.y_km);
        cells.push_back(c);
    }
    return cells;
}

} // namespace

std::vector<io::RawSample> simulate_samples(const SimulationParams& params,
                                            const geo::FieldOfView& fov) {
    if (params.end <= params.start || params.time_step_s <= 0.0) {
        throw ConfigurationError("simulation needs end > start and a positive time step");
    }

    std::mt19937 rng(params.seed);
    std::normal_distribution<double> noise(0.0, params.noise_db > 0.0 ? params.noise_db : 1.0);
    std::uniform_real_distribution<double> uniform(0.0, 1.0);

    const std::vector<CellPosition> cells = mappable_cells(params.site, fov);
    const double duration = static_cast<double>(params.end - params.start);
    const int nt = static_cast<int>(std::floor(duration / params.time_step_s + 1e-9));

    std::vector<io::RawSample> samples;
    samples.reserve(cells.size() * static_cast<size_t>(std::max(0, nt)));
    for (int j = 0; j < nt; ++j) {
        const double rel_t = j * params.time_step_s;
        const auto t = params.start + static_cast<EpochSeconds>(std::llround(rel_t));
        for (const auto& c : cells) {
            if (params.dropout_fraction > 0.0 && uniform(rng) < params.dropout_fraction) continue;

            double p = params.background_db;
            for (const auto& w : params.waves) {
                p += w.amplitude_db *
                     std::cos(2.0 * kPi * w.freq_hz * rel_t - w.kx * c.x_km - w.ky * c.y_km +
                              w.phase_rad);
            }
            if (params.noise_db > 0.0) p += noise(rng);

            io::RawSample s;
            s.time = t;
            s.beam = c.beam;
            s.gate = c.gate;
            s.power_db = p;
            s.scatter = params.scatter;
            samples.push_back(s);
        }
    }
    return samples;
}

} // namespace tid_music::synthetic
