#pragma once

#include "tid_music/geo/fov.hpp"
#include "tid_music/io/raw_source.hpp"

#include <cstdint>
#include <vector>

namespace tid_music::synthetic {

struct PlaneWave {
    double kx = 0.0;  // rad/km
    double ky = 0.0;
    double freq_hz = 0.0;
    double amplitude_db = 1.0;
    double phase_rad = 0.0;
};

struct SimulationParams {
    geo::RadarSite site;
    EpochSeconds start = 0;
    EpochSeconds end = 0;
    double time_step_s = 60.0;
    double background_db = 20.0;
    std::vector<PlaneWave> waves;
    double noise_db = 0.0;        // standard deviation
    double dropout_fraction = 0.0;  // of individual samples
    ScatterType scatter = ScatterType::GROUND;
    uint32_t seed = 12345;
};

// Samples for every mappable cell of the site at each time step:
// background + sum_i A_i cos(2 pi f_i t - kx_i x - ky_i y + phase_i), with
// (x, y) the cell offset in km from the centroid of the mappable cells.
std::vector<io::RawSample> simulate_samples(const SimulationParams& params,
                                            const geo::FieldOfView& fov);

} // namespace tid_music::synthetic
