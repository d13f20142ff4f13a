#pragma once

#include "tid_music/core/types.hpp"
#include "tid_music/io/fits_io.hpp"

#include <string>
#include <vector>

namespace tid_music::grid {

// Regular beam x gate x time array of backscatter power.
//
// Cell (b, g) is row b * n_gates() + g of the time-series matrices, so the
// row-major layout equals a (beam, gate, time) cube. Cells without data hold
// NaN and a zero mask entry.
struct Grid {
    std::string radar;
    EpochSeconds start = 0;
    EpochSeconds end = 0;

    std::vector<int> beams;
    std::vector<int> gates;
    std::vector<double> slant_range_km;  // per gate
    std::vector<double> times;           // epoch seconds, uniform
    double time_step_s = 0.0;

    Matrix2Dd power;     // cells x times (dB)
    Matrix2Dd velocity;  // cells x times (m/s), NaN when not measured
    MaskMatrix valid;    // cells x times

    Matrix2Dd cell_lat;  // beams x gates
    Matrix2Dd cell_lon;
    MaskMatrix geometry_valid;

    std::string fov_model;
    double center_lat = 0.0;
    double center_lon = 0.0;
    double coverage = 0.0;  // valid / (mappable cells x times)

    int n_beams() const { return static_cast<int>(beams.size()); }
    int n_gates() const { return static_cast<int>(gates.size()); }
    int n_times() const { return static_cast<int>(times.size()); }
    int n_cells() const { return n_beams() * n_gates(); }
    int cell_index(int b, int g) const { return b * n_gates() + g; }

    // True when every time step of the cell is valid.
    bool cell_complete(int cell) const;

    // Fraction of valid samples over geometry-valid cells only; 0 when no
    // cell maps.
    double compute_coverage() const;
};

io::ArrayBundle to_bundle(const Grid& grid);
Grid grid_from_bundle(const io::ArrayBundle& bundle);

} // namespace tid_music::grid
