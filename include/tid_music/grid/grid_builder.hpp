#pragma once

#include "tid_music/config/configuration.hpp"
#include "tid_music/geo/fov.hpp"
#include "tid_music/grid/grid.hpp"
#include "tid_music/io/raw_source.hpp"

#include <vector>

namespace tid_music::grid {

// Median spacing between successive distinct sample times; 0 with fewer
// than two distinct times.
double detect_time_step(const std::vector<io::RawSample>& samples);

// Hanning weight for index i of n that never reaches zero at the edges.
double edge_taper_weight(int i, int n);

class GridBuilder {
public:
    GridBuilder(const config::GridConfig& cfg, const geo::RadarSite& site,
                const geo::FieldOfView& fov)
        : cfg_(cfg), site_(site), fov_(fov) {}

    // Throws InsufficientDataError when no selected sample falls on a
    // mappable cell inside [start, end).
    Grid build(const std::vector<io::RawSample>& samples, EpochSeconds start,
               EpochSeconds end) const;

private:
    std::vector<int> axis(int n, const std::array<int, 2>& limits) const;
    void fill_series(std::vector<std::pair<double, double>>& series, const Grid& grid,
                     int row, Matrix2Dd& values, MaskMatrix* mask) const;
    void apply_taper(Grid& grid) const;

    const config::GridConfig& cfg_;
    const geo::RadarSite& site_;
    const geo::FieldOfView& fov_;
};

} // namespace tid_music::grid
