#include "tid_music/grid/grid.hpp"
#include "tid_music/core/errors.hpp"

#include <algorithm>
#include <cmath>

namespace tid_music::grid {

namespace {

template <typename Derived>
io::NdArray cube(const Eigen::MatrixBase<Derived>& m, long nb, long ng, long nt) {
    io::NdArray a;
    a.shape = {nb, ng, nt};
    a.data.reserve(static_cast<size_t>(m.size()));
    for (Eigen::Index r = 0; r < m.rows(); ++r) {
        for (Eigen::Index c = 0; c < m.cols(); ++c) {
            a.data.push_back(static_cast<double>(m(r, c)));
        }
    }
    return a;
}

Matrix2Dd rows_from_cube(const io::NdArray& a) {
    if (a.shape.size() != 3 || a.data.size() != a.expected_size()) {
        throw StorageError("grid array is not a (beam, gate, time) cube");
    }
    Matrix2Dd m(a.shape[0] * a.shape[1], a.shape[2]);
    std::copy(a.data.begin(), a.data.end(), m.data());
    return m;
}

template <typename T>
std::vector<double> as_doubles(const std::vector<T>& v) {
    return std::vector<double>(v.begin(), v.end());
}

} // namespace

bool Grid::cell_complete(int cell) const {
    if (n_times() == 0) return false;
    return valid.row(cell).minCoeff() != 0;
}

double Grid::compute_coverage() const {
    if (n_times() == 0) return 0.0;
    long mappable = 0;
    long filled = 0;
    for (int b = 0; b < n_beams(); ++b) {
        for (int g = 0; g < n_gates(); ++g) {
            if (!geometry_valid(b, g)) continue;
            ++mappable;
            filled += valid.row(cell_index(b, g)).cast<long>().sum();
        }
    }
    if (mappable == 0) return 0.0;
    return static_cast<double>(filled) / (static_cast<double>(mappable) * n_times());
}

io::ArrayBundle to_bundle(const Grid& grid) {
    const long nb = grid.n_beams();
    const long ng = grid.n_gates();
    const long nt = grid.n_times();

    io::ArrayBundle bundle;
    bundle.arrays["power"] = cube(grid.power, nb, ng, nt);
    bundle.arrays["velocity"] = cube(grid.velocity, nb, ng, nt);
    bundle.arrays["valid"] = cube(grid.valid, nb, ng, nt);
    bundle.arrays["beams"] = io::from_vector(as_doubles(grid.beams));
    bundle.arrays["gates"] = io::from_vector(as_doubles(grid.gates));
    bundle.arrays["slant_range"] = io::from_vector(grid.slant_range_km);
    bundle.arrays["times"] = io::from_vector(grid.times);
    bundle.arrays["lat"] = io::from_matrix(grid.cell_lat);
    bundle.arrays["lon"] = io::from_matrix(grid.cell_lon);
    bundle.arrays["geom_valid"] = io::from_matrix(grid.geometry_valid.cast<double>());

    bundle.attrs.set("RADAR", grid.radar);
    bundle.attrs.set("TSTART", static_cast<double>(grid.start));
    bundle.attrs.set("TEND", static_cast<double>(grid.end));
    bundle.attrs.set("DT", grid.time_step_s);
    bundle.attrs.set("FOVMODEL", grid.fov_model);
    bundle.attrs.set("CLAT", grid.center_lat);
    bundle.attrs.set("CLON", grid.center_lon);
    bundle.attrs.set("COVERAGE", grid.coverage);
    return bundle;
}

Grid grid_from_bundle(const io::ArrayBundle& bundle) {
    Grid grid;
    grid.radar = bundle.attrs.get_string("RADAR").value_or("");
    grid.start = static_cast<EpochSeconds>(std::llround(bundle.attrs.get_double("TSTART").value_or(0.0)));
    grid.end = static_cast<EpochSeconds>(std::llround(bundle.attrs.get_double("TEND").value_or(0.0)));
    grid.time_step_s = bundle.attrs.get_double("DT").value_or(0.0);
    grid.fov_model = bundle.attrs.get_string("FOVMODEL").value_or("GS");
    grid.center_lat = bundle.attrs.get_double("CLAT").value_or(0.0);
    grid.center_lon = bundle.attrs.get_double("CLON").value_or(0.0);

    for (double b : bundle.array("beams").data) grid.beams.push_back(static_cast<int>(b));
    for (double g : bundle.array("gates").data) grid.gates.push_back(static_cast<int>(g));
    grid.slant_range_km = bundle.array("slant_range").data;
    grid.times = bundle.array("times").data;

    grid.power = rows_from_cube(bundle.array("power"));
    grid.velocity = rows_from_cube(bundle.array("velocity"));
    grid.valid = rows_from_cube(bundle.array("valid")).cast<uint8_t>();
    grid.cell_lat = io::to_matrix(bundle.array("lat"));
    grid.cell_lon = io::to_matrix(bundle.array("lon"));
    grid.geometry_valid = io::to_matrix(bundle.array("geom_valid")).cast<uint8_t>();

    if (grid.power.rows() != grid.n_cells() || grid.power.cols() != grid.n_times()) {
        throw StorageError("stored grid axes do not match its power array");
    }
    grid.coverage = grid.compute_coverage();
    return grid;
}

} // namespace tid_music::grid
