#pragma once

#include "tid_music/config/configuration.hpp"
#include "tid_music/grid/grid.hpp"
#include "tid_music/io/fits_io.hpp"
#include "tid_music/spectral/spectral.hpp"

#include <Eigen/Dense>

#include <optional>
#include <string>
#include <vector>

namespace tid_music::music {

struct DetectedSignal {
    double kx = 0.0;  // rad/km, east
    double ky = 0.0;  // rad/km, north
    double k = 0.0;
    double wavelength_km = 0.0;
    double azimuth_deg = 0.0;  // direction of propagation, [0, 360)
    double freq_hz = 0.0;
    double period_s = 0.0;
    double velocity_mps = 0.0;
    double value = 0.0;     // normalized pseudospectrum at the peak
    double strength = 0.0;  // value weighted by relative bin power
    int rank = 0;           // 1 = strongest
};

// Eigenpairs sorted by descending eigenvalue.
struct Eigenstructure {
    Eigen::VectorXd values;
    Eigen::MatrixXcd vectors;  // column i pairs with values(i)
};

struct Peak {
    int row = 0;  // ky index
    int col = 0;  // kx index
    double kx = 0.0;
    double ky = 0.0;
    double value = 0.0;
};

struct BinResult {
    int bin = 0;
    double freq_hz = 0.0;
    double relative_power = 1.0;
    int signal_dim = 0;
    Eigen::VectorXd eigenvalues;
    Matrix2Dd pseudospectrum;  // ky x kx, normalized to max 1
    std::vector<DetectedSignal> signals;
};

struct FailedBin {
    int bin = 0;
    double freq_hz = 0.0;
    std::string reason;
};

struct MusicResult {
    std::vector<double> kx_axis;
    std::vector<double> ky_axis;
    std::vector<double> channel_x_km;
    std::vector<double> channel_y_km;
    std::vector<BinResult> bins;
    std::vector<FailedBin> failed_bins;
    std::vector<DetectedSignal> signals;  // all bins, strongest first
};

// -kmax..kmax in steps of dk, symmetric about zero.
std::vector<double> wavenumber_axis(double kmax, double dk);

// Spatial cross-covariance of the channels, averaged over bin +- avg_bins.
Eigen::MatrixXcd estimate_covariance(const ComplexMatrix2D& spectra, int bin, int avg_bins);

// Throws DetectionFailed for a non-finite or zero covariance or when the
// solver does not converge.
Eigenstructure decompose(const Eigen::MatrixXcd& cov);

// 0 <= d < number of channels.
int signal_dimension(const Eigen::VectorXd& sorted_values, const config::MusicConfig& cfg);

// 1 / |noise-subspace projection of a(k)|^2 over the (ky, kx) grid.
Matrix2Dd pseudospectrum(const Eigenstructure& eig, int signal_dim,
                         const std::vector<double>& x_km, const std::vector<double>& y_km,
                         const std::vector<double>& kx_axis, const std::vector<double>& ky_axis);

// Local maxima above threshold, ranked by value then by smaller |k|, with
// weaker peaks inside the neighbourhood of a stronger one suppressed.
std::vector<Peak> find_peaks(const Matrix2Dd& normalized, const std::vector<double>& kx_axis,
                             const std::vector<double>& ky_axis, const config::MusicConfig& cfg);

// Physical parameters; nullopt for non-physical or out-of-range results.
std::optional<DetectedSignal> wave_parameters(double kx, double ky, double freq_hz,
                                              const config::MusicConfig& cfg);

inline double wavelength_to_wavenumber(double wavelength_km) {
    return 2.0 * 3.14159265358979323846 / wavelength_km;
}
inline double wavenumber_to_wavelength(double k) {
    return 2.0 * 3.14159265358979323846 / k;
}

BinResult detect_from_covariance(const Eigen::MatrixXcd& cov, const std::vector<double>& x_km,
                                 const std::vector<double>& y_km, double freq_hz,
                                 const config::MusicConfig& cfg, double relative_power = 1.0);

class MusicDetector {
public:
    explicit MusicDetector(const config::MusicConfig& cfg) : cfg_(cfg) {}

    // Analyses the strongest in-band bins. Throws InsufficientChannelsError
    // for too few channels and DetectionFailed when every bin fails; single
    // bin failures are listed in the result.
    MusicResult detect(const grid::Grid& grid, const spectral::SpectralResult& spectrum,
                       double band_min_hz, double band_max_hz) const;

    void channel_positions(const grid::Grid& grid, const spectral::SpectralResult& spectrum,
                           std::vector<double>& x_km, std::vector<double>& y_km) const;

private:
    const config::MusicConfig& cfg_;
};

io::ArrayBundle to_bundle(const MusicResult& result);
MusicResult music_from_bundle(const io::ArrayBundle& bundle);

} // namespace tid_music::music
