#include "tid_music/music/music.hpp"
#include "tid_music/core/errors.hpp"
#include "tid_music/geo/fov.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace tid_music::music {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kProjectionFloor = 1e-12;
constexpr double kEigenFloor = 1e-12;
constexpr int kSignalColumns = 11;

bool stronger(const DetectedSignal& a, const DetectedSignal& b) {
    if (a.strength != b.strength) return a.strength > b.strength;
    return a.k < b.k;
}

void rank_signals(std::vector<DetectedSignal>& signals, int max_signals) {
    std::stable_sort(signals.begin(), signals.end(), stronger);
    if (max_signals > 0 && static_cast<int>(signals.size()) > max_signals) {
        signals.resize(static_cast<size_t>(max_signals));
    }
    for (size_t i = 0; i < signals.size(); ++i) {
        signals[i].rank = static_cast<int>(i) + 1;
    }
}

} // namespace

std::vector<double> wavenumber_axis(double kmax, double dk) {
    const int n = static_cast<int>(std::floor(kmax / dk + 1e-9));
    std::vector<double> axis;
    axis.reserve(static_cast<size_t>(2 * n + 1));
    for (int i = -n; i <= n; ++i) {
        axis.push_back(i * dk);
    }
    return axis;
}

Eigen::MatrixXcd estimate_covariance(const ComplexMatrix2D& spectra, int bin, int avg_bins) {
    const int nc = static_cast<int>(spectra.rows());
    const int nf = static_cast<int>(spectra.cols());
    if (bin < 0 || bin >= nf) {
        throw DetectionFailed("frequency bin " + std::to_string(bin) + " out of range");
    }

    const int lo = std::max(1, bin - avg_bins);
    const int hi = std::min(nf - 1, bin + avg_bins);
    Eigen::MatrixXcd cov = Eigen::MatrixXcd::Zero(nc, nc);
    int used = 0;
    for (int k = lo; k <= hi; ++k) {
        Eigen::VectorXcd x = spectra.col(k);
        cov.noalias() += x * x.adjoint();
        ++used;
    }
    if (used > 0) {
        cov /= static_cast<double>(used);
    }
    return cov;
}

Eigenstructure decompose(const Eigen::MatrixXcd& cov) {
    if (cov.rows() == 0 || cov.rows() != cov.cols()) {
        throw DetectionFailed("covariance matrix is empty or not square");
    }
    if (!cov.allFinite()) {
        throw DetectionFailed("covariance matrix has non-finite entries");
    }
    const double trace = cov.trace().real();
    if (!(trace > 0.0)) {
        throw DetectionFailed("covariance matrix has zero power");
    }

    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXcd> solver(cov);
    if (solver.info() != Eigen::Success) {
        throw DetectionFailed("eigendecomposition did not converge");
    }

    const Eigen::VectorXd& vals = solver.eigenvalues();
    std::vector<int> order(static_cast<size_t>(vals.size()));
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](int a, int b) { return vals(a) > vals(b); });

    Eigenstructure eig;
    eig.values.resize(vals.size());
    eig.vectors.resize(cov.rows(), cov.cols());
    for (size_t i = 0; i < order.size(); ++i) {
        const auto idx = static_cast<Eigen::Index>(i);
        eig.values(idx) = vals(order[i]);
        eig.vectors.col(idx) = solver.eigenvectors().col(order[i]);
    }
    return eig;
}

int signal_dimension(const Eigen::VectorXd& sorted_values, const config::MusicConfig& cfg) {
    const int n = static_cast<int>(sorted_values.size());
    if (n < 2) return 0;

    if (cfg.subspace_mode == "fixed") {
        return std::max(0, std::min(cfg.n_signals, n - 1));
    }

    // Largest relative drop between consecutive eigenvalues.
    const double top = sorted_values(0);
    if (!(top > 0.0)) return 0;
    const double floor = kEigenFloor * top;

    int best = 0;
    double best_ratio = std::numeric_limits<double>::infinity();
    for (int i = 1; i < n; ++i) {
        const double prev = std::max(sorted_values(i - 1), floor);
        const double cur = std::max(sorted_values(i), floor);
        const double ratio = cur / prev;
        if (ratio < best_ratio) {
            best_ratio = ratio;
            best = i;
        }
    }
    if (best_ratio > cfg.gap_ratio_max) return 0;
    return best;
}

Matrix2Dd pseudospectrum(const Eigenstructure& eig, int signal_dim,
                         const std::vector<double>& x_km, const std::vector<double>& y_km,
                         const std::vector<double>& kx_axis, const std::vector<double>& ky_axis) {
    const auto n = static_cast<Eigen::Index>(x_km.size());
    const auto nkx = static_cast<Eigen::Index>(kx_axis.size());
    const auto nky = static_cast<Eigen::Index>(ky_axis.size());

    Matrix2Dd p(nky, nkx);
    if (signal_dim <= 0) {
        p.setOnes();
        return p;
    }

    // With unit-norm a(k): |En^H a|^2 = 1 - |Es^H a|^2.
    const Eigen::MatrixXcd es_h = eig.vectors.leftCols(signal_dim).adjoint();
    const double norm = 1.0 / std::sqrt(static_cast<double>(n));

    Eigen::MatrixXcd ex(n, nkx);
    for (Eigen::Index c = 0; c < nkx; ++c) {
        for (Eigen::Index i = 0; i < n; ++i) {
            ex(i, c) = std::polar(norm, -kx_axis[static_cast<size_t>(c)] * x_km[static_cast<size_t>(i)]);
        }
    }

    Eigen::VectorXcd ey(n);
    for (Eigen::Index r = 0; r < nky; ++r) {
        for (Eigen::Index i = 0; i < n; ++i) {
            ey(i) = std::polar(1.0, -ky_axis[static_cast<size_t>(r)] * y_km[static_cast<size_t>(i)]);
        }
        const Eigen::MatrixXcd s = (es_h * ey.asDiagonal()) * ex;
        for (Eigen::Index c = 0; c < nkx; ++c) {
            const double proj = 1.0 - s.col(c).squaredNorm();
            p(r, c) = 1.0 / std::max(proj, kProjectionFloor);
        }
    }
    return p;
}

std::vector<Peak> find_peaks(const Matrix2Dd& normalized, const std::vector<double>& kx_axis,
                             const std::vector<double>& ky_axis, const config::MusicConfig& cfg) {
    std::vector<Peak> peaks;
    const int rows = static_cast<int>(normalized.rows());
    const int cols = static_cast<int>(normalized.cols());
    if (rows == 0 || cols == 0) return peaks;

    const int nb = cfg.peak_neighborhood;
    cv::Mat p(rows, cols, CV_64F, const_cast<double*>(normalized.data()));
    cv::Mat dilated;
    cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(2 * nb + 1, 2 * nb + 1));
    cv::dilate(p, dilated, kernel);

    for (int r = 0; r < rows; ++r) {
        const double* pr = p.ptr<double>(r);
        const double* dr = dilated.ptr<double>(r);
        for (int c = 0; c < cols; ++c) {
            if (pr[c] >= dr[c] && pr[c] >= cfg.peak_threshold) {
                peaks.push_back({r, c, kx_axis[static_cast<size_t>(c)],
                                 ky_axis[static_cast<size_t>(r)], pr[c]});
            }
        }
    }

    std::stable_sort(peaks.begin(), peaks.end(), [](const Peak& a, const Peak& b) {
        if (a.value != b.value) return a.value > b.value;
        return std::hypot(a.kx, a.ky) < std::hypot(b.kx, b.ky);
    });

    std::vector<Peak> kept;
    for (const auto& pk : peaks) {
        bool suppressed = false;
        for (const auto& k : kept) {
            if (std::abs(pk.row - k.row) <= nb && std::abs(pk.col - k.col) <= nb) {
                suppressed = true;
                break;
            }
        }
        if (!suppressed) kept.push_back(pk);
    }
    return kept;
}

std::optional<DetectedSignal> wave_parameters(double kx, double ky, double freq_hz,
                                              const config::MusicConfig& cfg) {
    const double k = std::hypot(kx, ky);
    if (!(k > 1e-12) || !(freq_hz > 0.0) || !std::isfinite(k)) {
        return std::nullopt;
    }
    const double wavelength = wavenumber_to_wavelength(k);
    if (wavelength < cfg.wavelength_min_km || wavelength > cfg.wavelength_max_km) {
        return std::nullopt;
    }

    DetectedSignal s;
    s.kx = kx;
    s.ky = ky;
    s.k = k;
    s.wavelength_km = wavelength;
    double az = std::atan2(kx, ky) * 180.0 / kPi;
    az = std::fmod(az + 360.0, 360.0);
    if (az >= 360.0) az = 0.0;
    s.azimuth_deg = az;
    s.freq_hz = freq_hz;
    s.period_s = 1.0 / freq_hz;
    s.velocity_mps = 2.0 * kPi * freq_hz / k * 1000.0;
    return s;
}

BinResult detect_from_covariance(const Eigen::MatrixXcd& cov, const std::vector<double>& x_km,
                                 const std::vector<double>& y_km, double freq_hz,
                                 const config::MusicConfig& cfg, double relative_power) {
    if (static_cast<size_t>(cov.rows()) != x_km.size() || x_km.size() != y_km.size()) {
        throw DetectionFailed("channel positions do not match the covariance");
    }

    BinResult result;
    result.freq_hz = freq_hz;
    result.relative_power = relative_power;

    Eigenstructure eig = decompose(cov);
    result.eigenvalues = eig.values;
    result.signal_dim = signal_dimension(eig.values, cfg);

    const std::vector<double> kx_axis = wavenumber_axis(cfg.kx_max, cfg.dk);
    const std::vector<double> ky_axis = wavenumber_axis(cfg.ky_max, cfg.dk);
    result.pseudospectrum = pseudospectrum(eig, result.signal_dim, x_km, y_km, kx_axis, ky_axis);

    const double pmax = result.pseudospectrum.maxCoeff();
    if (!std::isfinite(pmax) || pmax <= 0.0) {
        throw DetectionFailed("pseudospectrum is degenerate");
    }
    result.pseudospectrum /= pmax;

    // Without a signal subspace the spectrum is flat and carries no peaks.
    if (result.signal_dim == 0) {
        return result;
    }

    for (const auto& pk : find_peaks(result.pseudospectrum, kx_axis, ky_axis, cfg)) {
        auto sig = wave_parameters(pk.kx, pk.ky, freq_hz, cfg);
        if (!sig) continue;
        sig->value = pk.value;
        sig->strength = pk.value * relative_power;
        result.signals.push_back(*sig);
    }
    rank_signals(result.signals, cfg.max_signals);
    return result;
}

void MusicDetector::channel_positions(const grid::Grid& grid,
                                      const spectral::SpectralResult& spectrum,
                                      std::vector<double>& x_km, std::vector<double>& y_km) const {
    x_km.clear();
    y_km.clear();
    const size_t n = spectrum.channel_cells.size();
    if (n == 0 || grid.n_gates() == 0) return;

    std::vector<double> lat(n), lon(n);
    double lat0 = 0.0, lon0 = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const int cell = spectrum.channel_cells[i];
        const int b = cell / grid.n_gates();
        const int g = cell % grid.n_gates();
        lat[i] = grid.cell_lat(b, g);
        lon[i] = grid.cell_lon(b, g);
        lat0 += lat[i];
        lon0 += lon[i];
    }
    lat0 /= static_cast<double>(n);
    lon0 /= static_cast<double>(n);

    x_km.resize(n);
    y_km.resize(n);
    for (size_t i = 0; i < n; ++i) {
        geo::local_xy(lat[i], lon[i], lat0, lon0, x_km[i], y_km[i]);
    }
}

MusicResult MusicDetector::detect(const grid::Grid& grid, const spectral::SpectralResult& spectrum,
                                  double band_min_hz, double band_max_hz) const {
    const int nc = static_cast<int>(spectrum.channel_cells.size());
    if (nc < cfg_.min_channels) {
        throw InsufficientChannelsError(std::to_string(nc) + " channels, need " +
                                        std::to_string(cfg_.min_channels));
    }

    MusicResult result;
    result.kx_axis = wavenumber_axis(cfg_.kx_max, cfg_.dk);
    result.ky_axis = wavenumber_axis(cfg_.ky_max, cfg_.dk);
    channel_positions(grid, spectrum, result.channel_x_km, result.channel_y_km);

    const std::vector<int> bins =
        spectral::select_frequency_bins(spectrum, band_min_hz, band_max_hz, cfg_.num_freqs);
    if (bins.empty()) {
        throw DetectionFailed("no frequency bin inside the analysis band");
    }

    double max_power = 0.0;
    std::vector<double> bin_power;
    for (int b : bins) {
        bin_power.push_back(spectrum.spectra.col(b).cwiseAbs2().sum() / nc);
        max_power = std::max(max_power, bin_power.back());
    }

    for (size_t i = 0; i < bins.size(); ++i) {
        const int b = bins[i];
        const double f = spectrum.freqs_hz[static_cast<size_t>(b)];
        const double rel = max_power > 0.0 ? bin_power[i] / max_power : 0.0;
        try {
            Eigen::MatrixXcd cov = estimate_covariance(spectrum.spectra, b, cfg_.freq_avg_bins);
            BinResult br = detect_from_covariance(cov, result.channel_x_km, result.channel_y_km,
                                                  f, cfg_, rel);
            br.bin = b;
            result.signals.insert(result.signals.end(), br.signals.begin(), br.signals.end());
            result.bins.push_back(std::move(br));
        } catch (const DetectionFailed& e) {
            result.failed_bins.push_back({b, f, e.what()});
        }
    }

    if (result.bins.empty()) {
        throw DetectionFailed("all " + std::to_string(bins.size()) + " frequency bins failed: " +
                              result.failed_bins.front().reason);
    }

    rank_signals(result.signals, cfg_.max_signals);
    return result;
}

io::ArrayBundle to_bundle(const MusicResult& result) {
    io::ArrayBundle bundle;
    bundle.arrays["kx"] = io::from_vector(result.kx_axis);
    bundle.arrays["ky"] = io::from_vector(result.ky_axis);
    bundle.arrays["chan_x"] = io::from_vector(result.channel_x_km);
    bundle.arrays["chan_y"] = io::from_vector(result.channel_y_km);

    const long nbins = static_cast<long>(result.bins.size());
    const long nky = static_cast<long>(result.ky_axis.size());
    const long nkx = static_cast<long>(result.kx_axis.size());
    const long nch = static_cast<long>(result.channel_x_km.size());

    io::NdArray pseudo({nbins, nky, nkx}, {});
    io::NdArray eig({nbins, nch}, {});
    io::NdArray meta({nbins, 4}, {});
    for (const auto& b : result.bins) {
        pseudo.data.insert(pseudo.data.end(), b.pseudospectrum.data(),
                           b.pseudospectrum.data() + b.pseudospectrum.size());
        for (long i = 0; i < nch; ++i) {
            eig.data.push_back(i < b.eigenvalues.size() ? b.eigenvalues(i) : 0.0);
        }
        meta.data.insert(meta.data.end(), {static_cast<double>(b.bin), b.freq_hz,
                                           b.relative_power, static_cast<double>(b.signal_dim)});
    }
    bundle.arrays["pseudo"] = std::move(pseudo);
    bundle.arrays["eigvals"] = std::move(eig);
    bundle.arrays["bins"] = std::move(meta);

    io::NdArray sig({static_cast<long>(result.signals.size()), kSignalColumns}, {});
    for (const auto& s : result.signals) {
        sig.data.insert(sig.data.end(), {s.kx, s.ky, s.k, s.wavelength_km, s.azimuth_deg,
                                         s.freq_hz, s.period_s, s.velocity_mps, s.value,
                                         s.strength, static_cast<double>(s.rank)});
    }
    bundle.arrays["signals"] = std::move(sig);

    io::NdArray failed({static_cast<long>(result.failed_bins.size()), 2}, {});
    for (const auto& f : result.failed_bins) {
        failed.data.insert(failed.data.end(), {static_cast<double>(f.bin), f.freq_hz});
    }
    bundle.arrays["failed"] = std::move(failed);

    bundle.attrs.set("NBINS", static_cast<int>(nbins));
    bundle.attrs.set("NSIGNALS", static_cast<int>(result.signals.size()));
    bundle.attrs.set("NCHAN", static_cast<int>(nch));
    return bundle;
}

MusicResult music_from_bundle(const io::ArrayBundle& bundle) {
    MusicResult r;
    r.kx_axis = bundle.array("kx").data;
    r.ky_axis = bundle.array("ky").data;
    r.channel_x_km = bundle.array("chan_x").data;
    r.channel_y_km = bundle.array("chan_y").data;

    const long nky = static_cast<long>(r.ky_axis.size());
    const long nkx = static_cast<long>(r.kx_axis.size());
    const long nch = static_cast<long>(r.channel_x_km.size());
    const io::NdArray& pseudo = bundle.array("pseudo");
    const io::NdArray& eig = bundle.array("eigvals");
    const io::NdArray& meta = bundle.array("bins");
    const long nbins = meta.dim(0);
    if (pseudo.data.size() != static_cast<size_t>(nbins * nky * nkx) ||
        eig.data.size() != static_cast<size_t>(nbins * nch)) {
        throw StorageError("stored MUSIC arrays are inconsistent");
    }

    for (long i = 0; i < nbins; ++i) {
        BinResult b;
        b.bin = static_cast<int>(meta.data[static_cast<size_t>(i * 4)]);
        b.freq_hz = meta.data[static_cast<size_t>(i * 4 + 1)];
        b.relative_power = meta.data[static_cast<size_t>(i * 4 + 2)];
        b.signal_dim = static_cast<int>(meta.data[static_cast<size_t>(i * 4 + 3)]);
        b.pseudospectrum = Matrix2Dd(nky, nkx);
        std::copy(pseudo.data.begin() + i * nky * nkx, pseudo.data.begin() + (i + 1) * nky * nkx,
                  b.pseudospectrum.data());
        b.eigenvalues = Eigen::VectorXd(nch);
        for (long j = 0; j < nch; ++j) b.eigenvalues(j) = eig.data[static_cast<size_t>(i * nch + j)];
        r.bins.push_back(std::move(b));
    }

    const io::NdArray& sig = bundle.array("signals");
    for (long i = 0; i < sig.dim(0); ++i) {
        const double* v = sig.data.data() + i * kSignalColumns;
        DetectedSignal s;
        s.kx = v[0];
        s.ky = v[1];
        s.k = v[2];
        s.wavelength_km = v[3];
        s.azimuth_deg = v[4];
        s.freq_hz = v[5];
        s.period_s = v[6];
        s.velocity_mps = v[7];
        s.value = v[8];
        s.strength = v[9];
        s.rank = static_cast<int>(v[10]);
        r.signals.push_back(s);
    }

    const io::NdArray& failed = bundle.array("failed");
    for (long i = 0; i < failed.dim(0); ++i) {
        r.failed_bins.push_back({static_cast<int>(failed.data[static_cast<size_t>(i * 2)]),
                                 failed.data[static_cast<size_t>(i * 2 + 1)], ""});
    }
    return r;
}

} // namespace tid_music::music
