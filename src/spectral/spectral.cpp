#include "tid_music/spectral/spectral.hpp"
#include "tid_music/core/errors.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace tid_music::spectral {

namespace {

constexpr double kPi = 3.14159265358979323846;

void hanning(std::vector<double>& series) {
    const size_t n = series.size();
    if (n < 2) return;
    for (size_t i = 0; i < n; ++i) {
        series[i] *= 0.5 - 0.5 * std::cos(2.0 * kPi * static_cast<double>(i) /
                                          static_cast<double>(n - 1));
    }
}

void highpass(std::vector<double>& series, const config::SpectralConfig& cfg, double dt) {
    const int n = static_cast<int>(series.size());
    if (n < 3) return;
    int taps = std::min(cfg.filter_numtaps, n % 2 ? n : n - 1);
    if (taps < 3) return;

    std::vector<double> kernel = highpass_kernel(taps, cfg.filter_cutoff_hz, 1.0 / dt);
    cv::Mat src(1, n, CV_64F, series.data());
    cv::Mat k(1, taps, CV_64F, kernel.data());
    cv::Mat dst;
    cv::filter2D(src, dst, CV_64F, k, cv::Point(-1, -1), 0.0, cv::BORDER_REFLECT_101);
    std::copy(dst.ptr<double>(0), dst.ptr<double>(0) + n, series.begin());
}

} // namespace

std::vector<double> highpass_kernel(int numtaps, double cutoff_hz, double sample_rate_hz) {
    if (numtaps < 3 || numtaps % 2 == 0) {
        throw ValidationError("high-pass filter needs an odd tap count >= 3");
    }
    const double fc = cutoff_hz / sample_rate_hz;  // cycles per sample
    if (fc <= 0.0 || fc >= 0.5) {
        throw ValidationError("high-pass cutoff must lie between 0 and Nyquist");
    }

    const int m = numtaps / 2;
    std::vector<double> h(static_cast<size_t>(numtaps));
    double sum = 0.0;
    for (int i = 0; i < numtaps; ++i) {
        const double x = static_cast<double>(i - m);
        const double sinc = (i == m) ? 2.0 * fc : std::sin(2.0 * kPi * fc * x) / (kPi * x);
        const double w = 0.54 - 0.46 * std::cos(2.0 * kPi * i / (numtaps - 1));
        h[static_cast<size_t>(i)] = sinc * w;
        sum += h[static_cast<size_t>(i)];
    }
    for (auto& v : h) v = -v / sum;
    h[static_cast<size_t>(m)] += 1.0;
    return h;
}

void detrend_linear(std::vector<double>& series) {
    const size_t n = series.size();
    if (n == 0) return;
    if (n == 1) {
        series[0] = 0.0;
        return;
    }
    const double xm = 0.5 * static_cast<double>(n - 1);
    const double ym = std::accumulate(series.begin(), series.end(), 0.0) / static_cast<double>(n);
    double sxy = 0.0, sxx = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double dx = static_cast<double>(i) - xm;
        sxy += dx * (series[i] - ym);
        sxx += dx * dx;
    }
    const double slope = sxx > 0.0 ? sxy / sxx : 0.0;
    for (size_t i = 0; i < n; ++i) {
        series[i] -= ym + slope * (static_cast<double>(i) - xm);
    }
}

SpectralResult compute_spectrum(const grid::Grid& grid, const config::SpectralConfig& cfg) {
    SpectralResult result;
    const int nt = grid.n_times();
    result.n_times = nt;
    result.time_step_s = grid.time_step_s;
    if (nt == 0 || grid.time_step_s <= 0.0) {
        throw InsufficientDataError("grid has no time axis");
    }

    const int nf = nt / 2 + 1;
    for (int k = 0; k < nf; ++k) {
        result.freqs_hz.push_back(static_cast<double>(k) / (nt * grid.time_step_s));
    }

    for (int cell = 0; cell < grid.n_cells(); ++cell) {
        if (grid.cell_complete(cell)) result.channel_cells.push_back(cell);
    }
    const int nc = static_cast<int>(result.channel_cells.size());
    result.spectra = ComplexMatrix2D::Zero(nc, nf);
    result.integrated_psd.assign(static_cast<size_t>(nc), 0.0);
    result.n_valid = nc;
    if (nc == 0) {
        return result;
    }

    const bool filter = cfg.filter_cutoff_hz > 0.0;
    cv::Mat series(nc, nt, CV_64F);
    for (int c = 0; c < nc; ++c) {
        const int cell = result.channel_cells[static_cast<size_t>(c)];
        std::vector<double> x(grid.power.row(cell).data(), grid.power.row(cell).data() + nt);
        if (cfg.detrend) {
            detrend_linear(x);
        } else {
            const double mean = std::accumulate(x.begin(), x.end(), 0.0) / nt;
            for (auto& v : x) v -= mean;
        }
        if (filter) highpass(x, cfg, grid.time_step_s);
        if (cfg.window == "hanning") hanning(x);
        std::copy(x.begin(), x.end(), series.ptr<double>(c));
    }

    cv::Mat F;
    cv::dft(series, F, cv::DFT_ROWS | cv::DFT_COMPLEX_OUTPUT);

    const double df = result.freq_resolution_hz();
    const double scale = 2.0 * grid.time_step_s / static_cast<double>(nt);
    for (int c = 0; c < nc; ++c) {
        const cv::Vec2d* row = F.ptr<cv::Vec2d>(c);
        double ipsd = 0.0;
        for (int k = 0; k < nf; ++k) {
            const std::complex<double> X(row[k][0], row[k][1]);
            result.spectra(c, k) = X;
            const double f = result.freqs_hz[static_cast<size_t>(k)];
            if (f >= cfg.band_min_hz && f <= cfg.band_max_hz) {
                ipsd += scale * std::norm(X) * df;
            }
        }
        result.integrated_psd[static_cast<size_t>(c)] = ipsd;
        result.psd_sum += ipsd;
        result.psd_max = std::max(result.psd_max, ipsd);
    }
    result.psd_mean = result.psd_sum / nc;
    return result;
}

std::vector<int> select_frequency_bins(const SpectralResult& result, double band_min_hz,
                                       double band_max_hz, int count) {
    std::vector<std::pair<double, int>> ranked;
    const int nc = static_cast<int>(result.spectra.rows());
    if (nc == 0) return {};

    for (size_t k = 1; k < result.freqs_hz.size(); ++k) {
        const double f = result.freqs_hz[k];
        if (f < band_min_hz || f > band_max_hz) continue;
        const double mean_power =
            result.spectra.col(static_cast<Eigen::Index>(k)).cwiseAbs2().sum() / nc;
        ranked.emplace_back(mean_power, static_cast<int>(k));
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<int> bins;
    for (const auto& [power, k] : ranked) {
        if (static_cast<int>(bins.size()) >= count) break;
        bins.push_back(k);
    }
    return bins;
}

io::ArrayBundle to_bundle(const SpectralResult& result) {
    io::ArrayBundle bundle;
    const long nc = static_cast<long>(result.spectra.rows());
    const long nf = static_cast<long>(result.spectra.cols());

    io::NdArray re({nc, nf}, {});
    io::NdArray im({nc, nf}, {});
    re.data.reserve(static_cast<size_t>(nc * nf));
    im.data.reserve(static_cast<size_t>(nc * nf));
    for (long c = 0; c < nc; ++c) {
        for (long k = 0; k < nf; ++k) {
            re.data.push_back(result.spectra(c, k).real());
            im.data.push_back(result.spectra(c, k).imag());
        }
    }
    bundle.arrays["spec_re"] = std::move(re);
    bundle.arrays["spec_im"] = std::move(im);
    bundle.arrays["freqs"] = io::from_vector(result.freqs_hz);
    bundle.arrays["channels"] = io::from_vector(
        std::vector<double>(result.channel_cells.begin(), result.channel_cells.end()));
    bundle.arrays["ipsd"] = io::from_vector(result.integrated_psd);

    bundle.attrs.set("DT", result.time_step_s);
    bundle.attrs.set("NTIMES", result.n_times);
    bundle.attrs.set("NVALID", result.n_valid);
    bundle.attrs.set("PSDSUM", result.psd_sum);
    bundle.attrs.set("PSDMEAN", result.psd_mean);
    bundle.attrs.set("PSDMAX", result.psd_max);
    return bundle;
}

SpectralResult spectrum_from_bundle(const io::ArrayBundle& bundle) {
    SpectralResult r;
    r.time_step_s = bundle.attrs.get_double("DT").value_or(0.0);
    r.n_times = bundle.attrs.get_int("NTIMES").value_or(0);
    r.n_valid = bundle.attrs.get_int("NVALID").value_or(0);
    r.psd_sum = bundle.attrs.get_double("PSDSUM").value_or(0.0);
    r.psd_mean = bundle.attrs.get_double("PSDMEAN").value_or(0.0);
    r.psd_max = bundle.attrs.get_double("PSDMAX").value_or(0.0);

    r.freqs_hz = bundle.array("freqs").data;
    for (double c : bundle.array("channels").data) r.channel_cells.push_back(static_cast<int>(c));
    r.integrated_psd = bundle.array("ipsd").data;

    const io::NdArray& re = bundle.array("spec_re");
    const io::NdArray& im = bundle.array("spec_im");
    const long nc = re.dim(0);
    const long nf = re.shape.size() > 1 ? re.dim(1) : 0;
    if (im.shape != re.shape || static_cast<size_t>(nc) != r.channel_cells.size()) {
        throw StorageError("stored spectrum arrays are inconsistent");
    }
    r.spectra = ComplexMatrix2D(nc, nf);
    for (long c = 0; c < nc; ++c) {
        for (long k = 0; k < nf; ++k) {
            const size_t i = static_cast<size_t>(c * nf + k);
            r.spectra(c, k) = std::complex<double>(re.data[i], im.data[i]);
        }
    }
    return r;
}

} // namespace tid_music::spectral
