#pragma once

#include "tid_music/config/configuration.hpp"
#include "tid_music/grid/grid.hpp"
#include "tid_music/io/fits_io.hpp"

#include <vector>

namespace tid_music::spectral {

// Temporal spectra of the complete cells of a grid.
struct SpectralResult {
    std::vector<double> freqs_hz;     // one-sided, k / (N dt), k = 0..N/2
    std::vector<int> channel_cells;   // grid cell index per spectrum row
    ComplexMatrix2D spectra;          // channels x freqs
    std::vector<double> integrated_psd;  // per channel, over the band
    double time_step_s = 0.0;
    int n_times = 0;

    double psd_sum = 0.0;
    double psd_mean = 0.0;
    double psd_max = 0.0;
    int n_valid = 0;

    double freq_resolution_hz() const {
        return n_times > 0 && time_step_s > 0.0 ? 1.0 / (n_times * time_step_s) : 0.0;
    }
};

// Hamming-windowed sinc high-pass FIR (spectral inversion of the low-pass).
std::vector<double> highpass_kernel(int numtaps, double cutoff_hz, double sample_rate_hz);

// Removes the least-squares line.
void detrend_linear(std::vector<double>& series);

SpectralResult compute_spectrum(const grid::Grid& grid, const config::SpectralConfig& cfg);

// Indices of the `count` in-band bins with the highest mean |X|^2 across
// channels, strongest first. Bin 0 is never selected.
std::vector<int> select_frequency_bins(const SpectralResult& result, double band_min_hz,
                                       double band_max_hz, int count);

io::ArrayBundle to_bundle(const SpectralResult& result);
SpectralResult spectrum_from_bundle(const io::ArrayBundle& bundle);

} // namespace tid_music::spectral
