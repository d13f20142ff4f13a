#pragma once

#include "tid_music/config/configuration.hpp"
#include "tid_music/core/types.hpp"

#include <string>
#include <vector>

namespace tid_music::classify {

// Threshold fixed by the first phase and recorded beside every label.
struct Threshold {
    double value = 0.0;
    std::string mode;         // percentile | absolute
    double percentile = 0.0;  // meaningful in percentile mode
    size_t batch_size = 0;
};

// Phase one: threshold from the batch distribution of integrated PSD sums.
// Throws InsufficientDataError in percentile mode for an empty batch.
Threshold compute_threshold(const std::vector<double>& psd_sums,
                            const config::ClassifierConfig& cfg);

// Phase two: disturbed when the value exceeds the threshold.
Category label(double psd_sum, const Threshold& threshold);

std::vector<Category> label_all(const std::vector<double>& psd_sums, const Threshold& threshold);

} // namespace tid_music::classify
