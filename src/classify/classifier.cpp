#include "tid_music/classify/classifier.hpp"
#include "tid_music/core/errors.hpp"
#include "tid_music/core/utils.hpp"

#include <cmath>

namespace tid_music::classify {

Threshold compute_threshold(const std::vector<double>& psd_sums,
                            const config::ClassifierConfig& cfg) {
    Threshold t;
    t.mode = cfg.mode;
    t.batch_size = psd_sums.size();

    if (cfg.mode == "absolute") {
        t.value = cfg.absolute_threshold;
        return t;
    }

    std::vector<double> finite;
    finite.reserve(psd_sums.size());
    for (double v : psd_sums) {
        if (std::isfinite(v)) finite.push_back(v);
    }
    if (finite.empty()) {
        throw InsufficientDataError("cannot classify an empty batch");
    }
    t.percentile = cfg.percentile;
    t.value = core::compute_percentile(finite, cfg.percentile);
    return t;
}

Category label(double psd_sum, const Threshold& threshold) {
    return psd_sum > threshold.value ? Category::DISTURBED : Category::QUIET;
}

std::vector<Category> label_all(const std::vector<double>& psd_sums, const Threshold& threshold) {
    std::vector<Category> out;
    out.reserve(psd_sums.size());
    for (double v : psd_sums) out.push_back(label(v, threshold));
    return out;
}

} // namespace tid_music::classify
