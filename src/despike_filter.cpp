#include "../include/despike_filter.hpp"
#include <algorithm>
#include <cmath>

DespikeFilter::DespikeFilter(const DespikeConfig& config) : config_(config) {
    if (config_.window_size < 1) config_.window_size = 1;
}

double DespikeFilter::median(std::vector<double> values) {
    if (values.empty()) return 0.0;
    size_t mid = values.size() / 2;
    std::nth_element(values.begin(), values.begin() + mid, values.end());
    double upper = values[mid];
    if (values.size() % 2 == 1) return upper;
    double lower = *std::max_element(values.begin(), values.begin() + mid);
    return (lower + upper) / 2.0;
}

std::vector<double> DespikeFilter::apply(const std::vector<double>& values) const {
    std::vector<double> filtered(values);
    const size_t n = values.size();
    const size_t half_w = config_.window_size / 2;

    std::vector<double> window;
    std::vector<double> deviations;
    window.reserve(config_.window_size);
    deviations.reserve(config_.window_size);

    for (size_t i = 0; i < n; ++i) {
        size_t start = (i > half_w) ? i - half_w : 0;
        size_t end = std::min(n, i + half_w + 1);

        window.assign(values.begin() + start, values.begin() + end);
        double med = median(window);

        deviations.clear();
        for (double v : window) deviations.push_back(std::fabs(v - med));
        double mad = median(deviations);
        if (mad == 0.0) continue;

        double threshold = config_.n_sigmas * MAD_TO_SIGMA * mad;
        if (std::fabs(values[i] - med) > threshold) {
            filtered[i] = med;
        }
    }
    return filtered;
}
