#pragma once
#include <cstddef>
#include <vector>

struct DespikeConfig {
    size_t window_size = 11;
    double n_sigmas = 5.0;
};

/**
 * @brief Hampel-style outlier replacement.
 *
 * Each sample is compared against the median of a centered window (clipped at
 * the series ends). Samples deviating by more than n_sigmas * 1.4826 * MAD are
 * replaced by that median in the output. A window with MAD == 0 never replaces.
 */
class DespikeFilter {
public:
    static constexpr double MAD_TO_SIGMA = 1.4826;

    explicit DespikeFilter(const DespikeConfig& config = DespikeConfig());

    // Returns the filtered copy; the input is left untouched
    std::vector<double> apply(const std::vector<double>& values) const;

    // Median of the values; mean of the two middle values for even counts. 0.0 when empty.
    static double median(std::vector<double> values);

    const DespikeConfig& config() const { return config_; }

private:
    DespikeConfig config_;
};
