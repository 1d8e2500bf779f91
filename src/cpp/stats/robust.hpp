#ifndef STATKIT_ROBUST_HPP
#define STATKIT_ROBUST_HPP

/**
 * @file robust.hpp
 * @brief Scaling, clipping, binning and outlier flags
 *
 * All functions expect NaN-free input.
 */

#include <string>
#include <vector>

namespace statkit::stats {

/**
 * @brief Scaled sequence together with the location/spread used to scale it
 *
 * For min-max scaling center = min and spread = max.
 * For robust scaling center = median and spread = MAD.
 */
struct ScaleResult {
    std::vector<double> scaled;  ///< Transformed sequence
    double center;               ///< Location statistic
    double spread;               ///< Scale statistic

    std::string to_string() const {
        return "ScaleResult(n=" + std::to_string(scaled.size()) +
               ", center=" + std::to_string(center) + ", spread=" + std::to_string(spread) + ")";
    }
};

/**
 * @brief Min-max scaling to [0, 1]: (x - min) / (max - min)
 *
 * Every scaled value is NaN when max == min.
 *
 * @return Scaled values with center = min, spread = max
 * @throws std::invalid_argument if data is empty
 */
ScaleResult minmax_scale(const std::vector<double>& data);

/**
 * @brief Robust scaling: (x - median) / (MAD * scale_factor)
 *
 * When the MAD is exactly zero the denominator becomes 1e-12 instead,
 * so the result stays finite.
 *
 * @param data Input sequence
 * @param scale_factor Multiplier applied to the MAD (1.4826 makes it
 *        consistent with the standard deviation under normality)
 * @return Scaled values with center = median, spread = MAD
 */
ScaleResult robust_scale(const std::vector<double>& data, double scale_factor = 1.0);

/**
 * @brief Clip values to the [lower_q, upper_q] quantile range
 * @throws std::invalid_argument unless 0 <= lower_q <= upper_q <= 1
 */
std::vector<double> winsorize(const std::vector<double>& data, double lower_q, double upper_q);

/**
 * @brief Assign each element to one of n_bins equal-frequency bins
 *
 * Bin edges are the quantiles k / n_bins, k = 0..n_bins. Element x goes to
 * bin k when edges[k] < x <= edges[k+1]; a value equal to an inner edge
 * therefore lands in the lower bin, and the minimum goes to bin 0.
 *
 * @return Bin index in [0, n_bins - 1] per element
 * @throws std::invalid_argument if data is empty or n_bins is 0
 */
std::vector<int> quantile_bins(const std::vector<double>& data, size_t n_bins);

/**
 * @brief Tukey fences: flag x < Q1 - k*IQR or x > Q3 + k*IQR
 */
std::vector<bool> iqr_outliers(const std::vector<double>& data, double k = 1.5);

/**
 * @brief Flag |x - mean| / std > threshold (sample std)
 *
 * Nothing is flagged when the standard deviation is zero or undefined.
 */
std::vector<bool> zscore_outliers(const std::vector<double>& data, double threshold = 3.0);

} // namespace statkit::stats

#endif // STATKIT_ROBUST_HPP
