#ifndef STATKIT_ROLLING_HPP
#define STATKIT_ROLLING_HPP

/**
 * @file rolling.hpp
 * @brief Causal sliding-window statistics
 *
 * For window size w the output has the input's length; position i holds the
 * statistic of [i - w + 1, i] and positions i < w - 1 are NaN. Each step costs
 * O(1) regardless of w. Standard deviations use ddof = 1.
 *
 * The _nan variants skip missing observations inside each window and emit
 * NaN when fewer than min_periods valid values remain.
 *
 * Invalid arguments (window of 0 or larger than the input) throw
 * std::invalid_argument.
 */

#include <Eigen/Dense>
#include <cstddef>
#include <string>
#include <vector>

namespace statkit::stats {

/**
 * @brief Options for the NaN-aware rolling statistics
 *
 * min_periods is the minimum number of valid observations a window needs.
 * 0 selects the statistic's default: 1 for means, 2 for variance-based
 * statistics. Requests below a statistic's hard minimum are raised to it.
 */
struct RollingOptions {
    size_t min_periods = 0;  ///< Minimum valid observations per window (0 = default)

    RollingOptions() = default;
    explicit RollingOptions(size_t min_periods_) : min_periods(min_periods_) {}
};

/**
 * @brief Rolling mean and standard deviation computed in one pass
 */
struct MeanStdResult {
    std::vector<double> mean;  ///< Rolling mean
    std::vector<double> std;   ///< Rolling standard deviation

    std::string to_string() const {
        return "MeanStdResult(n=" + std::to_string(mean.size()) + ")";
    }
};

/**
 * @brief Column-wise rolling mean and standard deviation of a matrix
 */
struct MatrixMeanStdResult {
    Eigen::MatrixXd mean;  ///< Same shape as the input
    Eigen::MatrixXd std;   ///< Same shape as the input
};

// ============== Sequences ==============

std::vector<double> rolling_mean(const std::vector<double>& data, size_t window);

std::vector<double> rolling_var(const std::vector<double>& data, size_t window);

std::vector<double> rolling_std(const std::vector<double>& data, size_t window);

/**
 * @brief Z-score of the newest element in each window
 *
 * (x[i] - rolling_mean[i]) / rolling_std[i]; NaN where the window is constant.
 */
std::vector<double> rolling_zscore(const std::vector<double>& data, size_t window);

/// Rolling mean and standard deviation sharing one sliding pass
MeanStdResult rolling_mean_std(const std::vector<double>& data, size_t window);

/**
 * @brief Exponentially weighted moving average without bias adjustment
 *
 * out[0] = x[0], out[i] = alpha * x[i] + (1 - alpha) * out[i - 1]
 *
 * @param alpha Smoothing factor in (0, 1]
 * @throws std::invalid_argument if data is empty or alpha is outside (0, 1]
 */
std::vector<double> ewma(const std::vector<double>& data, double alpha);

// ============== NaN-aware sequences ==============

std::vector<double> rolling_mean_nan(const std::vector<double>& data, size_t window,
                                     const RollingOptions& options = RollingOptions());

std::vector<double> rolling_var_nan(const std::vector<double>& data, size_t window,
                                    const RollingOptions& options = RollingOptions());

std::vector<double> rolling_std_nan(const std::vector<double>& data, size_t window,
                                    const RollingOptions& options = RollingOptions());

/**
 * @brief NaN-aware rolling z-score of the newest element
 *
 * NaN where x[i] itself is missing, where the window holds fewer than
 * min_periods valid values, or where its valid values are all equal.
 */
std::vector<double> rolling_zscore_nan(const std::vector<double>& data, size_t window,
                                       const RollingOptions& options = RollingOptions());

// ============== Matrices (independent per column) ==============

Eigen::MatrixXd rolling_mean_axis0(const Eigen::MatrixXd& data, size_t window);

Eigen::MatrixXd rolling_var_axis0(const Eigen::MatrixXd& data, size_t window);

Eigen::MatrixXd rolling_std_axis0(const Eigen::MatrixXd& data, size_t window);

MatrixMeanStdResult rolling_mean_std_axis0(const Eigen::MatrixXd& data, size_t window);

} // namespace statkit::stats

#endif // STATKIT_ROLLING_HPP
