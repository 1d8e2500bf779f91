#ifndef STATKIT_DESCRIPTIVE_HPP
#define STATKIT_DESCRIPTIVE_HPP

/**
 * @file descriptive.hpp
 * @brief Scalar reductions over numeric sequences
 *
 * Conventions:
 * - Variance and standard deviation use ddof = 1 (Bessel's correction)
 * - Quantiles interpolate linearly at position q * (n - 1) of the sorted data
 * - Functions without the _nan suffix expect NaN-free input
 * - The _nan variants drop NaN and return NaN when too few values remain
 */

#include <Eigen/Dense>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace statkit::stats {

/**
 * @brief Lower quartile, upper quartile and their difference
 */
struct QuartileResult {
    double q1;   ///< 25th percentile
    double q3;   ///< 75th percentile
    double iqr;  ///< q3 - q1

    std::string to_string() const {
        return "QuartileResult(q1=" + std::to_string(q1) + ", q3=" + std::to_string(q3) +
               ", iqr=" + std::to_string(iqr) + ")";
    }
};

/**
 * @brief Compute the mean of a sequence
 * @param data Input sequence
 * @return Arithmetic mean
 * @throws std::invalid_argument if data is empty
 */
double mean(const std::vector<double>& data);

/**
 * @brief Sample variance (n - 1 denominator), computed with core::Accumulator
 * @param data Input sequence
 * @return Variance, NaN for a single observation
 * @throws std::invalid_argument if data is empty
 */
double var(const std::vector<double>& data);

/**
 * @brief Sample standard deviation
 * @throws std::invalid_argument if data is empty
 */
double std_dev(const std::vector<double>& data);

/**
 * @brief Standardize every element: (x - mean) / std
 *
 * All outputs are NaN when the standard deviation is zero or undefined.
 */
std::vector<double> zscore(const std::vector<double>& data);

/// Mean of the non-NaN values; NaN if none
double mean_nan(const std::vector<double>& data);

/// Sample variance of the non-NaN values; NaN if fewer than two
double var_nan(const std::vector<double>& data);

/// Sample standard deviation of the non-NaN values
double std_nan(const std::vector<double>& data);

/**
 * @brief Quantile of data already sorted ascending
 *
 * q <= 0 returns the minimum, q >= 1 the maximum; otherwise linear
 * interpolation between the order statistics around q * (n - 1).
 *
 * @return Quantile value, NaN for an empty sequence
 */
double quantile_from_sorted(const std::vector<double>& sorted, double q);

/**
 * @brief Quantile with q in [0, 1]
 * @throws std::invalid_argument if data is empty or q is outside [0, 1]
 */
double quantile(const std::vector<double>& data, double q);

/**
 * @brief Percentile with q in [0, 100]
 *
 * Equivalent to quantile(data, q / 100).
 *
 * @throws std::invalid_argument if data is empty or q is outside [0, 100]
 */
double percentile(const std::vector<double>& data, double q);

/// Median (50th percentile)
double median(const std::vector<double>& data);

/**
 * @brief Interquartile range
 * @return (Q1, Q3, Q3 - Q1)
 */
QuartileResult iqr(const std::vector<double>& data);

/**
 * @brief Median absolute deviation: median(|x - median(x)|)
 *
 * No consistency constant is applied.
 */
double mad(const std::vector<double>& data);

/**
 * @brief Symmetrically trimmed mean
 *
 * Sorts the data and discards floor(n * proportion / 2) elements from each
 * tail before averaging the remainder.
 *
 * @param data Input sequence
 * @param proportion Total fraction to cut, in [0, 1]
 * @return Trimmed mean, NaN if trimming leaves nothing
 */
double trimmed_mean(const std::vector<double>& data, double proportion);

/**
 * @brief Means along one matrix axis
 *
 * @param data Matrix (rows = observations, columns = variables)
 * @param axis 0 for one mean per column, 1 for one mean per row
 * @throws std::invalid_argument if axis is not 0 or 1, or the axis is empty
 */
Eigen::VectorXd mean_axis(const Eigen::MatrixXd& data, int axis);

/// -1, 0 or +1 per element (0 for NaN)
std::vector<int8_t> sign_mask(const std::vector<double>& data);

/**
 * @brief Subtract the mean and report the sign of each residual
 * @return (x - mean, sign_mask(x - mean))
 */
std::pair<std::vector<double>, std::vector<int8_t>> demean_with_signs(
    const std::vector<double>& data);

/// Sequence of n NaN values
std::vector<double> pad_nan(size_t n);

} // namespace statkit::stats

#endif // STATKIT_DESCRIPTIVE_HPP
