#ifndef STATKIT_TRANSFORMS_HPP
#define STATKIT_TRANSFORMS_HPP

/**
 * @file transforms.hpp
 * @brief Sequence transforms and distribution estimates
 *
 * Provides:
 * - Lagged differences and percentage changes
 * - Cumulative sum and mean
 * - Empirical CDF
 * - Gaussian kernel density estimate on an evenly spaced grid
 */

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace statkit::stats {

/**
 * @brief Empirical CDF: sorted values with cumulative probabilities (i+1)/n
 */
struct EcdfResult {
    std::vector<double> values;         ///< Data sorted ascending
    std::vector<double> probabilities;  ///< Non-decreasing, last element exactly 1

    std::string to_string() const {
        return "EcdfResult(n=" + std::to_string(values.size()) + ")";
    }
};

/**
 * @brief Gaussian kernel density evaluated on a grid
 */
struct KdeResult {
    std::vector<double> grid;     ///< Evenly spaced evaluation points
    std::vector<double> density;  ///< Estimated density at each grid point
    double bandwidth;             ///< Kernel bandwidth actually used

    std::string to_string() const {
        return "KdeResult(n_points=" + std::to_string(grid.size()) +
               ", bandwidth=" + std::to_string(bandwidth) + ")";
    }
};

/**
 * @brief Lagged difference x[i] - x[i - periods]
 *
 * @return Same-length sequence, NaN for i < periods
 * @throws std::invalid_argument if periods is 0
 */
std::vector<double> diff(const std::vector<double>& data, size_t periods = 1);

/**
 * @brief Relative change x[i] / x[i - periods] - 1
 *
 * NaN for i < periods and wherever the result is not finite (zero base).
 *
 * @throws std::invalid_argument if periods is 0
 */
std::vector<double> pct_change(const std::vector<double>& data, size_t periods = 1);

/// Prefix sums
std::vector<double> cumsum(const std::vector<double>& data);

/// Prefix means: cumsum[i] / (i + 1)
std::vector<double> cummean(const std::vector<double>& data);

/**
 * @brief Empirical cumulative distribution function
 * @throws std::invalid_argument if data is empty
 */
EcdfResult ecdf(const std::vector<double>& data);

/**
 * @brief Gaussian kernel density estimate
 *
 * The grid spans [min - 3h, max + 3h] in n_points evenly spaced steps and
 * the density is the average of N(x_i, h^2) densities, so it integrates to
 * approximately one over the grid.
 *
 * Without an explicit bandwidth, Silverman's rule is used:
 *   h = 0.9 * min(sd, IQR / 1.34) * n^(-1/5)
 * falling back to sd when the IQR is zero, and to 1 for a constant sample.
 *
 * @param data Sample
 * @param n_points Number of grid points (>= 2)
 * @param bandwidth Kernel bandwidth (finite, > 0), or std::nullopt for the default
 * @throws std::invalid_argument if data is empty, n_points < 2 or bandwidth is not finite and positive
 */
KdeResult kde_gaussian(const std::vector<double>& data, size_t n_points = 256,
                       std::optional<double> bandwidth = std::nullopt);

/**
 * @brief Silverman's rule-of-thumb bandwidth for a Gaussian kernel
 * @throws std::invalid_argument if data is empty
 */
double silverman_bandwidth(const std::vector<double>& data);

} // namespace statkit::stats

#endif // STATKIT_TRANSFORMS_HPP
