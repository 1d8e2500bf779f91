#ifndef STATKIT_ACCUMULATOR_HPP
#define STATKIT_ACCUMULATOR_HPP

/**
 * @file accumulator.hpp
 * @brief Welford one-pass mean and variance
 *
 * Reference: Welford, B.P. (1962). "Note on a method for calculating corrected
 * sums of squares and products." Technometrics 4(3), 419-420.
 *
 * Each insertion updates:
 *   n    <- n + 1
 *   mean <- mean + (x - mean) / n
 *   M2   <- M2 + (x - mean_old)(x - mean_new)
 *
 * The sample variance M2 / (n - 1) never forms the large intermediate sums
 * of the naive Σx² - (Σx)²/n formula.
 */

#include <cstddef>
#include <string>
#include <vector>

namespace statkit::core {

/**
 * @brief One-pass result: mean, sample variance and count
 */
struct WelfordResult {
    double mean;       ///< Arithmetic mean (NaN when count == 0)
    double variance;   ///< Sample variance, ddof = 1 (NaN when count < 2)
    size_t count;      ///< Number of observations

    std::string to_string() const {
        return "WelfordResult(mean=" + std::to_string(mean) +
               ", variance=" + std::to_string(variance) +
               ", count=" + std::to_string(count) + ")";
    }
};

/**
 * @brief Incremental mean/variance accumulator
 */
class Accumulator {
public:
    Accumulator() = default;

    /// Insert one observation
    void add(double x) noexcept {
        ++count_;
        const double delta = x - mean_;
        mean_ += delta / static_cast<double>(count_);
        m2_ += delta * (x - mean_);
    }

    /**
     * @brief Combine another accumulator into this one
     *
     * Uses the pairwise update of Chan, Golub & LeVeque (1979) so that
     * partial results computed on disjoint chunks can be merged exactly.
     */
    void merge(const Accumulator& other) noexcept;

    /// Forget all observations
    void reset() noexcept {
        count_ = 0;
        mean_ = 0.0;
        m2_ = 0.0;
    }

    size_t count() const noexcept { return count_; }

    /// Running mean, NaN if no observation was added
    double mean() const noexcept;

    /// Sample variance M2 / (n - 1), NaN if fewer than 2 observations
    double variance() const noexcept;

    /// Sample standard deviation
    double std_dev() const noexcept;

    /// Sum of squared deviations from the mean
    double m2() const noexcept { return m2_; }

    WelfordResult result() const noexcept { return {mean(), variance(), count_}; }

private:
    size_t count_ = 0;
    double mean_ = 0.0;
    double m2_ = 0.0;
};

/**
 * @brief Welford mean/variance of a whole sequence in one pass
 * @param data Input sequence
 * @return (mean, sample variance, count)
 */
WelfordResult welford(const std::vector<double>& data);

} // namespace statkit::core

#endif // STATKIT_ACCUMULATOR_HPP
