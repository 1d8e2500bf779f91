#ifndef STATKIT_PAIRWISE_HPP
#define STATKIT_PAIRWISE_HPP

/**
 * @file pairwise.hpp
 * @brief Covariance and Pearson correlation for pairs, matrices and windows
 *
 * All covariances use ddof = 1. Correlations are clamped to [-1, 1] and are
 * NaN when either side has zero variance.
 *
 * Matrix inputs hold one variable per column and one observation per row.
 */

#include <Eigen/Dense>
#include <cstddef>
#include <vector>

#include "stats/rolling.hpp"

namespace statkit::stats {

// ============== Pairs ==============

/**
 * @brief Sample covariance of two equal-length sequences (two-pass)
 * @return Covariance, NaN with fewer than two observations
 * @throws std::invalid_argument if the inputs are empty or differ in length
 */
double cov(const std::vector<double>& x, const std::vector<double>& y);

/**
 * @brief Pearson correlation (two-pass)
 * @return Correlation in [-1, 1], NaN if either sequence is constant
 * @throws std::invalid_argument if the inputs are empty or differ in length
 */
double corr(const std::vector<double>& x, const std::vector<double>& y);

/// Covariance over the indices where both x[i] and y[i] are non-NaN
double cov_nan(const std::vector<double>& x, const std::vector<double>& y);

/// Correlation over the indices where both x[i] and y[i] are non-NaN
double corr_nan(const std::vector<double>& x, const std::vector<double>& y);

// ============== Matrices ==============

/**
 * @brief Sample covariance matrix of the columns (p x p, symmetric)
 * @throws std::invalid_argument if the matrix has no rows
 */
Eigen::MatrixXd cov_matrix(const Eigen::MatrixXd& data);

/**
 * @brief Correlation matrix of the columns
 *
 * The diagonal is exactly 1. A constant column yields NaN across its row
 * and column, diagonal included.
 */
Eigen::MatrixXd corr_matrix(const Eigen::MatrixXd& data);

/**
 * @brief Covariance matrix using pairwise-complete observations
 *
 * Entry (i, j) is cov_nan of columns i and j. Column pairs are evaluated in
 * parallel when OpenMP is available.
 */
Eigen::MatrixXd cov_matrix_nan(const Eigen::MatrixXd& data);

/**
 * @brief Correlation matrix using pairwise-complete observations
 *
 * The diagonal is 1 for every column with at least two distinct valid values.
 */
Eigen::MatrixXd corr_matrix_nan(const Eigen::MatrixXd& data);

// ============== Rolling ==============

std::vector<double> rolling_cov(const std::vector<double>& x, const std::vector<double>& y,
                                size_t window);

std::vector<double> rolling_corr(const std::vector<double>& x, const std::vector<double>& y,
                                 size_t window);

/**
 * @brief Rolling covariance over the valid pairs of each window
 *
 * A pair counts only when both members are non-NaN. Windows with fewer than
 * max(2, min_periods) valid pairs are NaN.
 */
std::vector<double> rolling_cov_nan(const std::vector<double>& x, const std::vector<double>& y,
                                    size_t window,
                                    const RollingOptions& options = RollingOptions());

std::vector<double> rolling_corr_nan(const std::vector<double>& x, const std::vector<double>& y,
                                     size_t window,
                                     const RollingOptions& options = RollingOptions());

} // namespace statkit::stats

#endif // STATKIT_PAIRWISE_HPP
