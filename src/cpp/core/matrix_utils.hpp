#ifndef STATKIT_MATRIX_UTILS_HPP
#define STATKIT_MATRIX_UTILS_HPP

/**
 * @file matrix_utils.hpp
 * @brief Matrix helpers for column-oriented statistics using Eigen
 *
 * Provides:
 * - Sample covariance matrix (Bessel's correction)
 * - Covariance to correlation conversion with NaN for degenerate columns
 */

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace statkit::core {

/**
 * @brief Compute sample covariance matrix from data
 *
 * Uses Bessel's correction (n-1 denominator) for unbiased estimation.
 * With a single observation the covariance is undefined and every entry is NaN.
 *
 * @param data Matrix where each column is a variable's observations
 * @return Covariance matrix (p x p)
 * @throws std::invalid_argument if data has no rows
 */
inline Eigen::MatrixXd compute_covariance(const Eigen::MatrixXd& data) {
    const Eigen::Index n = data.rows();
    const Eigen::Index p = data.cols();

    if (n == 0) {
        throw std::invalid_argument("compute_covariance: matrix has no observations");
    }
    if (n < 2) {
        return Eigen::MatrixXd::Constant(p, p, std::numeric_limits<double>::quiet_NaN());
    }

    // Center the data
    Eigen::MatrixXd centered = data.rowwise() - data.colwise().mean();

    // Compute covariance: (1/(n-1)) * X'X
    Eigen::MatrixXd cov = (centered.transpose() * centered) / static_cast<double>(n - 1);

    // The product is symmetric up to rounding; mirror the upper triangle
    for (Eigen::Index i = 0; i < p; ++i) {
        for (Eigen::Index j = i + 1; j < p; ++j) {
            cov(j, i) = cov(i, j);
        }
    }

    // A constant column has exactly zero (co)variance; centering on a rounded
    // mean can leave residue
    for (Eigen::Index j = 0; j < p; ++j) {
        if (data.col(j).maxCoeff() == data.col(j).minCoeff()) {
            cov.row(j).setZero();
            cov.col(j).setZero();
        }
    }
    return cov;
}

/**
 * @brief Convert covariance matrix to correlation matrix
 *
 * corr_ij = cov_ij / (std_i * std_j), clamped to [-1, 1].
 * The diagonal is set to exactly 1. A column with zero (or undefined)
 * variance gets NaN on its whole row and column, diagonal included.
 *
 * @param cov Covariance matrix (must be square)
 * @return Correlation matrix
 * @throws std::invalid_argument if matrix is not square
 */
inline Eigen::MatrixXd covariance_to_correlation(const Eigen::MatrixXd& cov) {
    if (cov.rows() != cov.cols()) {
        throw std::invalid_argument("covariance_to_correlation: covariance matrix must be square");
    }

    constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
    const Eigen::Index p = cov.rows();
    Eigen::VectorXd std_devs = cov.diagonal().array().sqrt();

    Eigen::MatrixXd corr(p, p);
    for (Eigen::Index i = 0; i < p; ++i) {
        const bool degenerate_i = !(std_devs(i) > 0.0);
        for (Eigen::Index j = 0; j < p; ++j) {
            if (degenerate_i || !(std_devs(j) > 0.0)) {
                corr(i, j) = NaN;
            } else if (i == j) {
                corr(i, j) = 1.0;
            } else {
                const double r = cov(i, j) / (std_devs(i) * std_devs(j));
                corr(i, j) = std::clamp(r, -1.0, 1.0);
            }
        }
    }

    return corr;
}

}  // namespace statkit::core

#endif  // STATKIT_MATRIX_UTILS_HPP
