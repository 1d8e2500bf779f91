#ifndef STATKIT_MATH_UTILS_HPP
#define STATKIT_MATH_UTILS_HPP

/**
 * @file math_utils.hpp
 * @brief Special functions and distribution tails used by the statistics engine
 *
 * Provides the numerical building blocks behind the inferential tests:
 * - Standard normal density, CDF and survival function
 * - Regularized incomplete beta and gamma functions
 * - Student-t and chi-square tail probabilities
 */

#include <cmath>
#include <limits>
#include <stdexcept>

namespace statkit {

/**
 * @brief Standard normal cumulative distribution function
 * @param x Point at which to evaluate
 * @return P(Z <= x) where Z ~ N(0,1)
 */
double norm_cdf(double x);

/**
 * @brief Standard normal survival function
 *
 * Evaluated through erfc so that far right tails keep their precision.
 *
 * @param x Point at which to evaluate
 * @return P(Z > x) where Z ~ N(0,1)
 */
double norm_sf(double x);

/**
 * @brief Standard normal probability density function
 * @param x Point at which to evaluate
 * @return PDF value at x
 */
double norm_pdf(double x);

/**
 * @brief Regularized incomplete beta function I_x(a, b)
 *
 * Evaluated with the modified Lentz continued fraction, using the symmetry
 * I_x(a, b) = 1 - I_{1-x}(b, a) on the side where the fraction converges fast.
 *
 * @param a First shape parameter (> 0)
 * @param b Second shape parameter (> 0)
 * @param x Evaluation point in [0, 1]
 * @return I_x(a, b)
 * @throws std::invalid_argument if a or b is not positive or x is outside [0, 1]
 */
double regularized_incomplete_beta(double a, double b, double x);

/**
 * @brief Regularized upper incomplete gamma function Q(a, x)
 *
 * Series expansion for x < a + 1, continued fraction otherwise.
 *
 * @param a Shape parameter (> 0)
 * @param x Evaluation point (>= 0)
 * @return Q(a, x) = Γ(a, x) / Γ(a)
 * @throws std::invalid_argument if a is not positive or x is negative
 */
double regularized_gamma_q(double a, double x);

/**
 * @brief Student-t survival function P(T > t)
 * @param t Statistic value
 * @param df Degrees of freedom (may be fractional, e.g. Welch)
 * @return Upper tail probability, NaN if t or df is NaN or df <= 0
 */
double student_t_sf(double t, double df);

/**
 * @brief Student-t cumulative distribution function P(T <= t)
 */
double student_t_cdf(double t, double df);

/**
 * @brief Chi-square survival function P(X > x)
 * @param x Statistic value
 * @param df Degrees of freedom
 * @return Upper tail probability, NaN if x or df is NaN or df <= 0
 */
double chi2_sf(double x, double df);

} // namespace statkit

#endif // STATKIT_MATH_UTILS_HPP
