/**
 * @file test_math_utils.cpp
 * @brief Unit tests for the special functions and distribution tails
 */

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <vector>
#include "core/math_utils.hpp"

namespace {

constexpr double PI = 3.14159265358979323846;

// ============== Normal distribution ==============

TEST(MathUtilsTest, NormCdfZero) {
    // Phi(0) = 0.5
    EXPECT_NEAR(statkit::norm_cdf(0.0), 0.5, 1e-12);
}

TEST(MathUtilsTest, NormCdfKnownQuantile) {
    EXPECT_NEAR(statkit::norm_cdf(1.959963984540054), 0.975, 1e-12);
    EXPECT_NEAR(statkit::norm_cdf(-1.959963984540054), 0.025, 1e-12);
}

TEST(MathUtilsTest, NormSfComplementsCdf) {
    for (double x : {-3.0, -1.0, 0.0, 0.5, 2.0}) {
        SCOPED_TRACE(x);
        EXPECT_NEAR(statkit::norm_sf(x) + statkit::norm_cdf(x), 1.0, 1e-14);
    }
}

TEST(MathUtilsTest, NormSfFarTailKeepsPrecision) {
    // 1 - Phi(8) cancels to 0 in double precision; erfc does not
    const double sf = statkit::norm_sf(8.0);
    EXPECT_GT(sf, 0.0);
    EXPECT_NEAR(sf / 6.220960574271784e-16, 1.0, 1e-6);
}

TEST(MathUtilsTest, NormPdfPeak) {
    EXPECT_NEAR(statkit::norm_pdf(0.0), 1.0 / std::sqrt(2.0 * PI), 1e-15);
    EXPECT_NEAR(statkit::norm_pdf(1.0), statkit::norm_pdf(-1.0), 1e-15);
}

// ============== Incomplete beta ==============

TEST(MathUtilsTest, IncompleteBetaUniformCase) {
    // I_x(1, 1) = x
    for (double x : {0.0, 0.1, 0.37, 0.5, 0.9, 1.0}) {
        SCOPED_TRACE(x);
        EXPECT_NEAR(statkit::regularized_incomplete_beta(1.0, 1.0, x), x, 1e-12);
    }
}

TEST(MathUtilsTest, IncompleteBetaPowerCase) {
    // I_x(a, 1) = x^a
    EXPECT_NEAR(statkit::regularized_incomplete_beta(3.0, 1.0, 0.6), std::pow(0.6, 3.0), 1e-12);
    EXPECT_NEAR(statkit::regularized_incomplete_beta(0.5, 1.0, 0.25), 0.5, 1e-12);
}

TEST(MathUtilsTest, IncompleteBetaSymmetry) {
    // I_0.5(a, a) = 0.5 and I_x(a, b) = 1 - I_{1-x}(b, a)
    EXPECT_NEAR(statkit::regularized_incomplete_beta(4.5, 4.5, 0.5), 0.5, 1e-12);
    const double lhs = statkit::regularized_incomplete_beta(2.0, 5.0, 0.3);
    const double rhs = 1.0 - statkit::regularized_incomplete_beta(5.0, 2.0, 0.7);
    EXPECT_NEAR(lhs, rhs, 1e-12);
}

TEST(MathUtilsTest, IncompleteBetaInvalidArguments) {
    EXPECT_THROW(statkit::regularized_incomplete_beta(0.0, 1.0, 0.5), std::invalid_argument);
    EXPECT_THROW(statkit::regularized_incomplete_beta(1.0, -1.0, 0.5), std::invalid_argument);
    EXPECT_THROW(statkit::regularized_incomplete_beta(1.0, 1.0, 1.5), std::invalid_argument);
}

// ============== Incomplete gamma ==============

TEST(MathUtilsTest, IncompleteGammaExponentialCase) {
    // Q(1, x) = exp(-x), on both sides of the series/fraction switch
    for (double x : {0.0, 0.5, 1.9, 2.1, 10.0}) {
        SCOPED_TRACE(x);
        EXPECT_NEAR(statkit::regularized_gamma_q(1.0, x), std::exp(-x), 1e-12);
    }
}

TEST(MathUtilsTest, IncompleteGammaInvalidArguments) {
    EXPECT_THROW(statkit::regularized_gamma_q(0.0, 1.0), std::invalid_argument);
    EXPECT_THROW(statkit::regularized_gamma_q(1.0, -1.0), std::invalid_argument);
}

// ============== Student-t ==============

TEST(MathUtilsTest, StudentTSfAtZero) {
    EXPECT_NEAR(statkit::student_t_sf(0.0, 5.0), 0.5, 1e-12);
}

TEST(MathUtilsTest, StudentTSfCauchy) {
    // df = 1 is the Cauchy distribution: P(T > t) = 1/2 - atan(t)/pi
    for (double t : {-4.0, -1.0, 0.3, 1.0, 7.5}) {
        SCOPED_TRACE(t);
        EXPECT_NEAR(statkit::student_t_sf(t, 1.0), 0.5 - std::atan(t) / PI, 1e-12);
    }
}

TEST(MathUtilsTest, StudentTSfTwoDegreesOfFreedom) {
    // df = 2: P(T > t) = 1/2 - t / (2 sqrt(t^2 + 2))
    for (double t : {-2.0, 0.5, 3.0}) {
        SCOPED_TRACE(t);
        const double expected = 0.5 - t / (2.0 * std::sqrt(t * t + 2.0));
        EXPECT_NEAR(statkit::student_t_sf(t, 2.0), expected, 1e-12);
    }
}

TEST(MathUtilsTest, StudentTCdfComplementsSf) {
    EXPECT_NEAR(statkit::student_t_cdf(1.3, 7.0) + statkit::student_t_sf(1.3, 7.0), 1.0, 1e-12);
}

TEST(MathUtilsTest, StudentTApproachesNormal) {
    EXPECT_NEAR(statkit::student_t_sf(1.5, 1e4), statkit::norm_sf(1.5), 1e-4);
    EXPECT_DOUBLE_EQ(statkit::student_t_sf(1.5, std::numeric_limits<double>::infinity()),
                     statkit::norm_sf(1.5));
}

TEST(MathUtilsTest, StudentTDegenerateInputs) {
    EXPECT_TRUE(std::isnan(statkit::student_t_sf(1.0, 0.0)));
    EXPECT_TRUE(std::isnan(statkit::student_t_sf(std::nan(""), 3.0)));
    EXPECT_DOUBLE_EQ(statkit::student_t_sf(std::numeric_limits<double>::infinity(), 3.0), 0.0);
}

// ============== Chi-square ==============

TEST(MathUtilsTest, ChiSquareSfTwoDegreesOfFreedom) {
    // df = 2 is exponential with mean 2
    for (double x : {0.5, 2.0, 9.0}) {
        SCOPED_TRACE(x);
        EXPECT_NEAR(statkit::chi2_sf(x, 2.0), std::exp(-0.5 * x), 1e-12);
    }
}

TEST(MathUtilsTest, ChiSquareSfOneDegreeOfFreedom) {
    // df = 1: P(X > x) = 2 * P(Z > sqrt(x))
    EXPECT_NEAR(statkit::chi2_sf(3.841458820694124, 1.0), 0.05, 1e-10);
    EXPECT_NEAR(statkit::chi2_sf(1.0, 1.0), 2.0 * statkit::norm_sf(1.0), 1e-12);
}

TEST(MathUtilsTest, ChiSquareSfNonPositiveStatistic) {
    EXPECT_DOUBLE_EQ(statkit::chi2_sf(0.0, 4.0), 1.0);
    EXPECT_TRUE(std::isnan(statkit::chi2_sf(1.0, 0.0)));
}

}  // namespace
