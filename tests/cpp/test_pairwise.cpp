/**
 * @file test_pairwise.cpp
 * @brief Unit tests for covariance and correlation
 */

#include <gtest/gtest.h>
#include <cmath>
#include <cstddef>
#include <limits>
#include <random>
#include <vector>
#include "stats/pairwise.hpp"

namespace statkit::stats {
namespace {

const double NaN = std::numeric_limits<double>::quiet_NaN();

class PairwiseTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::mt19937 rng(2024);
        std::normal_distribution<double> dist(0.0, 1.0);
        x.resize(300);
        y.resize(300);
        for (size_t i = 0; i < x.size(); ++i) {
            x[i] = dist(rng);
            y[i] = 0.6 * x[i] + 0.8 * dist(rng);
        }

        data.resize(100, 4);
        for (Eigen::Index i = 0; i < data.rows(); ++i) {
            const double common = dist(rng);
            data(i, 0) = common + dist(rng);
            data(i, 1) = -common + 0.5 * dist(rng);
            data(i, 2) = dist(rng);
            data(i, 3) = 2.0 * data(i, 0) + 0.1 * dist(rng);
        }
    }

    static std::vector<double> column(const Eigen::MatrixXd& m, Eigen::Index j) {
        std::vector<double> out(static_cast<size_t>(m.rows()));
        for (Eigen::Index i = 0; i < m.rows(); ++i) {
            out[static_cast<size_t>(i)] = m(i, j);
        }
        return out;
    }

    static std::vector<double> slice(const std::vector<double>& v, size_t end, size_t w) {
        return std::vector<double>(v.begin() + static_cast<std::ptrdiff_t>(end + 1 - w),
                                   v.begin() + static_cast<std::ptrdiff_t>(end + 1));
    }

    std::vector<double> x;
    std::vector<double> y;
    Eigen::MatrixXd data;
};

// ============== Pairs ==============

TEST_F(PairwiseTest, CovarianceKnownValue) {
    EXPECT_NEAR(cov({1.0, 2.0, 3.0}, {2.0, 4.0, 7.0}), 2.5, 1e-12);
    EXPECT_NEAR(corr({1.0, 2.0, 3.0}, {2.0, 4.0, 7.0}), 5.0 / std::sqrt(2.0 * 38.0 / 3.0), 1e-12);
}

TEST_F(PairwiseTest, Symmetric) {
    EXPECT_DOUBLE_EQ(cov(x, y), cov(y, x));
    EXPECT_DOUBLE_EQ(corr(x, y), corr(y, x));
}

TEST_F(PairwiseTest, SelfCorrelationIsOne) {
    EXPECT_DOUBLE_EQ(corr(x, x), 1.0);
    std::vector<double> neg(x.size());
    for (size_t i = 0; i < x.size(); ++i) {
        neg[i] = -3.0 * x[i];
    }
    EXPECT_NEAR(corr(x, neg), -1.0, 1e-12);
}

TEST_F(PairwiseTest, ConstantSequence) {
    const std::vector<double> c(3, 0.1);
    EXPECT_TRUE(std::isnan(corr(c, {1.0, 2.0, 3.0})));
    EXPECT_DOUBLE_EQ(cov(c, {1.0, 2.0, 3.0}), 0.0);
}

TEST_F(PairwiseTest, InsufficientData) {
    EXPECT_TRUE(std::isnan(cov({1.0}, {2.0})));
    EXPECT_TRUE(std::isnan(corr({1.0}, {2.0})));
}

TEST_F(PairwiseTest, InvalidInputsThrow) {
    EXPECT_THROW(cov({1.0, 2.0}, {1.0}), std::invalid_argument);
    EXPECT_THROW(corr({}, {}), std::invalid_argument);
}

TEST_F(PairwiseTest, NanAwareUsesCompletePairsOnly) {
    // Only indices 0 and 3 are complete: (1, 2) and (4, 5)
    const std::vector<double> a{1.0, NaN, 3.0, 4.0};
    const std::vector<double> b{2.0, 2.0, NaN, 5.0};
    EXPECT_NEAR(cov_nan(a, b), cov({1.0, 4.0}, {2.0, 5.0}), 1e-12);
    EXPECT_NEAR(cov_nan(a, b), 4.5, 1e-12);
    EXPECT_NEAR(corr_nan(a, b), 1.0, 1e-12);
}

TEST_F(PairwiseTest, NanAwareTooFewPairs) {
    EXPECT_TRUE(std::isnan(cov_nan({1.0, NaN}, {NaN, 2.0})));
}

// ============== Matrices ==============

TEST_F(PairwiseTest, CovMatrixMatchesPairs) {
    const Eigen::MatrixXd c = cov_matrix(data);
    ASSERT_EQ(c.rows(), 4);
    ASSERT_EQ(c.cols(), 4);
    for (Eigen::Index i = 0; i < 4; ++i) {
        for (Eigen::Index j = 0; j < 4; ++j) {
            EXPECT_NEAR(c(i, j), cov(column(data, i), column(data, j)), 1e-10);
            EXPECT_EQ(c(i, j), c(j, i));
        }
    }
}

TEST_F(PairwiseTest, CorrMatrixDiagonalIsExactlyOne) {
    const Eigen::MatrixXd r = corr_matrix(data);
    for (Eigen::Index i = 0; i < 4; ++i) {
        EXPECT_EQ(r(i, i), 1.0);
        for (Eigen::Index j = 0; j < 4; ++j) {
            EXPECT_NEAR(r(i, j), corr(column(data, i), column(data, j)), 1e-10);
            EXPECT_LE(std::abs(r(i, j)), 1.0);
        }
    }
}

TEST_F(PairwiseTest, CorrMatrixConstantColumnIsNaN) {
    Eigen::MatrixXd m = data;
    m.col(2).setConstant(0.1);
    const Eigen::MatrixXd r = corr_matrix(m);
    for (Eigen::Index k = 0; k < 4; ++k) {
        EXPECT_TRUE(std::isnan(r(2, k)));
        EXPECT_TRUE(std::isnan(r(k, 2)));
    }
    EXPECT_EQ(r(0, 0), 1.0);

    const Eigen::MatrixXd c = cov_matrix(m);
    EXPECT_EQ(c(2, 2), 0.0);
    EXPECT_EQ(c(0, 2), 0.0);
}

TEST_F(PairwiseTest, MatrixWithoutRowsThrows) {
    EXPECT_THROW(cov_matrix(Eigen::MatrixXd(0, 3)), std::invalid_argument);
    EXPECT_THROW(corr_matrix_nan(Eigen::MatrixXd(0, 3)), std::invalid_argument);
}

TEST_F(PairwiseTest, NanMatrixMatchesPlainWithoutMissing) {
    const Eigen::MatrixXd c = cov_matrix(data);
    const Eigen::MatrixXd cn = cov_matrix_nan(data);
    const Eigen::MatrixXd rn = corr_matrix_nan(data);
    for (Eigen::Index i = 0; i < 4; ++i) {
        EXPECT_EQ(rn(i, i), 1.0);
        for (Eigen::Index j = 0; j < 4; ++j) {
            EXPECT_NEAR(cn(i, j), c(i, j), 1e-10);
        }
    }
}

TEST_F(PairwiseTest, NanMatrixIsPairwiseComplete) {
    Eigen::MatrixXd m = data;
    m(3, 0) = NaN;
    m(10, 1) = NaN;
    m(10, 2) = NaN;
    m(50, 2) = NaN;

    const Eigen::MatrixXd cn = cov_matrix_nan(m);
    const Eigen::MatrixXd rn = corr_matrix_nan(m);
    for (Eigen::Index i = 0; i < 4; ++i) {
        for (Eigen::Index j = 0; j < 4; ++j) {
            SCOPED_TRACE(i * 4 + j);
            EXPECT_NEAR(cn(i, j), cov_nan(column(m, i), column(m, j)), 1e-12);
            if (i != j) {
                EXPECT_NEAR(rn(i, j), corr_nan(column(m, i), column(m, j)), 1e-12);
            }
            EXPECT_EQ(cn(i, j), cn(j, i));
        }
    }
}

// ============== Rolling ==============

TEST_F(PairwiseTest, RollingMatchesDirectWindows) {
    const size_t w = 30;
    const std::vector<double> rc = rolling_cov(x, y, w);
    const std::vector<double> rr = rolling_corr(x, y, w);
    ASSERT_EQ(rc.size(), x.size());
    for (size_t i = 0; i + 1 < w; ++i) {
        EXPECT_TRUE(std::isnan(rc[i]));
        EXPECT_TRUE(std::isnan(rr[i]));
    }
    for (size_t i = w - 1; i < x.size(); ++i) {
        EXPECT_NEAR(rc[i], cov(slice(x, i, w), slice(y, i, w)), 1e-9);
        EXPECT_NEAR(rr[i], corr(slice(x, i, w), slice(y, i, w)), 1e-9);
    }
}

TEST_F(PairwiseTest, RollingRecoversAfterSpikesLeaveWindow) {
    std::vector<double> a;
    std::vector<double> b;
    for (size_t k = 0; k < 100; ++k) {
        a.push_back(1.0 + 0.001 * static_cast<double>((k * 7) % 11));
        b.push_back(3.0 + 0.002 * static_cast<double>((k * 5) % 13));
    }
    a[50] = 1e9;
    b[30] = -5e8;
    const size_t w = 10;

    const std::vector<double> rc = rolling_cov(a, b, w);
    const std::vector<double> rr = rolling_corr(a, b, w);
    for (size_t i = w - 1; i < a.size(); ++i) {
        SCOPED_TRACE(i);
        const std::vector<double> xs = slice(a, i, w);
        const std::vector<double> ys = slice(b, i, w);
        const double scale = std::sqrt(cov(xs, xs) * cov(ys, ys));
        EXPECT_NEAR(rc[i], cov(xs, ys), 1e-9 * scale);
        EXPECT_NEAR(rr[i], corr(xs, ys), 1e-9);
    }

    // Same data with gaps
    std::vector<double> bn = b;
    bn[25] = NaN;
    bn[55] = NaN;
    bn[80] = NaN;
    const std::vector<double> nc = rolling_cov_nan(a, bn, w);
    const std::vector<double> nr = rolling_corr_nan(a, bn, w);
    for (size_t i = w - 1; i < a.size(); ++i) {
        SCOPED_TRACE(i);
        const std::vector<double> xs = slice(a, i, w);
        const std::vector<double> ys = slice(bn, i, w);
        const double scale = std::sqrt(cov_nan(xs, xs) * cov_nan(ys, ys));
        EXPECT_NEAR(nc[i], cov_nan(xs, ys), 1e-9 * scale);
        EXPECT_NEAR(nr[i], corr_nan(xs, ys), 1e-9);
    }
}

TEST_F(PairwiseTest, RollingCorrConstantWindowIsNaN) {
    const std::vector<double> a{1.0, 2.0, 0.1, 0.1, 0.1, 4.0};
    const std::vector<double> b{1.0, 3.0, 2.0, 5.0, 4.0, 1.0};
    const std::vector<double> rr = rolling_corr(a, b, 3);
    const std::vector<double> rc = rolling_cov(a, b, 3);
    EXPECT_TRUE(std::isnan(rr[4]));
    EXPECT_EQ(rc[4], 0.0);
    EXPECT_FALSE(std::isnan(rr[5]));
}

TEST_F(PairwiseTest, RollingNanCountsCompletePairs) {
    // Window ending at 3 holds two valid x and two valid y but one complete pair
    const std::vector<double> a{1.0, NaN, 3.0, 4.0, 5.0};
    const std::vector<double> b{2.0, 2.0, NaN, 5.0, 7.0};
    const std::vector<double> rc = rolling_cov_nan(a, b, 3);
    const std::vector<double> rr = rolling_corr_nan(a, b, 3);
    EXPECT_TRUE(std::isnan(rc[2]));
    EXPECT_TRUE(std::isnan(rc[3]));
    EXPECT_NEAR(rc[4], 1.0, 1e-12);
    EXPECT_NEAR(rr[4], 1.0, 1e-12);

    const std::vector<double> strict = rolling_cov_nan(a, b, 3, RollingOptions(3));
    EXPECT_TRUE(std::isnan(strict[4]));
}

TEST_F(PairwiseTest, RollingNanMatchesPlainWithoutMissing) {
    const size_t w = 12;
    const std::vector<double> plain = rolling_corr(x, y, w);
    const std::vector<double> aware = rolling_corr_nan(x, y, w);
    for (size_t i = w - 1; i < x.size(); ++i) {
        EXPECT_DOUBLE_EQ(plain[i], aware[i]);
    }
}

TEST_F(PairwiseTest, RollingInvalidArgumentsThrow) {
    EXPECT_THROW(rolling_cov(x, y, 0), std::invalid_argument);
    EXPECT_THROW(rolling_corr(x, {1.0, 2.0}, 2), std::invalid_argument);
    EXPECT_THROW(rolling_corr_nan(x, y, 5, RollingOptions(6)), std::invalid_argument);
}

}  // namespace
}  // namespace statkit::stats
