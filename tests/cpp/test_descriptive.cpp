/**
 * @file test_descriptive.cpp
 * @brief Unit tests for scalar reductions
 */

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <vector>
#include "core/accumulator.hpp"
#include "stats/descriptive.hpp"

namespace statkit::stats {
namespace {

const double NaN = std::numeric_limits<double>::quiet_NaN();

class DescriptiveTest : public ::testing::Test {
protected:
    std::vector<double> one_to_five{1.0, 2.0, 3.0, 4.0, 5.0};
};

// ============== Moments ==============

TEST_F(DescriptiveTest, MeanBasic) {
    EXPECT_DOUBLE_EQ(mean(one_to_five), 3.0);
    EXPECT_DOUBLE_EQ(mean({42.0}), 42.0);
}

TEST_F(DescriptiveTest, EmptyInputThrows) {
    std::vector<double> empty;
    EXPECT_THROW(mean(empty), std::invalid_argument);
    EXPECT_THROW(var(empty), std::invalid_argument);
    EXPECT_THROW(median(empty), std::invalid_argument);
    EXPECT_THROW(quantile(empty, 0.5), std::invalid_argument);
    EXPECT_THROW(mean_nan(empty), std::invalid_argument);
}

TEST_F(DescriptiveTest, VarianceUsesBesselCorrection) {
    // (4 + 1 + 0 + 1 + 4) / 4
    EXPECT_DOUBLE_EQ(var(one_to_five), 2.5);
    EXPECT_DOUBLE_EQ(std_dev(one_to_five), std::sqrt(2.5));
}

TEST_F(DescriptiveTest, VarianceMatchesAccumulatorAtLargeOffset) {
    // Deviations {-2, -1, 0, 1, 2} * 1e-3 around 1e9
    std::vector<double> x;
    for (double d : one_to_five) {
        x.push_back(1e9 + (d - 3.0) * 1e-3);
    }
    EXPECT_DOUBLE_EQ(var(x), core::welford(x).variance);
    // Inputs carry rounding of about 1e-7 at this magnitude
    EXPECT_NEAR(var(x), 2.5e-6, 1e-3 * 2.5e-6);
}

TEST_F(DescriptiveTest, VarianceSingleObservationIsNaN) {
    EXPECT_TRUE(std::isnan(var({7.0})));
    EXPECT_TRUE(std::isnan(std_dev({7.0})));
}

TEST_F(DescriptiveTest, ZscoreBasic) {
    const std::vector<double> z = zscore(one_to_five);
    const double s = std::sqrt(2.5);
    ASSERT_EQ(z.size(), 5u);
    EXPECT_NEAR(z[0], -2.0 / s, 1e-12);
    EXPECT_NEAR(z[2], 0.0, 1e-12);
    EXPECT_NEAR(z[4], 2.0 / s, 1e-12);
}

TEST_F(DescriptiveTest, ZscoreConstantIsNaN) {
    for (double v : zscore({3.0, 3.0, 3.0})) {
        EXPECT_TRUE(std::isnan(v));
    }
}

// ============== NaN-aware ==============

TEST_F(DescriptiveTest, NanVariantsSkipMissing) {
    const std::vector<double> x{1.0, NaN, 2.0, 3.0, NaN, 4.0, 5.0};
    EXPECT_DOUBLE_EQ(mean_nan(x), 3.0);
    EXPECT_NEAR(var_nan(x), 2.5, 1e-12);
    EXPECT_NEAR(std_nan(x), std::sqrt(2.5), 1e-12);
}

TEST_F(DescriptiveTest, NanVariantsInsufficientData) {
    EXPECT_TRUE(std::isnan(mean_nan({NaN, NaN})));
    EXPECT_TRUE(std::isnan(var_nan({NaN, 1.0, NaN})));
}

// ============== Quantiles ==============

TEST_F(DescriptiveTest, QuantileInterpolatesLinearly) {
    // Position q * (n - 1) = 0.3 * 4 = 1.2 between 2 and 3
    EXPECT_NEAR(quantile(one_to_five, 0.3), 2.2, 1e-12);
    EXPECT_DOUBLE_EQ(quantile(one_to_five, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(quantile(one_to_five, 1.0), 5.0);
}

TEST_F(DescriptiveTest, QuantileIgnoresInputOrder) {
    EXPECT_DOUBLE_EQ(quantile({5.0, 1.0, 4.0, 2.0, 3.0}, 0.75), 4.0);
}

TEST_F(DescriptiveTest, QuantileOutOfRangeThrows) {
    EXPECT_THROW(quantile(one_to_five, -0.1), std::invalid_argument);
    EXPECT_THROW(quantile(one_to_five, 1.1), std::invalid_argument);
}

TEST_F(DescriptiveTest, PercentileUsesPercentScale) {
    EXPECT_DOUBLE_EQ(percentile(one_to_five, 50.0), 3.0);
    EXPECT_NEAR(percentile(one_to_five, 95.0), quantile(one_to_five, 0.95), 1e-12);
    EXPECT_THROW(percentile(one_to_five, 101.0), std::invalid_argument);
}

TEST_F(DescriptiveTest, QuantileFromSortedClampsAndHandlesEmpty) {
    EXPECT_DOUBLE_EQ(quantile_from_sorted(one_to_five, -1.0), 1.0);
    EXPECT_DOUBLE_EQ(quantile_from_sorted(one_to_five, 2.0), 5.0);
    EXPECT_TRUE(std::isnan(quantile_from_sorted({}, 0.5)));
}

TEST_F(DescriptiveTest, MedianEvenAndOdd) {
    EXPECT_DOUBLE_EQ(median(one_to_five), 3.0);
    EXPECT_DOUBLE_EQ(median({4.0, 1.0, 3.0, 2.0}), 2.5);
}

TEST_F(DescriptiveTest, InterquartileRange) {
    const QuartileResult q = iqr(one_to_five);
    EXPECT_DOUBLE_EQ(q.q1, 2.0);
    EXPECT_DOUBLE_EQ(q.q3, 4.0);
    EXPECT_DOUBLE_EQ(q.iqr, 2.0);
    EXPECT_NE(q.to_string().find("iqr="), std::string::npos);
}

TEST_F(DescriptiveTest, MedianAbsoluteDeviation) {
    // |x - 3| = {2, 1, 0, 1, 2}, median 1
    EXPECT_DOUBLE_EQ(mad(one_to_five), 1.0);
    EXPECT_DOUBLE_EQ(mad({1.0, 1.0, 1.0, 100.0}), 0.0);
}

// ============== Trimmed mean ==============

TEST_F(DescriptiveTest, TrimmedMeanCutsTails) {
    // n = 10, proportion 0.2 -> one value cut from each tail
    const std::vector<double> x{1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0, 8.0, 9.0, 1000.0};
    EXPECT_DOUBLE_EQ(trimmed_mean(x, 0.2), 5.5);
    EXPECT_DOUBLE_EQ(trimmed_mean(x, 0.0), mean(x));
}

TEST_F(DescriptiveTest, TrimmedMeanNothingLeftIsNaN) {
    EXPECT_TRUE(std::isnan(trimmed_mean({1.0, 2.0}, 1.0)));
    EXPECT_THROW(trimmed_mean(one_to_five, 1.5), std::invalid_argument);
}

// ============== Matrix and helpers ==============

TEST_F(DescriptiveTest, MeanAxis) {
    Eigen::MatrixXd m(2, 3);
    m << 1.0, 2.0, 3.0,
         4.0, 5.0, 6.0;

    const Eigen::VectorXd cols = mean_axis(m, 0);
    ASSERT_EQ(cols.size(), 3);
    EXPECT_DOUBLE_EQ(cols(0), 2.5);
    EXPECT_DOUBLE_EQ(cols(2), 4.5);

    const Eigen::VectorXd rows = mean_axis(m, 1);
    ASSERT_EQ(rows.size(), 2);
    EXPECT_DOUBLE_EQ(rows(0), 2.0);
    EXPECT_DOUBLE_EQ(rows(1), 5.0);

    EXPECT_THROW(mean_axis(m, 2), std::invalid_argument);
}

TEST_F(DescriptiveTest, SignMask) {
    const std::vector<int8_t> s = sign_mask({-2.0, 0.0, 3.0, NaN});
    EXPECT_EQ(s, (std::vector<int8_t>{-1, 0, 1, 0}));
}

TEST_F(DescriptiveTest, DemeanWithSigns) {
    const auto [demeaned, signs] = demean_with_signs({1.0, 2.0, 6.0});
    EXPECT_DOUBLE_EQ(demeaned[0], -2.0);
    EXPECT_DOUBLE_EQ(demeaned[1], -1.0);
    EXPECT_DOUBLE_EQ(demeaned[2], 3.0);
    EXPECT_EQ(signs, (std::vector<int8_t>{-1, -1, 1}));
}

TEST_F(DescriptiveTest, PadNan) {
    const std::vector<double> p = pad_nan(3);
    ASSERT_EQ(p.size(), 3u);
    for (double v : p) {
        EXPECT_TRUE(std::isnan(v));
    }
    EXPECT_TRUE(pad_nan(0).empty());
}

}  // namespace
}  // namespace statkit::stats
