#ifndef STATKIT_INFERENCE_HPP
#define STATKIT_INFERENCE_HPP

/**
 * @file inference.hpp
 * @brief Hypothesis tests and effect sizes
 *
 * Provides:
 * - One- and two-sample t-tests (pooled or Welch)
 * - Chi-square goodness-of-fit and independence tests
 * - Cohen's d and Hedges' g
 * - Mann-Whitney U rank test with tie correction
 *
 * Insufficient data (for example a single observation) yields NaN statistics
 * and p-values. Empty inputs throw std::invalid_argument.
 *
 * References:
 * - Welch, B.L. (1947). "The generalization of Student's problem when several
 *   different population variances are involved." Biometrika 34, 28-35.
 * - Mann, H.B. & Whitney, D.R. (1947). "On a test of whether one of two random
 *   variables is stochastically larger than the other." Ann. Math. Stat. 18, 50-60.
 */

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace statkit::stats {

/**
 * @brief Alternative hypothesis of a test
 */
enum class Alternative {
    TwoSided,  ///< Parameter differs from the null value
    Less,      ///< Parameter is below the null value
    Greater    ///< Parameter is above the null value
};

/**
 * @brief Parse "two-sided", "less" or "greater"
 * @throws std::invalid_argument for any other string
 */
Alternative parse_alternative(const std::string& name);

/// Canonical string for an Alternative
std::string alternative_name(Alternative alt);

struct TTestResult {
    double statistic;  ///< t statistic
    double p_value;    ///< p-value under the chosen alternative
    double df;         ///< Degrees of freedom (fractional for Welch)

    std::string to_string() const {
        return "TTestResult(statistic=" + std::to_string(statistic) +
               ", p_value=" + std::to_string(p_value) + ", df=" + std::to_string(df) + ")";
    }
};

struct ChiSquareResult {
    double statistic;          ///< Sum of (O - E)^2 / E
    double p_value;            ///< Upper tail probability
    double df;                 ///< Degrees of freedom
    Eigen::MatrixXd expected;  ///< Expected counts (k x 1 for goodness-of-fit)

    std::string to_string() const {
        return "ChiSquareResult(statistic=" + std::to_string(statistic) +
               ", p_value=" + std::to_string(p_value) + ", df=" + std::to_string(df) + ")";
    }
};

struct MannWhitneyResult {
    double statistic;  ///< U statistic of the first sample
    double p_value;    ///< Normal-approximation p-value

    std::string to_string() const {
        return "MannWhitneyResult(statistic=" + std::to_string(statistic) +
               ", p_value=" + std::to_string(p_value) + ")";
    }
};

/**
 * @brief One-sample t-test of mean(x) against mu
 *
 * t = (mean - mu) / (s / sqrt(n)), df = n - 1.
 *
 * @throws std::invalid_argument if x is empty
 */
TTestResult t_test_1samp(const std::vector<double>& x, double mu = 0.0,
                         Alternative alt = Alternative::TwoSided);

/**
 * @brief Two-sample t-test of mean(x) - mean(y) against 0
 *
 * With equal_var the pooled variance is used and df = n1 + n2 - 2.
 * Otherwise Welch's statistic with Welch-Satterthwaite degrees of freedom.
 *
 * @throws std::invalid_argument if either sample is empty
 */
TTestResult t_test_2samp(const std::vector<double>& x, const std::vector<double>& y,
                         bool equal_var = true, Alternative alt = Alternative::TwoSided);

/**
 * @brief Chi-square goodness-of-fit test, df = k - 1
 *
 * @param observed Observed counts (k >= 2)
 * @param expected Expected counts, same length, all > 0
 * @throws std::invalid_argument on length mismatch, k < 2 or a non-positive expectation
 */
ChiSquareResult chi2_gof(const std::vector<double>& observed, const std::vector<double>& expected);

/// Goodness-of-fit against the uniform expectation sum(observed) / k
ChiSquareResult chi2_gof(const std::vector<double>& observed);

/**
 * @brief Chi-square test of independence for an r x c contingency table
 *
 * E_ij = row_i * col_j / total, df = (r - 1)(c - 1).
 *
 * @throws std::invalid_argument if the table is smaller than 2 x 2, has a
 *         negative count or any expected count is zero
 */
ChiSquareResult chi2_independence(const Eigen::MatrixXd& table);

/**
 * @brief Cohen's d effect size: (mean(x) - mean(y)) / s
 *
 * s is the pooled sd sqrt(((n1-1)v1 + (n2-1)v2) / (n1+n2-2)) when pooled,
 * else sqrt((v1 + v2) / 2).
 */
double cohens_d(const std::vector<double>& x, const std::vector<double>& y, bool pooled = true);

/**
 * @brief Hedges' g: pooled Cohen's d times 1 - 3 / (4(n1 + n2) - 9)
 */
double hedges_g(const std::vector<double>& x, const std::vector<double>& y);

/**
 * @brief Mann-Whitney U test
 *
 * Ranks the pooled sample with mid-ranks for ties. U1 = R1 - n1(n1+1)/2 is
 * reported; the p-value uses the tie-corrected normal approximation with a
 * 0.5 continuity correction.
 *
 * @throws std::invalid_argument if either sample is empty
 */
MannWhitneyResult mann_whitney_u(const std::vector<double>& x, const std::vector<double>& y,
                                 Alternative alt = Alternative::TwoSided);

} // namespace statkit::stats

#endif // STATKIT_INFERENCE_HPP
