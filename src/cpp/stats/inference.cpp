#include "inference.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <numeric>
#include <stdexcept>

#include "core/checks.hpp"
#include "core/math_utils.hpp"
#include "stats/descriptive.hpp"

namespace statkit::stats {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

/// Continuity correction applied to U before standardizing
constexpr double CONTINUITY = 0.5;

/// p-value of a t statistic under the chosen alternative
double t_p_value(double t, double df, Alternative alt) {
    if (std::isnan(t) || std::isnan(df)) {
        return NaN;
    }
    switch (alt) {
        case Alternative::Less:
            return student_t_cdf(t, df);
        case Alternative::Greater:
            return student_t_sf(t, df);
        case Alternative::TwoSided:
        default:
            return std::min(1.0, 2.0 * student_t_sf(std::abs(t), df));
    }
}

/**
 * @brief Mid-ranks of the pooled values and the tie term Σ(t^3 - t)
 */
struct RankResult {
    std::vector<double> ranks;  ///< 1-based rank per element of the input
    double tie_term;            ///< Sum over tie groups of t^3 - t
};

RankResult mid_ranks(const std::vector<double>& values) {
    const size_t n = values.size();
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(),
              [&values](size_t a, size_t b) { return values[a] < values[b]; });

    RankResult result{std::vector<double>(n), 0.0};
    size_t i = 0;
    while (i < n) {
        size_t j = i + 1;
        while (j < n && values[order[j]] == values[order[i]]) {
            ++j;
        }
        // Positions i..j-1 share ranks i+1..j
        const double rank = 0.5 * static_cast<double>(i + 1 + j);
        for (size_t k = i; k < j; ++k) {
            result.ranks[order[k]] = rank;
        }
        const double t = static_cast<double>(j - i);
        result.tie_term += t * t * t - t;
        i = j;
    }
    return result;
}

void require_counts(const std::vector<double>& observed, const char* fn) {
    if (observed.size() < 2) {
        throw std::invalid_argument(std::string(fn) + ": at least 2 categories required, got " +
                                    std::to_string(observed.size()));
    }
    for (const double o : observed) {
        if (!(o >= 0.0)) {
            throw std::invalid_argument(std::string(fn) + ": observed counts must be non-negative");
        }
    }
}

}  // anonymous namespace

Alternative parse_alternative(const std::string& name) {
    if (name == "two-sided") return Alternative::TwoSided;
    if (name == "less") return Alternative::Less;
    if (name == "greater") return Alternative::Greater;
    throw std::invalid_argument("alternative must be 'two-sided', 'less' or 'greater', got '" +
                                name + "'");
}

std::string alternative_name(Alternative alt) {
    switch (alt) {
        case Alternative::Less:
            return "less";
        case Alternative::Greater:
            return "greater";
        case Alternative::TwoSided:
        default:
            return "two-sided";
    }
}

// ============== t-tests ==============

TTestResult t_test_1samp(const std::vector<double>& x, double mu, Alternative alt) {
    core::require_non_empty(x, "t_test_1samp");

    const size_t n = x.size();
    if (n < 2) {
        return {NaN, NaN, NaN};
    }

    const double df = static_cast<double>(n - 1);
    const double se = std_dev(x) / std::sqrt(static_cast<double>(n));
    if (!(se > 0.0)) {
        return {NaN, NaN, df};
    }

    const double t = (mean(x) - mu) / se;
    return {t, t_p_value(t, df, alt), df};
}

TTestResult t_test_2samp(const std::vector<double>& x, const std::vector<double>& y,
                         bool equal_var, Alternative alt) {
    core::require_non_empty(x, "t_test_2samp");
    core::require_non_empty(y, "t_test_2samp");

    const double n1 = static_cast<double>(x.size());
    const double n2 = static_cast<double>(y.size());
    if (x.size() < 2 || y.size() < 2) {
        return {NaN, NaN, NaN};
    }

    const double v1 = var(x);
    const double v2 = var(y);
    const double diff = mean(x) - mean(y);

    double se = 0.0;
    double df = 0.0;
    if (equal_var) {
        df = n1 + n2 - 2.0;
        const double pooled = ((n1 - 1.0) * v1 + (n2 - 1.0) * v2) / df;
        se = std::sqrt(pooled * (1.0 / n1 + 1.0 / n2));
    } else {
        // Welch-Satterthwaite
        const double a = v1 / n1;
        const double b = v2 / n2;
        se = std::sqrt(a + b);
        df = (a + b) * (a + b) / (a * a / (n1 - 1.0) + b * b / (n2 - 1.0));
    }

    if (!(se > 0.0)) {
        return {NaN, NaN, std::isfinite(df) ? df : NaN};
    }

    const double t = diff / se;
    return {t, t_p_value(t, df, alt), df};
}

// ============== Chi-square ==============

ChiSquareResult chi2_gof(const std::vector<double>& observed, const std::vector<double>& expected) {
    require_counts(observed, "chi2_gof");
    if (observed.size() != expected.size()) {
        throw std::invalid_argument("chi2_gof: length mismatch (" +
                                    std::to_string(observed.size()) + " vs " +
                                    std::to_string(expected.size()) + ")");
    }

    const Eigen::Index k = static_cast<Eigen::Index>(observed.size());
    ChiSquareResult result{0.0, NaN, static_cast<double>(k - 1), Eigen::MatrixXd(k, 1)};
    for (Eigen::Index i = 0; i < k; ++i) {
        const double e = expected[static_cast<size_t>(i)];
        if (!(e > 0.0)) {
            throw std::invalid_argument("chi2_gof: expected counts must be positive, got " +
                                        std::to_string(e) + " at index " + std::to_string(i));
        }
        const double d = observed[static_cast<size_t>(i)] - e;
        result.statistic += d * d / e;
        result.expected(i, 0) = e;
    }
    result.p_value = chi2_sf(result.statistic, result.df);
    return result;
}

ChiSquareResult chi2_gof(const std::vector<double>& observed) {
    require_counts(observed, "chi2_gof");
    const double total = std::accumulate(observed.begin(), observed.end(), 0.0);
    const std::vector<double> expected(observed.size(),
                                       total / static_cast<double>(observed.size()));
    return chi2_gof(observed, expected);
}

ChiSquareResult chi2_independence(const Eigen::MatrixXd& table) {
    const Eigen::Index r = table.rows();
    const Eigen::Index c = table.cols();
    if (r < 2 || c < 2) {
        throw std::invalid_argument("chi2_independence: table must be at least 2 x 2, got " +
                                    std::to_string(r) + " x " + std::to_string(c));
    }
    if (!(table.array() >= 0.0).all()) {
        throw std::invalid_argument("chi2_independence: counts must be non-negative");
    }

    const Eigen::VectorXd row_sums = table.rowwise().sum();
    const Eigen::RowVectorXd col_sums = table.colwise().sum();
    const double total = table.sum();

    ChiSquareResult result{0.0, NaN, static_cast<double>((r - 1) * (c - 1)),
                           Eigen::MatrixXd(r, c)};
    for (Eigen::Index i = 0; i < r; ++i) {
        for (Eigen::Index j = 0; j < c; ++j) {
            const double e = total > 0.0 ? row_sums(i) * col_sums(j) / total : 0.0;
            if (!(e > 0.0)) {
                throw std::invalid_argument("chi2_independence: expected count is zero at (" +
                                            std::to_string(i) + ", " + std::to_string(j) + ")");
            }
            const double d = table(i, j) - e;
            result.statistic += d * d / e;
            result.expected(i, j) = e;
        }
    }
    result.p_value = chi2_sf(result.statistic, result.df);
    return result;
}

// ============== Effect sizes ==============

double cohens_d(const std::vector<double>& x, const std::vector<double>& y, bool pooled) {
    core::require_non_empty(x, "cohens_d");
    core::require_non_empty(y, "cohens_d");
    if (x.size() < 2 || y.size() < 2) {
        return NaN;
    }

    const double n1 = static_cast<double>(x.size());
    const double n2 = static_cast<double>(y.size());
    const double v1 = var(x);
    const double v2 = var(y);

    const double s = pooled ? std::sqrt(((n1 - 1.0) * v1 + (n2 - 1.0) * v2) / (n1 + n2 - 2.0))
                            : std::sqrt(0.5 * (v1 + v2));
    if (!(s > 0.0)) {
        return NaN;
    }
    return (mean(x) - mean(y)) / s;
}

double hedges_g(const std::vector<double>& x, const std::vector<double>& y) {
    const double d = cohens_d(x, y, true);
    const double n = static_cast<double>(x.size() + y.size());
    const double correction = 1.0 - 3.0 / (4.0 * n - 9.0);
    return d * correction;
}

// ============== Rank tests ==============

MannWhitneyResult mann_whitney_u(const std::vector<double>& x, const std::vector<double>& y,
                                 Alternative alt) {
    core::require_non_empty(x, "mann_whitney_u");
    core::require_non_empty(y, "mann_whitney_u");

    const double n1 = static_cast<double>(x.size());
    const double n2 = static_cast<double>(y.size());
    const double n = n1 + n2;

    std::vector<double> pooled(x);
    pooled.insert(pooled.end(), y.begin(), y.end());
    const RankResult ranked = mid_ranks(pooled);

    const double r1 = std::accumulate(ranked.ranks.begin(),
                                      ranked.ranks.begin() + static_cast<std::ptrdiff_t>(x.size()),
                                      0.0);
    const double u1 = r1 - n1 * (n1 + 1.0) / 2.0;
    const double u2 = n1 * n2 - u1;

    const double mu = n1 * n2 / 2.0;
    const double sigma =
        std::sqrt(n1 * n2 / 12.0 * ((n + 1.0) - ranked.tie_term / (n * (n - 1.0))));
    if (!(sigma > 0.0)) {
        return {u1, NaN};
    }

    double p = NaN;
    switch (alt) {
        case Alternative::Greater:
            p = norm_sf((u1 - mu - CONTINUITY) / sigma);
            break;
        case Alternative::Less:
            p = norm_sf((u2 - mu - CONTINUITY) / sigma);
            break;
        case Alternative::TwoSided:
        default:
            p = std::min(1.0, 2.0 * norm_sf((std::max(u1, u2) - mu - CONTINUITY) / sigma));
            break;
    }
    return {u1, p};
}

} // namespace statkit::stats
