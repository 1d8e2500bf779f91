#include "pairwise.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "core/checks.hpp"
#include "core/matrix_utils.hpp"
#include "core/parallel.hpp"
#include "stats/sliding_window.hpp"

namespace statkit::stats {

namespace {

using detail::NaN;

/// Fewest valid pairs a rolling covariance can be computed from
constexpr size_t PAIR_MIN_PERIODS = 2;

/**
 * @brief Centered sums of the valid pairs of two buffers
 */
struct PairSums {
    size_t count = 0;
    double sxx = 0.0;
    double syy = 0.0;
    double sxy = 0.0;

    double covariance() const {
        return count < 2 ? NaN : sxy / static_cast<double>(count - 1);
    }

    double correlation() const {
        if (count < 2 || !(sxx > 0.0) || !(syy > 0.0)) {
            return NaN;
        }
        return std::clamp(sxy / std::sqrt(sxx * syy), -1.0, 1.0);
    }
};

/// Two passes: means of the valid pairs, then centered cross products
template <typename Valid>
PairSums pair_sums(const double* x, const double* y, size_t n, Valid valid) {
    PairSums s;
    double sum_x = 0.0;
    double sum_y = 0.0;
    double first_x = 0.0;
    double first_y = 0.0;
    bool constant_x = true;
    bool constant_y = true;
    for (size_t i = 0; i < n; ++i) {
        if (valid(x[i]) && valid(y[i])) {
            if (s.count == 0) {
                first_x = x[i];
                first_y = y[i];
            }
            constant_x = constant_x && x[i] == first_x;
            constant_y = constant_y && y[i] == first_y;
            sum_x += x[i];
            sum_y += y[i];
            ++s.count;
        }
    }
    if (s.count == 0) {
        return s;
    }

    const double mx = sum_x / static_cast<double>(s.count);
    const double my = sum_y / static_cast<double>(s.count);
    for (size_t i = 0; i < n; ++i) {
        if (valid(x[i]) && valid(y[i])) {
            const double dx = x[i] - mx;
            const double dy = y[i] - my;
            s.sxx += dx * dx;
            s.syy += dy * dy;
            s.sxy += dx * dy;
        }
    }
    // A constant side has exactly zero spread, which the rounded mean can miss
    if (constant_x) {
        s.sxx = 0.0;
        s.sxy = 0.0;
    }
    if (constant_y) {
        s.syy = 0.0;
        s.sxy = 0.0;
    }
    return s;
}

void require_pair(const std::vector<double>& x, const std::vector<double>& y, const char* fn) {
    core::require_non_empty(x, fn);
    core::require_same_length(x, y, fn);
}

/**
 * @brief Fill a symmetric p x p matrix from a per-column-pair statistic
 *
 * Only the upper triangle is computed; every (i, j) pair is independent.
 */
template <typename PairStat>
Eigen::MatrixXd pairwise_matrix(const Eigen::MatrixXd& data, PairStat stat) {
    const Eigen::Index p = data.cols();
    const size_t n = static_cast<size_t>(data.rows());
    Eigen::MatrixXd out(p, p);

#ifdef _OPENMP
#pragma omp parallel for schedule(dynamic) num_threads(core::num_threads())
#endif
    for (Eigen::Index i = 0; i < p; ++i) {
        for (Eigen::Index j = i; j < p; ++j) {
            const double v = stat(i, j, pair_sums(data.col(i).data(), data.col(j).data(), n,
                                                  detail::NotNaN{}));
            out(i, j) = v;
            out(j, i) = v;
        }
    }

    return out;
}

template <typename Stat>
std::vector<double> rolling_pair(const std::vector<double>& x, const std::vector<double>& y,
                                 size_t window, size_t min_periods, bool skip_nan, Stat stat) {
    std::vector<double> out(x.size(), NaN);
    auto emit = [&](size_t i, const detail::SlidingCoMoments& m) {
        if (m.count() >= min_periods) {
            out[i] = stat(m);
        }
    };
    if (skip_nan) {
        detail::slide_pairs(x.data(), y.data(), x.size(), window, detail::NotNaN{}, emit);
    } else {
        detail::slide_pairs(x.data(), y.data(), x.size(), window, detail::AllValid{}, emit);
    }
    return out;
}

size_t resolve_pair_periods(const RollingOptions& options, size_t window, const char* fn) {
    if (options.min_periods > window) {
        throw std::invalid_argument(std::string(fn) + ": min_periods must not exceed window (" +
                                    std::to_string(options.min_periods) + " > " +
                                    std::to_string(window) + ")");
    }
    return std::max(options.min_periods, PAIR_MIN_PERIODS);
}

}  // anonymous namespace

// ============== Pairs ==============

double cov(const std::vector<double>& x, const std::vector<double>& y) {
    require_pair(x, y, "cov");
    return pair_sums(x.data(), y.data(), x.size(), detail::AllValid{}).covariance();
}

double corr(const std::vector<double>& x, const std::vector<double>& y) {
    require_pair(x, y, "corr");
    return pair_sums(x.data(), y.data(), x.size(), detail::AllValid{}).correlation();
}

double cov_nan(const std::vector<double>& x, const std::vector<double>& y) {
    require_pair(x, y, "cov_nan");
    return pair_sums(x.data(), y.data(), x.size(), detail::NotNaN{}).covariance();
}

double corr_nan(const std::vector<double>& x, const std::vector<double>& y) {
    require_pair(x, y, "corr_nan");
    return pair_sums(x.data(), y.data(), x.size(), detail::NotNaN{}).correlation();
}

// ============== Matrices ==============

Eigen::MatrixXd cov_matrix(const Eigen::MatrixXd& data) {
    core::require_non_empty(static_cast<size_t>(data.rows()), "cov_matrix");
    return core::compute_covariance(data);
}

Eigen::MatrixXd corr_matrix(const Eigen::MatrixXd& data) {
    core::require_non_empty(static_cast<size_t>(data.rows()), "corr_matrix");
    return core::covariance_to_correlation(core::compute_covariance(data));
}

Eigen::MatrixXd cov_matrix_nan(const Eigen::MatrixXd& data) {
    core::require_non_empty(static_cast<size_t>(data.rows()), "cov_matrix_nan");
    return pairwise_matrix(data, [](Eigen::Index, Eigen::Index, const PairSums& s) {
        return s.covariance();
    });
}

Eigen::MatrixXd corr_matrix_nan(const Eigen::MatrixXd& data) {
    core::require_non_empty(static_cast<size_t>(data.rows()), "corr_matrix_nan");
    return pairwise_matrix(data, [](Eigen::Index i, Eigen::Index j, const PairSums& s) {
        const double r = s.correlation();
        // Same column: exactly 1 whenever defined
        return (i == j && !std::isnan(r)) ? 1.0 : r;
    });
}

// ============== Rolling ==============

std::vector<double> rolling_cov(const std::vector<double>& x, const std::vector<double>& y,
                                size_t window) {
    require_pair(x, y, "rolling_cov");
    core::require_window(x.size(), window, "rolling_cov");
    return rolling_pair(x, y, window, PAIR_MIN_PERIODS, false,
                        [](const detail::SlidingCoMoments& m) { return m.covariance(); });
}

std::vector<double> rolling_corr(const std::vector<double>& x, const std::vector<double>& y,
                                 size_t window) {
    require_pair(x, y, "rolling_corr");
    core::require_window(x.size(), window, "rolling_corr");
    return rolling_pair(x, y, window, PAIR_MIN_PERIODS, false,
                        [](const detail::SlidingCoMoments& m) { return m.correlation(); });
}

std::vector<double> rolling_cov_nan(const std::vector<double>& x, const std::vector<double>& y,
                                    size_t window, const RollingOptions& options) {
    require_pair(x, y, "rolling_cov_nan");
    core::require_window(x.size(), window, "rolling_cov_nan");
    const size_t min_periods = resolve_pair_periods(options, window, "rolling_cov_nan");
    return rolling_pair(x, y, window, min_periods, true,
                        [](const detail::SlidingCoMoments& m) { return m.covariance(); });
}

std::vector<double> rolling_corr_nan(const std::vector<double>& x, const std::vector<double>& y,
                                     size_t window, const RollingOptions& options) {
    require_pair(x, y, "rolling_corr_nan");
    core::require_window(x.size(), window, "rolling_corr_nan");
    const size_t min_periods = resolve_pair_periods(options, window, "rolling_corr_nan");
    return rolling_pair(x, y, window, min_periods, true,
                        [](const detail::SlidingCoMoments& m) { return m.correlation(); });
}

} // namespace statkit::stats
