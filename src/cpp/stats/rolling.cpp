#include "rolling.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "core/checks.hpp"
#include "core/parallel.hpp"
#include "stats/sliding_window.hpp"

namespace statkit::stats {

namespace {

using detail::NaN;

/// Fewest observations a mean-type window can be computed from
constexpr size_t MEAN_MIN_PERIODS = 1;

/// Fewest observations a variance-type window can be computed from
constexpr size_t VAR_MIN_PERIODS = 2;

size_t resolve_min_periods(const RollingOptions& options, size_t window, size_t hard_min,
                           const char* fn) {
    if (options.min_periods > window) {
        throw std::invalid_argument(std::string(fn) + ": min_periods must not exceed window (" +
                                    std::to_string(options.min_periods) + " > " +
                                    std::to_string(window) + ")");
    }
    return std::max(options.min_periods, hard_min);
}

// ============== Kernels over raw buffers ==============
// out must hold n values; positions before the first full window become NaN.

template <typename Valid>
void mean_kernel(const double* x, size_t n, size_t window, size_t min_periods, Valid valid,
                 double* out) {
    std::fill(out, out + n, NaN);
    detail::slide(x, n, window, valid, [&](size_t i, const detail::SlidingMoments& m) {
        if (m.count() >= min_periods) {
            out[i] = m.mean();
        }
    });
}

template <typename Valid>
void var_kernel(const double* x, size_t n, size_t window, size_t min_periods, Valid valid,
                double* out) {
    std::fill(out, out + n, NaN);
    detail::slide(x, n, window, valid, [&](size_t i, const detail::SlidingMoments& m) {
        if (m.count() >= min_periods) {
            out[i] = m.variance();
        }
    });
}

template <typename Valid>
void std_kernel(const double* x, size_t n, size_t window, size_t min_periods, Valid valid,
                double* out) {
    var_kernel(x, n, window, min_periods, valid, out);
    for (size_t i = 0; i < n; ++i) {
        out[i] = std::sqrt(out[i]);
    }
}

template <typename Valid>
void zscore_kernel(const double* x, size_t n, size_t window, size_t min_periods, Valid valid,
                   double* out) {
    std::fill(out, out + n, NaN);
    detail::slide(x, n, window, valid, [&](size_t i, const detail::SlidingMoments& m) {
        if (!valid(x[i]) || m.count() < min_periods) {
            return;
        }
        const double v = m.variance();
        if (v > 0.0) {
            out[i] = (x[i] - m.mean()) / std::sqrt(v);
        }
    });
}

void mean_std_kernel(const double* x, size_t n, size_t window, double* mean_out,
                     double* std_out) {
    std::fill(mean_out, mean_out + n, NaN);
    std::fill(std_out, std_out + n, NaN);
    detail::slide(x, n, window, detail::AllValid{},
                  [&](size_t i, const detail::SlidingMoments& m) {
                      mean_out[i] = m.mean();
                      std_out[i] = std::sqrt(m.variance());
                  });
}

/**
 * @brief Apply a column kernel to every column of a column-major matrix
 *
 * Columns are independent, so they are split across threads.
 */
template <typename Kernel>
Eigen::MatrixXd apply_columns(const Eigen::MatrixXd& data, size_t window, const char* fn,
                              Kernel kernel) {
    const size_t rows = static_cast<size_t>(data.rows());
    core::require_non_empty(rows, fn);
    core::require_window(rows, window, fn);

    Eigen::MatrixXd out(data.rows(), data.cols());
    const Eigen::Index cols = data.cols();

#ifdef _OPENMP
#pragma omp parallel for schedule(static) num_threads(core::num_threads())
#endif
    for (Eigen::Index j = 0; j < cols; ++j) {
        kernel(data.col(j).data(), rows, window, out.col(j).data());
    }

    return out;
}

}  // anonymous namespace

// ============== Sequences ==============

std::vector<double> rolling_mean(const std::vector<double>& data, size_t window) {
    core::require_non_empty(data, "rolling_mean");
    core::require_window(data.size(), window, "rolling_mean");

    std::vector<double> out(data.size());
    mean_kernel(data.data(), data.size(), window, MEAN_MIN_PERIODS, detail::AllValid{},
                out.data());
    return out;
}

std::vector<double> rolling_var(const std::vector<double>& data, size_t window) {
    core::require_non_empty(data, "rolling_var");
    core::require_window(data.size(), window, "rolling_var");

    std::vector<double> out(data.size());
    var_kernel(data.data(), data.size(), window, VAR_MIN_PERIODS, detail::AllValid{},
               out.data());
    return out;
}

std::vector<double> rolling_std(const std::vector<double>& data, size_t window) {
    core::require_non_empty(data, "rolling_std");
    core::require_window(data.size(), window, "rolling_std");

    std::vector<double> out(data.size());
    std_kernel(data.data(), data.size(), window, VAR_MIN_PERIODS, detail::AllValid{},
               out.data());
    return out;
}

std::vector<double> rolling_zscore(const std::vector<double>& data, size_t window) {
    core::require_non_empty(data, "rolling_zscore");
    core::require_window(data.size(), window, "rolling_zscore");

    std::vector<double> out(data.size());
    zscore_kernel(data.data(), data.size(), window, VAR_MIN_PERIODS, detail::AllValid{},
                  out.data());
    return out;
}

MeanStdResult rolling_mean_std(const std::vector<double>& data, size_t window) {
    core::require_non_empty(data, "rolling_mean_std");
    core::require_window(data.size(), window, "rolling_mean_std");

    MeanStdResult result{std::vector<double>(data.size()), std::vector<double>(data.size())};
    mean_std_kernel(data.data(), data.size(), window, result.mean.data(), result.std.data());
    return result;
}

std::vector<double> ewma(const std::vector<double>& data, double alpha) {
    core::require_non_empty(data, "ewma");
    if (!(alpha > 0.0 && alpha <= 1.0)) {
        throw std::invalid_argument("ewma: alpha must be in (0, 1], got " + std::to_string(alpha));
    }

    std::vector<double> out(data.size());
    out[0] = data[0];
    for (size_t i = 1; i < data.size(); ++i) {
        out[i] = alpha * data[i] + (1.0 - alpha) * out[i - 1];
    }
    return out;
}

// ============== NaN-aware sequences ==============

std::vector<double> rolling_mean_nan(const std::vector<double>& data, size_t window,
                                     const RollingOptions& options) {
    core::require_non_empty(data, "rolling_mean_nan");
    core::require_window(data.size(), window, "rolling_mean_nan");
    const size_t min_periods =
        resolve_min_periods(options, window, MEAN_MIN_PERIODS, "rolling_mean_nan");

    std::vector<double> out(data.size());
    mean_kernel(data.data(), data.size(), window, min_periods, detail::NotNaN{}, out.data());
    return out;
}

std::vector<double> rolling_var_nan(const std::vector<double>& data, size_t window,
                                    const RollingOptions& options) {
    core::require_non_empty(data, "rolling_var_nan");
    core::require_window(data.size(), window, "rolling_var_nan");
    const size_t min_periods =
        resolve_min_periods(options, window, VAR_MIN_PERIODS, "rolling_var_nan");

    std::vector<double> out(data.size());
    var_kernel(data.data(), data.size(), window, min_periods, detail::NotNaN{}, out.data());
    return out;
}

std::vector<double> rolling_std_nan(const std::vector<double>& data, size_t window,
                                    const RollingOptions& options) {
    core::require_non_empty(data, "rolling_std_nan");
    core::require_window(data.size(), window, "rolling_std_nan");
    const size_t min_periods =
        resolve_min_periods(options, window, VAR_MIN_PERIODS, "rolling_std_nan");

    std::vector<double> out(data.size());
    std_kernel(data.data(), data.size(), window, min_periods, detail::NotNaN{}, out.data());
    return out;
}

std::vector<double> rolling_zscore_nan(const std::vector<double>& data, size_t window,
                                       const RollingOptions& options) {
    core::require_non_empty(data, "rolling_zscore_nan");
    core::require_window(data.size(), window, "rolling_zscore_nan");
    const size_t min_periods =
        resolve_min_periods(options, window, VAR_MIN_PERIODS, "rolling_zscore_nan");

    std::vector<double> out(data.size());
    zscore_kernel(data.data(), data.size(), window, min_periods, detail::NotNaN{}, out.data());
    return out;
}

// ============== Matrices ==============

Eigen::MatrixXd rolling_mean_axis0(const Eigen::MatrixXd& data, size_t window) {
    return apply_columns(data, window, "rolling_mean_axis0",
                         [](const double* x, size_t n, size_t w, double* out) {
                             mean_kernel(x, n, w, MEAN_MIN_PERIODS, detail::AllValid{}, out);
                         });
}

Eigen::MatrixXd rolling_var_axis0(const Eigen::MatrixXd& data, size_t window) {
    return apply_columns(data, window, "rolling_var_axis0",
                         [](const double* x, size_t n, size_t w, double* out) {
                             var_kernel(x, n, w, VAR_MIN_PERIODS, detail::AllValid{}, out);
                         });
}

Eigen::MatrixXd rolling_std_axis0(const Eigen::MatrixXd& data, size_t window) {
    return apply_columns(data, window, "rolling_std_axis0",
                         [](const double* x, size_t n, size_t w, double* out) {
                             std_kernel(x, n, w, VAR_MIN_PERIODS, detail::AllValid{}, out);
                         });
}

MatrixMeanStdResult rolling_mean_std_axis0(const Eigen::MatrixXd& data, size_t window) {
    const size_t rows = static_cast<size_t>(data.rows());
    core::require_non_empty(rows, "rolling_mean_std_axis0");
    core::require_window(rows, window, "rolling_mean_std_axis0");

    MatrixMeanStdResult result{Eigen::MatrixXd(data.rows(), data.cols()),
                               Eigen::MatrixXd(data.rows(), data.cols())};
    const Eigen::Index cols = data.cols();

#ifdef _OPENMP
#pragma omp parallel for schedule(static) num_threads(core::num_threads())
#endif
    for (Eigen::Index j = 0; j < cols; ++j) {
        mean_std_kernel(data.col(j).data(), rows, window, result.mean.col(j).data(),
                        result.std.col(j).data());
    }

    return result;
}

} // namespace statkit::stats
