#include "descriptive.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

#include "core/accumulator.hpp"
#include "core/checks.hpp"

namespace statkit::stats {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

std::vector<double> sorted_copy(const std::vector<double>& data) {
    std::vector<double> v = data;
    std::sort(v.begin(), v.end());
    return v;
}

}  // anonymous namespace

double mean(const std::vector<double>& data) {
    core::require_non_empty(data, "mean");
    return std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(data.size());
}

double var(const std::vector<double>& data) {
    core::require_non_empty(data, "var");
    return core::welford(data).variance;
}

double std_dev(const std::vector<double>& data) {
    return std::sqrt(var(data));
}

std::vector<double> zscore(const std::vector<double>& data) {
    core::require_non_empty(data, "zscore");
    const double m = mean(data);
    const double s = std_dev(data);

    std::vector<double> out(data.size(), NaN);
    if (!(s > 0.0)) {
        return out;
    }
    for (size_t i = 0; i < data.size(); ++i) {
        out[i] = (data[i] - m) / s;
    }
    return out;
}

double mean_nan(const std::vector<double>& data) {
    core::require_non_empty(data, "mean_nan");
    double sum = 0.0;
    size_t count = 0;
    for (const auto& x : data) {
        if (!std::isnan(x)) {
            sum += x;
            ++count;
        }
    }
    return count == 0 ? NaN : sum / static_cast<double>(count);
}

double var_nan(const std::vector<double>& data) {
    core::require_non_empty(data, "var_nan");
    core::Accumulator acc;
    for (const auto& x : data) {
        if (!std::isnan(x)) {
            acc.add(x);
        }
    }
    return acc.variance();
}

double std_nan(const std::vector<double>& data) {
    return std::sqrt(var_nan(data));
}

double quantile_from_sorted(const std::vector<double>& sorted, double q) {
    const size_t n = sorted.size();
    if (n == 0) {
        return NaN;
    }
    if (q <= 0.0) {
        return sorted.front();
    }
    if (q >= 1.0) {
        return sorted.back();
    }

    const double pos = q * static_cast<double>(n - 1);
    const size_t lower = static_cast<size_t>(std::floor(pos));
    const size_t upper = static_cast<size_t>(std::ceil(pos));
    if (lower == upper) {
        return sorted[lower];
    }
    const double w = pos - static_cast<double>(lower);
    return sorted[lower] * (1.0 - w) + sorted[upper] * w;
}

double quantile(const std::vector<double>& data, double q) {
    core::require_non_empty(data, "quantile");
    core::require_unit_interval(q, "quantile", "q");
    return quantile_from_sorted(sorted_copy(data), q);
}

double percentile(const std::vector<double>& data, double q) {
    core::require_non_empty(data, "percentile");
    if (!(q >= 0.0 && q <= 100.0)) {
        throw std::invalid_argument("percentile: q must be in [0, 100], got " + std::to_string(q));
    }
    return quantile_from_sorted(sorted_copy(data), q / 100.0);
}

double median(const std::vector<double>& data) {
    core::require_non_empty(data, "median");
    return quantile_from_sorted(sorted_copy(data), 0.5);
}

QuartileResult iqr(const std::vector<double>& data) {
    core::require_non_empty(data, "iqr");
    const std::vector<double> sorted = sorted_copy(data);
    const double q1 = quantile_from_sorted(sorted, 0.25);
    const double q3 = quantile_from_sorted(sorted, 0.75);
    return {q1, q3, q3 - q1};
}

double mad(const std::vector<double>& data) {
    core::require_non_empty(data, "mad");
    const double med = median(data);
    std::vector<double> deviations(data.size());
    for (size_t i = 0; i < data.size(); ++i) {
        deviations[i] = std::abs(data[i] - med);
    }
    std::sort(deviations.begin(), deviations.end());
    return quantile_from_sorted(deviations, 0.5);
}

double trimmed_mean(const std::vector<double>& data, double proportion) {
    core::require_non_empty(data, "trimmed_mean");
    core::require_unit_interval(proportion, "trimmed_mean", "proportion");

    const size_t n = data.size();
    const size_t cut = static_cast<size_t>(std::floor(static_cast<double>(n) * proportion / 2.0));
    if (2 * cut >= n) {
        return NaN;
    }

    const std::vector<double> sorted = sorted_copy(data);
    const double sum = std::accumulate(sorted.begin() + static_cast<std::ptrdiff_t>(cut),
                                       sorted.end() - static_cast<std::ptrdiff_t>(cut), 0.0);
    return sum / static_cast<double>(n - 2 * cut);
}

Eigen::VectorXd mean_axis(const Eigen::MatrixXd& data, int axis) {
    if (axis == 0) {
        core::require_non_empty(static_cast<size_t>(data.rows()), "mean_axis");
        return data.colwise().mean().transpose();
    }
    if (axis == 1) {
        core::require_non_empty(static_cast<size_t>(data.cols()), "mean_axis");
        return data.rowwise().mean();
    }
    throw std::invalid_argument("mean_axis: axis must be 0 or 1, got " + std::to_string(axis));
}

std::vector<int8_t> sign_mask(const std::vector<double>& data) {
    std::vector<int8_t> out(data.size());
    for (size_t i = 0; i < data.size(); ++i) {
        const double x = data[i];
        out[i] = x > 0.0 ? 1 : (x < 0.0 ? -1 : 0);
    }
    return out;
}

std::pair<std::vector<double>, std::vector<int8_t>> demean_with_signs(
    const std::vector<double>& data) {
    const double m = mean(data);
    std::vector<double> demeaned(data.size());
    for (size_t i = 0; i < data.size(); ++i) {
        demeaned[i] = data[i] - m;
    }
    std::vector<int8_t> signs = sign_mask(demeaned);
    return {std::move(demeaned), std::move(signs)};
}

std::vector<double> pad_nan(size_t n) {
    return std::vector<double>(n, NaN);
}

} // namespace statkit::stats
