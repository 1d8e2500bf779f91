#include "transforms.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>

#include "core/checks.hpp"
#include "core/math_utils.hpp"
#include "core/parallel.hpp"
#include "stats/descriptive.hpp"

namespace statkit::stats {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

/// Grid padding on each side, in bandwidths
constexpr double KDE_PAD = 3.0;

/// IQR of the standard normal distribution
constexpr double NORMAL_IQR = 1.34;

}  // anonymous namespace

std::vector<double> diff(const std::vector<double>& data, size_t periods) {
    core::require_periods(periods, "diff");

    std::vector<double> out(data.size(), NaN);
    for (size_t i = periods; i < data.size(); ++i) {
        out[i] = data[i] - data[i - periods];
    }
    return out;
}

std::vector<double> pct_change(const std::vector<double>& data, size_t periods) {
    core::require_periods(periods, "pct_change");

    std::vector<double> out(data.size(), NaN);
    for (size_t i = periods; i < data.size(); ++i) {
        const double change = data[i] / data[i - periods] - 1.0;
        if (std::isfinite(change)) {
            out[i] = change;
        }
    }
    return out;
}

std::vector<double> cumsum(const std::vector<double>& data) {
    std::vector<double> out(data.size());
    double running = 0.0;
    for (size_t i = 0; i < data.size(); ++i) {
        running += data[i];
        out[i] = running;
    }
    return out;
}

std::vector<double> cummean(const std::vector<double>& data) {
    std::vector<double> out = cumsum(data);
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] /= static_cast<double>(i + 1);
    }
    return out;
}

EcdfResult ecdf(const std::vector<double>& data) {
    core::require_non_empty(data, "ecdf");

    const size_t n = data.size();
    EcdfResult result{data, std::vector<double>(n)};
    std::sort(result.values.begin(), result.values.end());
    for (size_t i = 0; i < n; ++i) {
        result.probabilities[i] = static_cast<double>(i + 1) / static_cast<double>(n);
    }
    return result;
}

double silverman_bandwidth(const std::vector<double>& data) {
    core::require_non_empty(data, "silverman_bandwidth");

    const double sd = data.size() < 2 ? 0.0 : std_dev(data);
    const double spread = iqr(data).iqr / NORMAL_IQR;

    double scale = sd;
    if (spread > 0.0 && spread < sd) {
        scale = spread;
    }
    if (!(scale > 0.0)) {
        return 1.0;
    }
    return 0.9 * scale * std::pow(static_cast<double>(data.size()), -0.2);
}

KdeResult kde_gaussian(const std::vector<double>& data, size_t n_points,
                       std::optional<double> bandwidth) {
    core::require_non_empty(data, "kde_gaussian");
    if (n_points < 2) {
        throw std::invalid_argument("kde_gaussian: n_points must be at least 2, got " +
                                    std::to_string(n_points));
    }
    if (bandwidth && (!std::isfinite(*bandwidth) || !(*bandwidth > 0.0))) {
        throw std::invalid_argument("kde_gaussian: bandwidth must be positive and finite, got " +
                                    std::to_string(*bandwidth));
    }

    const double h = bandwidth ? *bandwidth : silverman_bandwidth(data);
    const auto [min_it, max_it] = std::minmax_element(data.begin(), data.end());
    const double lo = *min_it - KDE_PAD * h;
    const double hi = *max_it + KDE_PAD * h;
    const double step = (hi - lo) / static_cast<double>(n_points - 1);

    KdeResult result{std::vector<double>(n_points), std::vector<double>(n_points), h};
    const double norm = 1.0 / (static_cast<double>(data.size()) * h);
    const std::ptrdiff_t points = static_cast<std::ptrdiff_t>(n_points);

#ifdef _OPENMP
#pragma omp parallel for schedule(static) num_threads(core::num_threads())
#endif
    for (std::ptrdiff_t g = 0; g < points; ++g) {
        const double x = lo + step * static_cast<double>(g);
        double sum = 0.0;
        for (const double xi : data) {
            sum += norm_pdf((x - xi) / h);
        }
        result.grid[static_cast<size_t>(g)] = x;
        result.density[static_cast<size_t>(g)] = sum * norm;
    }

    return result;
}

} // namespace statkit::stats
