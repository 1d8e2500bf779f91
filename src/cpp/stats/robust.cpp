#include "robust.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "core/checks.hpp"
#include "stats/descriptive.hpp"

namespace statkit::stats {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

/// Denominator substituted for a zero MAD
constexpr double MAD_FLOOR = 1e-12;

}  // anonymous namespace

ScaleResult minmax_scale(const std::vector<double>& data) {
    core::require_non_empty(data, "minmax_scale");

    const auto [min_it, max_it] = std::minmax_element(data.begin(), data.end());
    const double lo = *min_it;
    const double hi = *max_it;

    ScaleResult result{std::vector<double>(data.size(), NaN), lo, hi};
    if (hi == lo) {
        return result;
    }

    const double range = hi - lo;
    for (size_t i = 0; i < data.size(); ++i) {
        result.scaled[i] = (data[i] - lo) / range;
    }
    return result;
}

ScaleResult robust_scale(const std::vector<double>& data, double scale_factor) {
    core::require_non_empty(data, "robust_scale");
    if (!(scale_factor > 0.0)) {
        throw std::invalid_argument("robust_scale: scale_factor must be positive, got " +
                                    std::to_string(scale_factor));
    }

    const double med = median(data);
    const double spread = mad(data);
    const double denom = spread == 0.0 ? MAD_FLOOR : spread * scale_factor;

    ScaleResult result{std::vector<double>(data.size()), med, spread};
    for (size_t i = 0; i < data.size(); ++i) {
        result.scaled[i] = (data[i] - med) / denom;
    }
    return result;
}

std::vector<double> winsorize(const std::vector<double>& data, double lower_q, double upper_q) {
    core::require_non_empty(data, "winsorize");
    core::require_unit_interval(lower_q, "winsorize", "lower_q");
    core::require_unit_interval(upper_q, "winsorize", "upper_q");
    if (lower_q > upper_q) {
        throw std::invalid_argument("winsorize: lower_q must not exceed upper_q");
    }

    std::vector<double> sorted = data;
    std::sort(sorted.begin(), sorted.end());
    const double low = quantile_from_sorted(sorted, lower_q);
    const double high = quantile_from_sorted(sorted, upper_q);

    std::vector<double> out(data.size());
    for (size_t i = 0; i < data.size(); ++i) {
        out[i] = std::clamp(data[i], low, high);
    }
    return out;
}

std::vector<int> quantile_bins(const std::vector<double>& data, size_t n_bins) {
    core::require_non_empty(data, "quantile_bins");
    if (n_bins == 0) {
        throw std::invalid_argument("quantile_bins: n_bins must be positive");
    }

    std::vector<double> sorted = data;
    std::sort(sorted.begin(), sorted.end());

    std::vector<double> edges(n_bins + 1);
    for (size_t k = 0; k <= n_bins; ++k) {
        edges[k] = quantile_from_sorted(sorted, static_cast<double>(k) / static_cast<double>(n_bins));
    }

    const int max_bin = static_cast<int>(n_bins) - 1;
    std::vector<int> bins(data.size());
    for (size_t i = 0; i < data.size(); ++i) {
        // First edge >= x; x sits in the bin ending at that edge
        const auto it = std::lower_bound(edges.begin(), edges.end(), data[i]);
        const int bin = static_cast<int>(it - edges.begin()) - 1;
        bins[i] = std::clamp(bin, 0, max_bin);
    }
    return bins;
}

std::vector<bool> iqr_outliers(const std::vector<double>& data, double k) {
    const QuartileResult q = iqr(data);
    const double low = q.q1 - k * q.iqr;
    const double high = q.q3 + k * q.iqr;

    std::vector<bool> flags(data.size());
    for (size_t i = 0; i < data.size(); ++i) {
        flags[i] = data[i] < low || data[i] > high;
    }
    return flags;
}

std::vector<bool> zscore_outliers(const std::vector<double>& data, double threshold) {
    const std::vector<double> z = zscore(data);
    std::vector<bool> flags(data.size());
    for (size_t i = 0; i < data.size(); ++i) {
        // NaN compares false
        flags[i] = std::abs(z[i]) > threshold;
    }
    return flags;
}

} // namespace statkit::stats
