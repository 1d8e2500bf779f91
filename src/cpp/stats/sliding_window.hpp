#ifndef STATKIT_SLIDING_WINDOW_HPP
#define STATKIT_SLIDING_WINDOW_HPP

/**
 * @file sliding_window.hpp
 * @brief O(1)-per-step sliding moments shared by the rolling kernels
 *
 * The window state is the Accumulator's (count, mean, M2), extended with the
 * inverse update so the oldest observation can leave the window:
 *
 *   add:    n <- n + 1;  d = x - mean;  mean += d / n;  M2 += d (x - mean)
 *   remove: d = x - mean;  n <- n - 1;  mean -= d / n;  M2 -= d (x - mean)
 *
 * Pairs carry the co-moment C = Σ(x - mean_x)(y - mean_y) the same way.
 * M2 is clamped at zero against rounding. A window whose values are all
 * identical is detected from the run length of the most recent equal values
 * and snaps to an exact mean and zero variance.
 *
 * Removal cancels terms, so its rounding error scales with the removed
 * deviations rather than with the spread left in the window. The removed
 * mass Σ|d (x - mean)| is tracked, and the state is rebuilt from the window's
 * data once it exceeds REBUILD_RATIO times the remaining M2 (a large value
 * leaving a quiet window) and in any case every `window` steps.
 *
 * Plain and NaN-aware variants share one loop, parameterized by a validity
 * predicate: AllValid admits every element, NotNaN skips missing ones.
 */

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>

namespace statkit::stats::detail {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

/// Removed mass, relative to the remaining M2, that forces a rebuild
constexpr double REBUILD_RATIO = 1e3;

struct AllValid {
    bool operator()(double) const noexcept { return true; }
};

struct NotNaN {
    bool operator()(double x) const noexcept { return !std::isnan(x); }
};

/**
 * @brief Length of the run of identical values at the end of the window
 */
class RunTracker {
public:
    void push(double x) noexcept {
        if (run_ > 0 && x == last_) {
            ++run_;
        } else {
            last_ = x;
            run_ = 1;
        }
    }

    /// True when the newest `count` values are all equal
    bool covers(size_t count) const noexcept { return count > 0 && run_ >= count; }

    double value() const noexcept { return last_; }

private:
    double last_ = 0.0;
    size_t run_ = 0;
};

/**
 * @brief Count, mean and M2 of the valid observations in the active window
 */
class SlidingMoments {
public:
    void add(double x) noexcept {
        ++count_;
        const double d = x - mean_;
        mean_ += d / static_cast<double>(count_);
        m2_ += d * (x - mean_);
        run_.push(x);
        snap();
    }

    void remove(double x) noexcept {
        if (count_ <= 1) {
            clear();
            return;
        }
        const double d = x - mean_;
        --count_;
        mean_ -= d / static_cast<double>(count_);
        const double term = d * (x - mean_);
        m2_ -= term;
        removed_ += std::abs(term);
        snap();
    }

    /// Recompute from the valid elements of [first, first + len)
    template <typename Valid>
    void rebuild(const double* first, size_t len, Valid valid) noexcept {
        clear();
        run_ = RunTracker();
        for (size_t k = 0; k < len; ++k) {
            if (valid(first[k])) add(first[k]);
        }
    }

    /// Removal residue may no longer be negligible against M2
    bool stale() const noexcept { return removed_ > REBUILD_RATIO * m2_; }

    size_t count() const noexcept { return count_; }

    double mean() const noexcept {
        if (count_ == 0) return NaN;
        return mean_;
    }

    /// Sample variance, NaN for fewer than two values
    double variance() const noexcept {
        if (count_ < 2) return NaN;
        return std::max(m2_, 0.0) / static_cast<double>(count_ - 1);
    }

private:
    void clear() noexcept {
        count_ = 0;
        mean_ = 0.0;
        m2_ = 0.0;
        removed_ = 0.0;
    }

    /// A window of identical values has an exact state
    void snap() noexcept {
        if (run_.covers(count_)) {
            mean_ = run_.value();
            m2_ = 0.0;
            removed_ = 0.0;
        }
    }

    size_t count_ = 0;
    double mean_ = 0.0;
    double m2_ = 0.0;
    double removed_ = 0.0;
    RunTracker run_;
};

/**
 * @brief Co-moments of the valid (x, y) pairs in the active window
 *
 * The valid-pair count is tracked on its own: a pair contributes only when
 * both members are valid.
 */
class SlidingCoMoments {
public:
    void add(double x, double y) noexcept {
        ++count_;
        const double n = static_cast<double>(count_);
        const double dx = x - mean_x_;
        const double dy = y - mean_y_;
        mean_x_ += dx / n;
        mean_y_ += dy / n;
        c_ += dx * (y - mean_y_);
        m2_x_ += dx * (x - mean_x_);
        m2_y_ += dy * (y - mean_y_);
        run_x_.push(x);
        run_y_.push(y);
        snap();
    }

    void remove(double x, double y) noexcept {
        if (count_ <= 1) {
            clear();
            return;
        }
        const double dx = x - mean_x_;
        const double dy = y - mean_y_;
        --count_;
        const double n = static_cast<double>(count_);
        mean_x_ -= dx / n;
        mean_y_ -= dy / n;
        c_ -= (x - mean_x_) * dy;
        const double term_x = dx * (x - mean_x_);
        const double term_y = dy * (y - mean_y_);
        m2_x_ -= term_x;
        m2_y_ -= term_y;
        removed_x_ += std::abs(term_x);
        removed_y_ += std::abs(term_y);
        snap();
    }

    /// Recompute from the pairs in [0, len) where both members are valid
    template <typename Valid>
    void rebuild(const double* x, const double* y, size_t len, Valid valid) noexcept {
        clear();
        run_x_ = RunTracker();
        run_y_ = RunTracker();
        for (size_t k = 0; k < len; ++k) {
            if (valid(x[k]) && valid(y[k])) add(x[k], y[k]);
        }
    }

    bool stale() const noexcept {
        return removed_x_ > REBUILD_RATIO * m2_x_ || removed_y_ > REBUILD_RATIO * m2_y_;
    }

    size_t count() const noexcept { return count_; }

    /// Sample covariance; NaN for fewer than two pairs
    double covariance() const noexcept {
        if (count_ < 2) return NaN;
        if (run_x_.covers(count_) || run_y_.covers(count_)) return 0.0;
        return c_ / static_cast<double>(count_ - 1);
    }

    /// Pearson correlation clamped to [-1, 1]; NaN if either side is constant
    double correlation() const noexcept {
        if (count_ < 2) return NaN;
        if (run_x_.covers(count_) || run_y_.covers(count_)) return NaN;
        const double sxx = std::max(m2_x_, 0.0);
        const double syy = std::max(m2_y_, 0.0);
        if (sxx == 0.0 || syy == 0.0) return NaN;
        return std::clamp(c_ / std::sqrt(sxx * syy), -1.0, 1.0);
    }

private:
    void clear() noexcept {
        count_ = 0;
        mean_x_ = mean_y_ = c_ = m2_x_ = m2_y_ = 0.0;
        removed_x_ = removed_y_ = 0.0;
    }

    /// A constant side has an exact mean, no spread and no co-moment
    void snap() noexcept {
        if (run_x_.covers(count_)) {
            mean_x_ = run_x_.value();
            m2_x_ = c_ = removed_x_ = 0.0;
        }
        if (run_y_.covers(count_)) {
            mean_y_ = run_y_.value();
            m2_y_ = c_ = removed_y_ = 0.0;
        }
    }

    size_t count_ = 0;
    double mean_x_ = 0.0;
    double mean_y_ = 0.0;
    double c_ = 0.0;
    double m2_x_ = 0.0;
    double m2_y_ = 0.0;
    double removed_x_ = 0.0;
    double removed_y_ = 0.0;
    RunTracker run_x_;
    RunTracker run_y_;
};

/**
 * @brief Slide a window of size w over data[0..n) and report each full window
 *
 * emit(i, moments) is called for every i >= w - 1 with the moments of the
 * valid elements in [i - w + 1, i]. The caller fills earlier positions.
 */
template <typename Valid, typename Emit>
void slide(const double* data, size_t n, size_t window, Valid valid, Emit emit) {
    SlidingMoments moments;
    size_t since_rebuild = 0;
    for (size_t i = 0; i < n; ++i) {
        if (i >= window) {
            const double leaving = data[i - window];
            if (valid(leaving)) moments.remove(leaving);
            if (++since_rebuild >= window || moments.stale()) {
                moments.rebuild(data + (i + 1 - window), window - 1, valid);
                since_rebuild = 0;
            }
        }
        if (valid(data[i])) moments.add(data[i]);
        if (i + 1 >= window) {
            emit(i, moments);
        }
    }
}

/**
 * @brief Pairwise counterpart of slide(); a pair is valid when both members are
 */
template <typename Valid, typename Emit>
void slide_pairs(const double* x, const double* y, size_t n, size_t window, Valid valid,
                 Emit emit) {
    SlidingCoMoments moments;
    size_t since_rebuild = 0;
    for (size_t i = 0; i < n; ++i) {
        if (i >= window) {
            const size_t j = i - window;
            if (valid(x[j]) && valid(y[j])) moments.remove(x[j], y[j]);
            if (++since_rebuild >= window || moments.stale()) {
                moments.rebuild(x + j + 1, y + j + 1, window - 1, valid);
                since_rebuild = 0;
            }
        }
        if (valid(x[i]) && valid(y[i])) moments.add(x[i], y[i]);
        if (i + 1 >= window) {
            emit(i, moments);
        }
    }
}

}  // namespace statkit::stats::detail

#endif  // STATKIT_SLIDING_WINDOW_HPP
