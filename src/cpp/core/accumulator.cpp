#include "accumulator.hpp"

#include <cmath>
#include <limits>

namespace statkit::core {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

}  // anonymous namespace

void Accumulator::merge(const Accumulator& other) noexcept {
    if (other.count_ == 0) {
        return;
    }
    if (count_ == 0) {
        *this = other;
        return;
    }

    const double n_a = static_cast<double>(count_);
    const double n_b = static_cast<double>(other.count_);
    const double n = n_a + n_b;
    const double delta = other.mean_ - mean_;

    mean_ += delta * n_b / n;
    m2_ += other.m2_ + delta * delta * n_a * n_b / n;
    count_ += other.count_;
}

double Accumulator::mean() const noexcept {
    return count_ == 0 ? NaN : mean_;
}

double Accumulator::variance() const noexcept {
    if (count_ < 2) {
        return NaN;
    }
    return m2_ / static_cast<double>(count_ - 1);
}

double Accumulator::std_dev() const noexcept {
    return std::sqrt(variance());
}

WelfordResult welford(const std::vector<double>& data) {
    Accumulator acc;
    for (const auto& x : data) {
        acc.add(x);
    }
    return acc.result();
}

} // namespace statkit::core
