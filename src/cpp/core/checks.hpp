#ifndef STATKIT_CHECKS_HPP
#define STATKIT_CHECKS_HPP

/**
 * @file checks.hpp
 * @brief Argument validation shared by the public statistics functions
 *
 * Every check throws std::invalid_argument with the calling function's name
 * as prefix. Insufficient data is not checked here: it resolves to NaN.
 */

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace statkit::core {

inline void require_non_empty(size_t n, const char* fn) {
    if (n == 0) {
        throw std::invalid_argument(std::string(fn) + ": input must not be empty");
    }
}

inline void require_non_empty(const std::vector<double>& data, const char* fn) {
    require_non_empty(data.size(), fn);
}

inline void require_same_length(const std::vector<double>& x, const std::vector<double>& y,
                                const char* fn) {
    if (x.size() != y.size()) {
        throw std::invalid_argument(std::string(fn) + ": length mismatch (" +
                                    std::to_string(x.size()) + " vs " +
                                    std::to_string(y.size()) + ")");
    }
}

/// Window must satisfy 1 <= window <= n
inline void require_window(size_t n, size_t window, const char* fn) {
    if (window == 0 || window > n) {
        throw std::invalid_argument(std::string(fn) + ": window must be in [1, " +
                                    std::to_string(n) + "], got " + std::to_string(window));
    }
}

inline void require_periods(size_t periods, const char* fn) {
    if (periods == 0) {
        throw std::invalid_argument(std::string(fn) + ": periods must be positive");
    }
}

inline void require_unit_interval(double q, const char* fn, const char* name) {
    if (!(q >= 0.0 && q <= 1.0)) {
        throw std::invalid_argument(std::string(fn) + ": " + name + " must be in [0, 1], got " +
                                    std::to_string(q));
    }
}

} // namespace statkit::core

#endif // STATKIT_CHECKS_HPP
