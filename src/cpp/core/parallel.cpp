#include "parallel.hpp"

#include <atomic>
#include <stdexcept>
#include <string>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace statkit::core {

namespace {

/// 0 means "use the OpenMP runtime default"
std::atomic<int> requested_threads{0};

}  // anonymous namespace

void set_num_threads(int n) {
    if (n < 0) {
        throw std::invalid_argument("set_num_threads: thread count must be non-negative, got " +
                                    std::to_string(n));
    }
    requested_threads.store(n, std::memory_order_relaxed);
}

int num_threads() noexcept {
#ifdef _OPENMP
    const int requested = requested_threads.load(std::memory_order_relaxed);
    return requested > 0 ? requested : omp_get_max_threads();
#else
    return 1;
#endif
}

bool openmp_enabled() noexcept {
#ifdef _OPENMP
    return true;
#else
    return false;
#endif
}

} // namespace statkit::core
