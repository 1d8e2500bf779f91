#ifndef STATKIT_PARALLEL_HPP
#define STATKIT_PARALLEL_HPP

/**
 * @file parallel.hpp
 * @brief Intra-call parallelism configuration
 *
 * Column-wise matrix kernels and KDE grid evaluation split independent
 * outputs across OpenMP threads when the library is built with OpenMP.
 * The thread count is an explicit library option; results never depend on it.
 */

namespace statkit::core {

/**
 * @brief Set the number of threads used inside a single call
 *
 * @param n Thread count, or 0 to restore the runtime default
 * @throws std::invalid_argument if n is negative
 */
void set_num_threads(int n);

/**
 * @brief Number of threads a parallel kernel will use
 *
 * Always 1 when built without OpenMP.
 */
int num_threads() noexcept;

/// Whether the library was compiled with OpenMP support
bool openmp_enabled() noexcept;

} // namespace statkit::core

#endif // STATKIT_PARALLEL_HPP
