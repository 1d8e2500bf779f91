/**
 * @file statkit_cpp.cpp
 * @brief Main pybind11 module combining all C++ bindings
 *
 * This creates the 'statkit_cpp' Python extension module. All functions live
 * in one flat namespace whose names come from the function catalogue.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <stdexcept>
#include <string>

#include "api/catalogue.hpp"
#include "core/parallel.hpp"

namespace py = pybind11;

// Forward declarations of binding functions
void bind_descriptive(py::module_& m);
void bind_rolling(py::module_& m);
void bind_pairwise(py::module_& m);
void bind_transforms(py::module_& m);
void bind_inference(py::module_& m);

namespace {

void bind_configuration(py::module_& m) {
    m.def("set_num_threads", &statkit::core::set_num_threads,
          py::arg("n"),
          R"doc(
          Set the number of threads used inside a single call.

          Only column-wise matrix kernels and KDE grid evaluation are split
          across threads; results do not depend on the thread count.

          Args:
              n: Thread count, or 0 to restore the OpenMP runtime default

          Raises:
              ValueError: If n is negative
          )doc");

    m.def("get_num_threads", &statkit::core::num_threads,
          "Number of threads a parallel kernel will use (1 without OpenMP)");

    m.def("openmp_enabled", &statkit::core::openmp_enabled,
          "Whether the extension was compiled with OpenMP support");
}

}  // anonymous namespace

/**
 * @brief Main Python module definition
 *
 * Binds every component into the top-level module, then publishes the
 * catalogue as __all__ and verifies that each catalogued name exists.
 */
PYBIND11_MODULE(statkit_cpp, m) {
    m.doc() = R"doc(
        Statistics C++ Extension Module

        Descriptive, robust, rolling-window, pairwise and inferential
        statistics over float64 sequences and matrices.

        Conventions:
            - Variances and standard deviations use ddof = 1
            - Rolling outputs have the input's length, NaN before the first
              full window
            - Functions with the _nan suffix skip missing values
            - Invalid arguments raise ValueError; insufficient data gives NaN

        Example:
            >>> from statkit import statkit_cpp as sk
            >>> sk.rolling_mean([1.0, 2.0, 3.0, 4.0], 2)
            [nan, 1.5, 2.5, 3.5]
            >>> sk.corr([1.0, 2.0, 3.0], [2.0, 4.0, 7.0])
            0.9933992677987828
            >>> res = sk.mann_whitney_u(x, y, alternative="greater")
            >>> res.statistic, res.p_value

        References:
            - Welford (1962): "Note on a method for calculating corrected sums
              of squares and products"
            - Silverman (1986): "Density Estimation for Statistics and Data Analysis"
    )doc";

    bind_descriptive(m);
    bind_rolling(m);
    bind_pairwise(m);
    bind_transforms(m);
    bind_inference(m);
    bind_configuration(m);

    py::list names;
    for (const auto& entry : statkit::api::function_catalogue()) {
        if (!py::hasattr(m, entry.name.c_str())) {
            throw std::runtime_error("statkit_cpp: catalogued name '" + entry.name +
                                     "' is not bound");
        }
        names.append(entry.name);
    }
    m.attr("__all__") = names;

    // Add version information
    m.attr("__version__") = statkit::api::kApiVersion;
}
