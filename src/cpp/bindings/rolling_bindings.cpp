/**
 * @file rolling_bindings.cpp
 * @brief pybind11 bindings for the rolling-window statistics
 */

#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "stats/rolling.hpp"

namespace py = pybind11;
using namespace statkit::stats;

void bind_rolling(py::module_& m) {
    // ============== Result structs ==============
    py::class_<MeanStdResult>(m, "MeanStdResult")
        .def_readonly("mean", &MeanStdResult::mean)
        .def_readonly("std", &MeanStdResult::std)
        .def("__iter__", [](const MeanStdResult& r) {
            return py::iter(py::make_tuple(r.mean, r.std));
        })
        .def("__repr__", &MeanStdResult::to_string);

    py::class_<MatrixMeanStdResult>(m, "MatrixMeanStdResult")
        .def_readonly("mean", &MatrixMeanStdResult::mean)
        .def_readonly("std", &MatrixMeanStdResult::std)
        .def("__iter__", [](const MatrixMeanStdResult& r) {
            return py::iter(py::make_tuple(r.mean, r.std));
        });

    // ============== Sequences ==============
    m.def("rolling_mean", &rolling_mean, py::arg("x"), py::arg("window"),
          R"doc(
          Mean of each window [i - window + 1, i].

          The output has the input's length; positions before the first full
          window are nan. Each step costs O(1).

          Args:
              x: Input sequence (no nan)
              window: Window size in [1, len(x)]

          Raises:
              ValueError: If x is empty or window is out of range
          )doc");

    m.def("rolling_var", &rolling_var, py::arg("x"), py::arg("window"),
          "Sample variance (ddof = 1) of each window");

    m.def("rolling_std", &rolling_std, py::arg("x"), py::arg("window"),
          "Sample standard deviation (ddof = 1) of each window");

    m.def("rolling_zscore", &rolling_zscore, py::arg("x"), py::arg("window"),
          "(x[i] - rolling_mean[i]) / rolling_std[i]; nan for constant windows");

    m.def("rolling_mean_std", &rolling_mean_std, py::arg("x"), py::arg("window"),
          "Rolling mean and std from one sliding pass; unpacks as (mean, std)");

    m.def("ewma", &ewma, py::arg("x"), py::arg("alpha"),
          R"doc(
          Exponentially weighted moving average without bias adjustment.

          out[0] = x[0], out[i] = alpha * x[i] + (1 - alpha) * out[i - 1]

          Raises:
              ValueError: If x is empty or alpha is outside (0, 1]
          )doc");

    // ============== NaN-aware sequences ==============
    m.def("rolling_mean_nan",
          [](const std::vector<double>& x, size_t window, size_t min_periods) {
              return rolling_mean_nan(x, window, RollingOptions(min_periods));
          },
          py::arg("x"), py::arg("window"), py::arg("min_periods") = 0,
          R"doc(
          Rolling mean over the non-nan values of each window.

          Args:
              x: Input sequence, may contain nan
              window: Window size in [1, len(x)]
              min_periods: Minimum valid values per window (0 selects 1)
          )doc");

    m.def("rolling_var_nan",
          [](const std::vector<double>& x, size_t window, size_t min_periods) {
              return rolling_var_nan(x, window, RollingOptions(min_periods));
          },
          py::arg("x"), py::arg("window"), py::arg("min_periods") = 0,
          "Rolling variance over the non-nan values (min_periods default and floor: 2)");

    m.def("rolling_std_nan",
          [](const std::vector<double>& x, size_t window, size_t min_periods) {
              return rolling_std_nan(x, window, RollingOptions(min_periods));
          },
          py::arg("x"), py::arg("window"), py::arg("min_periods") = 0,
          "Rolling std over the non-nan values (min_periods default and floor: 2)");

    m.def("rolling_zscore_nan",
          [](const std::vector<double>& x, size_t window, size_t min_periods) {
              return rolling_zscore_nan(x, window, RollingOptions(min_periods));
          },
          py::arg("x"), py::arg("window"), py::arg("min_periods") = 0,
          "Rolling z-score over the non-nan values; nan where x[i] is nan");

    // ============== Matrices ==============
    m.def("rolling_mean_axis0", &rolling_mean_axis0, py::arg("a"), py::arg("window"),
          "Rolling mean of every column");
    m.def("rolling_var_axis0", &rolling_var_axis0, py::arg("a"), py::arg("window"),
          "Rolling variance of every column");
    m.def("rolling_std_axis0", &rolling_std_axis0, py::arg("a"), py::arg("window"),
          "Rolling std of every column");
    m.def("rolling_mean_std_axis0", &rolling_mean_std_axis0, py::arg("a"), py::arg("window"),
          "Rolling mean and std of every column; unpacks as (mean, std)");
}
