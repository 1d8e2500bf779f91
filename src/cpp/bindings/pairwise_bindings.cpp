/**
 * @file pairwise_bindings.cpp
 * @brief pybind11 bindings for covariance and correlation
 */

#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "stats/pairwise.hpp"

namespace py = pybind11;
using namespace statkit::stats;

void bind_pairwise(py::module_& m) {
    // ============== Pairs ==============
    m.def("cov", &cov, py::arg("x"), py::arg("y"),
          R"doc(
          Sample covariance (ddof = 1) of two equal-length sequences.

          Raises:
              ValueError: If the sequences are empty or differ in length
          )doc");

    m.def("corr", &corr, py::arg("x"), py::arg("y"),
          "Pearson correlation in [-1, 1]; nan if either sequence is constant");

    m.def("cov_nan", &cov_nan, py::arg("x"), py::arg("y"),
          "Covariance over the indices where both values are present");

    m.def("corr_nan", &corr_nan, py::arg("x"), py::arg("y"),
          "Correlation over the indices where both values are present");

    // ============== Matrices ==============
    m.def("cov_matrix", &cov_matrix, py::arg("a"),
          "Covariance matrix of the columns of a (rows are observations)");

    m.def("corr_matrix", &corr_matrix, py::arg("a"),
          R"doc(
          Correlation matrix of the columns of a.

          The diagonal is exactly 1; a constant column gives nan across its
          row and column.
          )doc");

    m.def("cov_matrix_nan", &cov_matrix_nan, py::arg("a"),
          "Covariance matrix from pairwise-complete observations");

    m.def("corr_matrix_nan", &corr_matrix_nan, py::arg("a"),
          "Correlation matrix from pairwise-complete observations");

    // ============== Rolling ==============
    m.def("rolling_cov", &rolling_cov, py::arg("x"), py::arg("y"), py::arg("window"),
          "Sample covariance of each window of pairs");

    m.def("rolling_corr", &rolling_corr, py::arg("x"), py::arg("y"), py::arg("window"),
          "Pearson correlation of each window of pairs");

    m.def("rolling_cov_nan",
          [](const std::vector<double>& x, const std::vector<double>& y, size_t window,
             size_t min_periods) {
              return rolling_cov_nan(x, y, window, RollingOptions(min_periods));
          },
          py::arg("x"), py::arg("y"), py::arg("window"), py::arg("min_periods") = 0,
          R"doc(
          Rolling covariance over the complete pairs of each window.

          A pair counts only when both values are present. Windows with fewer
          than max(2, min_periods) complete pairs are nan.
          )doc");

    m.def("rolling_corr_nan",
          [](const std::vector<double>& x, const std::vector<double>& y, size_t window,
             size_t min_periods) {
              return rolling_corr_nan(x, y, window, RollingOptions(min_periods));
          },
          py::arg("x"), py::arg("y"), py::arg("window"), py::arg("min_periods") = 0,
          "Rolling correlation over the complete pairs of each window");
}
