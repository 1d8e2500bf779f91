/**
 * @file transforms_bindings.cpp
 * @brief pybind11 bindings for sequence transforms, ECDF and KDE
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "stats/transforms.hpp"

namespace py = pybind11;
using namespace statkit::stats;

void bind_transforms(py::module_& m) {
    py::class_<EcdfResult>(m, "EcdfResult")
        .def_readonly("values", &EcdfResult::values)
        .def_readonly("probabilities", &EcdfResult::probabilities)
        .def("__iter__", [](const EcdfResult& r) {
            return py::iter(py::make_tuple(r.values, r.probabilities));
        })
        .def("__repr__", &EcdfResult::to_string);

    py::class_<KdeResult>(m, "KdeResult")
        .def_readonly("grid", &KdeResult::grid)
        .def_readonly("density", &KdeResult::density)
        .def_readonly("bandwidth", &KdeResult::bandwidth)
        .def("__iter__", [](const KdeResult& r) {
            return py::iter(py::make_tuple(r.grid, r.density));
        })
        .def("__repr__", &KdeResult::to_string);

    m.def("diff", &diff, py::arg("x"), py::arg("periods") = 1,
          "x[i] - x[i - periods]; nan for i < periods");

    m.def("pct_change", &pct_change, py::arg("x"), py::arg("periods") = 1,
          R"doc(
          x[i] / x[i - periods] - 1.

          nan for i < periods and wherever the base is zero.

          Raises:
              ValueError: If periods is 0
          )doc");

    m.def("cumsum", &cumsum, py::arg("x"));
    m.def("cummean", &cummean, py::arg("x"));

    m.def("ecdf", &ecdf, py::arg("x"),
          "Sorted values with cumulative probabilities (i + 1) / n; unpacks as (values, probs)");

    m.def("kde_gaussian", &kde_gaussian,
          py::arg("x"), py::arg("n_points") = 256, py::arg("bandwidth") = py::none(),
          R"doc(
          Gaussian kernel density estimate on an evenly spaced grid.

          The grid spans [min - 3h, max + 3h]. Without a bandwidth, Silverman's
          rule h = 0.9 * min(sd, IQR / 1.34) * n^(-1/5) is used.

          Args:
              x: Sample
              n_points: Number of grid points (>= 2)
              bandwidth: Finite kernel bandwidth (> 0) or None

          Returns:
              KdeResult; unpacks as (grid, density)
          )doc");

    m.def("silverman_bandwidth", &silverman_bandwidth, py::arg("x"));
}
