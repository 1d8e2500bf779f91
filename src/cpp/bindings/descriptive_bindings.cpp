/**
 * @file descriptive_bindings.cpp
 * @brief pybind11 bindings for the accumulator, descriptive and robust statistics
 */

#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "core/accumulator.hpp"
#include "stats/descriptive.hpp"
#include "stats/robust.hpp"

namespace py = pybind11;
using namespace statkit::core;
using namespace statkit::stats;

void bind_descriptive(py::module_& m) {
    // ============== Accumulator ==============
    py::class_<WelfordResult>(m, "WelfordResult",
        R"doc(
        One-pass summary of a sequence.

        Attributes:
            mean: Arithmetic mean (nan when count == 0)
            variance: Sample variance, ddof = 1 (nan when count < 2)
            count: Number of observations
        )doc")
        .def_readonly("mean", &WelfordResult::mean)
        .def_readonly("variance", &WelfordResult::variance)
        .def_readonly("count", &WelfordResult::count)
        .def("__repr__", &WelfordResult::to_string);

    py::class_<Accumulator>(m, "Accumulator",
        R"doc(
        Incremental mean/variance accumulator (Welford's algorithm).

        Each insertion updates the count, the running mean and the sum of
        squared deviations M2 without forming large intermediate sums.
        Accumulators built on disjoint chunks can be merged exactly.

        Example:
            >>> acc = Accumulator()
            >>> for x in stream:
            ...     acc.add(x)
            >>> acc.mean(), acc.variance()
        )doc")
        .def(py::init<>())
        .def("add", &Accumulator::add, py::arg("x"), "Insert one observation")
        .def("merge", &Accumulator::merge, py::arg("other"),
             "Combine another accumulator into this one")
        .def("reset", &Accumulator::reset, "Forget all observations")
        .def("count", &Accumulator::count)
        .def("mean", &Accumulator::mean, "Running mean, nan if empty")
        .def("variance", &Accumulator::variance, "Sample variance, nan if fewer than 2")
        .def("std_dev", &Accumulator::std_dev)
        .def("result", &Accumulator::result)
        .def("__repr__", [](const Accumulator& a) { return a.result().to_string(); });

    m.def("welford", &welford, py::arg("x"),
          "Mean, sample variance and count of x in one pass");

    // ============== Descriptive ==============
    py::class_<QuartileResult>(m, "QuartileResult")
        .def_readonly("q1", &QuartileResult::q1)
        .def_readonly("q3", &QuartileResult::q3)
        .def_readonly("iqr", &QuartileResult::iqr)
        .def("__repr__", &QuartileResult::to_string);

    m.def("mean", &mean, py::arg("x"),
          R"doc(
          Arithmetic mean.

          Raises:
              ValueError: If x is empty
          )doc");

    m.def("var", &var, py::arg("x"),
          "Sample variance (ddof = 1); nan for a single observation");

    m.def("std_dev", &std_dev, py::arg("x"),
          "Sample standard deviation (ddof = 1)");

    m.def("zscore", &zscore, py::arg("x"),
          "(x - mean) / std per element; all nan when std is zero");

    m.def("mean_nan", &mean_nan, py::arg("x"), "Mean of the non-nan values");
    m.def("var_nan", &var_nan, py::arg("x"), "Sample variance of the non-nan values");
    m.def("std_nan", &std_nan, py::arg("x"), "Sample standard deviation of the non-nan values");

    m.def("quantile", &quantile, py::arg("x"), py::arg("q"),
          R"doc(
          Quantile with linear interpolation at position q * (n - 1).

          Args:
              x: Input sequence
              q: Quantile in [0, 1]

          Raises:
              ValueError: If x is empty or q is outside [0, 1]
          )doc");

    m.def("percentile", &percentile, py::arg("x"), py::arg("q"),
          R"doc(
          Percentile with q in [0, 100]; equivalent to quantile(x, q / 100).

          Raises:
              ValueError: If x is empty or q is outside [0, 100]
          )doc");

    m.def("median", &median, py::arg("x"));

    m.def("iqr", &iqr, py::arg("x"),
          "Quartiles and interquartile range as a QuartileResult");

    m.def("mad", &mad, py::arg("x"),
          "Median absolute deviation (no consistency constant)");

    m.def("trimmed_mean", &trimmed_mean, py::arg("x"), py::arg("proportion"),
          R"doc(
          Mean after discarding floor(n * proportion / 2) values from each tail.

          Returns nan when trimming leaves nothing.
          )doc");

    m.def("mean_axis", &mean_axis, py::arg("a"), py::arg("axis") = 0,
          "Matrix means: one per column for axis=0, one per row for axis=1");

    m.def("sign_mask", &sign_mask, py::arg("x"), "-1, 0 or +1 per element");
    m.def("demean_with_signs", &demean_with_signs, py::arg("x"),
          "Tuple (x - mean, sign of each residual)");
    m.def("pad_nan", &pad_nan, py::arg("n"), "List of n nan values");

    // ============== Robust ==============
    py::class_<ScaleResult>(m, "ScaleResult",
        R"doc(
        Scaled sequence with the statistics used to scale it.

        Attributes:
            scaled: Transformed values
            center: min (minmax_scale) or median (robust_scale)
            spread: max (minmax_scale) or MAD (robust_scale)
        )doc")
        .def_readonly("scaled", &ScaleResult::scaled)
        .def_readonly("center", &ScaleResult::center)
        .def_readonly("spread", &ScaleResult::spread)
        .def("__repr__", &ScaleResult::to_string);

    m.def("minmax_scale", &minmax_scale, py::arg("x"),
          "(x - min) / (max - min); all nan when max == min");

    m.def("robust_scale", &robust_scale, py::arg("x"), py::arg("scale_factor") = 1.0,
          R"doc(
          (x - median) / (MAD * scale_factor).

          A zero MAD is replaced by 1e-12 so the result stays finite.
          Use scale_factor=1.4826 for consistency with the standard deviation
          under normality.
          )doc");

    m.def("winsorize", &winsorize, py::arg("x"), py::arg("lower_q"), py::arg("upper_q"),
          "Clip values to the [lower_q, upper_q] quantile range");

    m.def("quantile_bins", &quantile_bins, py::arg("x"), py::arg("n_bins"),
          "Equal-frequency bin index in [0, n_bins - 1] per element");

    m.def("iqr_outliers", &iqr_outliers, py::arg("x"), py::arg("k") = 1.5,
          "Flag values outside [Q1 - k*IQR, Q3 + k*IQR]");

    m.def("zscore_outliers", &zscore_outliers, py::arg("x"), py::arg("threshold") = 3.0,
          "Flag values with |z| > threshold");
}
