/**
 * @file inference_bindings.cpp
 * @brief pybind11 bindings for hypothesis tests and effect sizes
 */

#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <optional>
#include <string>

#include "stats/inference.hpp"

namespace py = pybind11;
using namespace statkit::stats;

void bind_inference(py::module_& m) {
    // ============== Result structs ==============
    py::class_<TTestResult>(m, "TTestResult",
        R"doc(
        Result of a t-test.

        Attributes:
            statistic: t statistic
            p_value: p-value under the requested alternative
            df: Degrees of freedom (fractional for Welch)
        )doc")
        .def_readonly("statistic", &TTestResult::statistic)
        .def_readonly("p_value", &TTestResult::p_value)
        .def_readonly("df", &TTestResult::df)
        .def("__repr__", &TTestResult::to_string);

    py::class_<ChiSquareResult>(m, "ChiSquareResult")
        .def_readonly("statistic", &ChiSquareResult::statistic)
        .def_readonly("p_value", &ChiSquareResult::p_value)
        .def_readonly("df", &ChiSquareResult::df)
        .def_readonly("expected", &ChiSquareResult::expected)
        .def("__repr__", &ChiSquareResult::to_string);

    py::class_<MannWhitneyResult>(m, "MannWhitneyResult")
        .def_readonly("statistic", &MannWhitneyResult::statistic)
        .def_readonly("p_value", &MannWhitneyResult::p_value)
        .def("__repr__", &MannWhitneyResult::to_string);

    // ============== t-tests ==============
    m.def("t_test_1samp",
          [](const std::vector<double>& x, double mu, const std::string& alternative) {
              return t_test_1samp(x, mu, parse_alternative(alternative));
          },
          py::arg("x"), py::arg("mu") = 0.0, py::arg("alternative") = "two-sided",
          R"doc(
          One-sample t-test of mean(x) against mu.

          t = (mean - mu) / (s / sqrt(n)), df = n - 1.

          Args:
              x: Sample
              mu: Hypothesized mean
              alternative: "two-sided", "less" or "greater"

          Raises:
              ValueError: If x is empty or alternative is not recognized
          )doc");

    m.def("t_test_2samp",
          [](const std::vector<double>& x, const std::vector<double>& y, bool equal_var,
             const std::string& alternative) {
              return t_test_2samp(x, y, equal_var, parse_alternative(alternative));
          },
          py::arg("x"), py::arg("y"), py::arg("equal_var") = true,
          py::arg("alternative") = "two-sided",
          R"doc(
          Two-sample t-test of mean(x) - mean(y).

          equal_var=True pools the variances (df = n1 + n2 - 2); otherwise
          Welch's test with Welch-Satterthwaite degrees of freedom.
          )doc");

    // ============== Chi-square ==============
    m.def("chi2_gof",
          [](const std::vector<double>& observed,
             const std::optional<std::vector<double>>& expected) {
              return expected ? chi2_gof(observed, *expected) : chi2_gof(observed);
          },
          py::arg("observed"), py::arg("expected") = py::none(),
          R"doc(
          Chi-square goodness-of-fit test, df = k - 1.

          Without expected counts the uniform expectation sum(observed) / k is used.

          Raises:
              ValueError: On length mismatch, k < 2 or a non-positive expectation
          )doc");

    m.def("chi2_independence", &chi2_independence, py::arg("table"),
          "Chi-square test of independence for an r x c contingency table");

    // ============== Effect sizes ==============
    m.def("cohens_d", &cohens_d, py::arg("x"), py::arg("y"), py::arg("pooled") = true,
          "(mean(x) - mean(y)) / s with pooled or averaged-variance s");

    m.def("hedges_g", &hedges_g, py::arg("x"), py::arg("y"),
          "Cohen's d with the small-sample correction 1 - 3 / (4(n1 + n2) - 9)");

    // ============== Rank tests ==============
    m.def("mann_whitney_u",
          [](const std::vector<double>& x, const std::vector<double>& y,
             const std::string& alternative) {
              return mann_whitney_u(x, y, parse_alternative(alternative));
          },
          py::arg("x"), py::arg("y"), py::arg("alternative") = "two-sided",
          R"doc(
          Mann-Whitney U test.

          Ties receive mid-ranks. The statistic is U of x; the p-value uses the
          tie-corrected normal approximation with continuity correction.
          )doc");
}
