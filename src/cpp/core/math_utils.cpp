#include "math_utils.hpp"

#include <string>

namespace statkit {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

/// Convergence tolerance for continued fractions and series
constexpr double EPSILON = 1e-15;

/// Guard against division by zero inside Lentz iterations
constexpr double FPMIN = 1e-300;

constexpr int MAX_ITERATIONS = 500;

/// Continued fraction for the incomplete beta function (Lentz's method)
double beta_continued_fraction(double a, double b, double x) {
    const double qab = a + b;
    const double qap = a + 1.0;
    const double qam = a - 1.0;

    double c = 1.0;
    double d = 1.0 - qab * x / qap;
    if (std::abs(d) < FPMIN) d = FPMIN;
    d = 1.0 / d;
    double h = d;

    for (int m = 1; m <= MAX_ITERATIONS; ++m) {
        const double m2 = 2.0 * m;

        // Even step
        double aa = m * (b - m) * x / ((qam + m2) * (a + m2));
        d = 1.0 + aa * d;
        if (std::abs(d) < FPMIN) d = FPMIN;
        c = 1.0 + aa / c;
        if (std::abs(c) < FPMIN) c = FPMIN;
        d = 1.0 / d;
        h *= d * c;

        // Odd step
        aa = -(a + m) * (qab + m) * x / ((a + m2) * (qap + m2));
        d = 1.0 + aa * d;
        if (std::abs(d) < FPMIN) d = FPMIN;
        c = 1.0 + aa / c;
        if (std::abs(c) < FPMIN) c = FPMIN;
        d = 1.0 / d;
        const double delta = d * c;
        h *= delta;

        if (std::abs(delta - 1.0) < EPSILON) {
            break;
        }
    }

    return h;
}

/// Lower regularized gamma P(a, x) by series, valid for x < a + 1
double gamma_p_series(double a, double x) {
    double ap = a;
    double sum = 1.0 / a;
    double term = sum;
    for (int n = 1; n <= MAX_ITERATIONS; ++n) {
        ap += 1.0;
        term *= x / ap;
        sum += term;
        if (std::abs(term) < std::abs(sum) * EPSILON) {
            break;
        }
    }
    return sum * std::exp(-x + a * std::log(x) - std::lgamma(a));
}

/// Upper regularized gamma Q(a, x) by continued fraction, valid for x >= a + 1
double gamma_q_continued_fraction(double a, double x) {
    double b = x + 1.0 - a;
    double c = 1.0 / FPMIN;
    double d = 1.0 / b;
    double h = d;
    for (int i = 1; i <= MAX_ITERATIONS; ++i) {
        const double an = -i * (i - a);
        b += 2.0;
        d = an * d + b;
        if (std::abs(d) < FPMIN) d = FPMIN;
        c = b + an / c;
        if (std::abs(c) < FPMIN) c = FPMIN;
        d = 1.0 / d;
        const double delta = d * c;
        h *= delta;
        if (std::abs(delta - 1.0) < EPSILON) {
            break;
        }
    }
    return std::exp(-x + a * std::log(x) - std::lgamma(a)) * h;
}

}  // anonymous namespace

double norm_cdf(double x) {
    // Using the error function: Phi(x) = 0.5 * (1 + erf(x / sqrt(2)))
    return 0.5 * (1.0 + std::erf(x / std::sqrt(2.0)));
}

double norm_sf(double x) {
    return 0.5 * std::erfc(x / std::sqrt(2.0));
}

double norm_pdf(double x) {
    // PDF of standard normal: (1/sqrt(2*pi)) * exp(-x^2/2)
    constexpr double inv_sqrt_2pi = 0.3989422804014327;
    return inv_sqrt_2pi * std::exp(-0.5 * x * x);
}

double regularized_incomplete_beta(double a, double b, double x) {
    if (!(a > 0.0) || !(b > 0.0)) {
        throw std::invalid_argument("regularized_incomplete_beta: shape parameters must be positive");
    }
    if (!(x >= 0.0 && x <= 1.0)) {
        throw std::invalid_argument("regularized_incomplete_beta: x must be in [0, 1], got " +
                                    std::to_string(x));
    }
    if (x == 0.0) return 0.0;
    if (x == 1.0) return 1.0;

    const double log_front = std::lgamma(a + b) - std::lgamma(a) - std::lgamma(b) +
                             a * std::log(x) + b * std::log1p(-x);
    const double front = std::exp(log_front);

    if (x < (a + 1.0) / (a + b + 2.0)) {
        return front * beta_continued_fraction(a, b, x) / a;
    }
    return 1.0 - front * beta_continued_fraction(b, a, 1.0 - x) / b;
}

double regularized_gamma_q(double a, double x) {
    if (!(a > 0.0)) {
        throw std::invalid_argument("regularized_gamma_q: a must be positive");
    }
    if (!(x >= 0.0)) {
        throw std::invalid_argument("regularized_gamma_q: x must be non-negative");
    }
    if (x == 0.0) return 1.0;
    if (std::isinf(x)) return 0.0;

    if (x < a + 1.0) {
        return 1.0 - gamma_p_series(a, x);
    }
    return gamma_q_continued_fraction(a, x);
}

double student_t_sf(double t, double df) {
    if (std::isnan(t) || std::isnan(df) || df <= 0.0) {
        return NaN;
    }
    if (std::isinf(t)) {
        return t > 0.0 ? 0.0 : 1.0;
    }
    if (std::isinf(df)) {
        return norm_sf(t);
    }

    // P(|T| > |t|) = I_{df/(df+t^2)}(df/2, 1/2)
    const double x = df / (df + t * t);
    const double half_tail = 0.5 * regularized_incomplete_beta(0.5 * df, 0.5, x);
    return t > 0.0 ? half_tail : 1.0 - half_tail;
}

double student_t_cdf(double t, double df) {
    return student_t_sf(-t, df);
}

double chi2_sf(double x, double df) {
    if (std::isnan(x) || std::isnan(df) || df <= 0.0) {
        return NaN;
    }
    if (x <= 0.0) {
        return 1.0;
    }
    return regularized_gamma_q(0.5 * df, 0.5 * x);
}

} // namespace statkit
