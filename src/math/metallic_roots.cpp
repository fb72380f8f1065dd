#include <math/metallic_roots.hpp>
#include <core/errors.hpp>

#include <cmath>
#include <string>

namespace chromaseq::math {

using Chromaseq::ChromaseqError;
using Chromaseq::ErrorKind;

namespace {
constexpr double INITIAL_GUESS = 1.5;
constexpr double CONVERGENCE_STEP = 1e-10;
constexpr int MAX_ITERATIONS = 20;
}

double r_sequence_root(uint32_t d) {
    if (d < 1) {
        throw ChromaseqError(ErrorKind::InvalidParameter,
                             "R-sequence dimension must be at least 1, got " + std::to_string(d));
    }

    const double exponent = static_cast<double>(d) + 1.0;

    // f(x) = x^(d+1) - x - 1 is convex on (1, 2) with f(1) < 0 < f(2),
    // so Newton from 1.5 converges monotonically to the root.
    double x = INITIAL_GUESS;
    for (int i = 0; i < MAX_ITERATIONS; ++i) {
        const double f = std::pow(x, exponent) - x - 1.0;
        const double df = exponent * std::pow(x, exponent - 1.0) - 1.0;
        const double x_new = x - f / df;

        if (std::abs(x_new - x) < CONVERGENCE_STEP) {
            return x_new;
        }
        x = x_new;
    }

    throw ChromaseqError(ErrorKind::NonConvergentRoot,
                         "Newton iteration for x^" + std::to_string(d + 1) +
                         " = x + 1 did not converge in " + std::to_string(MAX_ITERATIONS) + " steps");
}

} // namespace chromaseq::math
