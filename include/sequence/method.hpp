/**
 * @file method.hpp
 * @brief Closed set of color sequence methods and their parameters
 *
 * Every method owns its own parameter set; parameters of other methods are
 * never consulted. Dispatch goes through std::visit, so adding a method is a
 * compile error everywhere it is not handled yet.
 */

#pragma once

#include <export.hpp>
#include <math/continued_fraction.hpp>
#include <math/metallic_roots.hpp>
#include <array>
#include <cstdint>
#include <numbers>
#include <string>
#include <variant>
#include <vector>

namespace chromaseq::sequence {

/**
 * @brief How a three-coordinate point becomes a color.
 *
 * Rgb: coordinates are the channels.
 * Hsl: h = x1·360, s = x2·0.5 + 0.5, l = x3·0.3 + 0.4.
 */
enum class ColorMode {
    Rgb,
    Hsl
};

CHROMASEQ_API std::string to_string(ColorMode mode);
CHROMASEQ_API ColorMode parse_color_mode(const std::string& tag);

// hue = frac(seed + n/φ)
struct Golden {
    double saturation = 0.7;
    double lightness = 0.5;
};

// hue = frac(seed + n/φ₂), saturation = frac(seed + n/φ₂²)
struct Plastic {
    double lightness = 0.5;
};

// channel_i = frac(seed + vdc(n, base_i))
struct Halton {
    std::array<uint32_t, 3> bases{2, 3, 5};
    ColorMode mode = ColorMode::Rgb;
};

// x_k = frac(seed + n/φ_d^k) with φ_d the root of x^(d+1) = x + 1
struct RSequence {
    uint32_t dim = 3;
    double lightness = 0.5;  // used when dim == 2
};

// hue = frac(seed + n·α)
struct Kronecker {
    double alpha = std::numbers::sqrt2;
    double saturation = 0.7;
    double lightness = 0.55;
};

// x_d = frac(seed + sobol(n, d)) for d = 1, 2, 3
struct Sobol {
    ColorMode mode = ColorMode::Hsl;
};

// hue = frac(seed + round(θ^n))
struct Pisot {
    double theta = math::PHI;
    double saturation = 0.7;
    double lightness = 0.55;
};

// hue = frac(seed + p_n/q_n)
struct ContinuedFraction {
    math::ContinuedFractionKind kind = math::ContinuedFractionKind::Golden;
    double saturation = 0.7;
    double lightness = 0.55;
};

using Method = std::variant<Golden, Plastic, Halton, RSequence,
                            Kronecker, Sobol, Pisot, ContinuedFraction>;

/**
 * @brief Wire tag: golden, plastic, halton, r_sequence, kronecker, sobol,
 *        pisot or continued_fraction.
 */
CHROMASEQ_API std::string method_name(const Method& method);

/**
 * @brief All wire tags in declaration order.
 */
CHROMASEQ_API std::vector<std::string> method_tags();

/**
 * @brief Method for a wire tag with default parameters ("cf" is accepted
 *        for continued_fraction).
 * @throws Chromaseq::ChromaseqError (UnknownMethod)
 */
CHROMASEQ_API Method parse_method(const std::string& tag);

/**
 * @brief Natural first index: 0 for Sobol (Gray-code origin), 1 otherwise.
 */
CHROMASEQ_API uint32_t start_index(const Method& method);

/**
 * @brief Last index with a well-defined point: SobolDirections::MAX_INDEX
 *        for Sobol, UINT32_MAX for the rest.
 */
CHROMASEQ_API uint32_t max_index(const Method& method);

/**
 * @throws Chromaseq::ChromaseqError (InvalidParameter) if index > max_index(method)
 */
CHROMASEQ_API void check_index(const Method& method, uint64_t index);

/**
 * @brief Reject parameters outside their domain.
 *
 * Bases below 2, R-sequence dimensions outside 1..MAX_R_SEQUENCE_DIM,
 * non-finite α or θ, and saturation/lightness outside [0, 1].
 *
 * @throws Chromaseq::ChromaseqError (InvalidParameter)
 */
CHROMASEQ_API void validate(const Method& method);

} // namespace chromaseq::sequence
