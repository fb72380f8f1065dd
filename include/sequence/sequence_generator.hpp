#pragma once

#include <export.hpp>
#include <color/color_space.hpp>
#include <sequence/method.hpp>
#include <sequence/seed.hpp>
#include <Eigen/Core>
#include <cmath>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace chromaseq::sequence {

/**
 * @brief frac(x) = x - floor(x)
 */
inline double frac(double x) { return x - std::floor(x); }

/**
 * @brief Sequence coordinates in [0, 1)^d before the color mapping.
 *
 * Unused trailing coordinates are zero.
 */
struct SequencePoint {
    Eigen::Vector3d coords = Eigen::Vector3d::Zero();
    int dimension = 1;

    // First coordinate; the stream the discrepancy analysis ranks.
    double primary() const { return coords[0]; }
};

/**
 * @brief Low-discrepancy sequence → color generators.
 *
 * Every generator is a pure function of (method, index, seed). Coordinates
 * are evaluated as frac(seed + value) in exactly this order:
 *
 *   Golden      h = frac(s + n/φ)
 *   Plastic     h = frac(s + n/φ₂), sat = frac(s + n/(φ₂·φ₂))
 *   Halton      x_i = frac(s + vdc(n, b_i))
 *   R-sequence  x_k = frac(s + n/φ_d), frac(s + n/(φ_d·φ_d)), frac(s + n/(φ_d·φ_d·φ_d))
 *   Kronecker   h = frac(s + n·α)
 *   Sobol       x_d = frac(s + sobol(n, d))
 *   Pisot       h = frac(s + round(θ^n))
 *   ContFrac    h = frac(s + p_n/q_n)
 *
 * where s is Seed::offset(). Hues are scaled by 360 before HSL → RGB.
 * p_n/q_n is read from math::convergent_values(), so indices past the point
 * where the convergents settle share its last value.
 */
class CHROMASEQ_API SequenceGenerator {
public:
    using ColorFn = std::function<color::RGB(uint32_t)>;

    static color::RGB golden_color(uint32_t n, const Seed& seed = {}, const Golden& params = {});
    static color::RGB plastic_color(uint32_t n, const Seed& seed = {}, const Plastic& params = {});
    static color::RGB halton_color(uint32_t n, const Seed& seed = {}, const Halton& params = {});
    static color::RGB r_sequence_color(uint32_t n, const Seed& seed = {}, const RSequence& params = {});
    static color::RGB kronecker_color(uint32_t n, const Seed& seed = {}, const Kronecker& params = {});
    static color::RGB sobol_color(uint32_t n, const Seed& seed = {}, const Sobol& params = {});
    static color::RGB pisot_color(uint32_t n, const Seed& seed = {}, const Pisot& params = {});
    static color::RGB continued_fraction_color(uint32_t n, const Seed& seed = {},
                                               const ContinuedFraction& params = {});

    /**
     * @brief Coordinates of index n.
     * @throws Chromaseq::ChromaseqError (InvalidParameter) for invalid parameters
     *         or n > max_index(method)
     */
    static SequencePoint point(const Method& method, uint32_t n, const Seed& seed = {});

    static color::RGB color(const Method& method, uint32_t n, const Seed& seed = {});

    static std::string hex(const Method& method, uint32_t n, const Seed& seed = {});

    /**
     * @brief `count` sequential hex colors from the method's start index.
     *
     * Callers bound `count`; the result is allocated up front.
     */
    static std::vector<std::string> generate_hex(const Method& method, const Seed& seed, uint32_t count);

    /**
     * @brief Validate once and precompute per-method constants (φ_d, the
     *        convergent table, seed offset); the returned function is
     *        immutable and thread-safe. It does not check n against
     *        max_index(method).
     */
    static ColorFn bind(const Method& method, const Seed& seed);
};

} // namespace chromaseq::sequence
