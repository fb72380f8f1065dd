/**
 * @file digit_sequences.hpp
 * @brief Radical-inverse (van der Corput, Halton) and Gray-code (Sobol) sequences
 *
 * These generators build coordinates from the digits of the index rather than
 * from an irrational rotation:
 *   - van der Corput: mirror the base-b digits of n around the radix point
 *   - Halton: one van der Corput stream per prime base
 *   - Sobol: XOR of direction numbers selected by the Gray code of n
 */

#pragma once

#include <export.hpp>
#include <array>
#include <cstdint>

namespace chromaseq::sequence {

/**
 * @brief Van der Corput radical inverse of n in the given base.
 *
 * Example: n = 5 in base 2: 101₂ → 0.101₂ = 1/2 + 1/8 = 0.625
 *
 * @throws Chromaseq::ChromaseqError (InvalidParameter) for base < 2
 */
CHROMASEQ_API double van_der_corput(uint64_t n, uint32_t base);

inline double halton(uint64_t n, uint32_t base) { return van_der_corput(n, base); }

inline constexpr uint64_t gray_code(uint64_t n) { return n ^ (n >> 1); }

/**
 * @brief Sobol direction numbers for one dimension.
 *
 * Dimensions 1..5 use the primitive polynomials x, x²+x+1, x³+x+1, x⁴+x+1
 * and x⁵+x²+1; higher dimensions reuse the fifth. The first `degree` numbers
 * are powers of two, the rest follow
 *   V[i] = V[i-deg] XOR (V[i-j] >> j) for every j with a_j = 1.
 */
class CHROMASEQ_API SobolDirections {
public:
    static constexpr int BITS = 30;
    static constexpr int MAX_DIMENSION = 5;
    // Gray codes of larger indices need direction numbers past BITS.
    static constexpr uint32_t MAX_INDEX = (1u << BITS) - 1;
    using Table = std::array<uint32_t, BITS>;

    /**
     * @brief Immutable table for `dim` (clamped into 1..MAX_DIMENSION).
     *
     * Tables are built once on first use and shared by every thread.
     */
    static const Table& table(uint32_t dim);

private:
    static Table build(int dim);
};

/**
 * @brief n-th Sobol coordinate in dimension `dim`, in [0, 1).
 *
 * The Gray code of n selects which direction numbers are XORed together;
 * the accumulator is normalized by 2^30. Index 0 maps to 0.
 */
CHROMASEQ_API double sobol_point(uint64_t n, uint32_t dim);

} // namespace chromaseq::sequence
