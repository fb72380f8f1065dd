#pragma once

#include <export.hpp>
#include <cstdint>

namespace chromaseq::math {

// Golden ratio: x² = x + 1
inline constexpr double PHI = 1.618033988749895;
// Plastic constant: real root of x³ = x + 1
inline constexpr double PHI2 = 1.3247179572447460259609088544780973;

// Largest dimension whose root converges from the fixed guess within the cap
inline constexpr uint32_t MAX_R_SEQUENCE_DIM = 38;

/**
 * @brief d-dimensional golden ratio: the real root > 1 of x^(d+1) = x + 1.
 *
 * Newton's method on f(x) = x^(d+1) - x - 1 starting from 1.5, stopping once
 * |Δx| < 1e-10, at most 20 iterations.
 *
 *   d = 1  →  φ  ≈ 1.618034
 *   d = 2  →  φ₂ ≈ 1.324718
 *   d = 3  →  φ₃ ≈ 1.220744
 *
 * @throws Chromaseq::ChromaseqError InvalidParameter for d < 1,
 *         NonConvergentRoot if the iteration cap is reached.
 */
CHROMASEQ_API double r_sequence_root(uint32_t d);

} // namespace chromaseq::math
