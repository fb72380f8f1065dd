/**
 * @file continued_fraction.hpp
 * @brief Simple continued fractions [a0; a1, a2, ...] and their convergents
 */

#pragma once

#include <export.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace chromaseq::math {

enum class ContinuedFractionKind {
    Golden,   // φ  = [1; 1, 1, 1, ...]
    Sqrt2,    // √2 = [1; 2, 2, 2, ...]
    E         // e  = [2; 1, 2, 1, 1, 4, 1, 1, 6, 1, ...]
};

CHROMASEQ_API std::string to_string(ContinuedFractionKind kind);

/**
 * @throws Chromaseq::ChromaseqError (UnknownMethod) for tags other than
 *         "golden", "sqrt2" and "e"
 */
CHROMASEQ_API ContinuedFractionKind parse_continued_fraction_kind(const std::string& tag);

/**
 * @brief k-th convergent p/q.
 *
 * numerator and denominator follow p_i = a_i·p_{i-1} + p_{i-2} and
 * q_i = a_i·q_{i-1} + q_{i-2}. They are exact integers while below 2^53;
 * past 1e150 both are rescaled together, so only value() stays meaningful.
 */
struct Convergent {
    double numerator = 0.0;
    double denominator = 1.0;

    double value() const { return numerator / denominator; }
};

/**
 * @brief Partial quotient a_i of the named expansion.
 */
CHROMASEQ_API int64_t partial_quotient(ContinuedFractionKind kind, std::size_t i);

/**
 * @brief First `terms` partial quotients of the named expansion.
 */
CHROMASEQ_API std::vector<int64_t> expansion(ContinuedFractionKind kind, std::size_t terms);

/**
 * @brief k-th convergent of [a0; a1, ...] using a0..ak.
 *
 * Seeds p_{-1} = 1, q_{-1} = 0. A k beyond the available coefficients yields
 * the convergent of the full list.
 *
 * @throws Chromaseq::ChromaseqError (InvalidParameter) on an empty list
 */
CHROMASEQ_API Convergent continued_fraction_convergent(const std::vector<int64_t>& coeffs, std::size_t k);

/**
 * @brief Values p_k/q_k for k = 0, 1, ... up to the first k whose value
 *        equals the previous one in double precision, or `max_terms` values.
 *
 * The last entry stands for every later convergent.
 */
CHROMASEQ_API std::vector<double> convergent_values(ContinuedFractionKind kind, std::size_t max_terms = 256);

} // namespace chromaseq::math
