#pragma once

#include <export.hpp>
#include <cstdint>
#include <string>

namespace chromaseq::sequence {

/**
 * @brief How a seed enters the modulo-1 reduction.
 *
 * Additive: frac(seed + value), evaluated in double exactly as written. This
 *   reproduces the reference colors, but an integer seed only shifts the
 *   value through rounding, so neighbouring seeds of equal magnitude can give
 *   identical sequences.
 * Scrambled: the seed is mixed (SplitMix64 finalizer) into a fractional
 *   offset u ∈ [0, 1) and frac(u + value) is used instead, which separates
 *   every pair of seeds.
 */
enum class SeedMode {
    Additive,
    Scrambled
};

CHROMASEQ_API std::string to_string(SeedMode mode);

/**
 * @throws Chromaseq::ChromaseqError (InvalidParameter) for tags other than
 *         "additive" and "scrambled"
 */
CHROMASEQ_API SeedMode parse_seed_mode(const std::string& tag);

struct CHROMASEQ_API Seed {
    int64_t value = 0;
    SeedMode mode = SeedMode::Additive;

    Seed() = default;
    Seed(int64_t v, SeedMode m = SeedMode::Additive) : value(v), mode(m) {}

    /**
     * @brief The quantity added before the modulo-1 reduction.
     */
    double offset() const;
};

} // namespace chromaseq::sequence
