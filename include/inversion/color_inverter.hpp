/**
 * @file color_inverter.hpp
 * @brief Recover the sequence index that produced a color
 *
 * The forward map wraps an unbounded coordinate modulo 1 and then bends it
 * through HSL, so there is no closed-form inverse. Inversion is a bounded
 * scan over candidate indices comparing colors in continuous RGB.
 */

#pragma once

#include <export.hpp>
#include <color/color_space.hpp>
#include <sequence/method.hpp>
#include <sequence/seed.hpp>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace Chromaseq {

/**
 * @brief Which candidate within tolerance wins.
 *
 * FirstWithinTolerance stops at the lowest index below tolerance. Nearest
 * scans the whole range and keeps the smallest distance (ties go to the
 * lowest index).
 *
 * Colors read back from "#RRGGBB" carry up to 1/510 of rounding error per
 * channel, so a later index can land closer to the rounded color than the one
 * that produced it; FirstWithinTolerance is the policy that recovers indices
 * from hex. Nearest is for unquantized colors, where it also separates the
 * near-returns of 1D hue methods (Δn = 233 for φ, Δn = 169 for √2).
 */
enum class MatchPolicy {
    FirstWithinTolerance,
    Nearest
};

struct InversionOptions {
    uint32_t max_search = 10000;   // last index scanned (inclusive)
    double tolerance = 0.01;       // strict upper bound on RGB distance
    MatchPolicy policy = MatchPolicy::FirstWithinTolerance;
};

/**
 * @brief Outcome of one inversion.
 *
 * found == false is the "search exhausted" outcome, not an error; index is
 * then empty and distance is the closest miss (infinity for an empty range).
 */
struct InversionResult {
    bool found = false;
    std::optional<uint32_t> index;
    double distance = std::numeric_limits<double>::infinity();
};

/**
 * @brief Observed color checked against the color predicted for an index.
 */
struct Prediction {
    bool matches = false;
    std::string predicted_hex;
    std::string observed_hex;
    double distance = 0.0;
    double tolerance = 0.0;
};

class CHROMASEQ_API ColorInverter {
public:
    /**
     * @brief Scan indices start_index(method)..max_search.
     *
     * @throws ChromaseqError (InvalidParameter) for a negative or non-finite
     *         tolerance, invalid method parameters, or a max_search beyond
     *         max_index(method)
     */
    static InversionResult invert(const chromaseq::color::RGB& color,
                                  const chromaseq::sequence::Method& method,
                                  const chromaseq::sequence::Seed& seed,
                                  uint32_t max_search,
                                  double tolerance = 0.01);

    static InversionResult invert(const chromaseq::color::RGB& color,
                                  const chromaseq::sequence::Method& method,
                                  const chromaseq::sequence::Seed& seed,
                                  const InversionOptions& options);

    /**
     * @brief Parse "#RRGGBB" first.
     * @throws ChromaseqError (MalformedColor)
     */
    static InversionResult invert_hex(const std::string& hex,
                                      const chromaseq::sequence::Method& method,
                                      const chromaseq::sequence::Seed& seed,
                                      const InversionOptions& options = {});

    /**
     * @brief Same result as invert(), with the range split into disjoint
     *        contiguous blocks scanned by an OpenMP team.
     *
     * @param threads Team size; 0 uses the OpenMP default.
     */
    static InversionResult invert_parallel(const chromaseq::color::RGB& color,
                                           const chromaseq::sequence::Method& method,
                                           const chromaseq::sequence::Seed& seed,
                                           const InversionOptions& options = {},
                                           int threads = 0);

    static Prediction predict(const chromaseq::sequence::Method& method,
                              const chromaseq::sequence::Seed& seed,
                              uint32_t index,
                              const chromaseq::color::RGB& observed,
                              double tolerance = 0.01);
};

} // namespace Chromaseq
