#include <inversion/color_inverter.hpp>
#include <sequence/sequence_generator.hpp>
#include <core/errors.hpp>

#include <algorithm>
#include <cmath>
#include <vector>
#include <omp.h>

namespace Chromaseq {

using chromaseq::color::RGB;
using chromaseq::sequence::Method;
using chromaseq::sequence::Seed;
using chromaseq::sequence::SequenceGenerator;

namespace {

void check_tolerance(double tolerance) {
    if (!std::isfinite(tolerance) || tolerance < 0.0) {
        throw ChromaseqError(ErrorKind::InvalidParameter,
                             "Tolerance must be a finite non-negative number");
    }
}

/**
 * @brief Scan [first, last] (inclusive) and return the winner of that block.
 */
InversionResult scan_range(const SequenceGenerator::ColorFn& generator, const RGB& target,
                           uint64_t first, uint64_t last, const InversionOptions& options) {
    InversionResult best;

    for (uint64_t n = first; n <= last; ++n) {
        const double d = chromaseq::color::color_distance(target, generator(static_cast<uint32_t>(n)));

        if (d < options.tolerance) {
            if (!best.found || d < best.distance) {
                best.found = true;
                best.index = static_cast<uint32_t>(n);
                best.distance = d;
            }
            // Nothing later can beat an exact hit, and ties go to the lower index.
            if (options.policy == MatchPolicy::FirstWithinTolerance || d == 0.0) break;
        } else if (!best.found && d < best.distance) {
            best.distance = d;
        }
    }
    return best;
}

/**
 * @brief Combine two block results; `a` covers lower indices than `b`.
 */
InversionResult merge(const InversionResult& a, const InversionResult& b, MatchPolicy policy) {
    if (a.found && b.found) {
        if (policy == MatchPolicy::FirstWithinTolerance) return a;
        return b.distance < a.distance ? b : a;
    }
    if (a.found) return a;
    if (b.found) return b;

    InversionResult miss;
    miss.distance = std::min(a.distance, b.distance);
    return miss;
}

} // namespace

InversionResult ColorInverter::invert(const RGB& color, const Method& method, const Seed& seed,
                                      uint32_t max_search, double tolerance) {
    InversionOptions options;
    options.max_search = max_search;
    options.tolerance = tolerance;
    return invert(color, method, seed, options);
}

InversionResult ColorInverter::invert(const RGB& color, const Method& method, const Seed& seed,
                                      const InversionOptions& options) {
    check_tolerance(options.tolerance);
    chromaseq::sequence::check_index(method, options.max_search);
    const auto generator = SequenceGenerator::bind(method, seed);

    const uint64_t first = chromaseq::sequence::start_index(method);
    if (first > options.max_search) return InversionResult{};

    return scan_range(generator, color, first, options.max_search, options);
}

InversionResult ColorInverter::invert_hex(const std::string& hex, const Method& method, const Seed& seed,
                                          const InversionOptions& options) {
    return invert(chromaseq::color::hex_to_rgb(hex), method, seed, options);
}

InversionResult ColorInverter::invert_parallel(const RGB& color, const Method& method, const Seed& seed,
                                               const InversionOptions& options, int threads) {
    check_tolerance(options.tolerance);
    chromaseq::sequence::check_index(method, options.max_search);
    const auto generator = SequenceGenerator::bind(method, seed);

    const uint64_t first = chromaseq::sequence::start_index(method);
    const uint64_t last = options.max_search;
    if (first > last) return InversionResult{};

    const uint64_t total = last - first + 1;
    int team = threads > 0 ? threads : omp_get_max_threads();
    team = static_cast<int>(std::clamp<uint64_t>(static_cast<uint64_t>(std::max(team, 1)), 1, total));

    std::vector<InversionResult> partials(static_cast<std::size_t>(team));

    #pragma omp parallel num_threads(team)
    {
        const uint64_t t = static_cast<uint64_t>(omp_get_thread_num());
        const uint64_t nt = static_cast<uint64_t>(omp_get_num_threads());
        const uint64_t chunk = (total + nt - 1) / nt;
        const uint64_t begin = first + t * chunk;

        if (begin <= last) {
            const uint64_t end = std::min(last, begin + chunk - 1);
            partials[t] = scan_range(generator, color, begin, end, options);
        }
    }

    // Blocks are ordered by index, so a left fold keeps lowest-index tie breaking.
    InversionResult result;
    for (const auto& partial : partials) {
        result = merge(result, partial, options.policy);
    }
    return result;
}

Prediction ColorInverter::predict(const Method& method, const Seed& seed, uint32_t index,
                                  const RGB& observed, double tolerance) {
    check_tolerance(tolerance);
    const RGB predicted = SequenceGenerator::color(method, index, seed);

    Prediction prediction;
    prediction.distance = chromaseq::color::color_distance(predicted, observed);
    prediction.matches = prediction.distance < tolerance;
    prediction.predicted_hex = chromaseq::color::rgb_to_hex(predicted);
    prediction.observed_hex = chromaseq::color::rgb_to_hex(observed);
    prediction.tolerance = tolerance;
    return prediction;
}

} // namespace Chromaseq
