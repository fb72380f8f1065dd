/**
 * @file discrepancy.hpp
 * @brief Gap-based uniformity statistic for ranking sequences
 *
 * Descriptive only: nothing here feeds back into generation or inversion.
 */

#pragma once

#include <export.hpp>
#include <sequence/method.hpp>
#include <sequence/seed.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace Chromaseq {

struct DiscrepancyEntry {
    std::string method_name;
    double dispersion = 0.0;
};

/**
 * @brief Per-method dispersion, sorted ascending (most uniform first).
 */
struct ComparisonReport {
    uint32_t n = 0;
    std::vector<DiscrepancyEntry> ranking;

    const DiscrepancyEntry* best() const { return ranking.empty() ? nullptr : &ranking.front(); }
    const DiscrepancyEntry* worst() const { return ranking.empty() ? nullptr : &ranking.back(); }
};

class CHROMASEQ_API DiscrepancyAnalyzer {
public:
    /**
     * @brief Population standard deviation of the gaps between sorted points.
     *
     * Points are taken in [0, 1); 0 is prepended and 1 appended before the
     * gaps are formed. An evenly spaced set scores 0. Empty input scores 0.
     */
    static double discrepancy(const std::vector<double>& points);

    /**
     * @brief Primary coordinate of indices 1..n for one method.
     */
    static std::vector<double> primary_stream(const chromaseq::sequence::Method& method, uint32_t n,
                                              const chromaseq::sequence::Seed& seed = {});

    /**
     * @brief Rank methods by the discrepancy of their primary streams.
     *
     * Ties are ordered by method name.
     */
    static ComparisonReport compare_sequences(uint32_t n,
                                              const std::vector<chromaseq::sequence::Method>& methods,
                                              const chromaseq::sequence::Seed& seed = {});
};

} // namespace Chromaseq
