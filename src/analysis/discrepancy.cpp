#include <analysis/discrepancy.hpp>
#include <sequence/sequence_generator.hpp>

#include <Eigen/Core>
#include <algorithm>
#include <cmath>

namespace Chromaseq {

using chromaseq::sequence::Method;
using chromaseq::sequence::Seed;
using chromaseq::sequence::SequenceGenerator;

double DiscrepancyAnalyzer::discrepancy(const std::vector<double>& points) {
    if (points.empty()) return 0.0;

    std::vector<double> sorted(points);
    std::sort(sorted.begin(), sorted.end());

    // Boundaries 0 and 1 close the gaps at both ends.
    const Eigen::Index count = static_cast<Eigen::Index>(sorted.size()) + 1;
    Eigen::VectorXd gaps(count);
    double previous = 0.0;
    for (Eigen::Index i = 0; i + 1 < count; ++i) {
        gaps[i] = sorted[static_cast<std::size_t>(i)] - previous;
        previous = sorted[static_cast<std::size_t>(i)];
    }
    gaps[count - 1] = 1.0 - previous;

    const double mean = gaps.mean();
    return std::sqrt((gaps.array() - mean).square().mean());
}

std::vector<double> DiscrepancyAnalyzer::primary_stream(const Method& method, uint32_t n, const Seed& seed) {
    std::vector<double> stream;
    stream.reserve(n);
    for (uint64_t i = 1; i <= n; ++i) {
        stream.push_back(SequenceGenerator::point(method, static_cast<uint32_t>(i), seed).primary());
    }
    return stream;
}

ComparisonReport DiscrepancyAnalyzer::compare_sequences(uint32_t n, const std::vector<Method>& methods,
                                                        const Seed& seed) {
    ComparisonReport report;
    report.n = n;
    report.ranking.reserve(methods.size());

    for (const auto& method : methods) {
        DiscrepancyEntry entry;
        entry.method_name = chromaseq::sequence::method_name(method);
        entry.dispersion = discrepancy(primary_stream(method, n, seed));
        report.ranking.push_back(entry);
    }

    std::sort(report.ranking.begin(), report.ranking.end(),
              [](const DiscrepancyEntry& a, const DiscrepancyEntry& b) {
                  if (a.dispersion != b.dispersion) return a.dispersion < b.dispersion;
                  return a.method_name < b.method_name;
              });
    return report;
}

} // namespace Chromaseq
