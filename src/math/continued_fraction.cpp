#include <math/continued_fraction.hpp>
#include <core/errors.hpp>

#include <algorithm>
#include <cmath>

namespace chromaseq::math {

using Chromaseq::ChromaseqError;
using Chromaseq::ErrorKind;

namespace {
constexpr double RESCALE_LIMIT = 1e150;
constexpr double RESCALE_FACTOR = 1e-150;
}

std::string to_string(ContinuedFractionKind kind) {
    switch (kind) {
        case ContinuedFractionKind::Golden: return "golden";
        case ContinuedFractionKind::Sqrt2:  return "sqrt2";
        case ContinuedFractionKind::E:      return "e";
    }
    return "golden";
}

ContinuedFractionKind parse_continued_fraction_kind(const std::string& tag) {
    if (tag == "golden") return ContinuedFractionKind::Golden;
    if (tag == "sqrt2") return ContinuedFractionKind::Sqrt2;
    if (tag == "e") return ContinuedFractionKind::E;
    throw ChromaseqError(ErrorKind::UnknownMethod, "Unknown continued fraction type: " + tag);
}

int64_t partial_quotient(ContinuedFractionKind kind, std::size_t i) {
    switch (kind) {
        case ContinuedFractionKind::Golden:
            return 1;
        case ContinuedFractionKind::Sqrt2:
            return i == 0 ? 1 : 2;
        case ContinuedFractionKind::E:
            // [2; 1, 2k, 1] repeated for k = 1, 2, ...
            if (i == 0) return 2;
            return (i - 1) % 3 == 1 ? 2 * static_cast<int64_t>((i - 1) / 3 + 1) : 1;
    }
    return 1;
}

std::vector<int64_t> expansion(ContinuedFractionKind kind, std::size_t terms) {
    std::vector<int64_t> a;
    a.reserve(terms);
    for (std::size_t i = 0; i < terms; ++i) {
        a.push_back(partial_quotient(kind, i));
    }
    return a;
}

Convergent continued_fraction_convergent(const std::vector<int64_t>& coeffs, std::size_t k) {
    if (coeffs.empty()) {
        throw ChromaseqError(ErrorKind::InvalidParameter,
                             "Continued fraction needs at least one partial quotient");
    }

    double p_prev2 = 1.0, p_prev1 = static_cast<double>(coeffs[0]);
    double q_prev2 = 0.0, q_prev1 = 1.0;

    const std::size_t last = std::min(k, coeffs.size() - 1);
    for (std::size_t i = 1; i <= last; ++i) {
        const double a = static_cast<double>(coeffs[i]);
        const double p = a * p_prev1 + p_prev2;
        const double q = a * q_prev1 + q_prev2;

        p_prev2 = p_prev1; p_prev1 = p;
        q_prev2 = q_prev1; q_prev1 = q;

        // Homogeneous recurrence: scaling the whole state keeps every ratio.
        if (std::abs(p_prev1) > RESCALE_LIMIT || std::abs(q_prev1) > RESCALE_LIMIT) {
            p_prev1 *= RESCALE_FACTOR; p_prev2 *= RESCALE_FACTOR;
            q_prev1 *= RESCALE_FACTOR; q_prev2 *= RESCALE_FACTOR;
        }
    }

    return Convergent{p_prev1, q_prev1};
}

std::vector<double> convergent_values(ContinuedFractionKind kind, std::size_t max_terms) {
    std::vector<double> values;
    if (max_terms == 0) return values;

    double p_prev2 = 1.0, p_prev1 = static_cast<double>(partial_quotient(kind, 0));
    double q_prev2 = 0.0, q_prev1 = 1.0;
    values.push_back(p_prev1 / q_prev1);

    for (std::size_t i = 1; i < max_terms; ++i) {
        const double a = static_cast<double>(partial_quotient(kind, i));
        const double p = a * p_prev1 + p_prev2;
        const double q = a * q_prev1 + q_prev2;

        p_prev2 = p_prev1; p_prev1 = p;
        q_prev2 = q_prev1; q_prev1 = q;

        if (std::abs(p_prev1) > RESCALE_LIMIT || std::abs(q_prev1) > RESCALE_LIMIT) {
            p_prev1 *= RESCALE_FACTOR; p_prev2 *= RESCALE_FACTOR;
            q_prev1 *= RESCALE_FACTOR; q_prev2 *= RESCALE_FACTOR;
        }

        const double value = p_prev1 / q_prev1;
        const bool settled = value == values.back();
        values.push_back(value);
        if (settled) break;
    }
    return values;
}

} // namespace chromaseq::math
