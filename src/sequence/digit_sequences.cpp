#include <sequence/digit_sequences.hpp>
#include <core/errors.hpp>

#include <algorithm>
#include <string>

namespace chromaseq::sequence {

using Chromaseq::ChromaseqError;
using Chromaseq::ErrorKind;

namespace {

struct PrimitivePolynomial {
    int degree;
    std::array<int, 5> coeffs;  // a_1 .. a_degree
};

constexpr std::array<PrimitivePolynomial, SobolDirections::MAX_DIMENSION> POLYNOMIALS = {{
    {1, {1, 0, 0, 0, 0}},  // x
    {2, {1, 1, 0, 0, 0}},  // x² + x + 1
    {3, {1, 0, 1, 0, 0}},  // x³ + x + 1
    {4, {1, 1, 0, 1, 0}},  // x⁴ + x + 1
    {5, {1, 0, 1, 0, 1}}   // x⁵ + x² + 1
}};

constexpr double SOBOL_SCALE = 1.0 / static_cast<double>(1u << SobolDirections::BITS);

} // namespace

double van_der_corput(uint64_t n, uint32_t base) {
    if (base < 2) {
        throw ChromaseqError(ErrorKind::InvalidParameter,
                             "Van der Corput base must be at least 2, got " + std::to_string(base));
    }

    double result = 0.0;
    double f = 1.0 / base;
    while (n > 0) {
        result += f * static_cast<double>(n % base);
        n /= base;
        f /= base;
    }
    return result;
}

SobolDirections::Table SobolDirections::build(int dim) {
    const PrimitivePolynomial& poly = POLYNOMIALS[dim - 1];
    Table v{};

    for (int i = 0; i < std::min(poly.degree, BITS); ++i) {
        v[i] = 1u << (BITS - 1 - i);
    }

    for (int i = poly.degree; i < BITS; ++i) {
        v[i] = v[i - poly.degree];
        for (int j = 1; j <= poly.degree; ++j) {
            if (poly.coeffs[j - 1] == 1) {
                v[i] ^= v[i - j] >> j;
            }
        }
    }
    return v;
}

const SobolDirections::Table& SobolDirections::table(uint32_t dim) {
    static const std::array<Table, MAX_DIMENSION> tables = [] {
        std::array<Table, MAX_DIMENSION> t{};
        for (int d = 1; d <= MAX_DIMENSION; ++d) {
            t[d - 1] = build(d);
        }
        return t;
    }();

    const uint32_t clamped = std::clamp<uint32_t>(dim, 1, MAX_DIMENSION);
    return tables[clamped - 1];
}

double sobol_point(uint64_t n, uint32_t dim) {
    const auto& v = SobolDirections::table(dim);
    const uint64_t g = gray_code(n);

    uint32_t x = 0;
    for (int i = 0; i < SobolDirections::BITS; ++i) {
        if ((g >> i) & 1u) {
            x ^= v[i];
        }
    }
    return static_cast<double>(x) * SOBOL_SCALE;
}

} // namespace chromaseq::sequence
