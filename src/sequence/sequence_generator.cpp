#include <sequence/sequence_generator.hpp>
#include <sequence/digit_sequences.hpp>
#include <math/continued_fraction.hpp>
#include <math/metallic_roots.hpp>
#include <utils/overloaded.hpp>

#include <algorithm>

namespace chromaseq::sequence {

using Chromaseq::overloaded;
using color::RGB;

namespace {

/**
 * @brief Method with everything that does not depend on n resolved.
 */
struct PreparedMethod {
    Method method;
    double offset = 0.0;
    double root = 0.0;  // φ_d, R-sequence only
    std::vector<double> convergents;  // p_k/q_k, continued fraction only
};

PreparedMethod prepare(const Method& method, const Seed& seed) {
    validate(method);

    PreparedMethod prepared{method, seed.offset(), 0.0};
    if (const auto* r = std::get_if<RSequence>(&method)) {
        prepared.root = math::r_sequence_root(r->dim);
    }
    if (const auto* cf = std::get_if<ContinuedFraction>(&method)) {
        prepared.convergents = math::convergent_values(cf->kind);
    }
    return prepared;
}

SequencePoint point_of(const PreparedMethod& prepared, uint32_t index) {
    const double s = prepared.offset;
    const double n = static_cast<double>(index);
    SequencePoint p;

    std::visit(overloaded{
        [&](const Golden&) {
            p.coords[0] = frac(s + n / math::PHI);
            p.dimension = 1;
        },
        [&](const Plastic&) {
            p.coords[0] = frac(s + n / math::PHI2);
            p.coords[1] = frac(s + n / (math::PHI2 * math::PHI2));
            p.dimension = 2;
        },
        [&](const Halton& m) {
            for (int i = 0; i < 3; ++i) {
                p.coords[i] = frac(s + van_der_corput(index, m.bases[i]));
            }
            p.dimension = 3;
        },
        [&](const RSequence& m) {
            const double phi_d = prepared.root;
            p.coords[0] = frac(s + n / phi_d);
            p.coords[1] = frac(s + n / (phi_d * phi_d));
            if (m.dim == 2) {
                p.dimension = 2;
            } else {
                p.coords[2] = frac(s + n / (phi_d * phi_d * phi_d));
                p.dimension = 3;
            }
        },
        [&](const Kronecker& m) {
            p.coords[0] = frac(s + n * m.alpha);
            p.dimension = 1;
        },
        [&](const Sobol&) {
            for (int d = 0; d < 3; ++d) {
                p.coords[d] = frac(s + sobol_point(index, static_cast<uint32_t>(d + 1)));
            }
            p.dimension = 3;
        },
        [&](const Pisot& m) {
            // round(θ^n) is an integer; once it overflows it contributes nothing
            // to the fractional part.
            const double power = std::round(std::pow(m.theta, n));
            p.coords[0] = std::isfinite(power) ? frac(s + power) : frac(s);
            p.dimension = 1;
        },
        [&](const ContinuedFraction&) {
            // Past the last entry the convergents agree to double precision.
            const auto& values = prepared.convergents;
            p.coords[0] = frac(s + values[std::min<std::size_t>(index, values.size() - 1)]);
            p.dimension = 1;
        },
    }, prepared.method);

    return p;
}

RGB hsl_from_point(const Eigen::Vector3d& x) {
    return color::hsl_to_rgb(x[0] * 360.0, x[1] * 0.5 + 0.5, x[2] * 0.3 + 0.4);
}

RGB color_of(const PreparedMethod& prepared, const SequencePoint& p) {
    const Eigen::Vector3d& x = p.coords;

    return std::visit(overloaded{
        [&](const Golden& m) {
            return color::hsl_to_rgb(x[0] * 360.0, m.saturation, m.lightness);
        },
        [&](const Plastic& m) {
            return color::hsl_to_rgb(x[0] * 360.0, x[1] * 0.5 + 0.5, m.lightness);
        },
        [&](const Halton& m) {
            return m.mode == ColorMode::Rgb ? RGB{x[0], x[1], x[2]} : hsl_from_point(x);
        },
        [&](const RSequence& m) {
            if (m.dim == 2) {
                return color::hsl_to_rgb(x[0] * 360.0, x[1] * 0.5 + 0.5, m.lightness);
            }
            return hsl_from_point(x);
        },
        [&](const Kronecker& m) {
            return color::hsl_to_rgb(x[0] * 360.0, m.saturation, m.lightness);
        },
        [&](const Sobol& m) {
            return m.mode == ColorMode::Rgb ? RGB{x[0], x[1], x[2]} : hsl_from_point(x);
        },
        [&](const Pisot& m) {
            return color::hsl_to_rgb(x[0] * 360.0, m.saturation, m.lightness);
        },
        [&](const ContinuedFraction& m) {
            return color::hsl_to_rgb(x[0] * 360.0, m.saturation, m.lightness);
        },
    }, prepared.method);
}

} // namespace

RGB SequenceGenerator::golden_color(uint32_t n, const Seed& seed, const Golden& params) {
    return color(params, n, seed);
}

RGB SequenceGenerator::plastic_color(uint32_t n, const Seed& seed, const Plastic& params) {
    return color(params, n, seed);
}

RGB SequenceGenerator::halton_color(uint32_t n, const Seed& seed, const Halton& params) {
    return color(params, n, seed);
}

RGB SequenceGenerator::r_sequence_color(uint32_t n, const Seed& seed, const RSequence& params) {
    return color(params, n, seed);
}

RGB SequenceGenerator::kronecker_color(uint32_t n, const Seed& seed, const Kronecker& params) {
    return color(params, n, seed);
}

RGB SequenceGenerator::sobol_color(uint32_t n, const Seed& seed, const Sobol& params) {
    return color(params, n, seed);
}

RGB SequenceGenerator::pisot_color(uint32_t n, const Seed& seed, const Pisot& params) {
    return color(params, n, seed);
}

RGB SequenceGenerator::continued_fraction_color(uint32_t n, const Seed& seed,
                                                const ContinuedFraction& params) {
    return color(params, n, seed);
}

SequencePoint SequenceGenerator::point(const Method& method, uint32_t n, const Seed& seed) {
    check_index(method, n);
    return point_of(prepare(method, seed), n);
}

RGB SequenceGenerator::color(const Method& method, uint32_t n, const Seed& seed) {
    check_index(method, n);
    const PreparedMethod prepared = prepare(method, seed);
    return color_of(prepared, point_of(prepared, n));
}

std::string SequenceGenerator::hex(const Method& method, uint32_t n, const Seed& seed) {
    return color::rgb_to_hex(color(method, n, seed));
}

std::vector<std::string> SequenceGenerator::generate_hex(const Method& method, const Seed& seed,
                                                         uint32_t count) {
    const uint64_t first = start_index(method);
    const auto generator = bind(method, seed);
    if (count > 0) check_index(method, first + count - 1);

    std::vector<std::string> hexes;
    hexes.reserve(count);
    for (uint64_t i = 0; i < count; ++i) {
        hexes.push_back(color::rgb_to_hex(generator(static_cast<uint32_t>(first + i))));
    }
    return hexes;
}

SequenceGenerator::ColorFn SequenceGenerator::bind(const Method& method, const Seed& seed) {
    return [prepared = prepare(method, seed)](uint32_t n) {
        return color_of(prepared, point_of(prepared, n));
    };
}

} // namespace chromaseq::sequence
