#include <sequence/method.hpp>
#include <sequence/digit_sequences.hpp>
#include <core/errors.hpp>
#include <utils/overloaded.hpp>

#include <cmath>
#include <limits>

namespace chromaseq::sequence {

using Chromaseq::ChromaseqError;
using Chromaseq::ErrorKind;
using Chromaseq::overloaded;

namespace {

void require_unit(const char* method, const char* name, double value) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw ChromaseqError(ErrorKind::InvalidParameter,
                             std::string(method) + ": " + name + " must lie in [0, 1], got " +
                             std::to_string(value));
    }
}

void require_finite(const char* method, const char* name, double value) {
    if (!std::isfinite(value)) {
        throw ChromaseqError(ErrorKind::InvalidParameter,
                             std::string(method) + ": " + name + " must be finite");
    }
}

} // namespace

std::string to_string(ColorMode mode) {
    return mode == ColorMode::Rgb ? "rgb" : "hsl";
}

ColorMode parse_color_mode(const std::string& tag) {
    if (tag == "rgb") return ColorMode::Rgb;
    if (tag == "hsl") return ColorMode::Hsl;
    throw ChromaseqError(ErrorKind::UnknownMethod, "Unknown color mode: " + tag);
}

std::string method_name(const Method& method) {
    return std::visit(overloaded{
        [](const Golden&)            { return std::string("golden"); },
        [](const Plastic&)           { return std::string("plastic"); },
        [](const Halton&)            { return std::string("halton"); },
        [](const RSequence&)         { return std::string("r_sequence"); },
        [](const Kronecker&)         { return std::string("kronecker"); },
        [](const Sobol&)             { return std::string("sobol"); },
        [](const Pisot&)             { return std::string("pisot"); },
        [](const ContinuedFraction&) { return std::string("continued_fraction"); },
    }, method);
}

std::vector<std::string> method_tags() {
    return {"golden", "plastic", "halton", "r_sequence",
            "kronecker", "sobol", "pisot", "continued_fraction"};
}

Method parse_method(const std::string& tag) {
    if (tag == "golden") return Golden{};
    if (tag == "plastic") return Plastic{};
    if (tag == "halton") return Halton{};
    if (tag == "r_sequence") return RSequence{};
    if (tag == "kronecker") return Kronecker{};
    if (tag == "sobol") return Sobol{};
    if (tag == "pisot") return Pisot{};
    if (tag == "continued_fraction" || tag == "cf") return ContinuedFraction{};

    throw ChromaseqError(ErrorKind::UnknownMethod, "Unknown method: " + tag);
}

uint32_t start_index(const Method& method) {
    return std::holds_alternative<Sobol>(method) ? 0u : 1u;
}

uint32_t max_index(const Method& method) {
    return std::holds_alternative<Sobol>(method) ? SobolDirections::MAX_INDEX
                                                 : std::numeric_limits<uint32_t>::max();
}

void check_index(const Method& method, uint64_t index) {
    if (index > max_index(method)) {
        throw ChromaseqError(ErrorKind::InvalidParameter,
                             method_name(method) + ": index " + std::to_string(index) +
                             " is beyond the last index " + std::to_string(max_index(method)));
    }
}

void validate(const Method& method) {
    std::visit(overloaded{
        [](const Golden& m) {
            require_unit("golden", "saturation", m.saturation);
            require_unit("golden", "lightness", m.lightness);
        },
        [](const Plastic& m) {
            require_unit("plastic", "lightness", m.lightness);
        },
        [](const Halton& m) {
            for (uint32_t base : m.bases) {
                if (base < 2) {
                    throw ChromaseqError(ErrorKind::InvalidParameter,
                                         "halton: bases must be at least 2, got " + std::to_string(base));
                }
            }
        },
        [](const RSequence& m) {
            if (m.dim < 1 || m.dim > math::MAX_R_SEQUENCE_DIM) {
                throw ChromaseqError(ErrorKind::InvalidParameter,
                                     "r_sequence: dim must lie in 1.." +
                                     std::to_string(math::MAX_R_SEQUENCE_DIM) +
                                     ", got " + std::to_string(m.dim));
            }
            require_unit("r_sequence", "lightness", m.lightness);
        },
        [](const Kronecker& m) {
            require_finite("kronecker", "alpha", m.alpha);
            require_unit("kronecker", "saturation", m.saturation);
            require_unit("kronecker", "lightness", m.lightness);
        },
        [](const Sobol&) {},
        [](const Pisot& m) {
            require_finite("pisot", "theta", m.theta);
            require_unit("pisot", "saturation", m.saturation);
            require_unit("pisot", "lightness", m.lightness);
        },
        [](const ContinuedFraction& m) {
            require_unit("continued_fraction", "saturation", m.saturation);
            require_unit("continued_fraction", "lightness", m.lightness);
        },
    }, method);
}

} // namespace chromaseq::sequence
