#include <color/color_space.hpp>
#include <core/errors.hpp>

#include <algorithm>
#include <cmath>
#include <string_view>

namespace chromaseq::color {

using Chromaseq::ChromaseqError;
using Chromaseq::ErrorKind;

namespace {

// Pre-computed hex digit table for conversion
constexpr char HEX_DIGITS[] = "0123456789ABCDEF";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

int quantize(double channel) {
    return static_cast<int>(std::lround(std::clamp(channel, 0.0, 1.0) * 255.0));
}

} // namespace

RGB hsl_to_rgb(double h, double s, double l) {
    double hue = std::fmod(h, 360.0);
    if (hue < 0.0) hue += 360.0;

    const double c = (1.0 - std::abs(2.0 * l - 1.0)) * s;
    const double hp = hue / 60.0;
    const double x = c * (1.0 - std::abs(std::fmod(hp, 2.0) - 1.0));

    double r1 = 0.0, g1 = 0.0, b1 = 0.0;
    if (hp < 1.0) {
        r1 = c; g1 = x;
    } else if (hp < 2.0) {
        r1 = x; g1 = c;
    } else if (hp < 3.0) {
        g1 = c; b1 = x;
    } else if (hp < 4.0) {
        g1 = x; b1 = c;
    } else if (hp < 5.0) {
        r1 = x; b1 = c;
    } else {
        r1 = c; b1 = x;
    }

    const double m = l - c / 2.0;
    return RGB{r1 + m, g1 + m, b1 + m};
}

RGB hsl_to_rgb(const HSL& hsl) {
    return hsl_to_rgb(hsl.h, hsl.s, hsl.l);
}

HSL rgb_to_hsl(const RGB& rgb) {
    const double max = std::max({rgb.r, rgb.g, rgb.b});
    const double min = std::min({rgb.r, rgb.g, rgb.b});
    const double delta = max - min;

    double h = 0.0;
    if (delta != 0.0) {
        if (max == rgb.r) {
            h = 60.0 * std::fmod((rgb.g - rgb.b) / delta, 6.0);
        } else if (max == rgb.g) {
            h = 60.0 * ((rgb.b - rgb.r) / delta + 2.0);
        } else {
            h = 60.0 * ((rgb.r - rgb.g) / delta + 4.0);
        }
    }
    if (h < 0.0) h += 360.0;

    const double l = (max + min) / 2.0;
    const double s = delta == 0.0 ? 0.0 : delta / (1.0 - std::abs(2.0 * l - 1.0));

    return HSL{h, s, l};
}

std::string rgb_to_hex(const RGB& rgb) {
    std::string hex(7, '#');
    const int channels[3] = {quantize(rgb.r), quantize(rgb.g), quantize(rgb.b)};
    for (int i = 0; i < 3; ++i) {
        hex[1 + 2 * i] = HEX_DIGITS[channels[i] >> 4];
        hex[2 + 2 * i] = HEX_DIGITS[channels[i] & 0xF];
    }
    return hex;
}

RGB hex_to_rgb(const std::string& hex) {
    std::string_view digits(hex);
    if (!digits.empty() && digits.front() == '#') digits.remove_prefix(1);

    if (digits.size() != 6) {
        throw ChromaseqError(ErrorKind::MalformedColor,
                             "Invalid hex color length: '" + hex + "'. Expected #RRGGBB.");
    }

    double channels[3];
    for (int i = 0; i < 3; ++i) {
        int hi = hex_value(digits[2 * i]);
        int lo = hex_value(digits[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw ChromaseqError(ErrorKind::MalformedColor,
                                 "Invalid hex digit in color: '" + hex + "'");
        }
        channels[i] = static_cast<double>(hi * 16 + lo) / 255.0;
    }

    return RGB{channels[0], channels[1], channels[2]};
}

double color_distance(const RGB& a, const RGB& b) noexcept {
    return (a.vec() - b.vec()).norm();
}

} // namespace chromaseq::color
