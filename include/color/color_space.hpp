#pragma once

#include <export.hpp>
#include <Eigen/Core>
#include <string>

namespace chromaseq::color {

/**
 * @brief Color in the unit RGB cube (each channel in [0, 1]).
 */
struct RGB {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;

    Eigen::Vector3d vec() const { return Eigen::Vector3d(r, g, b); }

    bool operator==(const RGB& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
};

/**
 * @brief Hue in degrees [0, 360), saturation and lightness in [0, 1].
 */
struct HSL {
    double h = 0.0;
    double s = 0.0;
    double l = 0.0;
};

/**
 * @brief HSL → RGB using six 60° hue sectors.
 *
 * c = (1 - |2l - 1|) * s, x = c * (1 - |(h/60 mod 2) - 1|), m = l - c/2.
 * Hues outside [0, 360) are wrapped first; a hue that rounds to 360 lands
 * on the red sector exactly like hue 0.
 */
CHROMASEQ_API RGB hsl_to_rgb(double h, double s, double l);
CHROMASEQ_API RGB hsl_to_rgb(const HSL& hsl);

CHROMASEQ_API HSL rgb_to_hsl(const RGB& rgb);

/**
 * @brief Quantize to "#RRGGBB" (uppercase).
 *
 * Channels are clamped to [0, 1] and rounded to the nearest of 256 levels.
 */
CHROMASEQ_API std::string rgb_to_hex(const RGB& rgb);

/**
 * @brief Parse "#RRGGBB" or "RRGGBB"; each channel is divided by 255.
 * @throws Chromaseq::ChromaseqError (MalformedColor) on bad length or digits
 */
CHROMASEQ_API RGB hex_to_rgb(const std::string& hex);

/**
 * @brief Euclidean distance in the unit RGB cube, range [0, √3].
 */
CHROMASEQ_API double color_distance(const RGB& a, const RGB& b) noexcept;

} // namespace chromaseq::color
