#pragma once

#include <string_view>

namespace livemap::protocol {

/// RGBA color with channel fractions in [0, 1].
struct Color {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    bool operator==(const Color &) const = default;
};

/// Parse "#RRGGBB" into channel fractions (byte / 255) with full opacity.
/// Throws ColorConversionError: WrongPrefix if the leading '#' is missing,
/// ParseInt for a wrong length or a non-hex digit.
Color parse_hex_color(std::string_view text);

/// Build a color from a packed 0xRRGGBB integer.
Color color_from_rgb(unsigned int rgb);

} // namespace livemap::protocol
