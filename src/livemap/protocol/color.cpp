#include "livemap/protocol/color.hpp"
#include "livemap/protocol/errors.hpp"

#include <cstdint>
#include <string>

namespace livemap::protocol {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

uint8_t parse_channel(std::string_view text, size_t offset) {
    const int hi = hex_digit(text[offset]);
    const int lo = hex_digit(text[offset + 1]);
    if (hi < 0 || lo < 0) {
        throw ColorConversionError(ColorErrorKind::ParseInt,
                                   "invalid hex digit in '" + std::string(text) + "'");
    }
    return static_cast<uint8_t>(hi * 16 + lo);
}

} // namespace

Color parse_hex_color(std::string_view text) {
    if (text.empty() || text.front() != '#') {
        throw ColorConversionError(ColorErrorKind::WrongPrefix,
                                   "'" + std::string(text) + "' does not start with '#'");
    }
    if (text.size() != 7) {
        throw ColorConversionError(ColorErrorKind::ParseInt,
                                   "expected 6 hex digits in '" + std::string(text) + "'");
    }

    const uint8_t r = parse_channel(text, 1);
    const uint8_t g = parse_channel(text, 3);
    const uint8_t b = parse_channel(text, 5);
    return Color{r / 255.0f, g / 255.0f, b / 255.0f, 1.0f};
}

Color color_from_rgb(unsigned int rgb) {
    const auto r = static_cast<uint8_t>((rgb >> 16) & 0xFF);
    const auto g = static_cast<uint8_t>((rgb >> 8) & 0xFF);
    const auto b = static_cast<uint8_t>(rgb & 0xFF);
    return Color{r / 255.0f, g / 255.0f, b / 255.0f, 1.0f};
}

} // namespace livemap::protocol
