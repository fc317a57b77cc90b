#include "livemap/protocol/color.hpp"
#include "livemap/protocol/errors.hpp"

#include <gtest/gtest.h>

using namespace livemap::protocol;

namespace {

ColorErrorKind color_error_kind(const std::string &text) {
    try {
        parse_hex_color(text);
    } catch (const ColorConversionError &e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected a ColorConversionError for: " << text;
    return ColorErrorKind::WrongPrefix;
}

} // namespace

TEST(HexColor, ChannelFractions) {
    auto color = parse_hex_color("#1A2B3C");
    EXPECT_FLOAT_EQ(color.r, 26.0f / 255.0f);
    EXPECT_FLOAT_EQ(color.g, 43.0f / 255.0f);
    EXPECT_FLOAT_EQ(color.b, 60.0f / 255.0f);
    EXPECT_FLOAT_EQ(color.a, 1.0f);
}

TEST(HexColor, LowercaseDigits) {
    auto color = parse_hex_color("#ff0080");
    EXPECT_FLOAT_EQ(color.r, 1.0f);
    EXPECT_FLOAT_EQ(color.g, 0.0f);
    EXPECT_FLOAT_EQ(color.b, 128.0f / 255.0f);
}

TEST(HexColor, MissingPrefix) { EXPECT_EQ(color_error_kind("1A2B3C"), ColorErrorKind::WrongPrefix); }

TEST(HexColor, InvalidHexDigit) {
    EXPECT_EQ(color_error_kind("#GGHHII"), ColorErrorKind::ParseInt);
}

TEST(HexColor, WrongLength) {
    EXPECT_EQ(color_error_kind("#1A2B"), ColorErrorKind::ParseInt);
    EXPECT_EQ(color_error_kind("#1A2B3C4D"), ColorErrorKind::ParseInt);
    EXPECT_EQ(color_error_kind(""), ColorErrorKind::WrongPrefix);
}

TEST(HexColor, FromPackedRgb) {
    EXPECT_EQ(color_from_rgb(0x1A2B3C), parse_hex_color("#1A2B3C"));
}
