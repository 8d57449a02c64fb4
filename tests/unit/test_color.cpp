// File: tests/unit/test_color.cpp
// Purpose: Verify the color value model: unpacking, packed encodings, checked
//          arithmetic and the legacy negative() toggle.
// Key invariants: Failed arithmetic never yields a partially updated color.
// Ownership/Lifetime: Standalone unit test executable.

#include <gtest/gtest.h>

#include "color/Color.hpp"
#include "support/DiagnosticCodes.hpp"

using themebuild::color::Color;

TEST(Color, FromValueSelectsChannelCount)
{
    EXPECT_EQ(Color::fromValue(0xFFFFFF), Color::rgb(255, 255, 255));
    EXPECT_EQ(Color::fromValue(0x11223344), Color::rgba(0x11, 0x22, 0x33, 0x44));
    EXPECT_EQ(Color::fromValue(0).channelCount(), 3u);
    EXPECT_EQ(Color::fromValue(0x1000000).channelCount(), 4u);
}

TEST(Color, WithChannelsForcesLayout)
{
    auto rgba = Color::withChannels(0xFFFFFF, 4);
    ASSERT_TRUE(rgba);
    EXPECT_EQ(rgba.value(), Color::rgba(0, 255, 255, 255));

    auto rgb = Color::withChannels(0x102030, 3);
    ASSERT_TRUE(rgb);
    EXPECT_EQ(rgb.value(), Color::rgb(0x10, 0x20, 0x30));

    auto tooWide = Color::withChannels(0x1000000, 3);
    ASSERT_FALSE(tooWide);
    EXPECT_EQ(tooWide.error().code, themebuild::diag::ColorError);
    EXPECT_NE(tooWide.error().message.find("does not fit within 3 channels"), std::string::npos);

    auto badCount = Color::withChannels(1, 5);
    ASSERT_FALSE(badCount);
    EXPECT_EQ(badCount.error().message, "invalid channel count `5`");
}

TEST(Color, PackedEncodings)
{
    const Color rgb = Color::rgb(1, 2, 3);
    EXPECT_EQ(rgb.value(), 0x010203u);
    EXPECT_EQ(rgb.valueRev(), 0x030201u);
    EXPECT_EQ(rgb.valueRev(), 197121u);
    EXPECT_EQ(rgb.hex(), "030201");
    EXPECT_EQ(rgb.arr(), "1 2 3");

    const Color rgba = Color::rgba(0x11, 0x22, 0x33, 0x44);
    EXPECT_EQ(rgba.value(), 0x11223344u);
    EXPECT_EQ(rgba.valueRev(), 0x44332211u);
    EXPECT_EQ(rgba.hex(), "44332211");
    EXPECT_EQ(rgba.arr(), "17 34 51 68");

    EXPECT_EQ(Color::rgb(0xAB, 0x0C, 0xFF).hex(), "FF0CAB");
}

TEST(Color, AddThenSubRestoresOriginal)
{
    const Color a = Color::rgb(10, 20, 30);
    const Color b = Color::rgb(5, 100, 200);
    auto sum = a.add(b);
    ASSERT_TRUE(sum);
    EXPECT_EQ(sum.value(), Color::rgb(15, 120, 230));
    auto back = sum.value().sub(b);
    ASSERT_TRUE(back);
    EXPECT_EQ(back.value(), a);
}

TEST(Color, ArithmeticFailures)
{
    auto overflow = Color::rgb(250, 0, 0).add(Color::rgb(10, 0, 0));
    ASSERT_FALSE(overflow);
    EXPECT_NE(overflow.error().message.find("overflow past 255"), std::string::npos);

    auto underflow = Color::rgb(0, 0, 1).sub(Color::rgb(0, 0, 2));
    ASSERT_FALSE(underflow);
    EXPECT_NE(underflow.error().message.find("underflow below 0"), std::string::npos);

    auto mismatch = Color::rgb(1, 1, 1).add(Color::rgba(1, 1, 1, 1));
    ASSERT_FALSE(mismatch);
    EXPECT_EQ(mismatch.error().message,
              "cannot perform arithmetic on two colors with different channels");
}

TEST(Color, AlphaConversions)
{
    const Color rgb = Color::rgb(1, 2, 3);
    EXPECT_EQ(rgb.withAlpha(9), Color::rgba(1, 2, 3, 9));
    EXPECT_EQ(Color::rgba(1, 2, 3, 4).withAlpha(5), Color::rgba(1, 2, 3, 5));
    EXPECT_EQ(Color::rgba(1, 2, 3, 4).toRgb(), rgb);
    EXPECT_NE(rgb, rgb.withAlpha(0));
}

TEST(Color, NegativeIsRgbOnly)
{
    auto neg = Color::rgb(1, 2, 3).negative();
    ASSERT_TRUE(neg);
    EXPECT_EQ(neg.value(), static_cast<int64_t>(0x030201) - 0x1000000);

    auto rgbaNeg = Color::rgba(1, 2, 3, 4).negative();
    ASSERT_FALSE(rgbaNeg);
    EXPECT_EQ(rgbaNeg.error().message, "cannot apply negative() to RGBA color");
}
