//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/color/Color.cpp
// Purpose: Implement color construction, checked arithmetic and the packed
//          integer and textual encodings.
// Key invariants: Arithmetic results are computed into a scratch array and
//                 only returned once every channel succeeded.
//
//===----------------------------------------------------------------------===//

#include "color/Color.hpp"

#include "support/DiagnosticCodes.hpp"

#include <cstdio>

namespace themebuild::color
{
namespace
{
support::Diag colorError(std::string message)
{
    return support::makeError({}, std::move(message), std::string(diag::ColorError));
}
} // namespace

Color Color::rgb(uint8_t r, uint8_t g, uint8_t b)
{
    return Color(3, {r, g, b, 0});
}

Color Color::rgba(uint8_t r, uint8_t g, uint8_t b, uint8_t a)
{
    return Color(4, {r, g, b, a});
}

Color Color::fromValue(uint32_t value)
{
    if (value <= 0xFFFFFF)
        return rgb(static_cast<uint8_t>(value >> 16), static_cast<uint8_t>(value >> 8),
                   static_cast<uint8_t>(value));
    return rgba(static_cast<uint8_t>(value >> 24), static_cast<uint8_t>(value >> 16),
                static_cast<uint8_t>(value >> 8), static_cast<uint8_t>(value));
}

Expected<Color> Color::withChannels(uint32_t value, int64_t channels)
{
    switch (channels)
    {
        case 3:
            if (value > 0xFFFFFF)
            {
                return colorError("value `" + std::to_string(value) +
                                  "` does not fit within 3 channels");
            }
            return rgb(static_cast<uint8_t>(value >> 16), static_cast<uint8_t>(value >> 8),
                       static_cast<uint8_t>(value));
        case 4:
            return rgba(static_cast<uint8_t>(value >> 24), static_cast<uint8_t>(value >> 16),
                        static_cast<uint8_t>(value >> 8), static_cast<uint8_t>(value));
        default:
            return colorError("invalid channel count `" + std::to_string(channels) + "`");
    }
}

uint32_t Color::value() const
{
    uint32_t packed = 0;
    for (unsigned i = 0; i < count_; ++i)
        packed = (packed << 8) | channels_[i];
    return packed;
}

uint32_t Color::valueRev() const
{
    uint32_t packed = 0;
    for (unsigned i = count_; i-- > 0;)
        packed = (packed << 8) | channels_[i];
    return packed;
}

Expected<Color> Color::add(const Color &other) const
{
    if (count_ != other.count_)
        return colorError("cannot perform arithmetic on two colors with different channels");

    std::array<uint8_t, 4> result{};
    for (unsigned i = 0; i < count_; ++i)
    {
        const unsigned sum = unsigned{channels_[i]} + other.channels_[i];
        if (sum > 0xFF)
            return colorError("color addition caused one of the channels to overflow past 255");
        result[i] = static_cast<uint8_t>(sum);
    }
    return Color(count_, result);
}

Expected<Color> Color::sub(const Color &other) const
{
    if (count_ != other.count_)
        return colorError("cannot perform arithmetic on two colors with different channels");

    std::array<uint8_t, 4> result{};
    for (unsigned i = 0; i < count_; ++i)
    {
        if (other.channels_[i] > channels_[i])
            return colorError("color subtraction caused one of the channels to underflow below 0");
        result[i] = static_cast<uint8_t>(channels_[i] - other.channels_[i]);
    }
    return Color(count_, result);
}

Color Color::withAlpha(uint8_t alpha) const
{
    return rgba(channels_[0], channels_[1], channels_[2], alpha);
}

Color Color::toRgb() const
{
    return rgb(channels_[0], channels_[1], channels_[2]);
}

Expected<int64_t> Color::negative() const
{
    if (hasAlpha())
        return colorError("cannot apply negative() to RGBA color");
    return static_cast<int64_t>(valueRev()) - 0x1000000;
}

std::string Color::hex() const
{
    std::string out;
    char buf[3];
    for (unsigned i = count_; i-- > 0;)
    {
        std::snprintf(buf, sizeof(buf), "%02X", channels_[i]);
        out.append(buf, 2);
    }
    return out;
}

std::string Color::arr() const
{
    std::string out;
    for (unsigned i = 0; i < count_; ++i)
    {
        if (i != 0)
            out.push_back(' ');
        out += std::to_string(channels_[i]);
    }
    return out;
}

bool Color::operator==(const Color &other) const
{
    if (count_ != other.count_)
        return false;
    for (unsigned i = 0; i < count_; ++i)
    {
        if (channels_[i] != other.channels_[i])
            return false;
    }
    return true;
}

} // namespace themebuild::color
