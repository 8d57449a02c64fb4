//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: color/Color.hpp
// Purpose: Declare the 3/4-channel color value exposed to theme scripts.
// Key invariants: channelCount() is 3 or 4; every channel is a byte; binary
//                 operations require equal channel counts and never return a
//                 partially computed color.
// Ownership/Lifetime: Plain value type.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <array>
#include <cstdint>
#include <string>

namespace themebuild::color
{

using support::Expected;

/// @brief RGB or RGBA color with the legacy packed encodings used by themes.
///
/// Channels are stored in construction order: for a value built from
/// 0xRRGGBB the channels are r, g, b; for 0xRRGGBBAA they are r, g, b, a.
/// The reversed encodings (valueRev(), hex()) match the byte order of the
/// `.ReaperTheme` configuration format.
class Color
{
  public:
    /// @brief Build a 3-channel color.
    static Color rgb(uint8_t r, uint8_t g, uint8_t b);

    /// @brief Build a 4-channel color.
    static Color rgba(uint8_t r, uint8_t g, uint8_t b, uint8_t a);

    /// @brief Unpack @p value, choosing RGB when it fits in 24 bits.
    static Color fromValue(uint32_t value);

    /// @brief Unpack @p value into exactly @p channels channels.
    /// @return Error when @p channels is not 3 or 4, or when 3 channels are
    ///         requested for a value above 0xFFFFFF.
    static Expected<Color> withChannels(uint32_t value, int64_t channels);

    /// @brief Number of channels, 3 or 4.
    [[nodiscard]] unsigned channelCount() const
    {
        return count_;
    }

    [[nodiscard]] bool hasAlpha() const
    {
        return count_ == 4;
    }

    /// @brief Channel @p index in construction order.
    [[nodiscard]] uint8_t channel(unsigned index) const
    {
        return channels_[index];
    }

    /// @brief Re-pack the channels in construction order.
    [[nodiscard]] uint32_t value() const;

    /// @brief Re-pack the channels in reversed order.
    [[nodiscard]] uint32_t valueRev() const;

    /// @brief Channel-wise checked addition.
    [[nodiscard]] Expected<Color> add(const Color &other) const;

    /// @brief Channel-wise checked subtraction.
    [[nodiscard]] Expected<Color> sub(const Color &other) const;

    /// @brief Same color with alpha @p alpha; an RGB color gains a fourth channel.
    [[nodiscard]] Color withAlpha(uint8_t alpha) const;

    /// @brief Drop the alpha channel if present.
    [[nodiscard]] Color toRgb() const;

    /// @brief Legacy toggle encoding `valueRev() - 0x1000000`; RGB only.
    [[nodiscard]] Expected<int64_t> negative() const;

    /// @brief Uppercase zero-padded hex digits in reversed channel order.
    [[nodiscard]] std::string hex() const;

    /// @brief Decimal channels in construction order separated by spaces.
    [[nodiscard]] std::string arr() const;

    bool operator==(const Color &other) const;

    bool operator!=(const Color &other) const
    {
        return !(*this == other);
    }

  private:
    Color(unsigned count, std::array<uint8_t, 4> channels) : count_(count), channels_(channels) {}

    unsigned count_ = 3;
    std::array<uint8_t, 4> channels_{};
};

} // namespace themebuild::color
