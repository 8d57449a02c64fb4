//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/build/Serialize.cpp
// Purpose: Implement the projection of script values onto output text.
//
//===----------------------------------------------------------------------===//

#include "build/Serialize.hpp"

#include "support/DiagnosticCodes.hpp"

#include <array>
#include <charconv>
#include <cmath>

namespace themebuild::build
{

using script::Value;

std::string formatFloat(double value)
{
    if (std::isnan(value))
        return "nan";
    if (std::isinf(value))
        return value > 0 ? "inf" : "-inf";

    // Fixed notation of the largest doubles needs a little over 300 digits.
    std::array<char, 512> buf{};
    auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value,
                                   std::chars_format::fixed);
    if (ec != std::errc())
        return std::to_string(value);
    return std::string(buf.data(), end);
}

support::Expected<std::string> serializeValue(const Value &value,
                                              Destination dest,
                                              support::SourceLoc loc)
{
    switch (value.kind())
    {
        case Value::Kind::Nil:
            return std::string{};
        case Value::Kind::Boolean:
            return std::string(value.asBoolean() ? "true" : "false");
        case Value::Kind::Integer:
            return std::to_string(value.asInteger());
        case Value::Kind::Number:
            return formatFloat(value.asNumber());
        case Value::Kind::String:
            return value.asString();
        case Value::Kind::Color:
        {
            const auto &color = value.asColor();
            const uint32_t packed =
                dest == Destination::Descriptor ? color.value() : color.valueRev();
            return std::to_string(packed);
        }
        case Value::Kind::Function:
        case Value::Kind::Table:
        case Value::Kind::Userdata:
        case Value::Kind::Thread:
            break;
    }
    return support::makeError(loc,
                              std::string("cannot serialize a ") + value.typeName() +
                                  " value; expressions must produce nil, a boolean, a number, "
                                  "a string or a color",
                              std::string(diag::UnsupportedResult));
}

} // namespace themebuild::build
