//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: build/Serialize.hpp
// Purpose: Convert script results into the text spliced into descriptor code
//          and configuration values.
// Key invariants: Every Value kind is handled; kinds without a text form are
//                 rejected with T3001 rather than stringified.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "script/Value.hpp"
#include "support/diag_expected.hpp"

#include <string>

namespace themebuild::build
{

/// @brief Where a serialized result ends up; selects the color byte order.
enum class Destination
{
    Descriptor, ///< Descriptor code: colors use Color::value().
    Config      ///< Configuration values: colors use Color::valueRev().
};

/// @brief Shortest decimal text that reads back as @p value, never in
///        exponent form (`1.0` gives "1", `0.5` gives "0.5").
std::string formatFloat(double value);

/// @brief Text form of @p value for @p dest.
/// @param loc Location attached to the T3001 diagnostic.
support::Expected<std::string> serializeValue(const script::Value &value,
                                              Destination dest,
                                              support::SourceLoc loc = {});

} // namespace themebuild::build
