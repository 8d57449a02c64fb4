//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: descriptor/ConfigValueParser.hpp
// Purpose: Split an imported configuration value into literal text and
//          embedded `#{ }` expressions.
// Key invariants: Concatenating the parts (expressions re-wrapped in `#{ }`)
//                 reproduces the value.
// Ownership/Lifetime: Parts view the value string passed to the parser.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "themebuild/parse/Cursor.h"

#include <cstdint>
#include <string_view>
#include <vector>

namespace themebuild::descriptor
{

struct ValuePart
{
    enum class Kind
    {
        Text,
        Expression
    };

    Kind kind;
    std::string_view text; ///< Literal text, or the expression source between the braces.
    parse::SourcePos pos;  ///< Position of the part (of `#` for expressions).
    unsigned indent = 0;   ///< Code points between the start of the value's line and the part.
};

/// @brief Parse configuration value @p value.
/// @param value Raw value text as read from the configuration file.
/// @param fileId File identifier for diagnostics.
/// @param start Position of the value inside its file.
support::Expected<std::vector<ValuePart>> parseConfigValue(std::string_view value,
                                                           uint32_t fileId = 0,
                                                           parse::SourcePos start = {});

} // namespace themebuild::descriptor
