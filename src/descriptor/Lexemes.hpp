//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: descriptor/Lexemes.hpp
// Purpose: Scanning routines shared by the descriptor and config-value
//          parsers: JSON string literals and `#{ }` expression spans.
// Key invariants: On success the cursor sits just past the scanned lexeme; on
//                 failure its position is unspecified and the caller must
//                 abandon the buffer.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "themebuild/parse/Cursor.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace themebuild::descriptor
{

/// @brief Convert a cursor position into a diagnostic location.
support::SourceLoc toLoc(uint32_t fileId, parse::SourcePos pos);

/// @brief Short excerpt of the text at the cursor used in error messages.
std::string fragmentAt(const parse::Cursor &cur);

/// @brief Decode a JSON-style double-quoted string literal.
/// @param cur Cursor positioned on the opening quote.
/// @param fileId File identifier used for error locations.
/// @return Decoded UTF-8 text or a syntax diagnostic.
support::Expected<std::string> scanStringLiteral(parse::Cursor &cur, uint32_t fileId);

/// @brief Scan a `#{ ... }` expression span with nested braces.
/// @details Braces inside script strings (quoted or long-bracket) and script
///          comments do not count toward nesting.
/// @param cur Cursor positioned on the `#` of `#{`.
/// @param fileId File identifier used for error locations.
/// @return View of the text between the outer braces.
support::Expected<std::string_view> scanExpressionSpan(parse::Cursor &cur, uint32_t fileId);

} // namespace themebuild::descriptor
