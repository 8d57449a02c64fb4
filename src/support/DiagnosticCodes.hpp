//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/DiagnosticCodes.hpp
// Purpose: Centralized diagnostic codes for the theme build pipeline
// Key invariants: All codes are unique and follow T#### format
// Ownership/Lifetime: Static constants with program lifetime
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>

namespace themebuild::diag
{

/// Syntax error codes (T0001-T0999)
constexpr std::string_view UnterminatedString = "T0001";
constexpr std::string_view InvalidEscapeSequence = "T0002";
constexpr std::string_view ControlCharInString = "T0003";
constexpr std::string_view UnterminatedExpression = "T0004";
constexpr std::string_view MalformedInclude = "T0005";
constexpr std::string_view MalformedResource = "T0006";
constexpr std::string_view TrailingDirectiveText = "T0007";
constexpr std::string_view ScriptSyntax = "T0010";
constexpr std::string_view IniSyntax = "T0020";

/// Semantic and validation codes (T1000-T1999)
constexpr std::string_view NonRelativePath = "T1000";
constexpr std::string_view InvalidGlob = "T1001";
constexpr std::string_view IncludeDepthExceeded = "T1002";
constexpr std::string_view ColorError = "T1003";

/// I/O codes (T2000-T2999)
constexpr std::string_view ReadFailure = "T2000";
constexpr std::string_view WriteFailure = "T2001";
constexpr std::string_view OutputExists = "T2002";

/// Evaluation codes (T3000-T3999)
constexpr std::string_view ScriptRuntime = "T3000";
constexpr std::string_view UnsupportedResult = "T3001";

/// Advisory codes (T9000-T9999)
constexpr std::string_view ResourceOverwrite = "T9000";
constexpr std::string_view GlobEntryUnreadable = "T9001";
constexpr std::string_view UnnamedMatch = "T9002";
constexpr std::string_view ThemeNameMismatch = "T9003";

} // namespace themebuild::diag
