//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/path_utils.hpp
// Purpose: Declare helpers for validating and normalizing the relative paths
//          written in descriptors and scripts.
// Key invariants: Normalized paths always use forward slashes and have dot
//                 segments resolved; an empty path normalizes to ".".
// Ownership/Lifetime: Free functions returning owned strings.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <string>
#include <string_view>

namespace themebuild::support
{

/// @brief Check whether @p path starts with an absolute marker.
/// @details Rejects a leading `/` or `\` and a drive prefix such as `C:`.
[[nodiscard]] bool isAbsoluteLiteral(std::string_view path);

/// @brief Validate a path literal as relative and normalize it.
/// @param literal Decoded text of the path literal.
/// @param loc Location reported when the literal is rejected.
/// @return Normalized relative path or a T1000 diagnostic.
Expected<std::string> parseRelativePath(std::string_view literal, SourceLoc loc);

/// @brief Normalize @p path: backslashes become `/`, dot segments collapse.
[[nodiscard]] std::string normalize(std::string_view path);

/// @brief Join @p rel onto directory @p base and normalize the result.
[[nodiscard]] std::string joinPath(std::string_view base, std::string_view rel);

/// @brief Directory containing @p path, or "." when it has none.
[[nodiscard]] std::string parentDirectory(std::string_view path);

/// @brief Compute basename component of @p path after normalization.
/// @return Last path component or empty string when none exists.
[[nodiscard]] std::string basename(std::string_view path);

/// @brief Lower-cased extension of @p path without the leading dot.
[[nodiscard]] std::string extension(std::string_view path);

} // namespace themebuild::support
