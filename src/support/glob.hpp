//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/glob.hpp
// Purpose: Compile shell-style glob patterns and expand them against a
//          directory tree.
// Key invariants: A compiled GlobPattern is always syntactically valid; `**`
//                 only ever appears as a whole path component.
// Ownership/Lifetime: GlobPattern owns its component list by value.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace themebuild::support
{

/// @brief Validated glob pattern split into path components.
///
/// Supported syntax per component: `?` (one character), `*` (any run inside a
/// component), `[abc]`, `[a-z]` and `[!abc]` character classes.  A component
/// consisting solely of `**` matches zero or more directories.
class GlobPattern
{
  public:
    /// @brief Validate and split @p pattern.
    /// @param pattern Pattern text using `/` or `\` separators.
    /// @param loc Location attached to the T1001 diagnostic on failure.
    static Expected<GlobPattern> compile(std::string_view pattern, SourceLoc loc = {});

    /// @brief Original pattern text as written.
    const std::string &text() const
    {
        return text_;
    }

    /// @brief Test a `/`-separated relative path against the whole pattern.
    [[nodiscard]] bool matches(std::string_view relativePath) const;

    /// @brief Test a single file name against one pattern component.
    [[nodiscard]] static bool matchComponent(std::string_view component, std::string_view name);

  private:
    std::string text_;
    std::vector<std::string> components_;

    friend struct GlobWalker;
};

/// @brief Outcome of expanding a pattern on disk.
struct GlobExpansion
{
    std::vector<std::string> matches; ///< Matched paths in walk order, base-prefixed.
    std::vector<std::string> errors;  ///< Entries that could not be enumerated.
};

/// @brief Enumerate every filesystem entry under @p baseDir matching @p pattern.
/// @details Returned paths are @p baseDir joined with the matched relative path
///          using `/` separators.  Enumeration failures never abort expansion;
///          they are collected in GlobExpansion::errors.
GlobExpansion expandGlob(const GlobPattern &pattern, std::string_view baseDir);

} // namespace themebuild::support
