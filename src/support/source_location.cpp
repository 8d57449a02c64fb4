//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Provides the out-of-line validity query for the SourceLoc value type.  A
// location is considered valid when it refers to a registered file identifier;
// line and column components are optional and surfaced through `hasLine()` and
// `hasColumn()` respectively.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements validity queries for `SourceLoc`.

#include "support/source_location.hpp"

namespace themebuild::support
{
/// @brief Determine whether the location carries a real source attachment.
///
/// @details SourceManager dispenses monotonically increasing identifiers for
///          every file registered during a build.  The default-constructed
///          location uses zero to mark "unknown", which is also what the
///          parsers produce when scanning a buffer that has no backing file
///          (for example a configuration value or an inline script chunk).
///
/// @return True when the location originated from a tracked source file.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}
} // namespace themebuild::support
