//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_loader.hpp
// Purpose: Shared helpers for reading descriptor, configuration and script
//          files and for writing staged artifacts.
// Key invariants: LoadedSource accurately captures file contents and
//                 SourceManager registration.
// Ownership/Lifetime: The caller owns the returned LoadedSource.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace themebuild::support
{

/// @brief Result of loading a source file into memory.
/// @details Contains the file contents and the identifier assigned by the
///          SourceManager so diagnostics can name the file later.
struct LoadedSource
{
    std::string buffer; ///< Full contents of the source file.
    uint32_t fileId{0}; ///< Identifier assigned by SourceManager (0 indicates failure).
};

/// @brief Load a source file into memory and register it with the source manager.
///
/// @param path Filesystem path to the source file.
/// @param sm Source manager tracking file identifiers for diagnostics.
/// @param loc Location of the directive that requested the file, if any.
/// @return Loaded source buffer on success; otherwise a T2000 diagnostic.
Expected<LoadedSource> loadSourceBuffer(const std::string &path,
                                        SourceManager &sm,
                                        SourceLoc loc = {});

/// @brief Write @p contents to @p path, creating parent directories.
/// @return Empty on success; otherwise a T2001 diagnostic naming the path.
Expected<void> writeTextFile(const std::string &path, std::string_view contents);

} // namespace themebuild::support
