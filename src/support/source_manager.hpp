//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Declares manager for source file identifiers.
// Key invariants: File ID 0 is invalid.
// Ownership/Lifetime: Manager owns file path strings.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "source_location.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace themebuild::support
{

inline constexpr std::string_view kSourceManagerFileIdOverflowMessage =
    "source manager exhausted file identifier space";

/// Maintains the mapping between numeric file identifiers and their
/// corresponding filesystem paths. Every descriptor, configuration file and
/// script read during a build is registered here so diagnostics can name it.
class SourceManager
{
  public:
    /// @brief Register file path @p path and return its id.
    /// @param path File system path.
    /// @return File identifier (>0 on success, 0 on overflow). Registering the
    ///         same normalized path twice returns the original identifier.
    uint32_t addFile(std::string path);

    /// @brief Retrieve path for @p file_id.
    /// @param file_id Identifier returned by addFile().
    /// @return File path string view, empty for unknown identifiers.
    std::string_view getPath(uint32_t file_id) const;

    /// @brief Number of files registered so far.
    [[nodiscard]] std::size_t fileCount() const
    {
        return files_.size();
    }

  private:
    /// Stored file paths. Index corresponds to file identifier minus one.
    /// std::deque keeps string references stable as new files are added.
    std::deque<std::string> files_;

    /// Next identifier to assign; stored as 64-bit to detect overflow safely.
    uint64_t next_file_id_ = 1;

    /// Fast lookup from normalized path to previously assigned identifier.
    std::unordered_map<std::string, uint32_t> path_to_id_;
};
} // namespace themebuild::support
