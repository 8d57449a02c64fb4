//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: build/ResourceManifest.hpp
// Purpose: Destination to source mapping of the files packaged with a theme.
// Key invariants: Destinations are unique; the first registration of a
//                 destination wins and later ones are rejected.
// Ownership/Lifetime: Owns its entries by value.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace themebuild::build
{

struct ResourceEntry
{
    std::string dest;   ///< Normalized path inside the theme directory.
    std::string source; ///< Filesystem path of the file to copy.
};

class ResourceManifest
{
  public:
    /// @brief Register @p source under @p dest.
    /// @return False when @p dest is already taken; the manifest is unchanged.
    bool add(std::string dest, std::string source);

    /// @brief Entry registered under @p dest, or nullptr.
    [[nodiscard]] const ResourceEntry *find(std::string_view dest) const;

    /// @brief Entries in registration order.
    const std::vector<ResourceEntry> &entries() const
    {
        return entries_;
    }

    [[nodiscard]] bool empty() const
    {
        return entries_.empty();
    }

    [[nodiscard]] size_t size() const
    {
        return entries_.size();
    }

  private:
    std::vector<ResourceEntry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace themebuild::build
