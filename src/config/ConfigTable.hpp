//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: config/ConfigTable.hpp
// Purpose: Ordered section -> key -> value table produced by configuration
//          imports.
// Key invariants: Sections and keys keep first-insertion order; setting an
//                 existing key replaces its value in place.  The general
//                 section has the empty name and always sorts first.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace themebuild::config
{

class ConfigTable
{
  public:
    struct Section
    {
        std::string name;
        std::vector<std::pair<std::string, std::string>> entries;
    };

    /// @brief Set @p key in @p section, creating either as needed.
    void set(std::string_view section, std::string_view key, std::string value);

    /// @brief Value of @p key in @p section, or nullptr.
    [[nodiscard]] const std::string *get(std::string_view section, std::string_view key) const;

    /// @brief Copy every entry of @p other over this table.
    void merge(const ConfigTable &other);

    const std::vector<Section> &sections() const
    {
        return sections_;
    }

    [[nodiscard]] bool empty() const;

    /// @brief Total number of keys across all sections.
    [[nodiscard]] size_t size() const;

  private:
    Section &section(std::string_view name);

    std::vector<Section> sections_;
};

} // namespace themebuild::config
