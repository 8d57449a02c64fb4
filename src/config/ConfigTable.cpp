//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/config/ConfigTable.cpp
// Purpose: Ordered configuration table storage.
//
//===----------------------------------------------------------------------===//

#include "config/ConfigTable.hpp"

#include <algorithm>

namespace themebuild::config
{

ConfigTable::Section &ConfigTable::section(std::string_view name)
{
    auto it = std::find_if(
        sections_.begin(), sections_.end(), [&](const Section &s) { return s.name == name; });
    if (it != sections_.end())
        return *it;

    // The general section precedes every named one.
    if (name.empty())
        return *sections_.insert(sections_.begin(), Section{std::string(), {}});
    sections_.push_back(Section{std::string(name), {}});
    return sections_.back();
}

void ConfigTable::set(std::string_view sectionName, std::string_view key, std::string value)
{
    Section &s = section(sectionName);
    for (auto &entry : s.entries)
    {
        if (entry.first == key)
        {
            entry.second = std::move(value);
            return;
        }
    }
    s.entries.emplace_back(std::string(key), std::move(value));
}

const std::string *ConfigTable::get(std::string_view sectionName, std::string_view key) const
{
    for (const auto &s : sections_)
    {
        if (s.name != sectionName)
            continue;
        for (const auto &entry : s.entries)
        {
            if (entry.first == key)
                return &entry.second;
        }
    }
    return nullptr;
}

void ConfigTable::merge(const ConfigTable &other)
{
    for (const auto &s : other.sections_)
    {
        for (const auto &entry : s.entries)
            set(s.name, entry.first, entry.second);
    }
}

bool ConfigTable::empty() const
{
    return size() == 0;
}

size_t ConfigTable::size() const
{
    size_t n = 0;
    for (const auto &s : sections_)
        n += s.entries.size();
    return n;
}

} // namespace themebuild::config
