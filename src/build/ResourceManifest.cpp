//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/build/ResourceManifest.cpp
// Purpose: Implement first-wins registration of packaged resources.
//
//===----------------------------------------------------------------------===//

#include "build/ResourceManifest.hpp"

#include <utility>

namespace themebuild::build
{

bool ResourceManifest::add(std::string dest, std::string source)
{
    if (index_.find(dest) != index_.end())
        return false;
    index_.emplace(dest, entries_.size());
    entries_.push_back(ResourceEntry{std::move(dest), std::move(source)});
    return true;
}

const ResourceEntry *ResourceManifest::find(std::string_view dest) const
{
    auto it = index_.find(std::string(dest));
    if (it == index_.end())
        return nullptr;
    return &entries_[it->second];
}

} // namespace themebuild::build
