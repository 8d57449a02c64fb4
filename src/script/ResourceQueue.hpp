//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: script/ResourceQueue.hpp
// Purpose: Resources registered by scripts through `resource()`, waiting for
//          the preprocessor to resolve them against the evaluating file.
// Ownership/Lifetime: Owned by the build state; the `resource` builtin holds a
//                     reference, so the queue must outlive the engine.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/glob.hpp"

#include <string>
#include <utility>
#include <vector>

namespace themebuild::script
{

struct PendingResource
{
    support::GlobPattern pattern;
    std::string dest; ///< Normalized destination directory, "." for the root.
};

class ResourceQueue
{
  public:
    void push(PendingResource resource)
    {
        pending_.push_back(std::move(resource));
    }

    /// @brief Remove and return everything queued so far, oldest first.
    std::vector<PendingResource> drain()
    {
        std::vector<PendingResource> out;
        out.swap(pending_);
        return out;
    }

    void clear()
    {
        pending_.clear();
    }

    bool empty() const
    {
        return pending_.empty();
    }

    size_t size() const
    {
        return pending_.size();
    }

  private:
    std::vector<PendingResource> pending_;
};

} // namespace themebuild::script
