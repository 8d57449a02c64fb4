//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/ArgvView.hpp
// Purpose: Non-owning view over the argument array handed to main().
// Key invariants: Never modifies or owns the underlying argument storage.
// Ownership/Lifetime: Borrows pointers from the C runtime; callers must ensure
//                     validity through the view's lifetime.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>

namespace themebuild::tools
{

struct ArgvView
{
    int argc;
    char **argv;

    [[nodiscard]] bool empty() const
    {
        return argc <= 0 || argv == nullptr;
    }

    [[nodiscard]] int size() const
    {
        return empty() ? 0 : argc;
    }

    /// @brief Argument at @p index, or an empty view when out of range.
    [[nodiscard]] std::string_view at(int index) const
    {
        if (index < 0 || index >= argc || argv == nullptr)
            return std::string_view{};
        return std::string_view(argv[index]);
    }

    /// @brief View without the first @p count entries (usually the program name).
    [[nodiscard]] ArgvView dropFront(int count = 1) const
    {
        if (count >= argc)
            return ArgvView{0, nullptr};
        return ArgvView{argc - count, argv + count};
    }
};

} // namespace themebuild::tools
