//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file BuildOptions.hpp
/// @brief Options controlling a single theme build.
///
/// @details BuildOptions is filled in by the themebuild driver from its
/// command line and handed to the Preprocessor.  The environment hook backs the
/// `env()` script builtin; tests replace it with a fixed map.
///
/// @invariant A default-constructed BuildOptions names the theme "theme", caps
///            include nesting at 64 and reads the process environment.
///
/// Ownership/Lifetime: Value type, passed by const reference for the lifetime
/// of one build.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "script/ThemeBuiltins.hpp"

#include <cstddef>
#include <string>

namespace themebuild::build
{

struct BuildOptions
{
    /// @brief Value of the `theme_name` script global.
    std::string themeName{"theme"};

    /// @brief Deepest permitted chain of descriptor includes.
    /// @details The top-level descriptor is depth 0; an include that would
    ///          exceed this depth fails the build with T1002.
    std::size_t maxIncludeDepth{64};

    /// @brief Record a note for every file entered, script run and resource
    ///        registered.
    bool trace{false};

    /// @brief Lookup backing the `env()` builtin.
    script::EnvLookup env{script::processEnvironment()};
};

} // namespace themebuild::build
