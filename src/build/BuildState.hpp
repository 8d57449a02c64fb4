//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: build/BuildState.hpp
// Purpose: Mutable state of one theme build, threaded by reference through
//          every recursive expansion step.
// Key invariants: `pending` is declared before `engine` because the engine's
//                 `resource` builtin keeps a reference to it.  The queue is
//                 empty whenever no evaluation is in progress.
// Ownership/Lifetime: Created once per Preprocessor::build call and destroyed
//                     when it returns; nothing outlives the build.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "build/BuildOptions.hpp"
#include "build/ResourceManifest.hpp"
#include "config/ConfigTable.hpp"
#include "script/ResourceQueue.hpp"
#include "script/ScriptEngine.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace themebuild::build
{

/// @brief Artifacts produced by a successful build.
struct BuildOutput
{
    std::string text;            ///< Expanded descriptor text.
    config::ConfigTable config;  ///< Merged configuration imports.
    ResourceManifest resources;  ///< Files to package with the theme.
};

struct BuildState
{
    BuildState(const BuildOptions &options, support::DiagnosticEngine &diags)
        : engine(pending,
                 options.env,
                 [&diags](std::string_view text)
                 { diags.report(support::makeNote({}, std::string(text))); })
    {
        engine.setGlobal("theme_name", script::Value::string(options.themeName));
    }

    script::ResourceQueue pending;
    script::ScriptEngine engine;

    std::string output;
    config::ConfigTable config;
    ResourceManifest resources;

    /// Set after an include or resource directive so its line terminator is
    /// dropped; cleared by the next item.
    bool suppressNewline = false;

    /// Number of descriptor includes currently being expanded.
    std::size_t includeDepth = 0;
};

} // namespace themebuild::build
