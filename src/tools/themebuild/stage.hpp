//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/themebuild/stage.hpp
// Purpose: Write a built theme to disk as an unpacked theme directory.
// Key invariants: Nothing is written when the output directory exists and
//                 overwriting was not requested.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "build/BuildState.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"

#include <string>

namespace themebuild::tools
{

struct StageOptions
{
    std::string outputDir;
    std::string themeName;
    bool overwrite = false;
};

/// @brief Stage @p output below StageOptions::outputDir.
/// @details Produces `<dir>/<name>.ReaperTheme`, `<dir>/<name>/rtconfig.txt`
///          and one copy per manifest entry at `<dir>/<name>/<dest>`.  A theme
///          name that differs from the output directory name is reported as a
///          T9003 warning.
/// @return Empty on success; otherwise a T2001 or T2002 diagnostic.
support::Expected<void> stageTheme(const build::BuildOutput &output,
                                   const StageOptions &opts,
                                   support::DiagnosticEngine &diags);

} // namespace themebuild::tools
