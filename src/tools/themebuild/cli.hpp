//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/themebuild/cli.hpp
// Purpose: Command-line options of the themebuild driver.
// Key invariants: A successful parse names both an input descriptor and an
//                 output directory.
// Ownership/Lifetime: CliOptions owns copies of every argument it keeps.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tools/common/ArgvView.hpp"

#include <string>

namespace themebuild::tools
{

struct CliOptions
{
    /// @brief Descriptor to build.
    std::string inputPath{};

    /// @brief Directory receiving the staged theme.
    std::string outputDir{};

    /// @brief Theme name from `--name`; empty selects the output directory name.
    std::string themeName{};

    /// @brief Replace files in an existing output directory (`-o`).
    bool overwrite = false;

    /// @brief Report every file, script and resource handled (`--trace`).
    bool trace = false;
};

/// @brief Outcome of parsing the command line.
enum class CliParseResult
{
    Ok,      ///< Options are complete; run the build.
    Help,    ///< `-h`/`--help` was requested.
    Version, ///< `--version` was requested.
    Error    ///< Malformed command line; @p error describes the problem.
};

/// @brief Parse the driver arguments, excluding the program name.
/// @param args Arguments following argv[0].
/// @param opts Receives the parsed options.
/// @param error Receives a one-line description when the result is Error.
CliParseResult parseCli(ArgvView args, CliOptions &opts, std::string &error);

/// @brief Theme name used when `--name` is absent: the final component of
///        @p outputDir.
std::string defaultThemeName(const std::string &outputDir);

} // namespace themebuild::tools
