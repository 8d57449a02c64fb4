//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Main entry point for the themebuild command-line tool.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for the `themebuild` CLI tool.
/// @details Parses the command line, expands the descriptor through the
///          preprocessor and stages the resulting theme.  Every diagnostic,
///          including warnings and script output, is printed to stderr.

#include "build/Preprocessor.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"
#include "tools/themebuild/cli.hpp"
#include "tools/themebuild/stage.hpp"
#include "tools/themebuild/usage.hpp"

#include <iostream>

using namespace themebuild;

namespace
{

/// @brief Print collected diagnostics followed by @p fatal and fail.
int fail(const support::DiagnosticEngine &diags,
         const support::SourceManager &sm,
         const support::Diag &fatal)
{
    diags.printAll(std::cerr, &sm);
    support::printDiag(fatal, std::cerr, &sm);
    return 1;
}

} // namespace

/// @brief Main entry point for the theme compiler CLI.
/// @return 0 when the theme was staged, 1 on any error.
int main(int argc, char **argv)
{
    tools::CliOptions cli;
    std::string error;
    switch (tools::parseCli(tools::ArgvView{argc, argv}.dropFront(), cli, error))
    {
        case tools::CliParseResult::Help:
            tools::printUsage(std::cout);
            return 0;
        case tools::CliParseResult::Version:
            tools::printVersion(std::cout);
            return 0;
        case tools::CliParseResult::Error:
            std::cerr << "error: " << error << "\n\n";
            tools::printUsage(std::cerr);
            return 1;
        case tools::CliParseResult::Ok:
            break;
    }

    build::BuildOptions options;
    options.themeName = cli.themeName.empty() ? tools::defaultThemeName(cli.outputDir) : cli.themeName;
    options.trace = cli.trace;

    support::SourceManager sm;
    support::DiagnosticEngine diags;
    build::Preprocessor preprocessor(sm, diags, options);

    auto output = preprocessor.build(cli.inputPath);
    if (!output)
        return fail(diags, sm, output.error());

    tools::StageOptions stage{cli.outputDir, options.themeName, cli.overwrite};
    auto staged = tools::stageTheme(output.value(), stage, diags);
    if (!staged)
        return fail(diags, sm, staged.error());

    diags.printAll(std::cerr, &sm);
    diags.printSummary(std::cerr);
    return 0;
}
