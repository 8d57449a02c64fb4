//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/themebuild/stage.cpp
// Purpose: Implement theme staging: configuration, descriptor and resources.
//
//===----------------------------------------------------------------------===//

#include "tools/themebuild/stage.hpp"

#include "config/IniFile.hpp"
#include "support/DiagnosticCodes.hpp"
#include "support/source_loader.hpp"
#include "tools/themebuild/cli.hpp"

#include <filesystem>
#include <system_error>

namespace themebuild::tools
{
namespace
{
namespace fs = std::filesystem;

support::Diag writeError(const fs::path &path, const std::error_code &ec)
{
    return support::makeError({},
                              "failed to write `" + path.generic_string() + "`: " + ec.message(),
                              std::string(diag::WriteFailure));
}

support::Expected<void> copyResource(const build::ResourceEntry &entry, const fs::path &themeDir)
{
    const fs::path target = themeDir / fs::path(entry.dest);
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec)
        return writeError(target.parent_path(), ec);

    const auto options = fs::copy_options::overwrite_existing | fs::copy_options::recursive;
    fs::copy(fs::path(entry.source), target, options, ec);
    if (ec)
        return writeError(target, ec);
    return {};
}

} // namespace

support::Expected<void> stageTheme(const build::BuildOutput &output,
                                   const StageOptions &opts,
                                   support::DiagnosticEngine &diags)
{
    const fs::path outDir(opts.outputDir);
    std::error_code ec;
    const auto status = fs::status(outDir, ec);
    if (fs::exists(status))
    {
        if (!fs::is_directory(status))
        {
            return support::makeError({},
                                      "the path `" + opts.outputDir + "` exists and is not a directory",
                                      std::string(diag::OutputExists));
        }
        if (!opts.overwrite)
        {
            return support::makeError({},
                                      "the path `" + opts.outputDir +
                                          "` already exists; pass --overwrite to write into it",
                                      std::string(diag::OutputExists));
        }
    }

    if (defaultThemeName(opts.outputDir) != opts.themeName)
    {
        diags.report(support::makeWarning({},
                                          "output directory `" + opts.outputDir +
                                              "` is not named after the theme `" + opts.themeName +
                                              "`; REAPER may not load the theme correctly",
                                          std::string(diag::ThemeNameMismatch)));
    }

    const fs::path themeDir = outDir / opts.themeName;

    auto wrote = support::writeTextFile((outDir / (opts.themeName + ".ReaperTheme")).string(),
                                        config::writeIni(output.config));
    if (!wrote)
        return wrote;

    wrote = support::writeTextFile((themeDir / "rtconfig.txt").string(), output.text);
    if (!wrote)
        return wrote;

    for (const auto &entry : output.resources.entries())
    {
        auto copied = copyResource(entry, themeDir);
        if (!copied)
            return copied;
    }
    return {};
}

} // namespace themebuild::tools
