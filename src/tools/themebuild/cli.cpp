//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements command-line parsing for the themebuild driver.  Flags may appear
// before, between or after the two positional arguments; `--` ends flag
// processing so paths beginning with a dash can be passed.
//
//===----------------------------------------------------------------------===//

#include "tools/themebuild/cli.hpp"

#include <filesystem>
#include <string_view>

namespace themebuild::tools
{

CliParseResult parseCli(ArgvView args, CliOptions &opts, std::string &error)
{
    bool flagsDone = false;
    int positional = 0;

    for (int i = 0; i < args.size(); ++i)
    {
        const std::string_view arg = args.at(i);

        if (!flagsDone && arg.size() > 1 && arg.front() == '-')
        {
            if (arg == "--")
            {
                flagsDone = true;
            }
            else if (arg == "-h" || arg == "--help")
            {
                return CliParseResult::Help;
            }
            else if (arg == "--version")
            {
                return CliParseResult::Version;
            }
            else if (arg == "-o" || arg == "--overwrite")
            {
                opts.overwrite = true;
            }
            else if (arg == "--trace")
            {
                opts.trace = true;
            }
            else if (arg == "--name")
            {
                if (i + 1 >= args.size())
                {
                    error = "--name requires a theme name";
                    return CliParseResult::Error;
                }
                opts.themeName = std::string(args.at(++i));
                if (opts.themeName.empty())
                {
                    error = "--name requires a non-empty theme name";
                    return CliParseResult::Error;
                }
            }
            else if (arg.starts_with("--name="))
            {
                opts.themeName = std::string(arg.substr(7));
                if (opts.themeName.empty())
                {
                    error = "--name requires a non-empty theme name";
                    return CliParseResult::Error;
                }
            }
            else
            {
                error = "unknown option: " + std::string(arg);
                return CliParseResult::Error;
            }
            continue;
        }

        switch (positional++)
        {
            case 0:
                opts.inputPath = std::string(arg);
                break;
            case 1:
                opts.outputDir = std::string(arg);
                break;
            default:
                error = "unexpected argument: " + std::string(arg);
                return CliParseResult::Error;
        }
    }

    if (opts.inputPath.empty())
    {
        error = "no input descriptor specified";
        return CliParseResult::Error;
    }
    if (opts.outputDir.empty())
    {
        error = "no output directory specified";
        return CliParseResult::Error;
    }
    return CliParseResult::Ok;
}

std::string defaultThemeName(const std::string &outputDir)
{
    namespace fs = std::filesystem;
    fs::path dir = fs::path(outputDir).lexically_normal();
    if (dir.filename().empty())
        dir = dir.parent_path();
    std::string name = dir.filename().string();
    if (name.empty() || name == "." || name == "..")
    {
        std::error_code ec;
        const fs::path absolute = fs::absolute(dir, ec).lexically_normal();
        if (!ec)
            name = absolute.filename().string();
    }
    return name.empty() ? std::string("theme") : name;
}

} // namespace themebuild::tools
