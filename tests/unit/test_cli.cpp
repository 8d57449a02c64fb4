// File: tests/unit/test_cli.cpp
// Purpose: Cover the themebuild command line and the staging of build
//          output into a theme directory.
// Key invariants: Staging refuses to touch an existing output directory unless
//                 asked to; the theme is laid out as `<name>.ReaperTheme` plus
//                 `<name>/rtconfig.txt` and resources below `<name>/`.
// Ownership/Lifetime: Argument strings live in the test's local vectors.

#include <gtest/gtest.h>

#include "TempTree.hpp"
#include "support/DiagnosticCodes.hpp"
#include "tools/themebuild/cli.hpp"
#include "tools/themebuild/stage.hpp"

#include <string>
#include <vector>

using namespace themebuild;
using themebuild::tests::TempTree;
using tools::CliOptions;
using tools::CliParseResult;

namespace
{

struct Args
{
    explicit Args(std::vector<std::string> words) : storage(std::move(words))
    {
        for (auto &w : storage)
            pointers.push_back(w.data());
    }

    tools::ArgvView view()
    {
        return tools::ArgvView{static_cast<int>(pointers.size()), pointers.data()};
    }

    std::vector<std::string> storage;
    std::vector<char *> pointers;
};

CliParseResult parse(std::vector<std::string> words, CliOptions &opts, std::string &error)
{
    Args args(std::move(words));
    return tools::parseCli(args.view(), opts, error);
}

} // namespace

TEST(CliParse, PositionalsAndFlags)
{
    CliOptions opts;
    std::string error;
    ASSERT_EQ(parse({"theme.txt", "out/Dusk", "-o", "--trace", "--name", "Dusk"}, opts, error),
              CliParseResult::Ok);
    EXPECT_EQ(opts.inputPath, "theme.txt");
    EXPECT_EQ(opts.outputDir, "out/Dusk");
    EXPECT_EQ(opts.themeName, "Dusk");
    EXPECT_TRUE(opts.overwrite);
    EXPECT_TRUE(opts.trace);

    CliOptions eq;
    ASSERT_EQ(parse({"--name=Night", "a", "b"}, eq, error), CliParseResult::Ok);
    EXPECT_EQ(eq.themeName, "Night");
    EXPECT_FALSE(eq.overwrite);
}

TEST(CliParse, DoubleDashEndsFlags)
{
    CliOptions opts;
    std::string error;
    ASSERT_EQ(parse({"--", "-weird.txt", "out"}, opts, error), CliParseResult::Ok);
    EXPECT_EQ(opts.inputPath, "-weird.txt");
}

TEST(CliParse, HelpAndVersion)
{
    CliOptions opts;
    std::string error;
    EXPECT_EQ(parse({"-h"}, opts, error), CliParseResult::Help);
    EXPECT_EQ(parse({"x", "--help"}, opts, error), CliParseResult::Help);
    EXPECT_EQ(parse({"--version"}, opts, error), CliParseResult::Version);
}

TEST(CliParse, Errors)
{
    struct Case
    {
        std::vector<std::string> args;
        std::string message;
    };
    const std::vector<Case> cases = {
        {{"--bogus", "a", "b"}, "unknown option: --bogus"},
        {{"a", "b", "c"}, "unexpected argument: c"},
        {{}, "no input descriptor specified"},
        {{"a"}, "no output directory specified"},
        {{"a", "b", "--name"}, "--name requires a theme name"},
        {{"a", "b", "--name="}, "--name requires a non-empty theme name"},
    };
    for (const auto &c : cases)
    {
        CliOptions opts;
        std::string error;
        EXPECT_EQ(parse(c.args, opts, error), CliParseResult::Error) << c.message;
        EXPECT_EQ(error, c.message);
    }
}

TEST(CliParse, DefaultThemeName)
{
    EXPECT_EQ(tools::defaultThemeName("out/Dusk"), "Dusk");
    EXPECT_EQ(tools::defaultThemeName("out/Dusk/"), "Dusk");
    EXPECT_EQ(tools::defaultThemeName("Night"), "Night");
    EXPECT_FALSE(tools::defaultThemeName(".").empty());
}

TEST(StageTheme, WritesThemeLayout)
{
    TempTree tree;
    const std::string icon = tree.write("src/icon.png", "PNG");

    build::BuildOutput output;
    output.text = "clear *\n";
    output.config.set("", "version", "6");
    output.config.set("color theme", "col_bg", "197121");
    output.resources.add("toolbar/icon.png", icon);

    support::DiagnosticEngine diags;
    tools::StageOptions opts{tree.path("Dusk"), "Dusk", false};
    auto staged = tools::stageTheme(output, opts, diags);
    ASSERT_TRUE(staged) << staged.error().message;
    EXPECT_TRUE(diags.diagnostics().empty());

    EXPECT_EQ(tree.read("Dusk/Dusk.ReaperTheme"), "version=6\n\n[color theme]\ncol_bg=197121\n");
    EXPECT_EQ(tree.read("Dusk/Dusk/rtconfig.txt"), "clear *\n");
    EXPECT_EQ(tree.read("Dusk/Dusk/toolbar/icon.png"), "PNG");
}

TEST(StageTheme, ExistingOutputNeedsOverwrite)
{
    TempTree tree;
    tree.mkdir("Dusk");
    build::BuildOutput output;
    support::DiagnosticEngine diags;

    auto refused = tools::stageTheme(output, {tree.path("Dusk"), "Dusk", false}, diags);
    ASSERT_FALSE(refused);
    EXPECT_EQ(refused.error().code, diag::OutputExists);

    auto allowed = tools::stageTheme(output, {tree.path("Dusk"), "Dusk", true}, diags);
    EXPECT_TRUE(allowed);

    tree.write("file", "x");
    auto notDir = tools::stageTheme(output, {tree.path("file"), "file", true}, diags);
    ASSERT_FALSE(notDir);
    EXPECT_EQ(notDir.error().code, diag::OutputExists);
}

TEST(StageTheme, WarnsOnNameMismatch)
{
    TempTree tree;
    build::BuildOutput output;
    support::DiagnosticEngine diags;

    auto staged = tools::stageTheme(output, {tree.path("out"), "Dusk", false}, diags);
    ASSERT_TRUE(staged) << staged.error().message;
    ASSERT_EQ(diags.diagnostics().size(), 1u);
    EXPECT_EQ(diags.diagnostics()[0].code, diag::ThemeNameMismatch);
    EXPECT_EQ(diags.diagnostics()[0].severity, support::Severity::Warning);
}
