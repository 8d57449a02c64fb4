// File: tests/unit/test_path_utils.cpp
// Purpose: Verify relative path validation and lexical path helpers.
// Key invariants: Normalized paths use `/`, collapse dot segments and never
//                 end in a separator.
// Ownership/Lifetime: Standalone unit test executable.

#include <gtest/gtest.h>

#include "support/DiagnosticCodes.hpp"
#include "support/path_utils.hpp"

using namespace themebuild::support;

TEST(PathUtils, RejectsAbsoluteLiterals)
{
    EXPECT_TRUE(isAbsoluteLiteral("/etc"));
    EXPECT_TRUE(isAbsoluteLiteral("\\share"));
    EXPECT_TRUE(isAbsoluteLiteral("C:/abs"));
    EXPECT_TRUE(isAbsoluteLiteral("d:"));
    EXPECT_FALSE(isAbsoluteLiteral("images/a.png"));
    EXPECT_FALSE(isAbsoluteLiteral(""));

    auto rel = parseRelativePath("C:/abs", SourceLoc{4, 2, 9});
    ASSERT_FALSE(rel);
    EXPECT_EQ(rel.error().code, themebuild::diag::NonRelativePath);
    EXPECT_EQ(rel.error().loc.line, 2u);
    EXPECT_EQ(rel.error().message, "path `C:/abs` must be relative");
}

TEST(PathUtils, ParsesRelativePaths)
{
    auto empty = parseRelativePath("", {});
    ASSERT_TRUE(empty);
    EXPECT_EQ(empty.value(), ".");

    auto nested = parseRelativePath("img\\knobs/./big/../", {});
    ASSERT_TRUE(nested);
    EXPECT_EQ(nested.value(), "img/knobs");
}

TEST(PathUtils, Normalize)
{
    EXPECT_EQ(normalize("a/b/../c\\file.txt"), "a/c/file.txt");
    EXPECT_EQ(normalize("./x/"), "x");
    EXPECT_EQ(normalize("."), ".");
    EXPECT_EQ(normalize("a/.."), ".");
    EXPECT_EQ(normalize("../up"), "../up");
}

TEST(PathUtils, JoinAndSplit)
{
    EXPECT_EQ(joinPath(".", "a.png"), "a.png");
    EXPECT_EQ(joinPath("img", "a.png"), "img/a.png");
    EXPECT_EQ(joinPath("theme/parts", "../common.txt"), "theme/common.txt");
    EXPECT_EQ(joinPath("img", "."), "img");

    EXPECT_EQ(parentDirectory("theme/rtconfig.txt"), "theme");
    EXPECT_EQ(parentDirectory("rtconfig.txt"), ".");
    EXPECT_EQ(parentDirectory("/rtconfig.txt"), "/");

    EXPECT_EQ(themebuild::support::basename("theme/a.png"), "a.png");
    EXPECT_EQ(themebuild::support::basename("a.png"), "a.png");
    EXPECT_EQ(themebuild::support::basename("theme/"), "");

    EXPECT_EQ(extension("colors.INI"), "ini");
    EXPECT_EQ(extension("dir.v2/script.Lua"), "lua");
    EXPECT_EQ(extension("layout"), "");
    EXPECT_EQ(extension(".hidden"), "");
}
