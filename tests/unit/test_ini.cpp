// File: tests/unit/test_ini.cpp
// Purpose: Verify INI parsing, the configuration table and INI output.
// Key invariants: Keys before any header belong to the general section, which
//                 is always written first; later assignments overwrite.
// Ownership/Lifetime: Standalone unit test executable.

#include <gtest/gtest.h>

#include "config/ConfigTable.hpp"
#include "config/IniFile.hpp"
#include "support/DiagnosticCodes.hpp"

using namespace themebuild;
using namespace themebuild::config;

TEST(IniFile, ParsesSectionsAndPositions)
{
    const char *text = "\xEF\xBB\xBF"
                       "; leading comment\n"
                       "top = 1\n"
                       "\n"
                       "[color theme]\n"
                       "  col_main_bg2 =  #{ rgb(1,2,3) }  \r\n"
                       "# hash comment\n"
                       "empty=\n";
    auto entries = parseIni(text, 3);
    ASSERT_TRUE(entries);
    const auto &e = entries.value();
    ASSERT_EQ(e.size(), 3u);

    EXPECT_EQ(e[0].section, "");
    EXPECT_EQ(e[0].key, "top");
    EXPECT_EQ(e[0].value, "1");

    EXPECT_EQ(e[1].section, "color theme");
    EXPECT_EQ(e[1].key, "col_main_bg2");
    EXPECT_EQ(e[1].value, "#{ rgb(1,2,3) }");
    EXPECT_EQ(e[1].valuePos.line, 5u);
    EXPECT_EQ(e[1].valuePos.column, 19u);

    EXPECT_EQ(e[2].key, "empty");
    EXPECT_EQ(e[2].value, "");
}

TEST(IniFile, SyntaxErrors)
{
    auto header = parseIni("[broken\n", 1);
    ASSERT_FALSE(header);
    EXPECT_EQ(header.error().code, diag::IniSyntax);
    EXPECT_EQ(header.error().message, "expected `]` to close section header");

    auto noEquals = parseIni("ok=1\njust words\n", 1);
    ASSERT_FALSE(noEquals);
    EXPECT_EQ(noEquals.error().message, "expected `key=value`");
    EXPECT_EQ(noEquals.error().loc.line, 2u);

    auto noKey = parseIni(" = 4\n", 1);
    ASSERT_FALSE(noKey);
    EXPECT_EQ(noKey.error().message, "missing key before `=`");
}

TEST(ConfigTable, LaterValuesOverwriteInPlace)
{
    ConfigTable table;
    table.set("color theme", "a", "1");
    table.set("color theme", "b", "2");
    table.set("", "general", "g");
    table.set("color theme", "a", "3");

    ASSERT_EQ(table.sections().size(), 2u);
    EXPECT_EQ(table.sections()[0].name, "");
    EXPECT_EQ(table.size(), 3u);
    ASSERT_NE(table.get("color theme", "a"), nullptr);
    EXPECT_EQ(*table.get("color theme", "a"), "3");
    EXPECT_EQ(table.get("color theme", "missing"), nullptr);
    EXPECT_EQ(table.get("other", "a"), nullptr);

    ConfigTable extra;
    extra.set("color theme", "b", "20");
    extra.set("REAPER", "ui_img", "theme");
    table.merge(extra);
    EXPECT_EQ(*table.get("color theme", "b"), "20");
    EXPECT_EQ(*table.get("REAPER", "ui_img"), "theme");
}

TEST(IniFile, WritesGeneralSectionFirst)
{
    ConfigTable table;
    table.set("color theme", "col_main_bg2", "197121");
    table.set("REAPER", "ui_img", "mytheme");
    table.set("", "version", "5");

    EXPECT_EQ(writeIni(table),
              "version=5\n"
              "\n"
              "[color theme]\n"
              "col_main_bg2=197121\n"
              "\n"
              "[REAPER]\n"
              "ui_img=mytheme\n");
    EXPECT_TRUE(ConfigTable().empty());
    EXPECT_EQ(writeIni(ConfigTable()), "");
}

TEST(IniFile, ToTableRoundTrip)
{
    auto entries = parseIni("[a]\nx=1\n[b]\ny=2\n[a]\nx=3\n");
    ASSERT_TRUE(entries);
    const ConfigTable table = toTable(entries.value());
    EXPECT_EQ(table.size(), 2u);
    EXPECT_EQ(*table.get("a", "x"), "3");
    EXPECT_EQ(writeIni(table), "[a]\nx=3\n\n[b]\ny=2\n");
}
