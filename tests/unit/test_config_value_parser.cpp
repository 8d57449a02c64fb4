// File: tests/unit/test_config_value_parser.cpp
// Purpose: Verify scanning of configuration values for embedded expressions.
// Key invariants: Parts concatenate back to the value; expression positions
//                 are reported relative to the value's position in its file.
// Ownership/Lifetime: Standalone unit test executable.

#include <gtest/gtest.h>

#include <string>

#include "descriptor/ConfigValueParser.hpp"
#include "config/IniFile.hpp"
#include "support/DiagnosticCodes.hpp"

using namespace themebuild;
using themebuild::descriptor::ValuePart;

TEST(ConfigValueParser, PlainValueIsOneTextPart)
{
    auto parts = descriptor::parseConfigValue("16777215");
    ASSERT_TRUE(parts);
    ASSERT_EQ(parts.value().size(), 1u);
    EXPECT_EQ(parts.value()[0].kind, ValuePart::Kind::Text);
    EXPECT_EQ(parts.value()[0].text, "16777215");
}

TEST(ConfigValueParser, EmptyValueHasNoParts)
{
    auto parts = descriptor::parseConfigValue("");
    ASSERT_TRUE(parts);
    EXPECT_TRUE(parts.value().empty());
}

TEST(ConfigValueParser, ExpressionsBetweenText)
{
    parse::SourcePos start;
    start.line = 4;
    start.column = 7;
    start.offset = 40;
    auto parts = descriptor::parseConfigValue("a #{ rgb(1,2,3) } b#{x}", 2, start);
    ASSERT_TRUE(parts);
    const auto &p = parts.value();
    ASSERT_EQ(p.size(), 4u);

    EXPECT_EQ(p[0].kind, ValuePart::Kind::Text);
    EXPECT_EQ(p[0].text, "a ");

    EXPECT_EQ(p[1].kind, ValuePart::Kind::Expression);
    EXPECT_EQ(p[1].text, " rgb(1,2,3) ");
    EXPECT_EQ(p[1].pos.line, 4u);
    EXPECT_EQ(p[1].pos.column, 9u);
    EXPECT_EQ(p[1].pos.offset, 42u);
    EXPECT_EQ(p[1].indent, 2u);

    EXPECT_EQ(p[2].text, " b");
    EXPECT_EQ(p[3].kind, ValuePart::Kind::Expression);
    EXPECT_EQ(p[3].text, "x");
    EXPECT_EQ(p[3].indent, 19u);
}

TEST(ConfigValueParser, HashWithoutBraceIsText)
{
    auto parts = descriptor::parseConfigValue("#ff00ff");
    ASSERT_TRUE(parts);
    ASSERT_EQ(parts.value().size(), 1u);
    EXPECT_EQ(parts.value()[0].text, "#ff00ff");
}

TEST(ConfigValueParser, UnterminatedExpressionFails)
{
    auto parts = descriptor::parseConfigValue("x #{ 1 + 2", 5);
    ASSERT_FALSE(parts);
    EXPECT_EQ(parts.error().code, diag::UnterminatedExpression);
    EXPECT_EQ(parts.error().loc.file_id, 5u);
}

TEST(ConfigValueParser, ErrorsCarryFileOffsets)
{
    const std::string text = "a=1\nb = x #{ 1 +\n";
    auto entries = config::parseIni(text, 6);
    ASSERT_TRUE(entries);
    ASSERT_EQ(entries.value().size(), 2u);
    const auto &entry = entries.value()[1];
    EXPECT_EQ(entry.valuePos.offset, 8u);

    auto parts = descriptor::parseConfigValue(entry.value, 6, entry.valuePos);
    ASSERT_FALSE(parts);
    EXPECT_EQ(parts.error().code, diag::UnterminatedExpression);
    EXPECT_EQ(parts.error().loc.line, 2u);
    EXPECT_EQ(parts.error().loc.column, 7u);
    EXPECT_EQ(parts.error().loc.offset, 10u);
    EXPECT_EQ(text.substr(parts.error().loc.offset, 2), "#{");
}
