// File: tests/unit/test_descriptor_parser.cpp
// Purpose: Verify descriptor parsing into content items and its diagnostics.
// Key invariants: Directive-free input renders back byte for byte; malformed
//                 directives fail at the `#` keyword.
// Ownership/Lifetime: Standalone unit test executable.

#include <gtest/gtest.h>

#include "descriptor/DescriptorParser.hpp"
#include "support/DiagnosticCodes.hpp"

#include <string>
#include <variant>
#include <vector>

using namespace themebuild;
using namespace themebuild::descriptor;

namespace
{

template <class T> const T *itemAs(const Content &items, size_t index)
{
    if (index >= items.size())
        return nullptr;
    return std::get_if<T>(&items[index]);
}

const Directive &directiveAt(const Content &items, size_t index)
{
    return std::get<Directive>(items.at(index));
}

} // namespace

TEST(DescriptorParser, PlainTextRoundTrips)
{
    const std::string text = "set tcp.size [0 0 10 10]\n"
                             "\n"
                             "  front tcp.label ; trailing comment\n"
                             "## not a directive\n"
                             "clear *\r\n"
                             "last line without newline";
    auto content = parseDescriptor(text);
    ASSERT_TRUE(content);
    EXPECT_EQ(renderSource(content.value()), text);
}

TEST(DescriptorParser, SplitsCodeCommentAndNewline)
{
    auto content = parseDescriptor("abc ; note\nxyz");
    ASSERT_TRUE(content);
    const auto &items = content.value();
    ASSERT_EQ(items.size(), 4u);
    ASSERT_NE(itemAs<Code>(items, 0), nullptr);
    EXPECT_EQ(itemAs<Code>(items, 0)->span.text, "abc ");
    ASSERT_NE(itemAs<Comment>(items, 1), nullptr);
    EXPECT_EQ(itemAs<Comment>(items, 1)->span.text, "; note");
    ASSERT_NE(itemAs<Newline>(items, 2), nullptr);
    ASSERT_NE(itemAs<Code>(items, 3), nullptr);
    EXPECT_EQ(itemAs<Code>(items, 3)->span.pos.line, 2u);
}

TEST(DescriptorParser, ExpressionSpans)
{
    auto content = parseDescriptor("x #{ {a = {1}} } y #{ \"}\" }");
    ASSERT_TRUE(content);
    const auto &items = content.value();
    ASSERT_EQ(items.size(), 4u);
    const auto *first = itemAs<Expression>(items, 1);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->source, " {a = {1}} ");
    EXPECT_EQ(first->pos.column, 3u);
    const auto *second = itemAs<Expression>(items, 3);
    ASSERT_NE(second, nullptr);
    EXPECT_EQ(second->source, " \"}\" ");
}

TEST(DescriptorParser, ExpressionSkipsLongStringsAndComments)
{
    auto content = parseDescriptor("a #{ [[x}y]] } b #{ [==[}]]=]==] }\n"
                                   "#{ 1 -- } ignored\n } #{ --[[ } ]] 2 }");
    ASSERT_TRUE(content) << content.error().message;
    std::vector<std::string> sources;
    for (const auto &item : content.value())
    {
        if (const auto *expr = std::get_if<Expression>(&item))
            sources.emplace_back(expr->source);
    }
    ASSERT_EQ(sources.size(), 4u);
    EXPECT_EQ(sources[0], " [[x}y]] ");
    EXPECT_EQ(sources[1], " [==[}]]=]==] ");
    EXPECT_EQ(sources[2], " 1 -- } ignored\n ");
    EXPECT_EQ(sources[3], " --[[ } ]] 2 ");
}

TEST(DescriptorParser, ExpressionMaySpanLines)
{
    auto content = parseDescriptor("#{ 1 +\n 2 }\nafter");
    ASSERT_TRUE(content);
    const auto *expr = itemAs<Expression>(content.value(), 0);
    ASSERT_NE(expr, nullptr);
    EXPECT_EQ(expr->source, " 1 +\n 2 ");
    EXPECT_EQ(expr->pos.line, 1u);
}

TEST(DescriptorParser, UnterminatedExpression)
{
    auto content = parseDescriptor("a #{ 1 + ");
    ASSERT_FALSE(content);
    EXPECT_EQ(content.error().code, diag::UnterminatedExpression);
}

TEST(DescriptorParser, IncludeDirective)
{
    auto content = parseDescriptor("  #include \"parts/../layout.txt\"  \nnext", 7);
    ASSERT_TRUE(content);
    const auto &items = content.value();
    ASSERT_EQ(items.size(), 3u);
    const auto &dir = directiveAt(items, 0);
    const auto *include = std::get_if<IncludeDirective>(&dir.kind);
    ASSERT_NE(include, nullptr);
    EXPECT_EQ(include->path, "layout.txt");
    EXPECT_EQ(dir.keyword.column, 3u);
    ASSERT_NE(itemAs<Newline>(items, 1), nullptr);
}

TEST(DescriptorParser, ResourceDirectiveForms)
{
    auto content = parseDescriptor("#resource \"*.png\"\n#resource \"img/\" : \"art/**/*.png\"\n");
    ASSERT_TRUE(content);
    const auto &items = content.value();

    const auto *bare = std::get_if<ResourceDirective>(&directiveAt(items, 0).kind);
    ASSERT_NE(bare, nullptr);
    EXPECT_EQ(bare->dest, ".");
    EXPECT_EQ(bare->pattern.text(), "*.png");

    const auto *withDest = std::get_if<ResourceDirective>(&directiveAt(items, 2).kind);
    ASSERT_NE(withDest, nullptr);
    EXPECT_EQ(withDest->dest, "img");
    EXPECT_EQ(withDest->pattern.text(), "art/**/*.png");
}

TEST(DescriptorParser, ResourceRejectsAbsolutePath)
{
    auto content = parseDescriptor("#resource \"C:/abs\" \"x.png\"\n");
    ASSERT_FALSE(content);
    EXPECT_EQ(content.error().code, diag::NonRelativePath);

    auto rooted = parseDescriptor("#include \"/etc/passwd\"\n");
    ASSERT_FALSE(rooted);
    EXPECT_EQ(rooted.error().code, diag::NonRelativePath);
}

TEST(DescriptorParser, ResourceRequiresColon)
{
    auto content = parseDescriptor("x\n#resource \"150\" \"./*.png\"\n", 3);
    ASSERT_FALSE(content);
    const auto &err = content.error();
    EXPECT_EQ(err.code, diag::MalformedResource);
    EXPECT_EQ(err.loc.file_id, 3u);
    EXPECT_EQ(err.loc.line, 2u);
    EXPECT_EQ(err.loc.column, 1u);
}

TEST(DescriptorParser, ResourceRejectsBadGlob)
{
    auto content = parseDescriptor("#resource \"a***b\"\n");
    ASSERT_FALSE(content);
    EXPECT_EQ(content.error().code, diag::InvalidGlob);
}

TEST(DescriptorParser, TrailingTextAfterDirective)
{
    auto content = parseDescriptor("#include \"a.txt\" junk\n");
    ASSERT_FALSE(content);
    EXPECT_EQ(content.error().code, diag::TrailingDirectiveText);
}

TEST(DescriptorParser, UnknownDirectivePassesThrough)
{
    auto content = parseDescriptor("#define X 1\n");
    ASSERT_TRUE(content);
    const auto *unknown = std::get_if<UnknownDirective>(&directiveAt(content.value(), 0).kind);
    ASSERT_NE(unknown, nullptr);
    EXPECT_EQ(unknown->name, "define");
    EXPECT_EQ(unknown->rest, " X 1");
}

TEST(DescriptorParser, StringEscapes)
{
    auto content = parseDescriptor("#include \"d\\u00e9j\\u00e0/\\ud83d\\ude00.txt\"\n");
    ASSERT_TRUE(content);
    const auto *include = std::get_if<IncludeDirective>(&directiveAt(content.value(), 0).kind);
    ASSERT_NE(include, nullptr);
    EXPECT_EQ(include->path, "d\xC3\xA9j\xC3\xA0/\xF0\x9F\x98\x80.txt");

    auto bad = parseDescriptor("#include \"a\\qb\"\n");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, diag::InvalidEscapeSequence);

    auto unterminated = parseDescriptor("#include \"abc\n");
    ASSERT_FALSE(unterminated);
    EXPECT_EQ(unterminated.error().code, diag::ControlCharInString);
}
