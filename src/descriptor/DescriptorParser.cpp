//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/descriptor/DescriptorParser.cpp
// Purpose: Implement the descriptor grammar.
// Key invariants: Directives are only recognised at the start of a line; the
//                 leading blanks of a directive line belong to the directive.
//                 Adjacent code fragments are merged into one item.
//
//===----------------------------------------------------------------------===//

#include "descriptor/DescriptorParser.hpp"

#include "common/CharUtils.hpp"
#include "descriptor/Lexemes.hpp"
#include "support/DiagnosticCodes.hpp"
#include "support/path_utils.hpp"

namespace themebuild::descriptor
{
namespace cu = common::char_utils;
using support::Expected;
using support::makeError;

DescriptorParser::DescriptorParser(std::string_view text, uint32_t fileId)
    : cur_(text), fileId_(fileId)
{
}

bool DescriptorParser::atDirective() const
{
    std::size_t i = 0;
    while (cu::isHorizontalWhitespace(cur_.peekAt(i)))
        ++i;
    return cur_.peekAt(i) == '#' && cu::isIdentifierStart(cur_.peekAt(i + 1));
}

void DescriptorParser::appendCode(parse::Span span)
{
    if (!items_.empty())
    {
        if (auto *prev = std::get_if<Code>(&items_.back()))
        {
            const auto &text = prev->span.text;
            if (text.data() + text.size() == span.text.data())
            {
                prev->span.text = std::string_view(text.data(), text.size() + span.text.size());
                return;
            }
        }
    }
    items_.push_back(Code{span});
}

Expected<Content> DescriptorParser::parse()
{
    bool lineStart = true;
    while (!cur_.atEnd())
    {
        if (lineStart)
        {
            lineStart = false;
            if (atDirective())
            {
                auto directive = parseDirective();
                if (!directive)
                    return directive.takeError();
                items_.push_back(std::move(directive.value()));
                continue;
            }
        }

        const char c = cur_.peek();
        if (c == '\n')
        {
            items_.push_back(Newline{cur_.pos()});
            cur_.advance();
            lineStart = true;
            continue;
        }

        const parse::SourcePos start = cur_.pos();
        if (c == ';')
        {
            cur_.consumeWhile([](char ch) { return ch != '\n'; });
            items_.push_back(Comment{cur_.spanFrom(start)});
            continue;
        }

        if (c == '#' && cur_.peekAt(1) == '{')
        {
            auto source = scanExpressionSpan(cur_, fileId_);
            if (!source)
                return source.takeError();
            items_.push_back(Expression{source.value(), start});
            continue;
        }

        // A `#` that opens nothing is ordinary code.
        cur_.advance();
        cur_.consumeWhile([](char ch) { return ch != '#' && ch != ';' && ch != '\n'; });
        appendCode(cur_.spanFrom(start));
    }
    return std::move(items_);
}

Expected<Directive> DescriptorParser::parseDirective()
{
    const parse::SourcePos lineStart = cur_.pos();
    cur_.skipBlanks();
    const parse::SourcePos keyword = cur_.pos();
    cur_.advance(); // '#'
    const std::string_view name = cur_.consumeWhile(cu::isIdentifierContinue);

    Directive directive{};
    directive.keyword = keyword;

    if (name == "include")
    {
        auto include = parseInclude(keyword);
        if (!include)
            return include.takeError();
        directive.kind = std::move(include.value());
    }
    else if (name == "resource")
    {
        auto resource = parseResource(keyword);
        if (!resource)
            return resource.takeError();
        directive.kind = std::move(resource.value());
    }
    else
    {
        const std::string_view rest = cur_.consumeWhile([](char ch) { return ch != '\n'; });
        directive.kind = UnknownDirective{name, rest};
    }

    directive.line = cur_.spanFrom(lineStart);
    return directive;
}

Expected<std::string> DescriptorParser::parsePathLiteral()
{
    const parse::SourcePos pos = cur_.pos();
    auto literal = scanStringLiteral(cur_, fileId_);
    if (!literal)
        return literal.takeError();
    if (support::isAbsoluteLiteral(literal.value()))
    {
        return makeError(toLoc(fileId_, pos),
                         "path `" + literal.value() + "` must be relative",
                         std::string(diag::NonRelativePath));
    }
    return std::move(literal.value());
}

Expected<void> DescriptorParser::expectLineEnd(parse::SourcePos keyword, std::string_view directive)
{
    cur_.consumeWhile([](char ch) { return cu::isHorizontalWhitespace(ch) || ch == '\r'; });
    if (cur_.atEnd() || cur_.peek() == '\n')
        return {};
    return makeError(toLoc(fileId_, keyword),
                     "unexpected text after #" + std::string(directive) + " at `" +
                         fragmentAt(cur_) + "`",
                     std::string(diag::TrailingDirectiveText));
}

Expected<IncludeDirective> DescriptorParser::parseInclude(parse::SourcePos keyword)
{
    cur_.skipBlanks();
    if (cur_.peek() != '"')
    {
        return makeError(toLoc(fileId_, keyword),
                         "#include expects a quoted path, found `" + fragmentAt(cur_) + "`",
                         std::string(diag::MalformedInclude));
    }

    const parse::SourcePos pathPos = cur_.pos();
    auto literal = parsePathLiteral();
    if (!literal)
        return literal.takeError();

    auto end = expectLineEnd(keyword, "include");
    if (!end)
        return end.takeError();

    auto path = support::parseRelativePath(literal.value(), toLoc(fileId_, pathPos));
    if (!path)
        return path.takeError();
    return IncludeDirective{std::move(path.value())};
}

Expected<ResourceDirective> DescriptorParser::parseResource(parse::SourcePos keyword)
{
    cur_.skipBlanks();
    if (cur_.peek() != '"')
    {
        return makeError(toLoc(fileId_, keyword),
                         "#resource expects `\"glob\"` or `\"dest\":\"glob\"`, found `" +
                             fragmentAt(cur_) + "`",
                         std::string(diag::MalformedResource));
    }

    parse::SourcePos globPos = cur_.pos();
    auto first = parsePathLiteral();
    if (!first)
        return first.takeError();

    std::string dest = ".";
    std::string glob = std::move(first.value());

    cur_.skipBlanks();
    if (cur_.consume(':'))
    {
        cur_.skipBlanks();
        if (cur_.peek() != '"')
        {
            return makeError(toLoc(fileId_, keyword),
                             "#resource expects a quoted glob after `:`, found `" +
                                 fragmentAt(cur_) + "`",
                             std::string(diag::MalformedResource));
        }
        auto normalized = support::parseRelativePath(glob, toLoc(fileId_, globPos));
        if (!normalized)
            return normalized.takeError();
        dest = std::move(normalized.value());

        globPos = cur_.pos();
        auto second = parsePathLiteral();
        if (!second)
            return second.takeError();
        glob = std::move(second.value());
    }
    else if (cur_.peek() == '"')
    {
        return makeError(toLoc(fileId_, keyword),
                         "#resource expects `:` between destination and glob, found `" +
                             fragmentAt(cur_) + "`",
                         std::string(diag::MalformedResource));
    }

    auto end = expectLineEnd(keyword, "resource");
    if (!end)
        return end.takeError();

    auto pattern = support::GlobPattern::compile(glob, toLoc(fileId_, globPos));
    if (!pattern)
        return pattern.takeError();
    return ResourceDirective{std::move(pattern.value()), std::move(dest)};
}

Expected<Content> parseDescriptor(std::string_view text, uint32_t fileId)
{
    DescriptorParser parser(text, fileId);
    return parser.parse();
}

} // namespace themebuild::descriptor
