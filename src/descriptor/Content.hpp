//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: descriptor/Content.hpp
// Purpose: Content items produced by the descriptor parser.
// Key invariants: Items appear in document order; text views point into the
//                 parsed buffer, which must outlive the item sequence.
// Ownership/Lifetime: Directive payloads own their decoded literals; every
//                     other item only views the source text.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/glob.hpp"
#include "themebuild/parse/Cursor.h"

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace themebuild::descriptor
{

/// `#include "path"`; path is normalized and relative.
struct IncludeDirective
{
    std::string path;
};

/// `#resource ["dest":] "glob"`; dest is "." when omitted.
struct ResourceDirective
{
    support::GlobPattern pattern;
    std::string dest;
};

/// Any other `#name rest-of-line`, passed through as a comment.
struct UnknownDirective
{
    std::string_view name;
    std::string_view rest;
};

/// A directive line.  @c line covers the whole physical line without its
/// terminator (leading blanks included); @c keyword is the position of `#`.
struct Directive
{
    parse::Span line;
    parse::SourcePos keyword;
    std::variant<IncludeDirective, ResourceDirective, UnknownDirective> kind;
};

struct Newline
{
    parse::SourcePos pos;
};

struct Code
{
    parse::Span span;
};

/// `;` comment; the span includes the semicolon.
struct Comment
{
    parse::Span span;
};

/// `#{ ... }` span.  @c source is the text between the braces and @c pos the
/// position of the opening `#`.
struct Expression
{
    std::string_view source;
    parse::SourcePos pos;
};

using ContentItem = std::variant<Newline, Code, Comment, Expression, Directive>;
using Content = std::vector<ContentItem>;

/// @brief Re-assemble the source text represented by @p items.
/// @details Expressions are re-wrapped in `#{ }` and directives reproduce
///          their original line, so the result equals the parsed text.
std::string renderSource(const Content &items);

} // namespace themebuild::descriptor
