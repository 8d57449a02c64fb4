//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/descriptor/Lexemes.cpp
// Purpose: Implement string literal decoding and expression span scanning.
// Key invariants: String literals accept exactly the JSON escape set; raw
//                 control characters inside a literal are rejected.
//
//===----------------------------------------------------------------------===//

#include "descriptor/Lexemes.hpp"

#include "common/CharUtils.hpp"
#include "support/DiagnosticCodes.hpp"

namespace themebuild::descriptor
{
namespace cu = common::char_utils;
using support::Expected;
using support::makeError;

support::SourceLoc toLoc(uint32_t fileId, parse::SourcePos pos)
{
    return support::SourceLoc{fileId,
                              static_cast<uint32_t>(pos.line),
                              static_cast<uint32_t>(pos.column),
                              static_cast<uint32_t>(pos.offset)};
}

std::string fragmentAt(const parse::Cursor &cur)
{
    constexpr std::size_t kMaxFragment = 24;
    std::string_view rest = cur.remaining();
    const std::size_t eol = rest.find('\n');
    if (eol != std::string_view::npos)
        rest = rest.substr(0, eol);
    if (rest.size() > kMaxFragment)
        return std::string(rest.substr(0, kMaxFragment)) + "...";
    return std::string(rest);
}

namespace
{
/// Read four hex digits following `\u`.
bool readHex4(parse::Cursor &cur, unsigned long &out)
{
    out = 0;
    for (int i = 0; i < 4; ++i)
    {
        const int digit = cu::hexDigitValue(cur.peek());
        if (cur.atEnd() || digit < 0)
            return false;
        out = (out << 4) | static_cast<unsigned long>(digit);
        cur.advance();
    }
    return true;
}
} // namespace

Expected<std::string> scanStringLiteral(parse::Cursor &cur, uint32_t fileId)
{
    const parse::SourcePos start = cur.pos();
    if (!cur.consume('"'))
    {
        return makeError(toLoc(fileId, start),
                         "expected string literal at `" + fragmentAt(cur) + "`",
                         std::string(diag::UnterminatedString));
    }

    std::string out;
    while (true)
    {
        if (cur.atEnd())
        {
            return makeError(toLoc(fileId, start),
                             "unterminated string literal",
                             std::string(diag::UnterminatedString));
        }

        const char c = cur.peek();
        if (c == '"')
        {
            cur.advance();
            return out;
        }

        if (static_cast<unsigned char>(c) < 0x20)
        {
            return makeError(toLoc(fileId, cur.pos()),
                             "control character in string literal",
                             std::string(diag::ControlCharInString));
        }

        if (c != '\\')
        {
            out.push_back(c);
            cur.advance();
            continue;
        }

        const parse::SourcePos escPos = cur.pos();
        cur.advance();
        const char e = cur.peek();
        switch (e)
        {
            case '"':
            case '\\':
            case '/':
                out.push_back(e);
                cur.advance();
                break;
            case 'b':
                out.push_back('\b');
                cur.advance();
                break;
            case 'f':
                out.push_back('\f');
                cur.advance();
                break;
            case 'n':
                out.push_back('\n');
                cur.advance();
                break;
            case 'r':
                out.push_back('\r');
                cur.advance();
                break;
            case 't':
                out.push_back('\t');
                cur.advance();
                break;
            case 'u':
            {
                cur.advance();
                unsigned long cp = 0;
                if (!readHex4(cur, cp))
                {
                    return makeError(toLoc(fileId, escPos),
                                     "invalid unicode escape at `" + fragmentAt(cur) + "`",
                                     std::string(diag::InvalidEscapeSequence));
                }
                if (cp >= 0xD800 && cp <= 0xDBFF)
                {
                    unsigned long low = 0;
                    if (!cur.consumeLiteral("\\u") || !readHex4(cur, low) || low < 0xDC00 ||
                        low > 0xDFFF)
                    {
                        return makeError(toLoc(fileId, escPos),
                                         "unpaired surrogate in unicode escape",
                                         std::string(diag::InvalidEscapeSequence));
                    }
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                }
                if (!cu::appendUtf8(out, cp))
                {
                    return makeError(toLoc(fileId, escPos),
                                     "unpaired surrogate in unicode escape",
                                     std::string(diag::InvalidEscapeSequence));
                }
                break;
            }
            default:
                return makeError(toLoc(fileId, escPos),
                                 "invalid escape sequence at `" + fragmentAt(cur) + "`",
                                 std::string(diag::InvalidEscapeSequence));
        }
    }
}

namespace
{
/// Level of a long bracket opening at the cursor (`[[` is 0, `[==[` is 2),
/// or -1 when the cursor is not on one.
int longBracketLevel(const parse::Cursor &cur)
{
    if (cur.peek() != '[')
        return -1;
    std::size_t i = 1;
    while (cur.peekAt(i) == '=')
        ++i;
    return cur.peekAt(i) == '[' ? static_cast<int>(i - 1) : -1;
}

/// Consume a long string or long comment body; stops at end of input when the
/// closing bracket is missing.
void skipLongBracket(parse::Cursor &cur, int level)
{
    cur.seek(cur.offset() + static_cast<std::size_t>(level) + 2);
    const std::string close = "]" + std::string(static_cast<std::size_t>(level), '=') + "]";
    while (!cur.atEnd() && !cur.consumeLiteral(close))
        cur.advance();
}

void skipQuoted(parse::Cursor &cur)
{
    const char quote = cur.peek();
    cur.advance();
    while (!cur.atEnd() && cur.peek() != quote)
    {
        if (cur.peek() == '\\')
            cur.advance();
        cur.advance();
    }
    cur.advance();
}
} // namespace

Expected<std::string_view> scanExpressionSpan(parse::Cursor &cur, uint32_t fileId)
{
    const parse::SourcePos start = cur.pos();
    if (!cur.consumeLiteral("#{"))
    {
        return makeError(toLoc(fileId, start),
                         "expected `#{` at `" + fragmentAt(cur) + "`",
                         std::string(diag::UnterminatedExpression));
    }

    const std::size_t innerBegin = cur.offset();
    unsigned depth = 1;
    while (!cur.atEnd())
    {
        const char c = cur.peek();
        if (c == '\'' || c == '"')
        {
            skipQuoted(cur);
            continue;
        }
        if (const int level = longBracketLevel(cur); level >= 0)
        {
            skipLongBracket(cur, level);
            continue;
        }
        if (cur.startsWith("--"))
        {
            cur.seek(cur.offset() + 2);
            if (const int level = longBracketLevel(cur); level >= 0)
                skipLongBracket(cur, level);
            else
                cur.consumeWhile([](char ch) { return ch != '\n'; });
            continue;
        }

        if (c == '{')
        {
            ++depth;
        }
        else if (c == '}' && --depth == 0)
        {
            std::string_view inner = cur.view().substr(innerBegin, cur.offset() - innerBegin);
            cur.advance();
            return inner;
        }
        cur.advance();
    }

    return makeError(toLoc(fileId, start),
                     "unterminated expression, missing `}`",
                     std::string(diag::UnterminatedExpression));
}

} // namespace themebuild::descriptor
