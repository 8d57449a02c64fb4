//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/parse/Cursor.cpp
// Purpose: Provide out-of-line helpers for the parse::Cursor utility.
// Key invariants: Columns advance once per UTF-8 lead byte; continuation bytes
//                 only advance the byte offset.
// Ownership/Lifetime: Operates on caller-owned string_view buffers.
//
//===----------------------------------------------------------------------===//

#include "themebuild/parse/Cursor.h"

namespace themebuild::parse
{

/// @brief Construct a cursor that walks @p text starting at @p start.
///
/// @details The cursor records both the starting position and the current
///          position so seek() can rewind to the beginning and replay
///          movement when callers jump backwards.  The offset stored inside
///          @p start is ignored; the cursor always begins at byte zero of the
///          view it receives.
Cursor::Cursor(std::string_view text, SourcePos start) noexcept
    : text_(text), index_(0), start_(start), pos_(start)
{
    start_.offset = 0;
    pos_.offset = 0;
}

char Cursor::peek() const noexcept
{
    return atEnd() ? '\0' : text_[index_];
}

char Cursor::peekAt(std::size_t ahead) const noexcept
{
    const std::size_t at = index_ + ahead;
    return at < text_.size() ? text_[at] : '\0';
}

/// @brief Update line and column after consuming @p ch.
void Cursor::applyAdvance(char ch) noexcept
{
    ++pos_.offset;
    if (ch == '\n')
    {
        ++pos_.line;
        pos_.column = 1;
    }
    else if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80)
    {
        ++pos_.column;
    }
}

void Cursor::advance() noexcept
{
    if (atEnd())
        return;
    const char ch = text_[index_++];
    applyAdvance(ch);
}

void Cursor::skipBlanks() noexcept
{
    while (!atEnd() && (peek() == ' ' || peek() == '\t'))
        advance();
}

bool Cursor::consume(char c) noexcept
{
    if (atEnd() || peek() != c)
        return false;
    advance();
    return true;
}

bool Cursor::consumeLiteral(std::string_view literal) noexcept
{
    if (!startsWith(literal))
        return false;
    seek(index_ + literal.size());
    return true;
}

/// @brief Move the cursor to an absolute byte offset.
///
/// @details Forward seeks advance one byte at a time so the position stays
///          accurate.  Backward seeks rewind to the start and replay.
void Cursor::seek(std::size_t offset) noexcept
{
    if (offset > text_.size())
        offset = text_.size();

    if (offset >= index_)
    {
        while (index_ < offset)
            advance();
        return;
    }

    index_ = 0;
    pos_ = start_;
    while (index_ < offset)
        advance();
}

} // namespace themebuild::parse
