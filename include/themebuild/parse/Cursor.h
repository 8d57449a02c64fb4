//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/themebuild/parse/Cursor.h
// Purpose: Declare a lightweight text cursor for the descriptor parsers.
// Key invariants: Operates on a string_view without allocating or owning storage.
// Ownership/Lifetime: Views textual buffers owned by the caller; no allocations.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Defines the cursor shared by the descriptor and config-value parsers.
/// @details The cursor tracks the byte offset, the 1-based line and the
///          1-based column counted in UTF-8 code points of its current
///          position.  Parsers capture a SourcePos before scanning a construct
///          and turn the consumed range into a Span, so every fragment leaves
///          the scanner already annotated with its location.

#pragma once

#include <concepts>
#include <cstddef>
#include <string_view>

namespace themebuild::parse
{

template <class Predicate>
concept CursorPredicate = requires(Predicate pred, char ch) {
    { pred(ch) } -> std::convertible_to<bool>;
};

/// @brief Represents a position within a textual buffer.
struct SourcePos
{
    unsigned line = 1;      ///< 1-based line number.
    unsigned column = 1;    ///< 1-based column in UTF-8 code points.
    std::size_t offset = 0; ///< 0-based byte offset.
};

/// @brief Slice of the scanned buffer paired with the position it starts at.
struct Span
{
    std::string_view text;
    SourcePos pos;
};

/// @brief Lightweight cursor for scanning descriptor text.
class Cursor
{
  public:
    /// @brief Construct a cursor over @p text starting at @p start.
    explicit Cursor(std::string_view text, SourcePos start = {}) noexcept;

    /// @brief Return the backing view observed by the cursor.
    [[nodiscard]] std::string_view view() const noexcept
    {
        return text_;
    }

    /// @brief View the unconsumed suffix.
    [[nodiscard]] std::string_view remaining() const noexcept
    {
        return text_.substr(index_);
    }

    /// @brief Query whether the cursor has reached the end of the buffer.
    [[nodiscard]] bool atEnd() const noexcept
    {
        return index_ >= text_.size();
    }

    /// @brief Inspect the current character without consuming it.
    [[nodiscard]] char peek() const noexcept;

    /// @brief Inspect the character @p ahead bytes past the current one.
    [[nodiscard]] char peekAt(std::size_t ahead) const noexcept;

    /// @brief Check whether the unconsumed text begins with @p prefix.
    [[nodiscard]] bool startsWith(std::string_view prefix) const noexcept
    {
        return remaining().substr(0, prefix.size()) == prefix;
    }

    /// @brief Report the current position.
    [[nodiscard]] SourcePos pos() const noexcept
    {
        return pos_;
    }

    /// @brief Retrieve the absolute byte offset within the buffer.
    [[nodiscard]] std::size_t offset() const noexcept
    {
        return index_;
    }

    /// @brief Skip spaces and tabs; never crosses a line break.
    void skipBlanks() noexcept;

    /// @brief Consume @p c if present at the cursor.
    bool consume(char c) noexcept;

    /// @brief Consume @p literal if the unconsumed text starts with it.
    bool consumeLiteral(std::string_view literal) noexcept;

    /// @brief Consume characters while @p pred returns true.
    template <CursorPredicate Predicate> std::string_view consumeWhile(Predicate pred) noexcept
    {
        const std::size_t begin = index_;
        while (!atEnd() && pred(peek()))
            advance();
        return text_.substr(begin, index_ - begin);
    }

    /// @brief Build the span covering everything consumed since @p start.
    [[nodiscard]] Span spanFrom(SourcePos start) const noexcept
    {
        return Span{text_.substr(start.offset, index_ - start.offset), start};
    }

    /// @brief Advance by a single byte if not already at end.
    void advance() noexcept;

    /// @brief Advance to @p offset within the buffer.
    void seek(std::size_t offset) noexcept;

  private:
    void applyAdvance(char ch) noexcept;

    std::string_view text_;
    std::size_t index_ = 0;
    SourcePos start_{};
    SourcePos pos_{};
};

} // namespace themebuild::parse
