//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/descriptor/ConfigValueParser.cpp
// Purpose: Re-scan configuration values for expression spans using the same
//          span grammar as descriptors.  Directives, comments and string
//          literals have no meaning inside a value.
//
//===----------------------------------------------------------------------===//

#include "descriptor/ConfigValueParser.hpp"

#include "descriptor/Lexemes.hpp"

namespace themebuild::descriptor
{
namespace
{
/// Number of UTF-8 code points between the last line break before @p offset
/// and @p offset.
unsigned indentAt(std::string_view value, std::size_t offset)
{
    std::size_t lineBegin = value.rfind('\n', offset == 0 ? 0 : offset - 1);
    lineBegin = (lineBegin == std::string_view::npos || offset == 0) ? 0 : lineBegin + 1;
    unsigned column = 0;
    for (std::size_t i = lineBegin; i < offset; ++i)
    {
        if ((static_cast<unsigned char>(value[i]) & 0xC0) != 0x80)
            ++column;
    }
    return column;
}
} // namespace

support::Expected<std::vector<ValuePart>> parseConfigValue(std::string_view value,
                                                           uint32_t fileId,
                                                           parse::SourcePos start)
{
    std::vector<ValuePart> parts;
    // The cursor counts bytes from the start of the value; positions handed
    // out are rebased onto the file.
    parse::Cursor cur(value, start);

    while (!cur.atEnd())
    {
        parse::SourcePos pos = cur.pos();
        const std::size_t offset = cur.offset();
        pos.offset += start.offset;
        if (cur.startsWith("#{"))
        {
            auto source = scanExpressionSpan(cur, fileId);
            if (!source)
            {
                support::Diag diag = source.takeError();
                diag.loc.offset += static_cast<uint32_t>(start.offset);
                return diag;
            }
            parts.push_back(
                ValuePart{ValuePart::Kind::Expression, source.value(), pos, indentAt(value, offset)});
            continue;
        }

        cur.advance();
        while (!cur.atEnd() && !cur.startsWith("#{"))
            cur.advance();
        parts.push_back(ValuePart{ValuePart::Kind::Text,
                                  value.substr(offset, cur.offset() - offset),
                                  pos,
                                  indentAt(value, offset)});
    }
    return parts;
}

} // namespace themebuild::descriptor
