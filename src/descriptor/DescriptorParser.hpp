//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: descriptor/DescriptorParser.hpp
// Purpose: Recursive-descent parser turning descriptor text into content items.
// Key invariants: Parsing stops at the first error; no partial item sequence
//                 is ever returned.
// Ownership/Lifetime: The parser views the caller's buffer, which must outlive
//                     both the parser and the returned content.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "descriptor/Content.hpp"
#include "support/diag_expected.hpp"
#include "themebuild/parse/Cursor.h"

#include <cstdint>
#include <string_view>

namespace themebuild::descriptor
{

/// @brief Parses a theme descriptor.
///
/// Recognised constructs: `;` line comments, `#{ }` expression spans, and
/// directive lines whose first non-blank character is `#` followed by a name.
/// Everything else is code.
class DescriptorParser
{
  public:
    /// @param text Descriptor text.
    /// @param fileId Identifier of the file for diagnostics; 0 when unknown.
    DescriptorParser(std::string_view text, uint32_t fileId);

    /// @brief Parse the whole buffer.
    support::Expected<Content> parse();

  private:
    /// Check whether a directive starts after the blanks at the cursor.
    bool atDirective() const;

    support::Expected<Directive> parseDirective();
    support::Expected<IncludeDirective> parseInclude(parse::SourcePos keyword);
    support::Expected<ResourceDirective> parseResource(parse::SourcePos keyword);

    /// Parse a path literal and reject absolute paths.
    support::Expected<std::string> parsePathLiteral();

    /// Require only blanks up to the end of the line.
    support::Expected<void> expectLineEnd(parse::SourcePos keyword, std::string_view directive);

    void appendCode(parse::Span span);

    parse::Cursor cur_;
    uint32_t fileId_;
    Content items_;
};

/// @brief Convenience wrapper around DescriptorParser.
support::Expected<Content> parseDescriptor(std::string_view text, uint32_t fileId = 0);

} // namespace themebuild::descriptor
