//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: config/IniFile.hpp
// Purpose: Read and write the INI format used by `.ReaperTheme` files.
//
// Syntax accepted by the reader:
//   - blank lines;
//   - comment lines whose first non-blank character is `;` or `#`;
//   - `[section]` headers;
//   - `key=value` pairs; key and value are trimmed of surrounding blanks.
// Keys before the first header belong to the general section "".
// Comment characters later in a line are part of the value.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "config/ConfigTable.hpp"
#include "support/diag_expected.hpp"
#include "themebuild/parse/Cursor.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace themebuild::config
{

/// @brief One `key=value` line together with the position of its value.
struct IniEntry
{
    std::string section;
    std::string key;
    std::string value;
    parse::SourcePos valuePos;
};

/// @brief Parse @p text into entries in document order.
/// @return Entries, or a T0020 diagnostic for the first malformed line.
support::Expected<std::vector<IniEntry>> parseIni(std::string_view text, uint32_t fileId = 0);

/// @brief Fold parsed entries into a table (later duplicates win).
ConfigTable toTable(const std::vector<IniEntry> &entries);

/// @brief Serialize @p table: general keys first, then one block per section.
std::string writeIni(const ConfigTable &table);

} // namespace themebuild::config
