//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/config/IniFile.cpp
// Purpose: Line-oriented INI reader and writer.
//
//===----------------------------------------------------------------------===//

#include "config/IniFile.hpp"

#include "common/CharUtils.hpp"
#include "support/DiagnosticCodes.hpp"

namespace themebuild::config
{
namespace
{
namespace cu = common::char_utils;

bool isBlank(char c)
{
    return cu::isHorizontalWhitespace(c) || c == '\r';
}

std::string_view trim(std::string_view s)
{
    while (!s.empty() && isBlank(s.front()))
        s.remove_prefix(1);
    while (!s.empty() && isBlank(s.back()))
        s.remove_suffix(1);
    return s;
}

support::Diag iniError(uint32_t fileId, parse::SourcePos pos, const std::string &message)
{
    support::SourceLoc loc{fileId, pos.line, pos.column, static_cast<uint32_t>(pos.offset)};
    return support::makeError(loc, message, std::string(diag::IniSyntax));
}
} // namespace

support::Expected<std::vector<IniEntry>> parseIni(std::string_view text, uint32_t fileId)
{
    std::vector<IniEntry> entries;
    std::string section;
    parse::Cursor cur(text);

    // A UTF-8 byte order mark is not part of the first line.
    cur.consumeLiteral("\xEF\xBB\xBF");

    while (!cur.atEnd())
    {
        cur.skipBlanks();
        const parse::SourcePos lineStart = cur.pos();
        std::string_view line = cur.consumeWhile([](char c) { return c != '\n'; });
        cur.consume('\n');

        line = trim(line);
        if (line.empty() || line.front() == ';' || line.front() == '#')
            continue;

        if (line.front() == '[')
        {
            if (line.back() != ']')
                return iniError(fileId, lineStart, "expected `]` to close section header");
            section.assign(trim(line.substr(1, line.size() - 2)));
            continue;
        }

        const size_t eq = line.find('=');
        if (eq == std::string_view::npos)
            return iniError(fileId, lineStart, "expected `key=value`");

        const std::string_view key = trim(line.substr(0, eq));
        if (key.empty())
            return iniError(fileId, lineStart, "missing key before `=`");

        // Locate the value's first character for diagnostics inside it.
        parse::Cursor valueCur(line, lineStart);
        valueCur.seek(eq + 1);
        valueCur.skipBlanks();

        IniEntry entry;
        entry.section = section;
        entry.key.assign(key);
        entry.value.assign(trim(line.substr(eq + 1)));
        entry.valuePos = valueCur.pos();
        entry.valuePos.offset += lineStart.offset;
        entries.push_back(std::move(entry));
    }
    return entries;
}

ConfigTable toTable(const std::vector<IniEntry> &entries)
{
    ConfigTable table;
    for (const auto &e : entries)
        table.set(e.section, e.key, e.value);
    return table;
}

std::string writeIni(const ConfigTable &table)
{
    std::string out;
    for (const auto &section : table.sections())
    {
        if (!section.name.empty())
        {
            if (!out.empty())
                out += '\n';
            out += '[' + section.name + "]\n";
        }
        for (const auto &[key, value] : section.entries)
            out += key + '=' + value + '\n';
    }
    return out;
}

} // namespace themebuild::config
