//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/glob.cpp
// Purpose: Implement glob compilation, component matching and directory
//          expansion.
// Key invariants: Expansion visits one directory at a time in sorted name
//                 order, so matches come out in walk order and free of
//                 duplicates; failures to enumerate an entry are reported,
//                 never thrown.
//
//===----------------------------------------------------------------------===//

#include "support/glob.hpp"

#include "support/DiagnosticCodes.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <unordered_set>
#include <utility>

namespace themebuild::support
{
namespace
{
namespace fs = std::filesystem;

std::vector<std::string> splitComponents(std::string_view path)
{
    std::vector<std::string> parts;
    std::string current;
    for (char c : path)
    {
        if (c == '/' || c == '\\')
        {
            if (!current.empty() && current != ".")
                parts.push_back(current);
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    if (!current.empty() && current != ".")
        parts.push_back(current);
    return parts;
}

bool hasWildcard(std::string_view component)
{
    return component.find_first_of("*?[") != std::string_view::npos;
}

/// Length of the UTF-8 sequence introduced by lead byte @p c.
size_t utf8Length(unsigned char c)
{
    if (c >= 0xF0)
        return 4;
    if (c >= 0xE0)
        return 3;
    if (c >= 0xC0)
        return 2;
    return 1;
}

/// Decode the UTF-8 sequence at @p s[i]; @p len receives its byte length.
/// Malformed or truncated sequences decode as their lead byte.
char32_t decodeAt(std::string_view s, size_t i, size_t &len)
{
    const auto lead = static_cast<unsigned char>(s[i]);
    len = utf8Length(lead);
    if (len == 1 || i + len > s.size())
    {
        len = 1;
        return lead;
    }
    char32_t cp = lead & (0x7F >> len);
    for (size_t k = 1; k < len; ++k)
    {
        const auto cont = static_cast<unsigned char>(s[i + k]);
        if ((cont & 0xC0) != 0x80)
        {
            len = 1;
            return lead;
        }
        cp = (cp << 6) | (cont & 0x3F);
    }
    return cp;
}

/// Match a bracket class starting at @p pat[p] == '[' against code point
/// @p ch.  On return @p end is the index just past the closing bracket.
bool matchClass(std::string_view pat, size_t p, char32_t ch, size_t &end)
{
    size_t i = p + 1;
    bool negate = false;
    if (i < pat.size() && pat[i] == '!')
    {
        negate = true;
        ++i;
    }
    bool matched = false;
    bool first = true;
    while (i < pat.size() && (pat[i] != ']' || first))
    {
        first = false;
        size_t loLen = 0;
        const char32_t lo = decodeAt(pat, i, loLen);
        const size_t dash = i + loLen;
        if (dash + 1 < pat.size() && pat[dash] == '-' && pat[dash + 1] != ']')
        {
            size_t hiLen = 0;
            const char32_t hi = decodeAt(pat, dash + 1, hiLen);
            if (ch >= lo && ch <= hi)
                matched = true;
            i = dash + 1 + hiLen;
        }
        else
        {
            if (ch == lo)
                matched = true;
            i = dash;
        }
    }
    end = i + 1;
    return matched != negate;
}

bool matchFrom(std::string_view pat, size_t p, std::string_view name, size_t n)
{
    while (p < pat.size())
    {
        const char c = pat[p];
        if (c == '*')
        {
            while (p < pat.size() && pat[p] == '*')
                ++p;
            if (p == pat.size())
                return true;
            for (size_t k = n; k <= name.size(); ++k)
            {
                if (matchFrom(pat, p, name, k))
                    return true;
            }
            return false;
        }
        if (n >= name.size())
            return false;
        if (c == '?')
        {
            ++p;
            n += utf8Length(static_cast<unsigned char>(name[n]));
            continue;
        }
        if (c == '[')
        {
            size_t end = p;
            size_t len = 0;
            if (!matchClass(pat, p, decodeAt(name, n, len), end))
                return false;
            p = end;
            n += len;
            continue;
        }
        if (c != name[n])
            return false;
        ++p;
        ++n;
    }
    return n == name.size();
}

/// Validate one component; returns an empty string when it is well formed.
std::string validateComponent(std::string_view comp)
{
    for (size_t i = 0; i < comp.size(); ++i)
    {
        if (comp[i] == '*')
        {
            size_t run = 0;
            while (i + run < comp.size() && comp[i + run] == '*')
                ++run;
            if (run > 2)
                return "wildcards are either regular `*` or recursive `**`";
            if (run == 2 && comp.size() != 2)
                return "recursive wildcards must form a single path component";
            i += run - 1;
        }
        else if (comp[i] == '[')
        {
            size_t j = i + 1;
            if (j < comp.size() && comp[j] == '!')
                ++j;
            if (j < comp.size() && comp[j] == ']')
                ++j;
            size_t close = comp.find(']', j);
            if (close == std::string_view::npos)
                return "invalid range pattern";
            i = close;
        }
    }
    return {};
}
} // namespace

Expected<GlobPattern> GlobPattern::compile(std::string_view pattern, SourceLoc loc)
{
    GlobPattern glob;
    glob.text_.assign(pattern);
    glob.components_ = splitComponents(pattern);

    for (const auto &comp : glob.components_)
    {
        std::string problem = validateComponent(comp);
        if (!problem.empty())
        {
            return makeError(loc,
                             "invalid glob pattern `" + std::string(pattern) + "`: " + problem,
                             std::string(diag::InvalidGlob));
        }
    }
    return glob;
}

bool GlobPattern::matchComponent(std::string_view component, std::string_view name)
{
    return matchFrom(component, 0, name, 0);
}

namespace
{
bool matchParts(const std::vector<std::string> &comps,
                size_t ci,
                const std::vector<std::string> &parts,
                size_t pi)
{
    if (ci == comps.size())
        return pi == parts.size();
    if (comps[ci] == "**")
    {
        for (size_t k = pi; k <= parts.size(); ++k)
        {
            if (matchParts(comps, ci + 1, parts, k))
                return true;
        }
        return false;
    }
    if (pi < parts.size() && GlobPattern::matchComponent(comps[ci], parts[pi]))
        return matchParts(comps, ci + 1, parts, pi + 1);
    return false;
}
} // namespace

bool GlobPattern::matches(std::string_view relativePath) const
{
    return matchParts(components_, 0, splitComponents(relativePath), 0);
}

/// Depth-first walker driving expandGlob().
struct GlobWalker
{
    const GlobPattern &pattern;
    GlobExpansion &out;

    static std::string child(const std::string &dir, const std::string &name)
    {
        if (dir.empty() || dir == ".")
            return name;
        if (dir.back() == '/')
            return dir + name;
        return dir + "/" + name;
    }

    /// List the entry names of @p dir; failures are recorded and yield none.
    std::vector<std::string> list(const std::string &dir)
    {
        std::vector<std::string> names;
        std::error_code ec;
        fs::directory_iterator it(dir.empty() ? fs::path(".") : fs::path(dir), ec);
        if (ec)
        {
            out.errors.push_back(dir + ": " + ec.message());
            return names;
        }
        for (; it != fs::directory_iterator(); it.increment(ec))
        {
            if (ec)
            {
                out.errors.push_back(dir + ": " + ec.message());
                break;
            }
            names.push_back(it->path().filename().generic_string());
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    static bool isDirectory(const std::string &path)
    {
        std::error_code ec;
        return fs::is_directory(fs::path(path), ec);
    }

    void walk(const std::string &dir, size_t idx)
    {
        const auto &comps = pattern.components_;
        if (idx == comps.size())
        {
            out.matches.push_back(dir);
            return;
        }

        const std::string &comp = comps[idx];
        const bool last = idx + 1 == comps.size();

        if (comp == "**")
        {
            if (!last)
                walk(dir, idx + 1);
            for (const auto &name : list(dir))
            {
                std::string path = child(dir, name);
                const bool isDir = isDirectory(path);
                if (last)
                    out.matches.push_back(path);
                if (isDir)
                    walk(path, idx);
            }
            return;
        }

        if (!hasWildcard(comp))
        {
            std::string path = child(dir, comp);
            std::error_code ec;
            if (last)
            {
                if (fs::exists(fs::path(path), ec))
                    out.matches.push_back(path);
            }
            else if (isDirectory(path))
            {
                walk(path, idx + 1);
            }
            return;
        }

        for (const auto &name : list(dir))
        {
            if (!GlobPattern::matchComponent(comp, name))
                continue;
            std::string path = child(dir, name);
            if (last)
                out.matches.push_back(path);
            else if (isDirectory(path))
                walk(path, idx + 1);
        }
    }
};

GlobExpansion expandGlob(const GlobPattern &pattern, std::string_view baseDir)
{
    GlobExpansion result;
    std::string base(baseDir.empty() ? std::string_view(".") : baseDir);

    std::error_code ec;
    if (!fs::is_directory(fs::path(base), ec))
        return result;

    GlobWalker walker{pattern, result};
    walker.walk(base, 0);

    // Overlapping `**` components can reach a path twice; keep the first.
    std::unordered_set<std::string> seen;
    std::vector<std::string> unique;
    unique.reserve(result.matches.size());
    for (auto &match : result.matches)
    {
        if (seen.insert(match).second)
            unique.push_back(std::move(match));
    }
    result.matches = std::move(unique);
    return result;
}

} // namespace themebuild::support
