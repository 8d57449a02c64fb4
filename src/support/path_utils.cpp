//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/path_utils.cpp
// Purpose: Implement relative-path validation and lexical path helpers.
// Key invariants: Normalization always yields forward slashes and resolves dot
//                 segments; nothing here touches the filesystem.
//
//===----------------------------------------------------------------------===//

#include "support/path_utils.hpp"

#include "support/DiagnosticCodes.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace themebuild::support
{

bool isAbsoluteLiteral(std::string_view path)
{
    if (path.empty())
        return false;
    if (path.front() == '/' || path.front() == '\\')
        return true;
    return path.size() >= 2 && std::isalpha(static_cast<unsigned char>(path[0])) &&
           path[1] == ':';
}

Expected<std::string> parseRelativePath(std::string_view literal, SourceLoc loc)
{
    if (isAbsoluteLiteral(literal))
    {
        return makeError(loc,
                         "path `" + std::string(literal) + "` must be relative",
                         std::string(diag::NonRelativePath));
    }
    return normalize(literal);
}

std::string normalize(std::string_view path)
{
    std::string sanitized(path);
    std::replace(sanitized.begin(), sanitized.end(), '\\', '/');

    if (sanitized.empty())
        return std::string{"."};

    std::filesystem::path fsPath(sanitized);
    std::string generic = fsPath.lexically_normal().generic_string();

    // lexically_normal keeps a trailing separator for "dir/" and "dir/.".
    while (generic.size() > 1 && generic.back() == '/')
        generic.pop_back();

    if (generic.empty())
        generic = sanitized.front() == '/' ? std::string{"/"} : std::string{"."};

    return generic;
}

std::string joinPath(std::string_view base, std::string_view rel)
{
    if (base.empty() || base == ".")
        return normalize(rel);
    if (rel.empty() || rel == ".")
        return normalize(base);
    std::string joined(base);
    if (joined.back() != '/' && joined.back() != '\\')
        joined.push_back('/');
    joined.append(rel);
    return normalize(joined);
}

std::string parentDirectory(std::string_view path)
{
    std::string norm = normalize(path);
    size_t pos = norm.find_last_of('/');
    if (pos == std::string::npos)
        return ".";
    if (pos == 0)
        return "/";
    return norm.substr(0, pos);
}

std::string basename(std::string_view path)
{
    if (path.empty())
        return {};
    size_t pos = path.find_last_of('/');
    if (pos == std::string_view::npos)
        return std::string(path);
    if (pos + 1 >= path.size())
        return {};
    return std::string(path.substr(pos + 1));
}

std::string extension(std::string_view path)
{
    std::string name = basename(normalize(path));
    size_t dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0)
        return {};
    std::string ext = name.substr(dot + 1);
    std::transform(ext.begin(),
                   ext.end(),
                   ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace themebuild::support
