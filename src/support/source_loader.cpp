//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/source_loader.cpp
// Purpose: Standardise how the build reads input files into memory and how
//          the staging writer stores text artifacts.
// Key invariants: The loaded buffer contains the complete file contents.
// Ownership/Lifetime: The returned LoadedSource owns its buffer.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Provides file loading and writing helpers for the build pipeline.

#include "support/source_loader.hpp"

#include "support/DiagnosticCodes.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace themebuild::support
{

Expected<LoadedSource> loadSourceBuffer(const std::string &path, SourceManager &sm, SourceLoc loc)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        return makeError(loc, "failed to read file `" + path + "`", std::string(diag::ReadFailure));
    }

    // Check file size before reading to avoid OOM on huge files.
    in.seekg(0, std::ios::end);
    auto fileSize = in.tellg();
    in.seekg(0, std::ios::beg);
    constexpr auto kMaxSourceSize = static_cast<std::streamoff>(256ULL * 1024 * 1024);
    if (fileSize < 0 || fileSize > kMaxSourceSize)
    {
        return makeError(loc,
                         "source file too large: " + path + " (limit: 256 MB)",
                         std::string(diag::ReadFailure));
    }

    std::string contents;
    try
    {
        std::ostringstream ss;
        ss << in.rdbuf();
        contents = ss.str();
    }
    catch (const std::bad_alloc &)
    {
        return makeError(loc, "out of memory reading " + path, std::string(diag::ReadFailure));
    }

    const uint32_t fileId = sm.addFile(path);
    if (fileId == 0)
    {
        return makeError(loc, std::string{kSourceManagerFileIdOverflowMessage});
    }

    LoadedSource source{};
    source.buffer = std::move(contents);
    source.fileId = fileId;
    return source;
}

Expected<void> writeTextFile(const std::string &path, std::string_view contents)
{
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path target(path);
    if (target.has_parent_path())
    {
        fs::create_directories(target.parent_path(), ec);
        if (ec)
        {
            return makeError({},
                             "failed to create directory `" + target.parent_path().string() +
                                 "`: " + ec.message(),
                             std::string(diag::WriteFailure));
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        return makeError({}, "failed to write file `" + path + "`", std::string(diag::WriteFailure));
    }
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    if (!out)
    {
        return makeError({}, "failed to write file `" + path + "`", std::string(diag::WriteFailure));
    }
    return {};
}

} // namespace themebuild::support
