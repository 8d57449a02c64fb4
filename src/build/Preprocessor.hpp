//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Preprocessor.hpp
/// @brief Expands a theme descriptor into its build artifacts.
///
/// @details The preprocessor walks the content produced by the descriptor
/// parser and, for every item, either copies it to the output or acts on it:
///
/// - Expressions are evaluated in the build's script engine and replaced by
///   their serialized result.
/// - `#include` either imports an INI file into the configuration table, runs
///   a script once in the shared engine, or expands another descriptor in
///   place before the rest of the including file.
/// - `#resource` globs files relative to the including file and registers them
///   in the resource manifest.  The first registration of a destination wins.
/// - Unknown directives are re-emitted as `; #name rest` comment lines.
///
/// Include and resource directive lines leave no trace in the output,
/// including their line terminator.
///
/// @invariant A failed build returns its first error and no artifacts.
///            Advisory problems (resource collisions, unreadable glob entries)
///            are reported as warnings through the DiagnosticEngine.
///
/// Ownership/Lifetime: The preprocessor references the SourceManager and
/// DiagnosticEngine passed at construction; both must outlive it.  Each build
/// call owns a fresh BuildState.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "build/BuildOptions.hpp"
#include "build/BuildState.hpp"
#include "descriptor/Content.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/glob.hpp"
#include "support/source_manager.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace themebuild::build
{

class Preprocessor
{
  public:
    Preprocessor(support::SourceManager &sm,
                 support::DiagnosticEngine &diags,
                 BuildOptions options = {});

    /// @brief Build the descriptor stored at @p path.
    support::Expected<BuildOutput> build(const std::string &path);

    /// @brief Build descriptor @p text as though it had been read from @p path.
    /// @details Includes and resources resolve against the directory of
    ///          @p path; the file itself is never read.
    support::Expected<BuildOutput> buildText(std::string_view text, const std::string &path);

  private:
    /// @brief File whose content is being expanded.
    struct FileContext
    {
        std::string path;
        std::string dir;
        uint32_t fileId = 0;
    };

    support::Expected<BuildOutput> run(std::string_view text, const std::string &path, uint32_t fileId);

    support::Expected<void> expandFile(BuildState &state, const std::string &path, support::SourceLoc from);

    support::Expected<void> expandText(BuildState &state, std::string_view text, const FileContext &file);

    support::Expected<void> feed(BuildState &state,
                                 const descriptor::ContentItem &item,
                                 const FileContext &file);

    support::Expected<void> feedExpression(BuildState &state,
                                           const descriptor::Expression &expr,
                                           const FileContext &file);

    support::Expected<void> feedInclude(BuildState &state,
                                        const descriptor::IncludeDirective &include,
                                        support::SourceLoc loc,
                                        const FileContext &file);

    support::Expected<void> importConfig(BuildState &state, const std::string &path, support::SourceLoc from);

    support::Expected<void> runScript(BuildState &state, const std::string &path, support::SourceLoc from);

    /// @brief Glob @p pattern under @p baseDir and register every match below
    ///        destination directory @p dest.
    void addResources(BuildState &state,
                      const support::GlobPattern &pattern,
                      const std::string &dest,
                      const std::string &baseDir,
                      support::SourceLoc loc);

    /// @brief Resolve and clear the resources queued by `resource()`.
    void drainPending(BuildState &state, const std::string &baseDir, support::SourceLoc loc);

    void trace(support::SourceLoc loc, std::string message);

    support::SourceManager &sm_;
    support::DiagnosticEngine &diags_;
    BuildOptions options_;
};

} // namespace themebuild::build
