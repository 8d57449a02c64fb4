//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Preprocessor.cpp
/// @brief Implementation of descriptor expansion.
///
//===----------------------------------------------------------------------===//

#include "build/Preprocessor.hpp"

#include "build/Serialize.hpp"
#include "config/IniFile.hpp"
#include "descriptor/ConfigValueParser.hpp"
#include "descriptor/DescriptorParser.hpp"
#include "support/DiagnosticCodes.hpp"
#include "support/path_utils.hpp"
#include "support/source_loader.hpp"

#include <type_traits>
#include <utility>
#include <variant>

namespace themebuild::build
{
namespace
{

support::SourceLoc locate(uint32_t fileId, parse::SourcePos pos)
{
    return support::SourceLoc{fileId,
                              static_cast<uint32_t>(pos.line),
                              static_cast<uint32_t>(pos.column),
                              static_cast<uint32_t>(pos.offset)};
}

/// Indent every line after the first by @p indent spaces.
std::string reindent(std::string text, unsigned indent)
{
    if (indent == 0 || text.find('\n') == std::string::npos)
        return text;
    const std::string pad(indent, ' ');
    std::string out;
    out.reserve(text.size() + pad.size() * 4);
    for (char c : text)
    {
        out.push_back(c);
        if (c == '\n')
            out.append(pad);
    }
    return out;
}

enum class IncludeKind
{
    Descriptor,
    Config,
    Script
};

IncludeKind classifyInclude(const std::string &path)
{
    const std::string ext = support::extension(path);
    if (ext == "ini" || ext == "reapertheme")
        return IncludeKind::Config;
    if (ext == "lua")
        return IncludeKind::Script;
    return IncludeKind::Descriptor;
}

} // namespace

Preprocessor::Preprocessor(support::SourceManager &sm,
                           support::DiagnosticEngine &diags,
                           BuildOptions options)
    : sm_(sm), diags_(diags), options_(std::move(options))
{
}

support::Expected<BuildOutput> Preprocessor::build(const std::string &path)
{
    auto loaded = support::loadSourceBuffer(path, sm_);
    if (!loaded)
        return loaded.takeError();
    return run(loaded.value().buffer, path, loaded.value().fileId);
}

support::Expected<BuildOutput> Preprocessor::buildText(std::string_view text, const std::string &path)
{
    return run(text, path, sm_.addFile(path));
}

support::Expected<BuildOutput> Preprocessor::run(std::string_view text,
                                                 const std::string &path,
                                                 uint32_t fileId)
{
    BuildState state(options_, diags_);
    FileContext file{path, support::parentDirectory(path), fileId};
    trace(support::SourceLoc{fileId}, "building theme `" + options_.themeName + "` from `" + path + "`");

    auto expanded = expandText(state, text, file);
    if (!expanded)
        return expanded.takeError();

    BuildOutput out;
    out.text = std::move(state.output);
    out.config = std::move(state.config);
    out.resources = std::move(state.resources);
    return out;
}

support::Expected<void> Preprocessor::expandFile(BuildState &state,
                                                 const std::string &path,
                                                 support::SourceLoc from)
{
    auto loaded = support::loadSourceBuffer(path, sm_, from);
    if (!loaded)
        return loaded.takeError();

    FileContext file{path, support::parentDirectory(path), loaded.value().fileId};
    trace(from, "including descriptor `" + path + "`");
    return expandText(state, loaded.value().buffer, file);
}

support::Expected<void> Preprocessor::expandText(BuildState &state,
                                                 std::string_view text,
                                                 const FileContext &file)
{
    auto content = descriptor::parseDescriptor(text, file.fileId);
    if (!content)
        return content.takeError();

    for (const auto &item : content.value())
    {
        auto fed = feed(state, item, file);
        if (!fed)
            return fed;
    }
    return {};
}

support::Expected<void> Preprocessor::feed(BuildState &state,
                                           const descriptor::ContentItem &item,
                                           const FileContext &file)
{
    if (std::holds_alternative<descriptor::Newline>(item))
    {
        if (state.suppressNewline)
            state.suppressNewline = false;
        else
            state.output.push_back('\n');
        return {};
    }
    state.suppressNewline = false;

    return std::visit(
        [&](const auto &node) -> support::Expected<void>
        {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, descriptor::Code> || std::is_same_v<T, descriptor::Comment>)
            {
                state.output.append(node.span.text);
                return {};
            }
            else if constexpr (std::is_same_v<T, descriptor::Expression>)
            {
                return feedExpression(state, node, file);
            }
            else if constexpr (std::is_same_v<T, descriptor::Directive>)
            {
                const auto loc = locate(file.fileId, node.keyword);
                if (const auto *include = std::get_if<descriptor::IncludeDirective>(&node.kind))
                {
                    auto done = feedInclude(state, *include, loc, file);
                    state.suppressNewline = true;
                    return done;
                }
                if (const auto *resource = std::get_if<descriptor::ResourceDirective>(&node.kind))
                {
                    addResources(state, resource->pattern, resource->dest, file.dir, loc);
                    state.suppressNewline = true;
                    return {};
                }
                const auto &unknown = std::get<descriptor::UnknownDirective>(node.kind);
                state.output.append("; #");
                state.output.append(unknown.name);
                state.output.append(unknown.rest);
                return {};
            }
            else
            {
                return {};
            }
        },
        item);
}

support::Expected<void> Preprocessor::feedExpression(BuildState &state,
                                                     const descriptor::Expression &expr,
                                                     const FileContext &file)
{
    const auto loc = locate(file.fileId, expr.pos);
    auto value = state.engine.evaluate(
        expr.source, script::ScriptEngine::expressionChunkName(expr.source), loc);
    if (!value)
    {
        state.pending.clear();
        return value.takeError();
    }

    auto text = serializeValue(value.value(), Destination::Descriptor, loc);
    if (!text)
        return text.takeError();
    state.output.append(text.value());

    drainPending(state, file.dir, loc);
    return {};
}

support::Expected<void> Preprocessor::feedInclude(BuildState &state,
                                                  const descriptor::IncludeDirective &include,
                                                  support::SourceLoc loc,
                                                  const FileContext &file)
{
    const std::string target = support::joinPath(file.dir, include.path);
    switch (classifyInclude(include.path))
    {
        case IncludeKind::Config:
            return importConfig(state, target, loc);
        case IncludeKind::Script:
            return runScript(state, target, loc);
        case IncludeKind::Descriptor:
            break;
    }

    if (state.includeDepth >= options_.maxIncludeDepth)
    {
        return support::makeError(loc,
                                  "include depth exceeds maximum (" +
                                      std::to_string(options_.maxIncludeDepth) + ") at `" + target +
                                      "`; check for recursive includes",
                                  std::string(diag::IncludeDepthExceeded));
    }

    ++state.includeDepth;
    auto expanded = expandFile(state, target, loc);
    --state.includeDepth;
    return expanded;
}

support::Expected<void> Preprocessor::importConfig(BuildState &state,
                                                   const std::string &path,
                                                   support::SourceLoc from)
{
    auto loaded = support::loadSourceBuffer(path, sm_, from);
    if (!loaded)
        return loaded.takeError();
    const uint32_t fileId = loaded.value().fileId;
    const std::string dir = support::parentDirectory(path);
    trace(from, "importing configuration `" + path + "`");

    auto entries = config::parseIni(loaded.value().buffer, fileId);
    if (!entries)
        return entries.takeError();

    for (const auto &entry : entries.value())
    {
        auto parts = descriptor::parseConfigValue(entry.value, fileId, entry.valuePos);
        if (!parts)
            return parts.takeError();

        std::string value;
        for (const auto &part : parts.value())
        {
            if (part.kind == descriptor::ValuePart::Kind::Text)
            {
                value.append(part.text);
                continue;
            }

            const auto loc = locate(fileId, part.pos);
            auto result = state.engine.evaluate(
                part.text, script::ScriptEngine::expressionChunkName(part.text), loc);
            if (!result)
            {
                state.pending.clear();
                return result.takeError();
            }
            auto text = serializeValue(result.value(), Destination::Config, loc);
            if (!text)
                return text.takeError();
            value += reindent(std::move(text.value()), part.indent);
            drainPending(state, dir, loc);
        }
        state.config.set(entry.section, entry.key, std::move(value));
    }
    return {};
}

support::Expected<void> Preprocessor::runScript(BuildState &state,
                                                const std::string &path,
                                                support::SourceLoc from)
{
    auto loaded = support::loadSourceBuffer(path, sm_, from);
    if (!loaded)
        return loaded.takeError();
    trace(from, "running script `" + path + "`");

    const support::SourceLoc scriptLoc{loaded.value().fileId};
    auto ran = state.engine.execute(loaded.value().buffer, path, scriptLoc);
    if (!ran)
    {
        state.pending.clear();
        return ran;
    }
    drainPending(state, support::parentDirectory(path), scriptLoc);
    return {};
}

void Preprocessor::addResources(BuildState &state,
                                const support::GlobPattern &pattern,
                                const std::string &dest,
                                const std::string &baseDir,
                                support::SourceLoc loc)
{
    auto expansion = support::expandGlob(pattern, baseDir);

    for (const auto &problem : expansion.errors)
    {
        diags_.report(support::makeWarning(loc,
                                           "failed to read resources for `" + pattern.text() +
                                               "`: " + problem,
                                           std::string(diag::GlobEntryUnreadable)));
    }

    for (const auto &match : expansion.matches)
    {
        const std::string name = support::basename(match);
        if (name.empty() || name == "." || name == "..")
        {
            diags_.report(support::makeWarning(loc,
                                               "resource `" + match + "` does not have a file name",
                                               std::string(diag::UnnamedMatch)));
            continue;
        }

        std::string destFile = support::joinPath(dest, name);
        if (const auto *existing = state.resources.find(destFile))
        {
            diags_.report(support::makeWarning(loc,
                                               "resource `" + match + "` ignored: `" + destFile +
                                                   "` is already provided by `" +
                                                   existing->source + "`",
                                               std::string(diag::ResourceOverwrite)));
            continue;
        }

        trace(loc, "resource `" + destFile + "` <- `" + match + "`");
        state.resources.add(std::move(destFile), match);
    }
}

void Preprocessor::drainPending(BuildState &state, const std::string &baseDir, support::SourceLoc loc)
{
    for (const auto &pending : state.pending.drain())
        addResources(state, pending.pattern, pending.dest, baseDir, loc);
}

void Preprocessor::trace(support::SourceLoc loc, std::string message)
{
    if (options_.trace)
        diags_.report(support::makeNote(loc, std::move(message)));
}

} // namespace themebuild::build
