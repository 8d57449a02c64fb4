//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/script/ScriptEngine.cpp
// Purpose: Lua state lifetime and the error-to-diagnostic boundary.
//
//===----------------------------------------------------------------------===//

#include "script/ScriptEngine.hpp"

#include "script/LuaSandbox.hpp"
#include "support/DiagnosticCodes.hpp"

#include <lua.hpp>

#include <cctype>
#include <new>
#include <utility>

namespace themebuild::script
{

void ScriptEngine::StateCloser::operator()(lua_State *L) const
{
    lua_close(L);
}

ScriptEngine::ScriptEngine(ResourceQueue &queue, EnvLookup env, PrintSink print)
    : host_{queue, std::move(env), std::move(print)}, state_(luaL_newstate())
{
    if (!state_)
        throw std::bad_alloc();
    openSandbox(state_.get(), host_);
}

std::string ScriptEngine::expressionChunkName(std::string_view source)
{
    constexpr size_t kMaxShown = 40;
    const size_t eol = source.find_first_of("\r\n");
    std::string_view first = source.substr(0, eol);
    bool truncated = eol != std::string_view::npos;
    if (first.size() > kMaxShown)
    {
        first = first.substr(0, kMaxShown);
        truncated = true;
    }
    std::string name = "[string \"";
    name.append(first);
    if (truncated)
        name += "...";
    name += "\"]";
    return name;
}

namespace
{
/// Line number following `prefix:` at the start of @p message, else the
/// first `:<digits>:` anywhere in it; 0 when there is none.
uint32_t errorLine(const std::string &message, const std::string &chunkName)
{
    size_t pos = std::string::npos;
    if (message.compare(0, chunkName.size() + 1, chunkName + ":") == 0)
        pos = chunkName.size() + 1;
    else
    {
        for (size_t i = message.find(':'); i != std::string::npos; i = message.find(':', i + 1))
        {
            size_t j = i + 1;
            while (j < message.size() && std::isdigit(static_cast<unsigned char>(message[j])))
                ++j;
            if (j > i + 1 && j < message.size() && message[j] == ':')
            {
                pos = i + 1;
                break;
            }
        }
    }
    if (pos == std::string::npos)
        return 0;

    uint32_t line = 0;
    while (pos < message.size() && std::isdigit(static_cast<unsigned char>(message[pos])))
        line = line * 10 + static_cast<uint32_t>(message[pos++] - '0');
    return line;
}

/// Pop the error object on top of @p L and render it as text.
std::string popErrorMessage(lua_State *L)
{
    std::string message;
    if (lua_type(L, -1) == LUA_TSTRING || lua_type(L, -1) == LUA_TNUMBER)
    {
        size_t len = 0;
        const char *s = lua_tolstring(L, -1, &len);
        message.assign(s, len);
    }
    else
    {
        message = std::string("(error object is a ") + luaL_typename(L, -1) + " value)";
    }
    lua_pop(L, 1);
    return message;
}

/// Attach the expression location, keeping the parsed line when it has none.
support::SourceLoc locate(support::SourceLoc loc, uint32_t line)
{
    if (!loc.hasLine() && line > 0)
        loc.line = line;
    return loc;
}
} // namespace

support::Expected<void> ScriptEngine::load(std::string_view source,
                                           const std::string &chunkName,
                                           support::SourceLoc loc)
{
    lua_State *L = state_.get();
    const std::string name = "=" + chunkName;
    if (luaL_loadbufferx(L, source.data(), source.size(), name.c_str(), "t") == LUA_OK)
        return {};

    std::string message = popErrorMessage(L);
    const uint32_t line = errorLine(message, chunkName);
    return support::makeError(locate(loc, line), std::move(message), std::string(diag::ScriptSyntax));
}

support::Expected<Value> ScriptEngine::call(const std::string &chunkName, support::SourceLoc loc)
{
    lua_State *L = state_.get();
    const int base = lua_gettop(L) - 1;
    if (lua_pcall(L, 0, 1, 0) != LUA_OK)
    {
        std::string message = popErrorMessage(L);
        lua_settop(L, base);
        const uint32_t line = errorLine(message, chunkName);
        return support::makeError(locate(loc, line), std::move(message), std::string(diag::ScriptRuntime));
    }

    Value result = readValue(L, -1);
    lua_settop(L, base);
    return result;
}

support::Expected<Value> ScriptEngine::evaluate(std::string_view source,
                                                const std::string &chunkName,
                                                support::SourceLoc loc)
{
    const std::string asReturn = "return " + std::string(source);
    if (!load(asReturn, chunkName, loc))
    {
        auto block = load(source, chunkName, loc);
        if (!block)
            return block.takeError();
    }
    return call(chunkName, loc);
}

support::Expected<void> ScriptEngine::execute(std::string_view source,
                                              const std::string &chunkName,
                                              support::SourceLoc loc)
{
    auto chunk = load(source, chunkName, loc);
    if (!chunk)
        return chunk.takeError();

    auto result = call(chunkName, loc);
    if (!result)
        return result.takeError();
    return {};
}

void ScriptEngine::setGlobal(const std::string &name, const Value &value)
{
    lua_State *L = state_.get();
    pushValue(L, value);
    lua_setglobal(L, name.c_str());
}

Value ScriptEngine::global(const std::string &name) const
{
    lua_State *L = state_.get();
    lua_getglobal(L, name.c_str());
    Value value = readValue(L, -1);
    lua_pop(L, 1);
    return value;
}

} // namespace themebuild::script
