//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/script/LuaSandbox.cpp
// Purpose: Allow-list construction of the script environment.
//
//===----------------------------------------------------------------------===//

#include "script/LuaSandbox.hpp"

#include "script/ColorUserdata.hpp"
#include "script/LuaCall.hpp"

#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>

namespace themebuild::script
{
namespace
{
struct Library
{
    const char *name;
    lua_CFunction open;
};

constexpr Library kLibraries[] = {
    {LUA_GNAME, luaopen_base},
    {LUA_COLIBNAME, luaopen_coroutine},
    {LUA_TABLIBNAME, luaopen_table},
    {LUA_STRLIBNAME, luaopen_string},
    {LUA_MATHLIBNAME, luaopen_math},
    {LUA_UTF8LIBNAME, luaopen_utf8},
};

constexpr const char *kOsFunctions[] = {"clock", "date", "difftime", "time"};

/// Every global a script may see; the rest of the base library is dropped.
constexpr std::string_view kGlobals[] = {
    // base
    "_G", "_VERSION", "assert", "collectgarbage", "error", "getmetatable", "ipairs", "load",
    "next", "pairs", "pcall", "print", "rawequal", "rawget", "rawlen", "rawset", "select",
    "setmetatable", "tonumber", "tostring", "type", "xpcall",
    // libraries
    "coroutine", "math", "os", "string", "table", "utf8",
    // theme builtins
    "color", "rgb", "rgba", "blend", "env", "resource",
};

bool isAllowedGlobal(std::string_view name)
{
    for (std::string_view allowed : kGlobals)
    {
        if (allowed == name)
            return true;
    }
    return false;
}

/// Clear every global whose name is not in kGlobals.
void pruneGlobals(lua_State *L)
{
    lua_pushglobaltable(L);
    const int globals = lua_gettop(L);
    lua_pushnil(L);
    while (lua_next(L, globals) != 0)
    {
        lua_pop(L, 1);
        size_t len = 0;
        const char *name = lua_type(L, -1) == LUA_TSTRING ? lua_tolstring(L, -1, &len) : nullptr;
        if (name && isAllowedGlobal(std::string_view(name, len)))
            continue;
        // Clearing an existing field during traversal is allowed.
        lua_pushvalue(L, -1);
        lua_pushnil(L);
        lua_rawset(L, globals);
    }
    lua_pop(L, 1);
}

/// `load` that refuses binary chunks; the original `load` is upvalue 1.
int textOnlyLoad(lua_State *L)
{
    int nargs = lua_gettop(L);
    if (nargs < 3)
    {
        lua_settop(L, 3);
        nargs = 3;
    }
    lua_pushliteral(L, "t");
    lua_replace(L, 3);
    lua_pushvalue(L, lua_upvalueindex(1));
    lua_insert(L, 1);
    lua_call(L, nargs, LUA_MULTRET);
    return lua_gettop(L);
}

/// `print` joining `tostring` of each argument with tabs.
int sandboxPrint(lua_State *L)
{
    const int nargs = lua_gettop(L);
    luaL_Buffer buf;
    luaL_buffinit(L, &buf);
    for (int i = 1; i <= nargs; ++i)
    {
        if (i > 1)
            luaL_addchar(&buf, '\t');
        luaL_tolstring(L, i, nullptr);
        luaL_addvalue(&buf);
    }
    luaL_pushresult(&buf);

    auto *host = static_cast<ScriptHost *>(lua_touserdata(L, lua_upvalueindex(1)));
    size_t len = 0;
    const char *text = lua_tolstring(L, -1, &len);
    if (host->print)
        host->print(std::string_view(text, len));
    return 0;
}

/// Runs under lua_pcall with the ScriptHost as its only argument.
int populate(lua_State *L)
{
    auto *host = static_cast<ScriptHost *>(lua_touserdata(L, 1));

    for (const Library &lib : kLibraries)
    {
        luaL_requiref(L, lib.name, lib.open, 1);
        lua_pop(L, 1);
    }

    luaL_requiref(L, LUA_OSLIBNAME, luaopen_os, 0);
    lua_createtable(L, 0, static_cast<int>(std::size(kOsFunctions)));
    for (const char *name : kOsFunctions)
    {
        lua_getfield(L, -2, name);
        lua_setfield(L, -2, name);
    }
    lua_setglobal(L, LUA_OSLIBNAME);
    lua_pop(L, 1);

    lua_getglobal(L, "load");
    lua_pushcclosure(L, textOnlyLoad, 1);
    lua_setglobal(L, "load");

    lua_pushlightuserdata(L, host);
    lua_pushcclosure(L, sandboxPrint, 1);
    lua_setglobal(L, "print");

    openColorType(L);
    openThemeBuiltins(L, *host);
    pruneGlobals(L);
    return 0;
}
} // namespace

void openSandbox(lua_State *L, ScriptHost &host)
{
    lua_pushcfunction(L, populate);
    lua_pushlightuserdata(L, &host);
    if (lua_pcall(L, 1, 0, 0) != LUA_OK)
    {
        std::string message = lua_tostring(L, -1) ? lua_tostring(L, -1) : "unknown error";
        lua_pop(L, 1);
        throw std::runtime_error("cannot initialize the script environment: " + message);
    }
}

} // namespace themebuild::script
