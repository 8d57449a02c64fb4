//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/script/ColorUserdata.cpp
// Purpose: Color metatable, methods and metamethods.
//
//===----------------------------------------------------------------------===//

#include "script/ColorUserdata.hpp"

#include "script/LuaCall.hpp"

#include <new>
#include <type_traits>

namespace themebuild::script
{
namespace
{
constexpr const char *kColorType = "themebuild.Color";

static_assert(std::is_trivially_destructible_v<color::Color>);

uint8_t checkByte(lua_State *L, int idx)
{
    const lua_Integer v = luaL_checkinteger(L, idx);
    luaL_argcheck(L, v >= 0 && v <= 255, idx, "value out of range");
    return static_cast<uint8_t>(v);
}

/// Push the result of a checked color operation or report its failure.
void pushResult(lua_State *L, const color::Expected<color::Color> &result)
{
    if (!result)
        throw BuiltinError(result.error().message);
    pushColor(L, result.value());
}

int colorArr(lua_State *L)
{
    pushString(L, checkColor(L, 1).arr());
    return 1;
}

int colorHex(lua_State *L)
{
    pushString(L, checkColor(L, 1).hex());
    return 1;
}

int colorWithAlpha(lua_State *L)
{
    const color::Color &c = checkColor(L, 1);
    pushColor(L, c.withAlpha(checkByte(L, 2)));
    return 1;
}

int colorToRgb(lua_State *L)
{
    pushColor(L, checkColor(L, 1).toRgb());
    return 1;
}

int colorNegative(lua_State *L)
{
    const color::Color &c = checkColor(L, 1);
    auto result = c.negative();
    if (!result)
        throw BuiltinError(result.error().message);
    lua_pushinteger(L, static_cast<lua_Integer>(result.value()));
    return 1;
}

int colorAdd(lua_State *L)
{
    const color::Color &a = checkColor(L, 1);
    const color::Color &b = checkColor(L, 2);
    pushResult(L, a.add(b));
    return 1;
}

int colorSub(lua_State *L)
{
    const color::Color &a = checkColor(L, 1);
    const color::Color &b = checkColor(L, 2);
    pushResult(L, a.sub(b));
    return 1;
}

int colorEq(lua_State *L)
{
    const color::Color *a = testColor(L, 1);
    const color::Color *b = testColor(L, 2);
    lua_pushboolean(L, a && b && *a == *b);
    return 1;
}

const luaL_Reg kMethods[] = {
    {"arr", protect<colorArr>},
    {"hex", protect<colorHex>},
    {"with_alpha", protect<colorWithAlpha>},
    {"to_rgb", protect<colorToRgb>},
    {"negative", protect<colorNegative>},
    {nullptr, nullptr},
};

const luaL_Reg kMetamethods[] = {
    {"__add", protect<colorAdd>},
    {"__sub", protect<colorSub>},
    {"__eq", colorEq},
    {"__tostring", protect<colorHex>},
    {nullptr, nullptr},
};
} // namespace

void openColorType(lua_State *L)
{
    luaL_newmetatable(L, kColorType);
    luaL_setfuncs(L, kMetamethods, 0);

    luaL_newlib(L, kMethods);
    lua_setfield(L, -2, "__index");

    // Scripts see "color" in type errors and cannot reach the metatable.
    lua_pushliteral(L, "color");
    lua_setfield(L, -2, "__name");
    lua_pushliteral(L, "color");
    lua_setfield(L, -2, "__metatable");

    lua_pop(L, 1);
}

void pushColor(lua_State *L, const color::Color &c)
{
    void *mem = lua_newuserdatauv(L, sizeof(color::Color), 0);
    new (mem) color::Color(c);
    luaL_setmetatable(L, kColorType);
}

const color::Color *testColor(lua_State *L, int idx)
{
    return static_cast<const color::Color *>(luaL_testudata(L, idx, kColorType));
}

const color::Color &checkColor(lua_State *L, int idx)
{
    const color::Color *c = testColor(L, idx);
    if (!c)
        luaL_typeerror(L, idx, "color");
    return *c;
}

} // namespace themebuild::script
