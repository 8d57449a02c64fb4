//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/script/ThemeBuiltins.cpp
// Purpose: Color constructors, `blend`, `env` and `resource`.
//
//===----------------------------------------------------------------------===//

#include "script/ThemeBuiltins.hpp"

#include "script/ColorUserdata.hpp"
#include "script/LuaCall.hpp"
#include "support/DiagnosticCodes.hpp"
#include "support/path_utils.hpp"

#include <array>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <utility>

namespace themebuild::script
{
namespace
{
struct BlendMode
{
    std::string_view name;
    uint32_t code;
};

constexpr std::array<BlendMode, 6> kBlendModes{{
    {"normal", 0x00},
    {"add", 0x01},
    {"overlay", 0x04},
    {"multiply", 0x03},
    {"dodge", 0x02},
    {"hsv", 0xFE},
}};

/// Render a float the way `tostring` does.
std::string formatFraction(double d)
{
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.14g", d);
    std::string out(buf);
    if (std::isfinite(d) && out.find_first_of(".eE") == std::string::npos)
        out += ".0";
    return out;
}

ScriptHost &hostOf(lua_State *L)
{
    return *static_cast<ScriptHost *>(lua_touserdata(L, lua_upvalueindex(1)));
}

uint8_t checkByte(lua_State *L, int idx)
{
    const lua_Integer v = luaL_checkinteger(L, idx);
    luaL_argcheck(L, v >= 0 && v <= 255, idx, "value out of range");
    return static_cast<uint8_t>(v);
}

/// Validate a relative path or glob argument of `resource`.
std::string checkRelative(const char *literal)
{
    auto path = support::parseRelativePath(literal, {});
    if (!path)
        throw BuiltinError(path.error().message);
    return path.value();
}

int luaColor(lua_State *L)
{
    const lua_Integer value = luaL_checkinteger(L, 1);
    luaL_argcheck(L, value >= 0 && value <= 0xFFFFFFFFLL, 1, "value out of range");
    if (lua_isnoneornil(L, 2))
    {
        pushColor(L, color::Color::fromValue(static_cast<uint32_t>(value)));
        return 1;
    }

    const lua_Integer channels = luaL_checkinteger(L, 2);
    auto result = color::Color::withChannels(static_cast<uint32_t>(value), channels);
    if (!result)
        throw BuiltinError(result.error().message);
    pushColor(L, result.value());
    return 1;
}

int luaRgb(lua_State *L)
{
    const uint8_t r = checkByte(L, 1);
    const uint8_t g = checkByte(L, 2);
    const uint8_t b = checkByte(L, 3);
    pushColor(L, color::Color::rgb(r, g, b));
    return 1;
}

int luaRgba(lua_State *L)
{
    const uint8_t r = checkByte(L, 1);
    const uint8_t g = checkByte(L, 2);
    const uint8_t b = checkByte(L, 3);
    const uint8_t a = checkByte(L, 4);
    pushColor(L, color::Color::rgba(r, g, b, a));
    return 1;
}

int luaBlend(lua_State *L)
{
    const char *mode = luaL_checkstring(L, 1);
    const lua_Number fraction = luaL_checknumber(L, 2);
    auto result = encodeBlend(mode, static_cast<double>(fraction));
    if (!result)
        throw BuiltinError(result.error().message);
    lua_pushinteger(L, static_cast<lua_Integer>(result.value()));
    return 1;
}

int luaEnv(lua_State *L)
{
    const char *name = luaL_checkstring(L, 1);
    ScriptHost &host = hostOf(L);
    std::optional<std::string> value = host.env ? host.env(name) : std::nullopt;
    if (!value)
        throw BuiltinError("environment variable `" + std::string(name) + "` not found");
    pushString(L, *value);
    return 1;
}

int luaResource(lua_State *L)
{
    const int nargs = lua_gettop(L);
    if (nargs < 1 || nargs > 2)
        throw BuiltinError("resource(...) can only be called with 1 or 2 arguments");
    const char *destArg = nargs == 2 ? luaL_checkstring(L, 1) : nullptr;
    const char *patternArg = luaL_checkstring(L, nargs);

    std::string dest = destArg ? checkRelative(destArg) : std::string(".");
    if (support::isAbsoluteLiteral(patternArg))
        checkRelative(patternArg);

    auto glob = support::GlobPattern::compile(patternArg);
    if (!glob)
        throw BuiltinError(glob.error().message);
    hostOf(L).queue.push(PendingResource{std::move(glob.value()), std::move(dest)});
    return 0;
}

const luaL_Reg kBuiltins[] = {
    {"color", protect<luaColor>},
    {"rgb", protect<luaRgb>},
    {"rgba", protect<luaRgba>},
    {"blend", protect<luaBlend>},
    {"env", protect<luaEnv>},
    {"resource", protect<luaResource>},
    {nullptr, nullptr},
};
} // namespace

EnvLookup processEnvironment()
{
    return [](const std::string &name) -> std::optional<std::string>
    {
        const char *value = std::getenv(name.c_str());
        if (!value)
            return std::nullopt;
        return std::string(value);
    };
}

support::Expected<int64_t> encodeBlend(std::string_view mode, double fraction)
{
    if (!(fraction >= 0.0 && fraction <= 1.0))
    {
        return support::makeError({},
                                  "frac `" + formatFraction(fraction) +
                                      "` must be a value between 0.0 and 1.0",
                                  std::string(diag::ScriptRuntime));
    }

    const BlendMode *found = nullptr;
    for (const auto &m : kBlendModes)
    {
        if (m.name == mode)
            found = &m;
    }
    if (!found)
    {
        std::string names;
        for (const auto &m : kBlendModes)
        {
            if (!names.empty())
                names += ", ";
            names += "\"" + std::string(m.name) + "\"";
        }
        return support::makeError({},
                                  "mode `" + std::string(mode) + "` must be one of: " + names,
                                  std::string(diag::ScriptRuntime));
    }

    // The host stores the fraction as x / 256 and expects the nearest x.
    const auto numerator = static_cast<int64_t>(std::lround(static_cast<float>(fraction) * 256.0f));
    return int64_t{0x20000} | (numerator << 8) | static_cast<int64_t>(found->code);
}

void openThemeBuiltins(lua_State *L, ScriptHost &host)
{
    lua_pushglobaltable(L);
    lua_pushlightuserdata(L, &host);
    luaL_setfuncs(L, kBuiltins, 1);
    lua_pop(L, 1);
}

} // namespace themebuild::script
