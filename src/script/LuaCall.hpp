//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: script/LuaCall.hpp
// Purpose: Boundary between C++ builtins and the Lua error mechanism.
// Key invariants: lua_error is raised only after every C++ object of the
//                 failing builtin has been destroyed; a BuiltinError never
//                 crosses into the interpreter.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <lua.hpp>

#include <stdexcept>
#include <string>

namespace themebuild::script
{

/// @brief Script-level failure raised by a builtin, reported at the caller.
class BuiltinError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/// @brief lua_CFunction adapter turning a BuiltinError thrown by @p Impl into
///        a Lua error prefixed with the calling chunk and line.
/// @details Impl must run its luaL_check* calls before constructing objects
///          with destructors, since those raise through the interpreter.
template <int (*Impl)(lua_State *)> int protect(lua_State *L)
{
    try
    {
        return Impl(L);
    }
    catch (const BuiltinError &e)
    {
        luaL_where(L, 1);
        lua_pushstring(L, e.what());
        lua_concat(L, 2);
    }
    return lua_error(L);
}

/// @brief Push a std::string without relying on NUL termination.
inline void pushString(lua_State *L, const std::string &s)
{
    lua_pushlstring(L, s.data(), s.size());
}

} // namespace themebuild::script
