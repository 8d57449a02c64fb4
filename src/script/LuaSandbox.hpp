//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: script/LuaSandbox.hpp
// Purpose: Populate a fresh lua_State with the allow-listed environment.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "script/ThemeBuiltins.hpp"

struct lua_State;

namespace themebuild::script
{

/// @brief Open the sandboxed libraries, the color type and the theme builtins.
/// @details Opened: base, coroutine, table, string, math, utf8, and an `os`
///          table holding only `clock date difftime time`; `load` is
///          restricted to text chunks and `print` goes to ScriptHost::print.
///          Afterwards every global outside a fixed list of names is cleared,
///          which drops `dofile`, `loadfile`, `warn` and anything a newer base
///          library adds. Never opened: io, package, debug.
/// @throws std::runtime_error when the state cannot be populated.
void openSandbox(lua_State *L, ScriptHost &host);

} // namespace themebuild::script
