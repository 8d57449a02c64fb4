//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: script/ColorUserdata.hpp
// Purpose: Expose color::Color to scripts as a full userdata with methods
//          (`arr hex with_alpha to_rgb negative`) and `+ - == tostring`.
// Ownership/Lifetime: Colors are copied into Lua-owned memory; Color is
//                     trivially destructible, so no finalizer is registered.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "color/Color.hpp"

struct lua_State;

namespace themebuild::script
{

/// @brief Create the color metatable in the registry; call once per state.
void openColorType(lua_State *L);

/// @brief Push a new color userdata holding a copy of @p c.
void pushColor(lua_State *L, const color::Color &c);

/// @return The color at @p idx, or nullptr when it is anything else.
const color::Color *testColor(lua_State *L, int idx);

/// @brief Like testColor but raises "color expected" for other values.
const color::Color &checkColor(lua_State *L, int idx);

} // namespace themebuild::script
