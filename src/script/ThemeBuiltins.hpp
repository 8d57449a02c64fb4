//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: script/ThemeBuiltins.hpp
// Purpose: Theme-specific builtins: color construction, blend-mode encoding,
//          environment lookup and resource registration.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "script/ResourceQueue.hpp"
#include "support/diag_expected.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

struct lua_State;

namespace themebuild::script
{

/// @brief Host hook answering `env(name)`; nullopt means "not set".
using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

/// @brief Receiver of `print()` output, one call per `print`.
using PrintSink = std::function<void(std::string_view)>;

/// @brief EnvLookup backed by the process environment.
EnvLookup processEnvironment();

/// @brief Host services reachable from builtins.
/// @details Registered functions keep a pointer to this object as an upvalue,
///          so it must outlive the lua_State.
struct ScriptHost
{
    ResourceQueue &queue;
    EnvLookup env;
    PrintSink print;
};

/// @brief Register `color rgb rgba blend env resource` as globals.
/// @pre openColorType() has run on @p L.
void openThemeBuiltins(lua_State *L, ScriptHost &host);

/// @brief Encode a blend mode as `0x20000 | round(fraction * 256) << 8 | mode`.
/// @return The 18-bit value, or an error naming the invalid mode or fraction.
support::Expected<int64_t> encodeBlend(std::string_view mode, double fraction);

} // namespace themebuild::script
