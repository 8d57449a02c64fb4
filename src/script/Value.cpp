//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/script/Value.cpp
// Purpose: Conversion between Lua stack slots and Value snapshots.
//
//===----------------------------------------------------------------------===//

#include "script/Value.hpp"

#include "script/ColorUserdata.hpp"

#include <lua.hpp>

namespace themebuild::script
{

const char *Value::typeName() const
{
    switch (kind_)
    {
        case Kind::Nil:
            return "nil";
        case Kind::Boolean:
            return "boolean";
        case Kind::Integer:
        case Kind::Number:
            return "number";
        case Kind::String:
            return "string";
        case Kind::Function:
            return "function";
        case Kind::Table:
            return "table";
        case Kind::Color:
        case Kind::Userdata:
            return "userdata";
        case Kind::Thread:
            return "thread";
    }
    return "?";
}

Value readValue(lua_State *L, int idx)
{
    switch (lua_type(L, idx))
    {
        case LUA_TBOOLEAN:
            return Value::boolean(lua_toboolean(L, idx) != 0);
        case LUA_TNUMBER:
            if (lua_isinteger(L, idx))
                return Value::integer(static_cast<int64_t>(lua_tointeger(L, idx)));
            return Value::number(static_cast<double>(lua_tonumber(L, idx)));
        case LUA_TSTRING:
        {
            size_t len = 0;
            const char *s = lua_tolstring(L, idx, &len);
            return Value::string(std::string(s, len));
        }
        case LUA_TUSERDATA:
            if (const color::Color *c = testColor(L, idx))
                return Value::color(*c);
            return Value::opaque(Value::Kind::Userdata);
        case LUA_TLIGHTUSERDATA:
            return Value::opaque(Value::Kind::Userdata);
        case LUA_TFUNCTION:
            return Value::opaque(Value::Kind::Function);
        case LUA_TTABLE:
            return Value::opaque(Value::Kind::Table);
        case LUA_TTHREAD:
            return Value::opaque(Value::Kind::Thread);
        default:
            return Value();
    }
}

void pushValue(lua_State *L, const Value &value)
{
    switch (value.kind())
    {
        case Value::Kind::Boolean:
            lua_pushboolean(L, value.asBoolean() ? 1 : 0);
            return;
        case Value::Kind::Integer:
            lua_pushinteger(L, static_cast<lua_Integer>(value.asInteger()));
            return;
        case Value::Kind::Number:
            lua_pushnumber(L, static_cast<lua_Number>(value.asNumber()));
            return;
        case Value::Kind::String:
            lua_pushlstring(L, value.asString().data(), value.asString().size());
            return;
        case Value::Kind::Color:
            pushColor(L, value.asColor());
            return;
        case Value::Kind::Nil:
        case Value::Kind::Function:
        case Value::Kind::Table:
        case Value::Kind::Userdata:
        case Value::Kind::Thread:
            break;
    }
    lua_pushnil(L);
}

} // namespace themebuild::script
