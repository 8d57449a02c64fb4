//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: script/Value.hpp
// Purpose: Host-side snapshot of a Lua value as produced by an expression.
// Key invariants: Scalars and colors carry their payload; functions, tables,
//                 other userdata and threads carry only their kind.
// Ownership/Lifetime: Plain value type; a snapshot never references the
//                     lua_State it was read from.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "color/Color.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

struct lua_State;

namespace themebuild::script
{

class Value
{
  public:
    enum class Kind
    {
        Nil,
        Boolean,
        Integer,
        Number,
        String,
        Color,
        Function,
        Table,
        Userdata,
        Thread,
    };

    Value() = default;

    static Value boolean(bool b)
    {
        return Value(Kind::Boolean, b);
    }

    static Value integer(int64_t i)
    {
        return Value(Kind::Integer, i);
    }

    static Value number(double d)
    {
        return Value(Kind::Number, d);
    }

    static Value string(std::string s)
    {
        return Value(Kind::String, std::move(s));
    }

    static Value color(const color::Color &c)
    {
        return Value(Kind::Color, c);
    }

    /// @brief Payload-free stand-in for a function, table, userdata or thread.
    static Value opaque(Kind kind)
    {
        return Value(kind, std::monostate{});
    }

    [[nodiscard]] Kind kind() const
    {
        return kind_;
    }

    [[nodiscard]] bool isNil() const
    {
        return kind_ == Kind::Nil;
    }

    [[nodiscard]] bool is(Kind k) const
    {
        return kind_ == k;
    }

    /// @brief True for values that exist only inside the interpreter.
    [[nodiscard]] bool isOpaque() const
    {
        return kind_ == Kind::Function || kind_ == Kind::Table || kind_ == Kind::Userdata ||
               kind_ == Kind::Thread;
    }

    bool asBoolean() const
    {
        return std::get<bool>(data_);
    }

    int64_t asInteger() const
    {
        return std::get<int64_t>(data_);
    }

    double asNumber() const
    {
        return std::get<double>(data_);
    }

    const std::string &asString() const
    {
        return std::get<std::string>(data_);
    }

    const color::Color &asColor() const
    {
        return std::get<color::Color>(data_);
    }

    /// @brief Name as returned by Lua's `type()`; colors are "userdata".
    [[nodiscard]] const char *typeName() const;

  private:
    using Storage = std::variant<std::monostate, bool, int64_t, double, std::string, color::Color>;

    template <typename T> Value(Kind kind, T &&payload) : kind_(kind), data_(std::forward<T>(payload))
    {
    }

    Kind kind_ = Kind::Nil;
    Storage data_;
};

/// @brief Snapshot the value at stack index @p idx without converting it.
Value readValue(lua_State *L, int idx);

/// @brief Push @p value; opaque snapshots have no payload and push nil.
void pushValue(lua_State *L, const Value &value);

} // namespace themebuild::script
