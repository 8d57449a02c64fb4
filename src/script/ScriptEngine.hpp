//===----------------------------------------------------------------------===//
//
// Part of the Themebuild project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: script/ScriptEngine.hpp
// Purpose: Sandboxed Lua state used by the preprocessor: load, run and
//          convert failures into diagnostics.
// Key invariants: The global environment contains only the allow-listed
//                 libraries and the theme builtins.  No Lua error escapes
//                 evaluate() or execute(); the stack is balanced after each.
// Ownership/Lifetime: The engine owns its lua_State and references the
//                     ResourceQueue passed at construction; the queue must
//                     outlive the engine.  Not copyable or movable because
//                     registered builtins point at the engine's host record.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "script/ResourceQueue.hpp"
#include "script/ThemeBuiltins.hpp"
#include "script/Value.hpp"
#include "support/diag_expected.hpp"

#include <memory>
#include <string>
#include <string_view>

struct lua_State;

namespace themebuild::script
{

class ScriptEngine
{
  public:
    /// @param queue Destination of `resource()` registrations.
    /// @param env Backing store for `env()`.
    /// @param print Receiver of `print()` output; dropped when empty.
    explicit ScriptEngine(ResourceQueue &queue,
                          EnvLookup env = processEnvironment(),
                          PrintSink print = {});

    ScriptEngine(const ScriptEngine &) = delete;
    ScriptEngine &operator=(const ScriptEngine &) = delete;

    /// @brief Evaluate @p source as an expression, falling back to a block.
    /// @details The source is first compiled as `return <source>`; when that
    ///          does not compile it is compiled as a statement block whose
    ///          result is nil unless it returns.
    /// @param loc Location of the expression; attached to every diagnostic.
    /// @return First result value (nil when there is none).
    support::Expected<Value> evaluate(std::string_view source,
                                      const std::string &chunkName,
                                      support::SourceLoc loc = {});

    /// @brief Run @p source as a statement block, e.g. a script file.
    support::Expected<void> execute(std::string_view source,
                                    const std::string &chunkName,
                                    support::SourceLoc loc = {});

    /// @brief Assign a global; opaque snapshots assign nil.
    void setGlobal(const std::string &name, const Value &value);

    Value global(const std::string &name) const;

    /// @brief Chunk name for inline source: `[string "first line..."]`.
    static std::string expressionChunkName(std::string_view source);

  private:
    struct StateCloser
    {
        void operator()(lua_State *L) const;
    };

    /// Compile @p source and leave the chunk on the stack.
    support::Expected<void> load(std::string_view source,
                                 const std::string &chunkName,
                                 support::SourceLoc loc);

    /// Call the chunk on top of the stack, keeping at most one result.
    support::Expected<Value> call(const std::string &chunkName, support::SourceLoc loc);

    // Declared before the state so builtins never see a dangling host.
    ScriptHost host_;
    std::unique_ptr<lua_State, StateCloser> state_;
};

} // namespace themebuild::script
