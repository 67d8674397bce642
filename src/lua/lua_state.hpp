#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

struct lua_State;

namespace isr::lua {

/// RAII wrapper around a Lua 5.0 state.
///
/// Only the base, table, string and math libraries are opened; config
/// scripts get no io or debug access.
class LuaState {
public:
    LuaState();
    ~LuaState();

    // Move-only
    LuaState(const LuaState&) = delete;
    LuaState& operator=(const LuaState&) = delete;
    LuaState(LuaState&& other) noexcept;
    LuaState& operator=(LuaState&& other) noexcept;

    lua_State* raw() const { return L_; }
    bool valid() const { return L_ != nullptr; }

    /// Register a C function as a global.
    void register_function(const char* name, int (*fn)(lua_State*));

    /// Execute a string of Lua code.
    Result<void> do_string(std::string_view code);

    /// Execute a file from the real filesystem.
    Result<void> do_file(const fs::path& path);

    /// Execute a buffer with a given chunk name.
    Result<void> do_buffer(const char* buf, size_t len, const char* name);

private:
    /// Run the chunk on top of the stack, popping the error message on failure.
    Result<void> call_chunk(int load_status);

    lua_State* L_ = nullptr;
};

} // namespace isr::lua
