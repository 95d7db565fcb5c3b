#pragma once

#include "hook_types.hpp"

#include <sol/sol.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

// A single-use Lua execution context. Every hook invocation constructs its own
// sandbox, runs the script in it and throws it away; nothing is shared between
// two instances.
//
// The state only carries the base, package, coroutine, string, table, math and
// utf8 libraries. File access, C module loading and binary chunks are removed.
// A JSON module is reachable through require("json").
class LuaSandbox {
public:
    // p_budget bounds the wall-clock time spent in Lua code for each load()
    // and call_hook(); zero disables the check.
    explicit LuaSandbox(std::chrono::milliseconds p_budget = std::chrono::milliseconds::zero());
    ~LuaSandbox() = default;

    LuaSandbox(const LuaSandbox&) = delete;
    LuaSandbox& operator=(const LuaSandbox&) = delete;

    // Runs the chunk once. Throws HookLoadError(SyntaxInvalid) when it cannot
    // be parsed or raises while executing.
    void load(const std::string& p_source, const std::string& p_chunk_name);

    bool has_function(const std::string& p_name);

    // Calls p_name(body, headers) and expects exactly (string, table) back.
    // Throws HookError on any failure.
    HookResult call_hook(const std::string& p_name, const std::string& p_body, const HeaderMap& p_headers);

    sol::state& state() { return lua_; }

    static sol::table headers_to_table(sol::state_view p_lua, const HeaderMap& p_headers);
    static HeaderMap table_to_headers(const sol::table& p_table);

    static sol::object json_to_lua(sol::state_view p_lua, const nlohmann::json& p_value);
    static nlohmann::json lua_to_json(const sol::object& p_value, int p_depth = 0);

private:
    void restrict_environment();
    void open_json_module();
    void arm_deadline();
    void disarm_deadline() { deadline_armed_ = false; }

    static void instruction_hook(lua_State* p_state, lua_Debug* p_debug);

    sol::state lua_;
    std::chrono::milliseconds budget_;
    std::chrono::steady_clock::time_point deadline_;
    bool deadline_armed_ = false;
};
