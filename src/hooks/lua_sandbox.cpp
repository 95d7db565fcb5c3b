#include "lua_sandbox.hpp"
#include "../utils/logger.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <tuple>

namespace {

constexpr const char* kSandboxRegistryKey = "tracegate.sandbox";
constexpr int kInstructionsPerCheck = 10000;
constexpr int kMaxEncodeDepth = 128;

const char* type_name(const sol::object& p_value) {
    return lua_typename(p_value.lua_state(), static_cast<int>(p_value.get_type()));
}

// Lua's own number formatting: 2 stays "2", 2.5 stays "2.5".
std::string number_to_string(const sol::object& p_value) {
    lua_State* L = p_value.lua_state();
    p_value.push();
    std::size_t length = 0;
    const char* text = lua_tolstring(L, -1, &length);
    std::string out(text, length);
    lua_pop(L, 1);
    return out;
}

} // namespace

LuaSandbox::LuaSandbox(std::chrono::milliseconds p_budget)
    : budget_(p_budget) {
    lua_.open_libraries(sol::lib::base, sol::lib::package, sol::lib::coroutine,
                        sol::lib::string, sol::lib::table, sol::lib::math, sol::lib::utf8);
    restrict_environment();
    open_json_module();

    if (budget_.count() > 0) {
        lua_State* L = lua_.lua_state();
        lua_pushlightuserdata(L, this);
        lua_setfield(L, LUA_REGISTRYINDEX, kSandboxRegistryKey);
        lua_sethook(L, &LuaSandbox::instruction_hook, LUA_MASKCOUNT, kInstructionsPerCheck);
    }
}

void LuaSandbox::restrict_environment() {
    lua_["dofile"] = sol::lua_nil;
    lua_["loadfile"] = sol::lua_nil;
    lua_["string"]["dump"] = sol::lua_nil;
    lua_["package"]["loadlib"] = sol::lua_nil;
    lua_["package"]["path"] = "";
    lua_["package"]["cpath"] = "";

    // Text chunks only: precompiled bytecode is not verified by the VM.
    lua_.script(R"(
        local raw_load = load
        load = function(chunk, name, mode, ...)
            if select('#', ...) > 0 then
                return raw_load(chunk, name, 't', ...)
            end
            return raw_load(chunk, name, 't')
        end
    )", "=sandbox");
}

void LuaSandbox::open_json_module() {
    sol::table module = lua_.create_table();

    module.set_function("decode", [](sol::this_state p_state, const std::string& p_text) {
        sol::state_view lua(p_state);
        try {
            nlohmann::json value = nlohmann::json::parse(p_text);
            return std::make_tuple(json_to_lua(lua, value), sol::make_object(lua, sol::lua_nil));
        } catch (const nlohmann::json::exception& e) {
            return std::make_tuple(sol::make_object(lua, sol::lua_nil), sol::make_object(lua, std::string(e.what())));
        }
    });

    module.set_function("encode", [](sol::this_state p_state, sol::object p_value) {
        sol::state_view lua(p_state);
        try {
            std::string text = lua_to_json(p_value).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            return std::make_tuple(sol::make_object(lua, text), sol::make_object(lua, sol::lua_nil));
        } catch (const HookError& e) {
            return std::make_tuple(sol::make_object(lua, sol::lua_nil), sol::make_object(lua, std::string(e.what())));
        }
    });

    lua_["package"]["loaded"]["json"] = module;
}

void LuaSandbox::arm_deadline() {
    if (budget_.count() > 0) {
        deadline_ = std::chrono::steady_clock::now() + budget_;
        deadline_armed_ = true;
    }
}

void LuaSandbox::instruction_hook(lua_State* p_state, lua_Debug*) {
    lua_getfield(p_state, LUA_REGISTRYINDEX, kSandboxRegistryKey);
    auto* self = static_cast<LuaSandbox*>(lua_touserdata(p_state, -1));
    lua_pop(p_state, 1);
    if (self && self->deadline_armed_ && std::chrono::steady_clock::now() > self->deadline_) {
        luaL_error(p_state, "script exceeded its execution budget of %d ms",
                   static_cast<int>(self->budget_.count()));
    }
}

void LuaSandbox::load(const std::string& p_source, const std::string& p_chunk_name) {
    arm_deadline();
    sol::protected_function_result result =
        lua_.safe_script(p_source, sol::script_pass_on_error, "@" + p_chunk_name, sol::load_mode::text);
    disarm_deadline();

    if (!result.valid()) {
        sol::error err = result;
        throw HookLoadError(LoadFailure::SyntaxInvalid, err.what());
    }
}

bool LuaSandbox::has_function(const std::string& p_name) {
    sol::object value = lua_[p_name];
    return value.get_type() == sol::type::function;
}

HookResult LuaSandbox::call_hook(const std::string& p_name, const std::string& p_body, const HeaderMap& p_headers) {
    sol::object entry = lua_[p_name];
    if (entry.get_type() != sol::type::function) {
        throw HookError(p_name + " is not a function");
    }
    sol::protected_function fn = entry.as<sol::protected_function>();
    sol::table headers = headers_to_table(lua_, p_headers);

    arm_deadline();
    sol::protected_function_result result = fn(p_body, headers);
    disarm_deadline();

    if (!result.valid()) {
        sol::error err = result;
        throw HookError(p_name + " raised: " + err.what());
    }
    if (result.return_count() != 2) {
        throw HookError(p_name + " must return exactly 2 values, got " + std::to_string(result.return_count()));
    }

    sol::object body_value = result.get<sol::object>(0);
    sol::object headers_value = result.get<sol::object>(1);
    if (body_value.get_type() != sol::type::string) {
        throw HookError(p_name + " returned a " + type_name(body_value) + " body, expected string");
    }
    if (headers_value.get_type() != sol::type::table) {
        throw HookError(p_name + " returned " + type_name(headers_value) + " headers, expected table");
    }

    HookResult out;
    out.body = body_value.as<std::string>();
    out.headers = table_to_headers(headers_value.as<sol::table>());
    return out;
}

sol::table LuaSandbox::headers_to_table(sol::state_view p_lua, const HeaderMap& p_headers) {
    sol::table table = p_lua.create_table(0, static_cast<int>(p_headers.size()));
    for (const auto& [name, values] : p_headers) {
        sol::table list = p_lua.create_table(static_cast<int>(values.size()), 0);
        for (std::size_t i = 0; i < values.size(); ++i) {
            list[i + 1] = values[i];
        }
        table[name] = list;
    }
    return table;
}

HeaderMap LuaSandbox::table_to_headers(const sol::table& p_table) {
    HeaderMap headers;
    for (const auto& entry : p_table) {
        const sol::object& key = entry.first;
        const sol::object& value = entry.second;
        if (key.get_type() != sol::type::string) {
            throw HookError(std::string("header name must be a string, got ") + type_name(key));
        }
        const std::string name = key.as<std::string>();

        if (value.get_type() == sol::type::string) {
            headers.add(name, value.as<std::string>());
            continue;
        }
        if (value.get_type() != sol::type::table) {
            throw HookError("header '" + name + "' must be a string or a list of strings, got " + type_name(value));
        }

        sol::table list = value.as<sol::table>();
        HeaderMap::Values values;
        const std::size_t count = list.size();
        values.reserve(count);
        for (std::size_t i = 1; i <= count; ++i) {
            sol::object item = list[i];
            if (item.get_type() != sol::type::string && item.get_type() != sol::type::number) {
                throw HookError("header '" + name + "' has a " + type_name(item) + " value");
            }
            values.push_back(item.get_type() == sol::type::number ? number_to_string(item)
                                                                   : item.as<std::string>());
        }
        headers.set_values(name, std::move(values));
    }
    return headers;
}

sol::object LuaSandbox::json_to_lua(sol::state_view p_lua, const nlohmann::json& p_value) {
    using value_t = nlohmann::json::value_t;
    switch (p_value.type()) {
        case value_t::boolean:
            return sol::make_object(p_lua, p_value.get<bool>());
        case value_t::number_integer:
            return sol::make_object(p_lua, p_value.get<std::int64_t>());
        case value_t::number_unsigned: {
            auto v = p_value.get<std::uint64_t>();
            if (v <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return sol::make_object(p_lua, static_cast<std::int64_t>(v));
            }
            return sol::make_object(p_lua, static_cast<double>(v));
        }
        case value_t::number_float:
            return sol::make_object(p_lua, p_value.get<double>());
        case value_t::string:
            return sol::make_object(p_lua, p_value.get_ref<const std::string&>());
        case value_t::array: {
            sol::table table = p_lua.create_table(static_cast<int>(p_value.size()), 0);
            std::size_t index = 1;
            for (const auto& item : p_value) {
                table[index++] = json_to_lua(p_lua, item);
            }
            return sol::make_object(p_lua, table);
        }
        case value_t::object: {
            sol::table table = p_lua.create_table(0, static_cast<int>(p_value.size()));
            for (const auto& [key, item] : p_value.items()) {
                table[key] = json_to_lua(p_lua, item);
            }
            return sol::make_object(p_lua, table);
        }
        case value_t::null:
        default:
            return sol::make_object(p_lua, sol::lua_nil);
    }
}

nlohmann::json LuaSandbox::lua_to_json(const sol::object& p_value, int p_depth) {
    if (p_depth > kMaxEncodeDepth) {
        throw HookError("cannot encode: tables nested too deeply");
    }

    switch (p_value.get_type()) {
        case sol::type::none:
        case sol::type::lua_nil:
            return nullptr;
        case sol::type::boolean:
            return p_value.as<bool>();
        case sol::type::number: {
            const double d = p_value.as<double>();
            if (!std::isfinite(d)) {
                throw HookError("cannot encode non-finite number");
            }
            if (std::floor(d) == d && std::fabs(d) < 9007199254740992.0) {
                return static_cast<std::int64_t>(d);
            }
            return d;
        }
        case sol::type::string:
            return p_value.as<std::string>();
        case sol::type::table:
            break;
        default:
            throw HookError(std::string("cannot encode value of type ") + type_name(p_value));
    }

    sol::table table = p_value.as<sol::table>();
    std::size_t count = 0;
    bool string_keys = true;
    bool sequence_keys = true;
    for (const auto& entry : table) {
        ++count;
        const sol::object& key = entry.first;
        if (key.get_type() == sol::type::string) {
            sequence_keys = false;
        } else if (key.get_type() == sol::type::number) {
            string_keys = false;
            const double k = key.as<double>();
            if (k < 1 || std::floor(k) != k) {
                sequence_keys = false;
            }
        } else {
            string_keys = false;
            sequence_keys = false;
        }
    }

    // Empty tables encode as arrays.
    if (count == 0) {
        return nlohmann::json::array();
    }

    if (sequence_keys) {
        nlohmann::json array = nlohmann::json::array();
        auto& items = array.get_ref<nlohmann::json::array_t&>();
        items.resize(count);
        for (const auto& entry : table) {
            const double k = entry.first.as<double>();
            if (k > static_cast<double>(count)) {
                throw HookError("cannot encode sparse array");
            }
            items[static_cast<std::size_t>(k) - 1] = lua_to_json(entry.second, p_depth + 1);
        }
        return array;
    }

    if (!string_keys) {
        throw HookError("cannot encode table with mixed or invalid key types");
    }

    nlohmann::json object = nlohmann::json::object();
    for (const auto& entry : table) {
        object[entry.first.as<std::string>()] = lua_to_json(entry.second, p_depth + 1);
    }
    return object;
}
