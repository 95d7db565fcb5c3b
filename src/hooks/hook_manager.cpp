#include "hook_manager.hpp"
#include "lua_sandbox.hpp"
#include "../utils/logger.h"

#include <fstream>
#include <mutex>
#include <sstream>

namespace {

constexpr const char* kRequestEntryPoint = "processRequest";
constexpr const char* kResponseEntryPoint = "processResponse";

const char* const kSampleScript = R"(-- tracegate hook script
-- Both functions are optional; define at least one.
-- headers maps lower-case names to lists of values.

local json = require("json")

function processRequest(body, headers)
    -- local payload = json.decode(body)
    return body, headers
end

function processResponse(body, headers)
    -- headers["x-tracegate"] = {"1"}
    return body, headers
end
)";

} // namespace

const char* to_string(LoadFailure p_reason) {
    switch (p_reason) {
        case LoadFailure::Unreadable: return "unreadable";
        case LoadFailure::SyntaxInvalid: return "syntax-invalid";
        case LoadFailure::NoEntryPoints: return "no-entry-points";
    }
    return "unknown";
}

HookManager::HookManager(std::chrono::milliseconds p_script_budget)
    : script_budget_(p_script_budget) {}

void HookManager::load_file(const std::string& p_path) {
    std::ifstream in(p_path, std::ios::binary);
    if (!in) {
        throw HookLoadError(LoadFailure::Unreadable, "failed to read Lua script file " + p_path);
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        throw HookLoadError(LoadFailure::Unreadable, "failed to read Lua script file " + p_path);
    }

    load_source(contents.str(), p_path);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    script_path_ = p_path;
}

void HookManager::load_source(const std::string& p_source, const std::string& p_chunk_name) {
    auto source = std::make_shared<HookSource>();
    source->text = p_source;
    source->chunk_name = p_chunk_name;

    {
        LuaSandbox trial(script_budget_);
        trial.load(source->text, source->chunk_name);
        source->has_request = trial.has_function(kRequestEntryPoint);
        source->has_response = trial.has_function(kResponseEntryPoint);
    }

    if (!source->has_request && !source->has_response) {
        throw HookLoadError(LoadFailure::NoEntryPoints,
                            "Lua script must define at least one of 'processRequest' or 'processResponse' functions");
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        source_ = std::move(source);
    }
    LOG_INFO("Lua hook script loaded from " << p_chunk_name
             << " (processRequest: " << std::boolalpha << has_request_hook()
             << ", processResponse: " << has_response_hook() << ")");
}

bool HookManager::try_load_file(const std::string& p_path) {
    try {
        load_file(p_path);
        return true;
    } catch (const HookLoadError& e) {
        LOG_ERROR("Hook script " << p_path << " not loaded (" << to_string(e.reason()) << "): " << e.what());
        return false;
    }
}

bool HookManager::reload() {
    std::string path = script_path();
    if (path.empty()) {
        return false;
    }
    load_file(path);
    return true;
}

HookResult HookManager::run_request_hook(const std::string& p_body, const HeaderMap& p_headers) const {
    return run_hook(kRequestEntryPoint, &HookSource::has_request, p_body, p_headers);
}

HookResult HookManager::run_response_hook(const std::string& p_body, const HeaderMap& p_headers) const {
    return run_hook(kResponseEntryPoint, &HookSource::has_response, p_body, p_headers);
}

HookResult HookManager::run_hook(const char* p_entry_point, bool HookSource::*p_present,
                                 const std::string& p_body, const HeaderMap& p_headers) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (!source_ || !((*source_).*p_present)) {
        return HookResult{p_body, p_headers};
    }

    try {
        LuaSandbox sandbox(script_budget_);
        sandbox.load(source_->text, source_->chunk_name);
        HookResult result = sandbox.call_hook(p_entry_point, p_body, p_headers);
        LOG_DEBUG("Lua " << p_entry_point << " hook executed successfully");
        return result;
    } catch (const HookLoadError& e) {
        LOG_ERROR("Error executing " << p_entry_point << " hook script: " << e.what());
    } catch (const HookError& e) {
        LOG_ERROR("Error calling " << p_entry_point << " function: " << e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Lua engine failure in " << p_entry_point << ": " << e.what());
    }
    return HookResult{p_body, p_headers};
}

bool HookManager::enabled() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return source_ != nullptr;
}

bool HookManager::has_request_hook() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return source_ && source_->has_request;
}

bool HookManager::has_response_hook() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return source_ && source_->has_response;
}

std::string HookManager::script_path() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return script_path_;
}

const char* HookManager::sample_script() {
    return kSampleScript;
}
