#pragma once

#include "hook_types.hpp"

#include <chrono>
#include <memory>
#include <shared_mutex>
#include <string>

struct HookSource {
    std::string text;
    std::string chunk_name;
    bool has_request = false;
    bool has_response = false;
};

// Owns the currently loaded hook script and runs it for each exchange.
//
// Loading takes the lock exclusively; hook runs share it, so a reload waits for
// in-flight invocations and never exposes a half-installed script. Every run
// happens in a fresh LuaSandbox, and any failure falls back to the unmodified
// input.
class HookManager {
public:
    explicit HookManager(std::chrono::milliseconds p_script_budget = std::chrono::seconds(10));

    // Throws HookLoadError. The previous script stays active on failure.
    void load_file(const std::string& p_path);
    void load_source(const std::string& p_source, const std::string& p_chunk_name);
    // load_file() that logs a failure instead of throwing. Used at startup,
    // where a bad script leaves the gateway running without hooks.
    bool try_load_file(const std::string& p_path);

    // Re-reads the file given to the last successful load_file().
    // Returns false when there is nothing to reload.
    bool reload();

    HookResult run_request_hook(const std::string& p_body, const HeaderMap& p_headers) const;
    HookResult run_response_hook(const std::string& p_body, const HeaderMap& p_headers) const;

    bool enabled() const;
    bool has_request_hook() const;
    bool has_response_hook() const;
    std::string script_path() const;

    static const char* sample_script();

private:
    HookResult run_hook(const char* p_entry_point, bool HookSource::*p_present,
                        const std::string& p_body, const HeaderMap& p_headers) const;

    mutable std::shared_mutex mutex_;
    std::shared_ptr<const HookSource> source_;
    std::string script_path_;
    std::chrono::milliseconds script_budget_;
};
