#pragma once

#include "../transport/header_map.hpp"

#include <stdexcept>
#include <string>

struct HookResult {
    std::string body;
    HeaderMap headers;
};

// Failure inside a single hook invocation: script error, bad return shape,
// conversion failure or deadline overrun.
class HookError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class LoadFailure {
    Unreadable,
    SyntaxInvalid,
    NoEntryPoints
};

class HookLoadError : public std::runtime_error {
public:
    HookLoadError(LoadFailure p_reason, const std::string& p_message)
        : std::runtime_error(p_message), reason_(p_reason) {}

    LoadFailure reason() const { return reason_; }

private:
    LoadFailure reason_;
};

const char* to_string(LoadFailure p_reason);
