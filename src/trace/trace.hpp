#pragma once

#include "../transport/header_map.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <string>

// One completed proxied exchange. Built once by the pipeline and never changed
// afterwards.
struct Trace {
    std::string id;
    std::chrono::system_clock::time_point timestamp;
    std::string method;
    std::string url;
    std::string status;
    double latency = 0.0; // seconds
    std::string session_id;
    HeaderMap request_headers;
    std::string request_body;
    std::string response_body;
};

// Empty optional fields (session_id, request_headers, request_body,
// response_body) are left out of the object.
void to_json(nlohmann::json& p_json, const Trace& p_trace);

// Serialized form sent to observers. Invalid UTF-8 is replaced, not rejected.
std::string trace_to_message(const Trace& p_trace);

// 16 lower-case hex characters from 8 random bytes.
std::string generate_trace_id();

// RFC 3339 UTC with nanosecond precision, e.g. 2024-05-01T10:00:00.123456789Z
std::string format_timestamp(std::chrono::system_clock::time_point p_time);

std::string streaming_placeholder(std::uint64_t p_bytes);
