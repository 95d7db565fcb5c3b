#include "trace.hpp"

#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

void to_json(nlohmann::json& p_json, const Trace& p_trace) {
    p_json = {
        {"id", p_trace.id},
        {"timestamp", format_timestamp(p_trace.timestamp)},
        {"method", p_trace.method},
        {"url", p_trace.url},
        {"status", p_trace.status},
        {"latency", p_trace.latency}
    };
    if (!p_trace.session_id.empty()) {
        p_json["session_id"] = p_trace.session_id;
    }
    if (!p_trace.request_headers.empty()) {
        p_json["request_headers"] = p_trace.request_headers;
    }
    if (!p_trace.request_body.empty()) {
        p_json["request_body"] = p_trace.request_body;
    }
    if (!p_trace.response_body.empty()) {
        p_json["response_body"] = p_trace.response_body;
    }
}

std::string trace_to_message(const Trace& p_trace) {
    return nlohmann::json(p_trace).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string generate_trace_id() {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dis;
    std::ostringstream out;
    out << std::hex << std::setw(16) << std::setfill('0') << dis(gen);
    return out.str();
}

std::string format_timestamp(std::chrono::system_clock::time_point p_time) {
    auto since_epoch = p_time.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - seconds).count();
    if (nanos < 0) {
        seconds -= std::chrono::seconds(1);
        nanos += 1000000000;
    }

    std::time_t t = static_cast<std::time_t>(seconds.count());
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);

    std::ostringstream out;
    out << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(9) << std::setfill('0') << nanos << 'Z';
    return out.str();
}

std::string streaming_placeholder(std::uint64_t p_bytes) {
    return "[STREAMING RESPONSE - " + std::to_string(p_bytes) + " bytes]";
}
