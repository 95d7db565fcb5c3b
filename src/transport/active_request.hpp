#pragma once

#include "common.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

enum class RequestState {
    Received,
    RequestHook,
    Forwarding,
    Streaming,
    Buffering,
    ResponseHook,
    Completed,
    Failed
};

const char* to_string(RequestState p_state);

// One proxied exchange between arrival and the end of its response.
class ActiveRequest {
public:
    ActiveRequest(uint64_t id, std::string method, std::string target, std::string peer);
    ~ActiveRequest();

    uint64_t get_id() const { return request_id_; }
    RequestState get_state() const { return state_; }
    void set_state(RequestState state);

    const std::string& method() const { return method_; }
    const std::string& target() const { return target_; }
    const std::string& peer() const { return peer_; }

    // Seconds since arrival.
    double elapsed() const;

private:
    uint64_t request_id_;
    std::atomic<RequestState> state_;
    std::chrono::steady_clock::time_point start_time_;
    std::string method_;
    std::string target_;
    std::string peer_;
};

class ActiveRequestManager {
public:
    static ActiveRequestManager& instance();

    std::shared_ptr<ActiveRequest> create_request(const std::string& method, const std::string& target,
                                                  const std::string& peer);
    void complete_request(uint64_t request_id, RequestState final_state = RequestState::Completed);

    size_t get_active_count() const;
    uint64_t get_total_count() const { return next_request_id_ - 1; }
    // In-flight requests as a JSON array, oldest first.
    json to_json() const;
    void log_statistics() const;

private:
    ActiveRequestManager() = default;
    uint64_t generate_request_id();

    mutable std::mutex mutex_;
    std::unordered_map<uint64_t, std::shared_ptr<ActiveRequest>> active_requests_;
    std::atomic<uint64_t> next_request_id_{1};
};
