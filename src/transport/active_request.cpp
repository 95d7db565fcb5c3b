#include "active_request.hpp"
#include "../utils/logger.h"

#include <algorithm>
#include <vector>

const char* to_string(RequestState p_state) {
    switch (p_state) {
        case RequestState::Received: return "received";
        case RequestState::RequestHook: return "request_hook";
        case RequestState::Forwarding: return "forwarding";
        case RequestState::Streaming: return "streaming";
        case RequestState::Buffering: return "buffering";
        case RequestState::ResponseHook: return "response_hook";
        case RequestState::Completed: return "completed";
        case RequestState::Failed: return "failed";
    }
    return "unknown";
}

ActiveRequest::ActiveRequest(uint64_t id, std::string method, std::string target, std::string peer)
    : request_id_(id), state_(RequestState::Received),
      start_time_(std::chrono::steady_clock::now()),
      method_(std::move(method)), target_(std::move(target)), peer_(std::move(peer)) {
    LOG_DEBUG("Created ActiveRequest " << request_id_ << " " << method_ << " " << target_);
}

ActiveRequest::~ActiveRequest() {
    LOG_DEBUG("Destroyed ActiveRequest " << request_id_);
}

void ActiveRequest::set_state(RequestState state) {
    state_ = state;
    LOG_DEBUG("Request " << request_id_ << " state: " << to_string(state));
}

double ActiveRequest::elapsed() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_).count();
}

ActiveRequestManager& ActiveRequestManager::instance() {
    static ActiveRequestManager instance;
    return instance;
}

std::shared_ptr<ActiveRequest> ActiveRequestManager::create_request(const std::string& method,
                                                                    const std::string& target,
                                                                    const std::string& peer) {
    uint64_t id = generate_request_id();
    auto request = std::make_shared<ActiveRequest>(id, method, target, peer);

    std::lock_guard<std::mutex> lock(mutex_);
    active_requests_[id] = request;

    LOG_DEBUG("Created request " << id << ", total active: " << active_requests_.size());
    return request;
}

void ActiveRequestManager::complete_request(uint64_t request_id, RequestState final_state) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_requests_.find(request_id);
    if (it != active_requests_.end()) {
        it->second->set_state(final_state);
        active_requests_.erase(it);
        LOG_DEBUG("Completed request " << request_id << ", remaining active: " << active_requests_.size());
    }
}

size_t ActiveRequestManager::get_active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_requests_.size();
}

json ActiveRequestManager::to_json() const {
    std::vector<std::shared_ptr<ActiveRequest>> requests;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, request] : active_requests_) {
            requests.push_back(request);
        }
    }
    std::sort(requests.begin(), requests.end(),
              [](const auto& a, const auto& b) { return a->get_id() < b->get_id(); });

    json result = json::array();
    for (const auto& request : requests) {
        result.push_back({
            {"id", request->get_id()},
            {"method", request->method()},
            {"target", request->target()},
            {"peer", request->peer()},
            {"state", to_string(request->get_state())},
            {"elapsed", request->elapsed()}
        });
    }
    return result;
}

void ActiveRequestManager::log_statistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    LOG_INFO("Active requests: " << active_requests_.size() << ", handled: " << (next_request_id_ - 1));
}

uint64_t ActiveRequestManager::generate_request_id() {
    return next_request_id_.fetch_add(1);
}
