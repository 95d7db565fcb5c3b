#include "trace_hub.hpp"
#include "../utils/logger.h"

#include <algorithm>

TraceHub::TraceHub(std::size_t p_history_size, std::size_t p_queue_capacity)
    : history_(p_history_size),
      queue_capacity_(std::max<std::size_t>(p_queue_capacity, 1)),
      history_capacity_(history_.capacity()) {
    worker_ = std::thread([this]() { run(); });
}

TraceHub::~TraceHub() {
    stop();
}

void TraceHub::register_observer(TraceObserverPtr p_observer) {
    post(Register{std::move(p_observer)});
}

void TraceHub::unregister_observer(TraceObserverPtr p_observer) {
    post(Unregister{std::move(p_observer)});
}

void TraceHub::broadcast(Trace p_trace) {
    if (!post(Broadcast{std::move(p_trace)})) {
        LOG_WARN("Trace hub stopped, trace discarded");
    }
}

std::vector<Trace> TraceHub::snapshot() {
    auto reply = std::make_shared<std::promise<std::vector<Trace>>>();
    auto result = reply->get_future();
    if (!post(Snapshot{reply})) {
        return {};
    }
    return result.get();
}

void TraceHub::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!accepting_) {
            return;
        }
        accepting_ = false;
        queue_.push_back(Stop{});
    }
    not_empty_.notify_one();
    not_full_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool TraceHub::post(Message p_message) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        not_full_.wait(lock, [this]() { return !accepting_ || queue_.size() < queue_capacity_; });
        if (!accepting_) {
            return false;
        }
        queue_.push_back(std::move(p_message));
    }
    not_empty_.notify_one();
    return true;
}

void TraceHub::run() {
    LOG_DEBUG("Trace hub worker started");
    while (!stopping_) {
        Message message;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            not_empty_.wait(lock, [this]() { return !queue_.empty(); });
            message = std::move(queue_.front());
            queue_.pop_front();
        }
        not_full_.notify_one();
        std::visit([this](auto& p_msg) { handle(p_msg); }, message);
    }

    for (auto& observer : observers_) {
        observer->close();
    }
    observers_.clear();
    observer_count_ = 0;
    LOG_DEBUG("Trace hub worker stopped");
}

void TraceHub::handle(Register& p_message) {
    auto& observer = p_message.observer;
    if (!observer || contains(observer)) {
        return;
    }

    // Replay before joining the broadcast set so no trace is seen twice.
    for (const auto& entry : history_.entries()) {
        if (!observer->deliver(trace_to_message(entry.trace))) {
            LOG_WARN("Error sending initial traces to " << observer->name() << ", dropping observer");
            observer->close();
            return;
        }
    }

    observers_.push_back(observer);
    observer_count_ = observers_.size();
    LOG_INFO("Observer " << observer->name() << " registered, replayed " << history_.size() << " traces");
}

void TraceHub::handle(Unregister& p_message) {
    if (!p_message.observer || !contains(p_message.observer)) {
        return;
    }
    remove(p_message.observer);
    p_message.observer->close();
    LOG_INFO("Observer " << p_message.observer->name() << " unregistered");
}

void TraceHub::handle(Broadcast& p_message) {
    const std::string message = trace_to_message(p_message.trace);
    history_.append(std::move(p_message.trace));
    history_size_ = history_.size();

    LOG_DEBUG("Broadcasting trace to " << observers_.size() << " observers");
    std::vector<TraceObserverPtr> failed;
    for (auto& observer : observers_) {
        if (!observer->deliver(message)) {
            failed.push_back(observer);
        }
    }
    for (auto& observer : failed) {
        LOG_WARN("Write error to " << observer->name() << ", dropping observer");
        remove(observer);
        observer->close();
    }
}

void TraceHub::handle(Snapshot& p_message) {
    p_message.reply->set_value(history_.snapshot());
}

void TraceHub::handle(Stop&) {
    stopping_ = true;
}

bool TraceHub::contains(const TraceObserverPtr& p_observer) const {
    return std::find(observers_.begin(), observers_.end(), p_observer) != observers_.end();
}

void TraceHub::remove(const TraceObserverPtr& p_observer) {
    observers_.erase(std::remove(observers_.begin(), observers_.end(), p_observer), observers_.end());
    observer_count_ = observers_.size();
}
