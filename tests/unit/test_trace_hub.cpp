#include "trace/trace_hub.hpp"
#include "utils/logger.h"

#include <cassert>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

class RecordingObserver : public TraceObserver {
public:
    explicit RecordingObserver(std::string p_name, std::size_t p_fail_after = SIZE_MAX)
        : name_(std::move(p_name)), fail_after_(p_fail_after) {}

    bool deliver(const std::string& p_message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (messages_.size() >= fail_after_) {
            return false;
        }
        messages_.push_back(nlohmann::json::parse(p_message)["id"].get<std::string>());
        return true;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++close_calls_;
    }

    std::string name() const override { return name_; }

    std::vector<std::string> ids() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    int close_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_calls_;
    }

private:
    std::string name_;
    std::size_t fail_after_;
    mutable std::mutex mutex_;
    std::vector<std::string> messages_;
    int close_calls_ = 0;
};

Trace make_trace(const std::string& p_id) {
    Trace trace;
    trace.id = p_id;
    trace.method = "POST";
    trace.url = "https://api.openai.com/v1/chat/completions";
    trace.status = "200 OK";
    return trace;
}

} // namespace

static void test_replay_then_live_without_duplicates() {
    TraceHub hub(100, 16);
    hub.broadcast(make_trace("a"));
    hub.broadcast(make_trace("b"));

    auto observer = std::make_shared<RecordingObserver>("late");
    hub.register_observer(observer);
    hub.broadcast(make_trace("c"));

    // The snapshot is answered after every earlier message is handled.
    std::vector<Trace> history = hub.snapshot();
    assert(history.size() == 3);

    std::vector<std::string> ids = observer->ids();
    assert((ids == std::vector<std::string>{"a", "b", "c"}));
    assert(hub.observer_count() == 1);
    assert(hub.history_size() == 3);
}

static void test_history_is_bounded() {
    TraceHub hub(3, 4);
    for (int i = 0; i < 10; ++i) {
        hub.broadcast(make_trace(std::to_string(i)));
    }
    std::vector<Trace> history = hub.snapshot();
    assert(history.size() == 3);
    assert(history[0].id == "7");
    assert(history[2].id == "9");
    assert(hub.history_capacity() == 3);

    auto observer = std::make_shared<RecordingObserver>("replay");
    hub.register_observer(observer);
    hub.snapshot();
    assert((observer->ids() == std::vector<std::string>{"7", "8", "9"}));
}

static void test_failing_observer_is_dropped() {
    TraceHub hub(100, 16);
    auto healthy = std::make_shared<RecordingObserver>("healthy");
    auto flaky = std::make_shared<RecordingObserver>("flaky", 1);
    hub.register_observer(healthy);
    hub.register_observer(flaky);

    hub.broadcast(make_trace("1"));
    hub.broadcast(make_trace("2"));
    hub.broadcast(make_trace("3"));
    hub.snapshot();

    assert(hub.observer_count() == 1);
    assert(healthy->ids().size() == 3);
    assert(flaky->ids().size() == 1);
    assert(flaky->close_calls() == 1);
}

static void test_failed_replay_never_registers() {
    TraceHub hub(100, 16);
    hub.broadcast(make_trace("1"));
    hub.broadcast(make_trace("2"));

    auto observer = std::make_shared<RecordingObserver>("broken", 1);
    hub.register_observer(observer);
    hub.broadcast(make_trace("3"));
    hub.snapshot();

    assert(hub.observer_count() == 0);
    assert(observer->ids().size() == 1);
    assert(observer->close_calls() == 1);
}

static void test_unregister_is_idempotent() {
    TraceHub hub(100, 16);
    auto observer = std::make_shared<RecordingObserver>("viewer");
    auto stranger = std::make_shared<RecordingObserver>("stranger");
    hub.register_observer(observer);
    hub.register_observer(observer);
    hub.snapshot();
    assert(hub.observer_count() == 1);

    hub.unregister_observer(observer);
    hub.unregister_observer(observer);
    hub.unregister_observer(stranger);
    hub.broadcast(make_trace("after"));
    hub.snapshot();

    assert(hub.observer_count() == 0);
    assert(observer->close_calls() == 1);
    assert(stranger->close_calls() == 0);
    assert(observer->ids().empty());
}

static void test_concurrent_producers_lose_nothing() {
    TraceHub hub(1000, 8);
    auto observer = std::make_shared<RecordingObserver>("counter");
    hub.register_observer(observer);

    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&hub, t]() {
            for (int i = 0; i < 50; ++i) {
                hub.broadcast(make_trace(std::to_string(t) + "-" + std::to_string(i)));
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }

    assert(hub.snapshot().size() == 200);
    assert(observer->ids().size() == 200);
}

static void test_stop_closes_observers() {
    auto observer = std::make_shared<RecordingObserver>("viewer");
    TraceHub hub(100, 16);
    hub.register_observer(observer);
    hub.broadcast(make_trace("x"));
    hub.stop();

    assert(observer->ids().size() == 1);
    assert(observer->close_calls() == 1);
    assert(hub.observer_count() == 0);
    assert(hub.snapshot().empty());

    hub.broadcast(make_trace("ignored"));
    hub.stop();
    assert(observer->ids().size() == 1);
}

int main() {
    Logger::instance().set_level(LogLevel::Off);
    test_replay_then_live_without_duplicates();
    test_history_is_bounded();
    test_failing_observer_is_dropped();
    test_failed_replay_never_registers();
    test_unregister_is_idempotent();
    test_concurrent_producers_lose_nothing();
    test_stop_closes_observers();
    return 0;
}
