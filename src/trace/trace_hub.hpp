#pragma once

#include "trace_history.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

// A live subscriber to the trace stream.
class TraceObserver {
public:
    virtual ~TraceObserver() = default;

    // Hands one serialized trace to the observer without blocking on the
    // network. Returns false when the observer can no longer accept messages.
    virtual bool deliver(const std::string& p_message) = 0;
    virtual void close() = 0;
    virtual std::string name() const = 0;
};

using TraceObserverPtr = std::shared_ptr<TraceObserver>;

// Single-writer actor owning the trace history and the observer set.
//
// All mutation goes through a message queue drained by one worker thread, in
// arrival order. Posting blocks only while the queue is full, so a lagging hub
// delays trace recording but never loses a trace.
class TraceHub {
public:
    explicit TraceHub(std::size_t p_history_size = 100, std::size_t p_queue_capacity = 1024);
    ~TraceHub();

    TraceHub(const TraceHub&) = delete;
    TraceHub& operator=(const TraceHub&) = delete;

    // New observers first receive the whole history, then live traces.
    void register_observer(TraceObserverPtr p_observer);
    // Removes and closes the observer. Unknown observers are ignored.
    void unregister_observer(TraceObserverPtr p_observer);
    void broadcast(Trace p_trace);

    // Copy of the history, taken by the worker. Empty once stopped.
    std::vector<Trace> snapshot();

    // Processes everything already queued, closes all observers and joins
    // the worker. Later messages are discarded.
    void stop();

    std::size_t observer_count() const { return observer_count_; }
    std::size_t history_size() const { return history_size_; }
    // Upper bound on the number of traces replayed to a new observer.
    std::size_t history_capacity() const { return history_capacity_; }

private:
    struct Register { TraceObserverPtr observer; };
    struct Unregister { TraceObserverPtr observer; };
    struct Broadcast { Trace trace; };
    struct Snapshot { std::shared_ptr<std::promise<std::vector<Trace>>> reply; };
    struct Stop {};
    using Message = std::variant<Register, Unregister, Broadcast, Snapshot, Stop>;

    bool post(Message p_message);
    void run();

    void handle(Register& p_message);
    void handle(Unregister& p_message);
    void handle(Broadcast& p_message);
    void handle(Snapshot& p_message);
    void handle(Stop& p_message);

    bool contains(const TraceObserverPtr& p_observer) const;
    void remove(const TraceObserverPtr& p_observer);

    // Worker-only state.
    TraceHistory history_;
    std::vector<TraceObserverPtr> observers_;
    bool stopping_ = false;

    mutable std::mutex queue_mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<Message> queue_;
    std::size_t queue_capacity_;
    const std::size_t history_capacity_;
    bool accepting_ = true;

    std::atomic<std::size_t> observer_count_{0};
    std::atomic<std::size_t> history_size_{0};
    std::thread worker_;
};
