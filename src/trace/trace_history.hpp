#pragma once

#include "trace.hpp"

#include <cstdint>
#include <deque>
#include <vector>

// Insertion-ordered ring of the latest traces. Not synchronized: the trace hub
// worker is its only user.
class TraceHistory {
public:
    struct Entry {
        std::uint64_t index;
        Trace trace;
    };

    explicit TraceHistory(std::size_t p_capacity = 100);

    // Appends and evicts the oldest entries beyond capacity. Returns the
    // insertion index given to the trace.
    std::uint64_t append(Trace p_trace);

    const std::deque<Entry>& entries() const { return entries_; }
    std::vector<Trace> snapshot() const;

    std::size_t size() const { return entries_.size(); }
    std::size_t capacity() const { return capacity_; }
    std::uint64_t total_appended() const { return next_index_; }

private:
    std::size_t capacity_;
    std::uint64_t next_index_ = 0;
    std::deque<Entry> entries_;
};
