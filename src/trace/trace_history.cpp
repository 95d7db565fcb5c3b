#include "trace_history.hpp"

#include <stdexcept>

TraceHistory::TraceHistory(std::size_t p_capacity)
    : capacity_(p_capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("trace history capacity must be positive");
    }
}

std::uint64_t TraceHistory::append(Trace p_trace) {
    const std::uint64_t index = next_index_++;
    entries_.push_back(Entry{index, std::move(p_trace)});
    while (entries_.size() > capacity_) {
        entries_.pop_front();
    }
    return index;
}

std::vector<Trace> TraceHistory::snapshot() const {
    std::vector<Trace> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.trace);
    }
    return out;
}
