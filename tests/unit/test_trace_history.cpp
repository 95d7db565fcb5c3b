#include "trace/trace_history.hpp"
#include "utils/logger.h"

#include <cassert>
#include <string>

namespace {

Trace make_trace(int p_n) {
    Trace trace;
    trace.id = "trace-" + std::to_string(p_n);
    trace.method = "POST";
    trace.status = "200 OK";
    return trace;
}

} // namespace

static void test_keeps_everything_below_capacity() {
    TraceHistory history(5);
    for (int i = 0; i < 3; ++i) {
        assert(history.append(make_trace(i)) == static_cast<std::uint64_t>(i));
    }
    assert(history.size() == 3);
    std::vector<Trace> traces = history.snapshot();
    assert(traces.size() == 3);
    assert(traces.front().id == "trace-0");
    assert(traces.back().id == "trace-2");
}

static void test_evicts_oldest_beyond_capacity() {
    TraceHistory history(100);
    for (int i = 0; i < 130; ++i) {
        history.append(make_trace(i));
    }
    assert(history.size() == 100);
    assert(history.capacity() == 100);
    assert(history.total_appended() == 130);

    std::uint64_t expected = 30;
    for (const auto& entry : history.entries()) {
        assert(entry.index == expected);
        assert(entry.trace.id == "trace-" + std::to_string(expected));
        ++expected;
    }
    assert(expected == 130);
}

static void test_capacity_one() {
    TraceHistory history(1);
    history.append(make_trace(1));
    history.append(make_trace(2));
    assert(history.size() == 1);
    assert(history.snapshot().front().id == "trace-2");
}

int main() {
    Logger::instance().set_level(LogLevel::Warn);
    test_keeps_everything_below_capacity();
    test_evicts_oldest_beyond_capacity();
    test_capacity_one();
    return 0;
}
