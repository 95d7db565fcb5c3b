#include "hooks/hook_manager.hpp"
#include "trace/trace_hub.hpp"
#include "trace/trace_server.hpp"
#include "utils/logger.h"

#include <boost/beast/websocket.hpp>

#include <cassert>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace {

Trace make_trace(const std::string& p_id) {
    Trace trace;
    trace.id = p_id;
    trace.timestamp = std::chrono::system_clock::now();
    trace.method = "POST";
    trace.url = "https://api.openai.com/v1/chat/completions";
    trace.status = "200 OK";
    trace.latency = 0.5;
    trace.request_body = "{\"id\":\"" + p_id + "\"}";
    return trace;
}

http::response<http::string_body> http_get(uint16_t p_port, const std::string& p_target) {
    net::io_context io_context;
    tcp::socket socket(io_context);
    socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), p_port));

    http::request<http::string_body> request(http::verb::get, p_target, 11);
    request.set(http::field::host, "127.0.0.1");
    request.keep_alive(false);
    http::write(socket, request);

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    http::read(socket, buffer, response);
    beast::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    return response;
}

std::string read_message(websocket::stream<tcp::socket>& p_ws) {
    beast::flat_buffer buffer;
    p_ws.read(buffer);
    return beast::buffers_to_string(buffer.data());
}

class TraceServerFixture {
public:
    explicit TraceServerFixture(std::size_t p_history_size = 100, std::size_t p_observer_queue_limit = 256)
        : hub_(p_history_size, 64) {
        config_.host = "127.0.0.1";
        config_.trace_port = 0;
        config_.history_size = p_history_size;
        config_.observer_queue_limit = p_observer_queue_limit;
        server_ = std::make_unique<TraceServer>(io_context_, config_, hub_, hooks_);
        server_->start();
        work_.emplace(net::make_work_guard(io_context_));
        thread_ = std::thread([this]() { io_context_.run(); });
    }

    ~TraceServerFixture() {
        server_->stop();
        hub_.stop();
        work_.reset();
        io_context_.stop();
        thread_.join();
    }

    uint16_t port() const { return server_->port(); }
    TraceHub& hub() { return hub_; }

private:
    GatewayConfig config_;
    HookManager hooks_;
    TraceHub hub_;
    net::io_context io_context_;
    std::unique_ptr<TraceServer> server_;
    boost::optional<net::executor_work_guard<net::io_context::executor_type>> work_;
    std::thread thread_;
};

} // namespace

static void test_traces_endpoint() {
    TraceServerFixture fixture;

    auto empty = http_get(fixture.port(), "/traces");
    assert(empty.result_int() == 200);
    assert(nlohmann::json::parse(empty.body()) == nlohmann::json::array());

    fixture.hub().broadcast(make_trace("first"));
    fixture.hub().broadcast(make_trace("second"));

    auto response = http_get(fixture.port(), "/traces");
    assert(response.result_int() == 200);
    assert(response[http::field::content_type] == "application/json");
    assert(response[http::field::access_control_allow_origin] == "*");

    nlohmann::json traces = nlohmann::json::parse(response.body());
    assert(traces.is_array());
    assert(traces.size() == 2);
    assert(traces[0]["id"] == "first");
    assert(traces[1]["id"] == "second");
    assert(traces[1]["request_body"] == "{\"id\":\"second\"}");
    assert(!traces[0].contains("session_id"));
}

static void test_health_and_unknown_routes() {
    TraceServerFixture fixture;
    fixture.hub().broadcast(make_trace("one"));
    fixture.hub().snapshot();

    auto health = http_get(fixture.port(), "/health");
    assert(health.result_int() == 200);
    nlohmann::json body = nlohmann::json::parse(health.body());
    assert(body["status"] == "ok");
    assert(body["traces"] == 1);
    assert(body["observers"] == 0);
    assert(body["hooks"]["enabled"] == false);
    assert(body["in_flight"].is_array());

    auto missing = http_get(fixture.port(), "/nothing");
    assert(missing.result_int() == 404);
    assert(nlohmann::json::parse(missing.body())["code"] == 404);
}

static void test_websocket_replays_then_streams() {
    TraceServerFixture fixture;
    fixture.hub().broadcast(make_trace("a"));
    fixture.hub().broadcast(make_trace("b"));

    net::io_context io_context;
    websocket::stream<tcp::socket> ws(io_context);
    ws.next_layer().connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), fixture.port()));
    ws.handshake("127.0.0.1", "/ws");

    assert(nlohmann::json::parse(read_message(ws))["id"] == "a");
    assert(nlohmann::json::parse(read_message(ws))["id"] == "b");

    fixture.hub().broadcast(make_trace("c"));
    nlohmann::json live = nlohmann::json::parse(read_message(ws));
    assert(live["id"] == "c");
    assert(live["method"] == "POST");
    assert(live["status"] == "200 OK");
    assert(fixture.hub().observer_count() == 1);

    ws.close(websocket::close_code::normal);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (fixture.hub().observer_count() != 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(fixture.hub().observer_count() == 0);
}

static void test_history_larger_than_live_queue_is_replayed() {
    TraceServerFixture fixture(300, 16);
    for (int i = 0; i < 300; ++i) {
        fixture.hub().broadcast(make_trace("t" + std::to_string(i)));
    }
    assert(fixture.hub().snapshot().size() == 300);

    net::io_context io_context;
    websocket::stream<tcp::socket> ws(io_context);
    ws.next_layer().connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), fixture.port()));
    ws.handshake("127.0.0.1", "/ws");

    for (int i = 0; i < 300; ++i) {
        assert(nlohmann::json::parse(read_message(ws))["id"] == "t" + std::to_string(i));
    }
    assert(fixture.hub().observer_count() == 1);

    fixture.hub().broadcast(make_trace("live"));
    assert(nlohmann::json::parse(read_message(ws))["id"] == "live");
    assert(fixture.hub().observer_count() == 1);

    ws.close(websocket::close_code::normal);
}

static void test_two_viewers_see_the_same_stream() {
    TraceServerFixture fixture;

    net::io_context io_context;
    websocket::stream<tcp::socket> first(io_context);
    websocket::stream<tcp::socket> second(io_context);
    first.next_layer().connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), fixture.port()));
    second.next_layer().connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), fixture.port()));
    first.handshake("127.0.0.1", "/ws");
    second.handshake("127.0.0.1", "/ws");

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (fixture.hub().observer_count() != 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(fixture.hub().observer_count() == 2);

    fixture.hub().broadcast(make_trace("shared"));
    assert(nlohmann::json::parse(read_message(first))["id"] == "shared");
    assert(nlohmann::json::parse(read_message(second))["id"] == "shared");

    first.close(websocket::close_code::normal);
    second.close(websocket::close_code::normal);
}

static void test_websocket_on_other_path_is_refused() {
    TraceServerFixture fixture;

    net::io_context io_context;
    websocket::stream<tcp::socket> ws(io_context);
    ws.next_layer().connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), fixture.port()));
    beast::error_code ec;
    ws.handshake("127.0.0.1", "/traces", ec);
    assert(ec);
    assert(fixture.hub().observer_count() == 0);
}

int main() {
    Logger::instance().set_level(LogLevel::Warn);
    test_traces_endpoint();
    test_health_and_unknown_routes();
    test_websocket_replays_then_streams();
    test_history_larger_than_live_queue_is_replayed();
    test_two_viewers_see_the_same_stream();
    test_websocket_on_other_path_is_refused();
    return 0;
}
