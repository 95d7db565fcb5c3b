#pragma once

#include "trace_hub.hpp"
#include "../core/config.h"
#include "../transport/request_handler.h"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <atomic>
#include <deque>
#include <memory>
#include <string>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class HookManager;

// Live trace subscriber on a WebSocket. deliver() only queues; writes run on
// the connection's strand, one at a time.
class TraceStreamSession : public TraceObserver,
                           public std::enable_shared_from_this<TraceStreamSession> {
public:
    TraceStreamSession(tcp::socket socket, TraceHub& hub, std::size_t queue_limit);

    void run(http::request<http::string_body> request);

    bool deliver(const std::string& message) override;
    void close() override;
    std::string name() const override { return name_; }

private:
    void on_accept(beast::error_code ec);
    void do_read();
    void enqueue(std::shared_ptr<const std::string> message);
    void do_write();
    void on_write(beast::error_code ec);
    void fail(const std::string& what, beast::error_code ec);

    websocket::stream<beast::tcp_stream> ws_;
    TraceHub& hub_;
    beast::flat_buffer read_buffer_;
    std::deque<std::shared_ptr<const std::string>> outbound_;
    std::size_t queue_limit_;
    std::atomic<std::size_t> queued_{0};
    std::atomic<bool> closed_{false};
    bool close_sent_ = false;
    std::string name_;
};

class TraceHttpSession;

// Listener for GET /traces, GET /health and the /ws live stream.
class TraceServer {
public:
    TraceServer(net::io_context& io_context, const GatewayConfig& config, TraceHub& hub, const HookManager& hooks);

    void start();
    void stop();
    uint16_t port() const;

private:
    friend class TraceHttpSession;

    void register_routes();
    void accept_connections();

    net::io_context& io_context_;
    tcp::acceptor acceptor_;
    TraceHub& hub_;
    const HookManager& hooks_;
    std::size_t observer_queue_limit_;
    RequestHandler handler_;
};
