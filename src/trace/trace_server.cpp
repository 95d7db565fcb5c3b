#include "trace_server.hpp"
#include "../hooks/hook_manager.hpp"
#include "../transport/active_request.hpp"
#include "../transport/http1_proxy.hpp"
#include "../utils/logger.h"

namespace {

constexpr auto kReadTimeout = std::chrono::seconds(60);

std::string endpoint_string(const tcp::socket& socket) {
    beast::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // namespace

TraceStreamSession::TraceStreamSession(tcp::socket socket, TraceHub& hub, std::size_t queue_limit)
    : ws_(std::move(socket)), hub_(hub), queue_limit_(queue_limit) {
    name_ = "websocket " + endpoint_string(beast::get_lowest_layer(ws_).socket());
}

void TraceStreamSession::run(http::request<http::string_body> request) {
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, "tracegate");
    }));

    // Keep the request alive until the handshake completes.
    auto upgrade = std::make_shared<http::request<http::string_body>>(std::move(request));
    ws_.async_accept(*upgrade,
        [self = shared_from_this(), upgrade](beast::error_code ec) {
            self->on_accept(ec);
        });
}

void TraceStreamSession::on_accept(beast::error_code ec) {
    if (ec) {
        LOG_WARN("WebSocket handshake with " << name_ << " failed: " << ec.message());
        closed_ = true;
        return;
    }
    LOG_INFO("Trace viewer connected: " << name_);
    ws_.text(true);
    hub_.register_observer(shared_from_this());
    do_read();
}

void TraceStreamSession::do_read() {
    ws_.async_read(read_buffer_,
        [self = shared_from_this()](beast::error_code ec, std::size_t) {
            if (ec) {
                if (ec != websocket::error::closed && ec != net::error::operation_aborted) {
                    LOG_DEBUG("Read from " << self->name_ << " ended: " << ec.message());
                }
                self->closed_ = true;
                self->hub_.unregister_observer(self);
                return;
            }
            // Viewers have nothing to say; inbound messages are dropped.
            self->read_buffer_.consume(self->read_buffer_.size());
            self->do_read();
        });
}

bool TraceStreamSession::deliver(const std::string& message) {
    if (closed_) {
        return false;
    }
    if (queued_.fetch_add(1) >= queue_limit_) {
        --queued_;
        LOG_WARN("Outbound queue of " << name_ << " is full");
        return false;
    }
    auto payload = std::make_shared<const std::string>(message);
    net::post(ws_.get_executor(), [self = shared_from_this(), payload]() {
        self->enqueue(payload);
    });
    return true;
}

void TraceStreamSession::close() {
    closed_ = true;
    net::post(ws_.get_executor(), [self = shared_from_this()]() {
        if (self->close_sent_ || !self->ws_.is_open()) {
            return;
        }
        self->close_sent_ = true;
        if (!self->outbound_.empty()) {
            // on_write closes once the pending write is done.
            return;
        }
        self->ws_.async_close(websocket::close_code::normal, [self](beast::error_code ec) {
            if (ec) {
                LOG_DEBUG("Close of " << self->name_ << ": " << ec.message());
            }
        });
    });
}

void TraceStreamSession::enqueue(std::shared_ptr<const std::string> message) {
    if (close_sent_) {
        --queued_;
        return;
    }
    outbound_.push_back(std::move(message));
    if (outbound_.size() == 1) {
        do_write();
    }
}

void TraceStreamSession::do_write() {
    ws_.async_write(net::buffer(*outbound_.front()),
        [self = shared_from_this()](beast::error_code ec, std::size_t) {
            self->on_write(ec);
        });
}

void TraceStreamSession::on_write(beast::error_code ec) {
    outbound_.pop_front();
    --queued_;
    if (ec) {
        fail("write", ec);
        return;
    }
    if (close_sent_) {
        queued_ -= outbound_.size();
        outbound_.clear();
        ws_.async_close(websocket::close_code::normal, [self = shared_from_this()](beast::error_code ec) {
            if (ec) {
                LOG_DEBUG("Close of " << self->name_ << ": " << ec.message());
            }
        });
        return;
    }
    if (!outbound_.empty()) {
        do_write();
    }
}

void TraceStreamSession::fail(const std::string& what, beast::error_code ec) {
    LOG_WARN("WebSocket " << what << " to " << name_ << " failed: " << ec.message());
    closed_ = true;
    queued_ -= outbound_.size();
    outbound_.clear();
    hub_.unregister_observer(shared_from_this());
}

// Plain HTTP connection to the trace listener. Hands itself over to a
// TraceStreamSession when the client asks for a WebSocket upgrade on /ws.
class TraceHttpSession : public std::enable_shared_from_this<TraceHttpSession> {
public:
    TraceHttpSession(tcp::socket socket, TraceServer& server)
        : stream_(std::move(socket)), server_(server) {}

    void start() { read_request(); }

private:
    void read_request() {
        request_ = {};
        stream_.expires_after(kReadTimeout);
        http::async_read(stream_, buffer_, request_,
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                if (ec) {
                    if (ec != http::error::end_of_stream && ec != beast::error::timeout) {
                        LOG_DEBUG("Trace listener read error: " << ec.message());
                    }
                    self->do_close();
                    return;
                }
                self->handle_request();
            });
    }

    void handle_request() {
        const std::string target(request_.target());
        const std::string path = target.substr(0, target.find('?'));

        if (websocket::is_upgrade(request_)) {
            if (path != "/ws") {
                send(HttpResponse(404, RequestHandler::create_error_response(404, "Route not found").dump()));
                return;
            }
            stream_.expires_never();
            auto session = std::make_shared<TraceStreamSession>(stream_.release_socket(), server_.hub_,
                                                                server_.observer_queue_limit_);
            session->run(std::move(request_));
            return;
        }

        auto self = shared_from_this();
        server_.handler_.handle_request(std::string(request_.method_string()), path, request_.body(),
            [self](const HttpResponse& response) {
                self->send(response);
            });
    }

    void send(const HttpResponse& response) {
        auto res = std::make_shared<http::response<http::string_body>>(
            static_cast<http::status>(response.status_code), request_.version());
        res->set(http::field::server, "tracegate");
        res->set(http::field::content_type, response.content_type);
        res->set(http::field::access_control_allow_origin, "*");
        for (const auto& [name, values] : response.headers) {
            for (const auto& value : values) {
                res->insert(name, value);
            }
        }
        res->keep_alive(request_.keep_alive());
        res->body() = response.body;
        res->prepare_payload();

        stream_.expires_after(kReadTimeout);
        http::async_write(stream_, *res,
            [self = shared_from_this(), res](beast::error_code ec, std::size_t) {
                if (ec) {
                    LOG_DEBUG("Trace listener write error: " << ec.message());
                    self->do_close();
                    return;
                }
                if (!res->keep_alive()) {
                    self->do_close();
                    return;
                }
                self->read_request();
            });
    }

    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
    TraceServer& server_;
};

TraceServer::TraceServer(net::io_context& io_context, const GatewayConfig& config, TraceHub& hub,
                         const HookManager& hooks)
    : io_context_(io_context),
      acceptor_(io_context),
      hub_(hub),
      hooks_(hooks),
      // A new viewer is sent the whole history before any write drains.
      observer_queue_limit_(hub.history_capacity() + config.observer_queue_limit) {
    auto endpoint = resolve_listen_endpoint(io_context, config.host, config.trace_port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);
    register_routes();
}

void TraceServer::register_routes() {
    handler_.register_route("GET", "/traces",
        [this](std::string_view, std::string_view, std::string_view, ResponseSender p_sender) {
            json traces = hub_.snapshot();
            p_sender(HttpResponse(200, traces.dump(-1, ' ', false, json::error_handler_t::replace)));
        });

    handler_.register_route("GET", "/health",
        [this](std::string_view, std::string_view, std::string_view, ResponseSender p_sender) {
            auto& requests = ActiveRequestManager::instance();
            json health = {
                {"status", "ok"},
                {"active_requests", requests.get_active_count()},
                {"total_requests", requests.get_total_count()},
                {"in_flight", requests.to_json()},
                {"observers", hub_.observer_count()},
                {"traces", hub_.history_size()},
                {"hooks", {
                    {"enabled", hooks_.enabled()},
                    {"script", hooks_.script_path()},
                    {"request", hooks_.has_request_hook()},
                    {"response", hooks_.has_response_hook()}
                }}
            };
            p_sender(HttpResponse(200, health.dump(-1, ' ', false, json::error_handler_t::replace)));
        });
}

void TraceServer::start() {
    LOG_INFO("Trace server listening on port " << port() << " (/traces, /ws, /health)");
    accept_connections();
}

void TraceServer::stop() {
    beast::error_code ec;
    acceptor_.close(ec);
}

uint16_t TraceServer::port() const {
    return acceptor_.local_endpoint().port();
}

void TraceServer::accept_connections() {
    acceptor_.async_accept(net::make_strand(io_context_),
        [this](beast::error_code ec, tcp::socket socket) {
            if (ec == net::error::operation_aborted) {
                return;
            }
            if (!ec) {
                std::make_shared<TraceHttpSession>(std::move(socket), *this)->start();
            } else {
                LOG_ERROR("Trace listener accept error: " << ec.message());
            }
            accept_connections();
        });
}
