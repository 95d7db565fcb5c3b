#include "http1_proxy.hpp"
#include "../utils/logger.h"

namespace {

constexpr auto kClientTimeout = std::chrono::seconds(120);

std::string endpoint_string(const tcp::socket& socket) {
    beast::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

template <class Message>
void copy_headers(const HeaderMap& headers, Message& message) {
    for (const auto& [name, values] : headers) {
        for (const auto& value : values) {
            message.insert(name, value);
        }
    }
    if (message.find(http::field::server) == message.end()) {
        message.set(http::field::server, "tracegate");
    }
}

} // namespace

tcp::endpoint resolve_listen_endpoint(net::io_context& io_context, const std::string& host, uint16_t port) {
    beast::error_code ec;
    auto address = net::ip::make_address(host, ec);
    if (!ec) {
        return tcp::endpoint(address, port);
    }
    tcp::resolver resolver(io_context);
    auto results = resolver.resolve(host, std::to_string(port));
    return results.begin()->endpoint();
}

// HTTP/1.x side of the response writer. Streamed bodies use chunked
// transfer-encoding, or close-delimited framing for HTTP/1.0 clients.
class Http1ResponseWriter : public ResponseWriter {
public:
    Http1ResponseWriter(std::shared_ptr<Http1ProxySession> session, unsigned version, bool keep_alive,
                        bool head_only = false)
        : session_(std::move(session)), version_(version), keep_alive_(keep_alive), head_only_(head_only) {}

    void write_response(int status, const std::string& reason, const HeaderMap& headers,
                        std::string body, WriteCallback done) override {
        auto response = std::make_shared<http::response<http::string_body>>(static_cast<http::status>(status), version_);
        response->reason(reason);
        copy_headers(headers, *response);
        response->keep_alive(keep_alive_);
        if (head_only_) {
            // Content-Length, when present, describes the body a GET would get.
            response->body().clear();
        } else {
            response->body() = std::move(body);
            response->prepare_payload();
        }

        session_->stream_.expires_after(kClientTimeout);
        http::async_write(session_->stream_, *response,
            [response, done](beast::error_code ec, std::size_t) {
                done(ec ? ec.message() : "");
            });
    }

    void write_head(int status, const std::string& reason, const HeaderMap& headers,
                    WriteCallback done) override {
        head_ = std::make_shared<http::response<http::empty_body>>(static_cast<http::status>(status), version_);
        head_->reason(reason);
        copy_headers(headers, *head_);
        chunked_ = version_ >= 11;
        if (chunked_) {
            head_->chunked(true);
            head_->keep_alive(keep_alive_);
        } else {
            keep_alive_ = false;
            head_->keep_alive(false);
        }
        serializer_ = std::make_shared<http::response_serializer<http::empty_body>>(*head_);

        session_->stream_.expires_after(kClientTimeout);
        http::async_write_header(session_->stream_, *serializer_,
            [head = head_, serializer = serializer_, done](beast::error_code ec, std::size_t) {
                done(ec ? ec.message() : "");
            });
    }

    void write_chunk(std::string data, WriteCallback done) override {
        auto payload = std::make_shared<std::string>(std::move(data));
        session_->stream_.expires_after(kClientTimeout);
        auto handler = [payload, done](beast::error_code ec, std::size_t) {
            done(ec ? ec.message() : "");
        };
        if (chunked_) {
            net::async_write(session_->stream_, http::make_chunk(net::buffer(*payload)), handler);
        } else {
            net::async_write(session_->stream_, net::buffer(*payload), handler);
        }
    }

    void finish(WriteCallback done) override {
        if (!chunked_) {
            done("");
            return;
        }
        session_->stream_.expires_after(kClientTimeout);
        net::async_write(session_->stream_, http::make_chunk_last(),
            [done](beast::error_code ec, std::size_t) {
                done(ec ? ec.message() : "");
            });
    }

    void abort() override {
        beast::error_code ec;
        session_->stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
        session_->stream_.close();
    }

    std::string peer() const override { return session_->peer_; }

    bool must_close() const { return !keep_alive_; }

private:
    std::shared_ptr<Http1ProxySession> session_;
    unsigned version_;
    bool keep_alive_;
    bool head_only_;
    bool chunked_ = false;
    std::shared_ptr<http::response<http::empty_body>> head_;
    std::shared_ptr<http::response_serializer<http::empty_body>> serializer_;
};

Http1ProxySession::Http1ProxySession(tcp::socket socket, ForwardingPipeline& pipeline)
    : stream_(std::move(socket)), pipeline_(pipeline) {
    peer_ = endpoint_string(stream_.socket());
}

void Http1ProxySession::start() {
    read_request();
}

void Http1ProxySession::read_request() {
    parser_.emplace();
    parser_->body_limit(pipeline_.max_body_bytes());
    parser_->header_limit(64 * 1024);

    stream_.expires_after(kClientTimeout);
    http::async_read(stream_, buffer_, *parser_,
        [self = shared_from_this()](beast::error_code ec, std::size_t) {
            if (ec) {
                self->handle_read_error(ec);
                return;
            }
            self->handle_request();
        });
}

void Http1ProxySession::handle_read_error(beast::error_code ec) {
    if (ec == http::error::end_of_stream || ec == net::error::eof) {
        do_close();
        return;
    }
    if (ec == beast::error::timeout || ec == net::error::operation_aborted) {
        LOG_DEBUG("HTTP/1.1 connection " << peer_ << " idle: " << ec.message());
        do_close();
        return;
    }
    if (!parser_ || !parser_->is_header_done()) {
        LOG_ERROR("HTTP/1.1 read error from " << peer_ << ": " << ec.message());
        do_close();
        return;
    }

    // The headers arrived but the body did not; answer before closing.
    auto writer = std::make_shared<Http1ResponseWriter>(shared_from_this(), parser_->get().version(), false);
    int status = 500;
    std::string text = "Failed to read request body";
    if (ec == http::error::body_limit) {
        status = 413;
        text = "Request body too large";
    }
    LOG_WARN("HTTP/1.1 " << parser_->get().method_string() << " " << parser_->get().target()
             << " from " << peer_ << ": " << ec.message());
    ForwardingPipeline::send_error(writer, status, text,
        [self = shared_from_this()](const std::string& error) {
            if (!error.empty()) {
                LOG_DEBUG("Error reply to " << self->peer_ << " failed: " << error);
            }
            self->do_close();
        });
}

void Http1ProxySession::handle_request() {
    auto& request = parser_->get();

    InboundRequest inbound;
    inbound.method = std::string(request.method_string());
    inbound.target = std::string(request.target());
    for (const auto& field : request) {
        inbound.headers.add(std::string(field.name_string()), std::string(field.value()));
    }
    inbound.body = std::move(request.body());
    inbound.version = request.version();
    inbound.keep_alive = request.keep_alive();

    LOG_INFO("HTTP/1.1 " << inbound.method << " " << inbound.target << " from " << peer_);

    auto writer = std::make_shared<Http1ResponseWriter>(shared_from_this(), inbound.version, inbound.keep_alive,
                                                        request.method() == http::verb::head);
    pipeline_.handle(std::move(inbound), writer,
        [self = shared_from_this(), writer](bool reusable) {
            if (reusable && !writer->must_close()) {
                self->read_request();
            } else {
                self->do_close();
            }
        });
}

void Http1ProxySession::do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

Http1ProxyServer::Http1ProxyServer(net::io_context& io_context, const std::string& host, uint16_t port,
                                   ForwardingPipeline& pipeline)
    : io_context_(io_context), acceptor_(io_context), pipeline_(pipeline) {
    auto endpoint = resolve_listen_endpoint(io_context, host, port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);
}

void Http1ProxyServer::start() {
    LOG_INFO("Starting HTTP/1.1 proxy server on port " << port());
    accept_connections();
}

void Http1ProxyServer::stop() {
    beast::error_code ec;
    acceptor_.close(ec);
}

uint16_t Http1ProxyServer::port() const {
    return acceptor_.local_endpoint().port();
}

void Http1ProxyServer::accept_connections() {
    acceptor_.async_accept(net::make_strand(io_context_),
        [this](beast::error_code ec, tcp::socket socket) {
            if (ec == net::error::operation_aborted) {
                return;
            }
            if (!ec) {
                LOG_DEBUG("HTTP/1.1 connection accepted");
                std::make_shared<Http1ProxySession>(std::move(socket), pipeline_)->start();
            } else {
                LOG_ERROR("HTTP/1.1 accept error: " << ec.message());
            }
            accept_connections();
        });
}
