#include "http_client.hpp"
#include "../utils/logger.h"

#include <boost/asio/ssl/host_name_verification.hpp>
#include <limits>

UpstreamConnection::UpstreamConnection(net::io_context& p_io_context)
    : plain_(std::make_unique<beast::tcp_stream>(net::make_strand(p_io_context))) {}

UpstreamConnection::UpstreamConnection(net::io_context& p_io_context, ssl::context& p_ssl_context)
    : tls_(std::make_unique<beast::ssl_stream<beast::tcp_stream>>(net::make_strand(p_io_context), p_ssl_context)) {}

beast::tcp_stream& UpstreamConnection::tcp_layer() {
    if (tls_) {
        return beast::get_lowest_layer(*tls_);
    }
    return *plain_;
}

bool UpstreamConnection::is_open() {
    return tcp_layer().socket().is_open();
}

void UpstreamConnection::close() {
    beast::error_code ec;
    tcp_layer().socket().shutdown(tcp::socket::shutdown_both, ec);
    tcp_layer().close();
}

ConnectionPool::ConnectionPool(std::size_t p_max_idle, std::size_t p_max_idle_per_host,
                               std::chrono::seconds p_idle_timeout)
    : max_idle_(p_max_idle), max_idle_per_host_(p_max_idle_per_host), idle_timeout_(p_idle_timeout) {}

UpstreamConnectionPtr ConnectionPool::acquire(const std::string& p_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    prune_locked(std::chrono::steady_clock::now());

    auto it = idle_.find(p_key);
    if (it == idle_.end()) {
        return nullptr;
    }
    auto& queue = it->second;
    while (!queue.empty()) {
        auto connection = std::move(queue.back());
        queue.pop_back();
        --total_idle_;
        if (connection->is_open()) {
            return connection;
        }
    }
    idle_.erase(it);
    return nullptr;
}

void ConnectionPool::release(const std::string& p_key, UpstreamConnectionPtr p_connection) {
    if (!p_connection || !p_connection->is_open()) {
        return;
    }
    if (max_idle_ == 0 || max_idle_per_host_ == 0) {
        p_connection->close();
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = std::chrono::steady_clock::now();
    prune_locked(now);

    p_connection->last_used = now;
    auto& queue = idle_[p_key];
    if (queue.size() >= max_idle_per_host_) {
        queue.front()->close();
        queue.pop_front();
        --total_idle_;
    }
    queue.push_back(std::move(p_connection));
    ++total_idle_;

    while (total_idle_ > max_idle_) {
        evict_oldest_locked();
    }
}

std::size_t ConnectionPool::idle_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_idle_;
}

void ConnectionPool::prune_locked(std::chrono::steady_clock::time_point p_now) {
    for (auto it = idle_.begin(); it != idle_.end();) {
        auto& queue = it->second;
        while (!queue.empty() && p_now - queue.front()->last_used >= idle_timeout_) {
            queue.front()->close();
            queue.pop_front();
            --total_idle_;
        }
        if (queue.empty()) {
            it = idle_.erase(it);
        } else {
            ++it;
        }
    }
}

void ConnectionPool::evict_oldest_locked() {
    auto oldest = idle_.end();
    for (auto it = idle_.begin(); it != idle_.end(); ++it) {
        if (it->second.empty()) {
            continue;
        }
        if (oldest == idle_.end() || it->second.front()->last_used < oldest->second.front()->last_used) {
            oldest = it;
        }
    }
    if (oldest == idle_.end()) {
        return;
    }
    oldest->second.front()->close();
    oldest->second.pop_front();
    --total_idle_;
    if (oldest->second.empty()) {
        idle_.erase(oldest);
    }
}

UpstreamResponse::UpstreamResponse(std::shared_ptr<ConnectionPool> p_pool, std::string p_pool_key,
                                   UpstreamConnectionPtr p_connection, std::unique_ptr<Parser> p_parser,
                                   std::chrono::seconds p_timeout)
    : pool_(std::move(p_pool)),
      pool_key_(std::move(p_pool_key)),
      connection_(std::move(p_connection)),
      parser_(std::move(p_parser)),
      timeout_(p_timeout) {}

UpstreamResponse::~UpstreamResponse() {
    // An unread body leaves the connection in an unknown state.
    if (!finished_ && connection_) {
        connection_->close();
    }
}

int UpstreamResponse::status_code() const {
    return static_cast<int>(parser_->get().result_int());
}

std::string UpstreamResponse::reason() const {
    auto reason = parser_->get().reason();
    if (reason.empty()) {
        return std::string(http::obsolete_reason(parser_->get().result()));
    }
    return std::string(reason);
}

std::string UpstreamResponse::status_line() const {
    return std::to_string(status_code()) + " " + reason();
}

HeaderMap UpstreamResponse::headers() const {
    HeaderMap headers;
    for (const auto& field : parser_->get()) {
        headers.add(std::string(field.name_string()), std::string(field.value()));
    }
    return headers;
}

void UpstreamResponse::read_chunk(ChunkCallback p_callback) {
    if (finished_ || parser_->is_done()) {
        finish_connection(true);
        p_callback("", "", true);
        return;
    }

    auto& body = parser_->get().body();
    body.data = chunk_buffer_.data();
    body.size = chunk_buffer_.size();

    connection_->tcp_layer().expires_after(timeout_);
    auto self = shared_from_this();
    connection_->with_stream([&](auto& stream) {
        http::async_read(stream, connection_->buffer(), *parser_,
            [self, callback = std::move(p_callback)](beast::error_code ec, std::size_t) mutable {
                self->handle_chunk(ec, std::move(callback));
            });
    });
}

void UpstreamResponse::handle_chunk(beast::error_code p_ec, ChunkCallback p_callback) {
    if (p_ec == http::error::need_buffer) {
        p_ec = {};
    }
    if (p_ec) {
        finish_connection(false);
        p_callback("Failed to read response body: " + p_ec.message(), "", true);
        return;
    }

    const std::size_t length = chunk_buffer_.size() - parser_->get().body().size;
    bytes_read_ += length;
    std::string chunk(chunk_buffer_.data(), length);

    const bool done = parser_->is_done();
    if (done) {
        finish_connection(true);
    }
    p_callback("", std::move(chunk), done);
}

void UpstreamResponse::read_body(BodyCallback p_callback) {
    read_body_step(std::make_shared<std::string>(), std::move(p_callback));
}

void UpstreamResponse::read_body_step(std::shared_ptr<std::string> p_body, BodyCallback p_callback) {
    auto self = shared_from_this();
    read_chunk([self, p_body, p_callback](const std::string& error, std::string chunk, bool done) {
        if (!error.empty()) {
            p_callback(error, std::move(*p_body));
            return;
        }
        p_body->append(chunk);
        if (done) {
            p_callback("", std::move(*p_body));
            return;
        }
        self->read_body_step(p_body, p_callback);
    });
}

void UpstreamResponse::finish_connection(bool p_clean) {
    if (finished_) {
        return;
    }
    finished_ = true;
    if (p_clean && parser_->keep_alive() && connection_->is_open()) {
        pool_->release(pool_key_, connection_);
    } else {
        connection_->close();
    }
}

// One request/response exchange with the upstream, up to the response headers.
class UpstreamExchange : public std::enable_shared_from_this<UpstreamExchange> {
public:
    UpstreamExchange(HttpClient& p_client,
                     std::shared_ptr<http::request<http::string_body>> p_request,
                     UpstreamHeadCallback p_callback)
        : client_(p_client),
          request_(std::move(p_request)),
          callback_(std::move(p_callback)),
          resolver_(p_client.io_context_) {}

    void start() {
        connection_ = client_.pool_->acquire(client_.target_.origin());
        if (connection_) {
            reused_ = true;
            LOG_DEBUG("Reusing pooled connection to " << client_.target_.origin());
            write_request();
            return;
        }
        connect_fresh();
    }

private:
    void connect_fresh() {
        reused_ = false;
        connection_ = client_.make_connection();
        auto self = shared_from_this();
        resolver_.async_resolve(client_.target_.host, std::to_string(client_.target_.port),
            [self](const beast::error_code& ec, tcp::resolver::results_type results) {
                self->handle_resolve(ec, results);
            });
    }

    void handle_resolve(const beast::error_code& ec, tcp::resolver::results_type results) {
        if (ec) {
            fail("Failed to resolve host", ec);
            return;
        }
        connection_->tcp_layer().expires_after(client_.timeout_);
        auto self = shared_from_this();
        connection_->tcp_layer().async_connect(results,
            [self](const beast::error_code& ec, const tcp::endpoint&) {
                self->handle_connect(ec);
            });
    }

    void handle_connect(const beast::error_code& ec) {
        if (ec) {
            fail("Failed to connect", ec);
            return;
        }
        auto* tls = connection_->tls_stream();
        if (!tls) {
            write_request();
            return;
        }

        const std::string& host = client_.target_.host;
        if (!SSL_set_tlsext_host_name(tls->native_handle(), host.c_str())) {
            beast::error_code sni_ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
            fail("Failed to set SNI", sni_ec);
            return;
        }
        tls->set_verify_callback(ssl::host_name_verification(host));

        connection_->tcp_layer().expires_after(client_.timeout_);
        auto self = shared_from_this();
        tls->async_handshake(ssl::stream_base::client,
            [self](const beast::error_code& ec) {
                self->handle_handshake(ec);
            });
    }

    void handle_handshake(const beast::error_code& ec) {
        if (ec) {
            fail("TLS handshake failed", ec);
            return;
        }
        write_request();
    }

    void write_request() {
        connection_->tcp_layer().expires_after(client_.timeout_);
        auto self = shared_from_this();
        connection_->with_stream([&](auto& stream) {
            http::async_write(stream, *request_,
                [self](const beast::error_code& ec, std::size_t bytes_transferred) {
                    self->handle_write(ec, bytes_transferred);
                });
        });
    }

    void handle_write(const beast::error_code& ec, std::size_t bytes_transferred) {
        if (ec) {
            if (retry_stale()) {
                return;
            }
            fail("Failed to write request", ec);
            return;
        }
        LOG_DEBUG("Sent " << bytes_transferred << " bytes to " << client_.target_.origin());

        parser_ = std::make_unique<UpstreamResponse::Parser>();
        parser_->body_limit((std::numeric_limits<std::uint64_t>::max)());
        if (request_->method() == http::verb::head) {
            parser_->skip(true);
        }

        connection_->tcp_layer().expires_after(client_.timeout_);
        auto self = shared_from_this();
        connection_->with_stream([&](auto& stream) {
            http::async_read_header(stream, connection_->buffer(), *parser_,
                [self](const beast::error_code& ec, std::size_t) {
                    self->handle_read_header(ec);
                });
        });
    }

    void handle_read_header(const beast::error_code& ec) {
        if (ec) {
            if (retry_stale()) {
                return;
            }
            fail("Failed to read response", ec);
            return;
        }
        auto response = std::make_shared<UpstreamResponse>(client_.pool_, client_.target_.origin(),
                                                           std::move(connection_), std::move(parser_),
                                                           client_.timeout_);
        callback_(std::move(response), "");
    }

    // A pooled connection the upstream already closed fails before any
    // response byte; such a request is safe to send again.
    bool retry_stale() {
        if (!reused_ || retried_) {
            return false;
        }
        retried_ = true;
        LOG_DEBUG("Pooled connection to " << client_.target_.origin() << " was stale, reconnecting");
        connection_->close();
        connection_->buffer().clear();
        connect_fresh();
        return true;
    }

    void fail(const std::string& p_stage, const beast::error_code& ec) {
        if (connection_) {
            connection_->close();
        }
        callback_(nullptr, p_stage + ": " + ec.message());
    }

    HttpClient& client_;
    std::shared_ptr<http::request<http::string_body>> request_;
    UpstreamHeadCallback callback_;
    tcp::resolver resolver_;
    UpstreamConnectionPtr connection_;
    std::unique_ptr<UpstreamResponse::Parser> parser_;
    bool reused_ = false;
    bool retried_ = false;
};

HttpClient::HttpClient(net::io_context& p_io_context, const GatewayConfig& p_config)
    : io_context_(p_io_context),
      ssl_context_(ssl::context::tls_client),
      target_(p_config.upstream),
      timeout_(p_config.upstream_timeout),
      pool_(std::make_shared<ConnectionPool>(p_config.max_idle_connections, p_config.max_idle_per_host,
                                             p_config.idle_timeout)) {
    ssl_context_.set_default_verify_paths();
    ssl_context_.set_verify_mode(ssl::verify_peer);
}

void HttpClient::send_request(std::shared_ptr<http::request<http::string_body>> p_request,
                              UpstreamHeadCallback p_callback) {
    auto exchange = std::make_shared<UpstreamExchange>(*this, std::move(p_request), std::move(p_callback));
    exchange->start();
}

UpstreamConnectionPtr HttpClient::make_connection() {
    if (target_.use_tls()) {
        return std::make_shared<UpstreamConnection>(io_context_, ssl_context_);
    }
    return std::make_shared<UpstreamConnection>(io_context_);
}
