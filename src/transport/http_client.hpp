#pragma once

#include "common.h"
#include "../core/config.h"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <array>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

// One upstream connection, plain or TLS, with its read buffer. Leftover bytes
// in the buffer travel with the connection when it is pooled.
class UpstreamConnection {
public:
    explicit UpstreamConnection(net::io_context& p_io_context);
    UpstreamConnection(net::io_context& p_io_context, ssl::context& p_ssl_context);

    beast::tcp_stream& tcp_layer();
    beast::ssl_stream<beast::tcp_stream>* tls_stream() { return tls_.get(); }
    bool is_open();
    void close();

    template <class Fn>
    void with_stream(Fn&& p_fn) {
        if (tls_) {
            p_fn(*tls_);
        } else {
            p_fn(*plain_);
        }
    }

    beast::flat_buffer& buffer() { return buffer_; }

    std::chrono::steady_clock::time_point last_used;

private:
    std::unique_ptr<beast::tcp_stream> plain_;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls_;
    beast::flat_buffer buffer_;
};

using UpstreamConnectionPtr = std::shared_ptr<UpstreamConnection>;

// Idle keep-alive connections, bounded in total, per host and by age.
class ConnectionPool {
public:
    ConnectionPool(std::size_t p_max_idle, std::size_t p_max_idle_per_host, std::chrono::seconds p_idle_timeout);

    // Most recently used idle connection for the key, or nullptr.
    UpstreamConnectionPtr acquire(const std::string& p_key);
    void release(const std::string& p_key, UpstreamConnectionPtr p_connection);

    std::size_t idle_count() const;

private:
    void prune_locked(std::chrono::steady_clock::time_point p_now);
    void evict_oldest_locked();

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::deque<UpstreamConnectionPtr>> idle_;
    std::size_t total_idle_ = 0;
    std::size_t max_idle_;
    std::size_t max_idle_per_host_;
    std::chrono::seconds idle_timeout_;
};

// Status and headers of an upstream response whose body is still on the wire.
class UpstreamResponse : public std::enable_shared_from_this<UpstreamResponse> {
public:
    using Parser = http::response_parser<http::buffer_body>;
    using ChunkCallback = std::function<void(const std::string& p_error, std::string p_chunk, bool p_done)>;
    using BodyCallback = std::function<void(const std::string& p_error, std::string p_body)>;

    UpstreamResponse(std::shared_ptr<ConnectionPool> p_pool, std::string p_pool_key,
                     UpstreamConnectionPtr p_connection, std::unique_ptr<Parser> p_parser,
                     std::chrono::seconds p_timeout);
    ~UpstreamResponse();

    int status_code() const;
    std::string reason() const;
    // "200 OK"
    std::string status_line() const;
    HeaderMap headers() const;

    // Delivers body bytes as they arrive; p_done is set with the last piece.
    void read_chunk(ChunkCallback p_callback);
    // Reads the remaining body in full.
    void read_body(BodyCallback p_callback);

    std::uint64_t bytes_read() const { return bytes_read_; }

private:
    void handle_chunk(beast::error_code p_ec, ChunkCallback p_callback);
    void read_body_step(std::shared_ptr<std::string> p_body, BodyCallback p_callback);
    void finish_connection(bool p_clean);

    std::shared_ptr<ConnectionPool> pool_;
    std::string pool_key_;
    UpstreamConnectionPtr connection_;
    std::unique_ptr<Parser> parser_;
    std::chrono::seconds timeout_;
    std::array<char, 16384> chunk_buffer_;
    std::uint64_t bytes_read_ = 0;
    bool finished_ = false;
};

using UpstreamResponsePtr = std::shared_ptr<UpstreamResponse>;
using UpstreamHeadCallback = std::function<void(UpstreamResponsePtr p_response, const std::string& p_error)>;

// Pooled HTTP/1.1 client for the fixed upstream origin.
class HttpClient {
public:
    HttpClient(net::io_context& p_io_context, const GatewayConfig& p_config);
    ~HttpClient() = default;

    // Sends the request and reports once the response headers are in. A
    // pooled connection that turns out to be stale before any response byte
    // is replaced by a fresh one, once.
    void send_request(std::shared_ptr<http::request<http::string_body>> p_request,
                      UpstreamHeadCallback p_callback);

    const UpstreamTarget& target() const { return target_; }

private:
    friend class UpstreamExchange;

    UpstreamConnectionPtr make_connection();

    net::io_context& io_context_;
    ssl::context ssl_context_;
    UpstreamTarget target_;
    std::chrono::seconds timeout_;
    std::shared_ptr<ConnectionPool> pool_;
};
