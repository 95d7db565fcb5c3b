#pragma once

#include "forwarding_pipeline.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include <boost/optional.hpp>
#include <memory>
#include <string>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// Numeric addresses are used as is, names are resolved.
tcp::endpoint resolve_listen_endpoint(net::io_context& io_context, const std::string& host, uint16_t port);

class Http1ProxySession : public std::enable_shared_from_this<Http1ProxySession> {
public:
    Http1ProxySession(tcp::socket socket, ForwardingPipeline& pipeline);
    void start();

private:
    friend class Http1ResponseWriter;

    void read_request();
    void handle_request();
    void handle_read_error(beast::error_code ec);
    void do_close();

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    boost::optional<http::request_parser<http::string_body>> parser_;
    ForwardingPipeline& pipeline_;
    std::string peer_;
};

class Http1ProxyServer {
public:
    Http1ProxyServer(net::io_context& io_context, const std::string& host, uint16_t port,
                     ForwardingPipeline& pipeline);
    void start();
    void stop();
    uint16_t port() const;

private:
    void accept_connections();

    net::io_context& io_context_;
    tcp::acceptor acceptor_;
    ForwardingPipeline& pipeline_;
};
