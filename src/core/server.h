#pragma once

#include "../transport/common.h"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <memory>

class Session;
class ForwardingPipeline;

// HTTP/2 proxy listener. Cleartext connections speak prior-knowledge h2;
// with a certificate and key the listener negotiates h2 over TLS with ALPN.
class Server {
public:
    explicit Server(boost::asio::io_context& p_io_context, const std::string& p_host, uint16_t p_port,
                    ForwardingPipeline& p_pipeline);
    explicit Server(boost::asio::io_context& p_io_context, const std::string& p_host, uint16_t p_port,
                    const std::string& cert_file, const std::string& key_file,
                    ForwardingPipeline& p_pipeline);
    ~Server() = default;

    void start();
    void stop();
    uint16_t port() const;
private:
    void accept_connection();
    void setup_ssl_context(const std::string& cert_file, const std::string& key_file);

private:
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::io_context& io_context_;
    ForwardingPipeline& pipeline_;
    std::unique_ptr<boost::asio::ssl::context> ssl_context_;
    bool use_ssl_ = false;
};
