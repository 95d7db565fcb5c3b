#pragma once

#include "common.h"
#include "../utils/logger.h"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <nghttp2/nghttp2.h>
#include <array>
#include <functional>
#include <unordered_map>

class ForwardingPipeline;

// HTTP/2 server connection. nghttp2 state is only touched from the socket's
// strand; response writers post onto it.
class Session : public std::enable_shared_from_this<Session> {
    public:
        explicit Session(boost::asio::ip::tcp::socket p_socket, ForwardingPipeline& p_pipeline);
        explicit Session(boost::asio::ip::tcp::socket p_socket, boost::asio::ssl::context& ssl_context,
                         ForwardingPipeline& p_pipeline);
        ~Session();

        void start();

        // Entry points for Http2ResponseWriter, safe from any thread.
        void submit_response(int32_t p_stream_id, int p_status, const HeaderMap& p_headers,
                             std::string p_body, bool p_end, WriteCallback p_done);
        void submit_data(int32_t p_stream_id, std::string p_data, bool p_end, WriteCallback p_done);
        void reset_stream(int32_t p_stream_id);
        const std::string& peer() const { return peer_; }

    private:
        // nghttp2 callbacks
        static int on_frame_recv_cb(nghttp2_session* session, const nghttp2_frame* frame,
                                     void* user_data);
        static int on_header_cb(nghttp2_session* session, const nghttp2_frame* frame,
                                 const uint8_t* name, size_t namelen, const uint8_t* value, size_t valuelen,
                                 uint8_t flags, void* user_data);
        static int on_data_chunk_recv_cb(nghttp2_session* session, uint8_t flags,
                                         int32_t stream_id, const uint8_t* data,
                                         size_t len, void* user_data);
        static int on_stream_close_cb(nghttp2_session* session, int32_t stream_id,
                                       uint32_t error_code, void* user_data);
        static ssize_t send_cb(nghttp2_session* session, const uint8_t* data,
                               size_t length, int flags, void* user_data);
        static ssize_t data_source_read_cb(nghttp2_session* session, int32_t stream_id, uint8_t* buf,
                                           size_t length, uint32_t* data_flags, nghttp2_data_source* source,
                                           void* user_data);

        // Session management
        void setup_nghttp2();
        void read_data();
        void write_data();
        void flush_output();
        void handle_ssl_handshake();
        void fail_pending(const std::string& p_reason);

        // Request handling
        struct StreamData
        {
            std::string method;
            std::string path;
            std::string authority;
            HeaderMap headers;
            std::string body;
            bool dispatched = false;
            bool rejected = false;

            // response side
            std::string outgoing;
            size_t offset = 0;
            bool end = false;
            bool deferred = false;
            WriteCallback pending_done;
        };

        void dispatch_request(int32_t p_stream_id, StreamData& p_stream);
        void complete_write(StreamData& p_stream, const std::string& p_error);

    private:
        nghttp2_session* session_ = nullptr;
        std::unique_ptr<boost::asio::ip::tcp::socket> plain_socket_;
        std::unique_ptr<boost::asio::ssl::stream<boost::asio::ip::tcp::socket>> ssl_socket_;
        boost::asio::any_io_executor executor_;
        ForwardingPipeline& pipeline_;
        std::array<uint8_t, 8192> read_buffer_;
        std::unordered_map<int32_t, StreamData> streams_data_;
        std::string pending_output_;
        std::string output_;
        std::string peer_;
        bool writing_ = false;
        bool closed_ = false;
        bool use_ssl_ = false;
};
