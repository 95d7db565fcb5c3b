#include "session.h"
#include "forwarding_pipeline.hpp"

#include <algorithm>
#include <cstring>

// HTTP/2 side of the response writer: every call becomes nghttp2 work on
// the owning session's strand.
class Http2ResponseWriter : public ResponseWriter {
public:
    Http2ResponseWriter(std::shared_ptr<Session> session, int32_t stream_id)
        : session_(std::move(session)), stream_id_(stream_id) {}

    void write_response(int status, const std::string&, const HeaderMap& headers,
                        std::string body, WriteCallback done) override {
        session_->submit_response(stream_id_, status, headers, std::move(body), true, std::move(done));
    }

    void write_head(int status, const std::string&, const HeaderMap& headers,
                    WriteCallback done) override {
        session_->submit_response(stream_id_, status, headers, "", false, std::move(done));
    }

    void write_chunk(std::string data, WriteCallback done) override {
        session_->submit_data(stream_id_, std::move(data), false, std::move(done));
    }

    void finish(WriteCallback done) override {
        session_->submit_data(stream_id_, "", true, std::move(done));
    }

    void abort() override {
        session_->reset_stream(stream_id_);
    }

    std::string peer() const override { return session_->peer(); }

private:
    std::shared_ptr<Session> session_;
    int32_t stream_id_;
};

namespace {

std::string endpoint_string(const boost::asio::ip::tcp::socket& socket) {
    boost::system::error_code ec;
    auto endpoint = socket.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // namespace

Session::Session(boost::asio::ip::tcp::socket p_socket, ForwardingPipeline& p_pipeline)
    : executor_(p_socket.get_executor()), pipeline_(p_pipeline), use_ssl_(false) {
    peer_ = endpoint_string(p_socket);
    plain_socket_ = std::make_unique<boost::asio::ip::tcp::socket>(std::move(p_socket));
}

Session::Session(boost::asio::ip::tcp::socket p_socket, boost::asio::ssl::context& ssl_context,
                 ForwardingPipeline& p_pipeline)
    : executor_(p_socket.get_executor()), pipeline_(p_pipeline), use_ssl_(true) {
    peer_ = endpoint_string(p_socket);
    ssl_socket_ = std::make_unique<boost::asio::ssl::stream<boost::asio::ip::tcp::socket>>(std::move(p_socket), ssl_context);
}

Session::~Session() {
    if (session_) {
        nghttp2_session_del(session_);
    }
}

void Session::start() {
    LOG_DEBUG("Start nghttp2 session for " << peer_);
    if (use_ssl_) {
        handle_ssl_handshake();
    } else {
        setup_nghttp2();
        write_data();
        read_data();
    }
}

void Session::handle_ssl_handshake() {
    auto self(shared_from_this());
    ssl_socket_->async_handshake(boost::asio::ssl::stream_base::server,
        [this, self](boost::system::error_code ec) {
            if (!ec) {
                LOG_DEBUG("SSL handshake completed");
                setup_nghttp2();
                write_data();
                read_data();
            } else {
                LOG_ERROR("SSL handshake with " << peer_ << " failed: " << ec.message());
            }
        });
}

void Session::setup_nghttp2() {
    nghttp2_session_callbacks* callbacks;
    nghttp2_session_callbacks_new(&callbacks);

    nghttp2_session_callbacks_set_on_frame_recv_callback(callbacks, on_frame_recv_cb);
    nghttp2_session_callbacks_set_on_header_callback(callbacks, on_header_cb);
    nghttp2_session_callbacks_set_on_data_chunk_recv_callback(callbacks, on_data_chunk_recv_cb);
    nghttp2_session_callbacks_set_on_stream_close_callback(callbacks, on_stream_close_cb);
    nghttp2_session_callbacks_set_send_callback(callbacks, send_cb);

    nghttp2_session_server_new(&session_, callbacks, this);
    nghttp2_session_callbacks_del(callbacks);

    // Send initial SETTINGS frame
    nghttp2_settings_entry iv[1] = {
        {NGHTTP2_SETTINGS_MAX_CONCURRENT_STREAMS, 100}
    };
    nghttp2_submit_settings(session_, NGHTTP2_FLAG_NONE, iv, 1);
}

void Session::read_data() {
    auto self(shared_from_this());
    auto handler = [this, self](boost::system::error_code ec, std::size_t length) {
        if (ec) {
            LOG_DEBUG("HTTP/2 connection " << peer_ << " closed: " << ec.message());
            closed_ = true;
            fail_pending("connection closed");
            return;
        }
        ssize_t read = nghttp2_session_mem_recv(session_, read_buffer_.data(), length);
        if (read < 0) {
            LOG_ERROR("nghttp2_session_mem_recv error: " << nghttp2_strerror((int)read));
            closed_ = true;
            fail_pending("protocol error");
            return;
        }
        write_data();
        read_data();
    };

    if (use_ssl_) {
        ssl_socket_->async_read_some(boost::asio::buffer(read_buffer_), handler);
    } else {
        plain_socket_->async_read_some(boost::asio::buffer(read_buffer_), handler);
    }
}

void Session::write_data() {
    if (closed_) {
        return;
    }
    int rv = nghttp2_session_send(session_);
    if (rv != 0) {
        LOG_ERROR("nghttp2_session_send failed: " << nghttp2_strerror(rv));
        closed_ = true;
        fail_pending("protocol error");
        return;
    }
    flush_output();
}

void Session::flush_output() {
    if (writing_ || pending_output_.empty()) {
        return;
    }
    output_.swap(pending_output_);
    pending_output_.clear();
    writing_ = true;

    auto self(shared_from_this());
    auto handler = [this, self](boost::system::error_code ec, std::size_t) {
        writing_ = false;
        output_.clear();
        if (ec) {
            LOG_ERROR("Write error to " << peer_ << ": " << ec.message());
            closed_ = true;
            fail_pending("connection closed");
            return;
        }
        write_data();
    };

    if (use_ssl_) {
        boost::asio::async_write(*ssl_socket_, boost::asio::buffer(output_), handler);
    } else {
        boost::asio::async_write(*plain_socket_, boost::asio::buffer(output_), handler);
    }
}

void Session::fail_pending(const std::string& p_reason) {
    for (auto& [stream_id, stream] : streams_data_) {
        if (stream.pending_done) {
            complete_write(stream, p_reason);
        }
    }
}

void Session::complete_write(StreamData& p_stream, const std::string& p_error) {
    auto done = std::move(p_stream.pending_done);
    p_stream.pending_done = nullptr;
    // Never re-enter nghttp2 from inside its own callbacks.
    boost::asio::post(executor_, [done, p_error]() { done(p_error); });
}

void Session::submit_response(int32_t p_stream_id, int p_status, const HeaderMap& p_headers,
                              std::string p_body, bool p_end, WriteCallback p_done) {
    auto self(shared_from_this());
    boost::asio::post(executor_,
        [this, self, p_stream_id, p_status, headers = p_headers, body = std::move(p_body), p_end,
         done = std::move(p_done)]() mutable {
            auto it = streams_data_.find(p_stream_id);
            if (closed_ || it == streams_data_.end()) {
                done("stream closed");
                return;
            }
            auto& stream = it->second;

            std::vector<std::pair<std::string, std::string>> fields;
            fields.emplace_back(":status", std::to_string(p_status));
            for (const auto& [name, values] : headers) {
                for (const auto& value : values) {
                    fields.emplace_back(name, value);
                }
            }
            if (p_end && !headers.contains("content-length")) {
                fields.emplace_back("content-length", std::to_string(body.size()));
            }
            std::vector<nghttp2_nv> nva;
            nva.reserve(fields.size());
            for (const auto& [name, value] : fields) {
                nva.push_back(make_nv(name, value));
            }

            int rv;
            if (p_end && body.empty()) {
                rv = nghttp2_submit_response(session_, p_stream_id, nva.data(), nva.size(), nullptr);
            } else {
                stream.outgoing = std::move(body);
                stream.offset = 0;
                stream.end = p_end;
                nghttp2_data_provider data_prd;
                data_prd.source.ptr = nullptr;
                data_prd.read_callback = data_source_read_cb;
                rv = nghttp2_submit_response(session_, p_stream_id, nva.data(), nva.size(), &data_prd);
            }
            if (rv != 0) {
                done(nghttp2_strerror(rv));
                return;
            }
            LOG_DEBUG("Response submitted on stream " << p_stream_id << " with status " << p_status);

            if (p_end && !stream.outgoing.empty()) {
                // Completes once the body has been handed to nghttp2.
                stream.pending_done = std::move(done);
                write_data();
                return;
            }
            write_data();
            done("");
        });
}

void Session::submit_data(int32_t p_stream_id, std::string p_data, bool p_end, WriteCallback p_done) {
    auto self(shared_from_this());
    boost::asio::post(executor_,
        [this, self, p_stream_id, data = std::move(p_data), p_end, done = std::move(p_done)]() mutable {
            auto it = streams_data_.find(p_stream_id);
            if (closed_ || it == streams_data_.end()) {
                done("stream closed");
                return;
            }
            auto& stream = it->second;
            if (data.empty() && !p_end) {
                done("");
                return;
            }

            if (stream.offset > 0) {
                stream.outgoing.erase(0, stream.offset);
                stream.offset = 0;
            }
            stream.outgoing.append(data);
            stream.end = stream.end || p_end;
            stream.pending_done = std::move(done);

            if (stream.deferred) {
                stream.deferred = false;
                nghttp2_session_resume_data(session_, p_stream_id);
            }
            write_data();
        });
}

void Session::reset_stream(int32_t p_stream_id) {
    auto self(shared_from_this());
    boost::asio::post(executor_, [this, self, p_stream_id]() {
        if (closed_ || streams_data_.find(p_stream_id) == streams_data_.end()) {
            return;
        }
        nghttp2_submit_rst_stream(session_, NGHTTP2_FLAG_NONE, p_stream_id, NGHTTP2_INTERNAL_ERROR);
        write_data();
    });
}

void Session::dispatch_request(int32_t p_stream_id, StreamData& p_stream) {
    if (p_stream.dispatched) {
        return;
    }
    p_stream.dispatched = true;

    auto writer = std::make_shared<Http2ResponseWriter>(shared_from_this(), p_stream_id);
    if (p_stream.rejected) {
        LOG_WARN("HTTP/2 " << p_stream.method << " " << p_stream.path << " from " << peer_ << ": body too large");
        ForwardingPipeline::send_error(writer, 413, "Request body too large", [p_stream_id](const std::string& error) {
            if (!error.empty()) {
                LOG_DEBUG("Error reply on stream " << p_stream_id << " failed: " << error);
            }
        });
        return;
    }

    InboundRequest inbound;
    inbound.method = p_stream.method;
    inbound.target = p_stream.path;
    inbound.headers = p_stream.headers;
    inbound.body = std::move(p_stream.body);
    inbound.version = 20;
    inbound.keep_alive = true;
    if (!p_stream.authority.empty() && !inbound.headers.contains("host")) {
        inbound.headers.set("host", p_stream.authority);
    }

    LOG_INFO("HTTP/2 " << inbound.method << " " << inbound.target << " from " << peer_
             << " (body: " << inbound.body.size() << " bytes)");

    // Leave the nghttp2 callback before the pipeline starts writing.
    auto self(shared_from_this());
    boost::asio::post(executor_, [this, self, inbound = std::move(inbound), writer]() mutable {
        pipeline_.handle(std::move(inbound), writer, [](bool) {});
    });
}

// Static callbacks
int Session::on_frame_recv_cb(nghttp2_session* session, const nghttp2_frame* frame,
                                    void* user_data) {
    Session* sess = static_cast<Session*>(user_data);

    const bool request_headers = frame->hd.type == NGHTTP2_HEADERS && frame->headers.cat == NGHTTP2_HCAT_REQUEST;
    const bool data = frame->hd.type == NGHTTP2_DATA;
    if ((request_headers || data) && (frame->hd.flags & NGHTTP2_FLAG_END_STREAM)) {
        auto it = sess->streams_data_.find(frame->hd.stream_id);
        if (it != sess->streams_data_.end()) {
            sess->dispatch_request(frame->hd.stream_id, it->second);
        }
    }
    return 0;
}

int Session::on_header_cb(nghttp2_session* session, const nghttp2_frame* frame,
                            const uint8_t* name, size_t namelen, const uint8_t* value, size_t valuelen,
                            uint8_t flags, void* user_data) {
    Session* sess = static_cast<Session*>(user_data);
    if(frame->hd.type == NGHTTP2_HEADERS && frame->headers.cat == NGHTTP2_HCAT_REQUEST) {
        auto& stream_data = sess->streams_data_[frame->hd.stream_id];
        auto header_name = std::string(reinterpret_cast<const char*>(name), namelen);
        auto header_value = std::string(reinterpret_cast<const char*>(value), valuelen);
        if(header_name == ":method")
            stream_data.method = header_value;
        else if(header_name == ":path")
            stream_data.path = header_value;
        else if(header_name == ":authority")
            stream_data.authority = header_value;
        else if(!header_name.empty() && header_name[0] != ':')
            stream_data.headers.add(header_name, header_value);
    }

    return 0;
}

int Session::on_data_chunk_recv_cb(nghttp2_session* session, uint8_t flags,
                                    int32_t stream_id, const uint8_t* data,
                                    size_t len, void* user_data) {
    Session* sess = static_cast<Session*>(user_data);
    auto it = sess->streams_data_.find(stream_id);
    if (it == sess->streams_data_.end()) {
        return 0;
    }
    auto& stream_data = it->second;
    if (stream_data.rejected) {
        return 0;
    }
    if (stream_data.body.size() + len > sess->pipeline_.max_body_bytes()) {
        stream_data.rejected = true;
        stream_data.body.clear();
        return 0;
    }
    stream_data.body.append((const char*)data, len);
    LOG_DEBUG("Received " << len << " bytes on stream " << stream_id << ", total " << stream_data.body.size());
    return 0;
}

int Session::on_stream_close_cb(nghttp2_session* session, int32_t stream_id,
                                uint32_t error_code, void* user_data) {
    Session* sess = static_cast<Session*>(user_data);
    auto it = sess->streams_data_.find(stream_id);
    if (it != sess->streams_data_.end()) {
        if (it->second.pending_done) {
            sess->complete_write(it->second, "stream closed");
        }
        sess->streams_data_.erase(it);
    }
    LOG_DEBUG("Stream " << stream_id << " closed (error " << error_code << ")");
    return 0;
}

ssize_t Session::send_cb(nghttp2_session* session, const uint8_t* data,
                         size_t length, int flags, void* user_data) {
    Session* sess = static_cast<Session*>(user_data);
    sess->pending_output_.append(reinterpret_cast<const char*>(data), length);
    return static_cast<ssize_t>(length);
}

ssize_t Session::data_source_read_cb(nghttp2_session* session, int32_t stream_id, uint8_t* buf,
                                     size_t length, uint32_t* data_flags, nghttp2_data_source* source,
                                     void* user_data) {
    Session* sess = static_cast<Session*>(user_data);
    auto it = sess->streams_data_.find(stream_id);
    if (it == sess->streams_data_.end()) {
        return NGHTTP2_ERR_TEMPORAL_CALLBACK_FAILURE;
    }
    auto& stream = it->second;

    size_t available = stream.outgoing.size() - stream.offset;
    size_t len = std::min(available, length);
    std::memcpy(buf, stream.outgoing.data() + stream.offset, len);
    stream.offset += len;

    if (stream.offset < stream.outgoing.size()) {
        return static_cast<ssize_t>(len);
    }

    stream.outgoing.clear();
    stream.offset = 0;
    if (stream.pending_done) {
        sess->complete_write(stream, "");
    }
    if (stream.end) {
        *data_flags |= NGHTTP2_DATA_FLAG_EOF;
        return static_cast<ssize_t>(len);
    }
    if (len == 0) {
        stream.deferred = true;
        return NGHTTP2_ERR_DEFERRED;
    }
    return static_cast<ssize_t>(len);
}
