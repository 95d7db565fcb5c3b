#include "forwarding_pipeline.hpp"
#include "active_request.hpp"
#include "http_client.hpp"
#include "../codec/content_codec.hpp"
#include "../hooks/hook_manager.hpp"
#include "../hooks/message_digest_hook.hpp"
#include "../trace/trace_hub.hpp"
#include "../utils/logger.h"

#include <chrono>

namespace {

constexpr std::size_t kLoggedBodyLimit = 2000;

std::string reason_for(int p_status) {
    return std::string(http::obsolete_reason(static_cast<http::status>(p_status)));
}

} // namespace

ResponseMode classify_response(std::string_view p_content_type) {
    if (p_content_type.find("text/event-stream") != std::string_view::npos ||
        p_content_type.find("text/plain") != std::string_view::npos) {
        return ResponseMode::Stream;
    }
    return ResponseMode::Buffer;
}

HeaderMap build_upstream_headers(const HeaderMap& p_inbound, const UpstreamTarget& p_target) {
    HeaderMap headers;
    for (const auto& [name, values] : p_inbound) {
        if (is_hop_by_hop_header(name) || name == "host" || name == "accept-encoding") {
            continue;
        }
        headers.set_values(name, values);
    }
    headers.set("accept-encoding", "identity");
    headers.set("host", p_target.authority());
    return headers;
}

HeaderMap mirror_response_headers(const HeaderMap& p_upstream) {
    HeaderMap headers;
    for (const auto& [name, values] : p_upstream) {
        if (is_hop_by_hop_header(name)) {
            continue;
        }
        headers.set_values(name, values);
    }
    return headers;
}

void apply_hook_headers(HeaderMap& p_headers, const HeaderMap& p_hook_headers) {
    for (const auto& [name, values] : p_hook_headers) {
        if (is_hop_by_hop_header(name)) {
            continue;
        }
        p_headers.erase(name);
        if (!values.empty()) {
            p_headers.set_values(name, values);
        }
    }
}

std::string mask_authorization(const std::string& p_value) {
    if (p_value.size() <= 20) {
        return "***";
    }
    return p_value.substr(0, 15) + "***" + p_value.substr(p_value.size() - 4);
}

// One request travelling through the pipeline. Owns itself through the
// callbacks it hands out until the exchange completes.
class ProxyExchange : public std::enable_shared_from_this<ProxyExchange> {
public:
    ProxyExchange(ForwardingPipeline& p_pipeline, InboundRequest p_request,
                  ResponseWriterPtr p_writer, ExchangeCompletion p_done)
        : pipeline_(p_pipeline),
          request_(std::move(p_request)),
          writer_(std::move(p_writer)),
          done_(std::move(p_done)),
          start_(std::chrono::steady_clock::now()) {}

    void start() {
        active_ = ActiveRequestManager::instance().create_request(request_.method, request_.target, writer_->peer());

        if (!pipeline_.is_proxied(request_.path())) {
            LOG_DEBUG("Rejecting " << request_.method << " " << request_.target << ": outside "
                      << pipeline_.proxied_prefix_);
            reply_error(404, "Only " + pipeline_.proxied_prefix_ + " endpoints are supported");
            return;
        }

        const UpstreamTarget& target = pipeline_.client_.target();
        url_ = target.origin() + request_.target;
        LOG_INFO("Forwarding " << request_.method << " " << request_.target << " -> " << url_);

        active_->set_state(RequestState::RequestHook);
        HookResult digested = apply_message_digest(request_.body, request_.headers);
        HookResult hooked = pipeline_.hooks_.run_request_hook(digested.body, digested.headers);
        request_.body = std::move(hooked.body);
        request_.headers = std::move(hooked.headers);

        forward();
    }

private:
    void forward() {
        const UpstreamTarget& target = pipeline_.client_.target();

        auto upstream_request = std::make_shared<http::request<http::string_body>>();
        upstream_request->version(11);
        upstream_request->method_string(request_.method);
        upstream_request->target(request_.target);
        for (const auto& [name, values] : build_upstream_headers(request_.headers, target)) {
            for (const auto& value : values) {
                upstream_request->insert(name, value);
            }
        }
        upstream_request->keep_alive(true);
        upstream_request->body() = request_.body;
        upstream_request->prepare_payload();

        const std::string authorization = request_.headers.get("authorization");
        if (!authorization.empty()) {
            LOG_DEBUG("Authorization: " << mask_authorization(authorization));
        }
        const std::string content_type = request_.headers.get("content-type");
        if (!content_type.empty()) {
            LOG_DEBUG("Content-Type: " << content_type);
        }

        active_->set_state(RequestState::Forwarding);
        auto self = shared_from_this();
        pipeline_.client_.send_request(upstream_request,
            [self](UpstreamResponsePtr response, const std::string& error) {
                self->handle_upstream_head(std::move(response), error);
            });
    }

    void handle_upstream_head(UpstreamResponsePtr p_response, const std::string& p_error) {
        if (!p_error.empty()) {
            LOG_ERROR("Upstream request failed: " << p_error);
            reply_error(502, "Failed to forward request");
            return;
        }

        latency_ = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
        upstream_ = std::move(p_response);
        upstream_headers_ = upstream_->headers();
        LOG_INFO("Upstream status " << upstream_->status_line() << " in " << latency_ << "s");

        response_headers_ = mirror_response_headers(upstream_headers_);
        const std::string content_type = upstream_headers_.get("content-type");

        // HEAD responses have no body to relay, so they always take the buffered path.
        if (request_.method != "HEAD" && classify_response(content_type) == ResponseMode::Stream) {
            LOG_DEBUG("Streaming response (Content-Type: " << content_type << ")");
            active_->set_state(RequestState::Streaming);
            auto self = shared_from_this();
            writer_->write_head(upstream_->status_code(), upstream_->reason(), response_headers_,
                [self](const std::string& error) {
                    if (!error.empty()) {
                        self->abort_client("Failed to write response head: " + error);
                        return;
                    }
                    self->stream_next();
                });
            return;
        }

        LOG_DEBUG("Buffering response body");
        active_->set_state(RequestState::Buffering);
        auto self = shared_from_this();
        upstream_->read_body([self](const std::string& error, std::string body) {
            self->handle_buffered_body(error, std::move(body));
        });
    }

    void stream_next() {
        auto self = shared_from_this();
        upstream_->read_chunk([self](const std::string& error, std::string chunk, bool done) {
            self->handle_stream_chunk(error, std::move(chunk), done);
        });
    }

    void handle_stream_chunk(const std::string& p_error, std::string p_chunk, bool p_done) {
        if (!p_error.empty()) {
            abort_client("Streaming copy error: " + p_error);
            return;
        }

        auto self = shared_from_this();
        if (!p_chunk.empty()) {
            streamed_bytes_ += p_chunk.size();
            writer_->write_chunk(std::move(p_chunk), [self, p_done](const std::string& error) {
                if (!error.empty()) {
                    self->abort_client("Failed to write chunk: " + error);
                    return;
                }
                if (p_done) {
                    self->finish_stream();
                } else {
                    self->stream_next();
                }
            });
            return;
        }

        if (p_done) {
            finish_stream();
        } else {
            stream_next();
        }
    }

    void finish_stream() {
        auto self = shared_from_this();
        writer_->finish([self](const std::string& error) {
            if (!error.empty()) {
                self->abort_client("Failed to finish stream: " + error);
                return;
            }
            LOG_INFO("Streamed " << self->streamed_bytes_ << " bytes");
            self->publish_trace(streaming_placeholder(self->streamed_bytes_));
            self->complete(self->request_.keep_alive, RequestState::Completed);
        });
    }

    void handle_buffered_body(const std::string& p_error, std::string p_body) {
        if (!p_error.empty()) {
            LOG_ERROR("Failed to read upstream response: " << p_error);
            reply_error(500, "Failed to read response");
            return;
        }

        LOG_DEBUG("Read " << upstream_->bytes_read() << " body bytes from upstream");
        const bool head_only = request_.method == "HEAD";
        const std::string encoding = upstream_headers_.get("content-encoding");
        if (!encoding.empty() && !head_only) {
            DecodeResult decoded = ContentCodec::decompress(p_body, encoding);
            if (decoded.ok()) {
                p_body = std::move(decoded.body);
                response_headers_.erase("content-encoding");
            } else {
                LOG_WARN("Failed to decode " << encoding << " response, forwarding as received: " << decoded.error);
            }
        }

        active_->set_state(RequestState::ResponseHook);
        HookResult hooked = pipeline_.hooks_.run_response_hook(p_body, response_headers_);
        apply_hook_headers(response_headers_, hooked.headers);
        response_body_ = std::move(hooked.body);
        // A HEAD reply carries the length the matching GET would have.
        if (head_only && upstream_headers_.contains("content-length")) {
            response_headers_.set("content-length", upstream_headers_.get("content-length"));
        }

        LOG_DEBUG("Response body length: " << response_body_.size() << " bytes");
        if (response_body_.size() > kLoggedBodyLimit) {
            LOG_DEBUG("Body: " << response_body_.substr(0, kLoggedBodyLimit) << "... (truncated, "
                      << response_body_.size() << " bytes total)");
        } else {
            LOG_DEBUG("Body: " << response_body_);
        }

        auto self = shared_from_this();
        writer_->write_response(upstream_->status_code(), upstream_->reason(), response_headers_, response_body_,
            [self](const std::string& error) {
                if (!error.empty()) {
                    self->abort_client("Failed to write response: " + error);
                    return;
                }
                self->publish_trace(self->response_body_);
                self->complete(self->request_.keep_alive, RequestState::Completed);
            });
    }

    void publish_trace(std::string p_response_body) {
        Trace trace;
        trace.id = generate_trace_id();
        trace.timestamp = std::chrono::system_clock::now();
        trace.method = request_.method;
        trace.url = url_;
        trace.status = upstream_->status_line();
        trace.latency = latency_;
        trace.session_id = upstream_headers_.get("x-session-id");
        trace.request_headers = request_.headers;
        trace.request_body = request_.body;
        trace.response_body = std::move(p_response_body);

        if (!trace.session_id.empty()) {
            LOG_DEBUG("Session ID: " << trace.session_id);
        }
        pipeline_.hub_.broadcast(std::move(trace));
    }

    void reply_error(int p_status, const std::string& p_text) {
        auto self = shared_from_this();
        ForwardingPipeline::send_error(writer_, p_status, p_text, [self](const std::string& error) {
            if (!error.empty()) {
                self->abort_client("Failed to write error response: " + error);
                return;
            }
            self->complete(self->request_.keep_alive, RequestState::Failed);
        });
    }

    void abort_client(const std::string& p_reason) {
        LOG_WARN(request_.method << " " << request_.target << ": " << p_reason);
        writer_->abort();
        complete(false, RequestState::Failed);
    }

    void complete(bool p_reusable, RequestState p_state) {
        if (active_) {
            ActiveRequestManager::instance().complete_request(active_->get_id(), p_state);
        }
        if (done_) {
            auto done = std::move(done_);
            done_ = nullptr;
            done(p_reusable);
        }
    }

    ForwardingPipeline& pipeline_;
    InboundRequest request_;
    ResponseWriterPtr writer_;
    ExchangeCompletion done_;
    std::shared_ptr<ActiveRequest> active_;

    std::chrono::steady_clock::time_point start_;
    std::string url_;
    double latency_ = 0.0;
    UpstreamResponsePtr upstream_;
    HeaderMap upstream_headers_;
    HeaderMap response_headers_;
    std::string response_body_;
    std::uint64_t streamed_bytes_ = 0;
};

ForwardingPipeline::ForwardingPipeline(const GatewayConfig& p_config, HttpClient& p_client,
                                       const HookManager& p_hooks, TraceHub& p_hub)
    : client_(p_client),
      hooks_(p_hooks),
      hub_(p_hub),
      proxied_prefix_(p_config.proxied_prefix),
      max_body_bytes_(p_config.max_body_bytes) {}

void ForwardingPipeline::handle(InboundRequest p_request, ResponseWriterPtr p_writer, ExchangeCompletion p_done) {
    auto exchange = std::make_shared<ProxyExchange>(*this, std::move(p_request), std::move(p_writer), std::move(p_done));
    exchange->start();
}

bool ForwardingPipeline::is_proxied(std::string_view p_path) const {
    return p_path.substr(0, proxied_prefix_.size()) == proxied_prefix_;
}

void ForwardingPipeline::send_error(const ResponseWriterPtr& p_writer, int p_status, const std::string& p_text,
                                    WriteCallback p_done) {
    HeaderMap headers;
    headers.set("content-type", "text/plain; charset=utf-8");
    headers.set("x-content-type-options", "nosniff");
    p_writer->write_response(p_status, reason_for(p_status), headers, p_text + "\n", std::move(p_done));
}
