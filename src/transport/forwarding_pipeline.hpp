#pragma once

#include "common.h"
#include "../core/config.h"

#include <functional>
#include <memory>
#include <string>
#include <string_view>

class HttpClient;
class HookManager;
class TraceHub;

enum class ResponseMode {
    Stream,  // copied to the client as it arrives, never decoded or hooked
    Buffer   // read in full, decoded, run through the response hook
};

// text/event-stream and text/plain responses are streamed.
ResponseMode classify_response(std::string_view p_content_type);

// Headers sent upstream: the inbound set without hop-by-hop headers, with
// Accept-Encoding forced to identity and Host set to the upstream authority.
HeaderMap build_upstream_headers(const HeaderMap& p_inbound, const UpstreamTarget& p_target);

// Upstream response headers minus hop-by-hop and framing headers.
HeaderMap mirror_response_headers(const HeaderMap& p_upstream);

// Replaces every key returned by a response hook. Hop-by-hop keys are ignored.
void apply_hook_headers(HeaderMap& p_headers, const HeaderMap& p_hook_headers);

// "Bearer sk-abcdefghijk***wxyz" for logging.
std::string mask_authorization(const std::string& p_value);

// Receives whether the client connection may carry another request.
using ExchangeCompletion = std::function<void(bool p_reusable)>;

// Drives one proxied exchange from inbound request to client response and
// trace, independent of the front end that accepted it.
class ForwardingPipeline {
public:
    ForwardingPipeline(const GatewayConfig& p_config, HttpClient& p_client,
                       const HookManager& p_hooks, TraceHub& p_hub);

    void handle(InboundRequest p_request, ResponseWriterPtr p_writer, ExchangeCompletion p_done);

    bool is_proxied(std::string_view p_path) const;
    std::size_t max_body_bytes() const { return max_body_bytes_; }

    // Plain-text error reply used before a request reaches the upstream.
    static void send_error(const ResponseWriterPtr& p_writer, int p_status, const std::string& p_text,
                           WriteCallback p_done);

private:
    friend class ProxyExchange;

    HttpClient& client_;
    const HookManager& hooks_;
    TraceHub& hub_;
    std::string proxied_prefix_;
    std::size_t max_body_bytes_;
};
