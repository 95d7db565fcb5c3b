#pragma once

#include "header_map.hpp"

#include <nlohmann/json.hpp>
#include <nghttp2/nghttp2.h>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
using json = nlohmann::json;

struct HttpResponse {
    int status_code = 200;
    std::string body;
    std::string content_type = "application/json";
    HeaderMap headers;

    HttpResponse() = default;
    HttpResponse(int status, const std::string& response_body, const std::string& type = "application/json")
        : status_code(status), body(response_body), content_type(type) {}
};

using ResponseSender = std::function<void(const HttpResponse& response)>;
using RequestCB = std::function<void(std::string_view p_method,
                                     std::string_view p_path,
                                     std::string_view p_body,
                                     ResponseSender p_sender)>;
using RouteKey = std::pair<std::string, std::string>; // {method, path}

// A client request as read by one of the proxy front ends.
struct InboundRequest {
    std::string method;
    std::string target;          // path and query, as received
    HeaderMap headers;
    std::string body;
    unsigned version = 11;       // 10, 11 or 20
    bool keep_alive = true;

    std::string path() const { return target.substr(0, target.find('?')); }
};

// Empty on success.
using WriteCallback = std::function<void(const std::string& p_error)>;

// The client side of one proxied exchange. Each front end writes HTTP/1.1 or
// HTTP/2 frames behind this interface. Calls are made one at a time; the next
// call waits for the previous callback.
class ResponseWriter {
public:
    virtual ~ResponseWriter() = default;

    // Complete response with a known body.
    virtual void write_response(int p_status, const std::string& p_reason, const HeaderMap& p_headers,
                                std::string p_body, WriteCallback p_done) = 0;

    // Status and headers of a response whose body follows with write_chunk.
    virtual void write_head(int p_status, const std::string& p_reason, const HeaderMap& p_headers,
                            WriteCallback p_done) = 0;
    virtual void write_chunk(std::string p_data, WriteCallback p_done) = 0;
    virtual void finish(WriteCallback p_done) = 0;

    // Tears down the client stream after a failure mid-response.
    virtual void abort() = 0;
    virtual std::string peer() const = 0;
};

using ResponseWriterPtr = std::shared_ptr<ResponseWriter>;

inline nghttp2_nv make_nv(const std::string& name, const std::string& value) {
    return {(uint8_t*)name.c_str(), (uint8_t*)value.c_str(), name.size(),
            value.size(), NGHTTP2_NV_FLAG_NONE};
}
