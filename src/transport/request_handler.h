#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <map>

#include "utils/logger.h"
#include "common.h"

// Exact-match route table for the trace listener.
class RequestHandler {
    public:
        RequestHandler() = default;

        void register_route(std::string_view p_method,
                            std::string_view p_path,
                            RequestCB p_callback);
        void handle_request(std::string_view p_method,
                                    std::string_view p_path,
                                    std::string_view p_body,
                                    ResponseSender p_sender) const;
        bool has_path(std::string_view p_path) const;

        static json create_error_response(int code, const std::string& message);
    private:
        void handle_default_routes(std::string_view p_method,
                                            std::string_view p_path,
                                            std::string_view p_body,
                                            ResponseSender sender) const;

    private:
        std::map<RouteKey, RequestCB> route_handlers_;
};
