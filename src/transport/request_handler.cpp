#include "request_handler.h"
#include "../utils/logger.h"

void RequestHandler::register_route(std::string_view p_method,
                                    std::string_view p_path,
                                    RequestCB p_callback) {
    RouteKey key = {std::string(p_method), std::string(p_path)};
    route_handlers_[key] = std::move(p_callback);
    LOG_DEBUG("Registered route: " << p_method << " " << p_path);
}

void RequestHandler::handle_request(std::string_view p_method,
                                    std::string_view p_path,
                                    std::string_view p_body,
                                    ResponseSender p_sender) const {
    LOG_DEBUG("Processing " << p_method << " " << p_path);
    try
    {
        RouteKey key = {std::string(p_method), std::string(p_path)};
        auto it = route_handlers_.find(key);
        if (it != route_handlers_.end()) {
            it->second(p_method, p_path, p_body, p_sender);
            return;
        }
        handle_default_routes(p_method, p_path, p_body, p_sender);
    }
    catch(const std::exception& e)
    {
        LOG_ERROR("Route " << p_method << " " << p_path << " failed: " << e.what());
        json error = create_error_response(500, "Internal server error");
        p_sender(HttpResponse(500, error.dump()));
    }
}

bool RequestHandler::has_path(std::string_view p_path) const {
    for (const auto& [key, callback] : route_handlers_) {
        if (key.second == p_path) {
            return true;
        }
    }
    return false;
}

json RequestHandler::create_error_response(int code, const std::string& message)
{
    return {
        {"error", true},
        {"code", code},
        {"message", message}
    };
}

void RequestHandler::handle_default_routes(std::string_view p_method,
                                            std::string_view p_path,
                                            std::string_view p_body,
                                            ResponseSender sender) const {
    if (has_path(p_path)) {
        LOG_WARN("Method " << p_method << " not allowed for " << p_path);
        json error = create_error_response(405, "Method not allowed");
        sender(HttpResponse(405, error.dump()));
        return;
    }
    LOG_WARN("No route found for: " << p_method << " " << p_path);
    json error = create_error_response(404, "Route not found");
    sender(HttpResponse(404, error.dump()));
}
