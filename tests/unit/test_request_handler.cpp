#include "transport/request_handler.h"

#include <cassert>
#include <stdexcept>

namespace {

HttpResponse dispatch(const RequestHandler& p_handler, std::string_view p_method, std::string_view p_path) {
    HttpResponse captured;
    p_handler.handle_request(p_method, p_path, "", [&captured](const HttpResponse& response) {
        captured = response;
    });
    return captured;
}

} // namespace

static void test_registered_route() {
    RequestHandler handler;
    handler.register_route("GET", "/traces",
        [](std::string_view, std::string_view, std::string_view, ResponseSender p_sender) {
            p_sender(HttpResponse(200, "[]"));
        });

    HttpResponse response = dispatch(handler, "GET", "/traces");
    assert(response.status_code == 200);
    assert(response.body == "[]");
    assert(response.content_type == "application/json");
    assert(handler.has_path("/traces"));
    assert(!handler.has_path("/health"));
}

static void test_unknown_path_and_method() {
    RequestHandler handler;
    handler.register_route("GET", "/health",
        [](std::string_view, std::string_view, std::string_view, ResponseSender p_sender) {
            p_sender(HttpResponse(200, "{}"));
        });

    HttpResponse missing = dispatch(handler, "GET", "/nope");
    assert(missing.status_code == 404);
    json body = json::parse(missing.body);
    assert(body["error"] == true);
    assert(body["code"] == 404);
    assert(body["message"] == "Route not found");

    HttpResponse wrong_method = dispatch(handler, "POST", "/health");
    assert(wrong_method.status_code == 405);
    assert(json::parse(wrong_method.body)["code"] == 405);
}

static void test_throwing_route_becomes_500() {
    RequestHandler handler;
    handler.register_route("GET", "/boom",
        [](std::string_view, std::string_view, std::string_view, ResponseSender) {
            throw std::runtime_error("boom");
        });

    HttpResponse response = dispatch(handler, "GET", "/boom");
    assert(response.status_code == 500);
    assert(json::parse(response.body)["message"] == "Internal server error");
}

int main() {
    Logger::instance().set_level(LogLevel::Off);
    test_registered_route();
    test_unknown_path_and_method();
    test_throwing_route_becomes_500();
    return 0;
}
