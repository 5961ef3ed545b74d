#include "filest/network/http_router.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace filest {
namespace network {

namespace {

HttpResponse json_error(HttpStatus status, const std::string& message, const char* code) {
    HttpResponse response(status);
    nlohmann::json body = {{"success", false}, {"error", message}, {"code", code}};
    response.set_body(body.dump());
    response.set_header("Content-Type", "application/json");
    return response;
}

} // namespace

Route::Route(HttpMethod m, std::string p, RouteHandler h)
    : method(m), path(std::move(p)), handler(std::move(h)) {
}

void HttpRouter::get(const std::string& path, RouteHandler handler) {
    add_route(HttpMethod::GET, path, std::move(handler));
}

void HttpRouter::post(const std::string& path, RouteHandler handler) {
    add_route(HttpMethod::POST, path, std::move(handler));
}

void HttpRouter::add_route(HttpMethod method, const std::string& path, RouteHandler handler) {
    routes_.emplace_back(method, path, std::move(handler));
    spdlog::debug("Registered route: {} {}", HttpMethodUtils::to_string(method), path);
}

void HttpRouter::use(Middleware middleware) {
    middlewares_.push_back(std::move(middleware));
}

HttpResponse HttpRouter::handle_request(const HttpRequest& request) const {
    HttpContext ctx(request);
    HttpResponse response(HttpStatus::OK);

    try {
        for (const auto& middleware : middlewares_) {
            if (!middleware(ctx, response)) {
                return response;
            }
        }

        const std::string path = request.path();
        bool path_known = false;
        for (const auto& route : routes_) {
            if (!route.matches_path(path)) {
                continue;
            }
            if (route.method != request.method) {
                path_known = true;
                continue;
            }
            return route.handler(ctx);
        }

        if (path_known) {
            return json_error(HttpStatus::METHOD_NOT_ALLOWED, "Method not allowed", "METHOD_NOT_ALLOWED");
        }
        return json_error(HttpStatus::NOT_FOUND, "No route for " + path, "NOT_FOUND");
    } catch (const std::exception& e) {
        spdlog::error("Route handler threw exception: {}", e.what());
        return json_error(HttpStatus::INTERNAL_SERVER_ERROR, "Internal Server Error", "IO_FAILURE");
    }
}

} // namespace network
} // namespace filest
