#pragma once

#include "filest/network/http_types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace filest {
namespace network {

/**
 * @brief What middleware and handlers see of a request
 */
struct HttpContext {
    const HttpRequest& request;

    explicit HttpContext(const HttpRequest& req) : request(req) {}
};

using RouteHandler = std::function<HttpResponse(const HttpContext&)>;

/**
 * @brief Runs before the handler; return false to answer with @p response instead
 */
using Middleware = std::function<bool(const HttpContext&, HttpResponse&)>;

struct Route {
    HttpMethod method;
    std::string path;       // matched whole, e.g. "/api/upload/init"
    RouteHandler handler;

    Route(HttpMethod m, std::string p, RouteHandler h);

    bool matches_path(const std::string& request_path) const { return request_path == path; }
};

/**
 * @brief Method + path dispatch for the upload API
 *
 * Routes match the decoded path exactly; the query string is left to the
 * handler (HttpRequest::query_param). A path that matches some route under
 * a different method gets 405, anything else 404.
 *
 * @code
 * HttpRouter router;
 * router.use(auth_middleware);
 * router.post("/api/upload/init", [&](const HttpContext& ctx) { ... });
 * HttpResponse res = router.handle_request(request);
 * @endcode
 */
class HttpRouter {
public:
    void get(const std::string& path, RouteHandler handler);
    void post(const std::string& path, RouteHandler handler);

    /**
     * @brief Add middleware, executed in registration order before any handler
     */
    void use(Middleware middleware);

    /**
     * @brief Dispatch @p request; handler exceptions become 500
     */
    HttpResponse handle_request(const HttpRequest& request) const;

private:
    void add_route(HttpMethod method, const std::string& path, RouteHandler handler);

    std::vector<Route> routes_;
    std::vector<Middleware> middlewares_;
};

} // namespace network
} // namespace filest
