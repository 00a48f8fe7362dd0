#pragma once

#include <boost/beast/http.hpp>

#include "server_config.hpp"
#include "request_context.hpp"
#include "secure_error_handler.hpp"
#include "video_lookup.hpp"
#include "audit_logger.hpp"
#include "handlers/health_handler.hpp"
#include "handlers/video_handler.hpp"

namespace streamguard {

namespace http = boost::beast::http;

// Downstream handler installed behind the request pipeline. Dispatches on
// the route the pipeline matched; GET only, OPTIONS answers the CORS
// preflight.
class ApiRouter {
public:
    ApiRouter(const ServerConfig& config, VideoLookup& lookup, const AuditLogger& audit,
              const SecureErrorHandler& errors);

    http::response<http::string_body> handle(const http::request<http::string_body>& req, RequestContext& ctx);

private:
    const SecureErrorHandler& errors_;
    HealthHandler health_handler_;
    VideoHandler video_handler_;

    http::response<http::string_body> handle_cors_preflight(const RequestContext& ctx);

    template<class Body>
    void add_cors_headers(http::response<Body>& res) {
        res.set(http::field::access_control_allow_origin, "*");
        res.set(http::field::access_control_allow_methods, "GET, OPTIONS");
        res.set(http::field::access_control_allow_headers, "Content-Type, X-Request-ID");
        res.set(http::field::access_control_expose_headers, "X-Request-ID");
        res.set(http::field::access_control_max_age, "86400");
    }
};

}
