#include "api_router.hpp"

namespace streamguard {

ApiRouter::ApiRouter(const ServerConfig& config, VideoLookup& lookup, const AuditLogger& audit,
                     const SecureErrorHandler& errors)
    : errors_(errors)
    , health_handler_(config, lookup, audit)
    , video_handler_(config, lookup, errors)
{}

http::response<http::string_body> ApiRouter::handle_cors_preflight(const RequestContext& ctx) {
    http::response<http::string_body> res{http::status::no_content, ctx.version};
    res.keep_alive(ctx.keep_alive);
    res.prepare_payload();
    return res;
}

http::response<http::string_body> ApiRouter::handle(const http::request<http::string_body>& req,
                                                    RequestContext& ctx) {
    http::response<http::string_body> res;

    if (req.method() == http::verb::options) {
        res = handle_cors_preflight(ctx);
    } else if (req.method() != http::verb::get) {
        res = errors_.respond(http::status::method_not_allowed,
                              "method " + ctx.request.method + " not allowed", ctx, "router");
        res.set(http::field::allow, "GET, OPTIONS");
    } else {
        switch (ctx.route.kind) {
            case ResourceKind::Root:
                res = health_handler_.handle_root(ctx);
                break;
            case ResourceKind::Health:
                res = health_handler_.handle_health(ctx);
                break;
            case ResourceKind::Metrics:
                res = health_handler_.handle_metrics(ctx);
                break;
            case ResourceKind::Video:
                res = video_handler_.handle_video(ctx);
                break;
            case ResourceKind::Playlist:
                res = video_handler_.handle_playlist(ctx);
                break;
            case ResourceKind::Stream:
                res = video_handler_.handle_stream(req, ctx);
                break;
            case ResourceKind::NotFound:
                res = errors_.respond(http::status::not_found, "no route for " + ctx.clean_path, ctx, "router");
                break;
        }
    }

    add_cors_headers(res);
    return res;
}

}
