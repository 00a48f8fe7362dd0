#include "request_pipeline.hpp"
#include "route_matcher.hpp"
#include "service_logger.hpp"
#include "metrics.hpp"

#include <charconv>
#include <boost/stacktrace.hpp>

namespace streamguard {

namespace {

// Holds the in-flight gauge up for the lifetime of one pipeline run.
class InFlightGuard {
public:
    InFlightGuard() {
        MetricsRegistry::instance().increment_gauge(metric::kRequestsInFlight);
    }
    ~InFlightGuard() {
        MetricsRegistry::instance().decrement_gauge(metric::kRequestsInFlight);
    }
    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;
};

std::optional<Response> abandoned() {
    MetricsRegistry::instance().increment_counter(metric::kRequestsCancelled);
    return std::nullopt;
}

}

// --- Stages ---

std::optional<Response> IpAccessStage::process(const Request&, RequestContext& ctx) {
    if (!controller_.is_enabled()) {
        return std::nullopt;
    }

    const auto& addr = ctx.request.client_address;
    std::string reason;
    if (controller_.is_blocked(addr)) {
        reason = "ip_blocklisted";
    } else if (!controller_.is_allowed(addr)) {
        reason = "ip_not_in_allowlist";
    } else {
        return std::nullopt;
    }

    audit_.log_access_denied(ctx.request_id, ctx.request, reason);
    MetricsRegistry::instance().increment_counter(metric::kAccessDenied);
    return errors_.respond(http::status::forbidden, "client address rejected: " + reason, ctx, name());
}

std::optional<Response> SizeLimitStage::process(const Request& req, RequestContext& ctx) {
    auto violation = limiter_.check(req);
    if (!violation) {
        return std::nullopt;
    }

    std::string dimension = to_string(violation->dimension);
    audit_.log_size_limit_exceeded(ctx.request_id, ctx.request, dimension, violation->size, violation->limit);
    MetricsRegistry::instance().increment_counter(metric::kSizeLimitExceeded);

    std::string internal = dimension + " size " + std::to_string(violation->size) +
                           " exceeds limit " + std::to_string(violation->limit);
    if (!violation->header_name.empty()) {
        internal += " (header " + violation->header_name + ")";
    }
    return errors_.respond(http::status::payload_too_large, internal, ctx, name());
}

std::optional<Response> ValidationStage::process(const Request&, RequestContext& ctx) {
    auto errors = validator_.validate_all(ctx.params);
    if (errors.empty()) {
        return std::nullopt;
    }

    for (const auto& e : errors) {
        audit_.log_validation_failure(ctx.request_id, ctx.request, e.field, e.value, e.message);
    }
    MetricsRegistry::instance().increment_counter(metric::kValidationFailures);
    return errors_.respond_validation(errors, ctx);
}

Response SanitizationStage::reject(RequestContext& ctx, const SanitizationError& error, const std::string& field) {
    audit_.log_sanitization_triggered(ctx.request_id, ctx.request, to_string(error.category), field);
    MetricsRegistry::instance().increment_counter(metric::kSanitizationRejected);
    return errors_.respond(http::status::bad_request, field + ": " + error.message + " [" + error.code + "]",
                           ctx, name());
}

std::optional<Response> SanitizationStage::process(const Request&, RequestContext& ctx) {
    auto path = sanitizer_.sanitize_path(ctx.raw_path);
    if (!path.ok()) {
        return reject(ctx, path.error(), "path");
    }
    ctx.clean_path = path.value();

    std::string decoded_path;
    if (!url_decode(ctx.raw_path, decoded_path, false)) {
        decoded_path = ctx.raw_path;
    }
    if (ctx.clean_path != decoded_path) {
        audit_.log_sanitization_triggered(ctx.request_id, ctx.request, "path_traversal", "path");
        ServiceLogger::log(ServiceLogger::Level::WARNING, ServiceLogger::Event::SANITIZATION,
                           ctx.request.client_address,
                           "request_id=" + ctx.request_id + " traversal sequences stripped from path");
    }

    // Route segments feed the handler directly: any finding rejects.
    for (const auto& segment : ctx.route.segments) {
        if (sanitizer_.contains_null_or_control(segment)) {
            return reject(ctx, {"path", SanitizationCategory::NullOrControl,
                                "path segment contains null bytes or control characters",
                                "NULL_OR_CONTROL_CHARS"}, "path");
        }
        if (auto threat = sanitizer_.detect_malicious_patterns(segment)) {
            audit_.log_suspicious_activity(ctx.request_id, ctx.request, to_string(*threat),
                                           "malicious pattern in path segment");
            MetricsRegistry::instance().increment_counter(metric::kSuspiciousActivity);
            return errors_.respond(http::status::bad_request,
                                   std::string("path segment matched ") + to_string(*threat),
                                   ctx, name());
        }
    }

    for (const auto& [key, value] : ctx.raw_query_pairs) {
        for (const auto* raw : {&key, &value}) {
            auto outcome = sanitizer_.sanitize_url(*raw);
            if (!outcome.ok()) {
                return reject(ctx, outcome.error(), "query." + key);
            }
            if (auto threat = sanitizer_.detect_malicious_patterns(outcome.value())) {
                audit_.log_suspicious_activity(ctx.request_id, ctx.request, to_string(*threat),
                                               "malicious pattern in query parameter " + key);
                MetricsRegistry::instance().increment_counter(metric::kSuspiciousActivity);
                ServiceLogger::log(ServiceLogger::Level::WARNING, ServiceLogger::Event::SUSPICIOUS_ACTIVITY,
                                   ctx.request.client_address,
                                   "request_id=" + ctx.request_id + " category=" + to_string(*threat) +
                                   " param=" + key);
            }
        }
    }

    return std::nullopt;
}

// --- RequestPipeline ---

RequestPipeline::RequestPipeline(const SecurityPolicy& policy, AuditLogger& audit)
    : RequestPipeline(policy, audit,
                      std::make_unique<CidrAccessController>(policy.ip_allowlist, policy.ip_blocklist,
                                                             policy.enable_ip_control),
                      std::make_unique<DefaultInputValidator>(policy),
                      std::make_unique<DefaultInputSanitizer>())
{}

RequestPipeline::RequestPipeline(const SecurityPolicy& policy, AuditLogger& audit,
                                 std::unique_ptr<IpAccessController> access,
                                 std::unique_ptr<InputValidator> validator,
                                 std::unique_ptr<InputSanitizer> sanitizer)
    : audit_(audit)
    , access_(std::move(access))
    , limiter_(policy)
    , validator_(std::move(validator))
    , sanitizer_(std::move(sanitizer))
    , headers_(policy)
    , errors_(policy, audit)
{
    stages_.push_back(std::make_unique<IpAccessStage>(*access_, audit_, errors_));
    stages_.push_back(std::make_unique<SizeLimitStage>(limiter_, audit_, errors_));
    stages_.push_back(std::make_unique<ValidationStage>(*validator_, audit_, errors_));
    stages_.push_back(std::make_unique<SanitizationStage>(*sanitizer_, audit_, errors_));
}

RequestContext RequestPipeline::make_context(const http::request_header<>& header,
                                             const std::string& peer_addr) const {
    RequestContext ctx;
    ctx.version = header.version();
    ctx.request.client_address = extract_client_address(header, peer_addr);
    ctx.request.method = std::string(header.method_string());

    auto ua = header.find(http::field::user_agent);
    if (ua != header.end()) {
        ctx.request.user_agent = std::string(ua->value());
    }

    populate_context(std::string(header.target()), ctx);
    ctx.request.path = ctx.raw_path;
    return ctx;
}

void RequestPipeline::finish(Response& res, const RequestContext& ctx) const {
    headers_.apply(res);
    res.set(http::field::server, "streamguard");
    if (!ctx.request_id.empty()) {
        res.set("X-Request-ID", ctx.request_id);
    }
}

std::optional<Response> RequestPipeline::process(const Request& req, const std::string& peer_addr,
                                                 const Handler& handler,
                                                 std::shared_ptr<std::atomic<bool>> cancelled) const {
    MetricsRegistry::instance().increment_counter(metric::kRequestsTotal);
    InFlightGuard in_flight;

    RequestContext ctx;
    ctx.version = req.version();
    ctx.request.client_address = strip_port(peer_addr);
    ctx.request.method = std::string(req.method_string());
    ctx.request.path = std::string(req.target());

    Response res;
    try {
        ctx = make_context(req.base(), peer_addr);
        ctx.keep_alive = req.keep_alive();
        ctx.cancelled = std::move(cancelled);
        ctx.request_id = audit_.generate_request_id();

        bool short_circuit = false;
        for (const auto& stage : stages_) {
            if (ctx.is_cancelled()) {
                return abandoned();
            }
            if (auto rejected = stage->process(req, ctx)) {
                res = std::move(*rejected);
                short_circuit = true;
                break;
            }
        }

        if (!short_circuit) {
            if (ctx.is_cancelled()) {
                return abandoned();
            }
            res = handler(req, ctx);
            if (ctx.is_cancelled()) {
                return abandoned();
            }
        }
    } catch (const std::exception& e) {
        MetricsRegistry::instance().increment_counter(metric::kPanicsRecovered);
        res = errors_.respond_panic(e.what(), boost::stacktrace::to_string(boost::stacktrace::stacktrace()), ctx);
    } catch (...) {
        MetricsRegistry::instance().increment_counter(metric::kPanicsRecovered);
        res = errors_.respond_panic("non-standard exception", boost::stacktrace::to_string(boost::stacktrace::stacktrace()), ctx);
    }

    finish(res, ctx);
    return res;
}

Response RequestPipeline::reject_oversized_body(const http::request_header<>& header,
                                                const std::string& peer_addr, uint64_t limit) const {
    MetricsRegistry::instance().increment_counter(metric::kRequestsTotal);

    RequestContext ctx = make_context(header, peer_addr);
    ctx.keep_alive = false;
    ctx.request_id = audit_.generate_request_id();

    // Access control still runs first: a denied client gets 403, not 413.
    Request head_only(header);
    if (auto denied = stages_.front()->process(head_only, ctx)) {
        finish(*denied, ctx);
        return std::move(*denied);
    }
    MetricsRegistry::instance().increment_counter(metric::kSizeLimitExceeded);

    // The parser stopped at the ceiling, so the full size is unknown; report
    // the declared length when there is one.
    int64_t size = static_cast<int64_t>(limit) + 1;
    auto cl = header.find(http::field::content_length);
    if (cl != header.end()) {
        auto value = cl->value();
        int64_t declared = 0;
        auto r = std::from_chars(value.data(), value.data() + value.size(), declared);
        if (r.ec == std::errc() && declared > size) {
            size = declared;
        }
    }

    audit_.log_size_limit_exceeded(ctx.request_id, ctx.request, to_string(SizeDimension::Body),
                                   size, static_cast<int64_t>(limit));
    auto res = errors_.respond(http::status::payload_too_large,
                               "body exceeds read limit " + std::to_string(limit), ctx, "size_limit");
    finish(res, ctx);
    return res;
}

}
