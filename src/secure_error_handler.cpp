#include "secure_error_handler.hpp"
#include "service_logger.hpp"
#include "json_response.hpp"

#include <algorithm>
#include <cctype>

namespace streamguard {

namespace json = boost::json;

SecureErrorHandler::SecureErrorHandler(const SecurityPolicy& policy, AuditLogger& audit)
    : expose_detailed_(policy.expose_detailed_errors)
    , audit_(audit)
{}

std::string SecureErrorHandler::generic_message(unsigned status) {
    switch (status) {
        case 400: return "Invalid request";
        case 401: return "Authentication required";
        case 403: return "Access denied";
        case 404: return "Resource not found";
        case 405: return "Method not allowed";
        case 409: return "Request conflict";
        case 413: return "Request too large";
        case 422: return "Invalid request data";
        case 429: return "Too many requests";
        case 500: return "Internal server error";
        case 502:
        case 503: return "Service temporarily unavailable";
        case 504: return "Request timeout";
        default: return "An error occurred";
    }
}

const std::vector<std::regex>& SecureErrorHandler::sensitive_patterns() {
    static const std::vector<std::regex> patterns = [] {
        const auto flags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
        std::vector<std::regex> p;
        // Source file paths, unix and windows.
        p.emplace_back(R"(/[a-z0-9_\-./]*\.(?:cpp|cxx|cc|hpp|hh|h|c|go|py|js|ts|java|rb|php)(?::\d+)?)", flags);
        p.emplace_back(R"([a-z]:\\[a-z0-9_\-.\\]*\.(?:cpp|cxx|cc|hpp|hh|h|c|go|py|js|ts|java|rb|php)(?::\d+)?)", flags);
        // Stack-trace markers.
        p.emplace_back(R"(goroutine \d+ \[[^\]]+\]:)", flags);
        p.emplace_back(R"(\bat \S+:\d+)", flags);
        p.emplace_back(R"(\.go:\d+)", flags);
        p.emplace_back(R"(\b\d+#\s)", flags);
        p.emplace_back(R"(0x[0-9a-f]{6,})", flags);
        // Datastore connection strings.
        p.emplace_back(R"((?:postgres|postgresql|mysql|mongodb|redis|rediss|tcp|unix)://\S+)", flags);
        p.emplace_back(R"(host=\S+\s+port=\d+)", flags);
        // Loopback host:port.
        p.emplace_back(R"(127\.0\.0\.1:\d+)", flags);
        p.emplace_back(R"(localhost:\d+)", flags);
        p.emplace_back(R"(\[::1\]:\d+)", flags);
        // Internal service names.
        p.emplace_back(R"(internal[_-]?service)", flags);
        p.emplace_back(R"(backend[_-]?server)", flags);
        // Credential fields.
        p.emplace_back(R"(password[=:]\S+)", flags);
        p.emplace_back(R"(token[=:]\S+)", flags);
        p.emplace_back(R"(api[_-]?key[=:]\S+)", flags);
        p.emplace_back(R"(secret[=:]\S+)", flags);
        return p;
    }();
    return patterns;
}

std::string SecureErrorHandler::redact(const std::string& text) {
    std::string out = text;
    for (const auto& re : sensitive_patterns()) {
        out = std::regex_replace(out, re, "[REDACTED]");
    }
    return out;
}

bool SecureErrorHandler::contains_sensitive_data(const std::string& text) {
    const auto& patterns = sensitive_patterns();
    return std::any_of(patterns.begin(), patterns.end(),
                       [&text](const std::regex& re) { return std::regex_search(text, re); });
}

bool SecureErrorHandler::is_generic_message(const std::string& message) {
    static const char* const indicators[] = {
        ".go:", ".py:", ".cpp:", ".hpp:", ".cc:", ".h:",
        "goroutine", "panic:", "runtime error:", "terminate called", "what():",
        "sql:", "connection refused", "connection failed",
        "password=", "password:", "token=", "token:", "secret=", "secret:",
        "api_key=", "apikey=",
        "localhost:", "127.0.0.1:",
        "internal_service", "internal-service", "backend_server", "backend-server",
        "/home/", "/var/", "/etc/", "/usr/", "c:\\", "d:\\",
    };

    std::string lower = message;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const char* indicator : indicators) {
        if (lower.find(indicator) != std::string::npos) {
            return false;
        }
    }
    return true;
}

json::object SecureErrorHandler::error_body(unsigned status, const std::string& message,
                                            const RequestContext& ctx) const {
    json::object obj;
    obj["success"] = false;
    obj["error"] = message;
    obj["code"] = std::string(http::obsolete_reason(static_cast<http::status>(status)));
    if (!ctx.request_id.empty()) {
        obj["request_id"] = ctx.request_id;
    }
    obj["timestamp"] = utc_timestamp();
    return obj;
}

void SecureErrorHandler::log_error(unsigned status, const std::string& internal_error,
                                   const RequestContext& ctx, const std::string& context) const {
    auto level = ServiceLogger::Level::INFO;
    auto event = ServiceLogger::Event::REQUEST;
    if (status >= 500) {
        level = ServiceLogger::Level::ERROR;
        event = ServiceLogger::Event::SERVER_ERROR;
    } else if (status >= 400) {
        level = ServiceLogger::Level::WARNING;
        event = ServiceLogger::Event::CLIENT_ERROR;
    }

    std::string msg = "status=" + std::to_string(status) +
                      " request_id=" + (ctx.request_id.empty() ? "unknown" : ctx.request_id) +
                      " method=" + ctx.request.method +
                      " path=" + ctx.request.path;
    if (!context.empty()) msg += " context=" + context;
    if (!internal_error.empty()) msg += " error=" + internal_error;

    ServiceLogger::log(level, event, ctx.request.client_address, msg);
}

http::response<http::string_body> SecureErrorHandler::respond(http::status status,
                                                              const std::string& internal_error,
                                                              const RequestContext& ctx,
                                                              const std::string& context) const {
    auto code = static_cast<unsigned>(status);
    return respond_with_message(status, generic_message(code), internal_error, ctx, context);
}

http::response<http::string_body> SecureErrorHandler::respond_with_message(http::status status,
                                                                           const std::string& generic_message,
                                                                           const std::string& internal_error,
                                                                           const RequestContext& ctx,
                                                                           const std::string& context) const {
    auto code = static_cast<unsigned>(status);
    log_error(code, internal_error, ctx, context);

    std::string message = generic_message;
    if (message.empty() || !is_generic_message(message) || contains_sensitive_data(message)) {
        message = SecureErrorHandler::generic_message(code);
    }

    auto body = error_body(code, message, ctx);
    if (expose_detailed_ && !internal_error.empty()) {
        body["detail"] = redact(internal_error);
    }

    auto res = make_json_response(status, ctx.version, body);
    res.keep_alive(ctx.keep_alive);
    return res;
}

http::response<http::string_body> SecureErrorHandler::respond_validation(const std::vector<ValidationError>& errors,
                                                                         const RequestContext& ctx) const {
    std::string summary;
    for (const auto& e : errors) {
        if (!summary.empty()) summary += ",";
        summary += e.field + ":" + e.code;
    }
    log_error(400, "validation failed [" + summary + "]", ctx, "validation");

    auto body = error_body(400, generic_message(400), ctx);
    json::array list;
    for (const auto& e : errors) {
        list.push_back(to_json(e));
    }
    body["validation"] = std::move(list);

    auto res = make_json_response(http::status::bad_request, ctx.version, body);
    res.keep_alive(ctx.keep_alive);
    return res;
}

http::response<http::string_body> SecureErrorHandler::respond_panic(const std::string& error,
                                                                    const std::string& stack,
                                                                    const RequestContext& ctx) const {
    audit_.log_panic_recovered(ctx.request_id, ctx.request, error, stack);

    ServiceLogger::log(ServiceLogger::Level::CRITICAL, ServiceLogger::Event::PANIC_RECOVERED,
                       ctx.request.client_address,
                       "request_id=" + (ctx.request_id.empty() ? std::string("unknown") : ctx.request_id) +
                       " method=" + ctx.request.method + " path=" + ctx.request.path +
                       " error=" + error + " stack=" + stack);

    auto res = make_json_response(http::status::internal_server_error, ctx.version,
                                  error_body(500, generic_message(500), ctx));
    res.keep_alive(false);
    return res;
}

}
