#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include <atomic>
#include <boost/beast/http.hpp>

#include "security_policy.hpp"
#include "request_context.hpp"
#include "ip_access_controller.hpp"
#include "request_size_limiter.hpp"
#include "input_validator.hpp"
#include "input_sanitizer.hpp"
#include "security_headers.hpp"
#include "audit_logger.hpp"
#include "secure_error_handler.hpp"

namespace streamguard {

namespace http = boost::beast::http;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

// One step of the security chain. Returns a response to stop the chain, or
// nullopt to hand the request to the next stage.
class PipelineStage {
public:
    virtual ~PipelineStage() = default;

    virtual const char* name() const = 0;
    virtual std::optional<Response> process(const Request& req, RequestContext& ctx) = 0;
};

class IpAccessStage : public PipelineStage {
public:
    IpAccessStage(const IpAccessController& controller, AuditLogger& audit, const SecureErrorHandler& errors)
        : controller_(controller), audit_(audit), errors_(errors) {}

    const char* name() const override { return "ip_access"; }
    std::optional<Response> process(const Request& req, RequestContext& ctx) override;

private:
    const IpAccessController& controller_;
    AuditLogger& audit_;
    const SecureErrorHandler& errors_;
};

class SizeLimitStage : public PipelineStage {
public:
    SizeLimitStage(const RequestSizeLimiter& limiter, AuditLogger& audit, const SecureErrorHandler& errors)
        : limiter_(limiter), audit_(audit), errors_(errors) {}

    const char* name() const override { return "size_limit"; }
    std::optional<Response> process(const Request& req, RequestContext& ctx) override;

private:
    const RequestSizeLimiter& limiter_;
    AuditLogger& audit_;
    const SecureErrorHandler& errors_;
};

// Aggregates every field error into a single 400.
class ValidationStage : public PipelineStage {
public:
    ValidationStage(const InputValidator& validator, AuditLogger& audit, const SecureErrorHandler& errors)
        : validator_(validator), audit_(audit), errors_(errors) {}

    const char* name() const override { return "validation"; }
    std::optional<Response> process(const Request& req, RequestContext& ctx) override;

private:
    const InputValidator& validator_;
    AuditLogger& audit_;
    const SecureErrorHandler& errors_;
};

/**
 * Null/control characters and malformed encodings reject everywhere.
 * Injection signatures reject in route segments and are only audited in
 * query values. Traversal sequences are stripped from the path and audited.
 */
class SanitizationStage : public PipelineStage {
public:
    SanitizationStage(const InputSanitizer& sanitizer, AuditLogger& audit, const SecureErrorHandler& errors)
        : sanitizer_(sanitizer), audit_(audit), errors_(errors) {}

    const char* name() const override { return "sanitization"; }
    std::optional<Response> process(const Request& req, RequestContext& ctx) override;

private:
    const InputSanitizer& sanitizer_;
    AuditLogger& audit_;
    const SecureErrorHandler& errors_;

    Response reject(RequestContext& ctx, const SanitizationError& error, const std::string& field);
};

/**
 * Fixed-order request security chain wired in front of every handler:
 * IP access, size limits, validation, sanitization, then the handler.
 * Every response, including rejections and recovered failures, gets the
 * security headers and X-Request-ID.
 *
 * Components are built once from the policy and only read afterwards, so
 * one pipeline serves all sessions concurrently.
 */
class RequestPipeline {
public:
    using Handler = std::function<Response(const Request&, RequestContext&)>;

    RequestPipeline(const SecurityPolicy& policy, AuditLogger& audit);

    // Replacement components for tests.
    RequestPipeline(const SecurityPolicy& policy, AuditLogger& audit,
                    std::unique_ptr<IpAccessController> access,
                    std::unique_ptr<InputValidator> validator,
                    std::unique_ptr<InputSanitizer> sanitizer);

    RequestPipeline(const RequestPipeline&) = delete;
    RequestPipeline& operator=(const RequestPipeline&) = delete;

    /**
     * Runs the chain. Returns nullopt only when the request was cancelled
     * before a response was produced.
     */
    std::optional<Response> process(const Request& req, const std::string& peer_addr,
                                    const Handler& handler,
                                    std::shared_ptr<std::atomic<bool>> cancelled = nullptr) const;

    // 413 for a body cut off by the parser's read ceiling, or the access
    // stage's 403 when the client is denied.
    Response reject_oversized_body(const http::request_header<>& header, const std::string& peer_addr,
                                   uint64_t limit) const;

    const RequestSizeLimiter& size_limiter() const { return limiter_; }
    const SecureErrorHandler& errors() const { return errors_; }
    const SecurityHeaders& headers() const { return headers_; }
    AuditLogger& audit() const { return audit_; }

private:
    AuditLogger& audit_;
    std::unique_ptr<IpAccessController> access_;
    RequestSizeLimiter limiter_;
    std::unique_ptr<InputValidator> validator_;
    std::unique_ptr<InputSanitizer> sanitizer_;
    SecurityHeaders headers_;
    SecureErrorHandler errors_;
    std::vector<std::unique_ptr<PipelineStage>> stages_;

    RequestContext make_context(const http::request_header<>& header, const std::string& peer_addr) const;
    void finish(Response& res, const RequestContext& ctx) const;
};

}
