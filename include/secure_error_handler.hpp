#pragma once

#include <string>
#include <vector>
#include <regex>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include "security_policy.hpp"
#include "audit_logger.hpp"
#include "input_validator.hpp"
#include "request_context.hpp"

namespace streamguard {

namespace http = boost::beast::http;

/**
 * Turns internal failures into client responses that carry only a generic
 * message chosen by status family. The full error goes to the operational
 * log; recovered panics also go to the audit log with their stack trace.
 *
 * Thread-safe: all state is built in the constructor and read-only afterwards.
 */
class SecureErrorHandler {
public:
    SecureErrorHandler(const SecurityPolicy& policy, AuditLogger& audit);

    /**
     * Logs internal_error with the request context and answers with the
     * generic message for status. When detailed errors are enabled the
     * body also carries the redacted internal error as "detail".
     */
    http::response<http::string_body> respond(http::status status, const std::string& internal_error,
                                              const RequestContext& ctx,
                                              const std::string& context = "") const;

    // Same as respond() with a caller-chosen message. A message that looks
    // like it leaks internals is replaced by the generic one.
    http::response<http::string_body> respond_with_message(http::status status,
                                                           const std::string& generic_message,
                                                           const std::string& internal_error,
                                                           const RequestContext& ctx,
                                                           const std::string& context = "") const;

    // 400 carrying the field errors in "validation". Field errors echo only
    // client input and are never redacted.
    http::response<http::string_body> respond_validation(const std::vector<ValidationError>& errors,
                                                         const RequestContext& ctx) const;

    // Recovered failure at the pipeline boundary: always 500, fully generic.
    http::response<http::string_body> respond_panic(const std::string& error, const std::string& stack,
                                                    const RequestContext& ctx) const;

    bool detailed_errors() const { return expose_detailed_; }

    static std::string generic_message(unsigned status);

    // Replaces every sensitive fragment with "[REDACTED]".
    static std::string redact(const std::string& text);

    static bool contains_sensitive_data(const std::string& text);

    // False when the message carries any marker of internal detail.
    static bool is_generic_message(const std::string& message);

private:
    bool expose_detailed_;
    AuditLogger& audit_;

    boost::json::object error_body(unsigned status, const std::string& message,
                                   const RequestContext& ctx) const;

    void log_error(unsigned status, const std::string& internal_error,
                   const RequestContext& ctx, const std::string& context) const;

    static const std::vector<std::regex>& sensitive_patterns();
};

}
