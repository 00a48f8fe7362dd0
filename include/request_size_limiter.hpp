#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include <boost/beast/http.hpp>

#include "security_policy.hpp"

namespace streamguard {

namespace http = boost::beast::http;

enum class SizeDimension {
    Url,
    Query,
    Header,
    Body
};

const char* to_string(SizeDimension dimension);

// The first dimension found over its limit. Only the audit and service logs
// see the dimension; the client gets a uniform 413.
struct SizeViolation {
    SizeDimension dimension;
    int64_t size;
    int64_t limit;
    std::string header_name;  // set for SizeDimension::Header
};

class RequestSizeLimiter {
public:
    explicit RequestSizeLimiter(const SecurityPolicy& policy);

    /**
     * Checks URL, query string, each header (name + value) and the declared
     * Content-Length. Works on the header alone so it can run before any body
     * byte is read.
     */
    std::optional<SizeViolation> check_header(const http::request_header<>& header) const;

    // Checks a body size actually received.
    std::optional<SizeViolation> check_body(uint64_t received) const;

    // check_header() followed by check_body() on the buffered body.
    std::optional<SizeViolation> check(const http::request<http::string_body>& req) const;

    // Read ceiling for the HTTP parser so excess body data is never buffered.
    uint64_t body_read_limit() const { return static_cast<uint64_t>(max_body_); }

    template<class Body>
    void apply_body_limit(http::request_parser<Body>& parser) const {
        parser.body_limit(body_read_limit());
    }

private:
    int64_t max_url_;
    int64_t max_query_;
    int64_t max_header_;
    int64_t max_body_;
};

}
