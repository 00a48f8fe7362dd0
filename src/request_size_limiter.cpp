#include "request_size_limiter.hpp"

#include <charconv>

namespace streamguard {

const char* to_string(SizeDimension dimension) {
    switch (dimension) {
        case SizeDimension::Url: return "url";
        case SizeDimension::Query: return "query";
        case SizeDimension::Header: return "header";
        case SizeDimension::Body: return "body";
    }
    return "unknown";
}

RequestSizeLimiter::RequestSizeLimiter(const SecurityPolicy& policy)
    : max_url_(policy.max_url_length)
    , max_query_(policy.max_query_length)
    , max_header_(policy.max_header_size)
    , max_body_(policy.max_request_body_size)
{}

std::optional<SizeViolation> RequestSizeLimiter::check_header(const http::request_header<>& header) const {
    auto target = header.target();

    auto url_len = static_cast<int64_t>(target.size());
    if (url_len > max_url_) {
        return SizeViolation{SizeDimension::Url, url_len, max_url_, {}};
    }

    auto qpos = target.find('?');
    if (qpos != boost::beast::string_view::npos) {
        auto query_len = static_cast<int64_t>(target.size() - qpos - 1);
        if (query_len > max_query_) {
            return SizeViolation{SizeDimension::Query, query_len, max_query_, {}};
        }
    }

    for (const auto& field : header) {
        auto field_len = static_cast<int64_t>(field.name_string().size() + field.value().size());
        if (field_len > max_header_) {
            return SizeViolation{SizeDimension::Header, field_len, max_header_, std::string(field.name_string())};
        }
    }

    // A declared length over the ceiling is rejected before reading the body.
    auto cl = header.find(http::field::content_length);
    if (cl != header.end()) {
        auto value = cl->value();
        uint64_t declared = 0;
        auto res = std::from_chars(value.data(), value.data() + value.size(), declared);
        if (res.ec == std::errc() && declared > static_cast<uint64_t>(max_body_)) {
            return SizeViolation{SizeDimension::Body, static_cast<int64_t>(declared), max_body_, {}};
        }
    }

    return std::nullopt;
}

std::optional<SizeViolation> RequestSizeLimiter::check_body(uint64_t received) const {
    if (received > static_cast<uint64_t>(max_body_)) {
        return SizeViolation{SizeDimension::Body, static_cast<int64_t>(received), max_body_, {}};
    }
    return std::nullopt;
}

std::optional<SizeViolation> RequestSizeLimiter::check(const http::request<http::string_body>& req) const {
    if (auto v = check_header(req.base())) return v;
    return check_body(req.body().size());
}

}
