#pragma once

#include <string>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include "audit_logger.hpp"

namespace streamguard {

namespace http = boost::beast::http;
namespace json = boost::json;

inline http::response<http::string_body> make_json_response(http::status status, unsigned version,
                                                            const json::value& body) {
    http::response<http::string_body> res{status, version};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(body);
    res.prepare_payload();
    return res;
}

// {"success":true,"message":...,"data":...,"timestamp":...}
inline json::object success_body(const std::string& message, json::value data) {
    json::object obj;
    obj["success"] = true;
    obj["message"] = message;
    obj["data"] = std::move(data);
    obj["timestamp"] = utc_timestamp();
    return obj;
}

}
