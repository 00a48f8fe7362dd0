#pragma once

#include <string>
#include <boost/beast/http.hpp>

#include "server_config.hpp"
#include "request_context.hpp"
#include "secure_error_handler.hpp"
#include "video_lookup.hpp"

namespace beast = boost::beast;
namespace http = beast::http;

namespace streamguard {

// Video, playlist and smart-stream endpoints. Every parameter reaching
// these methods has already passed validation and sanitization.
class VideoHandler {
public:
    VideoHandler(const ServerConfig& config, VideoLookup& lookup, const SecureErrorHandler& errors)
        : config_(config), lookup_(lookup), errors_(errors) {}

    http::response<http::string_body> handle_video(const RequestContext& ctx);
    http::response<http::string_body> handle_playlist(const RequestContext& ctx);

    /**
     * mode=direct answers 302 to the resolved stream URL; mode=proxy answers
     * 200 with the stream descriptor for the relay. Without an explicit mode
     * the smart-proxy rule picks one from the detected country.
     */
    http::response<http::string_body> handle_stream(const http::request<http::string_body>& req,
                                                    const RequestContext& ctx);

    // Query "country", then the CDN/geo headers, ignoring ZZ and XX. Upper-case or empty.
    static std::string detect_country(const http::request<http::string_body>& req, const RequestContext& ctx);

    bool should_proxy(const std::string& country) const;

private:
    const ServerConfig& config_;
    VideoLookup& lookup_;
    const SecureErrorHandler& errors_;

    http::response<http::string_body> lookup_failed(const LookupError& e, const RequestContext& ctx,
                                                    const std::string& message, const std::string& context);
};

}
