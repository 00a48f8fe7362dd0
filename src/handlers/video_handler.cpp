#include "handlers/video_handler.hpp"
#include "json_response.hpp"
#include "input_validator.hpp"
#include "service_logger.hpp"

namespace streamguard {

http::response<http::string_body> VideoHandler::lookup_failed(const LookupError& e, const RequestContext& ctx,
                                                              const std::string& message,
                                                              const std::string& context) {
    auto status = (e.kind() == LookupError::Kind::Timeout)
        ? http::status::gateway_timeout : http::status::bad_gateway;
    return errors_.respond_with_message(status, message, e.what(), ctx, context);
}

http::response<http::string_body> VideoHandler::handle_video(const RequestContext& ctx) {
    auto platform = DefaultInputValidator::normalize_lower(*ctx.params.platform);
    const auto& video_id = *ctx.params.video_id;

    json::object info;
    try {
        info = lookup_.get_video_info(platform, video_id);
    } catch (const LookupError& e) {
        return lookup_failed(e, ctx, "Failed to get video info", "video_info");
    }

    auto res = make_json_response(http::status::ok, ctx.version,
                                  success_body("Video information retrieved successfully", std::move(info)));
    res.keep_alive(ctx.keep_alive);
    return res;
}

http::response<http::string_body> VideoHandler::handle_playlist(const RequestContext& ctx) {
    auto platform = DefaultInputValidator::normalize_lower(*ctx.params.platform);
    const auto& playlist_id = *ctx.params.playlist_id;

    json::object info;
    try {
        info = lookup_.get_playlist_info(platform, playlist_id);
    } catch (const LookupError& e) {
        return lookup_failed(e, ctx, "Failed to get playlist info", "playlist_info");
    }

    auto res = make_json_response(http::status::ok, ctx.version,
                                  success_body("Playlist information retrieved successfully", std::move(info)));
    res.keep_alive(ctx.keep_alive);
    return res;
}

std::string VideoHandler::detect_country(const http::request<http::string_body>& req, const RequestContext& ctx) {
    if (ctx.params.country) {
        return DefaultInputValidator::normalize_upper(*ctx.params.country);
    }

    static const char* const headers[] = {"CF-IPCountry", "X-Country-Code", "X-Appengine-Country", "X-Geo-Country"};
    for (const char* name : headers) {
        auto it = req.find(name);
        if (it == req.end()) continue;
        auto value = DefaultInputValidator::normalize_upper(std::string(it->value()));
        if (!value.empty() && value != "ZZ" && value != "XX") {
            return value;
        }
    }
    return {};
}

bool VideoHandler::should_proxy(const std::string& country) const {
    if (country.empty()) {
        return DefaultInputValidator::normalize_lower(config_.default_stream_mode) == "proxy";
    }
    for (const auto& code : config_.proxy_countries) {
        if (DefaultInputValidator::normalize_upper(code) == country) {
            return true;
        }
    }
    return false;
}

http::response<http::string_body> VideoHandler::handle_stream(const http::request<http::string_body>& req,
                                                              const RequestContext& ctx) {
    auto platform = DefaultInputValidator::normalize_lower(*ctx.params.platform);
    const auto& video_id = *ctx.params.video_id;
    auto quality = ctx.params.quality ? DefaultInputValidator::normalize_lower(*ctx.params.quality)
                                      : std::string("best");
    auto mode = ctx.params.mode ? DefaultInputValidator::normalize_lower(*ctx.params.mode) : std::string();
    auto country = detect_country(req, ctx);

    bool use_proxy = DefaultInputValidator::normalize_lower(config_.default_stream_mode) == "proxy";
    if (mode == "proxy") {
        use_proxy = true;
    } else if (mode == "direct") {
        use_proxy = false;
    } else if (config_.smart_proxy_enabled) {
        use_proxy = should_proxy(country);
    }

    ServiceLogger::log(ServiceLogger::Level::INFO, ServiceLogger::Event::REQUEST, ctx.request.client_address,
                       "request_id=" + ctx.request_id + " stream platform=" + platform +
                       " quality=" + quality + " mode=" + (use_proxy ? "proxy" : "direct") +
                       " country=" + (country.empty() ? "unknown" : country));

    if (ctx.is_cancelled()) {
        return errors_.respond(http::status::service_unavailable, "request cancelled before lookup", ctx, "stream");
    }

    std::string stream_url;
    try {
        stream_url = lookup_.get_stream_url(platform, video_id, quality);
    } catch (const LookupError& e) {
        return lookup_failed(e, ctx, "Failed to get stream URL", "stream_url");
    }

    if (!use_proxy) {
        http::response<http::string_body> res{http::status::found, ctx.version};
        res.set(http::field::location, stream_url);
        res.keep_alive(ctx.keep_alive);
        res.prepare_payload();
        return res;
    }

    // The relay needs the metadata as well; a metadata failure is not fatal.
    json::value video_info = json::object();
    try {
        video_info = lookup_.get_video_info(platform, video_id);
    } catch (const LookupError& e) {
        ServiceLogger::log(ServiceLogger::Level::WARNING, ServiceLogger::Event::LOOKUP, ctx.request.client_address,
                           "request_id=" + ctx.request_id + " video info unavailable for proxy: " + e.what());
    }

    auto now = std::chrono::system_clock::now();
    json::object response;
    response["success"] = true;
    response["stream_url"] = stream_url;
    response["video_info"] = std::move(video_info);
    response["cached_at"] = utc_timestamp(now);
    response["expires_at"] = utc_timestamp(now + std::chrono::seconds(config_.stream_url_ttl_sec));

    auto res = make_json_response(http::status::ok, ctx.version, response);
    res.keep_alive(ctx.keep_alive);
    return res;
}

}
