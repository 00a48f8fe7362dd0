#include "video_lookup.hpp"
#include "service_logger.hpp"
#include "metrics.hpp"

#include <algorithm>
#include <cctype>
#include <future>
#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>

namespace streamguard {

namespace bp = boost::process;

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// --- ProcessCommandRunner ---

std::string ProcessCommandRunner::run(const std::vector<std::string>& argv, std::chrono::seconds timeout) {
    if (argv.empty()) {
        throw LookupError(LookupError::Kind::Unavailable, "empty extractor command");
    }

    std::string exe = argv[0];
    if (exe.find('/') == std::string::npos) {
        auto resolved = bp::search_path(exe);
        if (resolved.empty()) {
            throw LookupError(LookupError::Kind::Unavailable, "extractor not found in PATH: " + exe);
        }
        exe = resolved.string();
    }
    std::vector<std::string> args(argv.begin() + 1, argv.end());

    boost::asio::io_context ioc;
    std::future<std::string> output;
    std::error_code ec;

    bp::child child(exe, bp::args(args),
                    bp::std_in < bp::null,
                    bp::std_out > output,
                    bp::std_err > bp::null,
                    ioc, ec);
    if (ec) {
        throw LookupError(LookupError::Kind::Unavailable, "failed to start extractor: " + ec.message());
    }

    ioc.run_for(timeout);

    if (child.running(ec)) {
        child.terminate(ec);
        throw LookupError(LookupError::Kind::Timeout,
                          "extractor exceeded " + std::to_string(timeout.count()) + "s");
    }
    child.wait(ec);

    int status = child.exit_code();
    if (status != 0) {
        throw LookupError(LookupError::Kind::Unavailable,
                          "extractor exited with status " + std::to_string(status));
    }
    return output.get();
}

// --- helpers ---

std::string build_video_url(const std::string& platform, const std::string& video_id) {
    auto p = to_lower(platform);
    if (p == "youtube") return "https://www.youtube.com/watch?v=" + video_id;
    if (p == "bilibili") return "https://www.bilibili.com/video/" + video_id;
    if (p == "twitter" || p == "x") return "https://twitter.com/i/status/" + video_id;
    if (p == "instagram") return "https://www.instagram.com/p/" + video_id;
    if (p == "twitch") return "https://www.twitch.tv/videos/" + video_id;
    return video_id;
}

std::string format_selector(const std::string& quality) {
    auto q = to_lower(quality);
    if (q.empty() || q == "best") return "best[ext=mp4][acodec!=none]/best[acodec!=none]/best";
    if (q == "worst") return "worstvideo+worstaudio/worst";

    static const char* const heights[] = {"2160", "1440", "1080", "720", "480", "360"};
    for (const char* h : heights) {
        if (q == std::string(h) + "p") {
            return std::string("best[height<=") + h + "][acodec!=none]/bestvideo[height<=" + h + "]+bestaudio";
        }
    }
    return "best[acodec!=none]/bestvideo+bestaudio";
}

std::string first_stream_url(const std::string& output) {
    size_t start = 0;
    while (start < output.size()) {
        auto end = output.find('\n', start);
        if (end == std::string::npos) end = output.size();

        size_t b = start, e = end;
        while (b < e && std::isspace(static_cast<unsigned char>(output[b]))) ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(output[e - 1]))) --e;
        if (e > b) {
            return output.substr(b, e - b);
        }
        start = end + 1;
    }
    throw LookupError(LookupError::Kind::InvalidOutput, "no stream URL in extractor output");
}

static std::string str_field(const json::object& obj, const char* key) {
    auto it = obj.find(key);
    if (it != obj.end() && it->value().is_string()) {
        return std::string(it->value().as_string());
    }
    return {};
}

static int64_t int_field(const json::object& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return 0;
    if (it->value().is_int64()) return it->value().as_int64();
    if (it->value().is_uint64()) return static_cast<int64_t>(it->value().as_uint64());
    if (it->value().is_double()) return static_cast<int64_t>(it->value().as_double());
    return 0;
}

// --- ExtractorVideoLookup ---

ExtractorVideoLookup::ExtractorVideoLookup(std::string extractor_path, std::chrono::seconds timeout,
                                           std::unique_ptr<CommandRunner> runner)
    : extractor_path_(std::move(extractor_path))
    , timeout_(timeout)
    , runner_(std::move(runner))
{}

json::object ExtractorVideoLookup::run_json(const std::vector<std::string>& args) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(extractor_path_);
    argv.insert(argv.end(), args.begin(), args.end());

    auto output = runner_->run(argv, timeout_);

    json::error_code ec;
    auto parsed = json::parse(output, ec);
    if (ec || !parsed.is_object()) {
        throw LookupError(LookupError::Kind::InvalidOutput, "unparsable extractor output");
    }
    return parsed.as_object();
}

json::object ExtractorVideoLookup::get_video_info(const std::string& platform, const std::string& video_id) {
    ServiceLogger::log(ServiceLogger::Level::INFO, ServiceLogger::Event::LOOKUP, "internal",
                       "extracting video info platform=" + platform + " id=" + video_id);

    auto raw = run_json({"--dump-json", "--no-playlist", "--no-warnings", build_video_url(platform, video_id)});

    json::object info;
    info["id"] = str_field(raw, "id");
    info["title"] = str_field(raw, "title");
    info["description"] = str_field(raw, "description");
    info["duration"] = int_field(raw, "duration");
    info["thumbnail"] = str_field(raw, "thumbnail");
    info["uploader"] = str_field(raw, "uploader");
    info["view_count"] = int_field(raw, "view_count");
    info["like_count"] = int_field(raw, "like_count");
    info["upload_date"] = str_field(raw, "upload_date");
    info["platform"] = to_lower(platform);

    json::array formats;
    auto it = raw.find("formats");
    if (it != raw.end() && it->value().is_array()) {
        for (const auto& f : it->value().as_array()) {
            if (!f.is_object()) continue;
            const auto& fo = f.as_object();
            auto url = str_field(fo, "url");
            if (url.empty()) continue;
            json::object format;
            format["format_id"] = str_field(fo, "format_id");
            format["url"] = url;
            format["ext"] = str_field(fo, "ext");
            format["resolution"] = str_field(fo, "resolution");
            format["filesize"] = int_field(fo, "filesize");
            format["codec"] = str_field(fo, "vcodec");
            formats.push_back(std::move(format));
        }
    }
    info["formats"] = std::move(formats);
    return info;
}

json::object ExtractorVideoLookup::get_playlist_info(const std::string& platform, const std::string& playlist_id) {
    ServiceLogger::log(ServiceLogger::Level::INFO, ServiceLogger::Event::LOOKUP, "internal",
                       "extracting playlist info platform=" + platform + " id=" + playlist_id);

    auto raw = run_json({"--dump-single-json", "--flat-playlist", "--no-warnings",
                         build_video_url(platform, playlist_id)});

    json::object info;
    info["id"] = str_field(raw, "id");
    info["title"] = str_field(raw, "title");
    info["description"] = str_field(raw, "description");
    info["uploader"] = str_field(raw, "uploader");
    info["webpage_url"] = str_field(raw, "webpage_url");
    info["platform"] = to_lower(platform);

    json::array entries;
    auto it = raw.find("entries");
    if (it != raw.end() && it->value().is_array()) {
        for (const auto& e : it->value().as_array()) {
            if (!e.is_object()) continue;
            const auto& eo = e.as_object();
            json::object entry;
            entry["id"] = str_field(eo, "id");
            entry["title"] = str_field(eo, "title");
            entry["duration"] = int_field(eo, "duration");
            entry["uploader"] = str_field(eo, "uploader");
            entry["webpage_url"] = str_field(eo, "webpage_url");
            entries.push_back(std::move(entry));
        }
    }
    info["entry_count"] = static_cast<int64_t>(entries.size());
    info["entries"] = std::move(entries);
    return info;
}

std::string ExtractorVideoLookup::get_stream_url(const std::string& platform, const std::string& video_id,
                                                 const std::string& quality) {
    std::vector<std::string> argv = {
        extractor_path_, "--get-url", "-f", format_selector(quality),
        "--no-playlist", "--no-warnings", build_video_url(platform, video_id)
    };
    return first_stream_url(runner_->run(argv, timeout_));
}

// --- CachedVideoLookup ---

CachedVideoLookup::CachedVideoLookup(std::unique_ptr<VideoLookup> inner, std::shared_ptr<CacheStore> cache,
                                     std::chrono::seconds info_ttl, std::chrono::seconds stream_ttl)
    : inner_(std::move(inner))
    , cache_(std::move(cache))
    , info_ttl_(info_ttl)
    , stream_ttl_(stream_ttl)
{}

std::optional<std::string> CachedVideoLookup::cache_get(const std::string& key) {
    try {
        auto hit = cache_->get(key);
        MetricsRegistry::instance().increment_counter(hit ? metric::kCacheHits : metric::kCacheMisses);
        return hit;
    } catch (const std::exception& e) {
        MetricsRegistry::instance().increment_counter(metric::kCacheErrors);
        ServiceLogger::log(ServiceLogger::Level::WARNING, ServiceLogger::Event::CACHE, "internal",
                           "cache read failed for " + key + ": " + e.what());
        return std::nullopt;
    }
}

void CachedVideoLookup::cache_set(const std::string& key, const std::string& value, std::chrono::seconds ttl) {
    try {
        cache_->set(key, value, ttl);
    } catch (const std::exception& e) {
        MetricsRegistry::instance().increment_counter(metric::kCacheErrors);
        ServiceLogger::log(ServiceLogger::Level::WARNING, ServiceLogger::Event::CACHE, "internal",
                           "cache write failed for " + key + ": " + e.what());
    }
}

json::object CachedVideoLookup::get_video_info(const std::string& platform, const std::string& video_id) {
    auto key = make_cache_key("video", platform, video_id);
    if (auto cached = cache_get(key)) {
        json::error_code ec;
        auto parsed = json::parse(*cached, ec);
        if (!ec && parsed.is_object()) {
            return parsed.as_object();
        }
    }

    auto info = inner_->get_video_info(platform, video_id);
    cache_set(key, json::serialize(info), info_ttl_);
    return info;
}

json::object CachedVideoLookup::get_playlist_info(const std::string& platform, const std::string& playlist_id) {
    auto key = make_cache_key("playlist", platform, playlist_id);
    if (auto cached = cache_get(key)) {
        json::error_code ec;
        auto parsed = json::parse(*cached, ec);
        if (!ec && parsed.is_object()) {
            return parsed.as_object();
        }
    }

    auto info = inner_->get_playlist_info(platform, playlist_id);
    cache_set(key, json::serialize(info), info_ttl_);
    return info;
}

std::string CachedVideoLookup::get_stream_url(const std::string& platform, const std::string& video_id,
                                              const std::string& quality) {
    auto key = make_cache_key("stream", platform, video_id, quality);
    if (auto cached = cache_get(key)) {
        try {
            return first_stream_url(*cached);
        } catch (const LookupError&) {
            ServiceLogger::log(ServiceLogger::Level::WARNING, ServiceLogger::Event::CACHE, "internal",
                               "cached stream URL invalid, regenerating: " + key);
        }
    }

    auto url = inner_->get_stream_url(platform, video_id, quality);
    cache_set(key, url, stream_ttl_);
    return url;
}

bool CachedVideoLookup::is_healthy() {
    try {
        return cache_->ping();
    } catch (const std::exception& e) {
        ServiceLogger::log(ServiceLogger::Level::WARNING, ServiceLogger::Event::CACHE, "internal",
                           std::string("cache health check failed: ") + e.what());
        return false;
    }
}

}
