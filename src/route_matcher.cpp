#include "route_matcher.hpp"
#include "input_sanitizer.hpp"

namespace streamguard {

std::pair<std::string, std::string> split_target(const std::string& target) {
    auto qpos = target.find('?');
    if (qpos == std::string::npos) {
        return {target, std::string()};
    }
    return {target.substr(0, qpos), target.substr(qpos + 1)};
}

static std::vector<std::string> split_segments(const std::string& raw_path) {
    std::vector<std::string> segments;
    std::string rest = raw_path;
    if (!rest.empty() && rest[0] == '/') rest.erase(0, 1);
    if (rest.empty()) return segments;

    size_t start = 0;
    for (;;) {
        auto pos = rest.find('/', start);
        std::string raw = rest.substr(start, pos == std::string::npos ? std::string::npos : pos - start);
        std::string decoded;
        // Path segments never treat '+' as a space.
        segments.push_back(url_decode(raw, decoded, false) ? decoded : raw);
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return segments;
}

RouteMatch match_route(const std::string& raw_path) {
    RouteMatch m;
    auto segs = split_segments(raw_path);

    size_t base = 0;
    if (segs.size() >= 2 && segs[0] == "api" && segs[1] == "v2") {
        base = 2;
    }
    std::vector<std::string> s(segs.begin() + static_cast<std::ptrdiff_t>(base), segs.end());
    m.segments = s;

    if (s.empty()) {
        m.kind = ResourceKind::Root;
    } else if ((s.size() == 1 && s[0] == "health") ||
               (s.size() == 2 && s[0] == "system" && s[1] == "health")) {
        m.kind = ResourceKind::Health;
    } else if ((s.size() == 1 && s[0] == "metrics") ||
               (s.size() == 2 && s[0] == "stream" && s[1] == "metrics")) {
        m.kind = ResourceKind::Metrics;
    } else if (s.size() == 3 && s[0] == "videos") {
        m.kind = ResourceKind::Video;
        m.platform = s[1];
        m.identifier = s[2];
    } else if (s.size() == 3 && s[0] == "playlists") {
        m.kind = ResourceKind::Playlist;
        m.platform = s[1];
        m.identifier = s[2];
    } else if (s.size() >= 3 && s[0] == "stream") {
        m.kind = ResourceKind::Stream;
        m.platform = s[1];
        m.identifier = s[2];
        for (size_t i = 3; i < s.size(); ++i) {
            m.identifier += "/" + s[i];
        }
    }
    return m;
}

QueryPairs parse_query(const std::string& raw_query) {
    QueryPairs pairs;
    if (raw_query.empty()) return pairs;

    size_t start = 0;
    for (;;) {
        auto amp = raw_query.find('&', start);
        std::string item = raw_query.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
        if (!item.empty()) {
            auto eq = item.find('=');
            if (eq == std::string::npos) {
                pairs.emplace_back(item, std::string());
            } else {
                pairs.emplace_back(item.substr(0, eq), item.substr(eq + 1));
            }
        }
        if (amp == std::string::npos) break;
        start = amp + 1;
    }
    return pairs;
}

void populate_context(const std::string& target, RequestContext& ctx) {
    auto [path, query] = split_target(target);
    ctx.raw_path = path;
    ctx.raw_query = query;
    ctx.route = match_route(path);
    ctx.raw_query_pairs = parse_query(query);

    ctx.query.clear();
    for (const auto& [k, v] : ctx.raw_query_pairs) {
        std::string dk, dv;
        if (!url_decode(k, dk)) dk = k;
        if (!url_decode(v, dv)) dv = v;
        ctx.query.emplace_back(std::move(dk), std::move(dv));
    }

    RequestParameters params;
    switch (ctx.route.kind) {
        case ResourceKind::Video:
        case ResourceKind::Stream:
            params.platform = ctx.route.platform;
            params.video_id = ctx.route.identifier;
            break;
        case ResourceKind::Playlist:
            params.platform = ctx.route.platform;
            params.playlist_id = ctx.route.identifier;
            break;
        default:
            break;
    }

    // Optional fields: an empty value counts as absent.
    auto optional_field = [&ctx](const char* key) -> std::optional<std::string> {
        auto v = ctx.query_value(key);
        if (v.empty()) return std::nullopt;
        return v;
    };
    params.quality = optional_field("quality");
    params.country = optional_field("country");
    params.mode = optional_field("mode");

    ctx.params = std::move(params);
}

}
