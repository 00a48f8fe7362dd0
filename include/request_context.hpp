#pragma once

#include <string>
#include <vector>
#include <utility>
#include <memory>
#include <atomic>

#include "audit_logger.hpp"
#include "input_validator.hpp"

namespace streamguard {

enum class ResourceKind {
    Root,
    Health,
    Video,
    Playlist,
    Stream,
    Metrics,
    NotFound
};

// Path segments after the optional "/api/v2" prefix, percent-decoded one by
// one. Parameters are the segments the resource consumes.
struct RouteMatch {
    ResourceKind kind = ResourceKind::NotFound;
    std::vector<std::string> segments;
    std::string platform;
    std::string identifier;  // video_id or playlist_id
};

using QueryPairs = std::vector<std::pair<std::string, std::string>>;

// Per-request state built by the pipeline and handed to every stage and to
// the handler. Never shared between requests.
struct RequestContext {
    std::string request_id;
    RequestInfo request;
    unsigned version = 11;
    bool keep_alive = false;

    RouteMatch route;
    std::string raw_path;
    std::string raw_query;
    QueryPairs raw_query_pairs;   // as received, not decoded
    QueryPairs query;             // decoded (lenient)
    RequestParameters params;

    std::string clean_path;       // set by the sanitization stage

    // Set by the session when the connection goes away.
    std::shared_ptr<std::atomic<bool>> cancelled;

    bool is_cancelled() const {
        return cancelled && cancelled->load();
    }

    // First decoded value for key, or empty.
    std::string query_value(const std::string& key) const {
        for (const auto& [k, v] : query) {
            if (k == key) return v;
        }
        return {};
    }
};

}
