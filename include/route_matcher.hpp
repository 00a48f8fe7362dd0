#pragma once

#include <string>

#include "request_context.hpp"

namespace streamguard {

// Splits a request target into path and query ("" when there is no '?').
std::pair<std::string, std::string> split_target(const std::string& target);

/**
 * Maps a raw path onto a resource. Accepts both "/api/v2/..." and the bare
 * form. Recognized shapes:
 *   /                               Root
 *   /health, /system/health         Health
 *   /videos/{platform}/{id}         Video
 *   /playlists/{platform}/{id}      Playlist
 *   /stream/{platform}/{id...}      Stream (remaining segments joined by '/')
 *   /stream/metrics, /metrics       Metrics
 */
RouteMatch match_route(const std::string& raw_path);

// Splits "a=1&b=2" into raw pairs; a key without '=' gets an empty value.
QueryPairs parse_query(const std::string& raw_query);

/**
 * Fills the route, query and parameter fields of ctx from the target.
 * Query values are decoded leniently; malformed encodings are left as
 * received for the sanitization stage to reject.
 */
void populate_context(const std::string& target, RequestContext& ctx);

}
