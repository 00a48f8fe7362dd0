#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include <stdexcept>

namespace streamguard {

// Minimum HSTS max-age accepted for production deployments (one year).
constexpr int kMinHstsMaxAge = 31536000;

// Thresholds, allowlists and header strings for the request-security pipeline.
// Built once at startup, validated, then shared read-only by every session.
struct SecurityPolicy {
    // --- Input Validation ---
    size_t max_video_id_length = 200;
    size_t max_playlist_id_length = 200;
    std::vector<std::string> allowed_platforms = {"youtube", "bilibili", "twitter", "instagram", "twitch"};
    std::vector<std::string> allowed_qualities = {"best", "2160p", "1440p", "1080p", "720p", "480p", "360p", "worst"};

    // --- Request Size Limits ---
    int64_t max_request_body_size = 1024 * 1024;  // 1MB
    int64_t max_url_length = 2048;
    int64_t max_query_length = 1024;
    int64_t max_header_size = 8192;

    // --- IP Access Control ---
    std::vector<std::string> ip_allowlist = {};
    std::vector<std::string> ip_blocklist = {};
    bool enable_ip_control = false;

    // --- Security Headers ---
    bool enable_hsts = true;
    int hsts_max_age = kMinHstsMaxAge;
    std::string csp_directives = "default-src 'self'";
    std::string referrer_policy = "strict-origin-when-cross-origin";
    std::string permissions_policy = "geolocation=(), microphone=(), camera=()";

    // --- Audit Logging ---
    bool enable_audit_log = true;
    std::string audit_log_path = "logs/audit.log";

    // --- Error Handling ---
    // Adds a redacted "detail" field to error bodies. Never enable in production.
    bool expose_detailed_errors = false;
};

// A startup configuration failure. Carries one entry per violated key,
// formatted as "KEY: constraint".
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(std::vector<std::string> violations);

    const std::vector<std::string>& violations() const { return violations_; }

private:
    std::vector<std::string> violations_;

    static std::string join(const std::vector<std::string>& violations);
};

/**
 * Checks every policy field and throws ConfigError listing all violations.
 * Numeric limits must be positive, HSTS max-age must be at least one year
 * when HSTS is on, allow/block entries must parse as an IP or CIDR range,
 * and the platform/quality sets, CSP and referrer policy must be non-empty.
 */
void validate(const SecurityPolicy& policy);

}
