#include "security_policy.hpp"
#include "cidr_range.hpp"

namespace streamguard {

ConfigError::ConfigError(std::vector<std::string> violations)
    : std::runtime_error(join(violations))
    , violations_(std::move(violations))
{}

std::string ConfigError::join(const std::vector<std::string>& violations) {
    std::string msg = "security configuration validation failed";
    for (size_t i = 0; i < violations.size(); ++i) {
        msg += (i == 0) ? ": " : "; ";
        msg += violations[i];
    }
    return msg;
}

static void check_cidr_list(const std::vector<std::string>& entries, const char* key,
                            std::vector<std::string>& errors) {
    for (const auto& entry : entries) {
        try {
            CidrRange::parse(entry);
        } catch (const std::invalid_argument& e) {
            errors.push_back(std::string(key) + ": invalid entry '" + entry + "' (" + e.what() + ")");
        }
    }
}

void validate(const SecurityPolicy& policy) {
    std::vector<std::string> errors;

    if (policy.max_video_id_length == 0) {
        errors.push_back("MAX_VIDEO_ID_LENGTH: must be positive");
    }
    if (policy.max_playlist_id_length == 0) {
        errors.push_back("MAX_PLAYLIST_ID_LENGTH: must be positive");
    }
    if (policy.max_request_body_size <= 0) {
        errors.push_back("MAX_REQUEST_BODY_SIZE: must be positive");
    }
    if (policy.max_url_length <= 0) {
        errors.push_back("MAX_URL_LENGTH: must be positive");
    }
    if (policy.max_query_length <= 0) {
        errors.push_back("MAX_QUERY_LENGTH: must be positive");
    }
    if (policy.max_header_size <= 0) {
        errors.push_back("MAX_HEADER_SIZE: must be positive");
    }

    if (policy.enable_hsts && policy.hsts_max_age < kMinHstsMaxAge) {
        errors.push_back("HSTS_MAX_AGE: must be at least " + std::to_string(kMinHstsMaxAge) +
                         " seconds (1 year)");
    }

    check_cidr_list(policy.ip_allowlist, "IP_ALLOWLIST", errors);
    check_cidr_list(policy.ip_blocklist, "IP_BLOCKLIST", errors);

    if (policy.allowed_platforms.empty()) {
        errors.push_back("ALLOWED_PLATFORMS: must not be empty");
    }
    if (policy.allowed_qualities.empty()) {
        errors.push_back("ALLOWED_QUALITIES: must not be empty");
    }
    if (policy.csp_directives.empty()) {
        errors.push_back("CSP_DIRECTIVES: must not be empty");
    }
    if (policy.referrer_policy.empty()) {
        errors.push_back("REFERRER_POLICY: must not be empty");
    }
    if (policy.enable_audit_log && policy.audit_log_path.empty()) {
        errors.push_back("AUDIT_LOG_PATH: must not be empty when ENABLE_AUDIT_LOG is set");
    }

    if (!errors.empty()) {
        throw ConfigError(std::move(errors));
    }
}

}
