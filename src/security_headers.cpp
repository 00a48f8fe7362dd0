#include "security_headers.hpp"

namespace streamguard {

SecurityHeaders::SecurityHeaders(const SecurityPolicy& policy) {
    headers_.emplace_back("X-Content-Type-Options", "nosniff");
    headers_.emplace_back("X-Frame-Options", "DENY");
    headers_.emplace_back("X-XSS-Protection", "1; mode=block");

    if (!policy.csp_directives.empty()) {
        headers_.emplace_back("Content-Security-Policy", policy.csp_directives);
    }
    if (!policy.referrer_policy.empty()) {
        headers_.emplace_back("Referrer-Policy", policy.referrer_policy);
    }
    if (!policy.permissions_policy.empty()) {
        headers_.emplace_back("Permissions-Policy", policy.permissions_policy);
    }

    // max-age was checked against kMinHstsMaxAge during policy validation.
    if (policy.enable_hsts) {
        headers_.emplace_back("Strict-Transport-Security", hsts_value(policy.hsts_max_age));
    }
}

std::string SecurityHeaders::hsts_value(int max_age) {
    return "max-age=" + std::to_string(max_age) + "; includeSubDomains; preload";
}

}
