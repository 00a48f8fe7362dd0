#include "config_loader.hpp"
#include "input_validator.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>

namespace streamguard {

EnvReader process_env() {
    return [](const std::string& name) -> std::optional<std::string> {
        if (const char* v = std::getenv(name.c_str())) {
            return std::string(v);
        }
        return std::nullopt;
    };
}

std::vector<std::string> split_csv(const std::string& value) {
    std::vector<std::string> out;
    size_t start = 0;
    for (;;) {
        auto comma = value.find(',', start);
        std::string item = value.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        size_t b = 0, e = item.size();
        while (b < e && std::isspace(static_cast<unsigned char>(item[b]))) ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(item[e - 1]))) --e;
        if (e > b) out.push_back(item.substr(b, e - b));
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return out;
}

std::optional<bool> parse_bool(const std::string& value) {
    auto v = DefaultInputValidator::normalize_lower(value);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return std::nullopt;
}

std::optional<int64_t> parse_int(const std::string& value) {
    int64_t out = 0;
    auto first = value.data();
    auto last = value.data() + value.size();
    auto res = std::from_chars(first, last, out);
    if (res.ec != std::errc() || res.ptr != last) {
        return std::nullopt;
    }
    return out;
}

namespace {

// Collects parse failures while applying overrides.
class EnvApplier {
public:
    explicit EnvApplier(const EnvReader& env) : env_(env) {}

    void str(const char* key, std::string& field) {
        if (auto v = env_(key)) field = *v;
    }

    void csv(const char* key, std::vector<std::string>& field, bool to_upper = false, bool to_lower = false) {
        auto v = env_(key);
        if (!v) return;
        field.clear();
        for (auto& item : split_csv(*v)) {
            if (to_upper) item = DefaultInputValidator::normalize_upper(item);
            if (to_lower) item = DefaultInputValidator::normalize_lower(item);
            field.push_back(item);
        }
    }

    void flag(const char* key, bool& field) {
        auto v = env_(key);
        if (!v) return;
        if (auto b = parse_bool(*v)) {
            field = *b;
        } else {
            errors_.push_back(std::string(key) + ": expected a boolean, got '" + *v + "'");
        }
    }

    template<class T>
    void number(const char* key, T& field) {
        auto v = env_(key);
        if (!v) return;
        auto n = parse_int(*v);
        bool in_range = n && *n >= static_cast<int64_t>(std::numeric_limits<T>::min()) &&
            (*n <= 0 || static_cast<uint64_t>(*n) <= static_cast<uint64_t>(std::numeric_limits<T>::max()));
        if (!in_range) {
            errors_.push_back(std::string(key) + ": expected an integer in range, got '" + *v + "'");
            return;
        }
        field = static_cast<T>(*n);
    }

    const std::vector<std::string>& errors() const { return errors_; }

private:
    const EnvReader& env_;
    std::vector<std::string> errors_;
};

}

void apply_env(ServerConfig& config, const EnvReader& env) {
    EnvApplier a(env);

    // --- Network & Infrastructure ---
    a.number("PORT", config.port);
    a.number("STREAMGUARD_PORT", config.port);
    a.str("STREAMGUARD_ADDR", config.address);
    a.number("STREAMGUARD_THREADS", config.thread_count);
    a.str("REDIS_URL", config.redis_url);
    a.flag("STREAMGUARD_TLS", config.enable_tls);
    a.str("STREAMGUARD_CERT", config.cert_path);
    a.str("STREAMGUARD_KEY", config.key_path);

    // --- Video Lookup & Cache ---
    a.str("YTDLP_PATH", config.extractor_path);
    a.number("YTDLP_TIMEOUT", config.extractor_timeout_sec);
    a.number("VIDEO_INFO_TTL", config.video_info_ttl_sec);
    a.number("STREAM_URL_TTL", config.stream_url_ttl_sec);

    // --- Smart Streaming ---
    a.flag("SMART_PROXY_ENABLED", config.smart_proxy_enabled);
    a.csv("PROXY_COUNTRIES", config.proxy_countries, true);
    a.str("DEFAULT_STREAM_MODE", config.default_stream_mode);

    // --- Security Policy ---
    auto& sec = config.security;
    a.number("MAX_VIDEO_ID_LENGTH", sec.max_video_id_length);
    a.number("MAX_PLAYLIST_ID_LENGTH", sec.max_playlist_id_length);
    a.csv("ALLOWED_PLATFORMS", sec.allowed_platforms, false, true);
    a.csv("ALLOWED_QUALITIES", sec.allowed_qualities, false, true);

    a.number("MAX_REQUEST_BODY_SIZE", sec.max_request_body_size);
    a.number("MAX_URL_LENGTH", sec.max_url_length);
    a.number("MAX_QUERY_LENGTH", sec.max_query_length);
    a.number("MAX_HEADER_SIZE", sec.max_header_size);

    a.csv("IP_ALLOWLIST", sec.ip_allowlist);
    a.csv("IP_BLOCKLIST", sec.ip_blocklist);
    a.flag("ENABLE_IP_CONTROL", sec.enable_ip_control);

    a.flag("ENABLE_HSTS", sec.enable_hsts);
    a.number("HSTS_MAX_AGE", sec.hsts_max_age);
    a.str("CSP_DIRECTIVES", sec.csp_directives);
    a.str("REFERRER_POLICY", sec.referrer_policy);
    a.str("PERMISSIONS_POLICY", sec.permissions_policy);

    a.flag("ENABLE_AUDIT_LOG", sec.enable_audit_log);
    a.str("AUDIT_LOG_PATH", sec.audit_log_path);

    a.flag("EXPOSE_DETAILED_ERRORS", sec.expose_detailed_errors);

    if (!a.errors().empty()) {
        throw ConfigError(a.errors());
    }
}

void validate(const ServerConfig& config) {
    std::vector<std::string> errors;

    if (config.port == 0) {
        errors.push_back("STREAMGUARD_PORT: must be between 1 and 65535");
    }
    if (config.thread_count < 0) {
        errors.push_back("STREAMGUARD_THREADS: must not be negative");
    }
    if (config.enable_tls && (config.cert_path.empty() || config.key_path.empty())) {
        errors.push_back("STREAMGUARD_CERT/STREAMGUARD_KEY: required when TLS is enabled");
    }
    if (config.extractor_path.empty()) {
        errors.push_back("YTDLP_PATH: must not be empty");
    }
    if (config.extractor_timeout_sec <= 0) {
        errors.push_back("YTDLP_TIMEOUT: must be positive");
    }
    if (config.video_info_ttl_sec <= 0) {
        errors.push_back("VIDEO_INFO_TTL: must be positive");
    }
    if (config.stream_url_ttl_sec <= 0) {
        errors.push_back("STREAM_URL_TTL: must be positive");
    }

    auto mode = DefaultInputValidator::normalize_lower(config.default_stream_mode);
    if (mode != "proxy" && mode != "direct") {
        errors.push_back("DEFAULT_STREAM_MODE: must be 'proxy' or 'direct'");
    }
    for (const auto& code : config.proxy_countries) {
        if (code.size() != 2 || !std::isalpha(static_cast<unsigned char>(code[0])) ||
            !std::isalpha(static_cast<unsigned char>(code[1]))) {
            errors.push_back("PROXY_COUNTRIES: invalid country code '" + code + "'");
        }
    }

    try {
        validate(config.security);
    } catch (const ConfigError& e) {
        errors.insert(errors.end(), e.violations().begin(), e.violations().end());
    }

    if (!errors.empty()) {
        throw ConfigError(std::move(errors));
    }
}

}
