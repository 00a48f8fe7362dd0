#include "input_validator.hpp"

#include <algorithm>
#include <cctype>

namespace streamguard {

namespace json = boost::json;

json::object to_json(const ValidationError& error) {
    json::object obj;
    obj["field"] = error.field;
    if (!error.value.empty()) {
        obj["value"] = error.value;
    }
    obj["message"] = error.message;
    obj["code"] = error.code;
    return obj;
}

std::vector<ValidationError> InputValidator::validate_all(const RequestParameters& params) const {
    std::vector<ValidationError> errors;
    auto collect = [&errors](std::optional<ValidationError> err) {
        if (err) errors.push_back(std::move(*err));
    };

    if (params.platform) collect(validate_platform(*params.platform));
    if (params.video_id) collect(validate_video_id(*params.video_id));
    if (params.playlist_id) collect(validate_playlist_id(*params.playlist_id));
    if (params.quality) collect(validate_quality(*params.quality));
    if (params.country) collect(validate_country_code(*params.country));
    if (params.mode) collect(validate_mode(*params.mode));

    return errors;
}

// --- DefaultInputValidator ---

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string DefaultInputValidator::normalize_lower(const std::string& str) {
    std::string out = trim(str);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string DefaultInputValidator::normalize_upper(const std::string& str) {
    std::string out = trim(str);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

bool DefaultInputValidator::is_valid_identifier(const std::string& str) {
    if (str.empty()) return false;
    return std::all_of(str.begin(), str.end(), [](char c) {
        auto uc = static_cast<unsigned char>(c);
        return (uc < 0x80 && std::isalnum(uc)) || c == '_' || c == '-';
    });
}

DefaultInputValidator::DefaultInputValidator(const SecurityPolicy& policy)
    : max_video_id_length_(policy.max_video_id_length)
    , max_playlist_id_length_(policy.max_playlist_id_length)
{
    for (const auto& p : policy.allowed_platforms) {
        allowed_platforms_.insert(normalize_lower(p));
    }
    for (const auto& q : policy.allowed_qualities) {
        allowed_qualities_.insert(normalize_lower(q));
    }
}

std::optional<ValidationError> DefaultInputValidator::validate_platform(const std::string& platform) const {
    if (platform.empty()) {
        return ValidationError{"platform", platform, "platform is required", "REQUIRED"};
    }

    if (allowed_platforms_.count(normalize_lower(platform)) == 0) {
        return ValidationError{"platform", platform, "unsupported platform", "INVALID_PLATFORM"};
    }

    return std::nullopt;
}

std::optional<ValidationError> DefaultInputValidator::validate_identifier(const std::string& field,
                                                                          const std::string& value,
                                                                          size_t max_length) const {
    if (value.empty()) {
        return ValidationError{field, value, field + " is required", "REQUIRED"};
    }

    if (value.size() > max_length) {
        return ValidationError{field, value,
                               field + " exceeds maximum length of " + std::to_string(max_length) + " characters",
                               "MAX_LENGTH_EXCEEDED"};
    }

    if (!is_valid_identifier(value)) {
        return ValidationError{field, value,
                               field + " contains invalid characters; only alphanumeric, hyphens, and underscores are allowed",
                               "INVALID_CHARACTERS"};
    }

    return std::nullopt;
}

std::optional<ValidationError> DefaultInputValidator::validate_video_id(const std::string& video_id) const {
    return validate_identifier("video_id", video_id, max_video_id_length_);
}

std::optional<ValidationError> DefaultInputValidator::validate_playlist_id(const std::string& playlist_id) const {
    return validate_identifier("playlist_id", playlist_id, max_playlist_id_length_);
}

std::optional<ValidationError> DefaultInputValidator::validate_quality(const std::string& quality) const {
    // Optional; absent means "best".
    if (quality.empty()) return std::nullopt;

    if (allowed_qualities_.count(normalize_lower(quality)) == 0) {
        return ValidationError{"quality", quality, "unsupported quality value", "INVALID_QUALITY"};
    }
    return std::nullopt;
}

std::optional<ValidationError> DefaultInputValidator::validate_country_code(const std::string& code) const {
    if (code.empty()) return std::nullopt;

    std::string normalized = normalize_upper(code);
    bool ok = normalized.size() == 2 &&
              std::all_of(normalized.begin(), normalized.end(), [](char c) { return c >= 'A' && c <= 'Z'; });
    if (!ok) {
        return ValidationError{"country", code, "country must be a valid 2-letter ISO country code",
                               "INVALID_COUNTRY_CODE"};
    }
    return std::nullopt;
}

std::optional<ValidationError> DefaultInputValidator::validate_mode(const std::string& mode) const {
    if (mode.empty()) return std::nullopt;

    std::string normalized = normalize_lower(mode);
    if (normalized != "proxy" && normalized != "direct") {
        return ValidationError{"mode", mode, "mode must be either 'proxy' or 'direct'", "INVALID_MODE"};
    }
    return std::nullopt;
}

}
