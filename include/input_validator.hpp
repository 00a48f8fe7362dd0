#pragma once

#include <string>
#include <vector>
#include <optional>
#include <unordered_set>
#include <boost/json.hpp>

#include "security_policy.hpp"

namespace streamguard {

// A single field rule failure. Echoed to the client as-is: every value here
// came from the client in the first place.
struct ValidationError {
    std::string field;
    std::string value;
    std::string message;
    std::string code;
};

// {field, value?, message, code}; value is omitted when empty.
boost::json::object to_json(const ValidationError& error);

// Parameters extracted from the route and query string. An unset optional
// means the route or request does not carry that field at all.
struct RequestParameters {
    std::optional<std::string> platform;
    std::optional<std::string> video_id;
    std::optional<std::string> playlist_id;
    std::optional<std::string> quality;
    std::optional<std::string> country;
    std::optional<std::string> mode;
};

// Per-field syntactic and semantic rules.
class InputValidator {
public:
    virtual ~InputValidator() = default;

    virtual std::optional<ValidationError> validate_platform(const std::string& platform) const = 0;
    virtual std::optional<ValidationError> validate_video_id(const std::string& video_id) const = 0;
    virtual std::optional<ValidationError> validate_playlist_id(const std::string& playlist_id) const = 0;
    virtual std::optional<ValidationError> validate_quality(const std::string& quality) const = 0;
    virtual std::optional<ValidationError> validate_country_code(const std::string& code) const = 0;
    virtual std::optional<ValidationError> validate_mode(const std::string& mode) const = 0;

    // Runs every rule for the fields present and returns all failures, in
    // field order: platform, video_id, playlist_id, quality, country, mode.
    std::vector<ValidationError> validate_all(const RequestParameters& params) const;
};

// Rules driven by the configured allowlist universe.
class DefaultInputValidator : public InputValidator {
public:
    explicit DefaultInputValidator(const SecurityPolicy& policy);

    std::optional<ValidationError> validate_platform(const std::string& platform) const override;
    std::optional<ValidationError> validate_video_id(const std::string& video_id) const override;
    std::optional<ValidationError> validate_playlist_id(const std::string& playlist_id) const override;
    std::optional<ValidationError> validate_quality(const std::string& quality) const override;
    std::optional<ValidationError> validate_country_code(const std::string& code) const override;
    std::optional<ValidationError> validate_mode(const std::string& mode) const override;

    // Checks for safe identifier characters: [A-Za-z0-9_-], non-empty.
    static bool is_valid_identifier(const std::string& str);

    // ASCII trim + lowercase.
    static std::string normalize_lower(const std::string& str);

    // ASCII trim + uppercase.
    static std::string normalize_upper(const std::string& str);

private:
    std::unordered_set<std::string> allowed_platforms_;
    std::unordered_set<std::string> allowed_qualities_;
    size_t max_video_id_length_;
    size_t max_playlist_id_length_;

    std::optional<ValidationError> validate_identifier(const std::string& field, const std::string& value,
                                                       size_t max_length) const;
};

}
