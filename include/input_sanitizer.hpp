#pragma once

#include <string>
#include <vector>
#include <optional>
#include <regex>

namespace streamguard {

// Why a value was rejected. The raw payload is never carried along.
enum class SanitizationCategory {
    NullOrControl,
    InvalidEncoding
};

// Malicious-pattern families reported by detection.
enum class ThreatCategory {
    SqlInjection,
    Xss,
    CommandInjection
};

const char* to_string(SanitizationCategory category);
const char* to_string(ThreatCategory category);

struct SanitizationError {
    std::string field;
    SanitizationCategory category;
    std::string message;
    std::string code;
};

// Either a cleaned value or a rejection.
class SanitizationOutcome {
public:
    static SanitizationOutcome cleaned(std::string value) {
        return SanitizationOutcome(std::move(value), std::nullopt);
    }
    static SanitizationOutcome rejected(SanitizationError error) {
        return SanitizationOutcome(std::string(), std::move(error));
    }

    bool ok() const { return !error_.has_value(); }
    const std::string& value() const { return value_; }
    const SanitizationError& error() const { return *error_; }

private:
    SanitizationOutcome(std::string value, std::optional<SanitizationError> error)
        : value_(std::move(value)), error_(std::move(error)) {}

    std::string value_;
    std::optional<SanitizationError> error_;
};

/**
 * Percent-decodes a string. With plus_as_space, '+' becomes ' ' (query
 * semantics). Returns false on a truncated or non-hex escape; out then holds
 * an unspecified partial result.
 */
bool url_decode(const std::string& in, std::string& out, bool plus_as_space = true);

// Detection and removal of traversal, injection and control-character payloads.
class InputSanitizer {
public:
    virtual ~InputSanitizer() = default;

    // Best-effort cleaner; rejects only on null/control characters.
    virtual SanitizationOutcome sanitize_path(const std::string& path) const = 0;

    // Strict: rejects control characters (raw or decoded) and malformed encoding.
    virtual SanitizationOutcome sanitize_url(const std::string& raw_url) const = 0;

    // Decodes leniently, rejects control characters, trims whitespace.
    virtual SanitizationOutcome sanitize_parameter(const std::string& param) const = 0;

    virtual std::optional<ThreatCategory> detect_malicious_patterns(const std::string& input) const = 0;

    virtual bool contains_null_or_control(const std::string& input) const = 0;
};

class DefaultInputSanitizer : public InputSanitizer {
public:
    DefaultInputSanitizer();

    SanitizationOutcome sanitize_path(const std::string& path) const override;
    SanitizationOutcome sanitize_url(const std::string& raw_url) const override;
    SanitizationOutcome sanitize_parameter(const std::string& param) const override;
    std::optional<ThreatCategory> detect_malicious_patterns(const std::string& input) const override;
    bool contains_null_or_control(const std::string& input) const override;

    // Strips "../", "..\" and their percent-encoded forms until none remain.
    std::string strip_traversal(std::string value) const;

private:
    std::regex traversal_pattern_;
    std::vector<std::regex> sql_patterns_;
    std::vector<std::regex> xss_patterns_;
    std::vector<std::regex> command_patterns_;
};

}
