#include "input_sanitizer.hpp"

#include <algorithm>
#include <cctype>

namespace streamguard {

const char* to_string(SanitizationCategory category) {
    switch (category) {
        case SanitizationCategory::NullOrControl: return "null_or_control";
        case SanitizationCategory::InvalidEncoding: return "invalid_encoding";
    }
    return "unknown";
}

const char* to_string(ThreatCategory category) {
    switch (category) {
        case ThreatCategory::SqlInjection: return "sql_injection";
        case ThreatCategory::Xss: return "xss";
        case ThreatCategory::CommandInjection: return "command_injection";
    }
    return "unknown";
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool url_decode(const std::string& in, std::string& out, bool plus_as_space) {
    out.clear();
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        char c = in[i];
        if (c == '%') {
            if (i + 2 >= in.size()) return false;
            int hi = hex_value(in[i + 1]);
            int lo = hex_value(in[i + 2]);
            if (hi < 0 || lo < 0) return false;
            out += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else if (c == '+' && plus_as_space) {
            out += ' ';
        } else {
            out += c;
        }
    }
    return true;
}

static std::vector<std::regex> compile(const std::vector<const char*>& patterns) {
    std::vector<std::regex> out;
    out.reserve(patterns.size());
    for (const char* p : patterns) {
        out.emplace_back(p, std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
    }
    return out;
}

static bool is_plain_token(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) {
        auto uc = static_cast<unsigned char>(c);
        return uc < 0x80 && std::isalnum(uc);
    });
}

DefaultInputSanitizer::DefaultInputSanitizer()
    : traversal_pattern_(R"((?:\.|%2e){2}(?:/|\\|%2f|%5c))",
                         std::regex::ECMAScript | std::regex::icase | std::regex::optimize)
    , sql_patterns_(compile({
          R"('\s*;\s*(?:drop|delete|update|insert)\s+)",
          R"(union\s+(?:all\s+)?select)",
          R"('\s*or\s+'?\d*'?\s*=\s*'?\d*)",
          R"('\s*or\s+1\s*=\s*1)",
          R"(--\s*$)",
          R"(/\*.*\*/)",
      }))
    , xss_patterns_(compile({
          R"(<script[^>]*>)",
          R"(</script>)",
          R"(javascript\s*:)",
          R"(\bon\w+\s*=)",
          R"(<iframe[^>]*>)",
          R"(<object[^>]*>)",
          R"(<embed[^>]*>)",
          R"(<svg[^>]*onload)",
          R"(expression\s*\()",
          R"(vbscript\s*:)",
      }))
    , command_patterns_(compile({
          R"(;\s*\w+)",
          R"(\|\s*\w+)",
          R"(\$\([^)]+\))",
          R"(`[^`]+`)",
          R"(&&\s*\w+)",
          R"(\|\|\s*\w+)",
          R"(>\s*/)",
          R"(<\s*/)",
      }))
{}

bool DefaultInputSanitizer::contains_null_or_control(const std::string& input) const {
    return std::any_of(input.begin(), input.end(), [](char ch) {
        auto c = static_cast<unsigned char>(ch);
        return c <= 0x1F && c != 0x09 && c != 0x0A && c != 0x0D;
    });
}

std::string DefaultInputSanitizer::strip_traversal(std::string value) const {
    // Removal can splice a new sequence together ("..././"), so repeat until stable.
    for (;;) {
        std::string next = std::regex_replace(value, traversal_pattern_, "");
        if (next == value) break;
        value = std::move(next);
    }

    std::string::size_type pos;
    while ((pos = value.find("//")) != std::string::npos) {
        value.erase(pos, 1);
    }
    return value;
}

SanitizationOutcome DefaultInputSanitizer::sanitize_path(const std::string& path) const {
    if (contains_null_or_control(path)) {
        return SanitizationOutcome::rejected({"path", SanitizationCategory::NullOrControl,
                                              "path contains null bytes or control characters",
                                              "NULL_OR_CONTROL_CHARS"});
    }

    std::string decoded;
    if (!url_decode(path, decoded, false)) {
        decoded = path;  // best effort: clean the raw form
    }

    if (contains_null_or_control(decoded)) {
        return SanitizationOutcome::rejected({"path", SanitizationCategory::NullOrControl,
                                              "decoded path contains null bytes or control characters",
                                              "NULL_OR_CONTROL_CHARS"});
    }

    return SanitizationOutcome::cleaned(strip_traversal(std::move(decoded)));
}

SanitizationOutcome DefaultInputSanitizer::sanitize_url(const std::string& raw_url) const {
    if (contains_null_or_control(raw_url)) {
        return SanitizationOutcome::rejected({"url", SanitizationCategory::NullOrControl,
                                              "URL contains null bytes or control characters",
                                              "NULL_OR_CONTROL_CHARS"});
    }

    std::string decoded;
    if (!url_decode(raw_url, decoded)) {
        return SanitizationOutcome::rejected({"url", SanitizationCategory::InvalidEncoding,
                                              "invalid URL encoding", "INVALID_ENCODING"});
    }

    if (contains_null_or_control(decoded)) {
        return SanitizationOutcome::rejected({"url", SanitizationCategory::NullOrControl,
                                              "decoded URL contains null bytes or control characters",
                                              "NULL_OR_CONTROL_CHARS"});
    }

    return SanitizationOutcome::cleaned(std::move(decoded));
}

SanitizationOutcome DefaultInputSanitizer::sanitize_parameter(const std::string& param) const {
    if (is_plain_token(param)) {
        return SanitizationOutcome::cleaned(param);
    }

    if (contains_null_or_control(param)) {
        return SanitizationOutcome::rejected({"parameter", SanitizationCategory::NullOrControl,
                                              "parameter contains null bytes or control characters",
                                              "NULL_OR_CONTROL_CHARS"});
    }

    std::string decoded;
    if (!url_decode(param, decoded)) {
        decoded = param;
    }

    if (contains_null_or_control(decoded)) {
        return SanitizationOutcome::rejected({"parameter", SanitizationCategory::NullOrControl,
                                              "decoded parameter contains null bytes or control characters",
                                              "NULL_OR_CONTROL_CHARS"});
    }

    size_t b = 0, e = decoded.size();
    while (b < e && std::isspace(static_cast<unsigned char>(decoded[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(decoded[e - 1]))) --e;
    return SanitizationOutcome::cleaned(decoded.substr(b, e - b));
}

std::optional<ThreatCategory> DefaultInputSanitizer::detect_malicious_patterns(const std::string& input) const {
    if (is_plain_token(input)) return std::nullopt;

    auto any_match = [&input](const std::vector<std::regex>& patterns) {
        return std::any_of(patterns.begin(), patterns.end(),
                           [&input](const std::regex& re) { return std::regex_search(input, re); });
    };

    if (any_match(sql_patterns_)) return ThreatCategory::SqlInjection;
    if (any_match(xss_patterns_)) return ThreatCategory::Xss;
    if (any_match(command_patterns_)) return ThreatCategory::CommandInjection;
    return std::nullopt;
}

}
