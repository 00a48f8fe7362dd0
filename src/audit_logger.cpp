#include "audit_logger.hpp"
#include "service_logger.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <openssl/rand.h>

namespace streamguard {

namespace json = boost::json;

const char* to_string(AuditEventType type) {
    switch (type) {
        case AuditEventType::ValidationFailure: return "validation_failure";
        case AuditEventType::AccessDenied: return "access_denied";
        case AuditEventType::SizeLimitExceeded: return "size_limit_exceeded";
        case AuditEventType::SuspiciousActivity: return "suspicious_activity";
        case AuditEventType::PanicRecovered: return "panic_recovered";
        case AuditEventType::SanitizationTriggered: return "sanitization_triggered";
    }
    return "unknown";
}

const char* to_string(AuditSeverity severity) {
    switch (severity) {
        case AuditSeverity::Info: return "info";
        case AuditSeverity::Warning: return "warning";
        case AuditSeverity::Error: return "error";
        case AuditSeverity::Critical: return "critical";
    }
    return "unknown";
}

std::string utc_timestamp(std::chrono::system_clock::time_point now) {
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    struct tm gmt;
    gmtime_r(&time_t, &gmt);

    std::stringstream ss;
    ss << std::put_time(&gmt, "%Y-%m-%dT%H:%M:%S")
       << "." << std::setw(3) << std::setfill('0') << millis << "Z";
    return ss.str();
}

std::string generate_uuid_v4() {
    unsigned char b[16];
    if (RAND_bytes(b, sizeof(b)) != 1) {
        throw std::runtime_error("CSPRNG failure while generating request ID");
    }

    b[6] = static_cast<unsigned char>((b[6] & 0x0F) | 0x40);  // version 4
    b[8] = static_cast<unsigned char>((b[8] & 0x3F) | 0x80);  // RFC 4122 variant

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) ss << '-';
        ss << std::setw(2) << static_cast<int>(b[i]);
    }
    return ss.str();
}

std::string to_valid_utf8(const std::string& in) {
    static const char kReplacement[] = "\xEF\xBF\xBD";

    std::string out;
    out.reserve(in.size());
    size_t i = 0;
    while (i < in.size()) {
        auto c = static_cast<unsigned char>(in[i]);
        if (c < 0x80) {
            out += static_cast<char>(c);
            ++i;
            continue;
        }

        size_t len = 0;
        uint32_t cp = 0;
        uint32_t min = 0;
        if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; min = 0x80; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; min = 0x800; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; min = 0x10000; }

        size_t n = 1;
        if (len != 0) {
            while (n < len && i + n < in.size() &&
                   (static_cast<unsigned char>(in[i + n]) & 0xC0) == 0x80) {
                cp = (cp << 6) | (static_cast<unsigned char>(in[i + n]) & 0x3F);
                ++n;
            }
        }

        // Overlong forms, surrogates and values past U+10FFFF are ill-formed too.
        if (len != 0 && n == len && cp >= min && cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF)) {
            out.append(in, i, len);
        } else {
            out += kReplacement;
        }
        i += n;
    }
    return out;
}

std::string truncate_utf8(const std::string& in, size_t max_bytes) {
    if (in.size() <= max_bytes) return in;
    size_t end = max_bytes;
    while (end > 0 && (static_cast<unsigned char>(in[end]) & 0xC0) == 0x80) {
        --end;
    }
    return in.substr(0, end);
}

json::object to_json(const AuditLogEntry& entry) {
    json::object obj;
    obj["timestamp"] = entry.timestamp;
    obj["request_id"] = entry.request_id;
    obj["event_type"] = to_string(entry.event_type);
    obj["client_ip"] = entry.request.client_address;
    obj["method"] = entry.request.method;
    obj["path"] = entry.request.path;
    obj["user_agent"] = entry.request.user_agent;
    obj["details"] = entry.details;
    obj["severity"] = to_string(entry.severity);
    return obj;
}

// --- AuditLogger ---

void AuditLogger::emit(const std::string& request_id, AuditEventType type, AuditSeverity severity,
                       const RequestInfo& req, json::object details) {
    if (!is_enabled()) return;

    // Request attributes and detail text are client-controlled bytes; the
    // file must stay valid UTF-8.
    RequestInfo info{
        to_valid_utf8(req.client_address),
        to_valid_utf8(req.method),
        to_valid_utf8(req.path),
        to_valid_utf8(req.user_agent)
    };
    for (auto& field : details) {
        if (field.value().is_string()) {
            field.value() = to_valid_utf8(std::string(field.value().as_string()));
        }
    }

    AuditLogEntry entry{
        utc_timestamp(),
        request_id.empty() ? std::string("unknown") : request_id,
        type,
        std::move(info),
        std::move(details),
        severity
    };
    record(entry);
}

void AuditLogger::log_validation_failure(const std::string& request_id, const RequestInfo& req,
                                         const std::string& field, const std::string& value,
                                         const std::string& reason) {
    json::object details;
    details["field"] = field;
    auto clean = to_valid_utf8(value);
    details["value"] = truncate_utf8(clean, kMaxAuditValueLength);
    if (clean.size() > kMaxAuditValueLength) {
        details["value_truncated"] = true;
    }
    details["reason"] = reason;
    emit(request_id, AuditEventType::ValidationFailure, AuditSeverity::Warning, req, std::move(details));
}

void AuditLogger::log_access_denied(const std::string& request_id, const RequestInfo& req,
                                    const std::string& reason) {
    json::object details;
    details["reason"] = reason;
    emit(request_id, AuditEventType::AccessDenied, AuditSeverity::Warning, req, std::move(details));
}

void AuditLogger::log_size_limit_exceeded(const std::string& request_id, const RequestInfo& req,
                                          const std::string& limit_type, int64_t size, int64_t limit) {
    json::object details;
    details["limit_type"] = limit_type;
    details["size"] = size;
    details["limit"] = limit;
    emit(request_id, AuditEventType::SizeLimitExceeded, AuditSeverity::Warning, req, std::move(details));
}

void AuditLogger::log_suspicious_activity(const std::string& request_id, const RequestInfo& req,
                                          const std::string& pattern, const std::string& details_text) {
    json::object details;
    details["pattern"] = pattern;
    details["details"] = details_text;
    emit(request_id, AuditEventType::SuspiciousActivity, AuditSeverity::Error, req, std::move(details));
}

void AuditLogger::log_panic_recovered(const std::string& request_id, const RequestInfo& req,
                                      const std::string& error, const std::string& stack) {
    json::object details;
    details["error"] = error;
    details["stack"] = stack;
    emit(request_id, AuditEventType::PanicRecovered, AuditSeverity::Critical, req, std::move(details));
}

void AuditLogger::log_sanitization_triggered(const std::string& request_id, const RequestInfo& req,
                                             const std::string& pattern_type, const std::string& field) {
    json::object details;
    details["pattern_type"] = pattern_type;
    details["field"] = field;
    emit(request_id, AuditEventType::SanitizationTriggered, AuditSeverity::Warning, req, std::move(details));
}

// --- FileAuditLogger ---

FileAuditLogger::FileAuditLogger(const std::string& path, bool enabled)
    : path_(path), enabled_(enabled)
{
    if (!enabled_) return;

    std::filesystem::path p(path_);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Failed to create audit log directory '" +
                                     p.parent_path().string() + "': " + ec.message());
        }
    }

    file_.open(path_, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        throw std::runtime_error("Failed to open audit log '" + path_ + "'");
    }
}

FileAuditLogger::~FileAuditLogger() {
    close();
}

void FileAuditLogger::close() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

void FileAuditLogger::record(const AuditLogEntry& entry) {
    // Serialize before taking the lock; only the append is serialized.
    std::string line = json::serialize(to_json(entry));
    line += '\n';

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (!file_.is_open()) return;

    file_.write(line.data(), static_cast<std::streamsize>(line.size()));
    file_.flush();
    if (!file_) {
        file_.clear();
        ServiceLogger::log(ServiceLogger::Level::ERROR, ServiceLogger::Event::AUDIT, "internal",
                           "Failed to write audit log entry to " + path_);
    }
}

}
