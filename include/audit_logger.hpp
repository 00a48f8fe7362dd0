#pragma once

#include <string>
#include <cstdint>
#include <chrono>
#include <fstream>
#include <mutex>
#include <boost/json.hpp>

namespace streamguard {

enum class AuditEventType {
    ValidationFailure,
    AccessDenied,
    SizeLimitExceeded,
    SuspiciousActivity,
    PanicRecovered,
    SanitizationTriggered
};

enum class AuditSeverity {
    Info,
    Warning,
    Error,
    Critical
};

const char* to_string(AuditEventType type);
const char* to_string(AuditSeverity severity);

// Request attributes copied into every audit entry.
struct RequestInfo {
    std::string client_address;
    std::string method;
    std::string path;
    std::string user_agent;
};

// One immutable audit record, serialized as a single JSON line.
struct AuditLogEntry {
    std::string timestamp;  // RFC 3339, UTC, millisecond precision
    std::string request_id;
    AuditEventType event_type;
    RequestInfo request;
    boost::json::object details;
    AuditSeverity severity;
};

boost::json::object to_json(const AuditLogEntry& entry);

// UTC time as "YYYY-MM-DDTHH:MM:SS.mmmZ".
std::string utc_timestamp(std::chrono::system_clock::time_point tp = std::chrono::system_clock::now());

/**
 * Returns a random RFC 4122 version-4 UUID drawn from the OpenSSL CSPRNG.
 * @throws std::runtime_error if the CSPRNG fails.
 */
std::string generate_uuid_v4();

// Values echoed into validation audit entries are cut to this many bytes.
constexpr size_t kMaxAuditValueLength = 256;

// Replaces every ill-formed UTF-8 sequence with U+FFFD.
std::string to_valid_utf8(const std::string& in);

// Longest prefix of a valid UTF-8 string that fits in max_bytes without
// splitting a code point.
std::string truncate_utf8(const std::string& in, size_t max_bytes);

// Structured, append-only security event sink. The per-category methods
// build an entry and hand it to record(); implementations decide where it
// goes. Implementations must make record() safe to call concurrently.
class AuditLogger {
public:
    virtual ~AuditLogger() = default;

    void log_validation_failure(const std::string& request_id, const RequestInfo& req,
                                const std::string& field, const std::string& value,
                                const std::string& reason);

    void log_access_denied(const std::string& request_id, const RequestInfo& req,
                           const std::string& reason);

    void log_size_limit_exceeded(const std::string& request_id, const RequestInfo& req,
                                 const std::string& limit_type, int64_t size, int64_t limit);

    void log_suspicious_activity(const std::string& request_id, const RequestInfo& req,
                                 const std::string& pattern, const std::string& details);

    void log_panic_recovered(const std::string& request_id, const RequestInfo& req,
                             const std::string& error, const std::string& stack);

    void log_sanitization_triggered(const std::string& request_id, const RequestInfo& req,
                                    const std::string& pattern_type, const std::string& field);

    // Unique per call; assigned once per inbound request.
    std::string generate_request_id() const { return generate_uuid_v4(); }

    virtual bool is_enabled() const = 0;

protected:
    virtual void record(const AuditLogEntry& entry) = 0;

private:
    void emit(const std::string& request_id, AuditEventType type, AuditSeverity severity,
              const RequestInfo& req, boost::json::object details);
};

// Discards every entry. Used when auditing is disabled.
class NullAuditLogger : public AuditLogger {
public:
    bool is_enabled() const override { return false; }

protected:
    void record(const AuditLogEntry&) override {}
};

// Appends JSON lines to a file. A single mutex serializes the append so
// concurrent requests never interleave partial lines.
class FileAuditLogger : public AuditLogger {
public:
    /**
     * Opens (creating parent directories) the audit file in append mode.
     * When enabled is false no file is created and every call is a no-op.
     * @throws std::runtime_error if the file cannot be opened.
     */
    FileAuditLogger(const std::string& path, bool enabled);
    ~FileAuditLogger() override;

    FileAuditLogger(const FileAuditLogger&) = delete;
    FileAuditLogger& operator=(const FileAuditLogger&) = delete;

    bool is_enabled() const override { return enabled_; }
    const std::string& path() const { return path_; }

    void close();

protected:
    void record(const AuditLogEntry& entry) override;

private:
    std::string path_;
    bool enabled_;
    std::ofstream file_;
    std::mutex write_mutex_;
};

}
