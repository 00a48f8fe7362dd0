#pragma once

#include <string>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <ctime>
#include <cctype>

namespace streamguard {

// Operational (application) log. One bracketed line per event; INFO and WARN
// go to the standard stream, ERROR and CRIT to the error stream. This sink
// is separate from the audit log and never receives audit JSON.
class ServiceLogger {
public:
    enum class Level {
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class Event {
        STARTUP,
        SHUTDOWN,
        CONFIG,
        REQUEST,
        ACCESS_DENIED,
        SIZE_LIMIT,
        VALIDATION,
        SANITIZATION,
        SUSPICIOUS_ACTIVITY,
        CLIENT_ERROR,
        SERVER_ERROR,
        PANIC_RECOVERED,
        CACHE,
        LOOKUP,
        AUDIT,
        CONNECTION
    };

    /**
     * Records an operational event.
     * @param level Severity level of the event.
     * @param event Category used for filtering.
     * @param remote_addr Client address, or "internal" for server-side events.
     * @param message Free text; quotes, backslashes and line breaks are neutralized.
     */
    static void log(Level level, Event event, const std::string& remote_addr,
                    const std::string& message = "") {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);

        struct tm gmt;
        gmtime_r(&time_t, &gmt);

        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] "
           << "ip=" << (remote_addr.empty() ? "unknown" : sanitize_log_message(remote_addr));

        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }

        std::lock_guard<std::mutex> lock(state().mutex);
        std::ostream& out = (level == Level::ERROR || level == Level::CRITICAL)
            ? *state().err : *state().out;
        out << ss.str() << "\n";
        out.flush();
    }

    // Redirects output; used by tests to capture the operational stream.
    static void set_streams(std::ostream& out, std::ostream& err) {
        std::lock_guard<std::mutex> lock(state().mutex);
        state().out = &out;
        state().err = &err;
    }

    static void reset_streams() {
        set_streams(std::cout, std::cerr);
    }

    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }

    static std::string event_to_string(Event event) {
        switch (event) {
            case Event::STARTUP: return "STARTUP";
            case Event::SHUTDOWN: return "SHUTDOWN";
            case Event::CONFIG: return "CONFIG";
            case Event::REQUEST: return "REQUEST";
            case Event::ACCESS_DENIED: return "ACCESS_DENIED";
            case Event::SIZE_LIMIT: return "SIZE_LIMIT";
            case Event::VALIDATION: return "VALIDATION";
            case Event::SANITIZATION: return "SANITIZATION";
            case Event::SUSPICIOUS_ACTIVITY: return "SUSPICIOUS";
            case Event::CLIENT_ERROR: return "CLIENT_ERROR";
            case Event::SERVER_ERROR: return "SERVER_ERROR";
            case Event::PANIC_RECOVERED: return "PANIC";
            case Event::CACHE: return "CACHE";
            case Event::LOOKUP: return "LOOKUP";
            case Event::AUDIT: return "AUDIT";
            case Event::CONNECTION: return "CONNECTION";
            default: return "UNKNOWN_EVENT";
        }
    }

    // Escapes non-printable characters and quotes to ensure log integrity
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }

private:
    struct State {
        std::mutex mutex;
        std::ostream* out = &std::cout;
        std::ostream* err = &std::cerr;
    };

    static State& state() {
        static State s;
        return s;
    }
};

}
