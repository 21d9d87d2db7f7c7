#ifndef STENCIL_LOG_LEVEL_HPP
#define STENCIL_LOG_LEVEL_HPP

#include <string>
#include <stdexcept>

namespace stencil {
    enum class LogLevel {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERROR,
        FATAL,
        PANIC
    };

    inline const char *getLevelString(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARN: return "WARN";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            case LogLevel::PANIC: return "PANIC";
            default: return "UNKNOWN";
        }
    }

    /// Lowercase full level name: trace, debug, info, warn, error, fatal, panic
    inline const char *getLevelLower(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "trace";
            case LogLevel::DEBUG: return "debug";
            case LogLevel::INFO:  return "info";
            case LogLevel::WARN:  return "warn";
            case LogLevel::ERROR: return "error";
            case LogLevel::FATAL: return "fatal";
            case LogLevel::PANIC: return "panic";
            default: return "unknown";
        }
    }

    /// Parse a level name in either case ("warn", "WARN").
    /// @throws std::invalid_argument for anything else.
    inline LogLevel parseLevel(const std::string &name) {
        std::string s;
        s.reserve(name.size());
        for (char c : name) {
            s += (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
        }
        if (s == "TRACE") return LogLevel::TRACE;
        if (s == "DEBUG") return LogLevel::DEBUG;
        if (s == "INFO")  return LogLevel::INFO;
        if (s == "WARN")  return LogLevel::WARN;
        if (s == "ERROR") return LogLevel::ERROR;
        if (s == "FATAL") return LogLevel::FATAL;
        if (s == "PANIC") return LogLevel::PANIC;
        throw std::invalid_argument("Unknown log level: " + name);
    }
} // namespace stencil

#endif // STENCIL_LOG_LEVEL_HPP
