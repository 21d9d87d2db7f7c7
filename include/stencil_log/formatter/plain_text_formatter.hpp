#ifndef STENCIL_LOG_PLAIN_TEXT_FORMATTER_HPP
#define STENCIL_LOG_PLAIN_TEXT_FORMATTER_HPP

#include "formatter_interface.hpp"
#include "json_detail.hpp"
#include "../core/log_common.hpp"
#include <string>

namespace stencil {
    /// Untemplated logfmt line:
    ///   time="2026-02-16T12:00:00Z" level=info msg="user logged in" region=us-east
    ///
    /// Used when no message template is configured.  Fields follow in key
    /// order; values with characters outside [A-Za-z0-9-._/@^+] are quoted.
    /// Quoting uses JSON string escaping, so a control byte such as 0x01
    /// becomes \u0001 and invalid UTF-8 becomes U+FFFD.
    class PlainTextFormatter : public IFormatter {
    public:
        std::string format(const LogRecord &record) const override {
            std::string line;
            line.reserve(64 + record.message.size());
            appendPair(line, "time", formatTimestamp(record.time));
            appendPair(line, "level", getLevelLower(record.level));
            appendPair(line, "msg", record.message);
            for (const auto &field : record.fields) {
                appendPair(line, field.first, field.second.toString());
            }
            line += '\n';
            return line;
        }

    private:
        static bool needsQuoting(const std::string &text) {
            for (char c : text) {
                bool plain = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                             (c >= '0' && c <= '9') ||
                             c == '-' || c == '.' || c == '_' || c == '/' ||
                             c == '@' || c == '^' || c == '+';
                if (!plain) return true;
            }
            return false;
        }

        static void appendPair(std::string &line, const std::string &key, const std::string &value) {
            if (!line.empty()) line += ' ';
            line += key;
            line += '=';
            if (needsQuoting(value)) {
                line += detail::json::dump(detail::json::Json(value), false);
            } else {
                line += value;
            }
        }
    };
} // namespace stencil

#endif // STENCIL_LOG_PLAIN_TEXT_FORMATTER_HPP
