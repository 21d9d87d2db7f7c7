#ifndef STENCIL_LOG_RECORD_HPP
#define STENCIL_LOG_RECORD_HPP

#include "log_level.hpp"
#include "field_value.hpp"
#include <string>
#include <chrono>
#include <utility>

namespace stencil {
    /// Field key carrying the request-correlation id.  The only key with
    /// special meaning; every other key is opaque user data.
    static const char *const kRequestIdKey = "X-Request-ID";

    /// Conventional message prefixes for request tracing.
    static const char *const kPrefixRequestIncoming = ">>>";
    static const char *const kPrefixRequestHandling = "===";
    static const char *const kPrefixRequestOutgoing = "<<<";

    struct LogRecord {
        std::chrono::system_clock::time_point time;
        LogLevel level;
        std::string message;
        FieldMap fields;

        LogRecord() : level(LogLevel::INFO) {}

        LogRecord(std::chrono::system_clock::time_point t, LogLevel lvl,
                  std::string msg, FieldMap data = FieldMap())
            : time(t), level(lvl), message(std::move(msg)), fields(std::move(data)) {}
    };

    /// The request id field of a record, or nullptr when absent.
    inline const FieldValue *requestId(const LogRecord &record) {
        FieldMap::const_iterator it = record.fields.find(kRequestIdKey);
        return it == record.fields.end() ? nullptr : &it->second;
    }
} // namespace stencil

#endif // STENCIL_LOG_RECORD_HPP
