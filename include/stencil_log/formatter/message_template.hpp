#ifndef STENCIL_LOG_MESSAGE_TEMPLATE_HPP
#define STENCIL_LOG_MESSAGE_TEMPLATE_HPP

#include "formatter_settings.hpp"
#include "../core/log_record.hpp"
#include "../core/log_common.hpp"
#include <string>
#include <set>

namespace stencil {

    /// Placeholder token for a field key: "region" -> "<region>".
    inline std::string placeholderToken(const std::string &key) {
        return "<" + key + ">";
    }

namespace detail {

    static const char *const kTimeToken  = "<time>";
    static const char *const kLevelToken = "<level>";
    static const char *const kIdToken    = "<id>";
    static const char *const kMsgToken   = "<msg>";

    /// Segments the default template drops when their value is missing.
    /// The id is only ever elided in its bracketed form.  The message is
    /// elided bracketed if present, else as the bare trailing " <msg>" that
    /// kDefaultLogTemplate ends with.
    static const char *const kIdSegment     = " [<id>]";
    static const char *const kMsgSegment    = " [<msg>]";
    static const char *const kBareMsgSegment = " <msg>";

    /// Width the level name is right-justified to.
    static const size_t kLevelWidth = 5;

    /// Replace the first occurrence of token.  Returns false if absent.
    inline bool replaceFirst(std::string &buffer, const std::string &token,
                             const std::string &value) {
        size_t pos = buffer.find(token);
        if (pos == std::string::npos) return false;
        buffer.replace(pos, token.size(), value);
        return true;
    }

    inline bool eraseFirst(std::string &buffer, const std::string &segment) {
        size_t pos = buffer.find(segment);
        if (pos == std::string::npos) return false;
        buffer.erase(pos, segment.size());
        return true;
    }

    inline std::string paddedLevel(LogLevel level) {
        std::string name = getLevelString(level);
        if (name.size() < kLevelWidth) {
            name.insert(0, kLevelWidth - name.size(), ' ');
        }
        return name;
    }

    /// Render the message line of a record from the configured template.
    ///
    /// Rules run in a fixed order over one buffer, each touching only the
    /// first occurrence of its token:
    ///   1. <time>   record time in settings.timeLayout
    ///   2. <level>  upper-case level, right-justified to 5 columns
    ///   3. <id>     request id; if absent, the default template drops " [<id>]"
    ///               and any other template keeps the token verbatim
    ///   4. <key>    each other field, in key order
    ///   5. <msg>    message; if empty, the default template drops " [<msg>]"
    ///               (or " <msg>"), any other template keeps the token
    ///
    /// The order is observable: a substituted value that itself contains a
    /// later token is expanded by the later rule.
    ///
    /// Keys whose token was substituted in step 4 are added to consumed when
    /// it is non-null.
    inline std::string renderMessage(const FormatterSettings &settings, const LogRecord &record,
                                     std::set<std::string> *consumed = nullptr) {
        std::string output = settings.logTemplate;

        replaceFirst(output, kTimeToken, formatTimestamp(record.time, settings.timeLayout));
        replaceFirst(output, kLevelToken, paddedLevel(record.level));

        const FieldValue *id = requestId(record);
        if (id) {
            replaceFirst(output, kIdToken, id->toString());
        } else if (settings.isDefaultTemplate) {
            eraseFirst(output, kIdSegment);
        }

        for (const auto &field : record.fields) {
            if (field.first == kRequestIdKey) continue;
            if (replaceFirst(output, placeholderToken(field.first), field.second.toString())) {
                if (consumed) consumed->insert(field.first);
            }
        }

        if (!record.message.empty()) {
            replaceFirst(output, kMsgToken, record.message);
        } else if (settings.isDefaultTemplate) {
            if (!eraseFirst(output, kMsgSegment)) {
                eraseFirst(output, kBareMsgSegment);
            }
        }

        return output;
    }

} // namespace detail
} // namespace stencil

#endif // STENCIL_LOG_MESSAGE_TEMPLATE_HPP
