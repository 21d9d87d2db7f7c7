#ifndef STENCIL_LOG_TEMPLATE_FORMATTER_HPP
#define STENCIL_LOG_TEMPLATE_FORMATTER_HPP

#include "formatter_interface.hpp"
#include "formatter_settings.hpp"
#include "message_template.hpp"
#include "plain_text_formatter.hpp"
#include "json_detail.hpp"
#include "../core/encoding_error.hpp"
#include "../core/log_common.hpp"
#include <string>
#include <set>
#include <utility>

namespace stencil {
    /// Formatter driven by a message template such as
    /// "[<time>] [<level>] [<id>] <msg>".
    ///
    /// Output modes:
    ///   - text: the rendered message, then " | key = value" for every field
    ///     the template did not consume (request id excluded)
    ///   - JSON: {"timestamp","level","id","message","data"} on one line
    ///   - empty template: PlainTextFormatter
    ///
    /// Settings are fixed at construction; use FormatterConfiguration to
    /// build one.  format() is const and safe to call from many threads.
    class TemplateFormatter : public IFormatter {
    public:
        explicit TemplateFormatter(FormatterSettings settings)
            : m_settings(std::move(settings)) {}

        /// @throws EncodingError in JSON mode only; partialOutput() holds a
        ///         best-effort line.
        std::string format(const LogRecord &record) const override {
            if (m_settings.logTemplate.empty()) {
                return m_fallback.format(record);
            }
            if (m_settings.jsonOutput) {
                return renderJson(record);
            }
            return renderText(record);
        }

        /// The templated message line alone, without trailing fields.
        std::string renderMessage(const LogRecord &record) const {
            return detail::renderMessage(m_settings, record);
        }

        std::string renderText(const LogRecord &record) const {
            std::set<std::string> consumed;
            std::string output = detail::renderMessage(m_settings, record, &consumed);

            for (const auto &field : record.fields) {
                if (field.first == kRequestIdKey) continue;
                if (consumed.count(field.first)) continue;

                output += m_settings.separator;
                output += ' ';
                output += field.first;
                output += " = ";
                output += textValue(field.second);
            }
            output += '\n';
            return output;
        }

        std::string renderJson(const LogRecord &record) const {
            std::string message = detail::renderMessage(m_settings, record);
            try {
                return detail::json::dump(buildJson(record, message, true), true) + '\n';
            } catch (const EncodingError &e) {
                throw EncodingError(e.what(),
                    detail::json::dump(buildJson(record, message, false), false) + '\n');
            }
        }

        const std::string &logTemplate() const { return m_settings.logTemplate; }
        const std::string &prefix() const { return m_settings.prefix; }
        const std::string &separator() const { return m_settings.separator; }
        const std::string &timeLayout() const { return m_settings.timeLayout; }
        bool isJsonOutput() const { return m_settings.jsonOutput; }
        bool isDefaultTemplate() const { return m_settings.isDefaultTemplate; }

        const FormatterSettings &settings() const { return m_settings; }

    private:
        /// Nested maps are written as compact JSON; if that fails the map[...]
        /// form is used so the line is still produced.
        static std::string textValue(const FieldValue &value) {
            if (value.isMap()) {
                try {
                    return detail::json::encode(value);
                } catch (const EncodingError &) {
                    // fall through to toString()
                }
            }
            return value.toString();
        }

        /// The JSON timestamp always uses RFC3339; timeLayout only affects
        /// <time> inside the message.  data keeps the request id as well.
        static detail::json::Json buildJson(const LogRecord &record, const std::string &message,
                                            bool strict) {
            detail::json::Json j = detail::json::Json::object();
            j["timestamp"] = formatTimestamp(record.time);
            j["level"] = getLevelString(record.level);
            const FieldValue *id = requestId(record);
            if (id) {
                j["id"] = id->toString();
            }
            j["message"] = message;
            if (!record.fields.empty()) {
                j["data"] = detail::json::toJson(record.fields, strict);
            }
            return j;
        }

        FormatterSettings m_settings;
        PlainTextFormatter m_fallback;
    };
} // namespace stencil

#endif // STENCIL_LOG_TEMPLATE_FORMATTER_HPP
