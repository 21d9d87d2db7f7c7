#ifndef STENCIL_LOG_FORMATTER_CONFIGURATION_HPP
#define STENCIL_LOG_FORMATTER_CONFIGURATION_HPP

#include "formatter/formatter_settings.hpp"
#include "formatter/template_formatter.hpp"
#include "core/log_common.hpp"

#include <string>
#include <chrono>
#include <stdexcept>
#include <memory>

namespace stencil {

    /// Fluent builder for an immutable TemplateFormatter.
    ///
    /// Usage:
    /// @code
    ///   auto formatter = FormatterConfiguration::defaults(kPrefixRequestIncoming)
    ///       .separator(" ;")
    ///       .timeLayout("%H:%M:%S.%L")
    ///       .build();
    ///
    ///   auto json = FormatterConfiguration()
    ///       .logTemplate("<method> <path> <msg>")
    ///       .jsonOutput()
    ///       .build();
    /// @endcode
    ///
    /// A blank configuration has no template, so its formatter writes the
    /// plain logfmt line until logTemplate() is set.  Only defaults() turns on
    /// elision of " [<id>]" and " [<msg>]" for missing values; that flag
    /// survives a later logTemplate() call.
    class FormatterConfiguration {
    public:
        FormatterConfiguration() : m_built(false) {}

        FormatterConfiguration(const FormatterConfiguration&) = delete;
        FormatterConfiguration& operator=(const FormatterConfiguration&) = delete;
        FormatterConfiguration(FormatterConfiguration&&) = default;
        FormatterConfiguration& operator=(FormatterConfiguration&&) = default;

        /// The stock "[<time>] [<level>] [<id>] <msg>" layout with elision.
        static FormatterConfiguration defaults(const std::string &prefix = std::string()) {
            FormatterConfiguration config;
            config.m_settings.logTemplate = kDefaultLogTemplate;
            config.m_settings.isDefaultTemplate = true;
            config.m_settings.prefix = prefix;
            return config;
        }

        FormatterConfiguration& logTemplate(const std::string &templateStr) {
            m_settings.logTemplate = templateStr;
            return *this;
        }

        /// Stored for the caller; the formatter never prepends it.
        FormatterConfiguration& prefix(const std::string &prefix) {
            m_settings.prefix = prefix;
            return *this;
        }

        FormatterConfiguration& separator(const std::string &sep) {
            m_settings.separator = sep;
            return *this;
        }

        FormatterConfiguration& jsonOutput() {
            m_settings.jsonOutput = true;
            return *this;
        }

        /// strftime layout for <time>, rendered in UTC; %L adds milliseconds.
        FormatterConfiguration& timeLayout(const std::string &layout) {
            m_settings.timeLayout = layout;
            return *this;
        }

        const FormatterSettings& settings() const { return m_settings; }

        /// Validate and freeze the settings.
        ///
        /// @throws std::invalid_argument if a non-empty time layout renders to
        ///         nothing (e.g. longer than any supported timestamp).
        /// @throws std::logic_error if called more than once.
        TemplateFormatter build() {
            if (m_built) {
                throw std::logic_error("FormatterConfiguration::build() called more than once");
            }
            if (!m_settings.timeLayout.empty() &&
                formatTimestamp(std::chrono::system_clock::time_point(), m_settings.timeLayout).empty()) {
                throw std::invalid_argument("Time layout renders no output: " + m_settings.timeLayout);
            }
            m_built = true;
            return TemplateFormatter(m_settings);
        }

        /// build() for callers that hand the formatter to a sink.
        std::unique_ptr<TemplateFormatter> buildUnique() {
            return detail::make_unique<TemplateFormatter>(build());
        }

    private:
        FormatterSettings m_settings;
        bool m_built;
    };

} // namespace stencil

#endif // STENCIL_LOG_FORMATTER_CONFIGURATION_HPP
