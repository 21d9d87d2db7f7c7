#ifndef STENCIL_LOG_FORMATTER_SETTINGS_HPP
#define STENCIL_LOG_FORMATTER_SETTINGS_HPP

#include "../core/log_common.hpp"
#include <string>

namespace stencil {
    /// Message template used by FormatterConfiguration::defaults().
    static const char *const kDefaultLogTemplate = "[<time>] [<level>] [<id>] <msg>";

    /// Separator placed before every key = value pair appended in text mode.
    static const char *const kDefaultSeparator = " |";

    /// Plain settings snapshot shared by the builder and the formatter.
    struct FormatterSettings {
        std::string logTemplate;
        std::string prefix;
        std::string separator;
        std::string timeLayout;
        bool jsonOutput;
        bool isDefaultTemplate;

        FormatterSettings()
            : separator(kDefaultSeparator)
            , timeLayout(kRfc3339Layout)
            , jsonOutput(false)
            , isDefaultTemplate(false) {}
    };
} // namespace stencil

#endif // STENCIL_LOG_FORMATTER_SETTINGS_HPP
