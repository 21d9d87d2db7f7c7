#ifndef STENCIL_LOG_FORMATTER_INTERFACE_HPP
#define STENCIL_LOG_FORMATTER_INTERFACE_HPP

#include "../core/log_record.hpp"
#include <string>

namespace stencil {
    /// Turns one record into one newline-terminated line.
    ///
    /// Implementations must be safe to call concurrently: format() is const
    /// and reads nothing but the record and immutable settings.  May throw
    /// EncodingError.
    class IFormatter {
    public:
        virtual ~IFormatter() = default;

        virtual std::string format(const LogRecord &record) const = 0;
    };
} // namespace stencil

#endif // STENCIL_LOG_FORMATTER_INTERFACE_HPP
