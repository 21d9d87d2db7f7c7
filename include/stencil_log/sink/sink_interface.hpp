#ifndef STENCIL_LOG_SINK_INTERFACE_HPP
#define STENCIL_LOG_SINK_INTERFACE_HPP

#include "../core/log_record.hpp"
#include "../core/encoding_error.hpp"
#include "../formatter/formatter_interface.hpp"
#include <cstdio>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace stencil {
    /// Destination for formatted records.
    ///
    /// An EncodingError from the formatter never leaves write(): the sink
    /// passes it to the error handler and still emits the best-effort line.
    /// The default handler prints "stencil_log: <what>" to stderr.
    class ISink {
    public:
        using ErrorHandler = std::function<void(const EncodingError&)>;

        virtual ~ISink() = default;

        virtual void write(const LogRecord &record) = 0;

        void setFormatter(std::unique_ptr<IFormatter> formatter) {
            m_formatter = std::move(formatter);
        }

        void setErrorHandler(ErrorHandler handler) {
            m_errorHandler = std::move(handler);
        }

        IFormatter* formatter() const { return m_formatter.get(); }

    protected:
        std::string formatRecord(const LogRecord &record) {
            try {
                return m_formatter->format(record);
            } catch (const EncodingError &e) {
                reportError(e);
                return e.partialOutput();
            }
        }

        void reportError(const EncodingError &e) {
            if (m_errorHandler) {
                m_errorHandler(e);
                return;
            }
            std::fprintf(stderr, "stencil_log: %s\n", e.what());
            std::fflush(stderr);
        }

        std::unique_ptr<IFormatter> m_formatter;
        ErrorHandler m_errorHandler;
    };
} // namespace stencil

#endif // STENCIL_LOG_SINK_INTERFACE_HPP
