#ifndef STENCIL_LOG_CALLBACK_SINK_HPP
#define STENCIL_LOG_CALLBACK_SINK_HPP

#include "sink_interface.hpp"
#include "../formatter_configuration.hpp"
#include <functional>
#include <string>
#include <memory>
#include <utility>

namespace stencil {

    /// Sink that hands each formatted line to a user callback.
    ///
    /// If formatter is nullptr, the default template formatter is used.
    ///
    /// @note The callback runs on the calling thread without a lock; it is
    ///       responsible for its own synchronization.
    class CallbackSink : public ISink {
    public:
        using LineCallback = std::function<void(const std::string&)>;

        explicit CallbackSink(LineCallback cb, std::unique_ptr<IFormatter> fmt = nullptr)
            : m_callback(std::move(cb)) {
            if (fmt) {
                setFormatter(std::move(fmt));
            } else {
                setFormatter(FormatterConfiguration::defaults().buildUnique());
            }
        }

        void write(const LogRecord &record) override {
            if (m_callback && m_formatter) {
                m_callback(formatRecord(record));
            }
        }

    private:
        LineCallback m_callback;
    };

} // namespace stencil

#endif // STENCIL_LOG_CALLBACK_SINK_HPP
