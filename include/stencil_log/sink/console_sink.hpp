#ifndef STENCIL_LOG_CONSOLE_SINK_HPP
#define STENCIL_LOG_CONSOLE_SINK_HPP

#include "sink_interface.hpp"
#include "../formatter_configuration.hpp"
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace stencil {

    enum class ConsoleStream { StdOut, StdErr };

    /// Writes formatted lines to stdout or stderr.
    ///
    /// Each line goes out in a single fwrite followed by a flush.  All
    /// console sinks on the same stream share one mutex, so lines from
    /// different sinks and threads never interleave.
    class ConsoleSink : public ISink {
    public:
        explicit ConsoleSink(ConsoleStream stream = ConsoleStream::StdOut)
            : m_stream(stream) {
            setFormatter(FormatterConfiguration::defaults().buildUnique());
        }

        explicit ConsoleSink(std::unique_ptr<IFormatter> formatter,
                             ConsoleStream stream = ConsoleStream::StdOut)
            : m_stream(stream) {
            setFormatter(std::move(formatter));
        }

        ConsoleStream stream() const { return m_stream; }

        void write(const LogRecord &record) override {
            if (!m_formatter) return;
            std::string line = formatRecord(record);
            if (line.empty()) return;

            std::FILE *fp = (m_stream == ConsoleStream::StdOut) ? stdout : stderr;
            std::lock_guard<std::mutex> lock(streamMutex(m_stream));
            std::fwrite(line.data(), 1, line.size(), fp);
            std::fflush(fp);
        }

    private:
        static std::mutex &streamMutex(ConsoleStream stream) {
            static std::mutex s_stdoutMutex;
            static std::mutex s_stderrMutex;
            return stream == ConsoleStream::StdOut ? s_stdoutMutex : s_stderrMutex;
        }

        ConsoleStream m_stream;
    };

} // namespace stencil

#endif // STENCIL_LOG_CONSOLE_SINK_HPP
