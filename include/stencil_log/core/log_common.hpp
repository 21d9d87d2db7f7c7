#ifndef STENCIL_LOG_COMMON_HPP
#define STENCIL_LOG_COMMON_HPP

#include <string>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <vector>
#include <memory>

namespace stencil {
namespace detail {
#if __cplusplus < 201402L
    template<typename T, typename... Args>
    std::unique_ptr<T> make_unique(Args&&... args) {
        return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
    }
#else
    using std::make_unique;
#endif

    /// Upper bound for a single rendered timestamp.  strftime reports 0 both
    /// for "did not fit" and for empty output, so the buffer grows until this
    /// limit and then gives up with an empty string.
    static const size_t kMaxTimestampLength = 4096;

    inline std::string strftimeChunk(const std::string &pattern, const std::tm &tmBuf) {
        if (pattern.empty()) return std::string();
        std::vector<char> buf(128);
        while (buf.size() <= kMaxTimestampLength) {
            size_t written = std::strftime(buf.data(), buf.size(), pattern.c_str(), &tmBuf);
            if (written > 0) return std::string(buf.data(), written);
            buf.resize(buf.size() * 2);
        }
        return std::string();
    }
} // namespace detail

    /// RFC3339 in UTC, second precision: 2026-02-16T12:00:00Z
    static const char *const kRfc3339Layout = "%Y-%m-%dT%H:%M:%SZ";

    /// Render a time point in UTC using a strftime layout.
    ///
    /// One extension on top of strftime: %L expands to zero-padded
    /// milliseconds (000-999).  %% is passed through untouched, so %%L stays a
    /// literal "%L".
    inline std::string formatTimestamp(const std::chrono::system_clock::time_point &time,
                                       const std::string &layout) {
        // Floor to whole seconds so pre-epoch points keep a 0-999 remainder.
        auto sinceEpoch = time.time_since_epoch();
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(sinceEpoch);
        if (secs > sinceEpoch) secs -= std::chrono::seconds(1);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(sinceEpoch - secs);
        std::time_t epoch = static_cast<std::time_t>(secs.count());

        std::tm tmBuf;
#if defined(_MSC_VER)
        gmtime_s(&tmBuf, &epoch);
#else
        gmtime_r(&epoch, &tmBuf);
#endif

        std::string result;
        std::string chunk;
        size_t i = 0;
        while (i < layout.size()) {
            if (layout[i] == '%' && i + 1 < layout.size()) {
                if (layout[i + 1] == 'L') {
                    result += detail::strftimeChunk(chunk, tmBuf);
                    chunk.clear();
                    char msBuf[8];
                    std::snprintf(msBuf, sizeof(msBuf), "%03d", static_cast<int>(ms.count()));
                    result += msBuf;
                } else {
                    chunk += layout[i];
                    chunk += layout[i + 1];
                }
                i += 2;
                continue;
            }
            chunk += layout[i];
            ++i;
        }
        result += detail::strftimeChunk(chunk, tmBuf);
        return result;
    }

    inline std::string formatTimestamp(const std::chrono::system_clock::time_point &time) {
        return formatTimestamp(time, kRfc3339Layout);
    }
} // namespace stencil

#endif // STENCIL_LOG_COMMON_HPP
