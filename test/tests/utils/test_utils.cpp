#include "test_utils.hpp"
#include <ctime>

std::chrono::system_clock::time_point TestUtils::utcTime(int year, int month, int day,
                                                         int hour, int minute, int second,
                                                         int millis) {
    std::tm tmBuf = {};
    tmBuf.tm_year = year - 1900;
    tmBuf.tm_mon = month - 1;
    tmBuf.tm_mday = day;
    tmBuf.tm_hour = hour;
    tmBuf.tm_min = minute;
    tmBuf.tm_sec = second;
#if defined(_MSC_VER)
    std::time_t seconds = _mkgmtime(&tmBuf);
#else
    std::time_t seconds = timegm(&tmBuf);
#endif
    return std::chrono::system_clock::from_time_t(seconds) + std::chrono::milliseconds(millis);
}

std::chrono::system_clock::time_point TestUtils::fixedTime() {
    return utcTime(2026, 2, 16, 12, 34, 56, 789);
}

stencil::LogRecord TestUtils::makeRecord(stencil::LogLevel level, const std::string &message,
                                         stencil::FieldMap fields) {
    return stencil::LogRecord(fixedTime(), level, message, std::move(fields));
}

std::string TestUtils::stripNewline(const std::string &line) {
    if (!line.empty() && line.back() == '\n') {
        return line.substr(0, line.size() - 1);
    }
    return line;
}

size_t TestUtils::countOccurrences(const std::string &haystack, const std::string &needle) {
    if (needle.empty()) return 0;
    size_t count = 0;
    size_t pos = haystack.find(needle);
    while (pos != std::string::npos) {
        ++count;
        pos = haystack.find(needle, pos + needle.size());
    }
    return count;
}
