// basic_usage.cpp
//
// Demonstrates the default template "[<time>] [<level>] [<id>] <msg>":
// - request id substitution from the X-Request-ID field
// - elision of " [<id>]" and the message when they are missing
// - extra fields appended as " | key = value", nested maps as JSON
//
// Compile: g++ -std=c++11 -I include examples/basic_usage.cpp -o basic_usage -pthread

#include "stencil_log.hpp"
#include <chrono>

int main() {
    stencil::ConsoleSink console;
    auto now = std::chrono::system_clock::now();

    console.write(stencil::LogRecord(now, stencil::LogLevel::INFO, "service started",
                                     stencil::FieldMap{{"port", 8080}}));

    console.write(stencil::LogRecord(now, stencil::LogLevel::WARN, "slow upstream",
                                     stencil::FieldMap{{"X-Request-ID", "7f3a9c"},
                                                       {"elapsed_ms", 1843.5},
                                                       {"upstream", "billing"}}));

    // Empty message and no id: only time and level remain
    console.write(stencil::LogRecord(now, stencil::LogLevel::DEBUG, ""));

    console.write(stencil::LogRecord(now, stencil::LogLevel::ERROR, "config rejected",
                                     stencil::FieldMap{{"config", stencil::FieldMap{{"retries", 3},
                                                                                    {"verbose", true}}}}));
    return 0;
}
