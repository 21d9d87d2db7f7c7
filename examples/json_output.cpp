// json_output.cpp
//
// Demonstrates JSON output mode and encoding error handling:
// - {"timestamp","level","id","message","data"} per line
// - the message still goes through the template
// - a NaN field makes strict encoding fail; the sink reports the error and
//   writes the best-effort line with null in its place
//
// Compile: g++ -std=c++11 -I include examples/json_output.cpp -o json_output -pthread

#include "stencil_log.hpp"
#include <chrono>
#include <iostream>
#include <limits>

int main() {
    stencil::ConsoleSink console(stencil::FormatterConfiguration::defaults().jsonOutput().buildUnique());
    console.setErrorHandler([](const stencil::EncodingError &e) {
        std::cerr << "encoding failed: " << e.what() << '\n';
    });

    auto now = std::chrono::system_clock::now();

    console.write(stencil::LogRecord(now, stencil::LogLevel::INFO, "user signed in",
                                     stencil::FieldMap{{"X-Request-ID", "abc123"},
                                                       {"user", "alice"},
                                                       {"mfa", true}}));

    console.write(stencil::LogRecord(now, stencil::LogLevel::ERROR, "ratio out of range",
                                     stencil::FieldMap{{"ratio", std::numeric_limits<double>::quiet_NaN()}}));
    return 0;
}
