// request_logging.cpp
//
// Demonstrates a custom template built from request fields:
// - <method>, <path>, <status> inlined from the record's fields
// - consumed fields are not repeated after the message
// - a custom time layout with milliseconds (%L)
// - the >>> / <<< prefixes stored on the formatter for the caller to use
//
// Compile: g++ -std=c++11 -I include examples/request_logging.cpp -o request_logging -pthread

#include "stencil_log.hpp"
#include <chrono>
#include <iostream>

int main() {
    auto incoming = stencil::FormatterConfiguration::defaults(stencil::kPrefixRequestIncoming)
        .logTemplate("<time> <level> [<id>] <method> <path> <msg>")
        .timeLayout("%H:%M:%S.%L")
        .separator(" ,")
        .build();

    auto outgoing = stencil::FormatterConfiguration::defaults(stencil::kPrefixRequestOutgoing)
        .logTemplate("<time> <level> [<id>] <status> <msg>")
        .timeLayout("%H:%M:%S.%L")
        .build();

    auto now = std::chrono::system_clock::now();
    stencil::FieldMap request{{"X-Request-ID", "req-42"},
                              {"method", "POST"},
                              {"path", "/orders"},
                              {"client", "10.0.0.7"}};

    stencil::LogRecord in(now, stencil::LogLevel::INFO, "received", request);
    std::cout << incoming.prefix() << ' ' << incoming.format(in);

    stencil::FieldMap response{{"X-Request-ID", "req-42"}, {"status", 201}, {"bytes", 512}};
    stencil::LogRecord out(now + std::chrono::milliseconds(37), stencil::LogLevel::INFO, "sent", response);
    std::cout << outgoing.prefix() << ' ' << outgoing.format(out);
    return 0;
}
