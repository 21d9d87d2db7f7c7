#include <benchmark/benchmark.h>
#include <chrono>
#include <string>
#include "stencil_log.hpp"

namespace {
    stencil::LogRecord sampleRecord() {
        return stencil::LogRecord(std::chrono::system_clock::now(), stencil::LogLevel::INFO,
                                  "request handled",
                                  stencil::FieldMap{{"X-Request-ID", "7f3a9c"},
                                                    {"method", "GET"},
                                                    {"path", "/api/users"},
                                                    {"status", 200},
                                                    {"elapsed_ms", 12.34}});
    }
}

// ---------------------------------------------------------------------------
// BM_DefaultTemplate
// Default template, four trailing fields appended as key = value.
// ---------------------------------------------------------------------------
static void BM_DefaultTemplate(benchmark::State& state) {
    auto formatter = stencil::FormatterConfiguration::defaults().build();
    auto record = sampleRecord();

    for (auto _ : state) {
        std::string line = formatter.format(record);
        benchmark::DoNotOptimize(line);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_DefaultTemplate);

// ---------------------------------------------------------------------------
// BM_FieldTokens
// Template consumes most fields, so the trailing list is short.
// ---------------------------------------------------------------------------
static void BM_FieldTokens(benchmark::State& state) {
    auto formatter = stencil::FormatterConfiguration::defaults()
        .logTemplate("[<time>] [<level>] [<id>] <method> <path> <status> <msg>")
        .build();
    auto record = sampleRecord();

    for (auto _ : state) {
        std::string line = formatter.format(record);
        benchmark::DoNotOptimize(line);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_FieldTokens);

// ---------------------------------------------------------------------------
// BM_JsonOutput
// ---------------------------------------------------------------------------
static void BM_JsonOutput(benchmark::State& state) {
    auto formatter = stencil::FormatterConfiguration::defaults().jsonOutput().build();
    auto record = sampleRecord();

    for (auto _ : state) {
        std::string line = formatter.format(record);
        benchmark::DoNotOptimize(line);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_JsonOutput);

// ---------------------------------------------------------------------------
// BM_PlainText
// Empty template, logfmt fallback.
// ---------------------------------------------------------------------------
static void BM_PlainText(benchmark::State& state) {
    auto formatter = stencil::FormatterConfiguration().build();
    auto record = sampleRecord();

    for (auto _ : state) {
        std::string line = formatter.format(record);
        benchmark::DoNotOptimize(line);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_PlainText);
