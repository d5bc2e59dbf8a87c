#include <benchmark/benchmark.h>
#include "compose_track.hpp"
#include "null_consumer.hpp"
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// BM_Filter_Passthrough
// Empty service set, every line forwarded.
// ---------------------------------------------------------------------------
static void BM_Filter_Passthrough(benchmark::State& state) {
    auto sink = std::make_shared<ctrack::NullLogConsumer>();
    auto consumer = ctrack::filterLogConsumer(sink, std::vector<std::string>());
    const std::string line = "GET /api/items 200 12ms";

    for (auto _ : state) {
        consumer->log("web", line);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Filter_Passthrough);

// ---------------------------------------------------------------------------
// BM_Filter_Mixed
// Three services, one selected.
// ---------------------------------------------------------------------------
static void BM_Filter_Mixed(benchmark::State& state) {
    auto sink = std::make_shared<ctrack::NullLogConsumer>();
    auto consumer = ctrack::filterLogConsumer(sink, {"web"});
    const char* services[] = {"web", "db", "cache"};
    const std::string line = "ready";
    size_t i = 0;

    for (auto _ : state) {
        consumer->log(services[i++ % 3], line);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
    state.counters["forwarded"] = static_cast<double>(sink->count());
}
BENCHMARK(BM_Filter_Mixed);

// ---------------------------------------------------------------------------
// BM_LogsService_Replay
// Full replay of a project through the service with a filter.
// ---------------------------------------------------------------------------
static void BM_LogsService_Replay(benchmark::State& state) {
    auto backend = std::make_shared<ctrack::ReplayLogBackend>();
    for (int64_t n = 0; n < state.range(0); ++n) {
        backend->append("bench", n % 2 ? "web" : "db", "line");
    }
    ctrack::LogsService service(backend);
    auto sink = std::make_shared<ctrack::NullLogConsumer>();
    ctrack::LogOptions options;
    options.setServices({"web"});
    ctrack::CancellationToken token;

    for (auto _ : state) {
        service.logs(token, "bench", sink, options);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_LogsService_Replay)->Arg(100)->Arg(10000);

BENCHMARK_MAIN();
