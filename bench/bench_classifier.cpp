#include <benchmark/benchmark.h>
#include "compose_track.hpp"
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// BM_Classify_Short
// Typical "compose up -d" invocation.
// ---------------------------------------------------------------------------
static void BM_Classify_Short(benchmark::State& state) {
    ctrack::CommandClassifier classifier(ctrack::CommandSet::defaults());
    std::vector<std::string> args = {"compose", "up", "-d"};

    for (auto _ : state) {
        std::string sig = classifier.classify(args);
        benchmark::DoNotOptimize(sig);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Classify_Short);

// ---------------------------------------------------------------------------
// BM_Classify_Long
// Many positionals and flags after the terminal command.
// ---------------------------------------------------------------------------
static void BM_Classify_Long(benchmark::State& state) {
    ctrack::CommandClassifier classifier(ctrack::CommandSet::defaults());
    std::vector<std::string> args = {"context", "create", "aci", "prod", "--location", "eastus",
                                     "--resource-group", "rg", "--subscription-id", "sub",
                                     "--description", "production", "--help"};

    for (auto _ : state) {
        std::string sig = classifier.classify(args);
        benchmark::DoNotOptimize(sig);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Classify_Long);

// ---------------------------------------------------------------------------
// BM_Classify_Unrecognised
// Nothing matches; measures the pure lookup cost.
// ---------------------------------------------------------------------------
static void BM_Classify_Unrecognised(benchmark::State& state) {
    ctrack::CommandClassifier classifier(ctrack::CommandSet::defaults());
    std::vector<std::string> args(static_cast<size_t>(state.range(0)), "positional");

    for (auto _ : state) {
        std::string sig = classifier.classify(args);
        benchmark::DoNotOptimize(sig);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Classify_Unrecognised)->Arg(4)->Arg(64);

// ---------------------------------------------------------------------------
// BM_HasQuietFlag
// ---------------------------------------------------------------------------
static void BM_HasQuietFlag(benchmark::State& state) {
    std::vector<std::string> args = {"compose", "pull", "--ignore-pull-failures", "-q"};

    for (auto _ : state) {
        bool quiet = ctrack::hasQuietFlag(args);
        benchmark::DoNotOptimize(quiet);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_HasQuietFlag);

// ---------------------------------------------------------------------------
// BM_Track_BackendSkip
// Backend invocation returns before classifying.
// ---------------------------------------------------------------------------
static void BM_Track_BackendSkip(benchmark::State& state) {
    ctrack::Tracker tracker(std::make_shared<ctrack::CommandClassifier>(ctrack::CommandSet::defaults()),
                            std::make_shared<ctrack::NullClient>(), "docker-compose-backend");
    std::vector<std::string> args = {"compose", "up"};

    for (auto _ : state) {
        tracker.track("default", args, ctrack::status::Success);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Track_BackendSkip);

BENCHMARK_MAIN();
