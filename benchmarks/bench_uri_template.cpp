#include <benchmark/benchmark.h>
#include "taskmcp/registry.hpp"
#include "taskmcp/uri_template.hpp"
#include <string>

using namespace taskmcp;

static void BM_ParseTemplate(benchmark::State& state) {
    for (auto _ : state) {
        auto t = UriTemplate::parse("tasks://project/{projectId}/task/{taskId}");
        benchmark::DoNotOptimize(t);
    }
}
BENCHMARK(BM_ParseTemplate)->MinTime(1.0);

static void BM_MatchLiteral(benchmark::State& state) {
    auto t = UriTemplate::parse("tasks://list");
    for (auto _ : state) {
        auto m = t.match("tasks://list");
        benchmark::DoNotOptimize(m);
    }
}
BENCHMARK(BM_MatchLiteral)->MinTime(1.0);

static void BM_MatchPlaceholder(benchmark::State& state) {
    auto t = UriTemplate::parse("tasks://task/{taskId}");
    for (auto _ : state) {
        auto m = t.match("tasks://task/12345");
        benchmark::DoNotOptimize(m);
    }
}
BENCHMARK(BM_MatchPlaceholder)->MinTime(1.0);

static void BM_MatchMiss(benchmark::State& state) {
    auto t = UriTemplate::parse("tasks://task/{taskId}");
    for (auto _ : state) {
        auto m = t.match("notes://task/1");
        benchmark::DoNotOptimize(m);
    }
}
BENCHMARK(BM_MatchMiss)->MinTime(1.0);

// First-match scan over N registered resources, hitting the last one.
static void BM_RegistryMatchResource(benchmark::State& state) {
    Registry registry;
    int n = static_cast<int>(state.range(0));
    for (int i = 0; i < n; ++i) {
        ResourceEntry entry;
        entry.name = "res_" + std::to_string(i);
        entry.uri_template = UriTemplate::parse("kind" + std::to_string(i) + "://item/{id}");
        entry.handler = [](const std::string&, const UriParams&) { return ResourceResult{}; };
        registry.add_resource(std::move(entry));
    }
    std::string uri = "kind" + std::to_string(n - 1) + "://item/7";

    for (auto _ : state) {
        auto m = registry.match_resource(uri);
        benchmark::DoNotOptimize(m);
    }
}
BENCHMARK(BM_RegistryMatchResource)->Arg(1)->Arg(10)->Arg(100)->MinTime(1.0);
