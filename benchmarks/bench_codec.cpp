#include <benchmark/benchmark.h>
#include "taskmcp/codec.hpp"
#include <string>

using namespace taskmcp;

static const std::string kDiscoverRequest = R"({"id":1,"type":"discover"})";

static const std::string kInvokeRequest =
    R"({"id":"req-42","type":"invoke","tool":"createTask","parameters":{"task":"Implement login page","category":"Development","priority":"high"}})";

// listTasks-style response carrying N tasks
static Response make_list_response(int n) {
    nlohmann::json tasks = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        tasks.push_back({
            {"id", i},
            {"task", "Task number " + std::to_string(i)},
            {"category", "Development"},
            {"priority", "medium"},
            {"status", "not_started"},
            {"create_time", "2024-01-01T00:00:00.000Z"}
        });
    }
    ToolResult result;
    result.content.push_back(TextContent{"Found " + std::to_string(n) + " tasks."});
    result.content.push_back(JsonContent{tasks});
    return Response::success(1, RequestType::Invoke, result);
}

static void BM_ParseDiscover(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kDiscoverRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kDiscoverRequest.size());
}
BENCHMARK(BM_ParseDiscover)->MinTime(1.0);

static void BM_ParseInvoke(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kInvokeRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kInvokeRequest.size());
}
BENCHMARK(BM_ParseInvoke)->MinTime(1.0);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const ParseError& e) {
            benchmark::DoNotOptimize(e.what());
        }
    }
}
BENCHMARK(BM_ParseInvalidJson)->MinTime(1.0);

static void BM_SerializeError(benchmark::State& state) {
    auto response = Response::failure(1, "Tool not found: doesNotExist");
    for (auto _ : state) {
        auto s = Codec::serialize(response);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeError)->MinTime(1.0);

static void BM_SerializeTaskList(benchmark::State& state) {
    auto response = make_list_response(static_cast<int>(state.range(0)));
    size_t bytes = Codec::serialize(response).size();
    for (auto _ : state) {
        auto s = Codec::serialize(response);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * bytes);
}
BENCHMARK(BM_SerializeTaskList)->Arg(10)->Arg(100)->Arg(1000)->MinTime(1.0);
