#include <benchmark/benchmark.h>
#include "taskmcp/dispatcher.hpp"
#include <memory>
#include <string>

using namespace taskmcp;

// Registry with N trivial tools plus one templated resource and one prompt.
static std::unique_ptr<Registry> make_registry(int n_tools) {
    auto registry = std::make_unique<Registry>();
    for (int i = 0; i < n_tools; ++i) {
        ToolEntry tool;
        tool.name = "tool_" + std::to_string(i);
        tool.description = "Tool number " + std::to_string(i);
        tool.schema = {string_param("text", "Some text", true)};
        tool.handler = [](const nlohmann::json&) {
            ToolResult r;
            r.content.push_back(TextContent{"ok"});
            return r;
        };
        registry->add_tool(std::move(tool));
    }

    ResourceEntry resource;
    resource.name = "task";
    resource.uri_template = UriTemplate::parse("tasks://task/{taskId}");
    resource.handler = [](const std::string& uri, const UriParams& params) {
        ResourceResult r;
        r.contents.push_back(ResourceContent{uri, params.at("taskId"), nlohmann::json::object()});
        return r;
    };
    registry->add_resource(std::move(resource));

    PromptEntry prompt;
    prompt.name = "hello";
    prompt.handler = [](const nlohmann::json&) {
        PromptMessage m;
        m.content.push_back(TextContent{"hello"});
        PromptResult r;
        r.messages.push_back(m);
        return r;
    };
    registry->add_prompt(std::move(prompt));
    return registry;
}

static ServerInfo bench_info() {
    ServerInfo info;
    info.name = "bench";
    return info;
}

static void BM_DispatchInvoke(benchmark::State& state) {
    auto registry = make_registry(static_cast<int>(state.range(0)));
    Dispatcher dispatcher(*registry, bench_info());
    nlohmann::json request = {{"id", 1}, {"type", "invoke"}, {"tool", "tool_0"},
                              {"parameters", {{"text", "x"}}}};

    for (auto _ : state) {
        auto resp = dispatcher.dispatch(request);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchInvoke)->Arg(1)->Arg(100)->MinTime(1.0);

static void BM_DispatchUnknownTool(benchmark::State& state) {
    auto registry = make_registry(10);
    Dispatcher dispatcher(*registry, bench_info());
    nlohmann::json request = {{"id", 1}, {"type", "invoke"}, {"tool", "missing"}};

    for (auto _ : state) {
        auto resp = dispatcher.dispatch(request);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchUnknownTool)->MinTime(1.0);

static void BM_DispatchResource(benchmark::State& state) {
    auto registry = make_registry(1);
    Dispatcher dispatcher(*registry, bench_info());
    nlohmann::json request = {{"id", 1}, {"type", "resource"}, {"uri", "tasks://task/99"}};

    for (auto _ : state) {
        auto resp = dispatcher.dispatch(request);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchResource)->MinTime(1.0);

static void BM_DispatchPrompt(benchmark::State& state) {
    auto registry = make_registry(1);
    Dispatcher dispatcher(*registry, bench_info());
    nlohmann::json request = {{"id", 1}, {"type", "prompt"}, {"prompt", "hello"}};

    for (auto _ : state) {
        auto resp = dispatcher.dispatch(request);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchPrompt)->MinTime(1.0);

static void BM_Discover(benchmark::State& state) {
    auto registry = make_registry(static_cast<int>(state.range(0)));
    Dispatcher dispatcher(*registry, bench_info());
    nlohmann::json request = {{"id", 1}, {"type", "discover"}};

    for (auto _ : state) {
        auto resp = dispatcher.dispatch(request);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_Discover)->Arg(4)->Arg(100)->MinTime(1.0);
