#include <benchmark/benchmark.h>
#include "kagimcp/dispatcher.hpp"
#include "kagimcp/router.hpp"
#include <memory>
#include <string>

using namespace kagimcp;

static StaticToolRegistry make_registry(int n_tools) {
    StaticToolRegistry registry;
    for (int i = 0; i < n_tools; ++i) {
        ToolDefinition td;
        td.name = "tool_" + std::to_string(i);
        td.description = "A tool for doing something useful, number " + std::to_string(i);
        td.input_schema = {
            {"type", "object"},
            {"properties", {{"text", {{"type", "string"}}}}}
        };
        registry.add_tool(td, [](const nlohmann::json& args) -> ToolOutcome {
            return std::vector<Content>{TextContent{args.value("text", std::string())}};
        });
    }
    return registry;
}

static JsonRpcRequest make_request(const std::string& method, std::optional<nlohmann::json> params) {
    JsonRpcRequest req;
    req.id = 1;
    req.method = method;
    req.params = std::move(params);
    return req;
}

static void BM_RouterKnownMethod(benchmark::State& state) {
    Router router;
    router.on_request("initialize", [](const std::optional<nlohmann::json>&) -> HandlerResult {
        return nlohmann::json::object();
    });
    auto req = make_request("initialize", std::nullopt);

    for (auto _ : state) {
        auto resp = router.dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_RouterKnownMethod)->MinTime(1.0);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    auto registry = make_registry(2);
    Dispatcher dispatcher{Implementation{"bench", "1.0"}, registry};
    auto req = make_request("resources/list", std::nullopt);

    for (auto _ : state) {
        auto resp = dispatcher.dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchUnknownMethod)->MinTime(1.0);

static void BM_DispatchToolsList(benchmark::State& state) {
    auto registry = make_registry(static_cast<int>(state.range(0)));
    Dispatcher dispatcher{Implementation{"bench", "1.0"}, registry};
    auto req = make_request("tools/list", std::nullopt);

    for (auto _ : state) {
        auto resp = dispatcher.dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchToolsList)->Arg(2)->Arg(100)->MinTime(1.0);

static void BM_DispatchToolsCall(benchmark::State& state) {
    auto registry = make_registry(static_cast<int>(state.range(0)));
    Dispatcher dispatcher{Implementation{"bench", "1.0"}, registry};
    auto req = make_request("tools/call",
        nlohmann::json{{"name", "tool_0"}, {"arguments", {{"text", "hello"}}}});

    for (auto _ : state) {
        auto resp = dispatcher.dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchToolsCall)->Arg(2)->Arg(100)->MinTime(1.0);
