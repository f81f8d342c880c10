#include <benchmark/benchmark.h>
#include "kagimcp/codec.hpp"
#include "kagimcp/json_rpc.hpp"
#include <string>

using namespace kagimcp;

static const std::string kSmallRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"tools/list","params":{}})";

static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"kagi_search_fetch","arguments":{"queries":["c++ json parsing","simdjson on-demand"]}}})";

// A tools/call result carrying a formatted search page of n results
static JsonRpcResponse make_search_response(int n) {
    std::string text = "-----\nResults for search query \"bench\":\n-----\n";
    for (int i = 1; i <= n; ++i) {
        text += std::to_string(i) + ": Result title " + std::to_string(i) + "\n"
              + "https://example.com/page/" + std::to_string(i) + "\n"
              + "Published Date: Not Available\n"
              + "A snippet of text describing why this page matters, number "
              + std::to_string(i) + "\n\n";
    }
    nlohmann::json content = nlohmann::json::array();
    content.push_back({{"type", "text"}, {"text", text}});
    return JsonRpcResponse::success(1, nlohmann::json{{"content", content}});
}

// ---- Parse benchmarks ----

static void BM_ParseSmallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse(kSmallRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kSmallRequest.size());
}
BENCHMARK(BM_ParseSmallRequest)->MinTime(1.0);

static void BM_ParseToolCallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse(kToolCallRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kToolCallRequest.size());
}
BENCHMARK(BM_ParseToolCallRequest)->MinTime(1.0);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto req = Codec::parse(bad);
            benchmark::DoNotOptimize(req);
        } catch (const McpParseError& e) {
            benchmark::DoNotOptimize(e.what());
        }
    }
}
BENCHMARK(BM_ParseInvalidJson)->MinTime(1.0);

// ---- Serialize benchmarks ----

static void BM_SerializeError(benchmark::State& state) {
    auto resp = JsonRpcResponse::failure(
        1, JsonRpcError{error::MethodNotFound, "Method not found: ping", std::nullopt});
    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeError)->MinTime(1.0);

static void BM_SerializeSearchResult(benchmark::State& state) {
    auto resp = make_search_response(static_cast<int>(state.range(0)));
    size_t bytes = Codec::serialize(resp).size();
    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * bytes);
}
BENCHMARK(BM_SerializeSearchResult)->Arg(10)->Arg(50)->MinTime(1.0);
