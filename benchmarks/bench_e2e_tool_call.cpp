#include <benchmark/benchmark.h>
#include "kagimcp/server.hpp"
#include "kagimcp/transport/stream_transport.hpp"
#include <sstream>
#include <string>

using namespace kagimcp;

static StaticToolRegistry make_echo_registry() {
    StaticToolRegistry registry;
    ToolDefinition echo_def;
    echo_def.name = "echo";
    echo_def.description = "Echo text";
    echo_def.input_schema = nlohmann::json{{"type", "object"}};
    registry.add_tool(echo_def, [](const nlohmann::json& args) -> ToolOutcome {
        return std::vector<Content>{TextContent{args.value("text", std::string())}};
    });
    return registry;
}

static const std::string kEchoCall =
    R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"echo","arguments":{"text":"hello world"}}})";

// One line in, one line out: decode, dispatch, invoke, encode
static void BM_HandleLineToolCall(benchmark::State& state) {
    auto registry = make_echo_registry();
    McpServer server{McpServer::Options{Implementation{"bench-server", "1.0"}}, registry};

    for (auto _ : state) {
        auto line = server.handle_line(kEchoCall);
        benchmark::DoNotOptimize(line);
    }
}
BENCHMARK(BM_HandleLineToolCall)->MinTime(1.0);

// Whole serve() loop over an in-memory stream of N requests
static void BM_ServeStream(benchmark::State& state) {
    auto registry = make_echo_registry();
    McpServer server{McpServer::Options{Implementation{"bench-server", "1.0"}}, registry};

    std::string input;
    for (int64_t i = 0; i < state.range(0); ++i) {
        input += kEchoCall;
        input += '\n';
    }

    for (auto _ : state) {
        std::istringstream in(input);
        std::ostringstream out;
        StreamTransport transport(in, out);
        auto stats = server.serve(transport);
        benchmark::DoNotOptimize(stats);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ServeStream)->Arg(100)->Arg(1000)->MinTime(1.0);
