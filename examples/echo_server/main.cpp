/// Echo server: minimal MCP server demonstrating tool registration.
/// Usage: ./echo_server
/// Communicates over stdio (newline-delimited JSON-RPC).

#include <kagimcp/kagimcp.hpp>

#include <csignal>

int main() {
    // A vanished client must surface as a write error, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    kagimcp::StaticToolRegistry registry;

    kagimcp::ToolDefinition echo_tool;
    echo_tool.name = "echo";
    echo_tool.description = "Echo the input text back to the caller";
    echo_tool.input_schema = {
        {"type", "object"},
        {"properties", {
            {"text", {{"type", "string"}, {"description", "The text to echo"}}}
        }},
        {"required", nlohmann::json::array({"text"})}
    };

    registry.add_tool(echo_tool, [](const nlohmann::json& args) -> kagimcp::ToolOutcome {
        if (!args.is_object() || !args.contains("text") || !args.at("text").is_string()) {
            return kagimcp::ToolError{"Missing 'text' parameter"};
        }
        return std::vector<kagimcp::Content>{
            kagimcp::TextContent{args.at("text").get<std::string>()}};
    });

    kagimcp::McpServer::Options opts;
    opts.server_info = {"echo-server", "1.0.0"};
    kagimcp::McpServer server{std::move(opts), registry};

    try {
        server.serve_stdio();
    } catch (const kagimcp::McpError& e) {
        kagimcp::logger()->critical("Server error: {}", e.what());
        return 1;
    }
    return 0;
}
