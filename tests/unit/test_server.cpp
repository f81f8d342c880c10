#include <gtest/gtest.h>
#include "kagimcp/server.hpp"
#include "kagimcp/error.hpp"
#include "kagimcp/transport/stream_transport.hpp"
#include <sstream>

using namespace kagimcp;

namespace {

StaticToolRegistry make_registry() {
    StaticToolRegistry registry;

    ToolDefinition echo;
    echo.name = "echo";
    echo.description = "Echo text";
    echo.input_schema = {{"type", "object"}};
    registry.add_tool(echo, [](const nlohmann::json& args) -> ToolOutcome {
        if (!args.is_object() || !args.contains("text")) return ToolError{"Missing 'text' parameter"};
        return std::vector<Content>{TextContent{args.at("text").get<std::string>()}};
    });

    ToolDefinition binary;
    binary.name = "binary";
    binary.description = "Returns bytes that are not UTF-8";
    binary.input_schema = {{"type", "object"}};
    registry.add_tool(binary, [](const nlohmann::json&) -> ToolOutcome {
        return std::vector<Content>{TextContent{std::string("\xC3\x28 broken")}};
    });

    return registry;
}

McpServer::Options test_options() {
    McpServer::Options opts;
    opts.server_info = {"test-server", "1.0.0"};
    return opts;
}

std::vector<nlohmann::json> output_lines(const std::string& out) {
    std::vector<nlohmann::json> lines;
    std::istringstream in(out);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(nlohmann::json::parse(line));
    }
    return lines;
}

/// Transport whose writes always fail.
class BrokenPipeTransport : public ITransport {
public:
    std::optional<std::string> read_line() override {
        if (served_) return std::nullopt;
        served_ = true;
        return std::string(R"({"jsonrpc":"2.0","id":1,"method":"initialize"})");
    }
    void write_line(std::string_view) override {
        throw McpTransportError("Write error: Broken pipe");
    }

private:
    bool served_ = false;
};

} // anonymous namespace

TEST(McpServer, HandleLineInitialize) {
    auto registry = make_registry();
    McpServer server{test_options(), registry};

    auto line = server.handle_line(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})");
    ASSERT_TRUE(line.has_value());
    auto j = nlohmann::json::parse(*line);
    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["result"]["serverInfo"]["name"], "test-server");
}

TEST(McpServer, HandleLineBlank) {
    auto registry = make_registry();
    McpServer server{test_options(), registry};
    EXPECT_FALSE(server.handle_line("").has_value());
    EXPECT_FALSE(server.handle_line("   \t\r").has_value());
}

TEST(McpServer, HandleLineTrimsWhitespace) {
    auto registry = make_registry();
    McpServer server{test_options(), registry};
    auto line = server.handle_line("  {\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/list\"}\r");
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(nlohmann::json::parse(*line)["id"], 2);
}

TEST(McpServer, HandleLineParseError) {
    auto registry = make_registry();
    McpServer server{test_options(), registry};

    auto line = server.handle_line("{not json");
    ASSERT_TRUE(line.has_value());
    auto j = nlohmann::json::parse(*line);
    EXPECT_TRUE(j["id"].is_null());
    EXPECT_EQ(j["error"]["code"], error::ParseError);
    EXPECT_EQ(j["error"]["message"].get<std::string>().rfind("Parse error: ", 0), 0u);
    EXPECT_FALSE(j.contains("result"));
}

TEST(McpServer, EncodeFailureFallsBackToInternalError) {
    auto registry = make_registry();
    McpServer server{test_options(), registry};

    auto line = server.handle_line(
        R"({"jsonrpc":"2.0","id":"b1","method":"tools/call","params":{"name":"binary","arguments":{}}})");
    ASSERT_TRUE(line.has_value());
    auto j = nlohmann::json::parse(*line);
    EXPECT_EQ(j["id"], "b1");
    EXPECT_EQ(j["error"]["code"], error::InternalError);
    EXPECT_EQ(j["error"]["message"].get<std::string>().rfind("Internal error: ", 0), 0u);
}

TEST(McpServer, DeeplyNestedLineIsParseError) {
    auto registry = make_registry();
    McpServer server{test_options(), registry};

    std::istringstream in(
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"tools/call\","
        "\"params\":{\"name\":\"echo\",\"arguments\":" + std::string(100000, '[')
        + std::string(100000, ']') + "}}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/list\"}\n");
    std::ostringstream out;
    StreamTransport transport(in, out);

    auto stats = server.serve(transport);
    EXPECT_EQ(stats.parse_errors, 1u);

    auto lines = output_lines(out.str());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_TRUE(lines[0]["id"].is_null());
    EXPECT_EQ(lines[0]["error"]["code"], error::ParseError);
    EXPECT_EQ(lines[0]["error"]["message"], "Parse error: Nesting too deep");
    EXPECT_EQ(lines[1]["id"], 2);
    EXPECT_TRUE(lines[1].contains("result"));
}

TEST(McpServer, LongLineEchoed) {
    auto registry = make_registry();
    McpServer server{test_options(), registry};

    std::string text(1 << 20, 'z');
    auto line = server.handle_line(
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"echo","arguments":{"text":")"
        + text + R"("}}})");
    ASSERT_TRUE(line.has_value());
    auto j = nlohmann::json::parse(*line);
    EXPECT_EQ(j["result"]["content"][0]["text"].get_ref<const std::string&>().size(), text.size());
}

TEST(McpServer, OversizedIntegerIdEchoedAsDouble) {
    auto registry = make_registry();
    McpServer server{test_options(), registry};

    auto line = server.handle_line(
        R"({"jsonrpc":"2.0","id":123456789012345678901234567890,"method":"initialize"})");
    ASSERT_TRUE(line.has_value());
    auto j = nlohmann::json::parse(*line);
    ASSERT_TRUE(j["id"].is_number_float());
    EXPECT_DOUBLE_EQ(j["id"].get<double>(), 1.2345678901234568e29);
    EXPECT_TRUE(j.contains("result"));
}

TEST(McpServer, ServeProcessesInOrder) {
    auto registry = make_registry();
    McpServer server{test_options(), registry};

    std::istringstream in(
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\",\"params\":{}}\n"
        "\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/list\"}\n"
        "garbage\n"
        "{\"jsonrpc\":\"2.0\",\"id\":3,\"method\":\"tools/call\","
        "\"params\":{\"name\":\"echo\",\"arguments\":{\"text\":\"hi\"}}}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":4,\"method\":\"prompts/list\"}");
    std::ostringstream out;
    StreamTransport transport(in, out);

    auto stats = server.serve(transport);
    EXPECT_EQ(stats.lines_read, 6u);
    EXPECT_EQ(stats.blank_lines, 1u);
    EXPECT_EQ(stats.requests, 5u);
    EXPECT_EQ(stats.parse_errors, 1u);

    auto lines = output_lines(out.str());
    ASSERT_EQ(lines.size(), 5u);
    EXPECT_EQ(lines[0]["id"], 1);
    EXPECT_EQ(lines[1]["id"], 2);
    EXPECT_EQ(lines[1]["result"]["tools"].size(), 2u);
    EXPECT_TRUE(lines[2]["id"].is_null());
    EXPECT_EQ(lines[2]["error"]["code"], error::ParseError);
    EXPECT_EQ(lines[3]["result"]["content"][0]["text"], "hi");
    EXPECT_EQ(lines[4]["error"]["code"], error::MethodNotFound);

    for (const auto& line : lines) {
        EXPECT_EQ(line["jsonrpc"], "2.0");
        EXPECT_NE(line.contains("result"), line.contains("error"));
    }
}

TEST(McpServer, ServeEmptyInput) {
    auto registry = make_registry();
    McpServer server{test_options(), registry};

    std::istringstream in("");
    std::ostringstream out;
    StreamTransport transport(in, out);

    auto stats = server.serve(transport);
    EXPECT_EQ(stats.lines_read, 0u);
    EXPECT_TRUE(out.str().empty());
}

TEST(McpServer, ToolErrorDoesNotStopLoop) {
    auto registry = make_registry();
    McpServer server{test_options(), registry};

    std::istringstream in(
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"tools/call\",\"params\":{\"name\":\"echo\",\"arguments\":{}}}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/list\"}\n");
    std::ostringstream out;
    StreamTransport transport(in, out);
    (void)server.serve(transport);

    auto lines = output_lines(out.str());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0]["error"]["code"], error::ToolInvocationError);
    EXPECT_EQ(lines[0]["error"]["message"], "Missing 'text' parameter");
    EXPECT_FALSE(lines[1].contains("error"));
}

TEST(McpServer, WriteFailurePropagates) {
    auto registry = make_registry();
    McpServer server{test_options(), registry};
    BrokenPipeTransport transport;
    EXPECT_THROW((void)server.serve(transport), McpTransportError);
}

TEST(McpServer, DuplicateCatalogRejectedAtConstruction) {
    class DuplicateRegistry : public ToolRegistry {
    public:
        std::vector<ToolDefinition> list_tools() const override {
            ToolDefinition td;
            td.name = "same";
            td.input_schema = {{"type", "object"}};
            return {td, td};
        }
        ToolOutcome invoke(const std::string&, const nlohmann::json&) const override {
            return ToolError{"unused"};
        }
    };
    DuplicateRegistry registry;
    EXPECT_THROW((McpServer{test_options(), registry}), std::invalid_argument);
}
