#include <gtest/gtest.h>
#include "kagimcp/dispatcher.hpp"
#include "kagimcp/error.hpp"
#include "kagimcp/version.hpp"
#include <stdexcept>

using namespace kagimcp;

namespace {

/// Registry double that records every invocation.
class RecordingRegistry : public ToolRegistry {
public:
    std::vector<ToolDefinition> catalog;
    mutable std::vector<std::pair<std::string, nlohmann::json>> calls;
    std::function<ToolOutcome(const std::string&, const nlohmann::json&)> behavior;

    std::vector<ToolDefinition> list_tools() const override { return catalog; }

    ToolOutcome invoke(const std::string& name, const nlohmann::json& arguments) const override {
        calls.emplace_back(name, arguments);
        if (behavior) return behavior(name, arguments);
        return std::vector<Content>{TextContent{"ok"}};
    }
};

ToolDefinition make_tool(const std::string& name) {
    ToolDefinition td;
    td.name = name;
    td.description = "The " + name + " tool";
    td.input_schema = {{"type", "object"}, {"properties", nlohmann::json::object()}};
    return td;
}

JsonRpcRequest make_request(RequestId id, const std::string& method,
                            std::optional<nlohmann::json> params = std::nullopt) {
    JsonRpcRequest req;
    req.id = std::move(id);
    req.method = method;
    req.params = std::move(params);
    return req;
}

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry.catalog = {make_tool("alpha"), make_tool("beta")};
    }

    RecordingRegistry registry;
};

} // anonymous namespace

// ---- initialize ----

TEST_F(DispatcherTest, InitializeResult) {
    Dispatcher d{Implementation{"test-server", "9.9.9"}, registry};
    auto resp = d.dispatch(make_request(1, "initialize",
                                        nlohmann::json{{"protocolVersion", "2099-01-01"}}));
    ASSERT_FALSE(resp.is_error());
    const auto& r = *resp.result();
    EXPECT_EQ(r["protocolVersion"], std::string(PROTOCOL_VERSION));
    EXPECT_EQ(r["capabilities"], (nlohmann::json{{"tools", nlohmann::json::object()}}));
    EXPECT_EQ(r["serverInfo"]["name"], "test-server");
    EXPECT_EQ(r["serverInfo"]["version"], "9.9.9");
}

TEST_F(DispatcherTest, InitializeIgnoresParamsAndRepeats) {
    Dispatcher d{Implementation{"test-server", "9.9.9"}, registry};
    auto first = d.dispatch(make_request(1, "initialize"));
    auto second = d.dispatch(make_request(2, "initialize", nlohmann::json("garbage")));
    ASSERT_FALSE(second.is_error());
    EXPECT_EQ(*first.result(), *second.result());
    EXPECT_EQ(second.id, 2);
}

// ---- tools/list ----

TEST_F(DispatcherTest, ToolsListMatchesCatalog) {
    Dispatcher d{Implementation{"test-server", "9.9.9"}, registry};
    auto resp = d.dispatch(make_request("l", "tools/list"));
    ASSERT_FALSE(resp.is_error());
    const auto& tools = (*resp.result())["tools"];
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0]["name"], "alpha");
    EXPECT_EQ(tools[1]["name"], "beta");
    EXPECT_EQ(tools[0]["description"], "The alpha tool");
    EXPECT_TRUE(tools[0]["inputSchema"].is_object());
    EXPECT_TRUE(registry.calls.empty());
}

TEST_F(DispatcherTest, ToolsListEmptyCatalog) {
    registry.catalog.clear();
    Dispatcher d{Implementation{"test-server", "9.9.9"}, registry};
    auto resp = d.dispatch(make_request(1, "tools/list"));
    EXPECT_EQ(*resp.result(), (nlohmann::json{{"tools", nlohmann::json::array()}}));
}

TEST_F(DispatcherTest, DuplicateToolNamesRejected) {
    registry.catalog.push_back(make_tool("alpha"));
    EXPECT_THROW((Dispatcher{Implementation{"s", "1"}, registry}), std::invalid_argument);
}

// ---- tools/call ----

TEST_F(DispatcherTest, CallSuccess) {
    registry.behavior = [](const std::string&, const nlohmann::json& args) -> ToolOutcome {
        return std::vector<Content>{TextContent{"got " + args.at("q").get<std::string>()}};
    };
    Dispatcher d{Implementation{"test-server", "9.9.9"}, registry};

    auto resp = d.dispatch(make_request(4, "tools/call",
        nlohmann::json{{"name", "alpha"}, {"arguments", {{"q", "x"}}}}));
    ASSERT_FALSE(resp.is_error());
    EXPECT_EQ(*resp.result(), nlohmann::json::parse(
        R"({"content":[{"type":"text","text":"got x"}]})"));

    ASSERT_EQ(registry.calls.size(), 1u);
    EXPECT_EQ(registry.calls[0].first, "alpha");
    EXPECT_EQ(registry.calls[0].second, (nlohmann::json{{"q", "x"}}));
}

TEST_F(DispatcherTest, CallToolErrorBecomesInvocationError) {
    registry.behavior = [](const std::string&, const nlohmann::json&) -> ToolOutcome {
        return ToolError{"upstream exploded"};
    };
    Dispatcher d{Implementation{"test-server", "9.9.9"}, registry};

    auto resp = d.dispatch(make_request(5, "tools/call",
        nlohmann::json{{"name", "beta"}, {"arguments", nlohmann::json::object()}}));
    ASSERT_TRUE(resp.is_error());
    EXPECT_EQ(resp.error()->code, error::ToolInvocationError);
    EXPECT_EQ(resp.error()->message, "upstream exploded");
}

TEST_F(DispatcherTest, CallWithoutParams) {
    Dispatcher d{Implementation{"test-server", "9.9.9"}, registry};
    auto resp = d.dispatch(make_request(1, "tools/call"));
    ASSERT_TRUE(resp.is_error());
    EXPECT_EQ(resp.error()->code, error::InvalidParams);
    EXPECT_EQ(resp.error()->message, "Missing parameters");

    auto null_params = d.dispatch(make_request(2, "tools/call", nlohmann::json(nullptr)));
    EXPECT_EQ(null_params.error()->message, "Missing parameters");
    EXPECT_TRUE(registry.calls.empty());
}

TEST_F(DispatcherTest, CallWithoutName) {
    Dispatcher d{Implementation{"test-server", "9.9.9"}, registry};
    auto resp = d.dispatch(make_request(1, "tools/call",
        nlohmann::json{{"arguments", nlohmann::json::object()}}));
    ASSERT_TRUE(resp.is_error());
    EXPECT_EQ(resp.error()->code, error::InvalidParams);
    EXPECT_EQ(resp.error()->message, "Missing name parameter");

    auto numeric = d.dispatch(make_request(2, "tools/call",
        nlohmann::json{{"name", 7}, {"arguments", nlohmann::json::object()}}));
    EXPECT_EQ(numeric.error()->message, "Missing name parameter");

    auto not_object = d.dispatch(make_request(3, "tools/call", nlohmann::json::array()));
    EXPECT_EQ(not_object.error()->message, "Missing name parameter");
    EXPECT_TRUE(registry.calls.empty());
}

TEST_F(DispatcherTest, CallWithoutArguments) {
    Dispatcher d{Implementation{"test-server", "9.9.9"}, registry};
    auto resp = d.dispatch(make_request(1, "tools/call", nlohmann::json{{"name", "alpha"}}));
    ASSERT_TRUE(resp.is_error());
    EXPECT_EQ(resp.error()->code, error::InvalidParams);
    EXPECT_EQ(resp.error()->message, "Missing arguments parameter");
    EXPECT_TRUE(registry.calls.empty());
}

TEST_F(DispatcherTest, NullArgumentsArePresent) {
    Dispatcher d{Implementation{"test-server", "9.9.9"}, registry};
    auto resp = d.dispatch(make_request(1, "tools/call",
        nlohmann::json{{"name", "alpha"}, {"arguments", nullptr}}));
    EXPECT_FALSE(resp.is_error());
    ASSERT_EQ(registry.calls.size(), 1u);
    EXPECT_TRUE(registry.calls[0].second.is_null());
}

TEST_F(DispatcherTest, CallUnknownToolNotInvoked) {
    Dispatcher d{Implementation{"test-server", "9.9.9"}, registry};
    auto resp = d.dispatch(make_request(1, "tools/call",
        nlohmann::json{{"name", "gamma"}, {"arguments", nlohmann::json::object()}}));
    ASSERT_TRUE(resp.is_error());
    EXPECT_EQ(resp.error()->code, error::MethodNotFound);
    EXPECT_EQ(resp.error()->message, "Unknown tool: gamma");
    EXPECT_TRUE(registry.calls.empty());
}

TEST_F(DispatcherTest, RegistryExceptionBecomesInternalError) {
    registry.behavior = [](const std::string&, const nlohmann::json&) -> ToolOutcome {
        throw std::runtime_error("unexpected");
    };
    Dispatcher d{Implementation{"test-server", "9.9.9"}, registry};
    auto resp = d.dispatch(make_request(8, "tools/call",
        nlohmann::json{{"name", "alpha"}, {"arguments", nlohmann::json::object()}}));
    ASSERT_TRUE(resp.is_error());
    EXPECT_EQ(resp.error()->code, error::InternalError);
    EXPECT_EQ(resp.error()->message, "Internal error: unexpected");
    EXPECT_EQ(resp.id, 8);
}

// ---- other methods ----

TEST_F(DispatcherTest, UnknownMethod) {
    Dispatcher d{Implementation{"test-server", "9.9.9"}, registry};
    for (const char* method : {"ping", "resources/list", "notifications/initialized", ""}) {
        auto resp = d.dispatch(make_request(1, method));
        ASSERT_TRUE(resp.is_error()) << method;
        EXPECT_EQ(resp.error()->code, error::MethodNotFound);
        EXPECT_EQ(resp.error()->message, std::string("Method not found: ") + method);
    }
}

TEST_F(DispatcherTest, CatalogReadOnce) {
    Dispatcher d{Implementation{"test-server", "9.9.9"}, registry};
    registry.catalog.push_back(make_tool("late"));
    auto resp = d.dispatch(make_request(1, "tools/list"));
    EXPECT_EQ((*resp.result())["tools"].size(), 2u);
    EXPECT_EQ(d.tools().size(), 2u);
}
