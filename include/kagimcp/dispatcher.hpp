#pragma once
#include "json_rpc.hpp"
#include "router.hpp"
#include "tool_registry.hpp"
#include "types.hpp"
#include <string>
#include <unordered_set>
#include <vector>

namespace kagimcp {

/// Protocol state machine: initialize, tools/list, tools/call, and
/// MethodNotFound for everything else. Stateless between requests.
///
/// The registry is not owned and must outlive the dispatcher. Its catalog is
/// read once, at construction.
class Dispatcher {
public:
    /// Throws std::invalid_argument if the catalog repeats a tool name.
    Dispatcher(Implementation server_info, const ToolRegistry& registry);

    // The router's handlers capture this
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    [[nodiscard]] JsonRpcResponse dispatch(const JsonRpcRequest& req) const;

    [[nodiscard]] const std::vector<ToolDefinition>& tools() const { return tools_; }
    [[nodiscard]] const Implementation& server_info() const { return server_info_; }

private:
    HandlerResult handle_initialize() const;
    HandlerResult handle_tools_list() const;
    HandlerResult handle_tools_call(const std::optional<nlohmann::json>& params) const;

    Implementation server_info_;
    const ToolRegistry& registry_;
    std::vector<ToolDefinition> tools_;
    std::unordered_set<std::string> tool_names_;
    nlohmann::json tools_json_;
    Router router_;
};

} // namespace kagimcp
