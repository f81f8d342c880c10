#include "kagimcp/dispatcher.hpp"
#include "kagimcp/error.hpp"
#include "kagimcp/logging.hpp"
#include "kagimcp/version.hpp"
#include <stdexcept>

namespace kagimcp {

Dispatcher::Dispatcher(Implementation server_info, const ToolRegistry& registry)
    : server_info_(std::move(server_info))
    , registry_(registry)
    , tools_(registry.list_tools())
    , tools_json_(nlohmann::json::array()) {
    for (const auto& tool : tools_) {
        if (!tool_names_.insert(tool.name).second) {
            throw std::invalid_argument("Duplicate tool name in catalog: " + tool.name);
        }
        tools_json_.push_back(tool);
    }

    router_.on_request("initialize", [this](const std::optional<nlohmann::json>&) {
        return handle_initialize();
    });
    router_.on_request("tools/list", [this](const std::optional<nlohmann::json>&) {
        return handle_tools_list();
    });
    router_.on_request("tools/call", [this](const std::optional<nlohmann::json>& params) {
        return handle_tools_call(params);
    });

    logger()->debug("Dispatcher ready with {} tool(s)", tools_.size());
}

JsonRpcResponse Dispatcher::dispatch(const JsonRpcRequest& req) const {
    logger()->debug("Dispatching '{}' (id={})", req.method, req.id.dump());
    return router_.dispatch(req);
}

HandlerResult Dispatcher::handle_initialize() const {
    InitializeResult result;
    result.protocol_version = std::string(PROTOCOL_VERSION);
    result.capabilities.tools = nlohmann::json::object();
    result.server_info = server_info_;

    nlohmann::json j;
    to_json(j, result);
    return j;
}

HandlerResult Dispatcher::handle_tools_list() const {
    return nlohmann::json{{"tools", tools_json_}};
}

HandlerResult Dispatcher::handle_tools_call(const std::optional<nlohmann::json>& params) const {
    if (!params || params->is_null()) {
        return JsonRpcError{error::InvalidParams, "Missing parameters", std::nullopt};
    }

    const nlohmann::json* name = nullptr;
    const nlohmann::json* arguments = nullptr;
    if (params->is_object()) {
        auto name_it = params->find("name");
        if (name_it != params->end()) name = &*name_it;
        auto args_it = params->find("arguments");
        if (args_it != params->end()) arguments = &*args_it;
    }

    if (!name || !name->is_string()) {
        return JsonRpcError{error::InvalidParams, "Missing name parameter", std::nullopt};
    }
    if (!arguments) {
        return JsonRpcError{error::InvalidParams, "Missing arguments parameter", std::nullopt};
    }

    const auto& tool_name = name->get_ref<const std::string&>();
    if (tool_names_.count(tool_name) == 0) {
        return JsonRpcError{error::MethodNotFound, "Unknown tool: " + tool_name, std::nullopt};
    }

    logger()->info("Calling tool '{}'", tool_name);
    auto outcome = registry_.invoke(tool_name, *arguments);

    if (auto* err = std::get_if<ToolError>(&outcome)) {
        logger()->warn("Tool '{}' failed: {}", tool_name, err->message);
        return JsonRpcError{error::ToolInvocationError, std::move(err->message), std::nullopt};
    }

    nlohmann::json content = nlohmann::json::array();
    for (const auto& block : std::get<std::vector<Content>>(outcome)) {
        content.push_back(block);
    }
    return nlohmann::json{{"content", std::move(content)}};
}

} // namespace kagimcp
