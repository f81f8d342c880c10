#include "kagimcp/tool_registry.hpp"
#include <algorithm>

namespace kagimcp {

void StaticToolRegistry::add_tool(ToolDefinition def, ToolHandler handler) {
    tools_.erase(std::remove_if(tools_.begin(), tools_.end(),
        [&def](const ToolDefinition& t) { return t.name == def.name; }), tools_.end());
    handlers_[def.name] = std::move(handler);
    tools_.push_back(std::move(def));
}

std::vector<ToolDefinition> StaticToolRegistry::list_tools() const {
    return tools_;
}

ToolOutcome StaticToolRegistry::invoke(const std::string& name,
                                       const nlohmann::json& arguments) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return ToolError{"Unknown tool: " + name};
    }
    return it->second(arguments);
}

} // namespace kagimcp
