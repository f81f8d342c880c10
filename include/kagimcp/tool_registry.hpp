#pragma once
#include "types.hpp"
#include <functional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace kagimcp {

/// Human-readable failure reported by a tool implementation.
struct ToolError {
    std::string message;

    bool operator==(const ToolError& o) const { return message == o.message; }
};

using ToolOutcome = std::variant<std::vector<Content>, ToolError>;

/// Capability set the protocol engine consumes. Implementations supply the
/// static catalog and execute calls; argument validation is theirs.
class ToolRegistry {
public:
    virtual ~ToolRegistry() = default;

    /// Static catalog in registration order. Must be stable across calls.
    [[nodiscard]] virtual std::vector<ToolDefinition> list_tools() const = 0;

    /// Run a tool. May block for as long as the implementation needs.
    [[nodiscard]] virtual ToolOutcome invoke(const std::string& name,
                                             const nlohmann::json& arguments) const = 0;
};

using ToolHandler = std::function<ToolOutcome(const nlohmann::json& arguments)>;

/// In-process registry of (definition, handler) pairs.
class StaticToolRegistry : public ToolRegistry {
public:
    /// Register a tool. A tool with the same name is replaced and moves to the end.
    void add_tool(ToolDefinition def, ToolHandler handler);

    [[nodiscard]] std::vector<ToolDefinition> list_tools() const override;
    [[nodiscard]] ToolOutcome invoke(const std::string& name,
                                     const nlohmann::json& arguments) const override;

private:
    std::vector<ToolDefinition> tools_;
    std::unordered_map<std::string, ToolHandler> handlers_;
};

} // namespace kagimcp
