#pragma once
#include "json_rpc.hpp"
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace kagimcp {

using RequestHandler = std::function<HandlerResult(const std::optional<nlohmann::json>& params)>;

/// Method-name table. dispatch() is the one place where a handler's
/// HandlerResult is turned into a wire response.
class Router {
public:
    /// Register a request handler for a method.
    void on_request(const std::string& method, RequestHandler handler);

    /// Route a request to its handler. Always produces a response.
    [[nodiscard]] JsonRpcResponse dispatch(const JsonRpcRequest& req) const;

private:
    std::unordered_map<std::string, RequestHandler> request_handlers_;
};

} // namespace kagimcp
