#include "kagimcp/router.hpp"
#include "kagimcp/error.hpp"
#include "kagimcp/logging.hpp"

namespace kagimcp {

void Router::on_request(const std::string& method, RequestHandler handler) {
    request_handlers_[method] = std::move(handler);
}

JsonRpcResponse Router::dispatch(const JsonRpcRequest& req) const {
    auto it = request_handlers_.find(req.method);
    if (it == request_handlers_.end()) {
        return JsonRpcResponse::failure(req.id, JsonRpcError{
            error::MethodNotFound,
            "Method not found: " + req.method,
            std::nullopt
        });
    }

    try {
        return JsonRpcResponse{req.id, it->second(req.params)};
    } catch (const std::exception& e) {
        logger()->warn("Handler for '{}' failed: {}", req.method, e.what());
        return JsonRpcResponse::failure(req.id, JsonRpcError{
            error::InternalError,
            std::string("Internal error: ") + e.what(),
            std::nullopt
        });
    }
}

} // namespace kagimcp
