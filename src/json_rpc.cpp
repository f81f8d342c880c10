#include "kagimcp/json_rpc.hpp"
#include "kagimcp/version.hpp"

#include <stdexcept>

namespace kagimcp {

void to_json(nlohmann::json& j, const JsonRpcRequest& r) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = r.id;
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
}

void from_json(const nlohmann::json& j, JsonRpcRequest& r) {
    r.id = j.contains("id") ? j.at("id") : nlohmann::json(nullptr);
    r.method = j.at("method").get<std::string>();
    if (j.contains("params")) r.params = j.at("params");
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = r.id;
    if (const auto* result = r.result()) {
        j["result"] = *result;
    } else if (const auto* err = r.error()) {
        j["error"] = *err;
    }
}

void from_json(const nlohmann::json& j, JsonRpcResponse& r) {
    const bool has_result = j.contains("result");
    const bool has_error = j.contains("error");
    if (has_result == has_error) {
        throw std::invalid_argument("Response must carry exactly one of 'result' or 'error'");
    }
    r.id = j.at("id");
    if (has_result) {
        r.outcome.emplace<nlohmann::json>(j.at("result"));
    } else {
        r.outcome.emplace<JsonRpcError>(j.at("error").get<JsonRpcError>());
    }
}

} // namespace kagimcp
