#pragma once
#include <string>
#include <variant>
#include <optional>
#include <nlohmann/json.hpp>

namespace kagimcp {

/// Request ids are opaque: null, number or string, echoed back untouched.
using RequestId = nlohmann::json;

struct JsonRpcError {
    int code;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
};

inline void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

inline void from_json(const nlohmann::json& j, JsonRpcError& e) {
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
    if (j.contains("data")) e.data = j.at("data");
}

/// Outcome of one request handler: a result payload or an error body.
using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;

struct JsonRpcRequest {
    RequestId id;
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcRequest& o) const {
        return id == o.id && method == o.method && params == o.params;
    }
};

/// Exactly one of result/error is carried, by construction.
struct JsonRpcResponse {
    RequestId id;
    HandlerResult outcome;

    static JsonRpcResponse success(RequestId id, nlohmann::json result) {
        return JsonRpcResponse{std::move(id), HandlerResult{std::in_place_index<0>, std::move(result)}};
    }

    static JsonRpcResponse failure(RequestId id, JsonRpcError err) {
        return JsonRpcResponse{std::move(id), HandlerResult{std::in_place_index<1>, std::move(err)}};
    }

    [[nodiscard]] bool is_error() const { return std::holds_alternative<JsonRpcError>(outcome); }

    [[nodiscard]] const nlohmann::json* result() const { return std::get_if<nlohmann::json>(&outcome); }
    [[nodiscard]] const JsonRpcError* error() const { return std::get_if<JsonRpcError>(&outcome); }

    bool operator==(const JsonRpcResponse& o) const {
        return id == o.id && outcome == o.outcome;
    }
};

void to_json(nlohmann::json& j, const JsonRpcRequest& r);
void from_json(const nlohmann::json& j, JsonRpcRequest& r);

void to_json(nlohmann::json& j, const JsonRpcResponse& r);
void from_json(const nlohmann::json& j, JsonRpcResponse& r);

} // namespace kagimcp
