#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace kagimcp {

class Codec {
public:
    /// Deepest container nesting accepted in one message; deeper input is a parse error.
    static constexpr size_t MAX_NESTING_DEPTH = 512;

    /// Parse one line into a request.
    /// Throws McpParseError on invalid JSON or a malformed envelope.
    [[nodiscard]] static JsonRpcRequest parse(std::string_view raw);

    /// Parse one line into a response (peer side of the wire).
    /// Throws McpParseError on invalid JSON or a malformed envelope.
    [[nodiscard]] static JsonRpcResponse parse_response(std::string_view raw);

    /// Serialize a response to a compact single-line JSON string.
    /// Throws McpEncodeError if the payload cannot be encoded.
    [[nodiscard]] static std::string serialize(const JsonRpcResponse& resp);

    [[nodiscard]] static std::string serialize(const JsonRpcRequest& req);

private:
    static nlohmann::json parse_json(std::string_view raw);
    static JsonRpcRequest request_from_object(const nlohmann::json& j);
};

} // namespace kagimcp
