#pragma once
#include <stdexcept>
#include <string>

namespace kagimcp {

class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A line could not be decoded into a request.
class McpParseError : public McpError {
public:
    using McpError::McpError;
};

class McpTransportError : public McpError {
public:
    using McpError::McpError;
};

/// A response could not be turned into a wire line.
class McpEncodeError : public McpError {
public:
    using McpError::McpError;
};

class ConfigError : public McpError {
public:
    using McpError::McpError;
};

namespace error {
    constexpr int ParseError          = -32700;
    constexpr int MethodNotFound      = -32601;
    constexpr int InvalidParams       = -32602;
    constexpr int InternalError       = -32603;
    constexpr int ToolInvocationError = -1;
} // namespace error

} // namespace kagimcp
