#pragma once
#include <string_view>

namespace kagimcp {

constexpr std::string_view SERVER_NAME         = "kagi-mcp-server";
constexpr std::string_view SERVER_VERSION      = "0.1.0";
constexpr std::string_view PROTOCOL_VERSION    = "2024-11-05";
constexpr std::string_view JSONRPC_VERSION     = "2.0";

} // namespace kagimcp
