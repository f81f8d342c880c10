#pragma once
#include "dispatcher.hpp"
#include "tool_registry.hpp"
#include "types.hpp"
#include "transport/transport.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace kagimcp {

/// Counters for one serve() run.
struct ServeStats {
    size_t lines_read = 0;
    size_t blank_lines = 0;
    size_t requests = 0;
    size_t parse_errors = 0;
};

/// Transport loop: read a line, decode, dispatch, encode, write. One request
/// at a time; request N+1 is not read until response N has been flushed.
class McpServer {
public:
    struct Options {
        Implementation server_info;
    };

    /// The registry is not owned and must outlive the server.
    McpServer(Options opts, const ToolRegistry& registry);

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    /// Handle one raw input line. Returns the encoded response, or nullopt for
    /// a blank line. Throws McpEncodeError if no response can be encoded.
    [[nodiscard]] std::optional<std::string> handle_line(std::string_view line) const;

    /// Run until end-of-stream. Throws on write or encode failure.
    ServeStats serve(ITransport& transport) const;

    /// serve() over the process stdin/stdout.
    ServeStats serve_stdio() const;

    [[nodiscard]] const Dispatcher& dispatcher() const { return dispatcher_; }

private:
    std::optional<std::string> process_line(std::string_view line, ServeStats& stats) const;
    std::string encode(const JsonRpcResponse& resp) const;

    Options opts_;
    Dispatcher dispatcher_;
};

} // namespace kagimcp
