#include "kagimcp/server.hpp"
#include "kagimcp/codec.hpp"
#include "kagimcp/error.hpp"
#include "kagimcp/logging.hpp"
#include "kagimcp/transport/stdio_transport.hpp"

namespace kagimcp {

namespace {

std::string_view trim(std::string_view s) {
    constexpr std::string_view whitespace = " \t\r\n\f\v";
    auto first = s.find_first_not_of(whitespace);
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(whitespace);
    return s.substr(first, last - first + 1);
}

} // anonymous namespace

McpServer::McpServer(Options opts, const ToolRegistry& registry)
    : opts_(std::move(opts))
    , dispatcher_(opts_.server_info, registry) {
}

std::string McpServer::encode(const JsonRpcResponse& resp) const {
    try {
        return Codec::serialize(resp);
    } catch (const McpEncodeError& e) {
        logger()->error("Failed to encode response (id={}): {}", resp.id.dump(), e.what());
        auto fallback = JsonRpcResponse::failure(resp.id, JsonRpcError{
            error::InternalError,
            std::string("Internal error: ") + e.what(),
            std::nullopt
        });
        // A second failure propagates: nothing valid can be written for this request
        return Codec::serialize(fallback);
    }
}

std::optional<std::string> McpServer::handle_line(std::string_view line) const {
    ServeStats scratch;
    return process_line(line, scratch);
}

ServeStats McpServer::serve(ITransport& transport) const {
    ServeStats stats;
    logger()->info("{} {} serving", opts_.server_info.name, opts_.server_info.version);

    while (auto line = transport.read_line()) {
        ++stats.lines_read;
        auto response = process_line(*line, stats);
        if (!response) continue;
        transport.write_line(*response);
    }

    logger()->info("End of input after {} request(s) ({} parse error(s), {} blank line(s))",
                   stats.requests, stats.parse_errors, stats.blank_lines);
    return stats;
}

ServeStats McpServer::serve_stdio() const {
    StdioTransport transport;
    return serve(transport);
}

std::optional<std::string> McpServer::process_line(std::string_view line,
                                                  ServeStats& stats) const {
    auto trimmed = trim(line);
    if (trimmed.empty()) {
        ++stats.blank_lines;
        return std::nullopt;
    }
    ++stats.requests;

    JsonRpcRequest req;
    try {
        req = Codec::parse(trimmed);
    } catch (const McpParseError& e) {
        ++stats.parse_errors;
        logger()->warn("Rejected input line: {}", e.what());
        return Codec::serialize(JsonRpcResponse::failure(nullptr, JsonRpcError{
            error::ParseError,
            std::string("Parse error: ") + e.what(),
            std::nullopt
        }));
    }

    return encode(dispatcher_.dispatch(req));
}

} // namespace kagimcp
