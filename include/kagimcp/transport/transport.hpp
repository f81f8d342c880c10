#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace kagimcp {

/// Blocking line-oriented transport. One request per line in, one response
/// per line out.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Next line without its terminator, or nullopt at end-of-stream.
    /// Throws McpTransportError on read failure.
    [[nodiscard]] virtual std::optional<std::string> read_line() = 0;

    /// Write one line followed by '\n' and flush it.
    /// Throws McpTransportError on write failure.
    virtual void write_line(std::string_view line) = 0;
};

} // namespace kagimcp
