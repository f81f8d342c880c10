#pragma once
#include "transport.hpp"
#include <string>

namespace kagimcp {

/// Newline-delimited transport over a pair of file descriptors.
class StdioTransport : public ITransport {
public:
    /// Create transport using system stdin/stdout.
    StdioTransport();

    /// Create transport using specified file descriptors (closed on destruction).
    StdioTransport(int read_fd, int write_fd);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    [[nodiscard]] std::optional<std::string> read_line() override;
    void write_line(std::string_view line) override;

private:
    int read_fd_;
    int write_fd_;
    bool owns_fds_;

    std::string buffer_;
    bool eof_{false};
};

} // namespace kagimcp
