#include "kagimcp/transport/stdio_transport.hpp"
#include "kagimcp/error.hpp"
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace kagimcp {

StdioTransport::StdioTransport()
    : read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true) {
}

StdioTransport::~StdioTransport() {
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0 && write_fd_ != read_fd_) ::close(write_fd_);
    }
}

std::optional<std::string> StdioTransport::read_line() {
    char chunk[4096];

    while (true) {
        size_t nl = buffer_.find('\n');
        if (nl != std::string::npos) {
            std::string line = buffer_.substr(0, nl);
            buffer_.erase(0, nl + 1);
            return line;
        }

        if (eof_) {
            if (buffer_.empty()) return std::nullopt;
            // Unterminated final line
            std::string line = std::move(buffer_);
            buffer_.clear();
            return line;
        }

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw McpTransportError(std::string("Read error: ") + std::strerror(errno));
        }
        if (n == 0) {
            eof_ = true;
            continue;
        }
        buffer_.append(chunk, static_cast<size_t>(n));
    }
}

void StdioTransport::write_line(std::string_view line) {
    std::string msg;
    msg.reserve(line.size() + 1);
    msg.append(line);
    msg += '\n';

    const char* data = msg.data();
    size_t remaining = msg.size();

    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw McpTransportError(std::string("Write error: ") + std::strerror(errno));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
}

} // namespace kagimcp
