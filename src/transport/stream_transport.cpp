#include "kagimcp/transport/stream_transport.hpp"
#include "kagimcp/error.hpp"
#include <istream>
#include <ostream>

namespace kagimcp {

StreamTransport::StreamTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {
}

std::optional<std::string> StreamTransport::read_line() {
    std::string line;
    if (std::getline(in_, line)) {
        return line;
    }
    if (in_.bad()) {
        throw McpTransportError("Read error on input stream");
    }
    return std::nullopt;
}

void StreamTransport::write_line(std::string_view line) {
    out_.write(line.data(), static_cast<std::streamsize>(line.size()));
    out_.put('\n');
    out_.flush();
    if (!out_) {
        throw McpTransportError("Write error on output stream");
    }
}

} // namespace kagimcp
