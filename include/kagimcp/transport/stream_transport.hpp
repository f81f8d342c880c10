#pragma once
#include "transport.hpp"
#include <iosfwd>

namespace kagimcp {

/// Newline-delimited transport over C++ streams. The streams are not owned.
class StreamTransport : public ITransport {
public:
    StreamTransport(std::istream& in, std::ostream& out);

    [[nodiscard]] std::optional<std::string> read_line() override;
    void write_line(std::string_view line) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace kagimcp
