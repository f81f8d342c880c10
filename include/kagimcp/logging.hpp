#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace kagimcp {

/// Process-wide "kagimcp" logger. Writes to stderr only: stdout carries the protocol.
std::shared_ptr<spdlog::logger> logger();

/// Set the logger level from its name ("trace" .. "critical", "off").
/// Throws ConfigError on an unknown name.
void set_log_level(const std::string& level);

} // namespace kagimcp
