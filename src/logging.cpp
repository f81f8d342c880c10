#include "kagimcp/logging.hpp"
#include "kagimcp/error.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace kagimcp {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get("kagimcp");
        if (existing) return existing;
        auto created = spdlog::stderr_color_mt("kagimcp");
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        created->set_level(spdlog::level::info);
        return created;
    }();
    return instance;
}

void set_log_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str falls back to "off" for names it does not know
    if (parsed == spdlog::level::off && level != "off") {
        throw ConfigError("Unknown log level: " + level);
    }
    logger()->set_level(parsed);
}

} // namespace kagimcp
