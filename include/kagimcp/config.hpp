#pragma once
#include "kagi/client.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace kagimcp {

/// Runtime settings of kagi-mcp-server.
struct Config {
    std::string api_key;
    kagi::SummarizerEngine default_engine = kagi::SummarizerEngine::Cecil;
    std::string base_url = std::string(kagi::DEFAULT_BASE_URL);
    std::string log_level = "info";
    bool show_help = false;
    bool show_version = false;
};

using EnvLookup = std::function<std::optional<std::string>(const char*)>;

/// Reads the process environment; empty values count as unset.
std::optional<std::string> process_env(const char* name);

/// Build a Config from command-line arguments (without argv[0]) and the
/// environment. Flags override environment variables.
/// Throws ConfigError on an unknown flag, a missing flag value, an invalid
/// log level or a missing API key (unless --help or --version was given).
Config parse_config(const std::vector<std::string>& args, const EnvLookup& env = process_env);

std::string usage(const std::string& program);

} // namespace kagimcp
