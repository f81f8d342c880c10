#include "kagimcp/config.hpp"
#include "kagimcp/logging.hpp"

#include <cstdlib>
#include <sstream>

namespace kagimcp {

namespace {

const char* const LOG_LEVELS[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};

bool valid_log_level(const std::string& level) {
    for (const char* name : LOG_LEVELS) {
        if (level == name) return true;
    }
    return false;
}

kagi::SummarizerEngine engine_or_default(const std::string& name) {
    if (auto engine = kagi::parse_engine(name)) return *engine;
    logger()->warn("Unknown summarizer engine '{}', using cecil", name);
    return kagi::SummarizerEngine::Cecil;
}

} // anonymous namespace

std::optional<std::string> process_env(const char* name) {
    const char* value = std::getenv(name);
    if (!value || *value == '\0') return std::nullopt;
    return std::string(value);
}

Config parse_config(const std::vector<std::string>& args, const EnvLookup& env) {
    Config cfg;
    std::optional<std::string> api_key = env("KAGI_API_KEY");
    std::optional<std::string> engine = env("KAGI_SUMMARIZER_ENGINE");
    std::optional<std::string> base_url = env("KAGI_API_BASE_URL");
    std::optional<std::string> log_level = env("KAGI_MCP_LOG_LEVEL");

    for (size_t i = 0; i < args.size(); ++i) {
        std::string flag = args[i];
        std::optional<std::string> inline_value;
        auto eq = flag.find('=');
        if (flag.rfind("--", 0) == 0 && eq != std::string::npos) {
            inline_value = flag.substr(eq + 1);
            flag = flag.substr(0, eq);
        }

        if (flag == "--help" || flag == "-h") {
            cfg.show_help = true;
            continue;
        }
        if (flag == "--version") {
            cfg.show_version = true;
            continue;
        }

        std::optional<std::string>* target = nullptr;
        if (flag == "--api-key") target = &api_key;
        else if (flag == "--summarizer-engine") target = &engine;
        else if (flag == "--base-url") target = &base_url;
        else if (flag == "--log-level") target = &log_level;
        else throw ConfigError("Unknown argument: " + args[i]);

        if (inline_value) {
            *target = *inline_value;
        } else if (i + 1 < args.size()) {
            *target = args[++i];
        } else {
            throw ConfigError("Missing value for " + flag);
        }
    }

    if (log_level) {
        if (!valid_log_level(*log_level)) {
            throw ConfigError("Invalid log level: " + *log_level);
        }
        cfg.log_level = *log_level;
    }
    if (engine) cfg.default_engine = engine_or_default(*engine);
    if (base_url && !base_url->empty()) cfg.base_url = *base_url;

    if (cfg.show_help || cfg.show_version) return cfg;

    if (!api_key || api_key->empty()) {
        throw ConfigError("KAGI_API_KEY environment variable is required (or pass --api-key)");
    }
    cfg.api_key = *api_key;
    return cfg;
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "\n"
        << "MCP server exposing Kagi search and summarizer tools over stdio.\n"
        << "\n"
        << "Options:\n"
        << "  --api-key KEY              Kagi API key (env KAGI_API_KEY)\n"
        << "  --summarizer-engine NAME   cecil, agnes, daphne or muriel"
           " (env KAGI_SUMMARIZER_ENGINE, default cecil)\n"
        << "  --base-url URL             Kagi API base URL (env KAGI_API_BASE_URL)\n"
        << "  --log-level LEVEL          trace, debug, info, warn, error, critical or off"
           " (env KAGI_MCP_LOG_LEVEL, default info)\n"
        << "  --version                  Print version and exit\n"
        << "  -h, --help                 Show this help\n";
    return out.str();
}

} // namespace kagimcp
