/// kagi-mcp-server: Kagi search and summarizer tools over stdio.
/// Usage: KAGI_API_KEY=... ./kagi-mcp-server [--summarizer-engine cecil]

#include <kagimcp/kagimcp.hpp>
#include <kagimcp/config.hpp>
#include <kagimcp/kagi/tools.hpp>

#include <csignal>
#include <iostream>

int main(int argc, char* argv[]) {
    // A vanished client must surface as a write error, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    kagimcp::Config cfg;
    try {
        cfg = kagimcp::parse_config(std::vector<std::string>(argv + 1, argv + argc));
        kagimcp::set_log_level(cfg.log_level);
    } catch (const kagimcp::ConfigError& e) {
        kagimcp::logger()->critical("{}", e.what());
        std::cerr << kagimcp::usage(argv[0]);
        return 2;
    }

    if (cfg.show_help) {
        std::cerr << kagimcp::usage(argv[0]);
        return 0;
    }
    if (cfg.show_version) {
        std::cerr << kagimcp::SERVER_NAME << " " << kagimcp::SERVER_VERSION << "\n";
        return 0;
    }

    try {
        kagimcp::kagi::KagiClient::Options client_opts;
        client_opts.api_key = cfg.api_key;
        client_opts.base_url = cfg.base_url;

        kagimcp::kagi::KagiToolOptions tool_opts;
        tool_opts.default_engine = cfg.default_engine;

        kagimcp::kagi::KagiToolRegistry registry{
            kagimcp::kagi::KagiClient{std::move(client_opts)}, tool_opts};

        kagimcp::McpServer::Options opts;
        opts.server_info = {std::string(kagimcp::SERVER_NAME),
                            std::string(kagimcp::SERVER_VERSION)};
        kagimcp::McpServer server{std::move(opts), registry};

        kagimcp::logger()->info("Using Kagi API at {} (summarizer engine: {})",
                                cfg.base_url, kagimcp::kagi::to_string(cfg.default_engine));
        server.serve_stdio();
    } catch (const kagimcp::McpError& e) {
        kagimcp::logger()->critical("Server error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        kagimcp::logger()->critical("Fatal: {}", e.what());
        return 1;
    }
    return 0;
}
