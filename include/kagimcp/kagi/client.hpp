#pragma once
#include "../error.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

// Forward declaration to avoid including heavy httplib header
namespace httplib {
    class Client;
}

namespace kagimcp::kagi {

constexpr std::string_view DEFAULT_BASE_URL = "https://kagi.com/api/v0";

enum class SummarizerEngine { Cecil, Agnes, Daphne, Muriel };
enum class SummaryType { Summary, Takeaway };

std::string to_string(SummarizerEngine engine);
std::string to_string(SummaryType type);
std::optional<SummarizerEngine> parse_engine(std::string_view name);
std::optional<SummaryType> parse_summary_type(std::string_view name);

/// Non-2xx answer from the Kagi API.
class KagiApiError : public McpError {
public:
    int status;
    std::string body;
    KagiApiError(int status, std::string body)
        : McpError("API error: " + std::to_string(status) + " - " + body)
        , status(status), body(std::move(body)) {}
};

// ---------- Search ----------

struct SearchResult {
    int type = 0;   // "t": 0 = search result, 1 = related searches
    std::optional<int> rank;
    std::string url;
    std::string title;
    std::string snippet;
    std::optional<std::string> published;
};

struct SearchMeta {
    std::string id;
    std::string node;
    int64_t ms = 0;
    std::optional<double> api_balance;
};

struct SearchResponse {
    SearchMeta meta;
    std::vector<SearchResult> data;
};

// ---------- Summarizer ----------

struct SummarizeRequest {
    std::string url;
    SummarizerEngine engine = SummarizerEngine::Cecil;
    SummaryType summary_type = SummaryType::Summary;
    std::optional<std::string> target_language;
};

struct Summary {
    std::string output;
    std::optional<int> tokens;
};

void from_json(const nlohmann::json& j, SearchResult& r);
void from_json(const nlohmann::json& j, SearchMeta& m);
void from_json(const nlohmann::json& j, SearchResponse& r);
void from_json(const nlohmann::json& j, Summary& s);

/// Blocking client for the Kagi Search and Universal Summarizer APIs.
class KagiClient {
public:
    struct Options {
        std::string api_key;
        std::string base_url = std::string(DEFAULT_BASE_URL);
        int connect_timeout_sec = 10;
        int read_timeout_sec = 60;
    };

    explicit KagiClient(Options opts);
    ~KagiClient();

    KagiClient(KagiClient&&) noexcept;
    KagiClient& operator=(KagiClient&&) noexcept;

    /// Throws KagiApiError, McpTransportError or McpParseError.
    [[nodiscard]] SearchResponse search(const std::string& query,
                                        std::optional<int> limit = 10) const;

    /// Throws KagiApiError, McpTransportError or McpParseError.
    [[nodiscard]] Summary summarize(const SummarizeRequest& req) const;

    [[nodiscard]] const std::string& base_url() const { return opts_.base_url; }

private:
    nlohmann::json post(const std::string& endpoint, const nlohmann::json& body) const;

    Options opts_;
    std::string path_prefix_;
    std::unique_ptr<httplib::Client> client_;
};

} // namespace kagimcp::kagi
