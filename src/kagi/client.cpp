#include "kagimcp/kagi/client.hpp"
#include "kagimcp/logging.hpp"

#include <httplib.h>

namespace kagimcp::kagi {

// ---------- Enums ----------

std::string to_string(SummarizerEngine engine) {
    switch (engine) {
        case SummarizerEngine::Cecil:  return "cecil";
        case SummarizerEngine::Agnes:  return "agnes";
        case SummarizerEngine::Daphne: return "daphne";
        case SummarizerEngine::Muriel: return "muriel";
    }
    return "cecil";
}

std::string to_string(SummaryType type) {
    return type == SummaryType::Takeaway ? "takeaway" : "summary";
}

std::optional<SummarizerEngine> parse_engine(std::string_view name) {
    if (name == "cecil")  return SummarizerEngine::Cecil;
    if (name == "agnes")  return SummarizerEngine::Agnes;
    if (name == "daphne") return SummarizerEngine::Daphne;
    if (name == "muriel") return SummarizerEngine::Muriel;
    return std::nullopt;
}

std::optional<SummaryType> parse_summary_type(std::string_view name) {
    if (name == "summary")  return SummaryType::Summary;
    if (name == "takeaway") return SummaryType::Takeaway;
    return std::nullopt;
}

// ---------- JSON ----------

void from_json(const nlohmann::json& j, SearchResult& r) {
    r.type = j.at("t").get<int>();
    if (j.contains("rank") && !j.at("rank").is_null()) r.rank = j.at("rank").get<int>();
    // Related-search entries (t == 1) carry a "list" instead of these fields
    r.url = j.value("url", std::string());
    r.title = j.value("title", std::string());
    r.snippet = j.value("snippet", std::string());
    if (j.contains("published") && j.at("published").is_string()) {
        r.published = j.at("published").get<std::string>();
    }
}

void from_json(const nlohmann::json& j, SearchMeta& m) {
    m.id = j.value("id", std::string());
    m.node = j.value("node", std::string());
    m.ms = j.value("ms", int64_t{0});
    if (j.contains("api_balance") && j.at("api_balance").is_number()) {
        m.api_balance = j.at("api_balance").get<double>();
    }
}

void from_json(const nlohmann::json& j, SearchResponse& r) {
    if (j.contains("meta")) r.meta = j.at("meta").get<SearchMeta>();
    r.data = j.at("data").get<std::vector<SearchResult>>();
}

void from_json(const nlohmann::json& j, Summary& s) {
    s.output = j.at("output").get<std::string>();
    if (j.contains("tokens") && j.at("tokens").is_number_integer()) {
        s.tokens = j.at("tokens").get<int>();
    }
}

// ---------- KagiClient ----------

KagiClient::KagiClient(Options opts)
    : opts_(std::move(opts)) {
    // Split http(s)://host[:port]/prefix
    std::string url = opts_.base_url;
    std::string scheme = "https://";
    if (url.substr(0, 7) == "http://") {
        scheme = "http://";
        url = url.substr(7);
    } else if (url.substr(0, 8) == "https://") {
        url = url.substr(8);
    }

    auto slash = url.find('/');
    std::string hostport = (slash == std::string::npos) ? url : url.substr(0, slash);
    path_prefix_ = (slash == std::string::npos) ? "" : url.substr(slash);
    while (!path_prefix_.empty() && path_prefix_.back() == '/') path_prefix_.pop_back();

    client_ = std::make_unique<httplib::Client>(scheme + hostport);
    client_->set_connection_timeout(opts_.connect_timeout_sec);
    client_->set_read_timeout(opts_.read_timeout_sec);
}

KagiClient::~KagiClient() = default;
KagiClient::KagiClient(KagiClient&&) noexcept = default;
KagiClient& KagiClient::operator=(KagiClient&&) noexcept = default;

nlohmann::json KagiClient::post(const std::string& endpoint, const nlohmann::json& body) const {
    const std::string path = path_prefix_ + endpoint;
    httplib::Headers headers = {
        {"Authorization", "Bot " + opts_.api_key},
        {"Accept", "application/json"}
    };

    logger()->debug("POST {}{}", opts_.base_url, endpoint);
    auto result = client_->Post(path, headers, body.dump(), "application/json");
    if (!result) {
        throw McpTransportError("HTTP request failed: " + httplib::to_string(result.error()));
    }
    if (result->status < 200 || result->status >= 300) {
        throw KagiApiError(result->status, result->body);
    }

    try {
        return nlohmann::json::parse(result->body);
    } catch (const nlohmann::json::exception& e) {
        throw McpParseError(std::string("Invalid JSON from ") + endpoint + ": " + e.what());
    }
}

SearchResponse KagiClient::search(const std::string& query, std::optional<int> limit) const {
    nlohmann::json body = {{"q", query}};
    if (limit) body["limit"] = std::to_string(*limit);

    auto j = post("/search", body);
    try {
        return j.get<SearchResponse>();
    } catch (const nlohmann::json::exception& e) {
        throw McpParseError(std::string("Unexpected search response: ") + e.what());
    }
}

Summary KagiClient::summarize(const SummarizeRequest& req) const {
    nlohmann::json body = {
        {"url", req.url},
        {"engine", to_string(req.engine)},
        {"summary_type", to_string(req.summary_type)}
    };
    if (req.target_language) body["target_language"] = *req.target_language;

    auto j = post("/summarize", body);
    try {
        return j.at("data").get<Summary>();
    } catch (const nlohmann::json::exception& e) {
        throw McpParseError(std::string("Unexpected summarize response: ") + e.what());
    }
}

} // namespace kagimcp::kagi
