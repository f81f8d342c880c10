#include "kagimcp/kagi/tools.hpp"
#include "kagimcp/logging.hpp"

namespace kagimcp::kagi {

namespace {

const nlohmann::json* find_member(const nlohmann::json& args, const char* key) {
    if (!args.is_object()) return nullptr;
    auto it = args.find(key);
    return it == args.end() ? nullptr : &*it;
}

std::optional<std::string> string_member(const nlohmann::json& args, const char* key) {
    const auto* value = find_member(args, key);
    if (!value || !value->is_string()) return std::nullopt;
    return value->get<std::string>();
}

std::string or_placeholder(const std::string& value, const char* placeholder) {
    return value.empty() ? placeholder : value;
}

} // anonymous namespace

std::string format_search_results(const std::string& query, const SearchResponse& response,
                                  int& next_number) {
    std::string output = "-----\nResults for search query \"" + query + "\":\n-----\n";
    for (const auto& result : response.data) {
        if (result.type != 0) continue;
        output += std::to_string(next_number++) + ": " + or_placeholder(result.title, "No title") + "\n";
        output += or_placeholder(result.url, "No URL") + "\n";
        output += "Published Date: " + result.published.value_or("Not Available") + "\n";
        output += or_placeholder(result.snippet, "No snippet") + "\n\n";
    }
    return output;
}

KagiToolRegistry::KagiToolRegistry(KagiClient client, KagiToolOptions opts)
    : client_(std::move(client)), opts_(opts) {
}

std::vector<ToolDefinition> KagiToolRegistry::list_tools() const {
    ToolDefinition search;
    search.name = std::string(SEARCH_TOOL);
    search.description =
        "Fetch web results based on one or more queries using the Kagi Search API. "
        "Use for general search and when the user explicitly tells you to 'fetch' "
        "results/information. Results are from all queries given. They are numbered "
        "continuously, so that a user may be able to refer to a result by a specific number.";
    search.input_schema = {
        {"type", "object"},
        {"properties", {
            {"queries", {
                {"type", "array"},
                {"items", {{"type", "string"}}},
                {"description", "One or more concise, keyword-focused search queries. "
                                "Include essential context within each query for standalone use."}
            }}
        }},
        {"required", nlohmann::json::array({"queries"})}
    };

    ToolDefinition summarizer;
    summarizer.name = std::string(SUMMARIZER_TOOL);
    summarizer.description =
        "Summarize content from a URL using the Kagi Summarizer API. The Summarizer can "
        "summarize any document type (text webpage, video, audio, etc.)";
    summarizer.input_schema = {
        {"type", "object"},
        {"properties", {
            {"url", {
                {"type", "string"},
                {"description", "A URL to a document to summarize."}
            }},
            {"summary_type", {
                {"type", "string"},
                {"enum", nlohmann::json::array({"summary", "takeaway"})},
                {"default", "summary"},
                {"description", "Type of summary to produce. Options are 'summary' for paragraph "
                                "prose and 'takeaway' for a bulleted list of key points."}
            }},
            {"engine", {
                {"type", "string"},
                {"enum", nlohmann::json::array({"cecil", "agnes", "daphne", "muriel"})},
                {"description", "Summarization engine to use. Defaults to configured engine."}
            }},
            {"target_language", {
                {"type", "string"},
                {"description", "Desired output language using language codes (e.g., 'EN' for "
                                "English). If not specified, the document's original language "
                                "influences the output."}
            }}
        }},
        {"required", nlohmann::json::array({"url"})}
    };

    return {search, summarizer};
}

ToolOutcome KagiToolRegistry::invoke(const std::string& name,
                                     const nlohmann::json& arguments) const {
    if (name == SEARCH_TOOL) return search_fetch(arguments);
    if (name == SUMMARIZER_TOOL) return summarize(arguments);
    return ToolError{"Unknown tool: " + name};
}

ToolOutcome KagiToolRegistry::search_fetch(const nlohmann::json& arguments) const {
    const auto* queries = find_member(arguments, "queries");
    if (!queries || !queries->is_array() || queries->empty()) {
        return ToolError{"Missing or invalid 'queries' parameter"};
    }
    for (const auto& query : *queries) {
        if (!query.is_string()) {
            return ToolError{"Invalid query format - expected string"};
        }
    }

    std::string text;
    int next_number = 1;
    bool first = true;
    for (const auto& query_value : *queries) {
        const auto& query = query_value.get_ref<const std::string&>();
        try {
            auto response = client_.search(query, opts_.search_limit);
            if (!first) text += '\n';
            text += format_search_results(query, response, next_number);
            first = false;
        } catch (const std::exception& e) {
            logger()->warn("Search for '{}' failed: {}", query, e.what());
            return ToolError{"Search failed for query '" + query + "': " + e.what()};
        }
    }

    return std::vector<Content>{TextContent{std::move(text)}};
}

ToolOutcome KagiToolRegistry::summarize(const nlohmann::json& arguments) const {
    auto url = string_member(arguments, "url");
    if (!url) {
        return ToolError{"Missing 'url' parameter"};
    }

    SummarizeRequest req;
    req.url = *url;
    req.engine = opts_.default_engine;
    if (auto engine = string_member(arguments, "engine")) {
        req.engine = parse_engine(*engine).value_or(opts_.default_engine);
    }
    if (auto type = string_member(arguments, "summary_type")) {
        req.summary_type = parse_summary_type(*type).value_or(SummaryType::Summary);
    }
    req.target_language = string_member(arguments, "target_language");

    try {
        auto summary = client_.summarize(req);
        return std::vector<Content>{TextContent{std::move(summary.output)}};
    } catch (const std::exception& e) {
        logger()->warn("Summarize for '{}' failed: {}", req.url, e.what());
        return ToolError{std::string("Summarization failed: ") + e.what()};
    }
}

} // namespace kagimcp::kagi
