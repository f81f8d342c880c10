#pragma once
#include "client.hpp"
#include "../tool_registry.hpp"
#include <string>
#include <vector>

namespace kagimcp::kagi {

constexpr std::string_view SEARCH_TOOL = "kagi_search_fetch";
constexpr std::string_view SUMMARIZER_TOOL = "kagi_summarizer";

struct KagiToolOptions {
    SummarizerEngine default_engine = SummarizerEngine::Cecil;
    int search_limit = 10;
};

/// Render the t == 0 results of one search. Numbering starts at next_number,
/// which is advanced past the last rendered result.
std::string format_search_results(const std::string& query, const SearchResponse& response,
                                  int& next_number);

/// Tool registry exposing kagi_search_fetch and kagi_summarizer.
class KagiToolRegistry : public ToolRegistry {
public:
    explicit KagiToolRegistry(KagiClient client, KagiToolOptions opts = {});

    [[nodiscard]] std::vector<ToolDefinition> list_tools() const override;
    [[nodiscard]] ToolOutcome invoke(const std::string& name,
                                     const nlohmann::json& arguments) const override;

private:
    ToolOutcome search_fetch(const nlohmann::json& arguments) const;
    ToolOutcome summarize(const nlohmann::json& arguments) const;

    KagiClient client_;
    KagiToolOptions opts_;
};

} // namespace kagimcp::kagi
