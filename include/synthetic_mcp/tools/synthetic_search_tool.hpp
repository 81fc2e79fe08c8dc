#pragma once

#include <synthetic_mcp/core/context.hpp>
#include <synthetic_mcp/http/i_http_client.hpp>
#include <synthetic_mcp/mcp/capability.hpp>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace synthetic_mcp {

struct SearchResultItem {
    std::string title;
    std::string url;
    std::string snippet;
};

struct SearchOutcome {
    std::string query;
    std::vector<SearchResultItem> results;

    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// SyntheticSearchTool — "synthetic_search": web search through the
// Synthetic.new API.
//
// POSTs {"query": q} to the search path and reshapes the reply into
// {"query", "results": [{"title","url","snippet"}], "resultCount"}.
// ---------------------------------------------------------------------------
class SyntheticSearchTool : public ICapability {
public:
    SyntheticSearchTool(IHttpClient& http,
                        RuntimeContext& context,
                        std::string search_path = "/v2/search");

    [[nodiscard]] const std::string& Name() const noexcept override { return name_; }
    [[nodiscard]] const std::string& Description() const noexcept override {
        return description_;
    }
    [[nodiscard]] const nlohmann::json& InputSchema() const noexcept override {
        return input_schema_;
    }

    [[nodiscard]] Result<nlohmann::json, Error> Execute(
        const nlohmann::json& arguments,
        const CancellationToken& cancel) override;

    // Run one search. A blank query fails with InvalidInvocation before any
    // request is sent.
    [[nodiscard]] Result<SearchOutcome, Error> Search(const std::string& query,
                                                      const CancellationToken& cancel);

private:
    IHttpClient& http_;
    RuntimeContext& context_;
    std::string search_path_;
    std::string name_;
    std::string description_;
    nlohmann::json input_schema_;
};

} // namespace synthetic_mcp
