#include <synthetic_mcp/tools/synthetic_search_tool.hpp>

#include <algorithm>
#include <cctype>

namespace synthetic_mcp {

namespace {

constexpr const char* kComponent = "synthetic_search";

bool IsBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

// String member or "" when missing, null, or not a string.
std::string StringField(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

Error MakeSearchError(const std::string& message, ErrorCategory category) {
    return Error{"SyntheticSearch", "", std::nullopt, message, category};
}

} // anonymous namespace

nlohmann::json SearchOutcome::ToJson() const {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& r : results) {
        items.push_back({{"title", r.title}, {"url", r.url}, {"snippet", r.snippet}});
    }
    return {
        {"query", query},
        {"results", items},
        {"resultCount", results.size()}
    };
}

SyntheticSearchTool::SyntheticSearchTool(IHttpClient& http,
                                         RuntimeContext& context,
                                         std::string search_path)
    : http_(http),
      context_(context),
      search_path_(std::move(search_path)),
      name_("synthetic_search"),
      description_("Search the web using Synthetic.new API - zero data "
                   "retention web search for coding agents"),
      input_schema_({
          {"type", "object"},
          {"properties", {
              {"query", {
                  {"type", "string"},
                  {"description", "The search query to execute"}
              }}
          }},
          {"required", nlohmann::json::array({"query"})}
      }) {}

Result<nlohmann::json, Error> SyntheticSearchTool::Execute(
    const nlohmann::json& arguments,
    const CancellationToken& cancel) {
    std::string query;
    if (arguments.is_object()) {
        query = StringField(arguments, "query");
    }
    return Search(query, cancel).Map([](SearchOutcome outcome) {
        return outcome.ToJson();
    });
}

Result<SearchOutcome, Error> SyntheticSearchTool::Search(
    const std::string& query,
    const CancellationToken& cancel) {
    using R = Result<SearchOutcome, Error>;

    if (IsBlank(query)) {
        return R::Err(MakeSearchError("Query is required",
                                      ErrorCategory::InvalidInvocation));
    }

    context_.logger.Info(kComponent, "Executing synthetic search for query: " + query);

    const nlohmann::json request = {{"query", query}};
    auto response = http_.PostJson(search_path_, request.dump(), cancel);
    if (response.IsErr()) {
        return R::Err(std::move(response).Error());
    }

    const auto& http_response = response.Value();
    if (!http_response.IsSuccess()) {
        context_.logger.Error(kComponent, "Synthetic API returned HTTP " +
                                              std::to_string(http_response.status_code));
        return R::Err(Error::FromHttpStatus("SyntheticSearch", search_path_,
                                            http_response.status_code,
                                            http_response.body));
    }

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(http_response.body);
    } catch (const nlohmann::json::exception& e) {
        return R::Err(MakeSearchError(
            std::string("Failed to parse Synthetic API response: ") + e.what(),
            ErrorCategory::Parse));
    }
    if (!body.is_object()) {
        return R::Err(MakeSearchError(
            "Failed to parse Synthetic API response: expected a JSON object",
            ErrorCategory::Parse));
    }

    SearchOutcome outcome;
    outcome.query = StringField(body, "query");
    if (IsBlank(outcome.query)) {
        outcome.query = query;
    }

    auto results = body.find("results");
    if (results != body.end() && results->is_array()) {
        for (const auto& item : *results) {
            if (!item.is_object()) {
                continue;
            }
            outcome.results.push_back({StringField(item, "title"),
                                       StringField(item, "url"),
                                       StringField(item, "snippet")});
        }
    }

    context_.logger.Info(kComponent, "Synthetic search completed. Found " +
                                         std::to_string(outcome.results.size()) +
                                         " results");
    return R::Ok(std::move(outcome));
}

} // namespace synthetic_mcp
