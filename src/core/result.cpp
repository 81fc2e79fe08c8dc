#include <synthetic_mcp/core/result.hpp>

#include <iterator>
#include <ostream>
#include <sstream>
#include <tuple>

namespace synthetic_mcp {

namespace {

struct CategoryInfo {
    ErrorCategory category;
    const char* name;
    int exit_code;
};

constexpr CategoryInfo kCategories[] = {
    {ErrorCategory::Connection,         "connection",           1},
    {ErrorCategory::Configuration,      "configuration",        2},
    {ErrorCategory::Upstream,           "upstream",             3},
    {ErrorCategory::Parse,              "parse",                4},
    {ErrorCategory::InvalidInvocation,  "invalid_invocation",   5},
    {ErrorCategory::CapabilityNotFound, "capability_not_found", 6},
    {ErrorCategory::ExecutionFailed,    "execution_failed",     7},
    {ErrorCategory::OperationCanceled,  "operation_canceled",   8},
    {ErrorCategory::Timeout,            "timeout",              10},
    {ErrorCategory::Internal,           "internal",             99},
};

const CategoryInfo& Lookup(ErrorCategory category) {
    for (const auto& info : kCategories) {
        if (info.category == category) {
            return info;
        }
    }
    return kCategories[std::size(kCategories) - 1];
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    auto message = "Synthetic API request failed with status code " +
                   std::to_string(status_code);
    if (!response_body.empty()) {
        message += ": " + response_body;
    }

    const bool timed_out = status_code == 408 || status_code == 504;
    return Error{operation, endpoint, status_code, std::move(message),
                 timed_out ? ErrorCategory::Timeout : ErrorCategory::Upstream};
}

Error Error::Canceled(const std::string& operation) {
    return Error{operation, "", std::nullopt, "Operation was canceled",
                 ErrorCategory::OperationCanceled};
}

int Error::ExitCode() const {
    return Lookup(category).exit_code;
}

std::string Error::CategoryName() const {
    return Lookup(category).name;
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!endpoint.empty()) {
        oss << " [" << endpoint << "]";
    }
    if (http_status) {
        oss << " (HTTP " << *http_status << ")";
    }
    oss << ": " << message;
    return oss.str();
}

bool Error::operator==(const Error& other) const {
    return std::tie(operation, endpoint, http_status, message, category) ==
           std::tie(other.operation, other.endpoint, other.http_status,
                    other.message, other.category);
}

std::ostream& operator<<(std::ostream& os, const Error& error) {
    return os << error.ToString();
}

} // namespace synthetic_mcp
