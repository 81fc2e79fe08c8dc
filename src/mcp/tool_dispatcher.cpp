#include <synthetic_mcp/mcp/tool_dispatcher.hpp>

#include <algorithm>
#include <cctype>
#include <exception>
#include <string>

namespace synthetic_mcp {

namespace {

constexpr const char* kComponent = "dispatch";
constexpr const char* kFailurePrefix = "Tool execution failed: ";

Error MakeDispatchError(const std::string& name, std::string message,
                        ErrorCategory category) {
    return Error{"Invoke", name, std::nullopt, std::move(message), category};
}

} // anonymous namespace

ToolDispatcher::ToolDispatcher(const ToolRegistry& registry,
                               RuntimeContext& context)
    : registry_(registry), context_(context) {}

Result<nlohmann::json, Error> ToolDispatcher::Invoke(
    std::string_view name,
    const nlohmann::json& arguments,
    const CancellationToken& cancel) {
    using R = Result<nlohmann::json, Error>;
    const std::string tool_name(name);

    const bool blank = std::all_of(tool_name.begin(), tool_name.end(),
                                   [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) {
        return R::Err(MakeDispatchError(tool_name, "Tool name cannot be empty",
                                        ErrorCategory::InvalidInvocation));
    }

    auto* capability = registry_.FindByName(tool_name);
    if (capability == nullptr) {
        context_.logger.Warn(kComponent, "Unknown tool requested: " + tool_name);
        return R::Err(MakeDispatchError(tool_name,
                                        "Tool '" + tool_name + "' not found.",
                                        ErrorCategory::CapabilityNotFound));
    }

    auto source = CancellationSource::CreateLinked(cancel);
    if (invocation_timeout_.count() > 0) {
        source.CancelAfter(invocation_timeout_);
    }
    const auto token = source.Token();

    if (token.IsCancellationRequested()) {
        return R::Err(MakeDispatchError(
            tool_name, std::string(kFailurePrefix) + "Operation was canceled",
            ErrorCategory::OperationCanceled));
    }

    context_.logger.Info(kComponent, "Executing tool: " + tool_name);

    std::optional<Error> failure;
    try {
        auto result = capability->Execute(arguments, token);
        if (result.IsOk()) {
            context_.logger.Info(kComponent,
                                 "Tool " + tool_name + " executed successfully");
            return R::Ok(std::move(result).Value());
        }
        failure = std::move(result).Error();
    } catch (const std::exception& e) {
        failure = Error{"Execute", tool_name, std::nullopt, e.what(),
                        ErrorCategory::Internal};
    } catch (...) {
        failure = Error{"Execute", tool_name, std::nullopt,
                        "unknown exception", ErrorCategory::Internal};
    }

    context_.logger.Error(kComponent, "Error executing tool " + tool_name +
                                          ": " + failure->ToString());

    // A real failure that lands after the deadline keeps its own message.
    if (failure->category == ErrorCategory::OperationCanceled) {
        const bool timed_out = invocation_timeout_.count() > 0 &&
                               token.IsCancellationRequested() &&
                               !cancel.IsCancellationRequested();
        auto message = timed_out
            ? "Operation timed out after " +
                  std::to_string(invocation_timeout_.count()) + " ms"
            : std::string("Operation was canceled");
        return R::Err(MakeDispatchError(
            tool_name, kFailurePrefix + message,
            timed_out ? ErrorCategory::ExecutionFailed
                      : ErrorCategory::OperationCanceled));
    }

    auto wrapped = MakeDispatchError(tool_name, kFailurePrefix + failure->message,
                                     ErrorCategory::ExecutionFailed);
    wrapped.http_status = failure->http_status;
    return R::Err(std::move(wrapped));
}

} // namespace synthetic_mcp
