#pragma once

#include <synthetic_mcp/core/context.hpp>
#include <synthetic_mcp/core/result.hpp>
#include <synthetic_mcp/mcp/tool_registry.hpp>

#include <chrono>
#include <string_view>

#include <nlohmann/json.hpp>

namespace synthetic_mcp {

// ---------------------------------------------------------------------------
// ToolDispatcher — executes a named capability on behalf of the protocol loop.
//
// Errors returned by Invoke():
//   InvalidInvocation   name is blank
//   CapabilityNotFound  no capability registered under name
//   OperationCanceled   cancel fired before or during execution
//   ExecutionFailed     anything the capability reported or threw; the
//                       message is "Tool execution failed: <original>"
// ---------------------------------------------------------------------------
class ToolDispatcher {
public:
    ToolDispatcher(const ToolRegistry& registry, RuntimeContext& context);

    // Bound every invocation by `timeout` on top of the caller's token.
    // Zero (the default) means no bound.
    void SetInvocationTimeout(std::chrono::milliseconds timeout) noexcept {
        invocation_timeout_ = timeout;
    }

    [[nodiscard]] Result<nlohmann::json, Error> Invoke(
        std::string_view name,
        const nlohmann::json& arguments,
        const CancellationToken& cancel);

    [[nodiscard]] const ToolRegistry& Registry() const noexcept { return registry_; }

private:
    const ToolRegistry& registry_;
    RuntimeContext& context_;
    std::chrono::milliseconds invocation_timeout_{0};
};

} // namespace synthetic_mcp
