#pragma once

#include <synthetic_mcp/core/cancellation.hpp>
#include <synthetic_mcp/core/result.hpp>

#include <string>

#include <nlohmann/json.hpp>

namespace synthetic_mcp {

// ---------------------------------------------------------------------------
// ICapability — a tool the server exposes through capabilities/list and
// capabilities/call.
//
// Identity (name, description, input schema) is fixed at construction.
// Execute() receives the caller's "arguments" value untouched and returns a
// JSON-serializable result. Long-running implementations must poll `cancel`
// at their I/O boundaries.
// ---------------------------------------------------------------------------
class ICapability {
public:
    virtual ~ICapability() = default;

    ICapability(const ICapability&) = delete;
    ICapability& operator=(const ICapability&) = delete;
    ICapability(ICapability&&) = delete;
    ICapability& operator=(ICapability&&) = delete;

    [[nodiscard]] virtual const std::string& Name() const noexcept = 0;
    [[nodiscard]] virtual const std::string& Description() const noexcept = 0;

    // JSON Schema object: {"type":"object","properties":{...},"required":[...]}
    [[nodiscard]] virtual const nlohmann::json& InputSchema() const noexcept = 0;

    [[nodiscard]] virtual Result<nlohmann::json, Error> Execute(
        const nlohmann::json& arguments,
        const CancellationToken& cancel) = 0;

protected:
    ICapability() = default;
};

} // namespace synthetic_mcp
