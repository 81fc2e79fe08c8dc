#pragma once

#include <synthetic_mcp/core/result.hpp>
#include <synthetic_mcp/mcp/capability.hpp>

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace synthetic_mcp {

// ---------------------------------------------------------------------------
// ToolRegistry — name-keyed set of capabilities.
//
// Populated on the bootstrap thread before the server starts and read-only
// afterwards, so lookups take no lock. List() preserves registration order.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    ToolRegistry() = default;

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;
    ToolRegistry(ToolRegistry&&) = default;
    ToolRegistry& operator=(ToolRegistry&&) = default;

    // Fails with ErrorCategory::Configuration on a null capability, a blank
    // name, or a name that is already registered. The registry is unchanged
    // on failure.
    [[nodiscard]] Result<void, Error> Register(std::unique_ptr<ICapability> capability);

    [[nodiscard]] const std::vector<const ICapability*>& List() const noexcept {
        return ordered_;
    }

    // nullptr when absent; a blank name is simply "absent".
    [[nodiscard]] ICapability* FindByName(std::string_view name) const;

    [[nodiscard]] size_t Size() const noexcept { return ordered_.size(); }

private:
    std::map<std::string, std::unique_ptr<ICapability>, std::less<>> by_name_;
    std::vector<const ICapability*> ordered_;
};

} // namespace synthetic_mcp
