#include <synthetic_mcp/mcp/tool_registry.hpp>

#include <algorithm>
#include <cctype>

namespace synthetic_mcp {

namespace {

bool IsBlank(std::string_view s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

Error MakeRegistrationError(const std::string& message) {
    return Error{"ToolRegistry", "", std::nullopt, message,
                 ErrorCategory::Configuration};
}

} // anonymous namespace

Result<void, Error> ToolRegistry::Register(std::unique_ptr<ICapability> capability) {
    if (!capability) {
        return Result<void, Error>::Err(
            MakeRegistrationError("Cannot register a null tool"));
    }
    const auto& name = capability->Name();
    if (IsBlank(name)) {
        return Result<void, Error>::Err(
            MakeRegistrationError("Tool name cannot be empty or whitespace"));
    }
    if (by_name_.find(name) != by_name_.end()) {
        return Result<void, Error>::Err(MakeRegistrationError(
            "A tool with the name '" + name + "' is already registered"));
    }

    ordered_.push_back(capability.get());
    by_name_.emplace(name, std::move(capability));
    return Result<void, Error>::Ok();
}

ICapability* ToolRegistry::FindByName(std::string_view name) const {
    if (IsBlank(name)) {
        return nullptr;
    }
    auto it = by_name_.find(name);
    return it != by_name_.end() ? it->second.get() : nullptr;
}

} // namespace synthetic_mcp
