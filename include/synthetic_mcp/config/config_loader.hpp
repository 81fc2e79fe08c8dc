#pragma once

#include <synthetic_mcp/config/app_config.hpp>
#include <synthetic_mcp/core/result.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace synthetic_mcp {

// Looks up an environment variable; returns nullptr when unset.
using EnvLookup = std::function<const char*(const char*)>;

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments into an AppConfig. Only fields given on the command
// line differ from the defaults.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: fields that cli_overrides changed from their defaults
// replace those in base.
AppConfig MergeConfigs(const AppConfig& base, const AppConfig& cli_overrides);

// Apply the environment: the API key (from api.api_key_env unless already
// set), SYNTHETIC_BASE_URL and DebugMode=true.
Result<AppConfig, Error> ResolveEnvironment(AppConfig config,
                                            const EnvLookup& getenv_fn);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace synthetic_mcp
