#pragma once

#include <synthetic_mcp/core/log.hpp>

#include <optional>
#include <string>

namespace synthetic_mcp {

constexpr const char* kDefaultApiKeyEnv = "SYNTHETIC_API_KEY";
constexpr const char* kDefaultBaseUrl = "https://api.synthetic.new";
constexpr const char* kDefaultSearchPath = "/v2/search";
constexpr int kDefaultTimeoutSeconds = 60;
constexpr int kDefaultConnectTimeoutSeconds = 10;

struct ApiConfig {
    std::string api_key;  // never logged
    std::string api_key_env = kDefaultApiKeyEnv;
    std::string base_url = kDefaultBaseUrl;
    std::string search_path = kDefaultSearchPath;
    int timeout_seconds = kDefaultTimeoutSeconds;
    int connect_timeout_seconds = kDefaultConnectTimeoutSeconds;
};

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    bool json = false;
    std::optional<std::string> file;
    std::optional<bool> color;  // unset: auto-detect from stderr
};

struct AppConfig {
    ApiConfig api;
    LogConfig log;
    // Optional cap on a single tools call; zero disables it.
    int invocation_timeout_seconds = 0;
    std::optional<std::string> config_file;
};

} // namespace synthetic_mcp
