#include <synthetic_mcp/config/config_loader.hpp>

#include <synthetic_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>

namespace synthetic_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message,
                 ErrorCategory::Configuration};
}

bool IsBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

bool ParseBoolText(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value == "true" || value == "1" || value == "yes";
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
//
//   api:
//     key_env: SYNTHETIC_API_KEY
//     base_url: https://api.synthetic.new
//     search_path: /v2/search
//     timeout: 60
//     connect_timeout: 10
//   log:
//     level: info
//     json: false
//     file: /tmp/synthetic-search-mcp.log
//   invocation_timeout: 0
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    config.config_file = std::string(file_path);

    try {
        const auto root = YAML::LoadFile(std::string(file_path));

        if (const auto api = root["api"]) {
            if (api["key"]) {
                return Result<AppConfig, Error>::Err(MakeConfigError(
                    "API keys must not be stored in the config file; "
                    "use api.key_env instead"));
            }
            if (api["key_env"]) {
                config.api.api_key_env = api["key_env"].as<std::string>();
            }
            if (api["base_url"]) {
                config.api.base_url = api["base_url"].as<std::string>();
            }
            if (api["search_path"]) {
                config.api.search_path = api["search_path"].as<std::string>();
            }
            if (api["timeout"]) {
                config.api.timeout_seconds = api["timeout"].as<int>();
            }
            if (api["connect_timeout"]) {
                config.api.connect_timeout_seconds = api["connect_timeout"].as<int>();
            }
        }

        if (const auto log = root["log"]) {
            if (log["level"]) {
                auto name = log["level"].as<std::string>();
                auto level = ParseLogLevel(name);
                if (!level) {
                    return Result<AppConfig, Error>::Err(
                        MakeConfigError("Invalid log level: " + name));
                }
                config.log.level = *level;
            }
            if (log["json"]) {
                config.log.json = log["json"].as<bool>();
            }
            if (log["file"]) {
                config.log.file = log["file"].as<std::string>();
            }
            if (log["color"]) {
                config.log.color = log["color"].as<bool>();
            }
        }

        if (root["invocation_timeout"]) {
            config.invocation_timeout_seconds = root["invocation_timeout"].as<int>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    // Only --help is built in: -v means --verbose here, and --version is
    // answered by main() before the config is parsed.
    argparse::ArgumentParser program(kServerName, kVersion,
                                     argparse::default_arguments::help);
    program.add_description(
        "MCP server exposing Synthetic.new web search over stdio.");

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--base-url")
        .help("Synthetic API base URL");
    program.add_argument("--api-key-env")
        .help("Environment variable holding the API key");
    program.add_argument("--timeout")
        .help("Outbound request timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--invocation-timeout")
        .help("Upper bound for a single tool call in seconds (0 = none)")
        .scan<'i', int>();
    program.add_argument("--json-logs")
        .help("Write logs as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Append logs to this file instead of stderr");
    program.add_argument("--color")
        .help("Force colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Info-level logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-vv")
        .help("Debug-level logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;
    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }
    if (auto val = program.present("--base-url")) {
        config.api.base_url = *val;
    }
    if (auto val = program.present("--api-key-env")) {
        config.api.api_key_env = *val;
    }
    if (auto val = program.present<int>("--timeout")) {
        config.api.timeout_seconds = *val;
    }
    if (auto val = program.present<int>("--invocation-timeout")) {
        config.invocation_timeout_seconds = *val;
    }
    if (program.get<bool>("--json-logs")) {
        config.log.json = true;
    }
    if (auto val = program.present("--log-file")) {
        config.log.file = *val;
    }
    if (program.get<bool>("--no-color")) {
        config.log.color = false;
    } else if (program.get<bool>("--color")) {
        config.log.color = true;
    }
    if (program.get<bool>("-vv")) {
        config.log.level = LogLevel::Debug;
    } else if (program.get<bool>("--verbose")) {
        config.log.level = LogLevel::Info;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const AppConfig& cli_overrides) {
    const AppConfig defaults;
    AppConfig merged = base;

    if (!cli_overrides.api.api_key.empty()) {
        merged.api.api_key = cli_overrides.api.api_key;
    }
    if (cli_overrides.api.api_key_env != defaults.api.api_key_env) {
        merged.api.api_key_env = cli_overrides.api.api_key_env;
    }
    if (cli_overrides.api.base_url != defaults.api.base_url) {
        merged.api.base_url = cli_overrides.api.base_url;
    }
    if (cli_overrides.api.search_path != defaults.api.search_path) {
        merged.api.search_path = cli_overrides.api.search_path;
    }
    if (cli_overrides.api.timeout_seconds != defaults.api.timeout_seconds) {
        merged.api.timeout_seconds = cli_overrides.api.timeout_seconds;
    }
    if (cli_overrides.api.connect_timeout_seconds !=
        defaults.api.connect_timeout_seconds) {
        merged.api.connect_timeout_seconds = cli_overrides.api.connect_timeout_seconds;
    }

    if (cli_overrides.log.level != defaults.log.level) {
        merged.log.level = cli_overrides.log.level;
    }
    if (cli_overrides.log.json) {
        merged.log.json = true;
    }
    if (cli_overrides.log.file.has_value()) {
        merged.log.file = cli_overrides.log.file;
    }
    if (cli_overrides.log.color.has_value()) {
        merged.log.color = cli_overrides.log.color;
    }

    if (cli_overrides.invocation_timeout_seconds != 0) {
        merged.invocation_timeout_seconds = cli_overrides.invocation_timeout_seconds;
    }
    if (cli_overrides.config_file.has_value()) {
        merged.config_file = cli_overrides.config_file;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ResolveEnvironment
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveEnvironment(AppConfig config,
                                            const EnvLookup& getenv_fn) {
    if (config.api.api_key.empty()) {
        const auto& env_var = config.api.api_key_env;
        const char* env_val = getenv_fn(env_var.c_str());
        if (env_val == nullptr || IsBlank(env_val)) {
            return Result<AppConfig, Error>::Err(MakeConfigError(
                env_var + " environment variable is required. "
                "Get your API key from https://synthetic.new"));
        }
        config.api.api_key = env_val;
    }

    if (const char* base_url = getenv_fn("SYNTHETIC_BASE_URL")) {
        if (!IsBlank(base_url) &&
            config.api.base_url == ApiConfig{}.base_url) {
            config.api.base_url = base_url;
        }
    }

    if (const char* debug = getenv_fn("DebugMode")) {
        if (ParseBoolText(debug)) {
            config.log.level = LogLevel::Debug;
        }
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (IsBlank(config.api.api_key)) {
        return Result<void, Error>::Err(MakeConfigError("Missing API key"));
    }
    const auto& url = config.api.base_url;
    if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid base URL (expected http:// or https://): " + url));
    }
    if (config.api.search_path.empty() || config.api.search_path[0] != '/') {
        return Result<void, Error>::Err(
            MakeConfigError("Search path must start with '/': " +
                            config.api.search_path));
    }
    if (config.api.timeout_seconds <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "Timeout must be positive, got " +
            std::to_string(config.api.timeout_seconds)));
    }
    if (config.api.connect_timeout_seconds <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "Connect timeout must be positive, got " +
            std::to_string(config.api.connect_timeout_seconds)));
    }
    if (config.invocation_timeout_seconds < 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "Invocation timeout must not be negative, got " +
            std::to_string(config.invocation_timeout_seconds)));
    }
    return Result<void, Error>::Ok();
}

} // namespace synthetic_mcp
