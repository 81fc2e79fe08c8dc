#include <synthetic_mcp/config/config_loader.hpp>
#include <synthetic_mcp/core/cancellation.hpp>
#include <synthetic_mcp/core/context.hpp>
#include <synthetic_mcp/core/log.hpp>
#include <synthetic_mcp/core/terminal.hpp>
#include <synthetic_mcp/core/version.hpp>
#include <synthetic_mcp/http/http_client.hpp>
#include <synthetic_mcp/mcp/line_reader.hpp>
#include <synthetic_mcp/mcp/stdio_server.hpp>
#include <synthetic_mcp/mcp/tool_dispatcher.hpp>
#include <synthetic_mcp/mcp/tool_registry.hpp>
#include <synthetic_mcp/tools/synthetic_search_tool.hpp>

#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

#include <unistd.h>

namespace {

constexpr int kExitSuccess = 0;

// Signal handlers can only reach the shutdown source through a global.
synthetic_mcp::CancellationSource* g_shutdown = nullptr;

extern "C" void HandleShutdownSignal(int /*signo*/) {
    if (g_shutdown != nullptr) {
        g_shutdown->Cancel();
    }
}

void InstallSignalHandlers(synthetic_mcp::CancellationSource& shutdown) {
    g_shutdown = &shutdown;

    struct sigaction sa {};
    sa.sa_handler = HandleShutdownSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // A vanished peer must surface as a failed write, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);
}

bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--version") {
            std::cout << synthetic_mcp::kServerName << " "
                      << synthetic_mcp::kVersion << "\n";
            return true;
        }
    }
    return false;
}

int Fail(const synthetic_mcp::Error& error) {
    std::cerr << synthetic_mcp::kServerName << ": " << error.message << "\n";
    return error.ExitCode();
}

// Build the full configuration: defaults < YAML < CLI, then environment
// variables are applied by ResolveEnvironment.
synthetic_mcp::Result<synthetic_mcp::AppConfig, synthetic_mcp::Error> LoadConfig(
    int argc, const char* const* argv) {
    using namespace synthetic_mcp;
    using R = Result<AppConfig, Error>;

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        return cli;
    }

    AppConfig base;
    if (cli.Value().config_file.has_value()) {
        auto yaml = LoadFromYaml(*cli.Value().config_file);
        if (yaml.IsErr()) {
            return yaml;
        }
        base = std::move(yaml).Value();
    }

    auto merged = MergeConfigs(base, cli.Value());
    auto resolved = ResolveEnvironment(
        std::move(merged), [](const char* name) { return std::getenv(name); });
    if (resolved.IsErr()) {
        return resolved;
    }

    auto valid = ValidateConfig(resolved.Value());
    if (valid.IsErr()) {
        return R::Err(std::move(valid).Error());
    }
    return resolved;
}

std::unique_ptr<synthetic_mcp::ILogSink> MakeLogSink(
    const synthetic_mcp::LogConfig& log, std::ofstream& log_file) {
    using namespace synthetic_mcp;

    std::ostream* out = &std::cerr;
    // An explicit --color/--no-color wins over auto-detection.
    bool use_color = log.color.value_or(IsStderrTty() && !NoColorEnvSet());
    if (log.file.has_value()) {
        log_file.open(*log.file, std::ios::app);
        if (log_file) {
            out = &log_file;
            use_color = false;
        } else {
            std::cerr << kServerName << ": cannot open log file " << *log.file
                      << ", logging to stderr\n";
        }
    }

    if (log.json) {
        return std::make_unique<JsonSink>(*out);
    }
    return std::make_unique<ColorConsoleSink>(use_color, *out);
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace synthetic_mcp;

    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }

    auto config_result = LoadConfig(argc, argv);
    if (config_result.IsErr()) {
        return Fail(config_result.Error());
    }
    const auto config = std::move(config_result).Value();

    // stdout carries the protocol; logs go to stderr or the log file only.
    std::ofstream log_file;
    Logger logger(MakeLogSink(config.log, log_file), config.log.level);

    CancellationSource shutdown;
    InstallSignalHandlers(shutdown);
    RuntimeContext context{logger, shutdown.Token()};

    HttpClientOptions http_options;
    http_options.connect_timeout = std::chrono::seconds(config.api.connect_timeout_seconds);
    http_options.read_timeout = std::chrono::seconds(config.api.timeout_seconds);
    HttpClient http(config.api.base_url, config.api.api_key, logger, http_options);

    ToolRegistry registry;
    auto registered = registry.Register(
        std::make_unique<SyntheticSearchTool>(http, context, config.api.search_path));
    if (registered.IsErr()) {
        logger.Error("main", registered.Error().ToString());
        return Fail(registered.Error());
    }
    logger.Info("main", "Registered " + std::to_string(registry.Size()) + " MCP tools");

    ToolDispatcher dispatcher(registry, context);
    dispatcher.SetInvocationTimeout(
        std::chrono::seconds(config.invocation_timeout_seconds));

    FdLineReader reader(STDIN_FILENO);
    StdioServer server(dispatcher, reader, std::cout, context);

    server.Start();
    server.Wait();

    server.Stop();
    server.Dispose();
    g_shutdown = nullptr;

    logger.Info("main", "Shutdown complete");
    return kExitSuccess;
}
