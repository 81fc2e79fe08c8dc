#include <synthetic_mcp/mcp/stdio_server.hpp>

#include <synthetic_mcp/core/version.hpp>

#include <algorithm>
#include <cctype>
#include <exception>

namespace synthetic_mcp {

namespace {

constexpr const char* kComponent = "server";
constexpr const char* kEnvelopeVersion = "2.0";

bool IsBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

bool IsValidId(const nlohmann::json& id) {
    return id.is_null() || id.is_string() || id.is_number();
}

} // anonymous namespace

const StdioServer::MethodEntry StdioServer::kMethods[] = {
    {"initialize", &StdioServer::HandleInitialize},
    {"capabilities/list", &StdioServer::HandleCapabilitiesList},
    {"capabilities/call", &StdioServer::HandleCapabilitiesCall},
};

StdioServer::StdioServer(ToolDispatcher& dispatcher,
                         ILineReader& reader,
                         std::ostream& out,
                         RuntimeContext& context)
    : dispatcher_(dispatcher),
      reader_(reader),
      out_(out),
      context_(context),
      cancel_(CancellationSource::CreateLinked(context.shutdown)) {}

StdioServer::~StdioServer() {
    Dispose();
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void StdioServer::Run() {
    if (state_.load() == ServerState::Stopped || loop_active_.exchange(true)) {
        return;
    }

    context_.logger.Info(kComponent, "Starting stdio server");
    const auto token = cancel_.Token();

    while (!token.IsCancellationRequested()) {
        auto line = reader_.ReadLine(token);
        if (!line) {
            break;
        }

        std::optional<nlohmann::json> response;
        try {
            response = HandleLine(*line);
        } catch (const std::exception& e) {
            context_.logger.Error(kComponent,
                                  std::string("Error processing request: ") + e.what());
            response = MakeError(nullptr, kInternalError, "Internal error");
        }

        if (response && !WriteResponse(*response)) {
            context_.logger.Error(kComponent, "Output stream closed; stopping");
            break;
        }
    }

    state_.store(ServerState::Stopped);
    loop_active_.store(false);
    context_.logger.Info(kComponent, "Stdio server stopped");
}

void StdioServer::Start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (disposed_ || thread_.joinable() || state_.load() == ServerState::Stopped) {
        return;
    }
    thread_ = std::thread([this] { Run(); });
}

void StdioServer::Wait() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void StdioServer::Stop() {
    if (stop_requested_.exchange(true)) {
        return;
    }
    context_.logger.Info(kComponent, "Stopping stdio server");
    cancel_.Cancel();
    if (!loop_active_.load()) {
        state_.store(ServerState::Stopped);
    }
}

void StdioServer::Dispose() {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (disposed_) {
            return;
        }
        disposed_ = true;
    }
    Stop();
    Wait();
}

// ---------------------------------------------------------------------------
// Request handling
// ---------------------------------------------------------------------------

std::optional<nlohmann::json> StdioServer::HandleLine(const std::string& line) {
    if (IsBlank(line)) {
        return std::nullopt;
    }

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception& e) {
        context_.logger.Error(kComponent,
                              std::string("Malformed request line: ") + e.what());
        return MakeError(nullptr, kInternalError, "Internal error");
    }

    return HandleMessage(message);
}

nlohmann::json StdioServer::HandleMessage(const nlohmann::json& message) {
    if (!message.is_object()) {
        context_.logger.Error(kComponent, "Request is not a JSON object");
        return MakeError(nullptr, kInternalError, "Internal error");
    }

    nlohmann::json id = message.contains("id") ? message["id"] : nlohmann::json();
    if (!IsValidId(id)) {
        context_.logger.Error(kComponent, "Request id must be a string, number or null");
        return MakeError(nullptr, kInternalError, "Internal error");
    }

    std::string method;
    if (message.contains("method")) {
        if (!message["method"].is_string()) {
            context_.logger.Error(kComponent, "Request method must be a string");
            return MakeError(nullptr, kInternalError, "Internal error");
        }
        method = message["method"].get<std::string>();
    }

    const auto params = message.contains("params") ? message["params"]
                                                   : nlohmann::json();

    context_.logger.Debug(kComponent, "Request: " + method + " id=" + id.dump());

    for (const auto& entry : kMethods) {
        if (method == entry.name) {
            return (this->*entry.handler)(params, id);
        }
    }
    return MakeError(id, kMethodNotFound, "Method not found: " + method);
}

nlohmann::json StdioServer::HandleInitialize(const nlohmann::json& /*params*/,
                                             const nlohmann::json& id) {
    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = nlohmann::json::object();
    result["serverInfo"] = {
        {"name", kServerName},
        {"version", kVersion}
    };
    return MakeResult(id, result);
}

nlohmann::json StdioServer::HandleCapabilitiesList(const nlohmann::json& /*params*/,
                                                   const nlohmann::json& id) {
    nlohmann::json capabilities = nlohmann::json::array();
    for (const auto* capability : dispatcher_.Registry().List()) {
        capabilities.push_back({
            {"name", capability->Name()},
            {"description", capability->Description()},
            {"inputSchema", capability->InputSchema()}
        });
    }
    return MakeResult(id, {{"capabilities", capabilities}});
}

nlohmann::json StdioServer::HandleCapabilitiesCall(const nlohmann::json& params,
                                                   const nlohmann::json& id) {
    std::string tool_name;
    if (params.is_object() && params.contains("name") && params["name"].is_string()) {
        tool_name = params["name"].get<std::string>();
    }
    if (IsBlank(tool_name)) {
        return MakeError(id, kInvalidParams, "Invalid params: tool name is required");
    }

    auto arguments = nlohmann::json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        arguments = params["arguments"];
    }

    auto result = dispatcher_.Invoke(tool_name, arguments, cancel_.Token());
    if (result.IsErr()) {
        context_.logger.Error(kComponent, "Error executing tool " + tool_name +
                                              ": " + result.Error().message);
        return MakeError(id, kInternalError, result.Error().message);
    }
    return MakeResult(id, std::move(result).Value());
}

nlohmann::json StdioServer::MakeError(const nlohmann::json& id,
                                      int code, const std::string& message) {
    return {
        {"protocolVersion", kEnvelopeVersion},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

nlohmann::json StdioServer::MakeResult(const nlohmann::json& id,
                                       const nlohmann::json& result) {
    return {
        {"protocolVersion", kEnvelopeVersion},
        {"id", id},
        {"result", result}
    };
}

bool StdioServer::WriteResponse(const nlohmann::json& response) {
    // Invalid UTF-8 from upstream data is replaced rather than thrown.
    out_ << response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
         << '\n';
    out_.flush();
    return static_cast<bool>(out_);
}

} // namespace synthetic_mcp
