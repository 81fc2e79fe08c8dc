#pragma once

#include <synthetic_mcp/core/cancellation.hpp>
#include <synthetic_mcp/core/context.hpp>
#include <synthetic_mcp/mcp/line_reader.hpp>
#include <synthetic_mcp/mcp/tool_dispatcher.hpp>

#include <atomic>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

namespace synthetic_mcp {

// JSON-RPC style error codes shared with existing peers.
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

enum class ServerState {
    Running,
    Stopped,
};

// ---------------------------------------------------------------------------
// StdioServer — newline-delimited JSON-RPC over a line reader and an ostream.
//
// Envelope: {"protocolVersion":"2.0","id":...,"method":...,"params":...}
// Methods:
//   - initialize
//   - capabilities/list
//   - capabilities/call
//
// Requests are handled strictly one at a time: a response is written and
// flushed before the next line is read. Every non-blank input line yields
// exactly one response line; malformed input and tool failures become error
// responses and never end the loop.
//
// The loop ends on end-of-input, Stop(), or the shutdown token in the
// RuntimeContext. A stopped server cannot be restarted.
// ---------------------------------------------------------------------------
class StdioServer {
public:
    StdioServer(ToolDispatcher& dispatcher,
                ILineReader& reader,
                std::ostream& out,
                RuntimeContext& context);

    ~StdioServer();

    StdioServer(const StdioServer&) = delete;
    StdioServer& operator=(const StdioServer&) = delete;

    // Run the loop on the calling thread (blocks until stopped).
    void Run();

    // Run the loop on a dedicated thread. No-op if already started or stopped.
    void Start();

    // Join the thread started by Start().
    void Wait();

    // Request the loop to exit at its next read/dispatch boundary. An
    // in-flight tool call sees the cancellation through its token. Idempotent.
    void Stop();

    // Stop and join. Idempotent; also run by the destructor.
    void Dispose();

    [[nodiscard]] ServerState State() const noexcept { return state_.load(); }

    // Process one raw input line. Returns nullopt for blank lines.
    [[nodiscard]] std::optional<nlohmann::json> HandleLine(const std::string& line);

    // Process one parsed envelope and return its response.
    [[nodiscard]] nlohmann::json HandleMessage(const nlohmann::json& message);

private:
    using MethodHandler = nlohmann::json (StdioServer::*)(
        const nlohmann::json& params, const nlohmann::json& id);

    struct MethodEntry {
        const char* name;
        MethodHandler handler;
    };

    static const MethodEntry kMethods[];

    nlohmann::json HandleInitialize(const nlohmann::json& params,
                                    const nlohmann::json& id);
    nlohmann::json HandleCapabilitiesList(const nlohmann::json& params,
                                          const nlohmann::json& id);
    nlohmann::json HandleCapabilitiesCall(const nlohmann::json& params,
                                          const nlohmann::json& id);

    static nlohmann::json MakeError(const nlohmann::json& id,
                                    int code, const std::string& message);
    static nlohmann::json MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result);

    // Write one line and flush. False once the output stream has failed.
    bool WriteResponse(const nlohmann::json& response);

    ToolDispatcher& dispatcher_;
    ILineReader& reader_;
    std::ostream& out_;
    RuntimeContext& context_;

    CancellationSource cancel_;
    std::atomic<ServerState> state_{ServerState::Running};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> loop_active_{false};

    std::mutex lifecycle_mutex_;
    std::thread thread_;
    bool disposed_ = false;
};

} // namespace synthetic_mcp
