#include <catch2/catch_test_macros.hpp>

#include <synthetic_mcp/core/version.hpp>
#include <synthetic_mcp/mcp/stdio_server.hpp>
#include "mocks/capture_sink.hpp"
#include "mocks/fake_capability.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace synthetic_mcp;
using namespace synthetic_mcp::testing;

namespace {

std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::vector<nlohmann::json> ParseLines(const std::string& text) {
    std::vector<nlohmann::json> out;
    for (const auto& line : SplitLines(text)) {
        out.push_back(nlohmann::json::parse(line));
    }
    return out;
}

std::string Request(const nlohmann::json& id, const std::string& method,
                    const nlohmann::json& params = nullptr) {
    nlohmann::json msg = {{"protocolVersion", "2.0"}, {"id", id}, {"method", method}};
    if (!params.is_null()) {
        msg["params"] = params;
    }
    return msg.dump();
}

std::string Call(const nlohmann::json& id, const std::string& name,
                 const nlohmann::json& arguments) {
    return Request(id, "capabilities/call",
                   {{"name", name}, {"arguments", arguments}});
}

// Records how many response lines had been written each time the server
// asked for the next request.
class RecordingReader : public ILineReader {
public:
    RecordingReader(std::vector<std::string> lines, const std::ostringstream& out)
        : lines_(std::move(lines)), out_(out) {}

    std::optional<std::string> ReadLine(const CancellationToken&) override {
        const auto text = out_.str();
        written_before_read_.push_back(
            static_cast<size_t>(std::count(text.begin(), text.end(), '\n')));
        if (next_ >= lines_.size()) {
            return std::nullopt;
        }
        return lines_[next_++];
    }

    [[nodiscard]] const std::vector<size_t>& WrittenBeforeRead() const noexcept {
        return written_before_read_;
    }

private:
    std::vector<std::string> lines_;
    const std::ostringstream& out_;
    size_t next_ = 0;
    std::vector<size_t> written_before_read_;
};

struct ServerFixture {
    CapturingLogger log;
    CancellationSource shutdown;
    RuntimeContext context{log.logger, shutdown.Token()};
    ToolRegistry registry;
    ToolDispatcher dispatcher{registry, context};

    std::string RunRaw(const std::string& input) {
        std::istringstream in(input);
        std::ostringstream out;
        StreamLineReader reader(in);
        StdioServer server(dispatcher, reader, out, context);
        server.Run();
        CHECK(server.State() == ServerState::Stopped);
        return out.str();
    }

    std::vector<nlohmann::json> Run(const std::string& input) {
        return ParseLines(RunRaw(input));
    }
};

} // anonymous namespace

// ===========================================================================
// initialize
// ===========================================================================

TEST_CASE("StdioServer: initialize reports server identity", "[mcp][server]") {
    ServerFixture f;
    auto responses = f.Run(Request(1, "initialize", nlohmann::json::object()) + "\n");

    REQUIRE(responses.size() == 1);
    const auto& r = responses[0];
    CHECK(r["protocolVersion"] == "2.0");
    CHECK(r["id"] == 1);
    CHECK_FALSE(r.contains("error"));
    CHECK(r["result"]["protocolVersion"] == "2024-11-05");
    CHECK(r["result"]["capabilities"] == nlohmann::json::object());
    CHECK(r["result"]["serverInfo"]["name"] == "synthetic-search-mcp");
    CHECK(r["result"]["serverInfo"]["version"] == kVersion);
}

TEST_CASE("StdioServer: repeated initialize is byte-identical", "[mcp][server]") {
    ServerFixture f;
    auto line = Request("init", "initialize");
    auto output = SplitLines(f.RunRaw(line + "\n" + line + "\n" + line + "\n"));

    REQUIRE(output.size() == 3);
    CHECK(output[0] == output[1]);
    CHECK(output[1] == output[2]);
}

// ===========================================================================
// capabilities/list
// ===========================================================================

TEST_CASE("StdioServer: capabilities/list in registration order", "[mcp][server]") {
    ServerFixture f;
    REQUIRE(f.registry.Register(MakeEchoCapability("second_alpha")).IsOk());
    REQUIRE(f.registry.Register(MakeEchoCapability("first_alpha")).IsOk());

    auto responses = f.Run(Request(2, "capabilities/list") + "\n");

    REQUIRE(responses.size() == 1);
    const auto& caps = responses[0]["result"]["capabilities"];
    REQUIRE(caps.is_array());
    REQUIRE(caps.size() == 2);
    CHECK(caps[0]["name"] == "second_alpha");
    CHECK(caps[1]["name"] == "first_alpha");
    CHECK(caps[0]["description"] == "Echo the input");
    CHECK(caps[0]["inputSchema"]["type"] == "object");
    CHECK(caps[0]["inputSchema"]["required"] == nlohmann::json::array({"message"}));
}

TEST_CASE("StdioServer: capabilities/list with empty registry", "[mcp][server]") {
    ServerFixture f;
    auto responses = f.Run(Request(3, "capabilities/list") + "\n");

    REQUIRE(responses.size() == 1);
    CHECK(responses[0]["result"]["capabilities"] == nlohmann::json::array());
}

// ===========================================================================
// capabilities/call
// ===========================================================================

TEST_CASE("StdioServer: call returns the capability result", "[mcp][server]") {
    ServerFixture f;
    REQUIRE(f.registry.Register(MakeEchoCapability()).IsOk());

    auto responses = f.Run(Call("c1", "echo", {{"message", "hi"}}) + "\n");

    REQUIRE(responses.size() == 1);
    CHECK(responses[0]["id"] == "c1");
    CHECK(responses[0]["result"] == nlohmann::json{{"echo", "hi"}});
    CHECK_FALSE(responses[0].contains("error"));
}

TEST_CASE("StdioServer: missing arguments default to an empty object", "[mcp][server]") {
    ServerFixture f;
    auto echo = MakeEchoCapability();
    auto* raw = echo.get();
    REQUIRE(f.registry.Register(std::move(echo)).IsOk());

    auto responses = f.Run(Request(4, "capabilities/call", {{"name", "echo"}}) + "\n");

    REQUIRE(responses.size() == 1);
    CHECK(raw->CallCount() == 1);
    CHECK(raw->LastArguments() == nlohmann::json::object());
    CHECK(responses[0]["result"]["echo"] == "");
}

TEST_CASE("StdioServer: missing tool name never reaches a capability", "[mcp][server]") {
    ServerFixture f;
    auto echo = MakeEchoCapability();
    auto* raw = echo.get();
    REQUIRE(f.registry.Register(std::move(echo)).IsOk());

    const std::string input =
        Request(5, "capabilities/call", {{"arguments", {{"message", "x"}}}}) + "\n" +
        Request(6, "capabilities/call", {{"name", "  "}}) + "\n" +
        Request(7, "capabilities/call", {{"name", 42}}) + "\n" +
        Request(8, "capabilities/call") + "\n";
    auto responses = f.Run(input);

    REQUIRE(responses.size() == 4);
    int expected_id = 5;
    for (const auto& r : responses) {
        CHECK(r["id"] == expected_id++);
        CHECK(r["error"]["code"] == kInvalidParams);
        CHECK(r["error"]["message"] == "Invalid params: tool name is required");
    }
    CHECK(raw->CallCount() == 0);
    CHECK_FALSE(f.log.Contains("Executing tool"));
}

TEST_CASE("StdioServer: unknown tool is an internal error", "[mcp][server]") {
    ServerFixture f;
    auto responses = f.Run(Call(9, "missing", nlohmann::json::object()) + "\n");

    REQUIRE(responses.size() == 1);
    CHECK(responses[0]["error"]["code"] == kInternalError);
    CHECK(responses[0]["error"]["message"] == "Tool 'missing' not found.");
}

TEST_CASE("StdioServer: capability failure keeps the loop alive", "[mcp][server]") {
    ServerFixture f;
    REQUIRE(f.registry.Register(MakeFailingCapability("bad", "upstream exploded")).IsOk());
    REQUIRE(f.registry.Register(MakeEchoCapability()).IsOk());

    auto responses = f.Run(Call(1, "bad", nlohmann::json::object()) + "\n" +
                           Call(2, "echo", {{"message", "still here"}}) + "\n");

    REQUIRE(responses.size() == 2);
    CHECK(responses[0]["id"] == 1);
    CHECK(responses[0]["error"]["code"] == kInternalError);
    CHECK(responses[0]["error"]["message"] ==
          "Tool execution failed: upstream exploded");
    CHECK(responses[1]["id"] == 2);
    CHECK(responses[1]["result"]["echo"] == "still here");
}

// ===========================================================================
// Envelope handling
// ===========================================================================

TEST_CASE("StdioServer: unknown method echoes id and names the method", "[mcp][server]") {
    ServerFixture f;
    auto responses = f.Run(Request("req-42", "tools/frobnicate") + "\n" +
                           Request(17, "shutdown") + "\n");

    REQUIRE(responses.size() == 2);
    CHECK(responses[0]["id"] == "req-42");
    CHECK(responses[0]["error"]["code"] == kMethodNotFound);
    CHECK(responses[0]["error"]["message"].get<std::string>().find("tools/frobnicate") !=
          std::string::npos);
    CHECK(responses[1]["id"] == 17);
    CHECK(responses[1]["error"]["code"] == kMethodNotFound);
}

TEST_CASE("StdioServer: missing method", "[mcp][server]") {
    ServerFixture f;
    auto responses = f.Run(R"({"protocolVersion":"2.0","id":3})" "\n");

    REQUIRE(responses.size() == 1);
    CHECK(responses[0]["id"] == 3);
    CHECK(responses[0]["error"]["code"] == kMethodNotFound);
}

TEST_CASE("StdioServer: id forms are echoed exactly", "[mcp][server]") {
    ServerFixture f;
    auto responses = f.Run(
        R"({"protocolVersion":"2.0","id":"abc","method":"initialize"})" "\n"
        R"({"protocolVersion":"2.0","id":12345,"method":"initialize"})" "\n"
        R"({"protocolVersion":"2.0","id":null,"method":"initialize"})" "\n"
        R"({"protocolVersion":"2.0","method":"initialize"})" "\n");

    REQUIRE(responses.size() == 4);
    CHECK(responses[0]["id"] == "abc");
    CHECK(responses[1]["id"] == 12345);
    CHECK(responses[2]["id"].is_null());
    CHECK(responses[3].contains("id"));
    CHECK(responses[3]["id"].is_null());
}

TEST_CASE("StdioServer: malformed line then list yields two responses", "[mcp][server]") {
    ServerFixture f;
    REQUIRE(f.registry.Register(MakeEchoCapability()).IsOk());

    auto responses = f.Run("this is not json\n" + Request(2, "capabilities/list") + "\n");

    REQUIRE(responses.size() == 2);
    CHECK(responses[0]["id"].is_null());
    CHECK(responses[0]["error"]["code"] == kInternalError);
    CHECK(responses[0]["error"]["message"] == "Internal error");
    CHECK(responses[1]["id"] == 2);
    REQUIRE(responses[1]["result"]["capabilities"].size() == 1);
    CHECK(responses[1]["result"]["capabilities"][0]["name"] == "echo");
    CHECK(f.log.Contains("Malformed request line"));
}

TEST_CASE("StdioServer: non-object and bad-typed envelopes", "[mcp][server]") {
    ServerFixture f;
    auto responses = f.Run(
        "[1,2,3]\n"
        "\"just a string\"\n"
        R"({"protocolVersion":"2.0","id":{"nested":true},"method":"initialize"})" "\n"
        R"({"protocolVersion":"2.0","id":1,"method":7})" "\n");

    REQUIRE(responses.size() == 4);
    for (const auto& r : responses) {
        CHECK(r["id"].is_null());
        CHECK(r["error"]["code"] == kInternalError);
    }
}

TEST_CASE("StdioServer: blank lines produce no output", "[mcp][server]") {
    ServerFixture f;
    auto output = f.RunRaw("\n   \n\r\n" + Request(1, "initialize") + "\n\n");

    auto lines = SplitLines(output);
    REQUIRE(lines.size() == 1);
    CHECK(nlohmann::json::parse(lines[0])["id"] == 1);
}

TEST_CASE("StdioServer: burst of requests answered in order", "[mcp][server]") {
    ServerFixture f;
    REQUIRE(f.registry.Register(MakeEchoCapability()).IsOk());

    std::string input;
    constexpr int kCount = 25;
    for (int i = 0; i < kCount; ++i) {
        input += Call(i, "echo", {{"message", "m" + std::to_string(i)}}) + "\n";
    }
    auto responses = f.Run(input);

    REQUIRE(responses.size() == static_cast<size_t>(kCount));
    for (int i = 0; i < kCount; ++i) {
        CHECK(responses[i]["id"] == i);
        CHECK(responses[i]["result"]["echo"] == "m" + std::to_string(i));
    }
}

TEST_CASE("StdioServer: each response is written before the next read", "[mcp][server]") {
    ServerFixture f;
    REQUIRE(f.registry.Register(MakeEchoCapability()).IsOk());

    std::ostringstream out;
    RecordingReader reader({Request(1, "initialize"),
                            "",
                            "garbage",
                            Call(2, "echo", {{"message", "x"}}),
                            Request(3, "capabilities/list")},
                           out);
    StdioServer server(f.dispatcher, reader, out, f.context);
    server.Run();

    // One extra read observes end of input.
    const std::vector<size_t> expected{0, 1, 1, 2, 3, 4};
    CHECK(reader.WrittenBeforeRead() == expected);
}

TEST_CASE("StdioServer: responses keep the envelope shape", "[mcp][server]") {
    ServerFixture f;
    auto output = f.RunRaw(Request(1, "initialize") + "\n" + Request(2, "nope") + "\n");

    for (const auto& line : SplitLines(output)) {
        CHECK(line.find('\n') == std::string::npos);
        auto r = nlohmann::json::parse(line);
        CHECK(r["protocolVersion"] == "2.0");
        CHECK(r.contains("id"));
        CHECK(r.contains("result") != r.contains("error"));
    }
}

TEST_CASE("StdioServer: invalid UTF-8 in a result is replaced", "[mcp][server]") {
    ServerFixture f;
    REQUIRE(f.registry.Register(std::make_unique<FakeCapability>(
        "raw", "Returns undecodable text",
        [](const nlohmann::json&, const CancellationToken&) {
            return Result<nlohmann::json, Error>::Ok(
                nlohmann::json{{"t", std::string("a\xff")}});
        })).IsOk());

    auto output = SplitLines(f.RunRaw(Call(7, "raw", nlohmann::json::object()) + "\n"));

    REQUIRE(output.size() == 1);
    auto r = nlohmann::json::parse(output[0]);
    CHECK(r["id"] == 7);
    CHECK(r["result"]["t"] == "a\xEF\xBF\xBD");
}

// ===========================================================================
// HandleLine / HandleMessage
// ===========================================================================

TEST_CASE("StdioServer: HandleLine skips blank input", "[mcp][server]") {
    ServerFixture f;
    std::istringstream in;
    std::ostringstream out;
    StreamLineReader reader(in);
    StdioServer server(f.dispatcher, reader, out, f.context);

    CHECK_FALSE(server.HandleLine("").has_value());
    CHECK_FALSE(server.HandleLine(" \t ").has_value());
    auto response = server.HandleLine(Request(1, "initialize"));
    REQUIRE(response.has_value());
    CHECK((*response)["id"] == 1);
}

TEST_CASE("StdioServer: HandleMessage dispatches parsed envelopes", "[mcp][server]") {
    ServerFixture f;
    REQUIRE(f.registry.Register(MakeEchoCapability()).IsOk());
    std::istringstream in;
    std::ostringstream out;
    StreamLineReader reader(in);
    StdioServer server(f.dispatcher, reader, out, f.context);

    auto response = server.HandleMessage(
        nlohmann::json::parse(Call("m", "echo", {{"message", "direct"}})));

    CHECK(response["id"] == "m");
    CHECK(response["result"]["echo"] == "direct");
    CHECK(out.str().empty());
}

// ===========================================================================
// Lifecycle
// ===========================================================================

TEST_CASE("StdioServer: output failure stops the loop", "[mcp][server]") {
    ServerFixture f;
    std::istringstream in(Request(1, "initialize") + "\n" + Request(2, "initialize") + "\n");
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    StreamLineReader reader(in);
    StdioServer server(f.dispatcher, reader, out, f.context);

    server.Run();

    CHECK(server.State() == ServerState::Stopped);
    CHECK(f.log.Contains("Output stream closed"));
    std::string remaining;
    CHECK(static_cast<bool>(std::getline(in, remaining)));
    CHECK(remaining == Request(2, "initialize"));
}

TEST_CASE("StdioServer: shutdown token ends the loop before reading", "[mcp][server]") {
    ServerFixture f;
    f.shutdown.Cancel();

    auto output = f.RunRaw(Request(1, "initialize") + "\n");

    CHECK(output.empty());
}

TEST_CASE("StdioServer: Stop before Run leaves the server stopped", "[mcp][server]") {
    ServerFixture f;
    std::istringstream in(Request(1, "initialize") + "\n");
    std::ostringstream out;
    StreamLineReader reader(in);
    StdioServer server(f.dispatcher, reader, out, f.context);

    CHECK(server.State() == ServerState::Running);
    server.Stop();
    CHECK(server.State() == ServerState::Stopped);

    server.Run();
    server.Start();
    server.Wait();
    CHECK(out.str().empty());
}

TEST_CASE("StdioServer: Start then Stop on an idle pipe", "[mcp][server]") {
    ServerFixture f;
    int fds[2];
    REQUIRE(::pipe(fds) == 0);

    {
        std::ostringstream out;
        FdLineReader reader(fds[0], std::chrono::milliseconds{10});
        StdioServer server(f.dispatcher, reader, out, f.context);

        server.Start();
        std::this_thread::sleep_for(std::chrono::milliseconds{30});
        CHECK(server.State() == ServerState::Running);

        const auto start = std::chrono::steady_clock::now();
        server.Stop();
        server.Wait();
        CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds{2});
        CHECK(server.State() == ServerState::Stopped);

        server.Stop();
        server.Dispose();
        server.Dispose();
        CHECK(out.str().empty());
    }

    ::close(fds[0]);
    ::close(fds[1]);
}

TEST_CASE("StdioServer: serves requests written to a pipe", "[mcp][server]") {
    ServerFixture f;
    REQUIRE(f.registry.Register(MakeEchoCapability()).IsOk());
    int fds[2];
    REQUIRE(::pipe(fds) == 0);

    std::ostringstream out;
    {
        FdLineReader reader(fds[0], std::chrono::milliseconds{10});
        StdioServer server(f.dispatcher, reader, out, f.context);
        server.Start();

        const auto input = Call(1, "echo", {{"message", "piped"}}) + "\n" +
                           Request(2, "capabilities/list") + "\n";
        REQUIRE(::write(fds[1], input.data(), input.size()) ==
                static_cast<ssize_t>(input.size()));
        ::close(fds[1]);

        server.Wait();
        CHECK(server.State() == ServerState::Stopped);
    }
    ::close(fds[0]);

    auto responses = ParseLines(out.str());
    REQUIRE(responses.size() == 2);
    CHECK(responses[0]["result"]["echo"] == "piped");
    CHECK(responses[1]["id"] == 2);
}

TEST_CASE("StdioServer: over-long line is answered with an error", "[mcp][server]") {
    ServerFixture f;
    REQUIRE(f.registry.Register(MakeEchoCapability()).IsOk());
    int fds[2];
    REQUIRE(::pipe(fds) == 0);

    const auto input = Call(1, "echo", {{"message", std::string(300, 'x')}}) + "\n" +
                       Request(2, "capabilities/list") + "\n";
    REQUIRE(::write(fds[1], input.data(), input.size()) ==
            static_cast<ssize_t>(input.size()));
    ::close(fds[1]);

    std::ostringstream out;
    {
        FdLineReader reader(fds[0], std::chrono::milliseconds{10}, 128);
        StdioServer server(f.dispatcher, reader, out, f.context);
        server.Run();
    }
    ::close(fds[0]);

    auto responses = ParseLines(out.str());
    REQUIRE(responses.size() == 2);
    CHECK(responses[0]["id"].is_null());
    CHECK(responses[0]["error"]["code"] == kInternalError);
    CHECK(responses[1]["id"] == 2);
    CHECK(responses[1]["result"]["capabilities"].size() == 1);
}

TEST_CASE("StdioServer: Stop cancels the in-flight call", "[mcp][server]") {
    ServerFixture f;
    std::atomic<bool> entered{false};
    REQUIRE(f.registry.Register(std::make_unique<FakeCapability>(
        "wait", "Blocks until cancelled",
        [&entered](const nlohmann::json&, const CancellationToken& cancel) {
            entered.store(true);
            auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
            while (!cancel.IsCancellationRequested() &&
                   std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds{2});
            }
            return Result<nlohmann::json, Error>::Err(Error::Canceled("wait"));
        })).IsOk());

    int fds[2];
    REQUIRE(::pipe(fds) == 0);
    std::ostringstream out;
    {
        FdLineReader reader(fds[0], std::chrono::milliseconds{10});
        StdioServer server(f.dispatcher, reader, out, f.context);
        server.Start();

        const auto input = Call(99, "wait", nlohmann::json::object()) + "\n";
        REQUIRE(::write(fds[1], input.data(), input.size()) ==
                static_cast<ssize_t>(input.size()));

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
        while (!entered.load() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds{2});
        }
        REQUIRE(entered.load());

        server.Stop();
        server.Wait();
    }
    ::close(fds[0]);
    ::close(fds[1]);

    auto responses = ParseLines(out.str());
    REQUIRE(responses.size() == 1);
    CHECK(responses[0]["id"] == 99);
    CHECK(responses[0]["error"]["code"] == kInternalError);
    CHECK(responses[0]["error"]["message"] ==
          "Tool execution failed: Operation was canceled");
}
