#include <catch2/catch_test_macros.hpp>

#include <synthetic_mcp/core/log.hpp>
#include "mocks/capture_sink.hpp"

#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace synthetic_mcp;
using namespace synthetic_mcp::testing;

// ===========================================================================
// Sinks
// ===========================================================================

TEST_CASE("JsonSink: writes valid JSON lines", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "server", "started");

    auto line = oss.str();
    CHECK(line.find("\"level\":\"INFO\"") != std::string::npos);
    CHECK(line.find("\"component\":\"server\"") != std::string::npos);
    CHECK(line.find("\"message\":\"started\"") != std::string::npos);
    CHECK(line.find("\"ts\":\"") != std::string::npos);
    CHECK(line.back() == '\n');
}

TEST_CASE("JsonSink: escapes quotes and control characters", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Error, "dispatch", "bad \"input\"\nnext\x01");

    auto line = oss.str();
    CHECK(line.find(R"(bad \"input\"\nnext\u0001)") != std::string::npos);
}

TEST_CASE("JsonSink: invalid UTF-8 is replaced, not dropped", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Warn, "stdio", std::string("bad \xff byte"));

    auto line = oss.str();
    CHECK(line.find("bad \xEF\xBF\xBD byte") != std::string::npos);
    CHECK(line.back() == '\n');
}

TEST_CASE("ColorConsoleSink: plain format has no ANSI codes", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(false, oss);

    sink.Write(LogLevel::Warn, "http", "slow response");

    auto line = oss.str();
    CHECK(line.find("[WARN] [http] slow response") != std::string::npos);
    CHECK(line.find('\033') == std::string::npos);
}

TEST_CASE("ColorConsoleSink: colored format wraps level", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(true, oss);

    sink.Write(LogLevel::Error, "server", "boom");

    auto line = oss.str();
    CHECK(line.find('\033') != std::string::npos);
    CHECK(line.find("ERROR") != std::string::npos);
    CHECK(line.find("[server]") != std::string::npos);
    CHECK(line.find("boom") != std::string::npos);
}

// ===========================================================================
// Logger
// ===========================================================================

TEST_CASE("Logger: filters below minimum level", "[log]") {
    auto messages = std::make_shared<std::vector<CapturedMessage>>();
    Logger logger(std::make_unique<CaptureSink>(messages), LogLevel::Warn);

    logger.Debug("c", "debug");
    logger.Info("c", "info");
    logger.Warn("c", "warn");
    logger.Error("c", "error");

    REQUIRE(messages->size() == 2);
    CHECK((*messages)[0].level == LogLevel::Warn);
    CHECK((*messages)[1].message == "error");
}

TEST_CASE("Logger: SetLevel changes filtering", "[log]") {
    auto messages = std::make_shared<std::vector<CapturedMessage>>();
    Logger logger(std::make_unique<CaptureSink>(messages), LogLevel::Error);

    logger.Info("c", "dropped");
    logger.SetLevel(LogLevel::Debug);
    CHECK(logger.Level() == LogLevel::Debug);
    logger.Debug("c", "kept");

    REQUIRE(messages->size() == 1);
    CHECK((*messages)[0].message == "kept");
}

TEST_CASE("Logger: IsEnabled follows the minimum level", "[log]") {
    Logger logger(nullptr, LogLevel::Info);
    CHECK_FALSE(logger.IsEnabled(LogLevel::Debug));
    CHECK(logger.IsEnabled(LogLevel::Info));
    CHECK(logger.IsEnabled(LogLevel::Error));

    logger.SetLevel(LogLevel::Debug);
    CHECK(logger.IsEnabled(LogLevel::Debug));
}

TEST_CASE("Logger: null sink is replaced by a discarding sink", "[log]") {
    Logger logger(nullptr, LogLevel::Debug);
    logger.Error("c", "goes nowhere");
    SUCCEED();
}

TEST_CASE("Logger: concurrent writers", "[log]") {
    auto messages = std::make_shared<std::vector<CapturedMessage>>();
    Logger logger(std::make_unique<CaptureSink>(messages), LogLevel::Debug);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&logger, t] {
            for (int i = 0; i < 100; ++i) {
                logger.Info("thread", std::to_string(t) + ":" + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK(messages->size() == 400);
}

// ===========================================================================
// ParseLogLevel
// ===========================================================================

TEST_CASE("LevelName: upper-case tags", "[log]") {
    CHECK(LevelName(LogLevel::Debug) == "DEBUG");
    CHECK(LevelName(LogLevel::Warn) == "WARN");
}

TEST_CASE("ParseLogLevel: known names", "[log]") {
    CHECK(ParseLogLevel("debug") == LogLevel::Debug);
    CHECK(ParseLogLevel("INFO") == LogLevel::Info);
    CHECK(ParseLogLevel("Warning") == LogLevel::Warn);
    CHECK(ParseLogLevel("warn") == LogLevel::Warn);
    CHECK(ParseLogLevel("error") == LogLevel::Error);
    CHECK_FALSE(ParseLogLevel("verbose").has_value());
}
