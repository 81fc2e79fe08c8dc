#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string_view>

namespace synthetic_mcp {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

/// "DEBUG", "INFO", "WARN" or "ERROR".
std::string_view LevelName(LogLevel level);

/// Parse "debug", "info", "warn"/"warning" or "error" (case-insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view name);

// ---------------------------------------------------------------------------
// ILogSink — formats and writes one record. Called with the Logger's mutex
// held, so implementations need no locking of their own.
// ---------------------------------------------------------------------------
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;
};

class NullSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

// Human-readable records. With color: "HH:MM:SS LEVEL [component] message"
// in ANSI colors. Without: "<ISO-8601 UTC> [LEVEL] [component] message".
// stdout carries the protocol, so the stream defaults to stderr.
class ColorConsoleSink : public ILogSink {
public:
    explicit ColorConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    bool use_color_;
    std::ostream& out_;
};

// One JSON object per line: {"component","level","message","ts"}.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ostream& out_;
};

// ---------------------------------------------------------------------------
// Logger — level filter in front of a sink. Shared by the protocol thread and
// the bootstrap thread through RuntimeContext.
// ---------------------------------------------------------------------------
class Logger {
public:
    // A null sink is replaced with NullSink.
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level);
    [[nodiscard]] LogLevel Level() const;

    // Lets callers skip building expensive messages.
    [[nodiscard]] bool IsEnabled(LogLevel level) const;

    void Log(LogLevel level, std::string_view component, std::string_view message);

    void Debug(std::string_view component, std::string_view message) {
        Log(LogLevel::Debug, component, message);
    }
    void Info(std::string_view component, std::string_view message) {
        Log(LogLevel::Info, component, message);
    }
    void Warn(std::string_view component, std::string_view message) {
        Log(LogLevel::Warn, component, message);
    }
    void Error(std::string_view component, std::string_view message) {
        Log(LogLevel::Error, component, message);
    }

private:
    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
};

} // namespace synthetic_mcp
