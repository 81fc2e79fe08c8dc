#include <synthetic_mcp/core/log.hpp>
#include <synthetic_mcp/core/ansi.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

namespace synthetic_mcp {

namespace {

struct LevelStyle {
    std::string_view name;
    const char* padded;  // fixed 5-char tag for aligned console output
    const char* color;
};

const LevelStyle& StyleOf(LogLevel level) {
    static const LevelStyle kStyles[] = {
        {"DEBUG", "DEBUG", ansi::kDim},
        {"INFO",  "INFO ", ansi::kCyan},
        {"WARN",  "WARN ", ansi::kYellow},
        {"ERROR", "ERROR", ansi::kRed},
    };
    return kStyles[static_cast<int>(level)];
}

// Wall-clock time: ISO-8601 UTC with milliseconds, or local HH:MM:SS.
std::string Timestamp(bool iso_utc) {
    const auto now = std::chrono::system_clock::now();
    const auto secs = std::chrono::system_clock::to_time_t(now);

    std::tm parts{};
    std::ostringstream oss;
    if (iso_utc) {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;
        gmtime_r(&secs, &parts);
        oss << std::put_time(&parts, "%Y-%m-%dT%H:%M:%S") << '.'
            << std::setfill('0') << std::setw(3) << ms << 'Z';
    } else {
        localtime_r(&secs, &parts);
        oss << std::put_time(&parts, "%H:%M:%S");
    }
    return oss.str();
}

} // anonymous namespace

std::string_view LevelName(LogLevel level) {
    return StyleOf(level).name;
}

std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "warning") {
        return LogLevel::Warn;
    }
    for (auto level : {LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error}) {
        std::string candidate(LevelName(level));
        std::transform(candidate.begin(), candidate.end(), candidate.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == candidate) {
            return level;
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// ColorConsoleSink
// ---------------------------------------------------------------------------
ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(LogLevel level, std::string_view component,
                             std::string_view message) {
    const auto& style = StyleOf(level);
    if (use_color_) {
        out_ << ansi::kDim << Timestamp(false) << ansi::kReset << ' '
             << style.color << style.padded << ansi::kReset << ' '
             << ansi::kDim << '[' << component << ']' << ansi::kReset << ' ';
        // Errors are colored end to end so they stand out in a scrolling log.
        if (level == LogLevel::Error) {
            out_ << style.color << message << ansi::kReset;
        } else {
            out_ << message;
        }
    } else {
        out_ << Timestamp(true) << " [" << style.name << "] ["
             << component << "] " << message;
    }
    out_ << '\n';
    out_.flush();
}

// ---------------------------------------------------------------------------
// JsonSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    const nlohmann::json record = {
        {"ts", Timestamp(true)},
        {"level", std::string(LevelName(level))},
        {"component", std::string(component)},
        {"message", std::string(message)},
    };
    out_ << record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
         << '\n';
    out_.flush();
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(sink ? std::move(sink) : std::make_unique<NullSink>()),
      min_level_(min_level) {}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::Level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

bool Logger::IsEnabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= min_level_;
}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) {
        return;
    }
    sink_->Write(level, component, message);
}

} // namespace synthetic_mcp
