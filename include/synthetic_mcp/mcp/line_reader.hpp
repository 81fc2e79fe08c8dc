#pragma once

#include <synthetic_mcp/core/cancellation.hpp>

#include <chrono>
#include <cstddef>
#include <istream>
#include <optional>
#include <string>

namespace synthetic_mcp {

// ---------------------------------------------------------------------------
// ILineReader — source of newline-delimited requests.
//
// ReadLine() returns the next line without its terminator (a trailing '\r'
// is stripped too), or nullopt at end of input or once `cancel` fires.
// ---------------------------------------------------------------------------
class ILineReader {
public:
    virtual ~ILineReader() = default;

    [[nodiscard]] virtual std::optional<std::string> ReadLine(
        const CancellationToken& cancel) = 0;
};

// Reads from a std::istream. Cancellation is only observed between lines,
// since std::getline cannot be interrupted.
class StreamLineReader : public ILineReader {
public:
    explicit StreamLineReader(std::istream& in) : in_(in) {}

    [[nodiscard]] std::optional<std::string> ReadLine(
        const CancellationToken& cancel) override;

private:
    std::istream& in_;
};

// Reads from a POSIX file descriptor (normally STDIN_FILENO). Waits with
// poll() in short slices so a cancellation is noticed while the peer is idle.
//
// A line longer than max_line_bytes is cut to that length and the rest of it
// is discarded up to the next '\n', so a peer that never sends a terminator
// cannot grow the buffer without bound. The cut line no longer parses and is
// answered like any other malformed request.
class FdLineReader : public ILineReader {
public:
    static constexpr size_t kDefaultMaxLineBytes = 4 * 1024 * 1024;

    explicit FdLineReader(int fd,
                          std::chrono::milliseconds poll_interval =
                              std::chrono::milliseconds{100},
                          size_t max_line_bytes = kDefaultMaxLineBytes);

    [[nodiscard]] std::optional<std::string> ReadLine(
        const CancellationToken& cancel) override;

private:
    std::optional<std::string> TakeBufferedLine();

    int fd_;
    std::chrono::milliseconds poll_interval_;
    size_t max_line_bytes_;
    std::string buffer_;
    // Head of an over-long line whose terminator has not arrived yet.
    std::optional<std::string> overflow_;
    bool eof_ = false;
};

} // namespace synthetic_mcp
