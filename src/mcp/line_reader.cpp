#include <synthetic_mcp/mcp/line_reader.hpp>

#include <algorithm>
#include <cerrno>

#include <poll.h>
#include <unistd.h>

namespace synthetic_mcp {

namespace {

void StripCarriageReturn(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// StreamLineReader
// ---------------------------------------------------------------------------
std::optional<std::string> StreamLineReader::ReadLine(
    const CancellationToken& cancel) {
    if (cancel.IsCancellationRequested()) {
        return std::nullopt;
    }
    std::string line;
    if (!std::getline(in_, line)) {
        return std::nullopt;
    }
    StripCarriageReturn(line);
    return line;
}

// ---------------------------------------------------------------------------
// FdLineReader
// ---------------------------------------------------------------------------
FdLineReader::FdLineReader(int fd, std::chrono::milliseconds poll_interval,
                           size_t max_line_bytes)
    : fd_(fd), poll_interval_(poll_interval), max_line_bytes_(max_line_bytes) {}

std::optional<std::string> FdLineReader::TakeBufferedLine() {
    auto nl = buffer_.find('\n');

    if (overflow_) {
        if (nl == std::string::npos) {
            buffer_.clear();
            return std::nullopt;
        }
        buffer_.erase(0, nl + 1);
        std::string head = std::move(*overflow_);
        overflow_.reset();
        return head;
    }

    if (nl == std::string::npos) {
        if (buffer_.size() > max_line_bytes_) {
            overflow_ = buffer_.substr(0, max_line_bytes_);
            buffer_.clear();
        }
        return std::nullopt;
    }

    std::string line = buffer_.substr(0, std::min(nl, max_line_bytes_));
    buffer_.erase(0, nl + 1);
    StripCarriageReturn(line);
    return line;
}

std::optional<std::string> FdLineReader::ReadLine(const CancellationToken& cancel) {
    while (true) {
        if (auto line = TakeBufferedLine()) {
            return line;
        }
        if (eof_) {
            if (overflow_) {
                std::string head = std::move(*overflow_);
                overflow_.reset();
                buffer_.clear();
                return head;
            }
            // Final line without a terminator.
            if (buffer_.size() > max_line_bytes_) {
                buffer_.resize(max_line_bytes_);
            }
            if (buffer_.empty()) {
                return std::nullopt;
            }
            std::string line = std::move(buffer_);
            buffer_.clear();
            StripCarriageReturn(line);
            return line;
        }
        if (cancel.IsCancellationRequested()) {
            return std::nullopt;
        }

        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int rc = ::poll(&pfd, 1, static_cast<int>(poll_interval_.count()));
        if (rc == 0) {
            continue;
        }
        if (rc < 0) {
            if (errno == EINTR) continue;
            eof_ = true;
            continue;
        }

        char buf[8192];
        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n > 0) {
            buffer_.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            eof_ = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            eof_ = true;
        }
    }
}

} // namespace synthetic_mcp
