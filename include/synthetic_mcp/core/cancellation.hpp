#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace synthetic_mcp {

namespace detail {

struct CancellationState {
    std::atomic<bool> cancelled{false};
    // steady_clock ticks; zero means "no deadline".
    std::atomic<int64_t> deadline_ticks{0};
    std::shared_ptr<const CancellationState> parent;

    [[nodiscard]] bool IsCancelled() const noexcept;
};

} // namespace detail

// ---------------------------------------------------------------------------
// CancellationToken — read-only view of a CancellationSource.
//
// Cheap to copy. A default-constructed token is never cancelled. Cancellation
// is cooperative: the holder polls IsCancellationRequested() at its own I/O
// boundaries.
// ---------------------------------------------------------------------------
class CancellationToken {
public:
    CancellationToken() = default;

    [[nodiscard]] bool IsCancellationRequested() const noexcept {
        return state_ && state_->IsCancelled();
    }

    [[nodiscard]] bool CanBeCanceled() const noexcept {
        return state_ != nullptr;
    }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<const detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<const detail::CancellationState> state_;
};

// ---------------------------------------------------------------------------
// CancellationSource — owns a cancellation flag and hands out tokens.
//
// Cancel() is a single lock-free store, so it may be called from a signal
// handler.
// ---------------------------------------------------------------------------
class CancellationSource {
public:
    CancellationSource();

    /// A source that also reports cancelled once `parent` is cancelled.
    static CancellationSource CreateLinked(const CancellationToken& parent);

    void Cancel() noexcept;

    /// Cancel automatically once `delay` has elapsed (checked on poll).
    void CancelAfter(std::chrono::milliseconds delay) noexcept;

    [[nodiscard]] bool IsCancellationRequested() const noexcept;
    [[nodiscard]] CancellationToken Token() const;

private:
    std::shared_ptr<detail::CancellationState> state_;
};

} // namespace synthetic_mcp
