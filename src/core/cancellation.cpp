#include <synthetic_mcp/core/cancellation.hpp>

namespace synthetic_mcp {

namespace detail {

bool CancellationState::IsCancelled() const noexcept {
    if (cancelled.load(std::memory_order_acquire)) {
        return true;
    }
    const auto deadline = deadline_ticks.load(std::memory_order_acquire);
    if (deadline != 0 &&
        std::chrono::steady_clock::now().time_since_epoch().count() >= deadline) {
        return true;
    }
    return parent && parent->IsCancelled();
}

} // namespace detail

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

CancellationSource CancellationSource::CreateLinked(const CancellationToken& parent) {
    CancellationSource source;
    source.state_->parent = parent.state_;
    return source;
}

void CancellationSource::Cancel() noexcept {
    state_->cancelled.store(true, std::memory_order_release);
}

void CancellationSource::CancelAfter(std::chrono::milliseconds delay) noexcept {
    const auto deadline = std::chrono::steady_clock::now() +
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(delay);
    state_->deadline_ticks.store(deadline.time_since_epoch().count(),
                                 std::memory_order_release);
}

bool CancellationSource::IsCancellationRequested() const noexcept {
    return state_->IsCancelled();
}

CancellationToken CancellationSource::Token() const {
    return CancellationToken(state_);
}

} // namespace synthetic_mcp
