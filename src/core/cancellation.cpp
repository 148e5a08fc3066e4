#include <azlist/core/cancellation.hpp>

#include <atomic>
#include <map>
#include <mutex>
#include <utility>

namespace azlist {

namespace detail {

struct CancellationState {
    std::atomic<bool> cancelled{false};
    // Guards callbacks_ and next_id_; held while callbacks run so that
    // unregistering waits for a running callback to finish.
    std::recursive_mutex mutex;
    std::map<uint64_t, std::function<void()>> callbacks;
    uint64_t next_id = 1;
};

} // namespace detail

// ---------------------------------------------------------------------------
// CancellationToken
// ---------------------------------------------------------------------------
bool CancellationToken::IsCancelled() const noexcept {
    return state_ && state_->cancelled.load(std::memory_order_acquire);
}

CancellationToken::Registration CancellationToken::OnCancel(
    std::function<void()> callback) const {
    if (!state_) {
        return Registration{};
    }
    std::lock_guard<std::recursive_mutex> lock(state_->mutex);
    if (state_->cancelled.load(std::memory_order_acquire)) {
        callback();
        return Registration{};
    }
    const auto id = state_->next_id++;
    state_->callbacks.emplace(id, std::move(callback));
    return Registration{state_, id};
}

CancellationToken::Registration::~Registration() {
    Reset();
}

CancellationToken::Registration::Registration(Registration&& other) noexcept
    : state_(std::move(other.state_)), id_(other.id_) {
    other.id_ = 0;
}

CancellationToken::Registration& CancellationToken::Registration::operator=(
    Registration&& other) noexcept {
    if (this != &other) {
        Reset();
        state_ = std::move(other.state_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void CancellationToken::Registration::Reset() {
    if (state_) {
        std::lock_guard<std::recursive_mutex> lock(state_->mutex);
        state_->callbacks.erase(id_);
    }
    state_.reset();
    id_ = 0;
}

// ---------------------------------------------------------------------------
// CancellationSource
// ---------------------------------------------------------------------------
CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

CancellationToken CancellationSource::Token() const {
    return CancellationToken{state_};
}

void CancellationSource::Cancel() {
    std::lock_guard<std::recursive_mutex> lock(state_->mutex);
    if (state_->cancelled.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    auto callbacks = std::move(state_->callbacks);
    state_->callbacks.clear();
    for (auto& [id, callback] : callbacks) {
        callback();
    }
}

bool CancellationSource::IsCancelled() const noexcept {
    return state_->cancelled.load(std::memory_order_acquire);
}

} // namespace azlist
