#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

namespace azlist {

namespace detail {
struct CancellationState;
} // namespace detail

// ---------------------------------------------------------------------------
// CancellationToken: read side of a cancellation signal.
//
// Cheap to copy; all copies observe the same state. A default-constructed
// token can never be cancelled. Callbacks registered with OnCancel() run
// once, on the thread that calls CancellationSource::Cancel() (or inline if
// the token is already cancelled).
// ---------------------------------------------------------------------------
class CancellationToken {
public:
    CancellationToken() = default;

    [[nodiscard]] bool IsCancelled() const noexcept;

    // -- Registration --------------------------------------------------------
    // Unregisters on destruction. After the destructor returns the callback
    // is guaranteed not to be running.
    class Registration {
    public:
        Registration() = default;
        ~Registration();

        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;
        Registration(Registration&& other) noexcept;
        Registration& operator=(Registration&& other) noexcept;

    private:
        friend class CancellationToken;
        Registration(std::shared_ptr<detail::CancellationState> state, uint64_t id)
            : state_(std::move(state)), id_(id) {}

        void Reset();

        std::shared_ptr<detail::CancellationState> state_;
        uint64_t id_ = 0;
    };

    [[nodiscard]] Registration OnCancel(std::function<void()> callback) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

// ---------------------------------------------------------------------------
// CancellationSource: write side. Cancel() is idempotent and thread-safe.
// ---------------------------------------------------------------------------
class CancellationSource {
public:
    CancellationSource();

    [[nodiscard]] CancellationToken Token() const;
    void Cancel();
    [[nodiscard]] bool IsCancelled() const noexcept;

private:
    std::shared_ptr<detail::CancellationState> state_;
};

} // namespace azlist
