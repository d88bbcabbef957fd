#ifndef CIDBOOST_BASE_CANCEL_TOKEN_H
#define CIDBOOST_BASE_CANCEL_TOKEN_H

#include <elio/elio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace cidboost {

namespace detail {
struct CancelState;
}

// Observer side of a cancellation signal. A default-constructed token is never
// cancelled. Tokens are cheap to copy and safe to use from any thread.
class CancelToken {
public:
    CancelToken() = default;

    bool cancelled() const;
    bool can_be_cancelled() const { return state_ != nullptr; }

    // Registers fn to run once on cancellation. Runs inline when the token is
    // already cancelled. Returns an id for remove_callback, 0 if fn never runs.
    uint64_t on_cancel(std::function<void()> fn) const;
    void remove_callback(uint64_t id) const;

private:
    friend class CancelSource;
    explicit CancelToken(std::shared_ptr<detail::CancelState> state) : state_(std::move(state)) {}

    std::shared_ptr<detail::CancelState> state_;
};

// Owner side. A source constructed from a parent token is cancelled together with it.
class CancelSource {
public:
    CancelSource();
    explicit CancelSource(const CancelToken& parent);
    ~CancelSource();

    CancelSource(const CancelSource&) = delete;
    CancelSource& operator=(const CancelSource&) = delete;
    CancelSource(CancelSource&& other) noexcept;
    CancelSource& operator=(CancelSource&& other) noexcept;

    CancelToken token() const { return CancelToken(state_); }
    void cancel();
    bool cancelled() const;

private:
    void unlink();

    std::shared_ptr<detail::CancelState> state_;
    CancelToken parent_;
    uint64_t parent_link_ = 0;
};

// Runs fn on cancellation of token while the object lives
class CancelCallback {
public:
    CancelCallback(CancelToken token, std::function<void()> fn)
        : token_(std::move(token)), id_(token_.on_cancel(std::move(fn))) {}
    ~CancelCallback() { token_.remove_callback(id_); }

    CancelCallback(const CancelCallback&) = delete;
    CancelCallback& operator=(const CancelCallback&) = delete;

private:
    CancelToken token_;
    uint64_t id_;
};

// Suspends the calling coroutine for duration. Returns false when the token was
// cancelled before the duration elapsed.
elio::coro::task<bool> sleep_unless_cancelled(std::chrono::milliseconds duration,
                                              CancelToken token);

} // namespace cidboost

#endif // CIDBOOST_BASE_CANCEL_TOKEN_H
