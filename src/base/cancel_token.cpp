#include "cidboost/base/cancel_token.h"
#include "cidboost/base/wakeup.h"
#include <algorithm>
#include <mutex>
#include <utility>
#include <vector>

namespace cidboost {

namespace detail {

struct CancelState {
    std::mutex mutex;
    bool cancelled = false;
    uint64_t next_id = 1;
    std::vector<std::pair<uint64_t, std::function<void()>>> callbacks;

    void cancel() {
        std::vector<std::pair<uint64_t, std::function<void()>>> to_run;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (cancelled) return;
            cancelled = true;
            to_run.swap(callbacks);
        }
        for (auto& [id, fn] : to_run) {
            fn();
        }
    }
};

} // namespace detail

bool CancelToken::cancelled() const {
    if (!state_) return false;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

uint64_t CancelToken::on_cancel(std::function<void()> fn) const {
    if (!state_) return 0;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            uint64_t id = state_->next_id++;
            state_->callbacks.emplace_back(id, std::move(fn));
            return id;
        }
    }
    fn();
    return 0;
}

void CancelToken::remove_callback(uint64_t id) const {
    if (!state_ || id == 0) return;
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto& cbs = state_->callbacks;
    cbs.erase(std::remove_if(cbs.begin(), cbs.end(),
                             [id](const auto& entry) { return entry.first == id; }),
              cbs.end());
}

CancelSource::CancelSource() : state_(std::make_shared<detail::CancelState>()) {}

CancelSource::CancelSource(const CancelToken& parent)
    : state_(std::make_shared<detail::CancelState>()), parent_(parent) {
    std::weak_ptr<detail::CancelState> weak = state_;
    parent_link_ = parent_.on_cancel([weak]() {
        if (auto state = weak.lock()) {
            state->cancel();
        }
    });
}

CancelSource::~CancelSource() {
    unlink();
}

CancelSource::CancelSource(CancelSource&& other) noexcept
    : state_(std::move(other.state_)),
      parent_(std::move(other.parent_)),
      parent_link_(std::exchange(other.parent_link_, 0)) {}

CancelSource& CancelSource::operator=(CancelSource&& other) noexcept {
    if (this != &other) {
        unlink();
        state_ = std::move(other.state_);
        parent_ = std::move(other.parent_);
        parent_link_ = std::exchange(other.parent_link_, 0);
    }
    return *this;
}

void CancelSource::unlink() {
    if (parent_link_ != 0) {
        parent_.remove_callback(parent_link_);
        parent_link_ = 0;
    }
}

void CancelSource::cancel() {
    if (state_) state_->cancel();
}

bool CancelSource::cancelled() const {
    return token().cancelled();
}

elio::coro::task<bool> sleep_unless_cancelled(std::chrono::milliseconds duration,
                                              CancelToken token) {
    auto deadline = std::chrono::steady_clock::now() + duration;
    auto wakeup = std::make_shared<Wakeup>();
    std::weak_ptr<Wakeup> weak = wakeup;
    CancelCallback on_cancel(token, [weak]() {
        if (auto w = weak.lock()) w->notify();
    });
    wakeup->notify_at(deadline);

    while (!token.cancelled()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            co_return true;
        }
        co_await wakeup->wait();
    }
    co_return false;
}

} // namespace cidboost
