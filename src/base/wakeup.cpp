#include "cidboost/base/wakeup.h"

namespace cidboost {

void Wakeup::notify() {
    pending_.fetch_add(1);
    event_.set();
}

elio::coro::task<void> Wakeup::wait() {
    if (pending_.exchange(0) > 0) {
        co_return;
    }
    event_.reset();
    // A notify() between the reset and this check is seen here; one after it
    // sets the event again
    if (pending_.exchange(0) > 0) {
        co_return;
    }
    co_await event_.wait();
}

void Wakeup::notify_at(std::chrono::steady_clock::time_point deadline) {
    (void)fire_at(weak_from_this(), deadline).spawn();
}

elio::coro::task<void> Wakeup::fire_at(std::weak_ptr<Wakeup> target,
                                       std::chrono::steady_clock::time_point deadline) {
    auto now = std::chrono::steady_clock::now();
    if (deadline > now) {
        co_await elio::time::sleep_for(
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now) +
            std::chrono::milliseconds(1));
    }
    if (auto wakeup = target.lock()) {
        wakeup->notify();
    }
}

} // namespace cidboost
