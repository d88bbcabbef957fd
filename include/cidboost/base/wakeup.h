#ifndef CIDBOOST_BASE_WAKEUP_H
#define CIDBOOST_BASE_WAKEUP_H

#include <elio/elio.hpp>
#include <elio/sync/primitives.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace cidboost {

// Wakes the one coroutine waiting on it. A notification that arrives while
// nobody waits is kept for the next wait(), so a waiter that re-checks its
// condition after every wake-up never misses one. Wake-ups may be spurious.
// notify() is safe from any thread.
class Wakeup : public std::enable_shared_from_this<Wakeup> {
public:
    void notify();

    // Suspends until the next notification
    elio::coro::task<void> wait();

    // Arranges a notify() at deadline. Call from a coroutine.
    void notify_at(std::chrono::steady_clock::time_point deadline);

private:
    static elio::coro::task<void> fire_at(std::weak_ptr<Wakeup> target,
                                          std::chrono::steady_clock::time_point deadline);

    std::atomic<uint64_t> pending_{0};
    elio::sync::event event_;
};

} // namespace cidboost

#endif // CIDBOOST_BASE_WAKEUP_H
