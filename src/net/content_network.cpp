#include "cidboost/net/content_network.h"

namespace cidboost {

std::string PeerInfo::dial_address() const {
    if (addrs.empty()) {
        return "/p2p/" + id;
    }
    return addrs.front() + "/p2p/" + id;
}

void ProviderStream::push(PeerInfo peer) {
    std::shared_ptr<Wakeup> watcher;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        queue_.push_back(std::move(peer));
        watcher = watcher_;
    }
    if (watcher) watcher->notify();
}

void ProviderStream::close() {
    std::shared_ptr<Wakeup> watcher;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        watcher = watcher_;
    }
    if (watcher) watcher->notify();
}

void ProviderStream::watch(std::shared_ptr<Wakeup> wakeup) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        watcher_ = wakeup;
    }
    // Anything pushed earlier is already waiting
    if (wakeup) wakeup->notify();
}

std::optional<PeerInfo> ProviderStream::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    PeerInfo peer = std::move(queue_.front());
    queue_.pop_front();
    return peer;
}

bool ProviderStream::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool ProviderStream::exhausted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_ && queue_.empty();
}

} // namespace cidboost
