#include "cidboost/p2p/connection_policy.h"
#include "cidboost/base/cancel_token.h"
#include "cidboost/base/error_code.h"
#include "cidboost/base/logger.h"
#include <elio/sync/primitives.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <map>
#include <mutex>
#include <unordered_map>

namespace cidboost {

namespace {

using Clock = std::chrono::steady_clock;

struct Setting {
    const char* key;
    std::string value;  // JSON text
};

} // anonymous namespace

struct ConnectionPolicyManager::Impl {
    ConnectionPolicyConfig config;
    std::shared_ptr<ConnectionConfigurator> configurator;
    std::shared_ptr<ContentNetwork> network;
    CancelSource shutdown;

    // Serialises boost and restore sequences across suspension points
    elio::sync::mutex op_mutex;

    mutable std::mutex mutex;
    std::unordered_map<std::string, Clock::time_point> active;
    std::map<std::string, std::string> originals;
    bool boosted = false;

    class OpGuard {
    public:
        explicit OpGuard(Impl& impl) : impl_(impl) {}
        ~OpGuard() { impl_.op_mutex.unlock(); }
        OpGuard(const OpGuard&) = delete;
        OpGuard& operator=(const OpGuard&) = delete;
    private:
        Impl& impl_;
    };

    elio::coro::task<void> acquire() {
        co_await op_mutex.lock();
    }

    std::vector<Setting> boost_settings() const {
        return {
            {kConnMgrHighWater, nlohmann::json(config.boost_high_water).dump()},
            {kConnMgrLowWater, nlohmann::json(config.boost_low_water).dump()},
            {kConnMgrGracePeriod, nlohmann::json(config.boost_grace_period).dump()},
        };
    }

    std::vector<Setting> restore_settings() const {
        std::vector<Setting> settings = {
            {kConnMgrHighWater, nlohmann::json(config.default_high_water).dump()},
            {kConnMgrLowWater, nlohmann::json(config.default_low_water).dump()},
            {kConnMgrGracePeriod, nlohmann::json(config.default_grace_period).dump()},
        };
        std::lock_guard<std::mutex> lock(mutex);
        for (auto& s : settings) {
            auto it = originals.find(s.key);
            if (it != originals.end()) {
                s.value = it->second;
            }
        }
        return settings;
    }

    elio::coro::task<void> save_originals() {
        for (const char* key : {kConnMgrHighWater, kConnMgrLowWater, kConnMgrGracePeriod}) {
            auto value = co_await configurator->get_config(key);
            if (!value) {
                Logger::instance().warning("Could not read {}, defaults will be restored", key);
                continue;
            }
            std::lock_guard<std::mutex> lock(mutex);
            originals[key] = *value;
        }
    }

    elio::coro::task<std::error_code> apply(const std::vector<Setting>& settings) {
        std::error_code first_error;
        for (const auto& s : settings) {
            auto ec = co_await configurator->set_config(s.key, s.value);
            if (ec) {
                Logger::instance().warning("Failed to set {} = {}: {}", s.key, s.value, ec.message());
                if (!first_error) first_error = ec;
            } else {
                Logger::instance().debug("Updated node config: {} = {}", s.key, s.value);
            }
        }
        co_return first_error;
    }

    // Caller holds the operation guard
    elio::coro::task<std::error_code> restore_locked() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!boosted) {
                co_return std::error_code{};
            }
        }
        Logger::instance().info("Restoring original connection limits");
        auto ec = co_await apply(restore_settings());
        std::lock_guard<std::mutex> lock(mutex);
        boosted = false;
        originals.clear();
        co_return ec;
    }

    elio::coro::task<void> expire_and_restore() {
        co_await acquire();
        OpGuard guard(*this);
        size_t remaining = 0;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto now = Clock::now();
            auto max_age = std::chrono::seconds(config.auto_restore_sec);
            for (auto it = active.begin(); it != active.end();) {
                if (now - it->second > max_age) {
                    Logger::instance().debug("Dropping stale download {} from connection policy", it->first);
                    it = active.erase(it);
                } else {
                    ++it;
                }
            }
            remaining = active.size();
        }
        if (remaining > 0) {
            Logger::instance().info("Auto-restore deferred: {} downloads still active", remaining);
            co_return;
        }
        auto ec = co_await restore_locked();
        if (ec) {
            Logger::instance().warning("Auto-restore failed: {}", ec.message());
        }
    }

    static elio::coro::task<void> auto_restore_after(std::shared_ptr<Impl> self) {
        auto delay = std::chrono::seconds(self->config.auto_restore_sec);
        if (!co_await sleep_unless_cancelled(delay, self->shutdown.token())) {
            co_return;
        }
        co_await self->expire_and_restore();
    }
};

ConnectionPolicyManager::ConnectionPolicyManager(const ConnectionPolicyConfig& config,
                                                 std::shared_ptr<ConnectionConfigurator> configurator,
                                                 std::shared_ptr<ContentNetwork> network)
    : impl_(std::make_shared<Impl>()) {
    impl_->config = config;
    impl_->configurator = std::move(configurator);
    impl_->network = std::move(network);
}

ConnectionPolicyManager::~ConnectionPolicyManager() {
    impl_->shutdown.cancel();
}

elio::coro::task<std::error_code> ConnectionPolicyManager::boost_for_download(const std::string& cid) {
    auto self = impl_;
    std::string key = cid;
    co_await self->acquire();
    Impl::OpGuard guard(*self);

    {
        std::lock_guard<std::mutex> lock(self->mutex);
        self->active[key] = Clock::now();
        if (self->boosted) {
            Logger::instance().debug("Already boosted, tracking CID: {}", key);
            co_return std::error_code{};
        }
    }

    Logger::instance().info("Boosting connection limits for download: {}", key);
    co_await self->save_originals();

    auto ec = co_await self->apply(self->boost_settings());
    if (ec) {
        // Put back whatever part of the boost landed
        auto rollback = co_await self->apply(self->restore_settings());
        if (rollback) {
            Logger::instance().warning("Rolling back partial boost failed: {}", rollback.message());
        }
        std::lock_guard<std::mutex> lock(self->mutex);
        self->originals.clear();
        co_return ec;
    }

    {
        std::lock_guard<std::mutex> lock(self->mutex);
        self->boosted = true;
    }
    (void)Impl::auto_restore_after(self).spawn();
    co_return std::error_code{};
}

elio::coro::task<std::error_code> ConnectionPolicyManager::restore_defaults(const std::string& cid) {
    auto self = impl_;
    std::string key = cid;
    co_await self->acquire();
    Impl::OpGuard guard(*self);

    {
        std::lock_guard<std::mutex> lock(self->mutex);
        self->active.erase(key);
        if (!self->active.empty()) {
            Logger::instance().debug("Still have {} active downloads, keeping boost", self->active.size());
            co_return std::error_code{};
        }
    }
    co_return co_await self->restore_locked();
}

elio::coro::task<void> ConnectionPolicyManager::auto_restore() {
    auto self = impl_;
    co_await self->expire_and_restore();
}

elio::coro::task<std::error_code> ConnectionPolicyManager::protect_peers(const std::vector<std::string>& peer_ids) {
    auto self = impl_;
    std::vector<std::string> wanted = peer_ids;
    if (!self->network) {
        co_return make_error_code(ErrorCode::InvalidState);
    }
    auto peers = co_await self->network->swarm_peers();
    if (!peers) {
        co_return make_error_code(ErrorCode::NetworkError);
    }

    std::error_code last_error;
    for (const auto& id : wanted) {
        auto it = std::find_if(peers->begin(), peers->end(),
                               [&](const SwarmPeer& p) { return p.id == id; });
        if (it == peers->end()) {
            Logger::instance().debug("Peer not connected, not protecting: {}", id);
            last_error = make_error_code(ErrorCode::NotFound);
            continue;
        }
        auto ec = co_await self->network->peering_add(it->address + "/p2p/" + id);
        if (ec) {
            Logger::instance().warning("Failed to protect peer {}: {}", id, ec.message());
            last_error = ec;
        } else {
            Logger::instance().debug("Protected peer: {}", id);
        }
    }
    co_return last_error;
}

size_t ConnectionPolicyManager::active_downloads() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->active.size();
}

bool ConnectionPolicyManager::is_boosted() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->boosted;
}

} // namespace cidboost
