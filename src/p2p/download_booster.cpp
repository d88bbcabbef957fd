#include "cidboost/p2p/download_booster.h"
#include "cidboost/base/error_code.h"
#include "cidboost/base/logger.h"
#include "cidboost/base/wakeup.h"
#include <algorithm>
#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <unordered_map>

namespace cidboost {

namespace {

using Clock = std::chrono::steady_clock;

constexpr size_t kPrefetchReadSize = 64 * 1024;

// Connection fan-out of one discovery round
struct DiscoveryRound {
    std::mutex mutex;
    std::deque<PeerInfo> pending;
    uint32_t active = 0;
    std::atomic<uint32_t> connected{0};
    std::shared_ptr<Wakeup> wakeup;  // notified on every established connection
};

// One shared discovery per CID
struct Flight {
    CancelSource cancel;
    uint32_t waiters = 0;  // guarded by Impl::flights_mutex

    std::mutex mutex;
    bool done = false;
    WarmupResult result;
    std::vector<std::shared_ptr<Wakeup>> watchers;

    bool finished() {
        std::lock_guard<std::mutex> lock(mutex);
        return done;
    }
};

std::chrono::milliseconds ms_since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

std::function<void()> notifier(const std::shared_ptr<Wakeup>& wakeup) {
    std::weak_ptr<Wakeup> weak = wakeup;
    return [weak]() {
        if (auto w = weak.lock()) w->notify();
    };
}

WarmupResult cancelled_result() {
    WarmupResult result;
    result.error = make_error_code(ErrorCode::Cancelled);
    return result;
}

} // anonymous namespace

struct DownloadBooster::Impl {
    BoosterConfig config;
    std::shared_ptr<ContentNetwork> network;
    std::shared_ptr<ProviderCache> cache;
    std::shared_ptr<ConnectionQualityMap> quality;

    std::mutex flights_mutex;
    std::unordered_map<std::string, std::shared_ptr<Flight>> flights;

    std::atomic<uint64_t> warmups{0};
    std::atomic<uint64_t> cache_hits{0};
    std::atomic<uint64_t> negative_cache_hits{0};
    std::atomic<uint64_t> discoveries{0};
    std::atomic<uint64_t> providers_found{0};
    std::atomic<uint64_t> connections_made{0};
    std::atomic<uint64_t> connection_failures{0};
    std::atomic<uint64_t> prefetches_completed{0};

    bool live(const ProviderCacheEntry& entry) const {
        auto age = Clock::now() - entry.cached_at;
        if (entry.negative()) {
            return age < std::chrono::milliseconds(config.negative_cache_ttl_ms);
        }
        return age < std::chrono::seconds(config.positive_cache_ttl_sec);
    }

    // Leaves the flight; the last waiter to give up stops the discovery
    void leave_flight(const std::string& cid, const std::shared_ptr<Flight>& flight, bool abandon) {
        std::lock_guard<std::mutex> lock(flights_mutex);
        if (--flight->waiters == 0 && abandon && !flight->finished()) {
            flight->cancel.cancel();
            auto it = flights.find(cid);
            if (it != flights.end() && it->second == flight) {
                flights.erase(it);
            }
        }
    }

    static void schedule_connect(const std::shared_ptr<Impl>& self,
                                 const std::shared_ptr<DiscoveryRound>& round,
                                 const PeerInfo& peer) {
        {
            std::lock_guard<std::mutex> lock(round->mutex);
            if (round->active >= self->config.max_parallel_connects) {
                round->pending.push_back(peer);
                return;
            }
            ++round->active;
        }
        (void)connect_worker(self, round, peer).spawn();
    }

    // Drains the round's pending queue one connection at a time
    static elio::coro::task<void> connect_worker(std::shared_ptr<Impl> self,
                                                 std::shared_ptr<DiscoveryRound> round,
                                                 PeerInfo first) {
        std::optional<PeerInfo> next = std::move(first);
        while (next) {
            co_await connect_provider(self, round, *next);
            std::lock_guard<std::mutex> lock(round->mutex);
            if (round->pending.empty()) {
                --round->active;
                next.reset();
            } else {
                next = std::move(round->pending.front());
                round->pending.pop_front();
            }
        }
    }

    static elio::coro::task<void> connect_provider(std::shared_ptr<Impl> self,
                                                   std::shared_ptr<DiscoveryRound> round,
                                                   PeerInfo peer) {
        std::string addr = peer.dial_address();
        auto start = Clock::now();
        std::error_code ec;
        try {
            ec = co_await self->network->connect(addr, std::chrono::milliseconds(self->config.connect_timeout_ms));
        } catch (const std::exception& e) {
            Logger::instance().debug("Connect to {} threw: {}", peer.id, e.what());
            ec = make_error_code(ErrorCode::ConnectionFailed);
        }
        if (ec) {
            self->connection_failures++;
            Logger::instance().debug("Failed to connect to provider {}: {}", peer.id, ec.message());
            co_return;
        }

        auto latency = ms_since(start);
        self->quality->store(peer.id, latency);
        self->connections_made++;
        round->connected++;
        if (round->wakeup) round->wakeup->notify();
        Logger::instance().info("Connected to provider {} (latency: {}ms)", peer.id, latency.count());

        if (self->config.add_to_peering) {
            auto peering_ec = co_await self->network->peering_add(addr);
            if (peering_ec) {
                Logger::instance().debug("Adding {} to peering failed: {}", peer.id, peering_ec.message());
            }
        }
    }

    static elio::coro::task<void> prefetch_first_block(std::shared_ptr<Impl> self,
                                                       std::string cid,
                                                       std::shared_ptr<std::atomic<bool>> done,
                                                       std::shared_ptr<Wakeup> wakeup) {
        auto start = Clock::now();
        auto limit = std::chrono::seconds(self->config.prefetch_timeout_sec);
        size_t total = 0;
        try {
            auto stream = co_await self->network->get_file(cid);
            std::vector<uint8_t> buffer(kPrefetchReadSize);
            while (total < self->config.prefetch_bytes) {
                if (Clock::now() - start > limit) {
                    Logger::instance().debug("Prefetch for {} hit its time limit", cid);
                    break;
                }
                size_t want = std::min(buffer.size(), self->config.prefetch_bytes - total);
                size_t n = co_await stream->read(buffer.data(), want);
                if (n == 0) break;
                total += n;
            }
            self->prefetches_completed++;
            Logger::instance().debug("Prefetched {} bytes for {} in {}ms", total, cid, ms_since(start).count());
        } catch (const std::exception& e) {
            Logger::instance().debug("Prefetch failed for {} (download will retry): {}", cid, e.what());
        }
        done->store(true);
        wakeup->notify();
    }

    static elio::coro::task<WarmupResult> discover(std::shared_ptr<Impl> self,
                                                   std::string cid,
                                                   CancelToken token) {
        const auto& config = self->config;
        self->discoveries++;
        Logger::instance().info("Starting provider discovery for CID: {}", cid);

        auto timeout = std::chrono::milliseconds(config.discovery_timeout_ms);
        auto deadline = Clock::now() + timeout;
        auto stream = co_await self->network->find_providers(cid, timeout);
        auto round = std::make_shared<DiscoveryRound>();
        std::vector<PeerInfo> found;

        // Stream pushes, connections, cancellation and deadlines all land here
        auto wake = std::make_shared<Wakeup>();
        round->wakeup = wake;
        stream->watch(wake);
        CancelCallback on_cancel(token, notifier(wake));
        wake->notify_at(deadline);

        auto connected_enough = [&]() {
            return round->connected.load() >= config.max_connected_for_early_exit;
        };

        while (true) {
            std::optional<PeerInfo> peer;
            while (!token.cancelled() && !connected_enough()) {
                peer = stream->try_pop();
                if (peer || stream->exhausted() || Clock::now() >= deadline) break;
                co_await wake->wait();
            }

            if (token.cancelled()) break;
            if (connected_enough()) {
                Logger::instance().info("Early exit: connected to provider for {}", cid);
                break;
            }
            if (!peer) {
                if (!stream->exhausted()) {
                    Logger::instance().info("Provider discovery timeout for {}, found {} providers",
                                            cid, found.size());
                }
                break;
            }

            found.push_back(*peer);
            self->providers_found++;
            Logger::instance().debug("Found provider {} for {}: {}", found.size(), cid, peer->id);
            schedule_connect(self, round, *peer);

            if (found.size() >= config.min_providers_for_early_exit) {
                // Short window for one of the attempts to land
                auto grace_end = std::min(deadline, Clock::now() + std::chrono::milliseconds(config.early_exit_grace_ms));
                wake->notify_at(grace_end);
                while (!token.cancelled() && !connected_enough() && Clock::now() < grace_end) {
                    co_await wake->wait();
                }
            }
        }
        stream->close();

        if (token.cancelled()) {
            Logger::instance().debug("Provider discovery for {} abandoned", cid);
            co_return cancelled_result();
        }

        WarmupResult result;
        result.providers = found.size();
        result.connected = round->connected.load();
        self->cache->store(cid, ProviderCacheEntry{found, Clock::now()});

        if (found.empty()) {
            Logger::instance().warning("No providers found for CID: {}", cid);
            result.error = make_error_code(ErrorCode::ProviderNotFound);
            co_return result;
        }

        auto prefetched = std::make_shared<std::atomic<bool>>(false);
        (void)prefetch_first_block(self, cid, prefetched, wake).spawn();
        auto wait_end = Clock::now() + std::chrono::milliseconds(config.prefetch_wait_ms);
        wake->notify_at(wait_end);
        while (!prefetched->load() && !token.cancelled() && Clock::now() < wait_end) {
            co_await wake->wait();
        }
        if (!prefetched->load()) {
            Logger::instance().debug("Prefetch for {} still running, continuing with download", cid);
        }

        Logger::instance().info("Warmup complete for CID {}: {} providers discovered, {} connected",
                                cid, result.providers, result.connected);
        co_return result;
    }

    static elio::coro::task<void> run_flight(std::shared_ptr<Impl> self,
                                             std::string cid,
                                             std::shared_ptr<Flight> flight) {
        auto token = flight->cancel.token();
        WarmupResult result;
        try {
            result = co_await discover(self, cid, token);
        } catch (const std::exception& e) {
            Logger::instance().warning("Provider discovery failed for CID {}: {}", cid, e.what());
            if (!token.cancelled()) {
                self->cache->store(cid, ProviderCacheEntry{{}, Clock::now()});
            }
            result = WarmupResult{};
            result.error = make_error_code(token.cancelled() ? ErrorCode::Cancelled : ErrorCode::ProviderNotFound);
        }

        {
            std::lock_guard<std::mutex> lock(self->flights_mutex);
            auto it = self->flights.find(cid);
            if (it != self->flights.end() && it->second == flight) {
                self->flights.erase(it);
            }
        }
        std::vector<std::shared_ptr<Wakeup>> watchers;
        {
            std::lock_guard<std::mutex> lock(flight->mutex);
            flight->result = result;
            flight->done = true;
            watchers.swap(flight->watchers);
        }
        for (auto& watcher : watchers) {
            watcher->notify();
        }
    }
};

DownloadBooster::DownloadBooster(const BoosterConfig& config,
                                 std::shared_ptr<ContentNetwork> network,
                                 std::shared_ptr<ProviderCache> cache,
                                 std::shared_ptr<ConnectionQualityMap> quality)
    : impl_(std::make_shared<Impl>()) {
    impl_->config = config;
    impl_->network = std::move(network);
    impl_->cache = cache ? std::move(cache) : std::make_shared<ProviderCache>();
    impl_->quality = quality ? std::move(quality) : std::make_shared<ConnectionQualityMap>();
}

DownloadBooster::~DownloadBooster() = default;

elio::coro::task<WarmupResult> DownloadBooster::warmup_cid(const std::string& cid, CancelToken token) {
    auto self = impl_;
    std::string key = cid;
    self->warmups++;

    if (auto entry = self->cache->load(key)) {
        if (self->live(*entry)) {
            WarmupResult result;
            result.from_cache = true;
            if (entry->negative()) {
                self->negative_cache_hits++;
                Logger::instance().debug("Negative cache hit for CID {}, skipping discovery", key);
                result.error = make_error_code(ErrorCode::ProviderNotFound);
            } else {
                self->cache_hits++;
                result.providers = entry->providers.size();
                Logger::instance().debug("Using {} cached providers for CID {}", result.providers, key);
            }
            co_return result;
        }
    }

    if (token.cancelled()) {
        co_return cancelled_result();
    }

    std::shared_ptr<Flight> flight;
    bool leader = false;
    {
        std::lock_guard<std::mutex> lock(self->flights_mutex);
        auto it = self->flights.find(key);
        if (it != self->flights.end()) {
            flight = it->second;
        } else {
            flight = std::make_shared<Flight>();
            self->flights[key] = flight;
            leader = true;
        }
        ++flight->waiters;
    }
    if (leader) {
        (void)Impl::run_flight(self, key, flight).spawn();
    } else {
        Logger::instance().debug("Joining in-flight discovery for CID {}", key);
    }

    auto wake = std::make_shared<Wakeup>();
    {
        std::lock_guard<std::mutex> lock(flight->mutex);
        if (!flight->done) flight->watchers.push_back(wake);
    }
    CancelCallback on_cancel(token, notifier(wake));

    std::optional<WarmupResult> result;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(flight->mutex);
            if (flight->done) result = flight->result;
        }
        if (result || token.cancelled()) break;
        co_await wake->wait();
    }

    if (!result) {
        self->leave_flight(key, flight, true);
        co_return cancelled_result();
    }
    self->leave_flight(key, flight, false);
    co_return *result;
}

std::vector<PeerInfo> DownloadBooster::get_cached_providers(const std::string& cid) const {
    auto entry = impl_->cache->load(cid);
    if (!entry || entry->negative() || !impl_->live(*entry)) {
        return {};
    }
    return entry->providers;
}

bool DownloadBooster::has_cached_providers(const std::string& cid) const {
    auto entry = impl_->cache->load(cid);
    return entry && !entry->negative() && impl_->live(*entry);
}

std::optional<std::chrono::milliseconds> DownloadBooster::get_connection_quality(const std::string& peer_id) const {
    if (auto latency = impl_->quality->load(peer_id)) {
        return *latency;
    }
    return std::nullopt;
}

void DownloadBooster::clear_cache() {
    impl_->cache->clear();
    Logger::instance().info("Provider cache cleared");
}

void DownloadBooster::clear_cache_for_cid(const std::string& cid) {
    impl_->cache->erase(cid);
    Logger::instance().info("Provider cache cleared for CID: {}", cid);
}

void DownloadBooster::clear_negative_cache_for_cid(const std::string& cid) {
    if (impl_->cache->erase_if(cid, [](const ProviderCacheEntry& e) { return e.negative(); })) {
        Logger::instance().info("Negative provider cache cleared for CID: {}", cid);
    }
}

void DownloadBooster::manually_add_provider(const std::string& cid, const PeerInfo& peer) {
    bool added = false;
    impl_->cache->update(cid, [&](const ProviderCacheEntry* current) {
        ProviderCacheEntry entry;
        if (current && !current->negative()) {
            entry = *current;
        } else {
            entry.cached_at = Clock::now();
        }
        auto dup = std::find_if(entry.providers.begin(), entry.providers.end(),
                                [&](const PeerInfo& p) { return p.id == peer.id; });
        if (dup == entry.providers.end()) {
            entry.providers.push_back(peer);
            entry.cached_at = Clock::now();
            added = true;
        }
        return entry;
    });
    if (added) {
        Logger::instance().info("Manually added provider {} for CID {}", peer.id, cid);
    }
}

BoosterStats DownloadBooster::get_stats() const {
    BoosterStats stats;
    stats.warmups = impl_->warmups.load();
    stats.cache_hits = impl_->cache_hits.load();
    stats.negative_cache_hits = impl_->negative_cache_hits.load();
    stats.discoveries = impl_->discoveries.load();
    stats.providers_found = impl_->providers_found.load();
    stats.connections_made = impl_->connections_made.load();
    stats.connection_failures = impl_->connection_failures.load();
    stats.prefetches_completed = impl_->prefetches_completed.load();
    return stats;
}

std::shared_ptr<ProviderCache> DownloadBooster::provider_cache() const {
    return impl_->cache;
}

std::shared_ptr<ConnectionQualityMap> DownloadBooster::connection_quality() const {
    return impl_->quality;
}

} // namespace cidboost
