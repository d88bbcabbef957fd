#include "cidboost/p2p/health_monitor.h"
#include "cidboost/base/cancel_token.h"
#include "cidboost/base/logger.h"
#include <fmt/chrono.h>
#include <atomic>
#include <mutex>
#include <set>
#include <unordered_map>

namespace cidboost {

namespace {

using Clock = std::chrono::steady_clock;

} // anonymous namespace

nlohmann::json HealthStatus::to_json() const {
    nlohmann::json j;
    j["running"] = running;
    if (last_maintenance) {
        j["last_maintenance"] = fmt::format("{:%Y-%m-%dT%H:%M:%SZ}",
            fmt::gmtime(std::chrono::system_clock::to_time_t(*last_maintenance)));
    } else {
        j["last_maintenance"] = nullptr;
    }
    j["failure_counts"] = failure_counts;
    j["maintenance_runs"] = maintenance_runs;
    j["repairs"] = repairs;
    j["peers_disconnected"] = peers_disconnected;
    return j;
}

struct HealthMonitor::Impl {
    HealthConfig config;
    std::shared_ptr<ContentNetwork> network;
    std::shared_ptr<DownloadBooster> booster;
    std::shared_ptr<elio::runtime::scheduler> scheduler;

    mutable std::mutex mutex;
    std::unordered_map<std::string, uint32_t> failures;
    std::set<std::string> repairing;
    std::optional<std::chrono::system_clock::time_point> last_maintenance;
    std::optional<CancelSource> loop_cancel;
    std::atomic<bool> running{false};
    std::atomic<bool> maintaining{false};

    std::atomic<uint64_t> maintenance_runs{0};
    std::atomic<uint64_t> repairs{0};
    std::atomic<uint64_t> peers_disconnected{0};

    void launch(elio::coro::task<void> task) {
        if (!scheduler) {
            Logger::instance().warning("Health monitor has no scheduler, background work skipped");
            return;
        }
        scheduler->spawn(task.release());
    }

    static elio::coro::task<void> maintenance(std::shared_ptr<Impl> self);
    static elio::coro::task<void> maintenance_loop(std::shared_ptr<Impl> self, CancelToken token);
    static elio::coro::task<void> repair(std::shared_ptr<Impl> self, std::string cid,
                                         std::vector<PeerInfo> providers);
    static elio::coro::task<bool> validate_provider(std::shared_ptr<Impl> self,
                                                    const PeerInfo& peer,
                                                    const std::vector<SwarmPeer>& swarm);
};

elio::coro::task<void> HealthMonitor::Impl::maintenance(std::shared_ptr<Impl> self) {
    auto& log = Logger::instance();
    if (self->maintaining.exchange(true)) {
        log.debug("Maintenance already in progress");
        co_return;
    }
    log.info("Running connection maintenance");

    auto deadline = Clock::now() + std::chrono::seconds(self->config.maintenance_timeout_sec);
    const auto stale = std::chrono::milliseconds(self->config.stale_latency_ms);
    size_t dropped = 0;

    auto peers = co_await self->network->swarm_peers();
    if (!peers) {
        log.warning("Maintenance could not list swarm peers");
    } else {
        for (const auto& peer : *peers) {
            if (Clock::now() >= deadline) {
                log.warning("Maintenance timed out after dropping {} peers", dropped);
                break;
            }
            if (peer.latency && *peer.latency > std::chrono::milliseconds(0) &&
                *peer.latency <= stale) {
                continue;
            }
            auto ec = co_await self->network->disconnect(peer.id);
            if (ec) {
                log.debug("Failed to disconnect {}: {}", peer.id, ec.message());
                continue;
            }
            ++dropped;
        }
    }

    self->booster->clear_cache();
    {
        std::lock_guard<std::mutex> lock(self->mutex);
        self->failures.clear();
        self->last_maintenance = std::chrono::system_clock::now();
    }
    self->peers_disconnected.fetch_add(dropped);
    self->maintenance_runs.fetch_add(1);
    self->maintaining.store(false);
    log.info("Maintenance done: {} stale peers disconnected, provider cache cleared", dropped);
}

elio::coro::task<void> HealthMonitor::Impl::maintenance_loop(std::shared_ptr<Impl> self,
                                                             CancelToken token) {
    const auto interval = std::chrono::seconds(self->config.maintenance_interval_sec);
    while (!token.cancelled()) {
        bool slept = co_await sleep_unless_cancelled(
            std::chrono::duration_cast<std::chrono::milliseconds>(interval), token);
        if (!slept) break;
        co_await maintenance(self);
    }
    Logger::instance().debug("Maintenance loop stopped");
}

elio::coro::task<bool> HealthMonitor::Impl::validate_provider(std::shared_ptr<Impl> self,
                                                              const PeerInfo& peer,
                                                              const std::vector<SwarmPeer>& swarm) {
    const auto healthy = std::chrono::milliseconds(self->config.healthy_latency_ms);
    for (const auto& connected : swarm) {
        if (connected.id != peer.id) continue;
        if (connected.latency && *connected.latency > std::chrono::milliseconds(0) &&
            *connected.latency < healthy) {
            co_return true;
        }
        break;
    }
    co_return co_await self->network->ping(peer.id,
        std::chrono::milliseconds(self->config.liveness_timeout_ms));
}

elio::coro::task<void> HealthMonitor::Impl::repair(std::shared_ptr<Impl> self, std::string cid,
                                                   std::vector<PeerInfo> providers) {
    auto& log = Logger::instance();
    log.info("Repairing connections for {} ({} cached providers)", cid, providers.size());

    auto deadline = Clock::now() + std::chrono::seconds(self->config.repair_timeout_sec);
    auto swarm = co_await self->network->swarm_peers();
    std::vector<SwarmPeer> connected = swarm ? std::move(*swarm) : std::vector<SwarmPeer>{};

    size_t dropped = 0;
    for (const auto& peer : providers) {
        if (Clock::now() >= deadline) {
            log.warning("Repair of {} timed out", cid);
            break;
        }
        bool ok = co_await validate_provider(self, peer, connected);
        if (ok) continue;

        log.debug("Provider {} of {} failed validation", peer.id, cid);
        auto ec = co_await self->network->disconnect(peer.id);
        if (ec) {
            log.debug("Failed to disconnect {}: {}", peer.id, ec.message());
        } else {
            ++dropped;
        }
    }

    {
        std::lock_guard<std::mutex> lock(self->mutex);
        self->repairing.erase(cid);
    }
    self->peers_disconnected.fetch_add(dropped);
    self->repairs.fetch_add(1);
    log.info("Repair of {} done, {} providers disconnected", cid, dropped);
}

HealthMonitor::HealthMonitor(const HealthConfig& config,
                             std::shared_ptr<ContentNetwork> network,
                             std::shared_ptr<DownloadBooster> booster)
    : impl_(std::make_shared<Impl>()) {
    impl_->config = config;
    impl_->network = std::move(network);
    impl_->booster = std::move(booster);
}

HealthMonitor::~HealthMonitor() {
    stop();
}

void HealthMonitor::set_scheduler(std::shared_ptr<elio::runtime::scheduler> scheduler) {
    impl_->scheduler = std::move(scheduler);
}

bool HealthMonitor::start() {
    if (impl_->running.exchange(true)) {
        return true;
    }
    if (!impl_->scheduler) {
        Logger::instance().error("Health monitor needs a scheduler to run");
        impl_->running.store(false);
        return false;
    }

    CancelToken token;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->loop_cancel.emplace();
        token = impl_->loop_cancel->token();
    }
    impl_->launch(Impl::maintenance_loop(impl_, token));
    Logger::instance().info("Health monitor started, maintenance every {}s",
                            impl_->config.maintenance_interval_sec);
    return true;
}

void HealthMonitor::stop() {
    if (!impl_->running.exchange(false)) {
        return;
    }
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->loop_cancel) {
        impl_->loop_cancel->cancel();
        impl_->loop_cancel.reset();
    }
    Logger::instance().info("Health monitor stopped");
}

bool HealthMonitor::is_running() const {
    return impl_->running.load();
}

void HealthMonitor::on_download_timeout(const std::string& cid) {
    std::vector<PeerInfo> providers;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        uint32_t count = ++impl_->failures[cid];
        Logger::instance().warning("Download of {} failed ({} consecutive)", cid, count);
        if (count < impl_->config.failure_threshold) {
            return;
        }
        impl_->failures.erase(cid);
        if (!impl_->repairing.insert(cid).second) {
            Logger::instance().debug("Repair of {} already running", cid);
            // The cache still goes so the next warmup rediscovers
            impl_->booster->clear_cache_for_cid(cid);
            return;
        }
        // Capture before clearing; the repair needs the providers that failed
        providers = impl_->booster->get_cached_providers(cid);
        impl_->booster->clear_cache_for_cid(cid);
    }
    Logger::instance().info("Provider cache for {} invalidated after repeated failures", cid);
    impl_->launch(Impl::repair(impl_, cid, std::move(providers)));
}

void HealthMonitor::on_download_success(const std::string& cid) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->failures.erase(cid);
}

void HealthMonitor::force_refresh() {
    impl_->launch(Impl::maintenance(impl_));
}

elio::coro::task<void> HealthMonitor::run_maintenance() {
    co_await Impl::maintenance(impl_);
}

uint32_t HealthMonitor::failure_count(const std::string& cid) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->failures.find(cid);
    return it == impl_->failures.end() ? 0 : it->second;
}

HealthStatus HealthMonitor::get_status() const {
    HealthStatus status;
    status.running = impl_->running.load();
    status.maintenance_runs = impl_->maintenance_runs.load();
    status.repairs = impl_->repairs.load();
    status.peers_disconnected = impl_->peers_disconnected.load();
    std::lock_guard<std::mutex> lock(impl_->mutex);
    status.last_maintenance = impl_->last_maintenance;
    status.failure_counts.insert(impl_->failures.begin(), impl_->failures.end());
    return status;
}

} // namespace cidboost
