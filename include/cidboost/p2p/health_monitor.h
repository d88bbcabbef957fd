#ifndef CIDBOOST_P2P_HEALTH_MONITOR_H
#define CIDBOOST_P2P_HEALTH_MONITOR_H

#include "cidboost/base/config.h"
#include "cidboost/net/content_network.h"
#include "cidboost/p2p/download_booster.h"
#include <elio/elio.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace cidboost {

struct HealthStatus {
    bool running = false;
    std::optional<std::chrono::system_clock::time_point> last_maintenance;
    std::map<std::string, uint32_t> failure_counts;
    uint64_t maintenance_runs = 0;
    uint64_t repairs = 0;
    uint64_t peers_disconnected = 0;

    nlohmann::json to_json() const;
};

// Keeps the node's connection set and the provider cache from going stale.
//
// A periodic maintenance pass drops slow or unmeasured peers and clears the
// provider cache. Repeated download timeouts for one CID invalidate that CID's
// cached providers and check them in the background. Nothing here throws; check
// failures are logged.
class HealthMonitor {
public:
    HealthMonitor(const HealthConfig& config,
                  std::shared_ptr<ContentNetwork> network,
                  std::shared_ptr<DownloadBooster> booster);
    ~HealthMonitor();

    // Background work (maintenance loop, repairs) runs here. Without a scheduler
    // only the synchronous part of failure handling happens.
    void set_scheduler(std::shared_ptr<elio::runtime::scheduler> scheduler);

    bool start();
    void stop();
    bool is_running() const;

    void on_download_timeout(const std::string& cid);
    void on_download_success(const std::string& cid);

    // Schedules a maintenance pass now
    void force_refresh();

    // One maintenance pass, awaited by the caller
    elio::coro::task<void> run_maintenance();

    uint32_t failure_count(const std::string& cid) const;
    HealthStatus get_status() const;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace cidboost

#endif // CIDBOOST_P2P_HEALTH_MONITOR_H
