#ifndef CIDBOOST_P2P_CONNECTION_POLICY_H
#define CIDBOOST_P2P_CONNECTION_POLICY_H

#include "cidboost/base/config.h"
#include "cidboost/net/content_network.h"
#include <elio/elio.hpp>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace cidboost {

// Connection manager keys touched by the policy
inline constexpr const char* kConnMgrHighWater = "Swarm.ConnMgr.HighWater";
inline constexpr const char* kConnMgrLowWater = "Swarm.ConnMgr.LowWater";
inline constexpr const char* kConnMgrGracePeriod = "Swarm.ConnMgr.GracePeriod";

// Raises the node's connection manager limits while at least one download is
// active and puts the previous values back when the last one finishes.
// Boost and restore operations are serialised.
class ConnectionPolicyManager {
public:
    ConnectionPolicyManager(const ConnectionPolicyConfig& config,
                            std::shared_ptr<ConnectionConfigurator> configurator,
                            std::shared_ptr<ContentNetwork> network = nullptr);
    ~ConnectionPolicyManager();

    // Tracks cid as active. The first active download saves the current limits
    // and applies the boost values; later ones only register.
    elio::coro::task<std::error_code> boost_for_download(const std::string& cid);

    // Untracks cid and, once nothing is active, writes back the saved limits
    // (or the defaults). A no-op when not boosted.
    elio::coro::task<std::error_code> restore_defaults(const std::string& cid);

    // Drops downloads older than the auto-restore age and restores when none remain
    elio::coro::task<void> auto_restore();

    // Adds currently connected peers among peer_ids to the peering set
    elio::coro::task<std::error_code> protect_peers(const std::vector<std::string>& peer_ids);

    size_t active_downloads() const;
    bool is_boosted() const;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace cidboost

#endif // CIDBOOST_P2P_CONNECTION_POLICY_H
