#ifndef CIDBOOST_P2P_DOWNLOAD_BOOSTER_H
#define CIDBOOST_P2P_DOWNLOAD_BOOSTER_H

#include "cidboost/base/cancel_token.h"
#include "cidboost/base/concurrent_map.h"
#include "cidboost/base/config.h"
#include "cidboost/net/content_network.h"
#include <elio/elio.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace cidboost {

// Result of one discovery round for a CID. An empty provider list is a
// negative entry.
struct ProviderCacheEntry {
    std::vector<PeerInfo> providers;
    std::chrono::steady_clock::time_point cached_at;

    bool negative() const { return providers.empty(); }
};

using ProviderCache = ConcurrentMap<std::string, ProviderCacheEntry>;

// Peer id -> latency of the last successful connect
using ConnectionQualityMap = ConcurrentMap<std::string, std::chrono::milliseconds>;

struct WarmupResult {
    std::error_code error;
    bool from_cache = false;  // answered from the provider cache, no discovery
    size_t providers = 0;
    size_t connected = 0;     // successful connects when discovery ended

    bool ok() const { return !error; }
};

struct BoosterStats {
    uint64_t warmups = 0;
    uint64_t cache_hits = 0;
    uint64_t negative_cache_hits = 0;
    uint64_t discoveries = 0;
    uint64_t providers_found = 0;
    uint64_t connections_made = 0;
    uint64_t connection_failures = 0;
    uint64_t prefetches_completed = 0;
};

// Provider discovery, caching and session pre-warming for CIDs.
// Concurrent warmups of one CID share a single discovery round.
class DownloadBooster {
public:
    DownloadBooster(const BoosterConfig& config,
                    std::shared_ptr<ContentNetwork> network,
                    std::shared_ptr<ProviderCache> cache = nullptr,
                    std::shared_ptr<ConnectionQualityMap> quality = nullptr);
    ~DownloadBooster();

    // Fails fast with ProviderNotFound on a live negative entry and succeeds
    // from a live positive entry; otherwise discovers providers, connects to
    // them, caches the outcome and primes the first block. Returns Cancelled
    // when token fires before the round completes.
    elio::coro::task<WarmupResult> warmup_cid(const std::string& cid, CancelToken token = {});

    // Live positive entries only
    std::vector<PeerInfo> get_cached_providers(const std::string& cid) const;
    bool has_cached_providers(const std::string& cid) const;

    std::optional<std::chrono::milliseconds> get_connection_quality(const std::string& peer_id) const;

    void clear_cache();
    void clear_cache_for_cid(const std::string& cid);
    void clear_negative_cache_for_cid(const std::string& cid);

    // Seeds a provider learned out of band. A negative entry becomes positive;
    // duplicates are ignored.
    void manually_add_provider(const std::string& cid, const PeerInfo& peer);

    BoosterStats get_stats() const;

    std::shared_ptr<ProviderCache> provider_cache() const;
    std::shared_ptr<ConnectionQualityMap> connection_quality() const;

private:
    struct Impl;
    // Shared with connection attempts and prefetches that outlive a warmup
    std::shared_ptr<Impl> impl_;
};

} // namespace cidboost

#endif // CIDBOOST_P2P_DOWNLOAD_BOOSTER_H
