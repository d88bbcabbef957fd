#ifndef CIDBOOST_NET_CONTENT_NETWORK_H
#define CIDBOOST_NET_CONTENT_NETWORK_H

#include "cidboost/base/wakeup.h"
#include <elio/elio.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace cidboost {

// A peer that advertised content
struct PeerInfo {
    std::string id;
    std::vector<std::string> addrs;

    // Multiaddr used to dial the peer: "<first addr>/p2p/<id>", or "/p2p/<id>"
    // when no address is known and routing has to find one.
    std::string dial_address() const;
};

// A currently connected peer as reported by the swarm
struct SwarmPeer {
    std::string id;
    std::string address;
    std::optional<std::chrono::milliseconds> latency;
};

// Providers discovered by one find_providers call. The producer pushes and
// closes; the consumer pulls lazily. Thread-safe.
class ProviderStream {
public:
    void push(PeerInfo peer);
    void close();

    // wakeup is notified on every push and on close
    void watch(std::shared_ptr<Wakeup> wakeup);

    std::optional<PeerInfo> try_pop();
    bool closed() const;
    // Closed and fully drained
    bool exhausted() const;

private:
    mutable std::mutex mutex_;
    std::deque<PeerInfo> queue_;
    bool closed_ = false;
    std::shared_ptr<Wakeup> watcher_;
};

// Sequential byte stream of one object
class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Reads up to len bytes. Returns 0 at end of stream. Throws CidBoostError on
    // failure.
    virtual elio::coro::task<size_t> read(uint8_t* buffer, size_t len) = 0;
};

// Content-addressed network operations used by the download path
class ContentNetwork {
public:
    virtual ~ContentNetwork() = default;

    // Starts provider discovery; results arrive on the returned stream, which is
    // closed when routing gives up or timeout elapses.
    virtual elio::coro::task<std::shared_ptr<ProviderStream>> find_providers(
        const std::string& cid, std::chrono::milliseconds timeout) = 0;

    virtual elio::coro::task<std::error_code> connect(const std::string& peer_address,
                                                      std::chrono::milliseconds timeout) = 0;

    // Keeps a connection to the peer alive across connection manager trims
    virtual elio::coro::task<std::error_code> peering_add(const std::string& peer_address) = 0;

    // Opens the object's byte stream. Throws CidBoostError on failure.
    virtual elio::coro::task<std::unique_ptr<ByteStream>> get_file(const std::string& cid) = 0;

    virtual elio::coro::task<std::optional<int64_t>> get_file_size(
        const std::string& cid, std::chrono::milliseconds timeout) = 0;

    virtual elio::coro::task<std::error_code> pin(const std::string& cid) = 0;
    virtual elio::coro::task<std::error_code> unpin(const std::string& cid) = 0;

    virtual elio::coro::task<std::optional<std::vector<SwarmPeer>>> swarm_peers() = 0;
    virtual elio::coro::task<std::error_code> disconnect(const std::string& peer_id) = 0;
    virtual elio::coro::task<bool> ping(const std::string& peer_id,
                                        std::chrono::milliseconds timeout) = 0;
};

// Access to the node's configuration store. Values are JSON texts.
class ConnectionConfigurator {
public:
    virtual ~ConnectionConfigurator() = default;

    virtual elio::coro::task<std::optional<std::string>> get_config(const std::string& key) = 0;
    virtual elio::coro::task<std::error_code> set_config(const std::string& key,
                                                         const std::string& json_value) = 0;
};

} // namespace cidboost

#endif // CIDBOOST_NET_CONTENT_NETWORK_H
