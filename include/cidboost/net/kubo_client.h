#ifndef CIDBOOST_NET_KUBO_CLIENT_H
#define CIDBOOST_NET_KUBO_CLIENT_H

#include "cidboost/base/config.h"
#include "cidboost/net/content_network.h"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cidboost {

namespace kubo {

// Go time.Duration text ("1.5ms", "2m3s", "850µs"). nullopt for "n/a" and junk.
std::optional<std::chrono::nanoseconds> parse_go_duration(std::string_view text);

// Milliseconds in a form the RPC "timeout" option accepts
std::string format_timeout(std::chrono::milliseconds timeout);

// Percent-encodes a query argument
std::string url_encode(std::string_view value);

// Peers from one routing/findprovs NDJSON record; only provider records count.
std::vector<PeerInfo> parse_provider_record(const std::string& line);

// swarm/peers?latency=true response
std::vector<SwarmPeer> parse_swarm_peers(const std::string& body);

// files/stat response; nullopt unless it describes a file
std::optional<int64_t> parse_file_stat_size(const std::string& body);

// ping NDJSON output; true when an echo reply was received
bool parse_ping_success(const std::string& body);

// "Message" of an RPC error object, or the raw body
std::string error_message(const std::string& body);

// Incremental HTTP/1.1 body decoder for Content-Length, chunked and
// read-until-close framing. Chunked trailers are collected with lower-case keys.
class HttpBodyDecoder {
public:
    enum class Mode { ContentLength, Chunked, UntilClose };

    explicit HttpBodyDecoder(Mode mode = Mode::UntilClose, uint64_t content_length = 0);

    // Decodes as much of [data, data + size) as possible, appending payload
    // bytes to out. Returns the number of input bytes consumed. Throws
    // CidBoostError(ProtocolError) on malformed framing.
    size_t decode(const char* data, size_t size, std::string& out);

    // The peer closed the connection
    void finish();

    bool done() const { return state_ == State::Done; }
    Mode mode() const { return mode_; }
    const std::map<std::string, std::string>& trailers() const { return trailers_; }

private:
    enum class State { Size, Data, DataEnd, Trailers, Body, Done };

    Mode mode_;
    State state_;
    uint64_t remaining_;
    std::string line_;
    std::map<std::string, std::string> trailers_;
};

} // namespace kubo

// Kubo RPC API client (HTTP on the node's API port)
class KuboClient : public ContentNetwork, public ConnectionConfigurator {
public:
    explicit KuboClient(const NodeConfig& config);
    ~KuboClient() override;

    // ContentNetwork
    elio::coro::task<std::shared_ptr<ProviderStream>> find_providers(
        const std::string& cid, std::chrono::milliseconds timeout) override;
    elio::coro::task<std::error_code> connect(const std::string& peer_address,
                                              std::chrono::milliseconds timeout) override;
    elio::coro::task<std::error_code> peering_add(const std::string& peer_address) override;
    elio::coro::task<std::unique_ptr<ByteStream>> get_file(const std::string& cid) override;
    elio::coro::task<std::optional<int64_t>> get_file_size(
        const std::string& cid, std::chrono::milliseconds timeout) override;
    elio::coro::task<std::error_code> pin(const std::string& cid) override;
    elio::coro::task<std::error_code> unpin(const std::string& cid) override;
    elio::coro::task<std::optional<std::vector<SwarmPeer>>> swarm_peers() override;
    elio::coro::task<std::error_code> disconnect(const std::string& peer_id) override;
    elio::coro::task<bool> ping(const std::string& peer_id,
                                std::chrono::milliseconds timeout) override;

    // ConnectionConfigurator
    elio::coro::task<std::optional<std::string>> get_config(const std::string& key) override;
    elio::coro::task<std::error_code> set_config(const std::string& key,
                                                 const std::string& json_value) override;

    // Node identity; empty when the API is unreachable
    elio::coro::task<std::string> node_id();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cidboost

#endif // CIDBOOST_NET_KUBO_CLIENT_H
