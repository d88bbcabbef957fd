#include "cidboost/net/kubo_client.h"
#include "cidboost/base/error_code.h"
#include "cidboost/base/logger.h"
#include <elio/net/tcp.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstring>

using json = nlohmann::json;

namespace cidboost {

namespace kubo {

namespace {

// Provider record type in routing query events
constexpr int kQueryEventProvider = 4;

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

} // anonymous namespace

std::optional<std::chrono::nanoseconds> parse_go_duration(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    bool negative = false;
    if (text.front() == '-' || text.front() == '+') {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }
    if (text == "0") {
        return std::chrono::nanoseconds(0);
    }

    double total_ns = 0;
    bool any = false;
    while (!text.empty()) {
        size_t i = 0;
        while (i < text.size() && (std::isdigit(static_cast<unsigned char>(text[i])) || text[i] == '.')) {
            ++i;
        }
        if (i == 0) {
            return std::nullopt;
        }
        double value = 0;
        try {
            value = std::stod(std::string(text.substr(0, i)));
        } catch (const std::exception&) {
            return std::nullopt;
        }
        text.remove_prefix(i);

        size_t u = 0;
        while (u < text.size() && !std::isdigit(static_cast<unsigned char>(text[u])) && text[u] != '.') {
            ++u;
        }
        std::string_view unit = text.substr(0, u);
        text.remove_prefix(u);

        double scale = 0;
        if (unit == "ns") scale = 1;
        else if (unit == "us" || unit == "\xC2\xB5s" || unit == "\xCE\xBCs") scale = 1e3;
        else if (unit == "ms") scale = 1e6;
        else if (unit == "s") scale = 1e9;
        else if (unit == "m") scale = 60e9;
        else if (unit == "h") scale = 3600e9;
        else return std::nullopt;

        total_ns += value * scale;
        any = true;
    }
    if (!any) {
        return std::nullopt;
    }
    auto ns = std::chrono::nanoseconds(static_cast<int64_t>(total_ns));
    return negative ? -ns : ns;
}

std::string format_timeout(std::chrono::milliseconds timeout) {
    return std::to_string(std::max<int64_t>(timeout.count(), 1)) + "ms";
}

std::string url_encode(std::string_view value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

std::vector<PeerInfo> parse_provider_record(const std::string& line) {
    std::vector<PeerInfo> peers;
    auto record = json::parse(line, nullptr, false);
    if (record.is_discarded() || !record.is_object()) {
        return peers;
    }
    if (record.value("Type", -1) != kQueryEventProvider) {
        return peers;
    }
    auto responses = record.find("Responses");
    if (responses == record.end() || !responses->is_array()) {
        return peers;
    }
    for (const auto& r : *responses) {
        PeerInfo peer;
        peer.id = r.value("ID", "");
        if (peer.id.empty()) continue;
        auto addrs = r.find("Addrs");
        if (addrs != r.end() && addrs->is_array()) {
            for (const auto& a : *addrs) {
                if (a.is_string()) peer.addrs.push_back(a.get<std::string>());
            }
        }
        peers.push_back(std::move(peer));
    }
    return peers;
}

std::vector<SwarmPeer> parse_swarm_peers(const std::string& body) {
    std::vector<SwarmPeer> result;
    auto doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return result;
    }
    auto peers = doc.find("Peers");
    if (peers == doc.end() || !peers->is_array()) {
        return result;
    }
    for (const auto& p : *peers) {
        SwarmPeer peer;
        peer.id = p.value("Peer", "");
        peer.address = p.value("Addr", "");
        if (auto latency = parse_go_duration(p.value("Latency", ""))) {
            peer.latency = std::chrono::duration_cast<std::chrono::milliseconds>(*latency);
        }
        if (!peer.id.empty()) {
            result.push_back(std::move(peer));
        }
    }
    return result;
}

std::optional<int64_t> parse_file_stat_size(const std::string& body) {
    auto doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::nullopt;
    }
    if (doc.value("Type", "file") != "file") {
        return std::nullopt;
    }
    auto size = doc.find("Size");
    if (size == doc.end() || !size->is_number_integer()) {
        return std::nullopt;
    }
    return size->get<int64_t>();
}

bool parse_ping_success(const std::string& body) {
    size_t start = 0;
    while (start < body.size()) {
        size_t end = body.find('\n', start);
        if (end == std::string::npos) end = body.size();
        auto event = json::parse(body.substr(start, end - start), nullptr, false);
        start = end + 1;
        if (event.is_discarded() || !event.is_object()) continue;
        if (event.value("Success", false) && event.value("Time", int64_t{0}) > 0) {
            return true;
        }
    }
    return false;
}

std::string error_message(const std::string& body) {
    auto doc = json::parse(body, nullptr, false);
    if (!doc.is_discarded() && doc.is_object() && doc.contains("Message")) {
        return doc.value("Message", "");
    }
    return trim(body);
}

HttpBodyDecoder::HttpBodyDecoder(Mode mode, uint64_t content_length)
    : mode_(mode), remaining_(content_length) {
    switch (mode) {
        case Mode::Chunked: state_ = State::Size; break;
        case Mode::ContentLength: state_ = content_length == 0 ? State::Done : State::Body; break;
        case Mode::UntilClose: state_ = State::Body; break;
    }
}

size_t HttpBodyDecoder::decode(const char* data, size_t size, std::string& out) {
    size_t i = 0;
    while (i < size && state_ != State::Done) {
        switch (state_) {
            case State::Body: {
                size_t take = size - i;
                if (mode_ == Mode::ContentLength) {
                    take = static_cast<size_t>(std::min<uint64_t>(take, remaining_));
                    remaining_ -= take;
                }
                out.append(data + i, take);
                i += take;
                if (mode_ == Mode::ContentLength && remaining_ == 0) {
                    state_ = State::Done;
                }
                break;
            }
            case State::Size: {
                char c = data[i++];
                if (c != '\n') {
                    line_ += c;
                    if (line_.size() > 1024) {
                        throw CidBoostError(ErrorCode::ProtocolError, "chunk size line too long");
                    }
                    break;
                }
                std::string size_text = trim(line_.substr(0, line_.find(';')));
                line_.clear();
                if (size_text.empty()) {
                    throw CidBoostError(ErrorCode::ProtocolError, "empty chunk size");
                }
                size_t parsed = 0;
                uint64_t chunk = 0;
                try {
                    chunk = std::stoull(size_text, &parsed, 16);
                } catch (const std::exception&) {
                    parsed = 0;
                }
                if (parsed != size_text.size()) {
                    throw CidBoostError(ErrorCode::ProtocolError, "bad chunk size: " + size_text);
                }
                remaining_ = chunk;
                state_ = chunk == 0 ? State::Trailers : State::Data;
                break;
            }
            case State::Data: {
                size_t take = static_cast<size_t>(std::min<uint64_t>(size - i, remaining_));
                out.append(data + i, take);
                i += take;
                remaining_ -= take;
                if (remaining_ == 0) {
                    state_ = State::DataEnd;
                }
                break;
            }
            case State::DataEnd: {
                if (data[i++] == '\n') {
                    state_ = State::Size;
                }
                break;
            }
            case State::Trailers: {
                char c = data[i++];
                if (c != '\n') {
                    line_ += c;
                    break;
                }
                std::string line = trim(line_);
                line_.clear();
                if (line.empty()) {
                    state_ = State::Done;
                    break;
                }
                auto colon = line.find(':');
                if (colon != std::string::npos) {
                    trailers_[lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
                }
                break;
            }
            case State::Done:
                break;
        }
    }
    return i;
}

void HttpBodyDecoder::finish() {
    if (state_ == State::Done) {
        return;
    }
    if (mode_ == Mode::UntilClose) {
        state_ = State::Done;
        return;
    }
    throw CidBoostError(ErrorCode::ConnectionClosed, "connection closed before end of response body");
}

} // namespace kubo

namespace {

constexpr size_t kReadBufferSize = 64 * 1024;
constexpr size_t kMaxHeaderSize = 64 * 1024;
constexpr size_t kMaxResponseSize = 16 * 1024 * 1024;

// One RPC exchange on its own connection
class HttpResponse {
public:
    explicit HttpResponse(elio::net::tcp_stream stream)
        : stream_(std::move(stream)), io_buffer_(kReadBufferSize) {}

    int status() const { return status_; }

    elio::coro::task<void> send(const std::string& request) {
        size_t sent = 0;
        while (sent < request.size()) {
            auto result = co_await stream_.write(request.data() + sent, request.size() - sent);
            if (result.result <= 0) {
                throw CidBoostError(ErrorCode::NetworkError, "failed to send request");
            }
            sent += static_cast<size_t>(result.result);
        }
    }

    elio::coro::task<void> read_head() {
        size_t pos;
        while ((pos = raw_.find("\r\n\r\n")) == std::string::npos) {
            if (raw_.size() > kMaxHeaderSize) {
                throw CidBoostError(ErrorCode::ProtocolError, "response header too large");
            }
            if (!co_await fill()) {
                throw CidBoostError(ErrorCode::ConnectionClosed, "connection closed before response headers");
            }
        }
        std::string head = raw_.substr(0, pos);
        raw_.erase(0, pos + 4);

        size_t line_end = head.find("\r\n");
        std::string status_line = head.substr(0, line_end);
        auto sp = status_line.find(' ');
        if (status_line.rfind("HTTP/", 0) != 0 || sp == std::string::npos) {
            throw CidBoostError(ErrorCode::ProtocolError, "bad status line: " + status_line);
        }
        status_ = std::atoi(status_line.c_str() + sp + 1);

        std::map<std::string, std::string> headers;
        size_t start = line_end == std::string::npos ? head.size() : line_end + 2;
        while (start < head.size()) {
            size_t end = head.find("\r\n", start);
            if (end == std::string::npos) end = head.size();
            std::string line = head.substr(start, end - start);
            start = end + 2;
            auto colon = line.find(':');
            if (colon == std::string::npos) continue;
            std::string key = line.substr(0, colon);
            std::transform(key.begin(), key.end(), key.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            std::string value = line.substr(colon + 1);
            value.erase(0, value.find_first_not_of(' '));
            headers[key] = value;
        }

        auto te = headers.find("transfer-encoding");
        auto cl = headers.find("content-length");
        if (te != headers.end() && te->second.find("chunked") != std::string::npos) {
            decoder_ = kubo::HttpBodyDecoder(kubo::HttpBodyDecoder::Mode::Chunked);
        } else if (cl != headers.end()) {
            decoder_ = kubo::HttpBodyDecoder(kubo::HttpBodyDecoder::Mode::ContentLength,
                                             std::stoull(cl->second));
        } else {
            decoder_ = kubo::HttpBodyDecoder(kubo::HttpBodyDecoder::Mode::UntilClose);
        }
    }

    // Decoded body bytes; 0 at end of body
    elio::coro::task<size_t> read(uint8_t* buffer, size_t len) {
        while (decoded_.empty()) {
            if (decoder_.done()) {
                check_trailers();
                co_return 0;
            }
            if (raw_.empty()) {
                if (!co_await fill()) {
                    decoder_.finish();
                    continue;
                }
            }
            size_t used = decoder_.decode(raw_.data(), raw_.size(), decoded_);
            raw_.erase(0, used);
        }
        size_t n = std::min(len, decoded_.size());
        std::memcpy(buffer, decoded_.data(), n);
        decoded_.erase(0, n);
        co_return n;
    }

    elio::coro::task<std::optional<std::string>> read_line() {
        while (true) {
            auto nl = line_buffer_.find('\n');
            if (nl != std::string::npos) {
                std::string line = line_buffer_.substr(0, nl);
                line_buffer_.erase(0, nl + 1);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                co_return line;
            }
            uint8_t tmp[4096];
            size_t n = co_await read(tmp, sizeof(tmp));
            if (n == 0) {
                if (line_buffer_.empty()) {
                    co_return std::nullopt;
                }
                std::string line;
                line.swap(line_buffer_);
                co_return line;
            }
            line_buffer_.append(reinterpret_cast<const char*>(tmp), n);
        }
    }

    elio::coro::task<std::string> read_all(size_t limit) {
        std::string body;
        uint8_t tmp[8192];
        while (true) {
            size_t n = co_await read(tmp, sizeof(tmp));
            if (n == 0) break;
            body.append(reinterpret_cast<const char*>(tmp), n);
            if (body.size() > limit) {
                throw CidBoostError(ErrorCode::ProtocolError, "response body too large");
            }
        }
        co_return body;
    }

    elio::coro::task<void> close() {
        co_await stream_.close();
    }

private:
    elio::coro::task<bool> fill() {
        auto result = co_await stream_.read(io_buffer_.data(), io_buffer_.size());
        if (result.result < 0) {
            throw CidBoostError(ErrorCode::NetworkError,
                                std::string("socket read failed: ") + std::strerror(static_cast<int>(-result.result)));
        }
        if (result.result == 0) {
            co_return false;
        }
        raw_.append(io_buffer_.data(), static_cast<size_t>(result.result));
        co_return true;
    }

    void check_trailers() const {
        auto it = decoder_.trailers().find("x-stream-error");
        if (it != decoder_.trailers().end() && !it->second.empty()) {
            throw CidBoostError(ErrorCode::TransferFailed, it->second);
        }
    }

    elio::net::tcp_stream stream_;
    std::vector<char> io_buffer_;
    std::string raw_;
    std::string decoded_;
    std::string line_buffer_;
    kubo::HttpBodyDecoder decoder_;
    int status_ = 0;
};

// Body of a cat call
class CatStream : public ByteStream {
public:
    explicit CatStream(std::unique_ptr<HttpResponse> response) : response_(std::move(response)) {}

    elio::coro::task<size_t> read(uint8_t* buffer, size_t len) override {
        co_return co_await response_->read(buffer, len);
    }

private:
    std::unique_ptr<HttpResponse> response_;
};

elio::coro::task<void> pump_providers(std::unique_ptr<HttpResponse> response,
                                      std::shared_ptr<ProviderStream> stream,
                                      std::string cid) {
    size_t found = 0;
    try {
        while (auto line = co_await response->read_line()) {
            if (stream->closed()) {
                break;
            }
            for (auto& peer : kubo::parse_provider_record(*line)) {
                stream->push(std::move(peer));
                ++found;
            }
        }
    } catch (const std::exception& e) {
        Logger::instance().debug("Provider query for {} ended: {}", cid, e.what());
    }
    stream->close();
    Logger::instance().debug("Routing returned {} providers for {}", found, cid);
}

} // anonymous namespace

struct KuboClient::Impl {
    NodeConfig config;

    struct CallResult {
        int status = 0;
        std::string body;
    };

    std::string build_request(const std::string& path) const {
        return "POST /api/v0/" + path + " HTTP/1.1\r\n"
               "Host: " + config.api_address + ":" + std::to_string(config.api_port) + "\r\n"
               "User-Agent: cidboost/0.1\r\n"
               "Content-Length: 0\r\n"
               "Connection: close\r\n\r\n";
    }

    elio::coro::task<std::unique_ptr<HttpResponse>> open(const std::string& path) {
        elio::net::tcp_options opts;
        opts.no_delay = true;

        auto connect_result = co_await elio::net::tcp_connect(config.api_address, config.api_port, opts);
        if (!connect_result) {
            throw CidBoostError(ErrorCode::ConnectionFailed,
                                "cannot reach Kubo API at " + config.api_address + ":" +
                                std::to_string(config.api_port));
        }
        auto response = std::make_unique<HttpResponse>(std::move(*connect_result));
        co_await response->send(build_request(path));
        co_await response->read_head();
        co_return response;
    }

    elio::coro::task<CallResult> call(const std::string& path) {
        auto response = co_await open(path);
        CallResult result;
        result.status = response->status();
        result.body = co_await response->read_all(kMaxResponseSize);
        co_await response->close();
        co_return result;
    }

    // Calls whose only outcome is success or failure
    elio::coro::task<std::error_code> command(const std::string& path, ErrorCode failure) {
        std::string problem;
        try {
            auto result = co_await call(path);
            if (result.status == 200) {
                co_return std::error_code{};
            }
            problem = kubo::error_message(result.body);
        } catch (const std::exception& e) {
            problem = e.what();
        }
        Logger::instance().debug("Kubo call {} failed: {}", path.substr(0, path.find('?')), problem);
        co_return make_error_code(failure);
    }
};

KuboClient::KuboClient(const NodeConfig& config)
    : impl_(std::make_unique<Impl>()) {
    impl_->config = config;
}

KuboClient::~KuboClient() = default;

elio::coro::task<std::shared_ptr<ProviderStream>> KuboClient::find_providers(
    const std::string& cid, std::chrono::milliseconds timeout) {
    auto stream = std::make_shared<ProviderStream>();
    try {
        auto response = co_await impl_->open("routing/findprovs?arg=" + kubo::url_encode(cid) +
                                             "&num-providers=20&timeout=" + kubo::format_timeout(timeout));
        if (response->status() != 200) {
            auto body = co_await response->read_all(kMaxHeaderSize);
            Logger::instance().warning("Provider query for {} rejected: {}", cid, kubo::error_message(body));
            stream->close();
            co_return stream;
        }
        (void)pump_providers(std::move(response), stream, cid).spawn();
    } catch (const std::exception& e) {
        Logger::instance().warning("Provider query for {} failed: {}", cid, e.what());
        stream->close();
    }
    co_return stream;
}

elio::coro::task<std::error_code> KuboClient::connect(const std::string& peer_address,
                                                      std::chrono::milliseconds timeout) {
    co_return co_await impl_->command("swarm/connect?arg=" + kubo::url_encode(peer_address) +
                                      "&timeout=" + kubo::format_timeout(timeout),
                                      ErrorCode::ConnectionFailed);
}

elio::coro::task<std::error_code> KuboClient::peering_add(const std::string& peer_address) {
    co_return co_await impl_->command("swarm/peering/add?arg=" + kubo::url_encode(peer_address),
                                      ErrorCode::NetworkError);
}

elio::coro::task<std::unique_ptr<ByteStream>> KuboClient::get_file(const std::string& cid) {
    auto response = co_await impl_->open("cat?arg=" + kubo::url_encode(cid));
    if (response->status() != 200) {
        auto body = co_await response->read_all(kMaxHeaderSize);
        throw CidBoostError(ErrorCode::TransferFailed, "cat " + cid + ": " + kubo::error_message(body));
    }
    co_return std::make_unique<CatStream>(std::move(response));
}

elio::coro::task<std::optional<int64_t>> KuboClient::get_file_size(
    const std::string& cid, std::chrono::milliseconds timeout) {
    try {
        auto result = co_await impl_->call("files/stat?arg=" + kubo::url_encode("/ipfs/" + cid) +
                                           "&timeout=" + kubo::format_timeout(timeout));
        if (result.status == 200) {
            co_return kubo::parse_file_stat_size(result.body);
        }
        Logger::instance().debug("Size lookup for {} failed: {}", cid, kubo::error_message(result.body));
    } catch (const std::exception& e) {
        Logger::instance().debug("Size lookup for {} failed: {}", cid, e.what());
    }
    co_return std::nullopt;
}

elio::coro::task<std::error_code> KuboClient::pin(const std::string& cid) {
    co_return co_await impl_->command("pin/add?arg=" + kubo::url_encode(cid), ErrorCode::NetworkError);
}

elio::coro::task<std::error_code> KuboClient::unpin(const std::string& cid) {
    co_return co_await impl_->command("pin/rm?arg=" + kubo::url_encode(cid), ErrorCode::NetworkError);
}

elio::coro::task<std::optional<std::vector<SwarmPeer>>> KuboClient::swarm_peers() {
    try {
        auto result = co_await impl_->call("swarm/peers?latency=true");
        if (result.status == 200) {
            co_return kubo::parse_swarm_peers(result.body);
        }
        Logger::instance().warning("Listing swarm peers failed: {}", kubo::error_message(result.body));
    } catch (const std::exception& e) {
        Logger::instance().warning("Listing swarm peers failed: {}", e.what());
    }
    co_return std::nullopt;
}

elio::coro::task<std::error_code> KuboClient::disconnect(const std::string& peer_id) {
    co_return co_await impl_->command("swarm/disconnect?arg=" + kubo::url_encode("/p2p/" + peer_id),
                                      ErrorCode::NetworkError);
}

elio::coro::task<bool> KuboClient::ping(const std::string& peer_id, std::chrono::milliseconds timeout) {
    try {
        auto result = co_await impl_->call("ping?arg=" + kubo::url_encode(peer_id) +
                                           "&count=1&timeout=" + kubo::format_timeout(timeout));
        co_return result.status == 200 && kubo::parse_ping_success(result.body);
    } catch (const std::exception& e) {
        Logger::instance().debug("Ping {} failed: {}", peer_id, e.what());
    }
    co_return false;
}

elio::coro::task<std::optional<std::string>> KuboClient::get_config(const std::string& key) {
    try {
        auto result = co_await impl_->call("config?arg=" + kubo::url_encode(key));
        if (result.status == 200) {
            auto doc = json::parse(result.body, nullptr, false);
            if (!doc.is_discarded() && doc.contains("Value")) {
                co_return doc["Value"].dump();
            }
        }
        Logger::instance().debug("Reading config {} failed: {}", key, kubo::error_message(result.body));
    } catch (const std::exception& e) {
        Logger::instance().debug("Reading config {} failed: {}", key, e.what());
    }
    co_return std::nullopt;
}

elio::coro::task<std::error_code> KuboClient::set_config(const std::string& key,
                                                         const std::string& json_value) {
    co_return co_await impl_->command("config?arg=" + kubo::url_encode(key) + "&arg=" +
                                      kubo::url_encode(json_value) + "&json=true",
                                      ErrorCode::NetworkError);
}

elio::coro::task<std::string> KuboClient::node_id() {
    try {
        auto result = co_await impl_->call("id");
        if (result.status == 200) {
            auto doc = json::parse(result.body, nullptr, false);
            if (!doc.is_discarded() && doc.is_object()) {
                co_return doc.value("ID", "");
            }
        }
    } catch (const std::exception& e) {
        Logger::instance().warning("Kubo API unreachable: {}", e.what());
    }
    co_return std::string{};
}

} // namespace cidboost
