#include "cidboost/transfer/stream_fetcher.h"
#include "cidboost/base/error_code.h"
#include "cidboost/base/logger.h"
#include <vector>

namespace cidboost {

namespace {

[[noreturn]] void throw_cancelled(const std::string& cid) {
    throw CidBoostError(ErrorCode::Cancelled, "fetch of " + cid + " cancelled");
}

} // anonymous namespace

StreamFetcher::StreamFetcher(std::shared_ptr<ContentNetwork> network, const TransferConfig& config)
    : network_(std::move(network)), config_(config) {}

elio::coro::task<uint64_t> StreamFetcher::fetch(const std::string& cid,
                                                ByteSink& sink,
                                                CancelToken token,
                                                ProgressCallback on_progress,
                                                TotalSizeCallback on_total) {
    std::string key = cid;

    if (on_total) {
        auto size = co_await network_->get_file_size(key, std::chrono::milliseconds(config_.size_timeout_ms));
        if (size && *size > 0) {
            on_total(*size);
        }
    }
    if (token.cancelled()) {
        throw_cancelled(key);
    }

    std::unique_ptr<ByteStream> stream;
    try {
        stream = co_await network_->get_file(key);
    } catch (const CidBoostError& e) {
        if (token.cancelled()) throw_cancelled(key);
        throw CidBoostError(ErrorCode::TransferFailed, "failed to open stream: " + e.detail());
    } catch (const std::exception& e) {
        if (token.cancelled()) throw_cancelled(key);
        throw CidBoostError(ErrorCode::TransferFailed, std::string("failed to open stream: ") + e.what());
    }

    std::vector<uint8_t> buffer(config_.chunk_size);
    uint64_t total = 0;
    while (true) {
        if (token.cancelled()) {
            throw_cancelled(key);
        }

        size_t n = 0;
        try {
            n = co_await stream->read(buffer.data(), buffer.size());
        } catch (const CidBoostError& e) {
            if (token.cancelled()) throw_cancelled(key);
            throw CidBoostError(ErrorCode::TransferFailed, "failed to read stream: " + e.detail());
        } catch (const std::exception& e) {
            if (token.cancelled()) throw_cancelled(key);
            throw CidBoostError(ErrorCode::TransferFailed, std::string("failed to read stream: ") + e.what());
        }
        if (n == 0) {
            break;
        }

        try {
            co_await sink.write(buffer.data(), n);
        } catch (const CidBoostError& e) {
            if (e.code() == ErrorCode::Cancelled || token.cancelled()) throw_cancelled(key);
            if (e.code() == ErrorCode::WriteFailed) throw;
            throw CidBoostError(ErrorCode::WriteFailed, e.detail());
        } catch (const std::exception& e) {
            if (token.cancelled()) throw_cancelled(key);
            throw CidBoostError(ErrorCode::WriteFailed, e.what());
        }

        total += n;
        if (on_progress) {
            on_progress(n);
        }
    }

    Logger::instance().debug("Fetched {} bytes for {}", total, key);
    co_return total;
}

} // namespace cidboost
