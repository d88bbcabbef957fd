#ifndef CIDBOOST_TRANSFER_STREAM_FETCHER_H
#define CIDBOOST_TRANSFER_STREAM_FETCHER_H

#include "cidboost/base/cancel_token.h"
#include "cidboost/base/config.h"
#include "cidboost/net/content_network.h"
#include "cidboost/transfer/file_sink.h"
#include <elio/elio.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace cidboost {

using ProgressCallback = std::function<void(uint64_t delta)>;
using TotalSizeCallback = std::function<void(int64_t total)>;

// Copies a CID's byte stream to a sink in order, one chunk at a time.
// A single sequential stream; any parallelism lives inside the network layer.
class StreamFetcher {
public:
    StreamFetcher(std::shared_ptr<ContentNetwork> network, const TransferConfig& config);

    // When on_total is set the object size is looked up first (bounded,
    // best-effort). on_progress gets each chunk's length after the sink
    // accepted it. Returns the byte count.
    // Throws CidBoostError: Cancelled, TransferFailed (open/read) or WriteFailed.
    elio::coro::task<uint64_t> fetch(const std::string& cid,
                                     ByteSink& sink,
                                     CancelToken token,
                                     ProgressCallback on_progress = nullptr,
                                     TotalSizeCallback on_total = nullptr);

private:
    std::shared_ptr<ContentNetwork> network_;
    TransferConfig config_;
};

} // namespace cidboost

#endif // CIDBOOST_TRANSFER_STREAM_FETCHER_H
