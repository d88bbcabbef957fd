#ifndef CIDBOOST_TRANSFER_STREAM_DECRYPTOR_H
#define CIDBOOST_TRANSFER_STREAM_DECRYPTOR_H

#include "cidboost/base/cancel_token.h"
#include "cidboost/base/config.h"
#include "cidboost/crypto/key_resolver.h"
#include "cidboost/transfer/file_sink.h"
#include "cidboost/transfer/stream_fetcher.h"
#include <elio/elio.hpp>
#include <memory>
#include <string>

namespace cidboost {

// Fetches an encrypted object (16-byte IV followed by AES-CTR ciphertext) and
// writes the plaintext to a sink. The fetch runs in the calling coroutine and
// feeds a bounded pipe; a second coroutine decrypts from the pipe. Neither side
// buffers the whole object.
class StreamDecryptor {
public:
    StreamDecryptor(std::shared_ptr<StreamFetcher> fetcher, const TransferConfig& config);

    // on_progress counts fetched ciphertext bytes. Returns the plaintext size.
    // Throws the first non-cancellation CidBoostError of either side, else
    // CidBoostError(Cancelled).
    elio::coro::task<uint64_t> download_and_decrypt(const std::string& cid,
                                                    const SymmetricKey& key,
                                                    ByteSink& sink,
                                                    CancelToken token,
                                                    ProgressCallback on_progress = nullptr);

private:
    std::shared_ptr<StreamFetcher> fetcher_;
    TransferConfig config_;
};

} // namespace cidboost

#endif // CIDBOOST_TRANSFER_STREAM_DECRYPTOR_H
