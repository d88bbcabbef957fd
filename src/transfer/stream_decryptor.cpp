#include "cidboost/transfer/stream_decryptor.h"
#include "cidboost/base/error_code.h"
#include "cidboost/base/logger.h"
#include "cidboost/crypto/aes_ctr.h"
#include "cidboost/transfer/byte_pipe.h"
#include <vector>

namespace cidboost {

namespace {

struct DecryptOutcome {
    std::exception_ptr error;
    uint64_t plaintext_bytes = 0;
};

elio::coro::task<uint64_t> decrypt_stream(BytePipe& pipe, const SymmetricKey& key, ByteSink& sink,
                                          CancelToken token, size_t chunk_size) {
    uint8_t iv[kAesIvSize];
    size_t got = 0;
    while (got < kAesIvSize) {
        size_t n = co_await pipe.read(iv + got, kAesIvSize - got);
        if (n == 0) {
            throw CidBoostError(ErrorCode::TransferFailed, "encrypted stream ended before its IV");
        }
        got += n;
    }

    AesCtrCipher cipher(key, iv);
    std::vector<uint8_t> buffer(chunk_size);
    uint64_t total = 0;
    while (true) {
        if (token.cancelled()) {
            throw CidBoostError(ErrorCode::Cancelled, "decryption cancelled");
        }
        size_t n = co_await pipe.read(buffer.data(), buffer.size());
        if (n == 0) {
            break;
        }
        cipher.update(buffer.data(), buffer.data(), n);
        co_await sink.write(buffer.data(), n);
        total += n;
    }
    co_return total;
}

// Consumer half. Closes the read end with its failure so the fetch half stops.
elio::coro::task<DecryptOutcome> decrypt_half(std::shared_ptr<BytePipe> pipe, SymmetricKey key,
                                              ByteSink* sink, CancelToken token, size_t chunk_size) {
    DecryptOutcome outcome;
    try {
        outcome.plaintext_bytes = co_await decrypt_stream(*pipe, key, *sink, token, chunk_size);
        pipe->close_read();
    } catch (const std::exception&) {
        outcome.error = std::current_exception();
    }
    if (outcome.error) {
        pipe->close_read(outcome.error);
    }
    co_return outcome;
}

bool is_cancellation(const std::exception_ptr& error) {
    return error_code_of(error) == ErrorCode::Cancelled;
}

} // anonymous namespace

StreamDecryptor::StreamDecryptor(std::shared_ptr<StreamFetcher> fetcher, const TransferConfig& config)
    : fetcher_(std::move(fetcher)), config_(config) {}

elio::coro::task<uint64_t> StreamDecryptor::download_and_decrypt(const std::string& cid,
                                                                 const SymmetricKey& key,
                                                                 ByteSink& sink,
                                                                 CancelToken token,
                                                                 ProgressCallback on_progress) {
    if (!AesCtrCipher::valid_key_size(key.size())) {
        throw CidBoostError(ErrorCode::CryptoError, "invalid key size " + std::to_string(key.size()));
    }

    std::string key_cid = cid;
    auto pipe = std::make_shared<BytePipe>(config_.pipe_capacity);

    // The decrypt half always finishes before this frame unwinds, so it may
    // borrow the sink
    auto decrypt = decrypt_half(pipe, key, &sink, token, config_.chunk_size).spawn();

    std::exception_ptr fetch_error;
    try {
        PipeSink writer(*pipe);
        co_await fetcher_->fetch(key_cid, writer, token, on_progress);
    } catch (const std::exception&) {
        fetch_error = std::current_exception();
    }
    pipe->close_write(fetch_error);
    DecryptOutcome outcome = co_await decrypt;

    // First non-cancellation failure wins
    std::exception_ptr cancellation;
    for (const auto& error : {pipe->first_error(), fetch_error, outcome.error}) {
        if (!error) continue;
        if (!is_cancellation(error)) {
            std::rethrow_exception(error);
        }
        cancellation = error;
    }
    if (cancellation) {
        std::rethrow_exception(cancellation);
    }

    uint64_t plaintext = outcome.plaintext_bytes;
    Logger::instance().debug("Decrypted {} bytes for {}", plaintext, key_cid);
    co_return plaintext;
}

} // namespace cidboost
