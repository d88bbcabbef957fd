#include <catch2/catch_test_macros.hpp>
#include "cidboost/base/error_code.h"
#include "cidboost/crypto/aes_ctr.h"
#include "cidboost/crypto/codec.h"
#include "cidboost/transfer/stream_decryptor.h"
#include "fakes.h"

using namespace cidboost;
using namespace cidboost::test;

namespace {

std::vector<uint8_t> encrypt(const std::vector<uint8_t>& plain, const SymmetricKey& key) {
    auto iv = random_bytes(kAesIvSize);
    std::vector<uint8_t> out(iv);
    out.resize(kAesIvSize + plain.size());
    AesCtrCipher cipher(key, iv.data());
    if (!plain.empty()) {
        cipher.update(plain.data(), out.data() + kAesIvSize, plain.size());
    }
    return out;
}

struct DecryptFixture {
    TestRuntime rt;
    std::shared_ptr<FakeNetwork> net = std::make_shared<FakeNetwork>();
    TransferConfig config;
    std::shared_ptr<StreamFetcher> fetcher;
    std::unique_ptr<StreamDecryptor> decryptor;

    DecryptFixture() {
        config.pipe_capacity = 256 * 1024;
        config.chunk_size = 64 * 1024;
        fetcher = std::make_shared<StreamFetcher>(net, config);
        decryptor = std::make_unique<StreamDecryptor>(fetcher, config);
    }
};

} // anonymous namespace

TEST_CASE("StreamDecryptor - round trip across sizes", "[decryptor][roundtrip]") {
    DecryptFixture fx;
    auto key = random_bytes(32);

    for (size_t size : {size_t{0}, size_t{1}, size_t{4096}, size_t{10000000}}) {
        auto plain = random_data(size, static_cast<uint32_t>(size));
        auto cipher = encrypt(plain, key);
        fx.net->set_file("bafyEnc", cipher);

        MemorySink sink;
        uint64_t progress = 0;
        auto written = fx.rt.run(fx.decryptor->download_and_decrypt(
            "bafyEnc", key, sink, CancelToken{}, [&](uint64_t delta) { progress += delta; }));

        INFO("size " << size);
        REQUIRE(written == size);
        REQUIRE(sink.bytes() == plain);
        REQUIRE(progress == cipher.size());
    }
}

TEST_CASE("StreamDecryptor - sink failure propagates", "[decryptor][error]") {
    DecryptFixture fx;
    auto key = random_bytes(32);
    fx.net->set_file("bafyEnc", encrypt(random_data(2000000), key));

    MemorySink sink;
    sink.fail_after(1000);
    ErrorCode code = ErrorCode::Success;
    try {
        fx.rt.run(fx.decryptor->download_and_decrypt("bafyEnc", key, sink, CancelToken{}));
    } catch (const CidBoostError& e) {
        code = e.code();
    }
    REQUIRE(code == ErrorCode::WriteFailed);
}

TEST_CASE("StreamDecryptor - fetch failure propagates", "[decryptor][error]") {
    DecryptFixture fx;
    auto key = random_bytes(16);
    fx.net->set_file("bafyEnc", encrypt(random_data(500000), key));
    fx.net->set_fail_at("bafyEnc", 100000);

    MemorySink sink;
    ErrorCode code = ErrorCode::Success;
    try {
        fx.rt.run(fx.decryptor->download_and_decrypt("bafyEnc", key, sink, CancelToken{}));
    } catch (const CidBoostError& e) {
        code = e.code();
    }
    REQUIRE(code == ErrorCode::TransferFailed);
    REQUIRE(sink.bytes().size() <= 100000);
}

TEST_CASE("StreamDecryptor - stream shorter than the IV", "[decryptor][error]") {
    DecryptFixture fx;
    fx.net->set_file("bafyShort", {1, 2, 3});

    MemorySink sink;
    ErrorCode code = ErrorCode::Success;
    try {
        fx.rt.run(fx.decryptor->download_and_decrypt("bafyShort", random_bytes(32), sink, CancelToken{}));
    } catch (const CidBoostError& e) {
        code = e.code();
    }
    REQUIRE(code == ErrorCode::TransferFailed);
}

TEST_CASE("StreamDecryptor - rejects bad key sizes", "[decryptor][error]") {
    DecryptFixture fx;
    fx.net->set_file("bafyEnc", encrypt({}, random_bytes(32)));
    MemorySink sink;
    SymmetricKey bad(7, 0);
    REQUIRE_THROWS_AS(fx.rt.run(fx.decryptor->download_and_decrypt("bafyEnc", bad, sink, CancelToken{})),
                      CidBoostError);
}
