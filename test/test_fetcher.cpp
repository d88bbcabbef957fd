#include <catch2/catch_test_macros.hpp>
#include <string>
#include "cidboost/base/error_code.h"
#include "cidboost/transfer/file_sink.h"
#include "cidboost/transfer/stream_fetcher.h"
#include "fakes.h"

using namespace cidboost;
using namespace cidboost::test;

namespace {

template <typename T>
ErrorCode error_of(TestRuntime& rt, elio::coro::task<T> task, std::string* message = nullptr) {
    try {
        rt.run(std::move(task));
    } catch (const CidBoostError& e) {
        if (message) *message = e.what();
        return e.code();
    }
    return ErrorCode::Success;
}

} // anonymous namespace

TEST_CASE("StreamFetcher - progress is monotone and ends at the file size", "[fetcher][progress]") {
    TestRuntime rt;
    auto net = std::make_shared<FakeNetwork>();
    auto data = random_data(1000000);
    net->set_file("bafyF", data);
    net->set_read_delay("bafyF", std::chrono::milliseconds(0), 64 * 1024);

    StreamFetcher fetcher(net, TransferConfig{});
    MemorySink sink;
    std::vector<uint64_t> deltas;
    int64_t total = -1;

    auto written = rt.run(fetcher.fetch("bafyF", sink, CancelToken{},
        [&](uint64_t delta) { deltas.push_back(delta); },
        [&](int64_t t) { total = t; }));

    REQUIRE(written == data.size());
    REQUIRE(total == static_cast<int64_t>(data.size()));
    REQUIRE(sink.bytes() == data);

    uint64_t loaded = 0;
    for (auto delta : deltas) {
        REQUIRE(delta > 0);
        loaded += delta;
    }
    REQUIRE(loaded == data.size());
}

TEST_CASE("StreamFetcher - empty object", "[fetcher]") {
    TestRuntime rt;
    auto net = std::make_shared<FakeNetwork>();
    net->set_file("bafyEmpty", {});
    StreamFetcher fetcher(net, TransferConfig{});
    MemorySink sink;

    REQUIRE(rt.run(fetcher.fetch("bafyEmpty", sink, CancelToken{})) == 0);
    REQUIRE(sink.bytes().empty());
}

TEST_CASE("StreamFetcher - cancellation is reported as Cancelled", "[fetcher][cancel]") {
    TestRuntime rt;
    auto net = std::make_shared<FakeNetwork>();
    net->set_file("bafyC", random_data(1024 * 1024));
    net->set_read_delay("bafyC", std::chrono::milliseconds(10), 1024);
    StreamFetcher fetcher(net, TransferConfig{});
    MemorySink sink;

    CancelSource source;
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        source.cancel();
    });
    auto code = error_of(rt, fetcher.fetch("bafyC", sink, source.token()));
    canceller.join();

    REQUIRE(code == ErrorCode::Cancelled);
    REQUIRE(sink.bytes().size() < 1024 * 1024);
}

TEST_CASE("StreamFetcher - read failure is TransferFailed", "[fetcher][error]") {
    TestRuntime rt;
    auto net = std::make_shared<FakeNetwork>();
    net->set_file("bafyR", random_data(100000));
    net->set_fail_at("bafyR", 50000);
    StreamFetcher fetcher(net, TransferConfig{});
    MemorySink sink;

    std::string message;
    auto code = error_of(rt, fetcher.fetch("bafyR", sink, CancelToken{}), &message);
    REQUIRE(code == ErrorCode::TransferFailed);
    REQUIRE(message.find("failed to read stream") != std::string::npos);
    REQUIRE(sink.bytes().size() == 50000);
}

TEST_CASE("StreamFetcher - missing object is TransferFailed", "[fetcher][error]") {
    TestRuntime rt;
    auto net = std::make_shared<FakeNetwork>();
    StreamFetcher fetcher(net, TransferConfig{});
    MemorySink sink;

    std::string message;
    auto code = error_of(rt, fetcher.fetch("bafyNone", sink, CancelToken{}), &message);
    REQUIRE(code == ErrorCode::TransferFailed);
    REQUIRE(message.find("failed to open stream") != std::string::npos);
}

TEST_CASE("StreamFetcher - sink failure is WriteFailed", "[fetcher][error]") {
    TestRuntime rt;
    auto net = std::make_shared<FakeNetwork>();
    net->set_file("bafyW", random_data(300000));
    StreamFetcher fetcher(net, TransferConfig{});
    MemorySink sink;
    sink.fail_after(1000);

    REQUIRE(error_of(rt, fetcher.fetch("bafyW", sink, CancelToken{})) == ErrorCode::WriteFailed);
}

TEST_CASE("FileSink - sealed sink rejects writes", "[fetcher][sink]") {
    TestRuntime rt;
    auto dir = temp_dir("sink");
    FileSink sink(dir / "out.bin");
    uint8_t bytes[4] = {1, 2, 3, 4};
    rt.run(sink.write(bytes, 4));
    sink.seal();

    REQUIRE(sink.sealed());
    REQUIRE_THROWS_AS(rt.run(sink.write(bytes, 4)), CidBoostError);
    REQUIRE(sink.bytes_written() == 4);
    REQUIRE(std::filesystem::file_size(dir / "out.bin") == 4);
    std::filesystem::remove_all(dir);
}
