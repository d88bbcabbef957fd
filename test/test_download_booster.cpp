#include <catch2/catch_test_macros.hpp>
#include "cidboost/base/error_code.h"
#include "cidboost/p2p/download_booster.h"
#include "fakes.h"

using namespace cidboost;
using namespace cidboost::test;

namespace {

BoosterConfig fast_config() {
    BoosterConfig config;
    config.discovery_timeout_ms = 1000;
    config.connect_timeout_ms = 200;
    config.early_exit_grace_ms = 50;
    config.prefetch_wait_ms = 50;
    config.prefetch_timeout_sec = 1;
    return config;
}

PeerInfo peer(const std::string& id) {
    return PeerInfo{id, {"/ip4/10.0.0.1/tcp/4001"}};
}

} // anonymous namespace

TEST_CASE("DownloadBooster - positive cache skips discovery", "[booster][cache]") {
    TestRuntime rt;
    auto net = std::make_shared<FakeNetwork>();
    DownloadBooster booster(fast_config(), net);

    booster.manually_add_provider("bafyA", peer("peerA"));
    REQUIRE(booster.has_cached_providers("bafyA"));

    auto result = rt.run(booster.warmup_cid("bafyA"));
    REQUIRE(result.ok());
    REQUIRE(result.from_cache);
    REQUIRE(result.providers == 1);
    REQUIRE(net->find_calls.load() == 0);
    REQUIRE(booster.get_stats().cache_hits == 1);
}

TEST_CASE("DownloadBooster - negative cache fails fast", "[booster][cache][negative]") {
    TestRuntime rt;
    auto net = std::make_shared<FakeNetwork>();
    DownloadBooster booster(fast_config(), net);

    auto first = rt.run(booster.warmup_cid("bafyMissing"));
    REQUIRE(is_error(first.error, ErrorCode::ProviderNotFound));
    REQUIRE_FALSE(first.from_cache);
    REQUIRE(net->find_calls.load() == 1);

    auto second = rt.run(booster.warmup_cid("bafyMissing"));
    REQUIRE(is_error(second.error, ErrorCode::ProviderNotFound));
    REQUIRE(second.from_cache);
    REQUIRE(net->find_calls.load() == 1);
    REQUIRE_FALSE(booster.has_cached_providers("bafyMissing"));

    booster.clear_negative_cache_for_cid("bafyMissing");
    auto third = rt.run(booster.warmup_cid("bafyMissing"));
    REQUIRE(is_error(third.error, ErrorCode::ProviderNotFound));
    REQUIRE(net->find_calls.load() == 2);
}

TEST_CASE("DownloadBooster - discovery connects and caches providers", "[booster][discovery]") {
    TestRuntime rt;
    auto net = std::make_shared<FakeNetwork>();
    net->set_providers("bafyB", {peer("p1"), peer("p2"), peer("p3")});
    net->set_file("bafyB", random_data(4096));
    DownloadBooster booster(fast_config(), net);

    auto result = rt.run(booster.warmup_cid("bafyB"));
    REQUIRE(result.ok());
    REQUIRE_FALSE(result.from_cache);
    REQUIRE(result.providers >= 1);
    REQUIRE(booster.has_cached_providers("bafyB"));

    auto cached = booster.get_cached_providers("bafyB");
    REQUIRE(cached.size() == result.providers);

    // Connection attempts may still land after the warmup returned
    REQUIRE(wait_until([&] {
        return booster.get_connection_quality(cached.front().id).has_value();
    }));
    REQUIRE(wait_until([&] { return net->peering_calls.load() >= 1; }));

    auto again = rt.run(booster.warmup_cid("bafyB"));
    REQUIRE(again.from_cache);
    REQUIRE(net->find_calls.load() == 1);
}

TEST_CASE("DownloadBooster - unreachable providers are still cached", "[booster][discovery]") {
    TestRuntime rt;
    auto net = std::make_shared<FakeNetwork>();
    net->set_providers("bafyC", {peer("down1"), peer("down2")});
    net->set_connect_result("down1", false);
    net->set_connect_result("down2", false);
    DownloadBooster booster(fast_config(), net);

    auto result = rt.run(booster.warmup_cid("bafyC"));
    REQUIRE(result.ok());
    REQUIRE(result.providers == 2);
    REQUIRE(result.connected == 0);
    REQUIRE_FALSE(booster.get_connection_quality("down1").has_value());
    REQUIRE(wait_until([&] { return booster.get_stats().connection_failures == 2; }));
}

TEST_CASE("DownloadBooster - concurrent warmups share one discovery", "[booster][dedupe]") {
    TestRuntime rt;
    auto net = std::make_shared<FakeNetwork>();
    net->set_providers("bafyD", {peer("p1")});
    auto booster = std::make_shared<DownloadBooster>(fast_config(), net);

    auto both = [](std::shared_ptr<DownloadBooster> b) -> elio::coro::task<int> {
        const std::string cid = "bafyD";
        std::vector<elio::coro::join_handle<WarmupResult>> handles;
        for (int i = 0; i < 4; ++i) {
            handles.push_back(b->warmup_cid(cid).spawn());
        }
        int ok = 0;
        for (auto& handle : handles) {
            auto result = co_await handle;
            if (result.ok()) ++ok;
        }
        co_return ok;
    };

    REQUIRE(rt.run(both(booster)) == 4);
    REQUIRE(net->find_calls.load() == 1);
}

TEST_CASE("DownloadBooster - cancelled warmup reports Cancelled", "[booster][cancel]") {
    TestRuntime rt;
    auto net = std::make_shared<FakeNetwork>();
    net->set_providers("bafyE", {peer("p1")});
    DownloadBooster booster(fast_config(), net);

    CancelSource source;
    source.cancel();
    auto result = rt.run(booster.warmup_cid("bafyE", source.token()));
    REQUIRE(is_error(result.error, ErrorCode::Cancelled));
    REQUIRE_FALSE(booster.has_cached_providers("bafyE"));
}

TEST_CASE("DownloadBooster - manual provider replaces a negative entry", "[booster][cache]") {
    TestRuntime rt;
    auto net = std::make_shared<FakeNetwork>();
    DownloadBooster booster(fast_config(), net);

    auto miss = rt.run(booster.warmup_cid("bafyF"));
    REQUIRE(is_error(miss.error, ErrorCode::ProviderNotFound));

    booster.manually_add_provider("bafyF", peer("seed"));
    booster.manually_add_provider("bafyF", peer("seed"));
    REQUIRE(booster.get_cached_providers("bafyF").size() == 1);

    auto hit = rt.run(booster.warmup_cid("bafyF"));
    REQUIRE(hit.ok());
    REQUIRE(hit.from_cache);

    booster.clear_cache_for_cid("bafyF");
    REQUIRE_FALSE(booster.has_cached_providers("bafyF"));
}

TEST_CASE("DownloadBooster - first connection ends discovery", "[booster][discovery][early-exit]") {
    TestRuntime rt;
    auto net = std::make_shared<FakeNetwork>();
    std::vector<PeerInfo> providers;
    for (int i = 0; i < 10; ++i) {
        providers.push_back(peer("slow" + std::to_string(i)));
    }
    net->set_providers("bafyG", providers);
    net->set_provider_interval("bafyG", std::chrono::milliseconds(100));

    auto config = fast_config();
    config.discovery_timeout_ms = 5000;
    config.min_providers_for_early_exit = 100;
    DownloadBooster booster(config, net);

    auto start = std::chrono::steady_clock::now();
    auto result = rt.run(booster.warmup_cid("bafyG"));
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(result.ok());
    REQUIRE(result.connected >= 1);
    REQUIRE(result.providers <= 2);
    REQUIRE(elapsed < std::chrono::milliseconds(700));
}

TEST_CASE("DownloadBooster - connection inside the grace window ends discovery", "[booster][discovery][early-exit]") {
    TestRuntime rt;
    auto net = std::make_shared<FakeNetwork>();
    net->set_providers("bafyH", {peer("h1"), peer("h2"), peer("h3"), peer("h4"), peer("h5")});
    net->set_connect_delay(std::chrono::milliseconds(50));

    auto config = fast_config();
    config.min_providers_for_early_exit = 2;
    config.early_exit_grace_ms = 1000;
    DownloadBooster booster(config, net);

    auto start = std::chrono::steady_clock::now();
    auto result = rt.run(booster.warmup_cid("bafyH"));
    auto elapsed = std::chrono::steady_clock::now() - start;

    // Two found, then the grace window waits for a dial instead of collecting more
    REQUIRE(result.ok());
    REQUIRE(result.providers == 2);
    REQUIRE(result.connected >= 1);
    REQUIRE(elapsed < std::chrono::milliseconds(800));
}

TEST_CASE("DownloadBooster - expired grace window keeps collecting", "[booster][discovery][early-exit]") {
    TestRuntime rt;
    auto net = std::make_shared<FakeNetwork>();
    net->set_providers("bafyI", {peer("i1"), peer("i2"), peer("i3")});
    for (const char* id : {"i1", "i2", "i3"}) {
        net->set_connect_result(id, false);
    }

    auto config = fast_config();
    config.min_providers_for_early_exit = 2;
    config.early_exit_grace_ms = 100;
    DownloadBooster booster(config, net);

    auto start = std::chrono::steady_clock::now();
    auto result = rt.run(booster.warmup_cid("bafyI"));
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(result.ok());
    REQUIRE(result.providers == 3);
    REQUIRE(result.connected == 0);
    // One window after the second provider and one after the third
    REQUIRE(elapsed >= std::chrono::milliseconds(200));
}

TEST_CASE("DownloadBooster - parallel dials are bounded", "[booster][discovery][connect]") {
    TestRuntime rt(4);
    auto net = std::make_shared<FakeNetwork>();
    std::vector<PeerInfo> providers;
    for (int i = 0; i < 8; ++i) {
        providers.push_back(peer("d" + std::to_string(i)));
        net->set_connect_result("d" + std::to_string(i), false);
    }
    net->set_providers("bafyJ", providers);
    net->set_connect_delay(std::chrono::milliseconds(50));

    auto config = fast_config();
    config.max_parallel_connects = 2;
    config.early_exit_grace_ms = 10;
    DownloadBooster booster(config, net);

    auto result = rt.run(booster.warmup_cid("bafyJ"));
    REQUIRE(result.providers == 8);

    // Queued dials drain in the background
    REQUIRE(wait_until([&] { return booster.get_stats().connection_failures == 8; }));
    REQUIRE(net->connect_calls.load() == 8);
    REQUIRE(net->max_dials_in_flight.load() == 2);
    REQUIRE(net->dials_in_flight.load() == 0);
}

TEST_CASE("DownloadBooster - negative entries expire", "[booster][cache][negative]") {
    TestRuntime rt;
    auto net = std::make_shared<FakeNetwork>();
    auto config = fast_config();
    config.negative_cache_ttl_ms = 100;
    DownloadBooster booster(config, net);

    rt.run(booster.warmup_cid("bafyK"));
    auto cached = rt.run(booster.warmup_cid("bafyK"));
    REQUIRE(cached.from_cache);
    REQUIRE(net->find_calls.load() == 1);

    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    auto fresh = rt.run(booster.warmup_cid("bafyK"));
    REQUIRE_FALSE(fresh.from_cache);
    REQUIRE(is_error(fresh.error, ErrorCode::ProviderNotFound));
    REQUIRE(net->find_calls.load() == 2);
}

TEST_CASE("DownloadBooster - positive entries expire", "[booster][cache]") {
    TestRuntime rt;
    auto net = std::make_shared<FakeNetwork>();
    net->set_providers("bafyL", {peer("fresh")});
    auto config = fast_config();
    config.positive_cache_ttl_sec = 1;
    DownloadBooster booster(config, net);

    booster.manually_add_provider("bafyL", peer("stale"));
    REQUIRE(booster.has_cached_providers("bafyL"));

    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    REQUIRE_FALSE(booster.has_cached_providers("bafyL"));
    REQUIRE(booster.get_cached_providers("bafyL").empty());

    auto result = rt.run(booster.warmup_cid("bafyL"));
    REQUIRE(result.ok());
    REQUIRE_FALSE(result.from_cache);
    REQUIRE(net->find_calls.load() == 1);
    auto providers = booster.get_cached_providers("bafyL");
    REQUIRE(providers.size() == 1);
    REQUIRE(providers.front().id == "fresh");
}

TEST_CASE("DownloadBooster - slow prefetch does not hold up warmup", "[booster][prefetch]") {
    TestRuntime rt;
    auto net = std::make_shared<FakeNetwork>();
    net->set_providers("bafyM", {peer("m1")});
    net->set_file("bafyM", random_data(64 * 1024));
    net->set_read_delay("bafyM", std::chrono::milliseconds(400), 1024);

    auto config = fast_config();
    config.prefetch_wait_ms = 100;
    DownloadBooster booster(config, net);

    auto start = std::chrono::steady_clock::now();
    auto result = rt.run(booster.warmup_cid("bafyM"));
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(result.ok());
    REQUIRE(elapsed < std::chrono::milliseconds(350));
    REQUIRE(booster.get_stats().prefetches_completed == 0);

    // The prefetch gives up at its own time limit
    REQUIRE(wait_until([&] { return booster.get_stats().prefetches_completed == 1; },
                       std::chrono::seconds(3)));
}

TEST_CASE("DownloadBooster - cancellation interrupts a slow discovery", "[booster][cancel]") {
    TestRuntime rt;
    auto net = std::make_shared<FakeNetwork>();
    net->set_providers("bafyN", {peer("n1"), peer("n2")});
    net->set_provider_interval("bafyN", std::chrono::seconds(2));

    auto config = fast_config();
    config.discovery_timeout_ms = 10000;
    DownloadBooster booster(config, net);

    CancelSource source;
    std::thread canceller([&source] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        source.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    auto result = rt.run(booster.warmup_cid("bafyN", source.token()));
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    REQUIRE(is_error(result.error, ErrorCode::Cancelled));
    REQUIRE(elapsed < std::chrono::milliseconds(1000));
    REQUIRE_FALSE(booster.has_cached_providers("bafyN"));
}

TEST_CASE("PeerInfo - dial address", "[booster][peer]") {
    REQUIRE(peer("abc").dial_address() == "/ip4/10.0.0.1/tcp/4001/p2p/abc");
    REQUIRE(PeerInfo{"abc", {}}.dial_address() == "/p2p/abc");
}
