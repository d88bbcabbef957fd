#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include "cidboost/p2p/download_booster.h"
#include "cidboost/p2p/health_monitor.h"
#include "fakes.h"

using namespace cidboost;
using namespace cidboost::test;

namespace {

BoosterConfig quick_booster() {
    BoosterConfig config;
    config.discovery_timeout_ms = 500;
    config.early_exit_grace_ms = 20;
    config.prefetch_wait_ms = 20;
    return config;
}

bool contains(const std::vector<std::string>& ids, const std::string& id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

} // anonymous namespace

TEST_CASE("HealthMonitor - repeated timeouts force rediscovery", "[health][scenario]") {
    TestRuntime rt;
    auto net = std::make_shared<FakeNetwork>();
    net->set_providers("bafyD", {PeerInfo{"slow", {"/ip4/10.0.0.3/tcp/4001"}}});
    auto booster = std::make_shared<DownloadBooster>(quick_booster(), net);
    HealthMonitor health(HealthConfig{}, net, booster);
    health.set_scheduler(rt.scheduler());

    REQUIRE(rt.run(booster->warmup_cid("bafyD")).ok());
    REQUIRE(net->find_calls.load() == 1);
    REQUIRE(booster->has_cached_providers("bafyD"));

    health.on_download_timeout("bafyD");
    REQUIRE(health.failure_count("bafyD") == 1);
    REQUIRE(booster->has_cached_providers("bafyD"));

    health.on_download_timeout("bafyD");
    REQUIRE(health.failure_count("bafyD") == 0);
    REQUIRE_FALSE(booster->has_cached_providers("bafyD"));

    // The captured provider is neither connected nor pingable
    REQUIRE(wait_until([&] { return contains(net->disconnected(), "slow"); }));
    REQUIRE(wait_until([&] { return health.get_status().repairs == 1; }));

    auto again = rt.run(booster->warmup_cid("bafyD"));
    REQUIRE(again.ok());
    REQUIRE_FALSE(again.from_cache);
    REQUIRE(net->find_calls.load() == 2);
}

TEST_CASE("HealthMonitor - healthy providers survive repair", "[health][repair]") {
    TestRuntime rt;
    auto net = std::make_shared<FakeNetwork>();
    net->set_swarm({
        SwarmPeer{"fast", "/ip4/10.0.0.4/tcp/4001", std::chrono::milliseconds(40)},
    });
    net->set_ping_result("pingable", true);
    auto booster = std::make_shared<DownloadBooster>(quick_booster(), net);
    booster->manually_add_provider("bafyR", PeerInfo{"fast", {}});
    booster->manually_add_provider("bafyR", PeerInfo{"pingable", {}});
    booster->manually_add_provider("bafyR", PeerInfo{"dead", {}});

    HealthConfig config;
    config.failure_threshold = 1;
    HealthMonitor health(config, net, booster);
    health.set_scheduler(rt.scheduler());

    health.on_download_timeout("bafyR");
    REQUIRE_FALSE(booster->has_cached_providers("bafyR"));
    REQUIRE(wait_until([&] { return health.get_status().repairs == 1; }));

    auto dropped = net->disconnected();
    REQUIRE(dropped == std::vector<std::string>{"dead"});
}

TEST_CASE("HealthMonitor - success resets the failure count", "[health][counter]") {
    auto net = std::make_shared<FakeNetwork>();
    auto booster = std::make_shared<DownloadBooster>(quick_booster(), net);
    HealthMonitor health(HealthConfig{}, net, booster);

    health.on_download_timeout("bafyS");
    REQUIRE(health.failure_count("bafyS") == 1);
    health.on_download_success("bafyS");
    REQUIRE(health.failure_count("bafyS") == 0);

    auto status = health.get_status();
    REQUIRE_FALSE(status.running);
    REQUIRE(status.failure_counts.empty());
}

TEST_CASE("HealthMonitor - maintenance drops stale peers and clears the cache", "[health][maintenance]") {
    TestRuntime rt;
    auto net = std::make_shared<FakeNetwork>();
    net->set_swarm({
        SwarmPeer{"good", "/ip4/10.0.0.5/tcp/4001", std::chrono::milliseconds(120)},
        SwarmPeer{"stale", "/ip4/10.0.0.6/tcp/4001", std::chrono::milliseconds(45000)},
        SwarmPeer{"unmeasured", "/ip4/10.0.0.7/tcp/4001", std::nullopt},
    });
    auto booster = std::make_shared<DownloadBooster>(quick_booster(), net);
    booster->manually_add_provider("bafyM", PeerInfo{"good", {}});
    HealthMonitor health(HealthConfig{}, net, booster);
    health.on_download_timeout("bafyM");

    rt.run(health.run_maintenance());

    auto dropped = net->disconnected();
    REQUIRE(dropped.size() == 2);
    REQUIRE(contains(dropped, "stale"));
    REQUIRE(contains(dropped, "unmeasured"));
    REQUIRE_FALSE(booster->has_cached_providers("bafyM"));

    auto status = health.get_status();
    REQUIRE(status.last_maintenance.has_value());
    REQUIRE(status.maintenance_runs == 1);
    REQUIRE(status.peers_disconnected == 2);
    REQUIRE(status.failure_counts.empty());
    REQUIRE(status.to_json()["maintenance_runs"] == 1);
}

TEST_CASE("HealthMonitor - start and stop", "[health][lifecycle]") {
    TestRuntime rt;
    auto net = std::make_shared<FakeNetwork>();
    auto booster = std::make_shared<DownloadBooster>(quick_booster(), net);
    HealthMonitor health(HealthConfig{}, net, booster);

    REQUIRE_FALSE(health.start());
    health.set_scheduler(rt.scheduler());
    REQUIRE(health.start());
    REQUIRE(health.is_running());
    REQUIRE(health.get_status().running);
    health.stop();
    REQUIRE_FALSE(health.is_running());
}
