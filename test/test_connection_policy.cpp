#include <catch2/catch_test_macros.hpp>
#include "cidboost/base/error_code.h"
#include "cidboost/p2p/connection_policy.h"
#include "fakes.h"

using namespace cidboost;
using namespace cidboost::test;

namespace {

std::shared_ptr<FakeConfigurator> node_with_limits() {
    auto node = std::make_shared<FakeConfigurator>();
    node->set_value(kConnMgrHighWater, "900");
    node->set_value(kConnMgrLowWater, "600");
    node->set_value(kConnMgrGracePeriod, "\"30s\"");
    return node;
}

} // anonymous namespace

TEST_CASE("ConnectionPolicy - restore without boost is a no-op", "[policy][restore]") {
    TestRuntime rt;
    auto node = node_with_limits();
    ConnectionPolicyManager policy(ConnectionPolicyConfig{}, node);

    REQUIRE_FALSE(rt.run(policy.restore_defaults("bafyA")));
    REQUIRE_FALSE(rt.run(policy.restore_defaults("bafyA")));
    REQUIRE(node->set_calls.load() == 0);
    REQUIRE_FALSE(policy.is_boosted());
}

TEST_CASE("ConnectionPolicy - boost applies limits and restore puts originals back", "[policy][boost]") {
    TestRuntime rt;
    auto node = node_with_limits();
    ConnectionPolicyManager policy(ConnectionPolicyConfig{}, node);

    REQUIRE_FALSE(rt.run(policy.boost_for_download("bafyA")));
    REQUIRE(policy.is_boosted());
    REQUIRE(policy.active_downloads() == 1);
    REQUIRE(node->value(kConnMgrHighWater) == "2000");
    REQUIRE(node->value(kConnMgrLowWater) == "1500");
    REQUIRE(node->value(kConnMgrGracePeriod) == "\"120s\"");

    REQUIRE_FALSE(rt.run(policy.restore_defaults("bafyA")));
    REQUIRE_FALSE(policy.is_boosted());
    REQUIRE(node->value(kConnMgrHighWater) == "900");
    REQUIRE(node->value(kConnMgrLowWater) == "600");
    REQUIRE(node->value(kConnMgrGracePeriod) == "\"30s\"");

    int writes = node->set_calls.load();
    REQUIRE_FALSE(rt.run(policy.restore_defaults("bafyA")));
    REQUIRE(node->set_calls.load() == writes);
}

TEST_CASE("ConnectionPolicy - second restore after a boost changes nothing", "[policy][restore]") {
    TestRuntime rt;
    auto node = node_with_limits();
    ConnectionPolicyManager policy(ConnectionPolicyConfig{}, node);

    REQUIRE_FALSE(rt.run(policy.boost_for_download("bafyA")));
    REQUIRE_FALSE(rt.run(policy.restore_defaults("bafyA")));
    int writes = node->set_calls.load();
    REQUIRE(writes == 6);

    // The user changed the node in between; a stale restore must not undo it
    node->set_value(kConnMgrHighWater, "1234");
    REQUIRE_FALSE(rt.run(policy.restore_defaults("bafyA")));
    REQUIRE(node->set_calls.load() == writes);
    REQUIRE(node->value(kConnMgrHighWater) == "1234");
    REQUIRE_FALSE(policy.is_boosted());
    REQUIRE(policy.active_downloads() == 0);
}

TEST_CASE("ConnectionPolicy - concurrent boosts apply the limits once", "[policy][concurrent]") {
    TestRuntime rt(4);
    auto node = node_with_limits();
    node->set_write_delay(std::chrono::milliseconds(20));
    auto policy = std::make_shared<ConnectionPolicyManager>(ConnectionPolicyConfig{}, node);

    auto boost_all = [](std::shared_ptr<ConnectionPolicyManager> p) -> elio::coro::task<int> {
        std::vector<std::string> cids = {"bafy0", "bafy1", "bafy2", "bafy3"};
        std::vector<elio::coro::join_handle<std::error_code>> handles;
        for (const auto& cid : cids) {
            handles.push_back(p->boost_for_download(cid).spawn());
        }
        int failed = 0;
        for (auto& handle : handles) {
            auto ec = co_await handle;
            if (ec) ++failed;
        }
        co_return failed;
    };

    REQUIRE(rt.run(boost_all(policy)) == 0);
    REQUIRE(node->set_calls.load() == 3);
    REQUIRE(policy->active_downloads() == 4);

    for (int i = 0; i < 4; ++i) {
        REQUIRE_FALSE(rt.run(policy->restore_defaults("bafy" + std::to_string(i))));
    }
    REQUIRE(node->set_calls.load() == 6);
    REQUIRE(node->value(kConnMgrHighWater) == "900");
}

TEST_CASE("ConnectionPolicy - unreadable limits restore to defaults", "[policy][restore]") {
    TestRuntime rt;
    auto node = std::make_shared<FakeConfigurator>();
    ConnectionPolicyManager policy(ConnectionPolicyConfig{}, node);

    REQUIRE_FALSE(rt.run(policy.boost_for_download("bafyA")));
    REQUIRE_FALSE(rt.run(policy.restore_defaults("bafyA")));
    REQUIRE(node->value(kConnMgrHighWater) == "600");
    REQUIRE(node->value(kConnMgrLowWater) == "100");
    REQUIRE(node->value(kConnMgrGracePeriod) == "\"20s\"");
}

TEST_CASE("ConnectionPolicy - boost held until the last download finishes", "[policy][concurrent]") {
    TestRuntime rt;
    auto node = node_with_limits();
    ConnectionPolicyManager policy(ConnectionPolicyConfig{}, node);

    REQUIRE_FALSE(rt.run(policy.boost_for_download("bafyA")));
    REQUIRE_FALSE(rt.run(policy.boost_for_download("bafyB")));
    REQUIRE(node->set_calls.load() == 3);
    REQUIRE(policy.active_downloads() == 2);

    REQUIRE_FALSE(rt.run(policy.restore_defaults("bafyA")));
    REQUIRE(policy.is_boosted());
    REQUIRE(node->value(kConnMgrHighWater) == "2000");

    REQUIRE_FALSE(rt.run(policy.restore_defaults("bafyB")));
    REQUIRE_FALSE(policy.is_boosted());
    REQUIRE(node->value(kConnMgrHighWater) == "900");
}

TEST_CASE("ConnectionPolicy - failed boost leaves policy unboosted", "[policy][boost][error]") {
    TestRuntime rt;
    auto node = node_with_limits();
    node->fail_writes(true);
    ConnectionPolicyManager policy(ConnectionPolicyConfig{}, node);

    auto ec = rt.run(policy.boost_for_download("bafyA"));
    REQUIRE(ec);
    REQUIRE_FALSE(policy.is_boosted());

    node->fail_writes(false);
    REQUIRE_FALSE(rt.run(policy.restore_defaults("bafyA")));
    REQUIRE(policy.active_downloads() == 0);
}

TEST_CASE("ConnectionPolicy - auto restore drops stale downloads", "[policy][auto-restore]") {
    TestRuntime rt;
    auto node = node_with_limits();
    ConnectionPolicyConfig config;
    config.auto_restore_sec = 0;
    ConnectionPolicyManager policy(config, node);

    REQUIRE_FALSE(rt.run(policy.boost_for_download("bafyA")));
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    rt.run(policy.auto_restore());
    REQUIRE(policy.active_downloads() == 0);
    REQUIRE_FALSE(policy.is_boosted());
    REQUIRE(node->value(kConnMgrHighWater) == "900");
}

TEST_CASE("ConnectionPolicy - protect peers peers only connected ones", "[policy][peering]") {
    TestRuntime rt;
    auto node = node_with_limits();
    auto net = std::make_shared<FakeNetwork>();
    net->set_swarm({SwarmPeer{"p1", "/ip4/10.0.0.1/tcp/4001", std::chrono::milliseconds(20)}});
    ConnectionPolicyManager policy(ConnectionPolicyConfig{}, node, net);

    auto ec = rt.run(policy.protect_peers({"p1", "p2"}));
    REQUIRE(is_error(ec, ErrorCode::NotFound));
    REQUIRE(net->peered() == std::vector<std::string>{"p1"});
}
