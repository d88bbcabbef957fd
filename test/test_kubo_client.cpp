#include <catch2/catch_test_macros.hpp>
#include "cidboost/base/error_code.h"
#include "cidboost/net/kubo_client.h"

using namespace cidboost;
using namespace cidboost::kubo;
using namespace std::chrono_literals;

TEST_CASE("Kubo - Go durations", "[kubo][duration]") {
    REQUIRE(parse_go_duration("1.5ms") == std::chrono::nanoseconds(1500000));
    REQUIRE(parse_go_duration("2m3s") == std::chrono::nanoseconds(123s));
    REQUIRE(parse_go_duration("850\xC2\xB5s") == std::chrono::nanoseconds(850us));
    REQUIRE(parse_go_duration("1h") == std::chrono::nanoseconds(1h));
    REQUIRE(parse_go_duration("0") == std::chrono::nanoseconds(0));
    REQUIRE_FALSE(parse_go_duration("n/a"));
    REQUIRE_FALSE(parse_go_duration(""));
    REQUIRE_FALSE(parse_go_duration("12parsecs"));
}

TEST_CASE("Kubo - query helpers", "[kubo][query]") {
    REQUIRE(format_timeout(1500ms) == "1500ms");
    REQUIRE(format_timeout(0ms) == "1ms");
    REQUIRE(url_encode("Swarm.ConnMgr.HighWater") == "Swarm.ConnMgr.HighWater");
    REQUIRE(url_encode("/ip4/1.2.3.4/tcp/4001") == "%2Fip4%2F1.2.3.4%2Ftcp%2F4001");
    REQUIRE(url_encode("\"20s\"") == "%2220s%22");
}

TEST_CASE("Kubo - provider records", "[kubo][findprovs]") {
    auto peers = parse_provider_record(
        R"({"Extra":"","ID":"","Responses":[{"Addrs":["/ip4/1.2.3.4/tcp/4001"],"ID":"12D3KooWA"},)"
        R"({"Addrs":[],"ID":"12D3KooWB"}],"Type":4})");
    REQUIRE(peers.size() == 2);
    REQUIRE(peers[0].id == "12D3KooWA");
    REQUIRE(peers[0].addrs == std::vector<std::string>{"/ip4/1.2.3.4/tcp/4001"});
    REQUIRE(peers[1].addrs.empty());

    // Query progress events carry peers that are not providers
    REQUIRE(parse_provider_record(R"({"ID":"x","Responses":[{"ID":"12D3KooWC","Addrs":[]}],"Type":1})").empty());
    REQUIRE(parse_provider_record("not json").empty());
}

TEST_CASE("Kubo - swarm peers with latency", "[kubo][swarm]") {
    auto peers = parse_swarm_peers(
        R"({"Peers":[{"Addr":"/ip4/1.1.1.1/tcp/4001","Peer":"A","Latency":"23.5ms"},)"
        R"({"Addr":"/ip4/2.2.2.2/udp/4001/quic-v1","Peer":"B","Latency":"n/a"}]})");
    REQUIRE(peers.size() == 2);
    REQUIRE(peers[0].latency == std::chrono::milliseconds(23));
    REQUIRE(peers[0].address == "/ip4/1.1.1.1/tcp/4001");
    REQUIRE_FALSE(peers[1].latency);
    REQUIRE(parse_swarm_peers(R"({"Peers":null})").empty());
}

TEST_CASE("Kubo - file stat, ping and errors", "[kubo][parse]") {
    REQUIRE(parse_file_stat_size(R"({"Hash":"bafy","Size":1024,"Type":"file"})") == 1024);
    REQUIRE_FALSE(parse_file_stat_size(R"({"Hash":"bafy","Size":0,"Type":"directory"})"));
    REQUIRE_FALSE(parse_file_stat_size("{}"));

    REQUIRE(parse_ping_success(
        "{\"Success\":true,\"Time\":0,\"Text\":\"PING QmX.\"}\n"
        "{\"Success\":true,\"Time\":1830000,\"Text\":\"\"}\n"));
    REQUIRE_FALSE(parse_ping_success("{\"Success\":false,\"Time\":0,\"Text\":\"ping failed\"}\n"));

    REQUIRE(error_message(R"({"Message":"routing: not found","Code":0,"Type":"error"})") == "routing: not found");
    REQUIRE(error_message("  plain failure \n") == "plain failure");
}

TEST_CASE("HttpBodyDecoder - chunked body with trailers", "[kubo][http]") {
    HttpBodyDecoder decoder(HttpBodyDecoder::Mode::Chunked);
    std::string wire = "5\r\nhello\r\n6;ext=1\r\n world\r\n0\r\nX-Stream-Error: read failed\r\n\r\n";
    std::string body;

    // Byte by byte to cover split framing
    size_t consumed = 0;
    for (char c : wire) {
        consumed += decoder.decode(&c, 1, body);
    }
    REQUIRE(consumed == wire.size());
    REQUIRE(decoder.done());
    REQUIRE(body == "hello world");
    REQUIRE(decoder.trailers().at("x-stream-error") == "read failed");
}

TEST_CASE("HttpBodyDecoder - content length and close framing", "[kubo][http]") {
    HttpBodyDecoder sized(HttpBodyDecoder::Mode::ContentLength, 4);
    std::string body;
    REQUIRE(sized.decode("abcdef", 6, body) == 4);
    REQUIRE(sized.done());
    REQUIRE(body == "abcd");

    HttpBodyDecoder until_close(HttpBodyDecoder::Mode::UntilClose);
    std::string rest;
    until_close.decode("xyz", 3, rest);
    REQUIRE_FALSE(until_close.done());
    until_close.finish();
    REQUIRE(until_close.done());
    REQUIRE(rest == "xyz");

    HttpBodyDecoder truncated(HttpBodyDecoder::Mode::ContentLength, 10);
    std::string partial;
    truncated.decode("abc", 3, partial);
    REQUIRE_THROWS_AS(truncated.finish(), CidBoostError);

    HttpBodyDecoder bad(HttpBodyDecoder::Mode::Chunked);
    std::string ignored;
    REQUIRE_THROWS_AS(bad.decode("zz\r\n", 4, ignored), CidBoostError);
}
