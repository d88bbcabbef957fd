#include <catch2/catch_test_macros.hpp>
#include "cidboost/base/config.h"
#include "fakes.h"
#include <cstdlib>
#include <fstream>
#include <vector>

using namespace cidboost;

namespace {

// argv-style view over a list of strings
struct Args {
    explicit Args(std::vector<std::string> list) : storage(std::move(list)) {
        for (auto& s : storage) {
            pointers.push_back(s.data());
        }
    }
    int argc() { return static_cast<int>(pointers.size()); }
    char** argv() { return pointers.data(); }

    std::vector<std::string> storage;
    std::vector<char*> pointers;
};

std::string write_ini(const std::string& name, const std::string& content) {
    auto path = test::temp_dir(name) / "cidboost.conf";
    std::ofstream out(path);
    out << content;
    return path.string();
}

} // anonymous namespace

TEST_CASE("Config - defaults", "[config]") {
    auto& config = Config::instance();
    config.reset();
    const auto& c = config.get();

    REQUIRE(c.node.api_address == "127.0.0.1");
    REQUIRE(c.node.api_port == 5001);
    REQUIRE(c.booster.negative_cache_ttl_ms == 5000);
    REQUIRE(c.booster.positive_cache_ttl_sec == 300);
    REQUIRE(c.connection.boost_high_water == 2000);
    REQUIRE(c.connection.default_grace_period == "20s");
    REQUIRE(c.health.failure_threshold == 2);
    REQUIRE(config.validate());
}

TEST_CASE("Config - INI file sections", "[config]") {
    auto& config = Config::instance();
    config.reset();

    auto path = write_ini("config_ini",
        "# node endpoint\n"
        "[node]\n"
        "api_address = \"10.0.0.5\"\n"
        "api_port = 6001\n"
        "\n"
        "[booster]\n"
        "max_parallel_connects = 8\n"
        "add_to_peering = no\n"
        "\n"
        "[transfer]\n"
        "download_dir = /tmp/cidboost-downloads\n"
        "speed_smoothing = 0.5\n"
        "\n"
        "[health]\n"
        "enable = false\n"
        "failure_threshold = 3\n");

    REQUIRE(config.load_from_file(path));
    const auto& c = config.get();
    REQUIRE(c.node.api_address == "10.0.0.5");
    REQUIRE(c.node.api_port == 6001);
    REQUIRE(c.booster.max_parallel_connects == 8);
    REQUIRE_FALSE(c.booster.add_to_peering);
    REQUIRE(c.transfer.download_dir == "/tmp/cidboost-downloads");
    REQUIRE(c.transfer.speed_smoothing == 0.5);
    REQUIRE_FALSE(c.health.enable);
    REQUIRE(c.health.failure_threshold == 3);
    REQUIRE(config.get_config_file() == path);
}

TEST_CASE("Config - bad values", "[config]") {
    auto& config = Config::instance();
    config.reset();

    SECTION("Missing file") {
        REQUIRE_FALSE(config.load_from_file("/nonexistent/cidboost.conf"));
    }

    SECTION("Non-numeric value") {
        auto path = write_ini("config_bad", "[node]\napi_port = lots\n");
        REQUIRE_FALSE(config.load_from_file(path));
    }

    SECTION("Validation") {
        config.get().transfer.chunk_size = 0;
        REQUIRE_FALSE(config.validate());
        config.reset();

        config.get().transfer.pipe_capacity = 1024;
        config.get().transfer.chunk_size = 4096;
        REQUIRE_FALSE(config.validate());
        config.reset();

        config.get().transfer.speed_smoothing = 0.0;
        REQUIRE_FALSE(config.validate());
        config.reset();

        config.get().log.output = "file";
        REQUIRE_FALSE(config.validate());
    }
    config.reset();
}

TEST_CASE("Config - file, environment and command line layering", "[config][cli]") {
    auto& config = Config::instance();
    config.reset();

    auto path = write_ini("config_layers",
        "[node]\napi_port = 6001\napi_address = 10.1.1.1\n"
        "[transfer]\nworker_threads = 2\n");
    ::setenv("CIDBOOST_API_PORT", "7001", 1);
    ::setenv("CIDBOOST_WORKER_THREADS", "6", 1);

    Args args({"cidboost", "-c", path, "--api-port", "8001", "--cid", "bafyexample",
               "--file-id", "42", "--password", "hunter2", "--no-health"});
    bool parsed = config.parse_command_line(args.argc(), args.argv());

    ::unsetenv("CIDBOOST_API_PORT");
    ::unsetenv("CIDBOOST_WORKER_THREADS");

    REQUIRE(parsed);
    const auto& c = config.get();
    REQUIRE(c.node.api_address == "10.1.1.1");  // file only
    REQUIRE(c.transfer.worker_threads == 6);     // env over file
    REQUIRE(c.node.api_port == 8001);            // command line over env
    REQUIRE(c.request.cid == "bafyexample");
    REQUIRE(c.request.file_id == uint64_t{42});
    REQUIRE(c.request.password == std::string("hunter2"));
    REQUIRE_FALSE(c.health.enable);
    config.reset();
}

TEST_CASE("Config - download directory default", "[config]") {
    TransferConfig transfer;
    transfer.download_dir = "/data/in";
    REQUIRE(resolve_download_dir(transfer) == "/data/in");

    transfer.download_dir.clear();
    if (const char* home = std::getenv("HOME")) {
        REQUIRE(resolve_download_dir(transfer) == (std::filesystem::path(home) / "Downloads").string());
    } else {
        REQUIRE(resolve_download_dir(transfer) == "downloads");
    }
}
