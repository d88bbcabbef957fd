#ifndef CIDBOOST_BASE_CONFIG_H
#define CIDBOOST_BASE_CONFIG_H

#include <cstdint>
#include <optional>
#include <string>

namespace cidboost {

// Log configuration
struct LogConfig {
    std::string level = "info";
    std::string output = "stdout";  // stdout, stderr, file
    std::string file_path = "";
};

// Kubo RPC endpoint of the local content node
struct NodeConfig {
    std::string api_address = "127.0.0.1";
    uint16_t api_port = 5001;
};

// Provider discovery and session pre-warming
struct BoosterConfig {
    uint32_t negative_cache_ttl_ms = 5000;
    uint32_t positive_cache_ttl_sec = 300;
    uint32_t min_providers_for_early_exit = 2;
    uint32_t max_connected_for_early_exit = 1;
    uint32_t discovery_timeout_ms = 10000;
    uint32_t connect_timeout_ms = 5000;
    uint32_t early_exit_grace_ms = 500;
    uint32_t max_parallel_connects = 5;
    uint32_t prefetch_bytes = 256 * 1024;
    uint32_t prefetch_wait_ms = 500;
    uint32_t prefetch_timeout_sec = 30;
    bool add_to_peering = true;
};

// Connection manager watermarks applied while downloads are active
struct ConnectionPolicyConfig {
    uint32_t boost_high_water = 2000;
    uint32_t boost_low_water = 1500;
    std::string boost_grace_period = "120s";
    uint32_t default_high_water = 600;
    uint32_t default_low_water = 100;
    std::string default_grace_period = "20s";
    uint32_t auto_restore_sec = 300;
};

// Transfer tasks
struct TransferConfig {
    std::string download_dir;  // empty: $HOME/Downloads
    uint32_t chunk_size = 256 * 1024;
    uint32_t pipe_capacity = 1024 * 1024;
    uint32_t warmup_timeout_ms = 15000;
    uint32_t size_timeout_ms = 10000;
    uint32_t speed_sample_ms = 500;
    double speed_smoothing = 0.7;  // weight of the newest sample
    uint32_t progress_interval_ms = 200;
    uint32_t worker_threads = 4;
};

// Connection health maintenance
struct HealthConfig {
    bool enable = true;
    uint32_t maintenance_interval_sec = 1800;
    uint32_t maintenance_timeout_sec = 120;
    uint32_t failure_threshold = 2;
    uint32_t stale_latency_ms = 30000;
    uint32_t healthy_latency_ms = 10000;
    uint32_t liveness_timeout_ms = 5000;
    uint32_t repair_timeout_sec = 30;
};

// File record catalog
struct CatalogConfig {
    std::string path = "";  // empty: no catalog
};

// Download requested on the command line
struct RequestConfig {
    std::string cid;
    std::optional<uint64_t> file_id;
    std::string name;
    std::optional<std::string> password;
    std::string encryption_type;
    std::string encryption_meta;
};

// Global configuration
struct GlobalConfig {
    LogConfig log;
    NodeConfig node;
    BoosterConfig booster;
    ConnectionPolicyConfig connection;
    TransferConfig transfer;
    HealthConfig health;
    CatalogConfig catalog;
    RequestConfig request;
};

class Config {
public:
    static Config& instance();

    // Load configuration from an INI file
    bool load_from_file(const std::string& path);

    // Load configuration from CIDBOOST_* environment variables
    bool load_from_env();

    // Parse command line arguments. The config file named by -c is loaded first,
    // then the environment, then the remaining options override both.
    bool parse_command_line(int argc, char* argv[]);

    // Get configuration
    const GlobalConfig& get() const { return config_; }
    GlobalConfig& get() { return config_; }

    // Back to built-in defaults
    void reset();

    // Get config file path that was loaded
    const std::string& get_config_file() const { return config_file_; }

    // Check if required fields are set
    bool validate() const;

    // Apply the log section to the Logger
    void apply_logging() const;

    // Print configuration (for debugging)
    void print() const;

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void override_from_env();

    GlobalConfig config_;
    std::string config_file_;
};

// Download directory after defaulting
std::string resolve_download_dir(const TransferConfig& config);

} // namespace cidboost

#endif // CIDBOOST_BASE_CONFIG_H
