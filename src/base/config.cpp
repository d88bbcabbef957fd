#include "cidboost/base/config.h"
#include "cidboost/base/logger.h"
#include "CLI/CLI.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>

namespace cidboost {

namespace {

using Section = std::map<std::string, std::string>;

std::string trim(const std::string& str) {
    auto start = std::find_if(str.begin(), str.end(), [](unsigned char c) { return !std::isspace(c); });
    auto end = std::find_if(str.rbegin(), str.rend(), [](unsigned char c) { return !std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : "";
}

// Simple INI-style parser for config files
void parse_ini_file(const std::string& path, std::map<std::string, Section>& sections) {
    std::ifstream file(path);
    if (!file.is_open()) return;

    std::string current_section;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            sections[current_section];
            continue;
        }

        auto pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            // Remove quotes
            if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                                      (value.front() == '\'' && value.back() == '\''))) {
                value = value.substr(1, value.size() - 2);
            }
            sections[current_section][key] = value;
        }
    }
}

bool parse_bool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

void read_u32(const Section& s, const char* key, uint32_t& out) {
    auto it = s.find(key);
    if (it != s.end()) out = static_cast<uint32_t>(std::stoul(it->second));
}

void read_u16(const Section& s, const char* key, uint16_t& out) {
    auto it = s.find(key);
    if (it != s.end()) out = static_cast<uint16_t>(std::stoul(it->second));
}

void read_str(const Section& s, const char* key, std::string& out) {
    auto it = s.find(key);
    if (it != s.end()) out = it->second;
}

void read_bool(const Section& s, const char* key, bool& out) {
    auto it = s.find(key);
    if (it != s.end()) out = parse_bool(it->second);
}

void env_u32(const char* name, uint32_t& out) {
    if (const char* val = std::getenv(name)) out = static_cast<uint32_t>(std::stoul(val));
}

void env_str(const char* name, std::string& out) {
    if (const char* val = std::getenv(name)) out = val;
}

} // anonymous namespace

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    config_ = GlobalConfig{};
    config_file_.clear();
}

bool Config::load_from_file(const std::string& path) {
    Logger::instance().info("Loading config from file: {}", path);

    if (!std::filesystem::exists(path)) {
        Logger::instance().warning("Config file not found: {}", path);
        return false;
    }

    std::map<std::string, Section> sections;
    parse_ini_file(path, sections);

    try {
        if (sections.count("log")) {
            auto& s = sections["log"];
            read_str(s, "level", config_.log.level);
            read_str(s, "output", config_.log.output);
            read_str(s, "file_path", config_.log.file_path);
        }

        if (sections.count("node")) {
            auto& s = sections["node"];
            read_str(s, "api_address", config_.node.api_address);
            read_u16(s, "api_port", config_.node.api_port);
        }

        if (sections.count("booster")) {
            auto& s = sections["booster"];
            auto& b = config_.booster;
            read_u32(s, "negative_cache_ttl_ms", b.negative_cache_ttl_ms);
            read_u32(s, "positive_cache_ttl_sec", b.positive_cache_ttl_sec);
            read_u32(s, "min_providers_for_early_exit", b.min_providers_for_early_exit);
            read_u32(s, "max_connected_for_early_exit", b.max_connected_for_early_exit);
            read_u32(s, "discovery_timeout_ms", b.discovery_timeout_ms);
            read_u32(s, "connect_timeout_ms", b.connect_timeout_ms);
            read_u32(s, "early_exit_grace_ms", b.early_exit_grace_ms);
            read_u32(s, "max_parallel_connects", b.max_parallel_connects);
            read_u32(s, "prefetch_bytes", b.prefetch_bytes);
            read_u32(s, "prefetch_wait_ms", b.prefetch_wait_ms);
            read_u32(s, "prefetch_timeout_sec", b.prefetch_timeout_sec);
            read_bool(s, "add_to_peering", b.add_to_peering);
        }

        if (sections.count("connection")) {
            auto& s = sections["connection"];
            auto& c = config_.connection;
            read_u32(s, "boost_high_water", c.boost_high_water);
            read_u32(s, "boost_low_water", c.boost_low_water);
            read_str(s, "boost_grace_period", c.boost_grace_period);
            read_u32(s, "default_high_water", c.default_high_water);
            read_u32(s, "default_low_water", c.default_low_water);
            read_str(s, "default_grace_period", c.default_grace_period);
            read_u32(s, "auto_restore_sec", c.auto_restore_sec);
        }

        if (sections.count("transfer")) {
            auto& s = sections["transfer"];
            auto& t = config_.transfer;
            read_str(s, "download_dir", t.download_dir);
            read_u32(s, "chunk_size", t.chunk_size);
            read_u32(s, "pipe_capacity", t.pipe_capacity);
            read_u32(s, "warmup_timeout_ms", t.warmup_timeout_ms);
            read_u32(s, "size_timeout_ms", t.size_timeout_ms);
            read_u32(s, "speed_sample_ms", t.speed_sample_ms);
            read_u32(s, "progress_interval_ms", t.progress_interval_ms);
            read_u32(s, "worker_threads", t.worker_threads);
            if (s.count("speed_smoothing")) t.speed_smoothing = std::stod(s["speed_smoothing"]);
        }

        if (sections.count("health")) {
            auto& s = sections["health"];
            auto& h = config_.health;
            read_bool(s, "enable", h.enable);
            read_u32(s, "maintenance_interval_sec", h.maintenance_interval_sec);
            read_u32(s, "maintenance_timeout_sec", h.maintenance_timeout_sec);
            read_u32(s, "failure_threshold", h.failure_threshold);
            read_u32(s, "stale_latency_ms", h.stale_latency_ms);
            read_u32(s, "healthy_latency_ms", h.healthy_latency_ms);
            read_u32(s, "liveness_timeout_ms", h.liveness_timeout_ms);
            read_u32(s, "repair_timeout_sec", h.repair_timeout_sec);
        }

        if (sections.count("catalog")) {
            read_str(sections["catalog"], "path", config_.catalog.path);
        }
    } catch (const std::exception& e) {
        Logger::instance().error("Invalid value in config file {}: {}", path, e.what());
        return false;
    }

    config_file_ = path;
    Logger::instance().info("Config loaded successfully from: {}", path);
    return true;
}

bool Config::load_from_env() {
    Logger::instance().debug("Loading config from environment variables");
    try {
        override_from_env();
    } catch (const std::exception& e) {
        Logger::instance().error("Invalid CIDBOOST_* environment value: {}", e.what());
        return false;
    }
    return true;
}

void Config::override_from_env() {
    // Log config
    env_str("CIDBOOST_LOG_LEVEL", config_.log.level);
    env_str("CIDBOOST_LOG_OUTPUT", config_.log.output);
    env_str("CIDBOOST_LOG_FILE", config_.log.file_path);

    // Node
    env_str("CIDBOOST_API_ADDRESS", config_.node.api_address);
    if (const char* val = std::getenv("CIDBOOST_API_PORT")) {
        config_.node.api_port = static_cast<uint16_t>(std::stoul(val));
    }

    // Booster
    env_u32("CIDBOOST_DISCOVERY_TIMEOUT_MS", config_.booster.discovery_timeout_ms);
    env_u32("CIDBOOST_CONNECT_TIMEOUT_MS", config_.booster.connect_timeout_ms);
    env_u32("CIDBOOST_MAX_PARALLEL_CONNECTS", config_.booster.max_parallel_connects);

    // Transfer
    env_str("CIDBOOST_DOWNLOAD_DIR", config_.transfer.download_dir);
    env_u32("CIDBOOST_WORKER_THREADS", config_.transfer.worker_threads);

    // Health
    env_u32("CIDBOOST_HEALTH_INTERVAL_SEC", config_.health.maintenance_interval_sec);

    // Catalog
    env_str("CIDBOOST_CATALOG", config_.catalog.path);
}

bool Config::parse_command_line(int argc, char* argv[]) {
    // First pass only picks up the config file so that it sits below env and CLI
    {
        CLI::App pre;
        pre.allow_extras();
        pre.set_help_flag();
        std::string config_file;
        pre.add_option("-c,--config", config_file);
        try {
            pre.parse(argc, argv);
        } catch (const CLI::ParseError&) {
            // Reported by the full parse below
        }
        if (!config_file.empty() && !load_from_file(config_file)) {
            return false;
        }
    }
    if (!load_from_env()) {
        return false;
    }

    CLI::App app{"cidboost - accelerated content downloads from a Kubo node"};

    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file");

    // Request options
    app.add_option("--cid", config_.request.cid, "CID to download");
    app.add_option("--file-id", config_.request.file_id, "File id from the catalog");
    app.add_option("--name", config_.request.name, "File name to save as");
    app.add_option("--password", config_.request.password, "Password for password-encrypted files");
    app.add_option("--encryption-type", config_.request.encryption_type, "Encryption type (none, password, private)");
    app.add_option("--encryption-meta", config_.request.encryption_meta, "Encryption metadata");

    // Log options
    app.add_option("--log-level", config_.log.level, "Log level (debug, info, warning, error)");
    app.add_option("--log-output", config_.log.output, "Log output (stdout, stderr, file)");
    app.add_option("--log-file", config_.log.file_path, "Log file path");

    // Node options
    app.add_option("--api-address", config_.node.api_address, "Kubo RPC address");
    app.add_option("--api-port", config_.node.api_port, "Kubo RPC port");

    // Booster options
    app.add_option("--discovery-timeout", config_.booster.discovery_timeout_ms, "Provider discovery timeout (ms)");
    app.add_option("--connect-timeout", config_.booster.connect_timeout_ms, "Per-provider connect timeout (ms)");
    app.add_option("--max-parallel-connects", config_.booster.max_parallel_connects, "Concurrent provider connection attempts");
    app.add_option("--prefetch-wait", config_.booster.prefetch_wait_ms, "Time to wait for the first block prefetch (ms)");
    app.add_flag("--peering,!--no-peering", config_.booster.add_to_peering, "Add connected providers to the peering set");

    // Transfer options
    app.add_option("-o,--download-dir", config_.transfer.download_dir, "Download directory");
    app.add_option("--chunk-size", config_.transfer.chunk_size, "Read chunk size (bytes)");
    app.add_option("--worker-threads", config_.transfer.worker_threads, "Scheduler worker threads");

    // Health options
    app.add_flag("--health,!--no-health", config_.health.enable, "Run connection health maintenance");
    app.add_option("--health-interval", config_.health.maintenance_interval_sec, "Maintenance interval (seconds)");

    // Catalog
    app.add_option("--catalog", config_.catalog.path, "Path to the JSON file catalog");

    app.set_version_flag("-v,--version", "0.1.0");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // Help and version requests exit with code 0 and print themselves
        app.exit(e);
        return false;
    }

    apply_logging();
    return true;
}

bool Config::validate() const {
    if (config_.node.api_address.empty() || config_.node.api_port == 0) {
        Logger::instance().error("node.api_address and node.api_port are required");
        return false;
    }
    if (config_.transfer.chunk_size == 0) {
        Logger::instance().error("transfer.chunk_size must be positive");
        return false;
    }
    if (config_.transfer.pipe_capacity < config_.transfer.chunk_size) {
        Logger::instance().error("transfer.pipe_capacity must hold at least one chunk");
        return false;
    }
    if (config_.transfer.speed_smoothing <= 0.0 || config_.transfer.speed_smoothing > 1.0) {
        Logger::instance().error("transfer.speed_smoothing must be in (0, 1]");
        return false;
    }
    if (config_.booster.max_parallel_connects == 0) {
        Logger::instance().error("booster.max_parallel_connects must be positive");
        return false;
    }
    if (config_.health.failure_threshold == 0) {
        Logger::instance().error("health.failure_threshold must be positive");
        return false;
    }
    if (config_.log.output == "file" && config_.log.file_path.empty()) {
        Logger::instance().error("log.file_path is required when log.output is file");
        return false;
    }
    return true;
}

void Config::apply_logging() const {
    auto& logger = Logger::instance();
    logger.set_level(parse_log_level(config_.log.level));
    if (config_.log.output == "stderr") {
        logger.set_output(LogOutput::Stderr);
    } else if (config_.log.output == "file" && !config_.log.file_path.empty()) {
        logger.set_file_output(config_.log.file_path);
    } else {
        logger.set_output(LogOutput::Stdout);
    }
}

void Config::print() const {
    Logger::instance().info("=== Configuration ===");
    Logger::instance().info("Log Level: {}", config_.log.level);
    Logger::instance().info("Kubo API: {}:{}", config_.node.api_address, config_.node.api_port);
    Logger::instance().info("Download Dir: {}", resolve_download_dir(config_.transfer));
    Logger::instance().info("Discovery Timeout: {} ms", config_.booster.discovery_timeout_ms);
    Logger::instance().info("Parallel Connects: {}", config_.booster.max_parallel_connects);
    Logger::instance().info("Health Maintenance: {}", config_.health.enable ? "on" : "off");
    if (!config_.catalog.path.empty()) {
        Logger::instance().info("Catalog: {}", config_.catalog.path);
    }
}

std::string resolve_download_dir(const TransferConfig& config) {
    if (!config.download_dir.empty()) {
        return config.download_dir;
    }
    if (const char* home = std::getenv("HOME")) {
        return (std::filesystem::path(home) / "Downloads").string();
    }
    return "downloads";
}

} // namespace cidboost
