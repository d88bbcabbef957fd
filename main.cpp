#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include "cidboost/base/config.h"
#include "cidboost/base/logger.h"
#include "cidboost/catalog/file_catalog.h"
#include "cidboost/crypto/key_resolver.h"
#include "cidboost/net/kubo_client.h"
#include "cidboost/p2p/connection_policy.h"
#include "cidboost/p2p/download_booster.h"
#include "cidboost/p2p/health_monitor.h"
#include "cidboost/transfer/stream_decryptor.h"
#include "cidboost/transfer/stream_fetcher.h"
#include "cidboost/transfer/task_manager.h"
#include <fmt/format.h>

using namespace cidboost;

// Global flag for signal handling
static volatile std::sig_atomic_t g_running = 1;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = 0;
    }
}

namespace {

std::string human_bytes(double bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    size_t unit = 0;
    while (bytes >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
        bytes /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", bytes, units[unit]);
}

void print_progress(const TaskSnapshot& snap) {
    std::string phase = to_string(snap.phase);
    std::string line;
    if (snap.total > 0) {
        double percent = 100.0 * static_cast<double>(snap.loaded) / static_cast<double>(snap.total);
        line = fmt::format("{:>10} {:5.1f}% {} / {} at {}/s", to_string(snap.status), percent,
                           human_bytes(static_cast<double>(snap.loaded)),
                           human_bytes(static_cast<double>(snap.total)), human_bytes(snap.speed));
    } else {
        line = fmt::format("{:>10} {} at {}/s", to_string(snap.status),
                           human_bytes(static_cast<double>(snap.loaded)), human_bytes(snap.speed));
    }
    if (!phase.empty()) {
        line += " [" + phase + "]";
    }
    std::cout << "\r" << line << "    " << std::flush;
}

} // anonymous namespace

class CidBoostApplication {
public:
    CidBoostApplication() = default;
    ~CidBoostApplication() {
        stop();
    }

    bool initialize(int argc, char* argv[]) {
        if (!Config::instance().parse_command_line(argc, argv)) {
            return false;
        }
        if (!Config::instance().validate()) {
            return false;
        }

        const auto& config = Config::instance().get();
        Logger::instance().info("Initializing cidboost...");

        kubo_ = std::make_shared<KuboClient>(config.node);
        booster_ = std::make_shared<DownloadBooster>(config.booster, kubo_);
        policy_ = std::make_shared<ConnectionPolicyManager>(config.connection, kubo_, kubo_);
        auto fetcher = std::make_shared<StreamFetcher>(kubo_, config.transfer);

        if (!config.catalog.path.empty()) {
            auto catalog = std::make_shared<JsonFileCatalog>(config.catalog.path);
            try {
                catalog->load();
            } catch (const CidBoostError& e) {
                Logger::instance().error("Failed to load catalog: {}", e.what());
                return false;
            }
            catalog_ = catalog;
        }

        health_ = std::make_shared<HealthMonitor>(config.health, kubo_, booster_);

        TransferServices services;
        services.config = config.transfer;
        services.network = kubo_;
        services.booster = booster_;
        services.policy = policy_;
        services.fetcher = fetcher;
        services.decryptor = std::make_shared<StreamDecryptor>(fetcher, config.transfer);
        services.keys = std::make_shared<DefaultKeyResolver>();
        services.health = health_;
        services.catalog = catalog_;
        tasks_ = std::make_unique<TaskManager>(std::move(services));

        Logger::instance().info("cidboost initialized");
        return true;
    }

    bool start() {
        const auto& config = Config::instance().get();
        Logger::instance().info("Starting cidboost...");

        std::string node_id;
        elio::run([this, &node_id]() -> elio::coro::task<void> {
            node_id = co_await kubo_->node_id();
        });
        if (node_id.empty()) {
            Logger::instance().error("Kubo RPC API at {}:{} is not reachable",
                                     config.node.api_address, config.node.api_port);
            return false;
        }
        Logger::instance().info("Connected to node {}", node_id);

        if (!tasks_->start()) {
            Logger::instance().error("Failed to start task manager");
            return false;
        }

        if (config.health.enable) {
            health_->set_scheduler(tasks_->scheduler());
            if (!health_->start()) {
                Logger::instance().warning("Health monitor not started");
            }
        }
        return true;
    }

    void stop() {
        if (health_) {
            health_->stop();
        }
        if (tasks_) {
            tasks_->stop();
        }
    }

    // Runs the requested download to its end. Returns the process exit code.
    int run() {
        const auto& request = Config::instance().get().request;

        StartRequest start;
        start.file_id = request.file_id;
        start.cid = request.cid;
        start.name = request.name;
        start.password = request.password;
        start.encryption_type = request.encryption_type;
        start.encryption_meta = request.encryption_meta;

        auto started = tasks_->start_download(start);
        if (!started.snapshot) {
            std::cerr << "Cannot start download: " << started.message << std::endl;
            return 1;
        }
        const std::string id = started.snapshot->id;
        std::cout << "Downloading " << started.snapshot->cid << " to "
                  << started.snapshot->dest_path << std::endl;

        auto channel = tasks_->subscribe(id);
        bool interrupted = false;
        while (channel && !channel->drained()) {
            if (!g_running && !interrupted) {
                interrupted = true;
                auto canceled = tasks_->cancel(id);
                if (!canceled.ok()) {
                    Logger::instance().warning("Cancel failed: {}", canceled.message);
                }
                channel->close();
                break;
            }
            auto snap = channel->next(std::chrono::milliseconds(500));
            if (snap) {
                print_progress(*snap);
                // Nothing resumes a failed one-shot download
                if (snap->status == TaskStatus::Error) {
                    channel->close();
                    break;
                }
            }
        }
        std::cout << std::endl;

        if (interrupted) {
            std::cout << "Download canceled" << std::endl;
            return 130;
        }

        auto final_state = tasks_->get(id);
        if (!final_state.snapshot) {
            std::cerr << "Task disappeared: " << final_state.message << std::endl;
            return 1;
        }
        const auto& snap = *final_state.snapshot;
        if (snap.status != TaskStatus::Completed) {
            std::cerr << "Download " << to_string(snap.status) << ": " << snap.error << std::endl;
            return 1;
        }
        std::cout << "Saved " << human_bytes(static_cast<double>(snap.loaded))
                  << " to " << snap.dest_path << std::endl;
        return 0;
    }

private:
    std::shared_ptr<KuboClient> kubo_;
    std::shared_ptr<DownloadBooster> booster_;
    std::shared_ptr<ConnectionPolicyManager> policy_;
    std::shared_ptr<HealthMonitor> health_;
    std::shared_ptr<FileCatalog> catalog_;
    std::unique_ptr<TaskManager> tasks_;
};

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // CLI11 prints help and version itself; those are not failures
    bool info_only = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h" || arg == "--version" || arg == "-v") {
            info_only = true;
        }
    }

    try {
        CidBoostApplication app;

        if (!app.initialize(argc, argv)) {
            if (info_only) {
                return 0;
            }
            std::cerr << "Failed to initialize cidboost" << std::endl;
            return 1;
        }

        const auto& request = Config::instance().get().request;
        if (request.cid.empty() && !request.file_id) {
            std::cerr << "Nothing to download: pass --cid or --file-id" << std::endl;
            return 1;
        }

        if (!app.start()) {
            std::cerr << "Failed to start cidboost" << std::endl;
            return 1;
        }

        int code = app.run();
        app.stop();
        return code;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
