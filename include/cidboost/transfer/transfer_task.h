#ifndef CIDBOOST_TRANSFER_TRANSFER_TASK_H
#define CIDBOOST_TRANSFER_TRANSFER_TASK_H

#include "cidboost/base/config.h"
#include "cidboost/crypto/key_resolver.h"
#include <elio/elio.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>

namespace cidboost {

class ContentNetwork;
class DownloadBooster;
class ConnectionPolicyManager;
class StreamFetcher;
class StreamDecryptor;
class HealthMonitor;
class FileCatalog;

enum class TaskStatus {
    Pending,
    Running,
    Paused,
    Error,
    Completed,
    Canceled
};

enum class TaskPhase {
    None,
    Preparing,
    Connecting,
    Downloading
};

const char* to_string(TaskStatus status);
const char* to_string(TaskPhase phase);

// Completed and canceled tasks never run again
bool is_terminal(TaskStatus status);

struct TaskSnapshot {
    std::string id;
    std::optional<uint64_t> file_id;
    std::string cid;
    std::string name;
    std::string dest_path;
    TaskStatus status = TaskStatus::Pending;
    TaskPhase phase = TaskPhase::None;
    std::string error;
    uint64_t loaded = 0;
    uint64_t total = 0;   // 0 while unknown
    double speed = 0.0;   // bytes per second, smoothed
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point updated_at;

    nlohmann::json to_json() const;
};

struct TaskRequest {
    std::optional<uint64_t> file_id;
    std::string cid;
    std::string name;
    std::filesystem::path dest_path;
    uint64_t known_size = 0;
    DecryptionParams decryption;
};

// Collaborators shared by every task of a manager
struct TransferServices {
    TransferConfig config;
    std::shared_ptr<elio::runtime::scheduler> scheduler;
    std::shared_ptr<ContentNetwork> network;
    std::shared_ptr<DownloadBooster> booster;
    std::shared_ptr<ConnectionPolicyManager> policy;   // optional
    std::shared_ptr<StreamFetcher> fetcher;
    std::shared_ptr<StreamDecryptor> decryptor;
    std::shared_ptr<KeyResolver> keys;
    std::shared_ptr<HealthMonitor> health;             // optional
    std::shared_ptr<FileCatalog> catalog;              // optional
};

// One download of one CID to one destination file.
//
// State machine:
//   pending -> running | error (malformed decryption metadata)
//   running -> paused | error | completed | canceled
//   paused  -> running | canceled
//   error   -> running | canceled
//
// Every start or resume creates a new attempt with its own cancellation
// source; at most one attempt runs at a time. Progress from a superseded
// attempt is ignored.
class TransferTask : public std::enable_shared_from_this<TransferTask> {
public:
    TransferTask(std::string id, TaskRequest request, std::shared_ptr<const TransferServices> services);
    ~TransferTask();

    TransferTask(const TransferTask&) = delete;
    TransferTask& operator=(const TransferTask&) = delete;

    const std::string& id() const { return id_; }
    const TaskRequest& request() const { return request_; }

    TaskSnapshot snapshot() const;
    TaskStatus status() const;

    // Returns DecryptionMetadataInvalid after moving to error, InvalidState
    // when not pending.
    std::error_code start();

    // Only from running. No byte reaches the destination once this returns.
    std::error_code pause();

    // From paused or error. The download restarts from offset 0.
    std::error_code resume();

    // From running, paused or error. Deletes the partial file.
    std::error_code cancel();

    // No attempt is executing
    bool idle() const;

    // Blocks the calling thread until idle() or deadline. Not for coroutines.
    bool wait_idle(std::chrono::steady_clock::time_point deadline) const;

private:
    struct Attempt;

    std::shared_ptr<Attempt> new_attempt_locked();
    void launch(std::shared_ptr<Attempt> attempt, std::shared_ptr<Attempt> previous);

    static elio::coro::task<void> run(std::shared_ptr<TransferTask> self,
                                      std::shared_ptr<Attempt> attempt,
                                      std::shared_ptr<Attempt> previous);
    elio::coro::task<void> download(std::shared_ptr<Attempt> attempt);
    elio::coro::task<void> connect_phase(std::shared_ptr<Attempt> attempt);
    static elio::coro::task<void> speed_monitor(std::shared_ptr<TransferTask> self,
                                                std::shared_ptr<Attempt> attempt);

    // Mutators that only apply while attempt is current and running
    bool set_phase(const std::shared_ptr<Attempt>& attempt, TaskPhase phase);
    void set_total(const std::shared_ptr<Attempt>& attempt, uint64_t total);
    void reset_progress(const std::shared_ptr<Attempt>& attempt);
    void add_progress(const std::shared_ptr<Attempt>& attempt, uint64_t delta);
    bool sample_speed(const std::shared_ptr<Attempt>& attempt, double instant);
    void complete(const std::shared_ptr<Attempt>& attempt);
    void fail(const std::shared_ptr<Attempt>& attempt, const std::exception_ptr& error);

    uint64_t total_bytes() const;
    void touch_locked();

    const std::string id_;
    const TaskRequest request_;
    const std::shared_ptr<const TransferServices> services_;
    const std::chrono::system_clock::time_point created_at_;

    mutable std::mutex mutex_;
    mutable std::condition_variable idle_cv_;
    TaskStatus status_ = TaskStatus::Pending;
    TaskPhase phase_ = TaskPhase::None;
    std::string error_;
    uint64_t loaded_ = 0;
    uint64_t total_ = 0;
    double speed_ = 0.0;
    std::chrono::system_clock::time_point updated_at_;
    uint64_t attempts_ = 0;
    std::shared_ptr<Attempt> attempt_;
};

} // namespace cidboost

#endif // CIDBOOST_TRANSFER_TRANSFER_TASK_H
