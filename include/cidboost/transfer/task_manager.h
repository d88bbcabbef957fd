#ifndef CIDBOOST_TRANSFER_TASK_MANAGER_H
#define CIDBOOST_TRANSFER_TASK_MANAGER_H

#include "cidboost/transfer/transfer_task.h"
#include <elio/elio.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace cidboost {

struct StartRequest {
    std::optional<uint64_t> file_id;   // looked up in the catalog when set
    std::string cid;
    std::string name;
    std::optional<std::string> password;
    std::string encryption_type;
    std::string encryption_meta;
};

// Outcome of a control operation
struct TaskResult {
    std::error_code error;
    std::string message;
    std::optional<TaskSnapshot> snapshot;

    bool ok() const { return !error; }
};

// Snapshots of one task, pushed periodically until it completes or is canceled.
// Thread-safe; the producer finishes it, the consumer may close it early.
class ProgressChannel {
public:
    explicit ProgressChannel(size_t capacity = 64);

    // Waits up to timeout. nullopt on timeout, or once finished and drained.
    std::optional<TaskSnapshot> next(std::chrono::milliseconds timeout);

    // Consumer side: stop receiving
    void close();
    bool closed() const;

    // Producer side. The oldest snapshot is dropped when the consumer lags.
    void publish(TaskSnapshot snapshot);
    void finish();
    // Finished and every snapshot consumed
    bool drained() const;

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<TaskSnapshot> queue_;
    bool finished_ = false;
    bool closed_ = false;
};

// Registry of transfer tasks and the control surface over them
class TaskManager {
public:
    // services.scheduler may be empty; start() then creates one
    explicit TaskManager(TransferServices services);
    ~TaskManager();

    TaskManager(const TaskManager&) = delete;
    TaskManager& operator=(const TaskManager&) = delete;

    bool start();
    // Pauses running tasks and waits briefly for them to unwind
    void stop();
    bool is_running() const;

    TaskResult start_download(const StartRequest& request);
    TaskResult get(const std::string& id) const;
    TaskResult pause(const std::string& id);
    TaskResult resume(const std::string& id);
    TaskResult cancel(const std::string& id);
    std::vector<TaskSnapshot> list() const;

    // nullptr for an unknown id
    std::shared_ptr<ProgressChannel> subscribe(const std::string& id);

    std::shared_ptr<elio::runtime::scheduler> scheduler() const;

private:
    std::shared_ptr<TransferTask> find(const std::string& id) const;
    TaskResult control(const std::string& id, std::error_code (TransferTask::*op)());

    static elio::coro::task<void> pump(std::shared_ptr<TransferTask> task,
                                       std::shared_ptr<ProgressChannel> channel,
                                       std::chrono::milliseconds interval);

    std::shared_ptr<TransferServices> services_;
    bool owns_scheduler_ = false;
    bool running_ = false;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<TransferTask>> tasks_;
};

using PathReserved = std::function<bool(const std::filesystem::path&)>;

// path itself when free, else "<stem> (n)<ext>" for the smallest free n >= 1.
// A path is taken when it exists or reserved reports it.
std::filesystem::path ensure_unique_path(const std::filesystem::path& path,
                                         const PathReserved& reserved = nullptr);

// Final path component of name; falls back when nothing usable remains
std::string sanitize_file_name(const std::string& name, const std::string& fallback);

} // namespace cidboost

#endif // CIDBOOST_TRANSFER_TASK_MANAGER_H
