#include "cidboost/transfer/task_manager.h"
#include "cidboost/base/error_code.h"
#include "cidboost/base/logger.h"
#include "cidboost/catalog/file_catalog.h"
#include "cidboost/crypto/codec.h"
#include <algorithm>

namespace cidboost {

namespace {

constexpr size_t kTaskIdBytes = 16;
constexpr std::chrono::milliseconds kStopWait{2000};

TaskResult failure(ErrorCode code, const std::string& message) {
    TaskResult result;
    result.error = make_error_code(code);
    result.message = message;
    return result;
}

} // anonymous namespace

// ProgressChannel

ProgressChannel::ProgressChannel(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {
}

std::optional<TaskSnapshot> ProgressChannel::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] {
        return !queue_.empty() || finished_ || closed_;
    });
    if (closed_ || queue_.empty()) {
        return std::nullopt;
    }
    TaskSnapshot snapshot = std::move(queue_.front());
    queue_.pop_front();
    return snapshot;
}

void ProgressChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        queue_.clear();
    }
    cv_.notify_all();
}

bool ProgressChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

void ProgressChannel::publish(TaskSnapshot snapshot) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || finished_) return;
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
        }
        queue_.push_back(std::move(snapshot));
    }
    cv_.notify_all();
}

void ProgressChannel::finish() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
    }
    cv_.notify_all();
}

bool ProgressChannel::drained() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_ || (finished_ && queue_.empty());
}

// TaskManager

TaskManager::TaskManager(TransferServices services)
    : services_(std::make_shared<TransferServices>(std::move(services))) {
}

TaskManager::~TaskManager() {
    stop();
}

bool TaskManager::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return true;
    }
    if (!services_->network || !services_->booster || !services_->fetcher ||
        !services_->decryptor || !services_->keys) {
        Logger::instance().error("Task manager is missing a required service");
        return false;
    }
    if (!services_->scheduler) {
        size_t workers = services_->config.worker_threads == 0 ? 1 : services_->config.worker_threads;
        services_->scheduler = std::make_shared<elio::runtime::scheduler>(workers);
        services_->scheduler->start();
        owns_scheduler_ = true;
        Logger::instance().info("Task scheduler started with {} workers", workers);
    }
    running_ = true;
    return true;
}

void TaskManager::stop() {
    std::vector<std::shared_ptr<TransferTask>> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        for (const auto& [id, task] : tasks_) {
            tasks.push_back(task);
        }
    }

    for (const auto& task : tasks) {
        if (task->status() == TaskStatus::Running) {
            auto ec = task->pause();
            if (ec) {
                Logger::instance().debug("Task {} not paused on stop: {}", task->id(), ec.message());
            }
        }
    }

    auto deadline = std::chrono::steady_clock::now() + kStopWait;
    for (const auto& task : tasks) {
        if (!task->wait_idle(deadline)) {
            Logger::instance().warning("Task {} still running at shutdown", task->id());
        }
    }

    if (owns_scheduler_ && services_->scheduler) {
        services_->scheduler->shutdown();
        Logger::instance().info("Task scheduler stopped");
    }
}

bool TaskManager::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

TaskResult TaskManager::start_download(const StartRequest& request) {
    if (!is_running()) {
        return failure(ErrorCode::InvalidState, "task manager is not running");
    }

    TaskRequest task_request;
    task_request.file_id = request.file_id;
    task_request.cid = request.cid;
    std::string name = request.name;
    std::string encryption_type = request.encryption_type;
    std::string encryption_meta = request.encryption_meta;

    if (request.file_id) {
        if (!services_->catalog) {
            return failure(ErrorCode::NotFound, "no file catalog configured");
        }
        auto record = services_->catalog->find(*request.file_id);
        if (!record) {
            return failure(ErrorCode::NotFound,
                           "file " + std::to_string(*request.file_id) + " not found");
        }
        task_request.cid = record->cid;
        task_request.known_size = record->size;
        if (name.empty()) name = record->name;
        if (encryption_type.empty()) encryption_type = record->encryption_type;
        if (encryption_meta.empty()) encryption_meta = record->encryption_meta;
    }

    if (task_request.cid.empty()) {
        return failure(ErrorCode::InvalidArgument, "a CID or a file id is required");
    }

    auto type = parse_encryption_type(encryption_type);
    if (!type) {
        return failure(ErrorCode::InvalidArgument,
                       "unknown encryption type '" + encryption_type + "'");
    }
    task_request.decryption.type = *type;
    task_request.decryption.metadata = encryption_meta;
    task_request.decryption.password = request.password;
    task_request.name = sanitize_file_name(name, task_request.cid);

    std::filesystem::path dir = resolve_download_dir(services_->config);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return failure(ErrorCode::WriteFailed,
                       "cannot create download directory " + dir.string() + ": " + ec.message());
    }

    std::shared_ptr<TransferTask> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Paths of tasks that have not created their file yet are taken too
        auto candidate = ensure_unique_path(dir / task_request.name,
            [this](const std::filesystem::path& p) {
                for (const auto& [id, t] : tasks_) {
                    if (t->request().dest_path == p) return true;
                }
                return false;
            });
        task_request.dest_path = candidate;

        std::string id = to_hex(random_bytes(kTaskIdBytes));
        task = std::make_shared<TransferTask>(id, std::move(task_request), services_);
        tasks_.emplace(id, task);
    }

    Logger::instance().info("Created task {} for {} -> {}",
                            task->id(), task->request().cid, task->request().dest_path.string());

    TaskResult result;
    result.error = task->start();
    if (result.error) {
        result.message = task->snapshot().error;
    }
    result.snapshot = task->snapshot();
    return result;
}

std::shared_ptr<TransferTask> TaskManager::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    return it == tasks_.end() ? nullptr : it->second;
}

TaskResult TaskManager::get(const std::string& id) const {
    auto task = find(id);
    if (!task) {
        return failure(ErrorCode::NotFound, "task " + id + " not found");
    }
    TaskResult result;
    result.snapshot = task->snapshot();
    return result;
}

TaskResult TaskManager::control(const std::string& id, std::error_code (TransferTask::*op)()) {
    auto task = find(id);
    if (!task) {
        return failure(ErrorCode::NotFound, "task " + id + " not found");
    }
    TaskResult result;
    result.error = (task.get()->*op)();
    if (result.error) {
        result.message = fmt::format("operation not allowed while task is {}",
                                     to_string(task->status()));
    }
    result.snapshot = task->snapshot();
    return result;
}

TaskResult TaskManager::pause(const std::string& id) {
    return control(id, &TransferTask::pause);
}

TaskResult TaskManager::resume(const std::string& id) {
    return control(id, &TransferTask::resume);
}

TaskResult TaskManager::cancel(const std::string& id) {
    auto result = control(id, &TransferTask::cancel);
    if (result.ok()) {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.erase(id);
    }
    return result;
}

std::vector<TaskSnapshot> TaskManager::list() const {
    std::vector<std::shared_ptr<TransferTask>> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, task] : tasks_) {
            tasks.push_back(task);
        }
    }
    std::vector<TaskSnapshot> snapshots;
    snapshots.reserve(tasks.size());
    for (const auto& task : tasks) {
        snapshots.push_back(task->snapshot());
    }
    std::sort(snapshots.begin(), snapshots.end(),
              [](const TaskSnapshot& a, const TaskSnapshot& b) { return a.created_at < b.created_at; });
    return snapshots;
}

std::shared_ptr<ProgressChannel> TaskManager::subscribe(const std::string& id) {
    auto task = find(id);
    if (!task || !services_->scheduler) {
        return nullptr;
    }
    auto channel = std::make_shared<ProgressChannel>();
    auto interval = std::chrono::milliseconds(services_->config.progress_interval_ms);
    auto pumper = pump(task, channel, interval);
    services_->scheduler->spawn(pumper.release());
    return channel;
}

elio::coro::task<void> TaskManager::pump(std::shared_ptr<TransferTask> task,
                                         std::shared_ptr<ProgressChannel> channel,
                                         std::chrono::milliseconds interval) {
    while (!channel->closed()) {
        auto snapshot = task->snapshot();
        auto status = snapshot.status;
        channel->publish(std::move(snapshot));
        // An errored task may still be resumed, so only terminal states end the stream
        if (is_terminal(status)) {
            break;
        }
        co_await elio::time::sleep_for(interval);
    }
    channel->finish();
}

std::shared_ptr<elio::runtime::scheduler> TaskManager::scheduler() const {
    return services_->scheduler;
}

std::filesystem::path ensure_unique_path(const std::filesystem::path& path,
                                         const PathReserved& reserved) {
    auto taken = [&reserved](const std::filesystem::path& p) {
        return std::filesystem::exists(p) || (reserved && reserved(p));
    };
    if (!taken(path)) {
        return path;
    }
    auto dir = path.parent_path();
    auto stem = path.stem().string();
    auto ext = path.extension().string();
    for (int n = 1;; ++n) {
        auto candidate = dir / (stem + " (" + std::to_string(n) + ")" + ext);
        if (!taken(candidate)) {
            return candidate;
        }
    }
}

std::string sanitize_file_name(const std::string& name, const std::string& fallback) {
    std::string cleaned = name;
    for (auto& c : cleaned) {
        if (c == '\\' || c == '\0') c = '_';
    }
    auto file = std::filesystem::path(cleaned).filename().string();
    if (file.empty() || file == "." || file == "..") {
        return fallback;
    }
    return file;
}

} // namespace cidboost
