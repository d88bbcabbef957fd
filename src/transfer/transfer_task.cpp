#include "cidboost/transfer/transfer_task.h"
#include "cidboost/base/cancel_token.h"
#include "cidboost/base/error_code.h"
#include "cidboost/base/logger.h"
#include "cidboost/base/wakeup.h"
#include "cidboost/catalog/file_catalog.h"
#include "cidboost/net/content_network.h"
#include "cidboost/p2p/connection_policy.h"
#include "cidboost/p2p/download_booster.h"
#include "cidboost/p2p/health_monitor.h"
#include "cidboost/transfer/file_sink.h"
#include "cidboost/transfer/stream_decryptor.h"
#include "cidboost/transfer/stream_fetcher.h"
#include <fmt/chrono.h>
#include <atomic>

namespace cidboost {

namespace {

using Clock = std::chrono::steady_clock;

std::string format_time(std::chrono::system_clock::time_point tp) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z",
                       fmt::gmtime(std::chrono::system_clock::to_time_t(tp)), millis);
}

std::error_code task_error(ErrorCode code) {
    return make_error_code(code);
}

// Network and transfer failures suggest unhealthy peers; key and disk errors do not
bool reported_to_health(ErrorCode code) {
    switch (code) {
        case ErrorCode::Timeout:
        case ErrorCode::NetworkError:
        case ErrorCode::ConnectionFailed:
        case ErrorCode::ConnectionClosed:
        case ErrorCode::ProviderNotFound:
        case ErrorCode::TransferFailed:
            return true;
        default:
            return false;
    }
}

// Cancels a warmup that outlives its deadline
struct WarmupDeadline {
    explicit WarmupDeadline(const CancelToken& attempt) : warmup(attempt) {}

    CancelSource warmup;
    CancelSource settled;   // the warmup finished first
    std::atomic<bool> expired{false};
};

elio::coro::task<void> warmup_watchdog(std::shared_ptr<WarmupDeadline> deadline,
                                       std::chrono::milliseconds timeout) {
    if (co_await sleep_unless_cancelled(timeout, deadline->settled.token())) {
        deadline->expired.store(true);
        deadline->warmup.cancel();
    }
}

elio::coro::task<WarmupResult> warmup_job(std::shared_ptr<DownloadBooster> booster,
                                          std::string cid,
                                          CancelToken token) {
    WarmupResult result;
    try {
        result = co_await booster->warmup_cid(cid, token);
    } catch (const std::exception& e) {
        Logger::instance().debug("Warmup for {} threw: {}", cid, e.what());
        result.error = make_error_code(ErrorCode::ProviderNotFound);
    }
    co_return result;
}

elio::coro::task<std::optional<int64_t>> size_job(std::shared_ptr<ContentNetwork> network,
                                                  std::string cid,
                                                  std::chrono::milliseconds timeout) {
    std::optional<int64_t> size;
    try {
        size = co_await network->get_file_size(cid, timeout);
    } catch (const std::exception& e) {
        Logger::instance().debug("Size lookup for {} failed: {}", cid, e.what());
    }
    co_return size;
}

} // anonymous namespace

const char* to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::Running: return "running";
        case TaskStatus::Paused: return "paused";
        case TaskStatus::Error: return "error";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Canceled: return "canceled";
    }
    return "unknown";
}

const char* to_string(TaskPhase phase) {
    switch (phase) {
        case TaskPhase::None: return "";
        case TaskPhase::Preparing: return "preparing";
        case TaskPhase::Connecting: return "connecting";
        case TaskPhase::Downloading: return "downloading";
    }
    return "";
}

bool is_terminal(TaskStatus status) {
    return status == TaskStatus::Completed || status == TaskStatus::Canceled;
}

nlohmann::json TaskSnapshot::to_json() const {
    nlohmann::json j = {
        {"id", id},
        {"cid", cid},
        {"name", name},
        {"dest_path", dest_path},
        {"status", to_string(status)},
        {"phase", to_string(phase)},
        {"error", error},
        {"loaded", loaded},
        {"total", total},
        {"speed", speed},
        {"created_at", format_time(created_at)},
        {"updated_at", format_time(updated_at)}
    };
    if (file_id) {
        j["file_id"] = *file_id;
    } else {
        j["file_id"] = nullptr;
    }
    return j;
}

// One execution of a task, from start or resume until it stops
struct TransferTask::Attempt {
    uint64_t number = 0;
    CancelSource cancel;
    std::atomic<uint64_t> bytes{0};      // progress of this attempt, for speed sampling
    std::atomic<bool> io_done{false};
    std::atomic<bool> finished{false};
    std::shared_ptr<Wakeup> on_finished = std::make_shared<Wakeup>();  // the next attempt waits here

    // Opens the destination unless the attempt was already stopped
    std::shared_ptr<FileSink> open_sink(const std::filesystem::path& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) return nullptr;
        sink_ = std::make_shared<FileSink>(path);
        return sink_;
    }

    // Cancels the attempt and seals its sink. No byte reaches the file afterwards.
    void stop() {
        std::shared_ptr<FileSink> sink;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
            sink = sink_;
        }
        cancel.cancel();
        if (sink) sink->seal();
    }

private:
    std::mutex mutex_;
    bool stopped_ = false;
    std::shared_ptr<FileSink> sink_;
};

TransferTask::TransferTask(std::string id, TaskRequest request,
                           std::shared_ptr<const TransferServices> services)
    : id_(std::move(id))
    , request_(std::move(request))
    , services_(std::move(services))
    , created_at_(std::chrono::system_clock::now())
    , total_(request_.known_size)
    , updated_at_(created_at_) {
}

TransferTask::~TransferTask() = default;

TaskSnapshot TransferTask::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    TaskSnapshot snap;
    snap.id = id_;
    snap.file_id = request_.file_id;
    snap.cid = request_.cid;
    snap.name = request_.name;
    snap.dest_path = request_.dest_path.string();
    snap.status = status_;
    snap.phase = phase_;
    snap.error = error_;
    snap.loaded = loaded_;
    snap.total = total_;
    snap.speed = speed_;
    snap.created_at = created_at_;
    snap.updated_at = updated_at_;
    return snap;
}

TaskStatus TransferTask::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

bool TransferTask::idle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !attempt_ || attempt_->finished.load();
}

bool TransferTask::wait_idle(std::chrono::steady_clock::time_point deadline) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_until(lock, deadline, [this] {
        return !attempt_ || attempt_->finished.load();
    });
}

std::error_code TransferTask::start() {
    std::shared_ptr<Attempt> attempt;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ != TaskStatus::Pending) {
            return task_error(ErrorCode::InvalidState);
        }
        try {
            services_->keys->validate(request_.decryption);
        } catch (const CidBoostError& e) {
            status_ = TaskStatus::Error;
            error_ = e.what();
            touch_locked();
            Logger::instance().error("Task {} rejected: {}", id_, error_);
            return make_error_code(e.code());
        }
        status_ = TaskStatus::Running;
        phase_ = TaskPhase::Preparing;
        touch_locked();
        attempt = new_attempt_locked();
    }
    launch(std::move(attempt), nullptr);
    return {};
}

std::error_code TransferTask::pause() {
    std::shared_ptr<Attempt> attempt;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ != TaskStatus::Running) {
            return task_error(ErrorCode::InvalidState);
        }
        status_ = TaskStatus::Paused;
        speed_ = 0.0;
        touch_locked();
        attempt = attempt_;
    }
    if (attempt) attempt->stop();
    Logger::instance().info("Task {} paused at {} bytes", id_, snapshot().loaded);
    return {};
}

std::error_code TransferTask::resume() {
    std::shared_ptr<Attempt> previous;
    std::shared_ptr<Attempt> attempt;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ != TaskStatus::Paused && status_ != TaskStatus::Error) {
            return task_error(ErrorCode::InvalidState);
        }
        status_ = TaskStatus::Running;
        phase_ = TaskPhase::Preparing;
        error_.clear();
        speed_ = 0.0;
        touch_locked();
        previous = attempt_;
        attempt = new_attempt_locked();
    }
    Logger::instance().info("Task {} resumed", id_);
    launch(std::move(attempt), std::move(previous));
    return {};
}

std::error_code TransferTask::cancel() {
    std::shared_ptr<Attempt> attempt;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ != TaskStatus::Running && status_ != TaskStatus::Paused &&
            status_ != TaskStatus::Error) {
            return task_error(ErrorCode::InvalidState);
        }
        status_ = TaskStatus::Canceled;
        phase_ = TaskPhase::None;
        speed_ = 0.0;
        touch_locked();
        attempt = attempt_;
    }
    if (attempt) attempt->stop();

    std::error_code ec;
    std::filesystem::remove(request_.dest_path, ec);
    if (ec) {
        Logger::instance().warning("Failed to remove partial file {}: {}",
                                   request_.dest_path.string(), ec.message());
    }
    Logger::instance().info("Task {} canceled", id_);
    return {};
}

std::shared_ptr<TransferTask::Attempt> TransferTask::new_attempt_locked() {
    auto attempt = std::make_shared<Attempt>();
    attempt->number = ++attempts_;
    attempt_ = attempt;
    return attempt;
}

void TransferTask::launch(std::shared_ptr<Attempt> attempt, std::shared_ptr<Attempt> previous) {
    auto runner = run(shared_from_this(), std::move(attempt), std::move(previous));
    services_->scheduler->spawn(runner.release());
}

elio::coro::task<void> TransferTask::run(std::shared_ptr<TransferTask> self,
                                         std::shared_ptr<Attempt> attempt,
                                         std::shared_ptr<Attempt> previous) {
    // A superseded attempt may still be unwinding; never overlap two
    if (previous) {
        while (!previous->finished.load()) {
            co_await previous->on_finished->wait();
        }
    }

    auto& log = Logger::instance();
    const std::string cid = self->request_.cid;
    const auto& policy = self->services_->policy;
    log.info("Task {} attempt {} started for CID {}", self->id_, attempt->number, cid);

    if (policy) {
        auto ec = co_await policy->boost_for_download(cid);
        if (ec) {
            log.warning("Connection boost for {} failed: {}", cid, ec.message());
        }
    }

    std::exception_ptr failure;
    try {
        co_await self->download(attempt);
    } catch (const std::exception&) {
        failure = std::current_exception();
    }
    attempt->io_done.store(true);
    if (failure) {
        self->fail(attempt, failure);
    }

    if (policy) {
        auto ec = co_await policy->restore_defaults(cid);
        if (ec) {
            log.warning("Connection restore for {} failed: {}", cid, ec.message());
        }
    }
    {
        std::lock_guard<std::mutex> lock(self->mutex_);
        attempt->finished.store(true);
    }
    self->idle_cv_.notify_all();
    attempt->on_finished->notify();
}

elio::coro::task<void> TransferTask::download(std::shared_ptr<Attempt> attempt) {
    auto self = shared_from_this();
    const auto& svc = *services_;
    const auto& cid = request_.cid;
    const auto& dest = request_.dest_path;
    CancelToken token = attempt->cancel.token();

    if (!set_phase(attempt, TaskPhase::Connecting)) co_return;
    co_await connect_phase(attempt);
    if (token.cancelled()) co_return;

    // Progress restarts with the file
    std::error_code ec;
    auto partial = std::filesystem::file_size(dest, ec);
    if (!ec && partial > 0) {
        Logger::instance().info("Discarding {} partial bytes of {}, restarting from offset 0",
                                partial, dest.string());
    }
    std::filesystem::remove(dest, ec);
    reset_progress(attempt);

    const bool encrypted = request_.decryption.type != EncryptionType::None;
    SymmetricKey key;
    if (encrypted) {
        key = svc.keys->resolve(request_.decryption);
    }
    if (token.cancelled()) co_return;

    auto sink = attempt->open_sink(dest);
    if (!sink) co_return;

    (void)speed_monitor(self, attempt).spawn();
    if (!set_phase(attempt, TaskPhase::Downloading)) co_return;

    auto on_progress = [self, attempt](uint64_t delta) {
        self->add_progress(attempt, delta);
    };

    if (encrypted) {
        co_await svc.decryptor->download_and_decrypt(cid, key, *sink, token, on_progress);
    } else {
        TotalSizeCallback on_total;
        if (total_bytes() == 0) {
            on_total = [self, attempt](int64_t total) {
                if (total > 0) self->set_total(attempt, static_cast<uint64_t>(total));
            };
        }
        co_await svc.fetcher->fetch(cid, *sink, token, on_progress, on_total);
    }
    sink->finish();
    complete(attempt);
}

elio::coro::task<void> TransferTask::connect_phase(std::shared_ptr<Attempt> attempt) {
    const auto& svc = *services_;
    const std::string cid = request_.cid;
    CancelToken token = attempt->cancel.token();

    // The size lookup runs beside the warmup and is bounded on its own
    std::optional<elio::coro::join_handle<std::optional<int64_t>>> size_handle;
    if (total_bytes() == 0) {
        size_handle = size_job(svc.network, cid,
                               std::chrono::milliseconds(svc.config.size_timeout_ms)).spawn();
    }

    // Discovery is bounded on its own; the deadline only guards a stalled node
    auto deadline = std::make_shared<WarmupDeadline>(token);
    WarmupResult warmup;
    bool warmed = false;
    if (svc.booster->has_cached_providers(cid)) {
        Logger::instance().debug("Providers for {} cached, skipping warmup", cid);
    } else {
        auto warmup_handle = warmup_job(svc.booster, cid, deadline->warmup.token()).spawn();
        (void)warmup_watchdog(deadline,
                              std::chrono::milliseconds(svc.config.warmup_timeout_ms)).spawn();
        warmup = co_await warmup_handle;
        deadline->settled.cancel();
        warmed = true;
    }

    std::optional<int64_t> size;
    if (size_handle) {
        size = co_await *size_handle;
    }
    if (token.cancelled()) co_return;
    if (size && *size > 0) {
        set_total(attempt, static_cast<uint64_t>(*size));
    }

    if (deadline->expired.load()) {
        Logger::instance().warning("Warmup for {} timed out, downloading anyway", cid);
    } else if (warmed && !warmup.ok()) {
        Logger::instance().warning("Warmup for {} failed ({}), downloading anyway",
                                   cid, warmup.error.message());
    } else if (warmed && warmup.connected > 0 && svc.policy) {
        std::vector<std::string> peer_ids;
        for (const auto& peer : svc.booster->get_cached_providers(cid)) {
            peer_ids.push_back(peer.id);
        }
        auto ec = co_await svc.policy->protect_peers(peer_ids);
        if (ec) {
            Logger::instance().debug("Could not protect providers of {}: {}", cid, ec.message());
        }
    }
}

elio::coro::task<void> TransferTask::speed_monitor(std::shared_ptr<TransferTask> self,
                                                   std::shared_ptr<Attempt> attempt) {
    const auto period = std::chrono::milliseconds(self->services_->config.speed_sample_ms);
    uint64_t last_bytes = attempt->bytes.load();
    auto last_time = Clock::now();

    while (!attempt->io_done.load()) {
        co_await elio::time::sleep_for(period);
        if (attempt->io_done.load()) break;

        auto now = Clock::now();
        uint64_t bytes = attempt->bytes.load();
        double seconds = std::chrono::duration<double>(now - last_time).count();
        if (seconds <= 0.0) continue;

        double instant = static_cast<double>(bytes - last_bytes) / seconds;
        if (!self->sample_speed(attempt, instant)) break;
        last_bytes = bytes;
        last_time = now;
    }
}

bool TransferTask::set_phase(const std::shared_ptr<Attempt>& attempt, TaskPhase phase) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (attempt_ != attempt || status_ != TaskStatus::Running) return false;
    phase_ = phase;
    touch_locked();
    return true;
}

void TransferTask::set_total(const std::shared_ptr<Attempt>& attempt, uint64_t total) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (attempt_ != attempt || total_ != 0) return;
    total_ = total;
    touch_locked();
}

void TransferTask::reset_progress(const std::shared_ptr<Attempt>& attempt) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (attempt_ != attempt) return;
    loaded_ = 0;
    touch_locked();
}

void TransferTask::add_progress(const std::shared_ptr<Attempt>& attempt, uint64_t delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (attempt_ != attempt || status_ != TaskStatus::Running) return;
    loaded_ += delta;
    attempt->bytes.fetch_add(delta);
    touch_locked();
}

bool TransferTask::sample_speed(const std::shared_ptr<Attempt>& attempt, double instant) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (attempt_ != attempt || status_ != TaskStatus::Running) return false;
    double weight = services_->config.speed_smoothing;
    speed_ = speed_ == 0.0 ? instant : speed_ * (1.0 - weight) + instant * weight;
    return true;
}

void TransferTask::complete(const std::shared_ptr<Attempt>& attempt) {
    uint64_t loaded = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (attempt_ != attempt || status_ != TaskStatus::Running) return;
        status_ = TaskStatus::Completed;
        phase_ = TaskPhase::None;
        speed_ = 0.0;
        if (total_ < loaded_) total_ = loaded_;
        loaded = loaded_;
        touch_locked();
    }
    Logger::instance().info("Task {} completed: {} bytes written to {}",
                            id_, loaded, request_.dest_path.string());

    if (services_->health) {
        services_->health->on_download_success(request_.cid);
    }
    if (services_->catalog && request_.file_id) {
        if (!services_->catalog->update_saved_path(*request_.file_id, request_.dest_path.string())) {
            Logger::instance().warning("Could not record saved path of file {}", *request_.file_id);
        }
    }
}

void TransferTask::fail(const std::shared_ptr<Attempt>& attempt, const std::exception_ptr& error) {
    ErrorCode code = error_code_of(error);
    std::string message;
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        message = e.what();
    }

    if (code == ErrorCode::Cancelled || attempt->cancel.cancelled()) {
        Logger::instance().debug("Task {} attempt {} stopped", id_, attempt->number);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (attempt_ != attempt || status_ != TaskStatus::Running) return;
        status_ = TaskStatus::Error;
        phase_ = TaskPhase::None;
        error_ = message;
        speed_ = 0.0;
        touch_locked();
    }
    Logger::instance().error("Task {} failed: {}", id_, message);

    if (services_->health && reported_to_health(code)) {
        services_->health->on_download_timeout(request_.cid);
    }
}

uint64_t TransferTask::total_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

void TransferTask::touch_locked() {
    updated_at_ = std::chrono::system_clock::now();
}

} // namespace cidboost
