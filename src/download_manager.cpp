#include "coursedl/download_manager.hpp"
#include "coursedl/detail/task_queue.hpp"
#include "coursedl/engine_context.hpp"
#include "coursedl/log.hpp"
#include "coursedl/transfer_executor.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <thread>
#include <utility>

#include <fmt/format.h>

namespace coursedl {

namespace {

// Upper bound on how long worker progress waits before it is applied.
constexpr std::chrono::milliseconds kCoordinatorTick{100};

struct WorkerUpdate {
    enum class Type {
        Started,
        Progress,
        Retrying,
        Finished
    };

    Type type{Type::Progress};
    std::string task_id;
    TransferStatus status{TransferStatus::InProgress};
    std::uint64_t bytes{0};
    std::optional<std::uint64_t> total;
    std::optional<std::string> checksum;
    std::uint32_t attempt_count{0};
    std::optional<TransferError> error;
};

bool isInterrupted(TransferStatus status) noexcept {
    return status == TransferStatus::Queued || status == TransferStatus::InProgress ||
           status == TransferStatus::Paused;
}

} // namespace

class DownloadManager::Impl {
public:
    explicit Impl(EngineContext& context) : context_(context) {}

    std::size_t submit(const std::vector<DownloadTask>& tasks) {
        if (running_) {
            throw std::logic_error("submit() called while a run is in progress");
        }

        std::set<std::string> seen;
        std::size_t queued = 0;
        for (const auto& task : tasks) {
            if (task.id.empty()) {
                log::get()->warn("ignoring task without id (url {})", task.url);
                continue;
            }
            if (!seen.insert(task.id).second || queue_.contains(task.id)) {
                log::get()->warn("duplicate task id {}, keeping the first occurrence", task.id);
                continue;
            }
            submitted_.insert(task.id);

            auto previous = context_.store().get(task.id);
            if (previous && !previous->destination.empty() &&
                previous->destination != task.destination.string()) {
                log::get()->info("task {}: destination changed from {} to {}, discarding its resume record",
                                 task.id, previous->destination, task.destination.string());
                previous.reset();
            }

            if (previous && previous->status == TransferStatus::Completed &&
                context_.validator().canSkip(task, *previous)) {
                log::get()->debug("task {}: already complete, skipping", task.id);
                ++pending_.skipped;
                emit(task.id, TransferStatus::Skipped, previous->bytes_downloaded, previous->total_bytes);
                continue;
            }

            ResumeRecord record;
            record.task_id = task.id;
            record.status = TransferStatus::Queued;
            record.destination = task.destination.string();
            record.total_bytes = task.expected_size;
            if (previous && isInterrupted(previous->status)) {
                record.attempt_count = previous->attempt_count;
                record.last_error = previous->last_error;
                if (context_.config().resume_on_restart) {
                    record.bytes_downloaded = previous->bytes_downloaded;
                    if (!record.total_bytes) {
                        record.total_bytes = previous->total_bytes;
                    }
                }
            }
            record.updated_at = nowEpochMillis();
            context_.store().put(record);

            queue_.push(task);
            ++queued;
            emit(task.id, TransferStatus::Queued, record.bytes_downloaded, record.total_bytes);
        }

        persist();
        log::get()->info("submitted {} tasks: {} queued, {} already complete", tasks.size(), queued,
                         pending_.skipped);
        return queued;
    }

    RunSummary run(int concurrency) {
        if (concurrency < kMinConcurrency || concurrency > kMaxConcurrency) {
            throw std::invalid_argument(fmt::format("concurrency must be between {} and {}, got {}",
                                                    kMinConcurrency, kMaxConcurrency, concurrency));
        }
        if (running_.exchange(true)) {
            throw std::logic_error("run() is already in progress");
        }

        RunSummary summary = std::exchange(pending_, RunSummary{});
        degraded_ = degraded_now_;
        log::get()->info("starting {} workers for {} queued tasks", concurrency, queue_.size());

        {
            std::lock_guard<std::mutex> lock(channel_mutex_);
            active_workers_ = concurrency;
        }
        std::vector<std::thread> workers;
        workers.reserve(static_cast<std::size_t>(concurrency));
        for (int i = 0; i < concurrency; ++i) {
            workers.emplace_back([this]() { workerLoop(); });
        }

        coordinate(summary);

        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }

        // Tasks left behind by a cancel stay queued for a later run(), which
        // starts with a cleared stop flag.
        summary.not_started = queue_.size();
        context_.cancellation().reset();
        if (context_.store().dirty()) {
            persist();
        }
        summary.persistence_degraded = degraded_;
        running_ = false;

        log::get()->info("run finished: {} completed, {} skipped, {} failed, {} paused, {} not started",
                         summary.completed, summary.skipped, summary.failed, summary.paused,
                         summary.not_started);
        return summary;
    }

    [[nodiscard]] int configuredConcurrency() const noexcept { return context_.config().concurrency; }

    void cancel() {
        log::get()->info("cancellation requested");
        context_.cancellation().requestStop();
        channel_cv_.notify_all();
    }

    std::vector<ResumeRecord> snapshot() const { return context_.store().snapshot(); }

    std::size_t purgeUnreferenced() {
        if (running_) {
            throw std::logic_error("purgeUnreferenced() called while a run is in progress");
        }
        const std::size_t removed = context_.store().purge(submitted_);
        if (removed > 0) {
            log::get()->info("purged {} records of unreferenced tasks", removed);
            persist();
        }
        return removed;
    }

private:
    // Coordinator side. Runs on the thread that called run().
    void coordinate(RunSummary& summary) {
        const EngineConfig& config = context_.config();
        auto last_flush = std::chrono::steady_clock::now();
        std::uint64_t unflushed_bytes = 0;

        for (;;) {
            std::deque<WorkerUpdate> batch;
            bool workers_done = false;
            {
                std::unique_lock<std::mutex> lock(channel_mutex_);
                channel_cv_.wait_for(lock, kCoordinatorTick,
                                     [this]() { return !updates_.empty() || active_workers_ == 0; });
                batch.swap(updates_);
                workers_done = active_workers_ == 0;
            }

            bool transition = false;
            std::map<std::string, ProgressEvent> progress_events;
            for (auto& update : batch) {
                if (update.type == WorkerUpdate::Type::Progress) {
                    unflushed_bytes += applyProgress(update, progress_events);
                } else {
                    progress_events.erase(update.task_id);
                    applyTransition(update, summary);
                    transition = true;
                }
            }
            for (const auto& entry : progress_events) {
                context_.emit(entry.second);
            }

            const auto now = std::chrono::steady_clock::now();
            const bool due = now - last_flush >= config.progress_flush_interval ||
                             unflushed_bytes >= config.progress_flush_bytes;
            if (transition || (due && context_.store().dirty())) {
                persist();
                last_flush = now;
                unflushed_bytes = 0;
            }

            if (workers_done) {
                break;
            }
        }
    }

    std::uint64_t applyProgress(const WorkerUpdate& update, std::map<std::string, ProgressEvent>& events) {
        ResumeRecord record = recordFor(update.task_id);
        const std::uint64_t delta = update.bytes > record.bytes_downloaded ? update.bytes - record.bytes_downloaded : 0;
        record.status = TransferStatus::InProgress;
        record.bytes_downloaded = update.bytes;
        if (update.total) {
            record.total_bytes = update.total;
        }
        record.updated_at = nowEpochMillis();
        context_.store().put(record);

        events[update.task_id] =
            ProgressEvent{update.task_id, TransferStatus::InProgress, update.bytes, record.total_bytes, record.updated_at};
        return delta;
    }

    void applyTransition(const WorkerUpdate& update, RunSummary& summary) {
        ResumeRecord record = recordFor(update.task_id);
        record.status = update.status;
        record.bytes_downloaded = update.bytes;
        if (update.total) {
            record.total_bytes = update.total;
        }
        record.attempt_count = update.attempt_count;
        record.updated_at = nowEpochMillis();

        switch (update.type) {
            case WorkerUpdate::Type::Retrying:
                if (update.error) {
                    record.last_error = update.error->describe();
                }
                break;
            case WorkerUpdate::Type::Finished:
                if (update.status == TransferStatus::Completed) {
                    record.checksum = update.checksum;
                    record.last_error.reset();
                    ++summary.completed;
                } else if (update.status == TransferStatus::Failed) {
                    const TransferError error =
                        update.error.value_or(TransferError{ErrorKind::TransientNetwork, 0, "unknown error"});
                    record.last_error = error.describe();
                    summary.failures.push_back({update.task_id, error});
                    ++summary.failed;
                } else if (update.status == TransferStatus::Paused) {
                    ++summary.paused;
                }
                break;
            case WorkerUpdate::Type::Started:
            case WorkerUpdate::Type::Progress:
                break;
        }

        context_.store().put(record);
        emit(update.task_id, record.status, record.bytes_downloaded, record.total_bytes);
    }

    ResumeRecord recordFor(const std::string& task_id) const {
        if (auto record = context_.store().get(task_id)) {
            return *record;
        }
        ResumeRecord record;
        record.task_id = task_id;
        return record;
    }

    void persist() {
        try {
            context_.store().flush();
            if (degraded_now_) {
                log::get()->info("status document {} is writable again", context_.store().path().string());
                degraded_now_ = false;
            }
        } catch (const StatusStoreError& ex) {
            log::get()->error("cannot persist status document, continuing in memory: {}", ex.what());
            degraded_ = true;
            degraded_now_ = true;
        }
    }

    void emit(const std::string& task_id, TransferStatus status, std::uint64_t bytes,
              const std::optional<std::uint64_t>& total) const {
        context_.emit(ProgressEvent{task_id, status, bytes, total, nowEpochMillis()});
    }

    // Worker side.
    void workerLoop() {
        TransferExecutor executor(context_);
        CancellationToken& cancel = context_.cancellation();
        const auto delay = context_.config().inter_task_delay;

        bool first = true;
        while (!cancel.stopRequested()) {
            if (!first) {
                if (queue_.empty()) {
                    break;
                }
                if (delay.count() > 0 && cancel.waitFor(delay)) {
                    break;
                }
            }
            auto task = queue_.pop();
            if (!task) {
                break;
            }
            first = false;
            processTask(executor, *task);
        }

        {
            std::lock_guard<std::mutex> lock(channel_mutex_);
            --active_workers_;
        }
        channel_cv_.notify_all();
    }

    void processTask(TransferExecutor& executor, const DownloadTask& task) {
        ResumeRecord record = recordFor(task.id);
        std::uint32_t attempts = record.attempt_count;

        WorkerUpdate started;
        started.type = WorkerUpdate::Type::Started;
        started.task_id = task.id;
        started.status = TransferStatus::InProgress;
        started.bytes = record.bytes_downloaded;
        started.total = record.total_bytes;
        started.attempt_count = attempts;
        post(std::move(started), true);
        log::get()->debug("task {}: started ({})", task.id, task.url);

        const ByteProgress progress = [this, &task](std::uint64_t bytes, std::optional<std::uint64_t> total) {
            WorkerUpdate update;
            update.type = WorkerUpdate::Type::Progress;
            update.task_id = task.id;
            update.bytes = bytes;
            update.total = total;
            post(std::move(update), false);
        };

        AttemptOptions options;
        for (;;) {
            const TransferOutcome outcome = executor.execute(task, record, options, progress);
            log::get()->debug("task {}: attempt ended: {}", task.id, outcomeLabel(outcome.kind));

            WorkerUpdate update;
            update.type = WorkerUpdate::Type::Finished;
            update.task_id = task.id;
            update.bytes = outcome.bytes_on_disk;
            update.total = outcome.total_bytes;
            update.attempt_count = attempts;

            switch (outcome.kind) {
                case TransferOutcome::Kind::Success:
                case TransferOutcome::Kind::Skip:
                    if (outcome.kind == TransferOutcome::Kind::Skip) {
                        log::get()->info("task {}: {}", task.id, outcome.skip_reason);
                    } else {
                        log::get()->info("task {}: completed ({} bytes)", task.id, outcome.bytes_on_disk);
                    }
                    update.status = TransferStatus::Completed;
                    update.checksum = outcome.checksum;
                    post(std::move(update), true);
                    return;

                case TransferOutcome::Kind::Cancelled:
                    log::get()->info("task {}: paused at byte {}", task.id, outcome.bytes_on_disk);
                    update.status = TransferStatus::Paused;
                    post(std::move(update), true);
                    return;

                case TransferOutcome::Kind::Fatal:
                    update.status = TransferStatus::Failed;
                    update.error = outcome.error;
                    log::get()->error("task {}: failed: {}", task.id,
                                      outcome.error ? outcome.error->describe() : std::string{"unknown error"});
                    post(std::move(update), true);
                    return;

                case TransferOutcome::Kind::Retryable:
                    break;
            }

            const TransferError error =
                outcome.error.value_or(TransferError{ErrorKind::TransientNetwork, 0, "unknown error"});
            const RetryDecision decision = context_.retryPolicy().decide(error, attempts);
            attempts = decision.attempt_count;
            update.attempt_count = attempts;
            update.error = error;

            if (!decision.retry) {
                log::get()->error("task {}: failed after {} attempts: {}", task.id, attempts, error.describe());
                update.status = TransferStatus::Failed;
                post(std::move(update), true);
                return;
            }

            log::get()->warn("task {}: attempt {} of {} failed: {}; retrying in {} ms", task.id, attempts,
                             context_.retryPolicy().maxAttempts(), error.describe(), decision.delay.count());
            update.type = WorkerUpdate::Type::Retrying;
            update.status = TransferStatus::InProgress;
            post(std::move(update), true);

            if (context_.cancellation().waitFor(decision.delay)) {
                WorkerUpdate paused;
                paused.type = WorkerUpdate::Type::Finished;
                paused.task_id = task.id;
                paused.status = TransferStatus::Paused;
                paused.bytes = outcome.bytes_on_disk;
                paused.total = outcome.total_bytes;
                paused.attempt_count = attempts;
                post(std::move(paused), true);
                return;
            }

            options.force_restart = outcome.restart_from_zero;
            record.attempt_count = attempts;
            if (outcome.total_bytes) {
                record.total_bytes = outcome.total_bytes;
            }
        }
    }

    void post(WorkerUpdate update, bool wake) {
        {
            std::lock_guard<std::mutex> lock(channel_mutex_);
            updates_.push_back(std::move(update));
        }
        if (wake) {
            channel_cv_.notify_one();
        }
    }

    EngineContext& context_;
    detail::TaskQueue queue_;
    std::set<std::string> submitted_;
    RunSummary pending_;
    std::atomic<bool> running_{false};
    bool degraded_{false};
    bool degraded_now_{false};

    std::mutex channel_mutex_;
    std::condition_variable channel_cv_;
    std::deque<WorkerUpdate> updates_;
    int active_workers_{0};
};

DownloadManager::DownloadManager(EngineContext& context) : impl_(std::make_unique<Impl>(context)) {}

DownloadManager::~DownloadManager() = default;

std::size_t DownloadManager::submit(const std::vector<DownloadTask>& tasks) { return impl_->submit(tasks); }

RunSummary DownloadManager::run(int concurrency) { return impl_->run(concurrency); }

RunSummary DownloadManager::run() { return impl_->run(impl_->configuredConcurrency()); }

void DownloadManager::cancel() { impl_->cancel(); }

std::vector<ResumeRecord> DownloadManager::snapshot() const { return impl_->snapshot(); }

std::size_t DownloadManager::purgeUnreferenced() { return impl_->purgeUnreferenced(); }

} // namespace coursedl
