#pragma once

#include "download_task.hpp"
#include "errors.hpp"
#include "transfer_status.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace coursedl {

class EngineContext;

struct TaskFailure {
    std::string task_id;
    TransferError error;
};

struct RunSummary {
    std::size_t completed{0};
    std::size_t failed{0};
    std::size_t skipped{0};
    std::size_t paused{0};
    // Still queued when the run was cancelled.
    std::size_t not_started{0};
    std::vector<TaskFailure> failures;
    bool persistence_degraded{false};

    [[nodiscard]] std::size_t total() const noexcept {
        return completed + failed + skipped + paused + not_started;
    }
};

// Owns the task queue and the worker threads of a run. The thread calling
// run() is the only writer of the status store while the run lasts.
class DownloadManager {
public:
    explicit DownloadManager(EngineContext& context);
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    // Skips tasks whose completed artifact still validates and queues the rest.
    // Returns the number of tasks queued.
    std::size_t submit(const std::vector<DownloadTask>& tasks);

    // Drains the queue with `concurrency` workers (1..10, std::invalid_argument
    // otherwise) and blocks until they exit.
    RunSummary run(int concurrency);
    // Uses the configured concurrency.
    RunSummary run();

    // Cooperative stop. Safe to call from any thread, including a progress sink.
    void cancel();

    [[nodiscard]] std::vector<ResumeRecord> snapshot() const;

    // Removes records of tasks that were never submitted to this manager.
    std::size_t purgeUnreferenced();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace coursedl
