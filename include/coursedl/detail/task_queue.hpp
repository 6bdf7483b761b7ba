#pragma once

#include "coursedl/download_task.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <set>
#include <string>
#include <vector>

namespace coursedl::detail {

// Highest priority first, then submission order. A task id is queued at most once.
class TaskQueue {
public:
    // Returns false if a task with the same id is already waiting.
    bool push(DownloadTask task);
    std::optional<DownloadTask> pop();

    [[nodiscard]] bool contains(const std::string& task_id) const;
    [[nodiscard]] bool empty() const;
    [[nodiscard]] std::size_t size() const;

private:
    struct Entry {
        DownloadTask task;
        std::uint64_t sequence{0};
    };

    struct Before {
        bool operator()(const Entry& lhs, const Entry& rhs) const noexcept {
            if (lhs.task.priority != rhs.task.priority) {
                return lhs.task.priority < rhs.task.priority;
            }
            return lhs.sequence > rhs.sequence;
        }
    };

    std::priority_queue<Entry, std::vector<Entry>, Before> heap_;
    std::set<std::string> ids_;
    std::uint64_t next_sequence_{0};
    mutable std::mutex mutex_;
};

} // namespace coursedl::detail
