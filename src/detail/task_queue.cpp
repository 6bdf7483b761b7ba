#include "coursedl/detail/task_queue.hpp"

#include <utility>

namespace coursedl::detail {

bool TaskQueue::push(DownloadTask task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ids_.insert(task.id).second) {
        return false;
    }
    heap_.push(Entry{std::move(task), next_sequence_++});
    return true;
}

std::optional<DownloadTask> TaskQueue::pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (heap_.empty()) {
        return std::nullopt;
    }
    DownloadTask task = heap_.top().task;
    heap_.pop();
    ids_.erase(task.id);
    return task;
}

bool TaskQueue::contains(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ids_.count(task_id) != 0;
}

bool TaskQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return heap_.empty();
}

std::size_t TaskQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return heap_.size();
}

} // namespace coursedl::detail
