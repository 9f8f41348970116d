#include "distributed/task_queue.hpp"

#include <utility>

namespace refinery::distributed {

bool TaskQueue::Push(TaskId id) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_) {
      return false;
    }
    ids_.push_back(std::move(id));
  }
  available_.notify_one();
  return true;
}

std::optional<TaskId> TaskQueue::PopFor(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mu_);
  available_.wait_for(lock, timeout, [this]() { return closed_ || !ids_.empty(); });
  if (ids_.empty()) {
    return std::nullopt;
  }
  TaskId id = std::move(ids_.front());
  ids_.pop_front();
  return id;
}

void TaskQueue::Close() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    closed_ = true;
  }
  available_.notify_all();
}

void TaskQueue::Reset() {
  std::lock_guard<std::mutex> lock(mu_);
  ids_.clear();
  closed_ = false;
}

std::size_t TaskQueue::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return ids_.size();
}

bool TaskQueue::closed() const {
  std::lock_guard<std::mutex> lock(mu_);
  return closed_;
}

} // namespace refinery::distributed
