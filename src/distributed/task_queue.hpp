#pragma once

#include "distributed/task.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace refinery::distributed {

// Thread-safe FIFO of task ids with its own mutex, independent of the
// processor state lock. Pops are timeout-bounded so worker loops can observe
// a shutdown flag between waits.
class TaskQueue {
public:
  TaskQueue() = default;
  TaskQueue(const TaskQueue&) = delete;
  TaskQueue& operator=(const TaskQueue&) = delete;

  // Returns false once the queue is closed; the id is dropped.
  bool Push(TaskId id);

  // Waits up to `timeout` for an id. nullopt on timeout or when closed and
  // drained.
  std::optional<TaskId> PopFor(std::chrono::milliseconds timeout);

  // Rejects further pushes and wakes every waiter.
  void Close();

  // Drops queued ids and reopens the queue.
  void Reset();

  std::size_t size() const;
  bool closed() const;

private:
  mutable std::mutex mu_;
  std::condition_variable available_;
  std::deque<TaskId> ids_;
  bool closed_ = false;
};

} // namespace refinery::distributed
