#pragma once

#include "config/engine_config.hpp"
#include "core/logging/logger.hpp"
#include "distributed/task.hpp"
#include "distributed/task_queue.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace refinery::distributed {

struct TaskFailure {
  std::size_t index = 0;
  TaskId task_id;
  std::size_t retry_count = 0;
  std::string error;
};

// Outcome of one ProcessDistributed call.
//
// `results` holds completed items only, in submission order. `failures`
// lists the rest, also in submission order. An aggregate function that throws
// leaves `aggregate` empty and sets `aggregate_error`; the run itself still
// succeeds.
template <typename Result>
struct DistributedResult {
  std::vector<Result> results;
  std::vector<TaskFailure> failures;
  std::optional<Result> aggregate;
  std::string aggregate_error;
  std::size_t total_tasks = 0;
  std::size_t completed_tasks = 0;
  std::size_t failed_tasks = 0;
  std::size_t retries = 0;
  std::size_t stalls_detected = 0;
  std::chrono::milliseconds elapsed{0};
};

struct TaskSnapshot {
  TaskId id;
  std::size_t index = 0;
  TaskStatus status = TaskStatus::kPending;
  std::size_t retry_count = 0;
  std::optional<std::size_t> assigned_worker;
  std::string error;
};

struct WorkerSnapshot {
  std::size_t id = 0;
  WorkerStatus status = WorkerStatus::kIdle;
  std::size_t completed_tasks = 0;
  std::size_t failed_tasks = 0;
  std::optional<TaskId> current_task;
};

// Task counts describe the current (or last) run. Worker counters and
// `stale_completions` accumulate across runs until Reset.
struct ProcessorStatistics {
  bool running = false;
  std::size_t num_workers = 0;
  std::size_t total_tasks = 0;
  std::size_t pending_tasks = 0;
  std::size_t running_tasks = 0;
  std::size_t retrying_tasks = 0;
  std::size_t completed_tasks = 0;
  std::size_t failed_tasks = 0;
  std::size_t total_retries = 0;
  std::size_t stalls_detected = 0;
  std::size_t stale_completions = 0;
  double average_task_ms = 0.0;
  std::vector<WorkerSnapshot> workers;
};

struct ProcessorProgress {
  std::size_t total = 0;
  std::size_t completed = 0;
  std::size_t failed = 0;
  std::size_t in_flight = 0;
  // 0.0 when there are no tasks.
  double percent_complete = 0.0;
};

namespace detail {

// Bounded string form of an item; feeds task ids and previews.
template <typename Item>
std::string PreviewItem(const Item& item) {
  if constexpr (std::is_convertible_v<const Item&, std::string_view>) {
    const std::string_view view(item);
    return std::string(view.substr(0, kTaskIdPayloadPrefix));
  } else if constexpr (requires(std::ostream& out, const Item& value) { out << value; }) {
    std::ostringstream out;
    out << item;
    return out.str().substr(0, kTaskIdPayloadPrefix);
  } else {
    return std::string();
  }
}

} // namespace detail

// Generic fan-out over a fixed pool of worker threads.
//
// Every item becomes a Task with a deterministic id. Workers pop ids from a
// shared queue, run the caller's function outside the state lock and report
// back under it. A failed attempt is re-queued (any worker may pick it up)
// while fault tolerance is on and retries remain; otherwise the task fails.
// The calling thread doubles as the stall detector: every heartbeat interval
// it re-dispatches Running tasks older than `task_timeout` through the same
// retry-or-fail path. In-flight work is never cancelled, so a function that
// never returns still blocks the final join.
//
// All Task and Worker mutations happen under one mutex. One run at a time per
// instance.
class DistributedProcessor {
public:
  DistributedProcessor(config::ProcessorConfig config, core::logging::Logger& logger);

  DistributedProcessor(const DistributedProcessor&) = delete;
  DistributedProcessor& operator=(const DistributedProcessor&) = delete;

  // `fn` is called concurrently from worker threads and must be thread-safe.
  //
  // Contract:
  // - false: rejected before any work (invalid config, run already active,
  //   task id collision, no worker could start).
  // - true: every item reached Completed or Failed; `result` describes them.
  template <typename Item, typename Fn,
            typename Result = std::decay_t<std::invoke_result_t<Fn&, const Item&>>>
  bool ProcessDistributed(
      const std::vector<Item>& items, Fn fn, DistributedResult<Result>& result,
      std::string& error,
      std::type_identity_t<std::function<Result(const std::vector<Result>&)>> aggregate = {}) {
    result = DistributedResult<Result>{};

    std::vector<std::string> previews;
    previews.reserve(items.size());
    for (const auto& item : items) {
      previews.push_back(detail::PreviewItem(item));
    }

    // Slots are written by commit closures, which only run under the state
    // mutex for a task's current attempt.
    std::vector<std::optional<Result>> slots(items.size());
    const TaskBody body = [&items, &fn, &slots](std::size_t index) -> CommitFn {
      auto value = std::make_shared<Result>(fn(items[index]));
      return [&slots, index, value]() { slots[index] = std::move(*value); };
    };

    RunSummary summary;
    if (!RunTasks(previews, body, summary, error)) {
      return false;
    }

    for (auto& slot : slots) {
      if (slot.has_value()) {
        result.results.push_back(std::move(*slot));
      }
    }
    result.failures = std::move(summary.failures);
    result.total_tasks = items.size();
    result.completed_tasks = summary.completed;
    result.failed_tasks = summary.failed;
    result.retries = summary.retries;
    result.stalls_detected = summary.stalls;
    result.elapsed = summary.elapsed;

    if (aggregate) {
      try {
        result.aggregate = aggregate(result.results);
      } catch (const std::exception& e) {
        result.aggregate_error = e.what();
        logger_->Error("aggregate function failed", {{"error", result.aggregate_error}});
      } catch (...) {
        result.aggregate_error = "non-standard exception";
        logger_->Error("aggregate function failed", {{"error", result.aggregate_error}});
      }
    }
    return true;
  }

  ProcessorStatistics GetStatistics() const;
  ProcessorProgress GetProgress() const;

  std::vector<TaskSnapshot> SnapshotTasks() const;
  std::vector<WorkerSnapshot> SnapshotWorkers() const;

  // Clears tasks, counters and the queue; workers return to Idle. Rejected
  // while a run is active.
  bool Reset(std::string& error);

  const config::ProcessorConfig& config() const {
    return config_;
  }

private:
  using CommitFn = std::function<void()>;
  using TaskBody = std::function<CommitFn(std::size_t index)>;

  struct RunSummary {
    std::vector<TaskFailure> failures;
    std::size_t completed = 0;
    std::size_t failed = 0;
    std::size_t retries = 0;
    std::size_t stalls = 0;
    std::chrono::milliseconds elapsed{0};
  };

  bool RunTasks(const std::vector<std::string>& previews, const TaskBody& body,
                RunSummary& summary, std::string& error);
  void WorkerLoop(std::size_t worker_id, const TaskBody& body);

  // Callers hold state_mu_.
  void HandleAttemptFailure(Task& task, const std::string& failure);
  void DetectStalls(std::chrono::steady_clock::time_point now);
  void MoveWorker(Worker& worker, WorkerStatus to);
  void MoveTask(Task& task, TaskStatus to);

  config::ProcessorConfig config_;
  core::logging::Logger* logger_ = nullptr;

  mutable std::mutex state_mu_;
  std::condition_variable progress_cv_;
  std::vector<Task> tasks_;
  std::unordered_map<TaskId, std::size_t> index_by_id_;
  std::vector<Worker> workers_;
  std::size_t terminal_count_ = 0;
  std::size_t total_retries_ = 0;
  std::size_t stalls_detected_ = 0;
  std::size_t stale_completions_ = 0;
  bool running_ = false;

  std::atomic<bool> stop_{false};
  TaskQueue queue_;
};

} // namespace refinery::distributed
