#include "distributed/processor.hpp"

#include "core/time_utils.hpp"

#include <algorithm>
#include <system_error>

namespace refinery::distributed {

namespace {

using Clock = std::chrono::steady_clock;

double ElapsedMs(Clock::time_point from, Clock::time_point to) {
  return std::chrono::duration<double, std::milli>(to - from).count();
}

} // namespace

DistributedProcessor::DistributedProcessor(config::ProcessorConfig config,
                                           core::logging::Logger& logger)
    : config_(config), logger_(&logger) {
  // An invalid config leaves the worker table empty; RunTasks rejects it.
  std::string error;
  if (!config::ValidateProcessorConfig(config_, error)) {
    logger_->Error("invalid processor config", {{"error", error}});
    return;
  }
  const auto now = Clock::now();
  workers_.resize(config_.num_workers);
  for (std::size_t i = 0; i < workers_.size(); ++i) {
    workers_[i].id = i;
    workers_[i].last_heartbeat = now;
  }
}

bool DistributedProcessor::RunTasks(const std::vector<std::string>& previews,
                                    const TaskBody& body, RunSummary& summary,
                                    std::string& error) {
  summary = RunSummary{};
  if (!config::ValidateProcessorConfig(config_, error)) {
    return false;
  }

  const auto started = Clock::now();
  {
    std::lock_guard<std::mutex> lock(state_mu_);
    if (running_) {
      error = "a distributed run is already in progress";
      return false;
    }

    std::vector<Task> tasks;
    std::unordered_map<TaskId, std::size_t> index_by_id;
    tasks.reserve(previews.size());
    for (std::size_t i = 0; i < previews.size(); ++i) {
      Task task;
      task.id = MakeTaskId(i, previews[i]);
      task.index = i;
      task.payload_preview = previews[i];
      task.created_at = started;
      if (!index_by_id.emplace(task.id, i).second) {
        error = "task id collision at index " + std::to_string(i) + " (" + task.id + ")";
        return false;
      }
      tasks.push_back(std::move(task));
    }

    // A new run replaces the previous task table; worker counters carry over.
    tasks_ = std::move(tasks);
    index_by_id_ = std::move(index_by_id);
    terminal_count_ = 0;
    total_retries_ = 0;
    stalls_detected_ = 0;
    for (auto& worker : workers_) {
      if (worker.status == WorkerStatus::kStopped) {
        MoveWorker(worker, WorkerStatus::kIdle);
      }
      worker.current_task.reset();
    }
    if (tasks_.empty()) {
      error.clear();
      return true;
    }

    running_ = true;
    stop_.store(false);
    queue_.Reset();
    for (const auto& task : tasks_) {
      if (!queue_.Push(task.id)) {
        running_ = false;
        error = "task queue rejected task " + task.id;
        return false;
      }
    }
  }

  logger_->Info("distributed run started",
                {{"tasks", std::to_string(previews.size())},
                 {"workers", std::to_string(config_.num_workers)},
                 {"max_retries", std::to_string(config_.max_retries)},
                 {"fault_tolerance", config_.enable_fault_tolerance ? "true" : "false"}});

  std::vector<std::thread> threads;
  threads.reserve(config_.num_workers);
  std::string start_error;
  for (std::size_t i = 0; i < config_.num_workers; ++i) {
    try {
      threads.emplace_back(&DistributedProcessor::WorkerLoop, this, i, std::cref(body));
    } catch (const std::system_error& e) {
      start_error = e.what();
      logger_->Error("failed to start worker",
                     {{"worker", std::to_string(i)}, {"error", start_error}});
      break;
    }
  }
  if (threads.empty()) {
    std::lock_guard<std::mutex> lock(state_mu_);
    running_ = false;
    queue_.Close();
    error = "no worker thread could be started: " + start_error;
    return false;
  }

  {
    std::unique_lock<std::mutex> lock(state_mu_);
    while (terminal_count_ < tasks_.size()) {
      progress_cv_.wait_for(lock, config_.heartbeat_interval,
                            [this]() { return terminal_count_ >= tasks_.size(); });
      DetectStalls(Clock::now());
    }
  }

  stop_.store(true);
  queue_.Close();
  for (auto& thread : threads) {
    thread.join();
  }

  std::lock_guard<std::mutex> lock(state_mu_);
  for (auto& worker : workers_) {
    MoveWorker(worker, WorkerStatus::kStopped);
    worker.current_task.reset();
  }
  for (const auto& task : tasks_) {
    if (task.status == TaskStatus::kCompleted) {
      ++summary.completed;
    } else {
      ++summary.failed;
      summary.failures.push_back(TaskFailure{task.index, task.id, task.retry_count, task.error});
    }
  }
  summary.retries = total_retries_;
  summary.stalls = stalls_detected_;
  summary.elapsed = core::ElapsedSince(started);
  running_ = false;

  logger_->Info("distributed run finished",
                {{"tasks", std::to_string(tasks_.size())},
                 {"completed", std::to_string(summary.completed)},
                 {"failed", std::to_string(summary.failed)},
                 {"retries", std::to_string(summary.retries)},
                 {"stalls", std::to_string(summary.stalls)},
                 {"elapsed_ms", std::to_string(summary.elapsed.count())}});
  error.clear();
  return true;
}

void DistributedProcessor::WorkerLoop(std::size_t worker_id, const TaskBody& body) {
  while (!stop_.load()) {
    std::optional<TaskId> popped = queue_.PopFor(config_.heartbeat_interval);

    std::size_t index = 0;
    std::size_t attempt = 0;
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      Worker& worker = workers_[worker_id];
      worker.last_heartbeat = Clock::now();
      if (!popped.has_value()) {
        continue;
      }

      const auto found = index_by_id_.find(*popped);
      if (found == index_by_id_.end()) {
        logger_->Warn("dropping unknown task id", {{"task_id", *popped}});
        continue;
      }
      Task& task = tasks_[found->second];
      if (!IsLegalTransition(task.status, TaskStatus::kRunning)) {
        logger_->Warn("dropping task that is not runnable",
                      {{"task_id", task.id}, {"status", ToString(task.status)}});
        continue;
      }

      MoveWorker(worker, WorkerStatus::kBusy);
      MoveTask(task, TaskStatus::kRunning);
      ++task.attempt;
      task.assigned_worker = worker_id;
      task.started_at = worker.last_heartbeat;
      worker.current_task = task.id;
      index = task.index;
      attempt = task.attempt;
    }

    CommitFn commit;
    std::string failure;
    try {
      commit = body(index);
    } catch (const std::exception& e) {
      failure = e.what();
    } catch (...) {
      failure = "non-standard exception";
    }
    if (!commit && failure.empty()) {
      failure = "task produced no result";
    }

    {
      std::lock_guard<std::mutex> lock(state_mu_);
      Worker& worker = workers_[worker_id];
      Task& task = tasks_[index];
      worker.last_heartbeat = Clock::now();

      // The stall detector already re-dispatched this attempt.
      if (task.status != TaskStatus::kRunning || task.attempt != attempt) {
        ++stale_completions_;
        logger_->Warn("discarding stale task attempt",
                      {{"task_id", task.id},
                       {"worker", std::to_string(worker_id)},
                       {"attempt", std::to_string(attempt)}});
        MoveWorker(worker, WorkerStatus::kIdle);
        continue;
      }

      worker.current_task.reset();
      MoveWorker(worker, WorkerStatus::kIdle);

      if (failure.empty()) {
        try {
          commit();
        } catch (const std::exception& e) {
          failure = std::string("storing result failed: ") + e.what();
        }
      }

      if (failure.empty()) {
        MoveTask(task, TaskStatus::kCompleted);
        task.completed_at = worker.last_heartbeat;
        task.assigned_worker.reset();
        task.error.clear();
        ++worker.completed_tasks;
        ++terminal_count_;
        logger_->Debug("task completed",
                       {{"task_id", task.id},
                        {"worker", std::to_string(worker_id)},
                        {"attempt", std::to_string(attempt)}});
      } else {
        ++worker.failed_tasks;
        HandleAttemptFailure(task, failure);
      }
    }
    progress_cv_.notify_all();
  }
}

void DistributedProcessor::HandleAttemptFailure(Task& task, const std::string& failure) {
  task.error = failure;
  task.assigned_worker.reset();

  // Workers need state_mu_ to claim a popped id, so queueing before the
  // status change cannot race a re-run.
  if (config_.enable_fault_tolerance && task.retry_count < config_.max_retries) {
    if (queue_.Push(task.id)) {
      MoveTask(task, TaskStatus::kRetrying);
      ++task.retry_count;
      ++total_retries_;
      logger_->Warn("task attempt failed, retrying",
                    {{"task_id", task.id},
                     {"index", std::to_string(task.index)},
                     {"retry", std::to_string(task.retry_count)},
                     {"max_retries", std::to_string(config_.max_retries)},
                     {"error", failure}});
      return;
    }
    task.error = failure + " (retry could not be queued)";
  }

  MoveTask(task, TaskStatus::kFailed);
  task.completed_at = Clock::now();
  ++terminal_count_;
  logger_->Error("task failed",
                 {{"task_id", task.id},
                  {"index", std::to_string(task.index)},
                  {"retries", std::to_string(task.retry_count)},
                  {"error", task.error}});
}

void DistributedProcessor::DetectStalls(Clock::time_point now) {
  for (auto& task : tasks_) {
    if (task.status != TaskStatus::kRunning || !task.started_at.has_value() ||
        now - *task.started_at <= config_.task_timeout) {
      continue;
    }

    ++stalls_detected_;
    if (task.assigned_worker.has_value() && *task.assigned_worker < workers_.size()) {
      Worker& worker = workers_[*task.assigned_worker];
      MoveWorker(worker, WorkerStatus::kStalled);
      worker.current_task.reset();
    }
    logger_->Warn("task exceeded timeout",
                  {{"task_id", task.id},
                   {"worker", task.assigned_worker.has_value()
                                  ? std::to_string(*task.assigned_worker)
                                  : std::string("-")},
                   {"running_ms", core::FormatFixedDouble(ElapsedMs(*task.started_at, now), 0)},
                   {"task_timeout_ms", std::to_string(config_.task_timeout.count())}});
    HandleAttemptFailure(task, "task exceeded timeout of " +
                                   std::to_string(config_.task_timeout.count()) + " ms");
  }
}

void DistributedProcessor::MoveWorker(Worker& worker, WorkerStatus to) {
  const WorkerStatus from = worker.status;
  if (from == to) {
    return;
  }
  if (!Transition(worker.status, to)) {
    logger_->Error("illegal worker transition",
                   {{"worker", std::to_string(worker.id)},
                    {"from", ToString(from)},
                    {"to", ToString(to)}});
  }
}

void DistributedProcessor::MoveTask(Task& task, TaskStatus to) {
  const TaskStatus from = task.status;
  if (!Transition(task.status, to)) {
    logger_->Error("illegal task transition",
                   {{"task_id", task.id}, {"from", ToString(from)}, {"to", ToString(to)}});
  }
}

ProcessorStatistics DistributedProcessor::GetStatistics() const {
  std::lock_guard<std::mutex> lock(state_mu_);
  ProcessorStatistics stats;
  stats.running = running_;
  stats.num_workers = workers_.size();
  stats.total_tasks = tasks_.size();
  stats.total_retries = total_retries_;
  stats.stalls_detected = stalls_detected_;
  stats.stale_completions = stale_completions_;

  double duration_sum = 0.0;
  std::size_t timed = 0;
  for (const auto& task : tasks_) {
    switch (task.status) {
    case TaskStatus::kPending:
      ++stats.pending_tasks;
      break;
    case TaskStatus::kRunning:
      ++stats.running_tasks;
      break;
    case TaskStatus::kRetrying:
      ++stats.retrying_tasks;
      break;
    case TaskStatus::kCompleted:
      ++stats.completed_tasks;
      if (task.started_at.has_value() && task.completed_at.has_value()) {
        duration_sum += ElapsedMs(*task.started_at, *task.completed_at);
        ++timed;
      }
      break;
    case TaskStatus::kFailed:
      ++stats.failed_tasks;
      break;
    }
  }
  if (timed > 0U) {
    stats.average_task_ms = duration_sum / static_cast<double>(timed);
  }

  for (const auto& worker : workers_) {
    stats.workers.push_back(WorkerSnapshot{worker.id, worker.status, worker.completed_tasks,
                                           worker.failed_tasks, worker.current_task});
  }
  return stats;
}

ProcessorProgress DistributedProcessor::GetProgress() const {
  std::lock_guard<std::mutex> lock(state_mu_);
  ProcessorProgress progress;
  progress.total = tasks_.size();
  for (const auto& task : tasks_) {
    if (task.status == TaskStatus::kCompleted) {
      ++progress.completed;
    } else if (task.status == TaskStatus::kFailed) {
      ++progress.failed;
    } else {
      ++progress.in_flight;
    }
  }
  if (progress.total > 0U) {
    progress.percent_complete = 100.0 * static_cast<double>(progress.completed + progress.failed) /
                                static_cast<double>(progress.total);
  }
  return progress;
}

std::vector<TaskSnapshot> DistributedProcessor::SnapshotTasks() const {
  std::lock_guard<std::mutex> lock(state_mu_);
  std::vector<TaskSnapshot> snapshots;
  snapshots.reserve(tasks_.size());
  for (const auto& task : tasks_) {
    snapshots.push_back(TaskSnapshot{task.id, task.index, task.status, task.retry_count,
                                     task.assigned_worker, task.error});
  }
  return snapshots;
}

std::vector<WorkerSnapshot> DistributedProcessor::SnapshotWorkers() const {
  std::lock_guard<std::mutex> lock(state_mu_);
  std::vector<WorkerSnapshot> snapshots;
  snapshots.reserve(workers_.size());
  for (const auto& worker : workers_) {
    snapshots.push_back(WorkerSnapshot{worker.id, worker.status, worker.completed_tasks,
                                       worker.failed_tasks, worker.current_task});
  }
  return snapshots;
}

bool DistributedProcessor::Reset(std::string& error) {
  std::lock_guard<std::mutex> lock(state_mu_);
  if (running_) {
    error = "cannot reset while a distributed run is in progress";
    return false;
  }

  tasks_.clear();
  index_by_id_.clear();
  terminal_count_ = 0;
  total_retries_ = 0;
  stalls_detected_ = 0;
  stale_completions_ = 0;
  const auto now = Clock::now();
  for (auto& worker : workers_) {
    worker.status = WorkerStatus::kIdle;
    worker.completed_tasks = 0;
    worker.failed_tasks = 0;
    worker.current_task.reset();
    worker.last_heartbeat = now;
  }
  queue_.Reset();
  logger_->Info("distributed processor reset", {{"workers", std::to_string(workers_.size())}});
  error.clear();
  return true;
}

} // namespace refinery::distributed
