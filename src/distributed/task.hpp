#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace refinery::distributed {

using TaskId = std::string;

// Bytes of an item's string form that feed its task id.
constexpr std::size_t kTaskIdPayloadPrefix = 100U;

// Task lifecycle:
//   Pending -> Running
//   Running -> Completed | Retrying | Failed
//   Retrying -> Running
// Completed and Failed are terminal.
enum class TaskStatus {
  kPending,
  kRunning,
  kCompleted,
  kFailed,
  kRetrying,
};

// Worker lifecycle:
//   Idle -> Busy | Stopped
//   Busy -> Idle | Stalled
//   Stalled -> Idle | Stopped
//   Stopped -> Idle (next run or Reset)
enum class WorkerStatus {
  kIdle,
  kBusy,
  kStalled,
  kStopped,
};

const char* ToString(TaskStatus status);
const char* ToString(WorkerStatus status);

bool IsTerminal(TaskStatus status);

// Transition table lookups. Every status change in the processor goes
// through these.
bool IsLegalTransition(TaskStatus from, TaskStatus to);
bool IsLegalTransition(WorkerStatus from, WorkerStatus to);

// Applies `to` when legal. Returns false and leaves `status` unchanged
// otherwise.
bool Transition(TaskStatus& status, TaskStatus to);
bool Transition(WorkerStatus& status, WorkerStatus to);

// Deterministic id from submission index plus the first kTaskIdPayloadPrefix
// bytes of the payload: 16 lowercase hex chars of FNV-1a 64.
TaskId MakeTaskId(std::size_t index, std::string_view payload);

// Canonical per-task record. Mutated only under the processor state mutex.
//
// `attempt` increments every time the task starts running; a completion or
// failure reported for an older attempt is stale and discarded.
struct Task {
  TaskId id;
  std::size_t index = 0;
  std::string payload_preview;
  TaskStatus status = TaskStatus::kPending;
  std::size_t retry_count = 0;
  std::size_t attempt = 0;
  std::optional<std::size_t> assigned_worker;
  std::chrono::steady_clock::time_point created_at;
  std::optional<std::chrono::steady_clock::time_point> started_at;
  std::optional<std::chrono::steady_clock::time_point> completed_at;
  std::string error;
};

struct Worker {
  std::size_t id = 0;
  WorkerStatus status = WorkerStatus::kIdle;
  std::size_t completed_tasks = 0;
  std::size_t failed_tasks = 0;
  std::optional<TaskId> current_task;
  std::chrono::steady_clock::time_point last_heartbeat;
};

} // namespace refinery::distributed
