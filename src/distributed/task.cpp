#include "distributed/task.hpp"

#include "core/hash_utils.hpp"

#include <string>

namespace refinery::distributed {

const char* ToString(TaskStatus status) {
  switch (status) {
  case TaskStatus::kPending:
    return "pending";
  case TaskStatus::kRunning:
    return "running";
  case TaskStatus::kCompleted:
    return "completed";
  case TaskStatus::kFailed:
    return "failed";
  case TaskStatus::kRetrying:
    return "retrying";
  }
  return "pending";
}

const char* ToString(WorkerStatus status) {
  switch (status) {
  case WorkerStatus::kIdle:
    return "idle";
  case WorkerStatus::kBusy:
    return "busy";
  case WorkerStatus::kStalled:
    return "stalled";
  case WorkerStatus::kStopped:
    return "stopped";
  }
  return "idle";
}

bool IsTerminal(TaskStatus status) {
  return status == TaskStatus::kCompleted || status == TaskStatus::kFailed;
}

bool IsLegalTransition(TaskStatus from, TaskStatus to) {
  switch (from) {
  case TaskStatus::kPending:
    return to == TaskStatus::kRunning;
  case TaskStatus::kRunning:
    return to == TaskStatus::kCompleted || to == TaskStatus::kRetrying ||
           to == TaskStatus::kFailed;
  case TaskStatus::kRetrying:
    return to == TaskStatus::kRunning;
  case TaskStatus::kCompleted:
  case TaskStatus::kFailed:
    return false;
  }
  return false;
}

bool IsLegalTransition(WorkerStatus from, WorkerStatus to) {
  switch (from) {
  case WorkerStatus::kIdle:
    return to == WorkerStatus::kBusy || to == WorkerStatus::kStopped;
  case WorkerStatus::kBusy:
    return to == WorkerStatus::kIdle || to == WorkerStatus::kStalled;
  case WorkerStatus::kStalled:
    return to == WorkerStatus::kIdle || to == WorkerStatus::kStopped;
  case WorkerStatus::kStopped:
    return to == WorkerStatus::kIdle;
  }
  return false;
}

bool Transition(TaskStatus& status, TaskStatus to) {
  if (!IsLegalTransition(status, to)) {
    return false;
  }
  status = to;
  return true;
}

bool Transition(WorkerStatus& status, WorkerStatus to) {
  if (!IsLegalTransition(status, to)) {
    return false;
  }
  status = to;
  return true;
}

TaskId MakeTaskId(std::size_t index, std::string_view payload) {
  const std::string index_text = std::to_string(index);
  std::uint64_t hash = core::Fnv1a64(index_text);
  hash = core::Fnv1a64(":", hash);
  hash = core::Fnv1a64(payload.substr(0, kTaskIdPayloadPrefix), hash);
  return core::ToHex64(hash);
}

} // namespace refinery::distributed
