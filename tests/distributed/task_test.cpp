#include "distributed/task.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using refinery::distributed::IsLegalTransition;
using refinery::distributed::IsTerminal;
using refinery::distributed::MakeTaskId;
using refinery::distributed::TaskStatus;
using refinery::distributed::Transition;
using refinery::distributed::WorkerStatus;

TEST_CASE("MakeTaskId is deterministic and fixed width", "[distributed][task]") {
  const std::string first = MakeTaskId(3, "payload");
  REQUIRE(first == MakeTaskId(3, "payload"));
  REQUIRE(first.size() == 16U);
  REQUIRE(first.find_first_not_of("0123456789abcdef") == std::string::npos);

  REQUIRE(first != MakeTaskId(4, "payload"));
  REQUIRE(first != MakeTaskId(3, "payload2"));
}

TEST_CASE("MakeTaskId only hashes the payload prefix", "[distributed][task]") {
  const std::string prefix(refinery::distributed::kTaskIdPayloadPrefix, 'x');
  REQUIRE(MakeTaskId(0, prefix + "tail-a") == MakeTaskId(0, prefix + "tail-b"));
  REQUIRE(MakeTaskId(0, prefix.substr(1) + "a") != MakeTaskId(0, prefix.substr(1) + "b"));
}

TEST_CASE("Task transitions follow the lifecycle table", "[distributed][task]") {
  REQUIRE(IsLegalTransition(TaskStatus::kPending, TaskStatus::kRunning));
  REQUIRE_FALSE(IsLegalTransition(TaskStatus::kPending, TaskStatus::kCompleted));
  REQUIRE(IsLegalTransition(TaskStatus::kRunning, TaskStatus::kCompleted));
  REQUIRE(IsLegalTransition(TaskStatus::kRunning, TaskStatus::kRetrying));
  REQUIRE(IsLegalTransition(TaskStatus::kRunning, TaskStatus::kFailed));
  REQUIRE(IsLegalTransition(TaskStatus::kRetrying, TaskStatus::kRunning));
  REQUIRE_FALSE(IsLegalTransition(TaskStatus::kRetrying, TaskStatus::kFailed));
  REQUIRE_FALSE(IsLegalTransition(TaskStatus::kCompleted, TaskStatus::kRunning));
  REQUIRE_FALSE(IsLegalTransition(TaskStatus::kFailed, TaskStatus::kRetrying));

  REQUIRE(IsTerminal(TaskStatus::kCompleted));
  REQUIRE(IsTerminal(TaskStatus::kFailed));
  REQUIRE_FALSE(IsTerminal(TaskStatus::kRetrying));
}

TEST_CASE("Transition leaves status unchanged on illegal moves", "[distributed][task]") {
  TaskStatus task = TaskStatus::kPending;
  REQUIRE_FALSE(Transition(task, TaskStatus::kCompleted));
  REQUIRE(task == TaskStatus::kPending);
  REQUIRE(Transition(task, TaskStatus::kRunning));
  REQUIRE(Transition(task, TaskStatus::kCompleted));
  REQUIRE(task == TaskStatus::kCompleted);

  WorkerStatus worker = WorkerStatus::kIdle;
  REQUIRE_FALSE(Transition(worker, WorkerStatus::kStalled));
  REQUIRE(Transition(worker, WorkerStatus::kBusy));
  REQUIRE(Transition(worker, WorkerStatus::kStalled));
  REQUIRE_FALSE(Transition(worker, WorkerStatus::kBusy));
  REQUIRE(Transition(worker, WorkerStatus::kStopped));
  REQUIRE(Transition(worker, WorkerStatus::kIdle));
}

TEST_CASE("Status strings are stable lowercase names", "[distributed][task]") {
  using refinery::distributed::ToString;
  REQUIRE(std::string(ToString(TaskStatus::kRetrying)) == "retrying");
  REQUIRE(std::string(ToString(TaskStatus::kCompleted)) == "completed");
  REQUIRE(std::string(ToString(WorkerStatus::kStalled)) == "stalled");
  REQUIRE(std::string(ToString(WorkerStatus::kIdle)) == "idle");
}
