#pragma once

#include "config/engine_config.hpp"
#include "engine/workflow.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace refinery::core::logging {
class Logger;
}

namespace refinery::engine {

// Number of recommendations from one round fed back as hints to the next.
constexpr std::size_t kFeedbackHintLimit = 3U;

// Session lifecycle. `kRunning` is the only non-terminal state.
enum class SessionStatus {
  kRunning,
  kConverged,
  kExhausted,
  kFailed,
};

const char* ToString(SessionStatus status);

// One produce/score iteration. Immutable once appended to a session history.
// A round without `artifact`, or with a non-empty `error`, was unsuccessful.
struct SessionRound {
  std::size_t round = 0;
  std::optional<Artifact> artifact;
  bool scored = false;
  double score = 0.0;
  std::map<std::string, double> dimensions;
  std::vector<std::string> strengths;
  std::vector<std::string> weaknesses;
  std::vector<std::string> recommendations;
  std::string error;
};

// Outcome of one session. `success` implies `best_artifact` is set.
struct SessionResult {
  std::string input;
  SessionStatus status = SessionStatus::kFailed;
  std::optional<Artifact> best_artifact;
  double best_score = 0.0;
  std::optional<ScoreResult> best_evaluation;
  std::size_t best_round = 0;
  std::vector<SessionRound> rounds;
  bool converged = false;
  bool success = false;
  std::chrono::milliseconds elapsed{0};
  // Whole-session attempts consumed by harness retries (1 when run directly).
  std::size_t attempts = 0;
  std::string error;
};

// Bounded produce/score/refine loop for one input.
//
// Each round calls Produce then Score. The best artifact by score is kept; a
// score at or above the threshold ends the loop as converged. Otherwise the
// round's top recommendations become hints for the next Produce call.
// Produce/Score failures and exceptions are recorded on the round and never
// escape `Run`.
class Session {
public:
  Session(IWorkflow& workflow, core::logging::Logger& logger);

  // Contract:
  // - false: `config` is invalid; nothing ran and `error` explains why.
  // - true: `result` holds the terminal outcome (converged, exhausted or
  //   failed) and `error` is empty.
  bool Run(const std::string& input, const ProduceContext& context,
           const config::SessionConfig& config, SessionResult& result, std::string& error) const;

private:
  IWorkflow* workflow_ = nullptr;
  core::logging::Logger* logger_ = nullptr;
};

} // namespace refinery::engine
