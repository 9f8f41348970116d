#pragma once

#include "config/engine_config.hpp"
#include "engine/session.hpp"
#include "engine/workflow.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace refinery::core::logging {
class Logger;
}

namespace refinery::engine {

// Runs one session to completion. May throw; the harness retries throws.
using SessionRunner =
    std::function<SessionResult(const std::string& input, const ProduceContext& context)>;

// Input contract for one batch. `contexts`, when present, must pair 1:1 with
// `inputs`. `config` overrides the harness default for this call only.
struct BatchRequest {
  std::vector<std::string> inputs;
  std::optional<std::vector<ProduceContext>> contexts;
  std::optional<config::HarnessConfig> config;
};

// Aggregate outcome of one batch.
//
// `sessions` is in submission order. Score statistics cover successful
// sessions only and are 0.0 when there are none; round statistics cover all
// sessions.
struct HarnessResult {
  std::vector<SessionResult> sessions;
  std::size_t total = 0;
  std::size_t successful = 0;
  std::size_t failed = 0;
  std::size_t converged = 0;
  std::size_t timed_out = 0;
  std::size_t runner_exceptions = 0;
  double average_score = 0.0;
  double best_score = 0.0;
  double worst_score = 0.0;
  double convergence_rate = 0.0;
  double average_rounds = 0.0;
  std::size_t min_rounds = 0;
  std::size_t max_rounds = 0;
  std::map<std::string, double> dimension_averages;
  std::chrono::milliseconds elapsed{0};
};

// Parallel batch runner: one session per input on a fixed-size thread pool.
//
// Every submission is wrapped in an in-thread retry loop: a session that
// throws is re-run in the same worker after an exponential backoff sleep, up
// to `max_retries` attempts. Collection waits at most
// `timeout_per_session * chunk_length` per chunk; a session that misses the
// deadline or whose future carries an exception counts as failed. The
// deadline bounds collection only, so RunBatch still joins slow workers
// before returning.
class Harness {
public:
  // Default runner: a `Session` over `workflow` with `session_config`.
  Harness(IWorkflow& workflow, config::SessionConfig session_config,
          config::HarnessConfig harness_config, core::logging::Logger& logger);

  Harness(SessionRunner runner, config::HarnessConfig harness_config,
          core::logging::Logger& logger);

  Harness(const Harness&) = delete;
  Harness& operator=(const Harness&) = delete;

  // Contract:
  // - false: usage error (bad config, context count mismatch); no session ran.
  // - true: `result` describes every input, including failed ones.
  bool RunBatch(const BatchRequest& request, HarnessResult& result, std::string& error);

  // Runs one session with whole-session retry. Never throws; returns a failed
  // result carrying the last error once every attempt has thrown, or the
  // validation error (with zero attempts) when `config` is invalid.
  SessionResult RunWithRetry(const std::string& input, const ProduceContext& context,
                             const config::HarnessConfig& config) const;

  const config::HarnessConfig& config() const {
    return config_;
  }

private:
  void RunChunk(const BatchRequest& request, const config::HarnessConfig& config,
                std::size_t begin, std::size_t end, HarnessResult& result) const;

  SessionRunner runner_;
  std::optional<config::SessionConfig> session_config_;
  config::HarnessConfig config_;
  core::logging::Logger* logger_ = nullptr;
};

// Recomputes counts and statistics from `result.sessions`.
void ComputeBatchStatistics(HarnessResult& result);

// Compact JSON summary (counts and statistics, no per-session detail).
std::string ToJson(const HarnessResult& result);

} // namespace refinery::engine
