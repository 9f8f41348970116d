#pragma once

#include "config/engine_config.hpp"
#include "engine/harness.hpp"
#include "optimizer/optimizer.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace refinery::core::logging {
class Logger;
}

namespace refinery::optimizer {

// Per-cycle digest kept by the loop. Session detail stays in `batches`.
struct CycleRecord {
  std::size_t cycle = 0;
  std::size_t total = 0;
  std::size_t successful = 0;
  std::size_t failed = 0;
  std::size_t converged_sessions = 0;
  double average_score = 0.0;
  double convergence_rate = 0.0;
  OptimizationReport report;
};

struct LoopResult {
  std::vector<CycleRecord> cycles;
  // Session results per cycle, oldest first; input to the trend analysis.
  std::vector<std::vector<engine::SessionResult>> batches;
  bool converged = false;
  OptimizationReport trend_report;
};

// Batch -> analyze -> feed back, repeated up to `max_cycles` times.
//
// Each cycle runs `request` through the harness and analyzes the sessions.
// The cycle's top recommendations become extra hints on every context of the
// next cycle. A "converged" verdict ends the loop early when
// `stop_on_convergence` is set. The loop finishes with AnalyzeTrends over all
// cycles.
//
// Contract:
// - false: a config or request was rejected before the first batch, or a
//   later batch was rejected; `error` explains why.
// - true: `result` covers every cycle that ran.
bool RunOptimizationLoop(engine::Harness& harness, Optimizer& optimizer,
                         const engine::BatchRequest& request, const config::LoopConfig& config,
                         core::logging::Logger& logger, LoopResult& result, std::string& error);

} // namespace refinery::optimizer
