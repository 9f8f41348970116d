#include "optimizer/optimization_loop.hpp"

#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <utility>

namespace refinery::optimizer {

namespace {

// Builds the next cycle's request: the caller's contexts (or defaults) with
// the analysis recommendations appended to their own hints.
engine::BatchRequest WithFeedback(const engine::BatchRequest& base,
                                  const std::vector<std::string>& recommendations) {
  engine::BatchRequest next = base;
  if (!next.contexts.has_value()) {
    next.contexts = std::vector<engine::ProduceContext>(next.inputs.size());
  }

  const std::size_t take = std::min(engine::kFeedbackHintLimit, recommendations.size());
  for (auto& context : *next.contexts) {
    context.hints.insert(context.hints.end(), recommendations.begin(),
                         recommendations.begin() + static_cast<std::ptrdiff_t>(take));
  }
  return next;
}

} // namespace

bool RunOptimizationLoop(engine::Harness& harness, Optimizer& optimizer,
                         const engine::BatchRequest& request, const config::LoopConfig& config,
                         core::logging::Logger& logger, LoopResult& result, std::string& error) {
  result = LoopResult{};
  if (!config::ValidateLoopConfig(config, error)) {
    return false;
  }

  engine::BatchRequest cycle_request = request;
  for (std::size_t cycle = 1; cycle <= config.max_cycles; ++cycle) {
    engine::HarnessResult batch;
    if (!harness.RunBatch(cycle_request, batch, error)) {
      error = "cycle " + std::to_string(cycle) + ": " + error;
      return false;
    }

    CycleRecord record;
    record.cycle = cycle;
    if (!optimizer.AnalyzeBatch(batch.sessions, record.report, error)) {
      error = "cycle " + std::to_string(cycle) + ": " + error;
      return false;
    }
    record.total = batch.total;
    record.successful = batch.successful;
    record.failed = batch.failed;
    record.converged_sessions = batch.converged;
    record.average_score = batch.average_score;
    record.convergence_rate = batch.convergence_rate;

    logger.Info("optimization cycle finished",
                {{"cycle", std::to_string(cycle)},
                 {"average_score", core::FormatFixedDouble(record.report.average_score, 4)},
                 {"trend", ToString(record.report.trend)},
                 {"convergence", ToString(record.report.convergence)}});

    const bool converged = record.report.convergence == ConvergenceStatus::kConverged;
    cycle_request = WithFeedback(request, record.report.recommendations);
    result.batches.push_back(std::move(batch.sessions));
    result.cycles.push_back(std::move(record));

    if (converged) {
      result.converged = true;
      if (config.stop_on_convergence) {
        logger.Info("optimization converged", {{"cycle", std::to_string(cycle)}});
        break;
      }
    }
  }

  if (!optimizer.AnalyzeTrends(result.batches, result.trend_report, error)) {
    return false;
  }
  error.clear();
  return true;
}

} // namespace refinery::optimizer
