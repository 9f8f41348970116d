#pragma once

#include "config/engine_config.hpp"
#include "engine/session.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace refinery::core::logging {
class Logger;
}

namespace refinery::optimizer {

// Direction of recent batch scores. `kInsufficientData` means there was nothing
// to analyze; `kNoScores` means sessions ran but none succeeded.
enum class Trend {
  kInsufficientData,
  kNoScores,
  kImproving,
  kStable,
  kDeclining,
};

enum class ConvergenceStatus {
  kConverged,
  kNearConvergence,
  kNotConverged,
};

// Stable string forms used in logs and JSON output.
const char* ToString(Trend trend);
const char* ToString(ConvergenceStatus status);

struct DimensionStats {
  double mean = 0.0;
  double min = 0.0;
  double max = 0.0;
  std::size_t count = 0;
};

// Result of one batch or trend analysis.
//
// AnalyzeBatch fills the per-session fields (dimension metrics, weakness,
// best/worst, stddev). AnalyzeTrends fills `batch_scores` and
// `convergence_estimate`. Both set the trend, verdict and recommendations.
struct OptimizationReport {
  double average_score = 0.0;
  Trend trend = Trend::kInsufficientData;
  ConvergenceStatus convergence = ConvergenceStatus::kNotConverged;
  std::vector<std::string> recommendations;
  std::vector<std::string> insights;
  std::map<std::string, DimensionStats> dimension_metrics;
  std::optional<std::string> most_common_weakness;
  std::size_t weakness_occurrences = 0;
  // Batch: delta to the previous history entry. Trends: linear per-batch rate.
  double improvement_rate = 0.0;
  double score_stddev = 0.0;
  double best_score = 0.0;
  double worst_score = 0.0;
  std::size_t session_count = 0;
  std::size_t successful_count = 0;
  std::size_t batch_count = 0;
  std::vector<double> batch_scores;
  // Batches still needed to reach the threshold at the current rate.
  std::optional<std::size_t> convergence_estimate;
};

struct ScoreSample {
  double score = 0.0;
  std::chrono::steady_clock::time_point recorded_at;
};

struct HistorySummary {
  std::size_t count = 0;
  double mean = 0.0;
  double stddev = 0.0;
  double min = 0.0;
  double max = 0.0;
  double latest = 0.0;
};

// Compares the first and last value of the trailing `window_size` scores.
// Fewer than one score yields kInsufficientData.
Trend ClassifyTrend(const std::vector<double>& scores, std::size_t window_size,
                    double min_improvement_rate);

ConvergenceStatus ClassifyConvergence(double average_score, Trend trend,
                                      double convergence_threshold);

// Meta-level analyzer of score trends across harness batches.
//
// Generic over the {dimension -> score} shape of evaluations. The score
// history is append-only and owned by the calling thread; AnalyzeBatch must
// not be called concurrently on one instance.
class Optimizer {
public:
  Optimizer(config::OptimizerConfig config, core::logging::Logger& logger);

  // Contract:
  // - false: config invalid; history untouched.
  // - true: `report` is valid. Batches with at least one successful session
  //   append their mean score to the history.
  bool AnalyzeBatch(const std::vector<engine::SessionResult>& results, OptimizationReport& report,
                    std::string& error);

  // Stateless analysis of historical batches, oldest first.
  bool AnalyzeTrends(const std::vector<std::vector<engine::SessionResult>>& batches,
                     OptimizationReport& report, std::string& error) const;

  HistorySummary SummarizeHistory() const;

  const std::vector<ScoreSample>& score_history() const {
    return history_;
  }

  const config::OptimizerConfig& config() const {
    return config_;
  }

private:
  config::OptimizerConfig config_;
  core::logging::Logger* logger_ = nullptr;
  std::vector<ScoreSample> history_;
};

std::string ToJson(const OptimizationReport& report);

} // namespace refinery::optimizer
