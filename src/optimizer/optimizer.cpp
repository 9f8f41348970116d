#include "optimizer/optimizer.hpp"

#include "core/json_utils.hpp"
#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace refinery::optimizer {

namespace {

constexpr double kWeakDimensionMean = 0.5;
constexpr double kCriticalDimensionMean = 0.3;
constexpr double kUrgentAverage = 0.4;
constexpr double kHighAverage = 0.8;
constexpr double kNearConvergenceAverage = 0.7;
constexpr double kHighVarianceStddev = 0.15;
// Estimates beyond this many batches are reported as unknown.
constexpr double kMaxConvergenceEstimate = 1'000'000.0;

double Mean(const std::vector<double>& values) {
  if (values.empty()) {
    return 0.0;
  }
  double sum = 0.0;
  for (const double value : values) {
    sum += value;
  }
  return sum / static_cast<double>(values.size());
}

// Population standard deviation; 0 for fewer than two values.
double StdDev(const std::vector<double>& values) {
  if (values.size() < 2U) {
    return 0.0;
  }
  const double mean = Mean(values);
  double squared = 0.0;
  for (const double value : values) {
    squared += (value - mean) * (value - mean);
  }
  return std::sqrt(squared / static_cast<double>(values.size()));
}

std::vector<double> SuccessfulScores(const std::vector<engine::SessionResult>& results) {
  std::vector<double> scores;
  scores.reserve(results.size());
  for (const auto& result : results) {
    if (result.success) {
      scores.push_back(result.best_score);
    }
  }
  return scores;
}

std::map<std::string, DimensionStats>
CollectDimensionStats(const std::vector<engine::SessionResult>& results) {
  std::map<std::string, DimensionStats> stats;
  std::map<std::string, double> sums;
  for (const auto& result : results) {
    if (!result.best_evaluation.has_value()) {
      continue;
    }
    for (const auto& [dimension, value] : result.best_evaluation->dimensions) {
      DimensionStats& entry = stats[dimension];
      if (entry.count == 0U) {
        entry.min = value;
        entry.max = value;
      } else {
        entry.min = std::min(entry.min, value);
        entry.max = std::max(entry.max, value);
      }
      ++entry.count;
      sums[dimension] += value;
    }
  }
  for (auto& [dimension, entry] : stats) {
    entry.mean = sums[dimension] / static_cast<double>(entry.count);
  }
  return stats;
}

// Ties resolve to the lexicographically smallest tag.
std::optional<std::pair<std::string, std::size_t>>
FindMostCommonWeakness(const std::vector<engine::SessionResult>& results) {
  std::map<std::string, std::size_t> counts;
  for (const auto& result : results) {
    if (!result.best_evaluation.has_value()) {
      continue;
    }
    for (const auto& weakness : result.best_evaluation->weaknesses) {
      ++counts[weakness];
    }
  }

  std::optional<std::pair<std::string, std::size_t>> top;
  for (const auto& [weakness, count] : counts) {
    if (!top.has_value() || count > top->second) {
      top = std::make_pair(weakness, count);
    }
  }
  return top;
}

std::vector<std::string> BatchRecommendations(const OptimizationReport& report) {
  std::vector<std::string> recommendations;
  for (const auto& [dimension, stats] : report.dimension_metrics) {
    if (stats.mean >= kWeakDimensionMean) {
      continue;
    }
    const char* severity = stats.mean < kCriticalDimensionMean ? "[HIGH]" : "[MEDIUM]";
    recommendations.push_back(std::string(severity) + " Improve '" + dimension + "' (average " +
                              core::FormatFixedDouble(stats.mean, 2) + ")");
  }

  if (report.average_score < kUrgentAverage) {
    recommendations.insert(recommendations.begin(),
                           "URGENT: average score " +
                               core::FormatFixedDouble(report.average_score, 2) +
                               " is critically low; revisit the production strategy");
  } else if (report.average_score > kHighAverage) {
    recommendations.emplace_back("Scores are consistently high; add harder test cases");
  } else {
    recommendations.emplace_back("Continue current optimization approach");
  }

  if (report.successful_count > 1U && report.score_stddev > kHighVarianceStddev) {
    recommendations.emplace_back("High score variance across sessions; stabilize production");
  }
  return recommendations;
}

std::vector<std::string> TrendRecommendations(Trend trend, double latest_score) {
  switch (trend) {
  case Trend::kDeclining:
    return {"Consider reverting to the previous configuration",
            "Reduce exploration between rounds"};
  case Trend::kStable:
    if (latest_score < kHighAverage) {
      return {"Try different production strategies", "Increase variety across rounds"};
    }
    return {};
  case Trend::kImproving:
    return {"Continue current optimization approach"};
  case Trend::kInsufficientData:
  case Trend::kNoScores:
    break;
  }
  return {};
}

} // namespace

const char* ToString(Trend trend) {
  switch (trend) {
  case Trend::kInsufficientData:
    return "insufficient_data";
  case Trend::kNoScores:
    return "no_scores";
  case Trend::kImproving:
    return "improving";
  case Trend::kStable:
    return "stable";
  case Trend::kDeclining:
    return "declining";
  }
  return "insufficient_data";
}

const char* ToString(ConvergenceStatus status) {
  switch (status) {
  case ConvergenceStatus::kConverged:
    return "converged";
  case ConvergenceStatus::kNearConvergence:
    return "near_convergence";
  case ConvergenceStatus::kNotConverged:
    return "not_converged";
  }
  return "not_converged";
}

Trend ClassifyTrend(const std::vector<double>& scores, std::size_t window_size,
                    double min_improvement_rate) {
  if (scores.empty()) {
    return Trend::kInsufficientData;
  }
  const std::size_t window = std::clamp<std::size_t>(window_size, 1U, scores.size());
  const double delta = scores.back() - scores[scores.size() - window];
  if (delta > min_improvement_rate) {
    return Trend::kImproving;
  }
  if (delta < -min_improvement_rate) {
    return Trend::kDeclining;
  }
  return Trend::kStable;
}

ConvergenceStatus ClassifyConvergence(double average_score, Trend trend,
                                      double convergence_threshold) {
  if (average_score >= convergence_threshold) {
    return ConvergenceStatus::kConverged;
  }
  if (trend == Trend::kStable && average_score > kNearConvergenceAverage) {
    return ConvergenceStatus::kNearConvergence;
  }
  return ConvergenceStatus::kNotConverged;
}

Optimizer::Optimizer(config::OptimizerConfig config, core::logging::Logger& logger)
    : config_(config), logger_(&logger) {}

bool Optimizer::AnalyzeBatch(const std::vector<engine::SessionResult>& results,
                             OptimizationReport& report, std::string& error) {
  report = OptimizationReport{};
  if (!config::ValidateOptimizerConfig(config_, error)) {
    return false;
  }

  report.session_count = results.size();
  report.batch_count = 1;
  if (results.empty()) {
    report.recommendations.emplace_back("Need more sessions to analyze");
    logger_->Warn("batch analysis skipped", {{"reason", "empty batch"}});
    return true;
  }

  const std::vector<double> scores = SuccessfulScores(results);
  report.successful_count = scores.size();
  if (scores.empty()) {
    report.trend = Trend::kNoScores;
    report.recommendations.emplace_back("No successful sessions to analyze");
    logger_->Warn("batch analysis skipped",
                  {{"reason", "no successful sessions"},
                   {"sessions", std::to_string(results.size())}});
    return true;
  }

  report.average_score = Mean(scores);
  report.score_stddev = StdDev(scores);
  report.best_score = *std::max_element(scores.begin(), scores.end());
  report.worst_score = *std::min_element(scores.begin(), scores.end());
  report.improvement_rate = history_.empty() ? 0.0 : report.average_score - history_.back().score;

  history_.push_back(ScoreSample{report.average_score, std::chrono::steady_clock::now()});
  std::vector<double> history_scores;
  history_scores.reserve(history_.size());
  for (const auto& sample : history_) {
    history_scores.push_back(sample.score);
  }
  report.trend = ClassifyTrend(history_scores, config_.window_size, config_.min_improvement_rate);
  report.convergence =
      ClassifyConvergence(report.average_score, report.trend, config_.convergence_threshold);

  report.dimension_metrics = CollectDimensionStats(results);
  if (const auto weakness = FindMostCommonWeakness(results); weakness.has_value()) {
    report.most_common_weakness = weakness->first;
    report.weakness_occurrences = weakness->second;
    report.insights.push_back("Most common weakness: '" + weakness->first + "' (" +
                              std::to_string(weakness->second) + " occurrences)");
  }
  report.insights.push_back(std::to_string(report.successful_count) + " of " +
                            std::to_string(report.session_count) +
                            " sessions produced a scored artifact");
  report.recommendations = BatchRecommendations(report);

  logger_->Info("batch analyzed",
                {{"sessions", std::to_string(report.session_count)},
                 {"successful", std::to_string(report.successful_count)},
                 {"average_score", core::FormatFixedDouble(report.average_score, 4)},
                 {"improvement_rate", core::FormatFixedDouble(report.improvement_rate, 4)},
                 {"trend", ToString(report.trend)},
                 {"convergence", ToString(report.convergence)},
                 {"history_size", std::to_string(history_.size())}});
  return true;
}

bool Optimizer::AnalyzeTrends(const std::vector<std::vector<engine::SessionResult>>& batches,
                              OptimizationReport& report, std::string& error) const {
  report = OptimizationReport{};
  if (!config::ValidateOptimizerConfig(config_, error)) {
    return false;
  }

  report.batch_count = batches.size();
  if (batches.empty()) {
    report.recommendations.emplace_back("Need more batches to analyze trends");
    logger_->Warn("trend analysis skipped", {{"reason", "no batches"}});
    return true;
  }

  // A batch without successful sessions contributes a 0.0 mean.
  for (const auto& batch : batches) {
    const std::vector<double> scores = SuccessfulScores(batch);
    report.session_count += batch.size();
    report.successful_count += scores.size();
    report.batch_scores.push_back(Mean(scores));
  }

  const std::vector<double>& means = report.batch_scores;
  const double latest = means.back();
  report.average_score = Mean(means);
  report.score_stddev = StdDev(means);
  report.best_score = *std::max_element(means.begin(), means.end());
  report.worst_score = *std::min_element(means.begin(), means.end());
  report.improvement_rate = (latest - means.front()) / static_cast<double>(means.size());
  report.trend = ClassifyTrend(means, config_.window_size, config_.min_improvement_rate);
  report.convergence =
      ClassifyConvergence(report.average_score, report.trend, config_.convergence_threshold);

  if (report.improvement_rate > 0.0 && latest < config_.convergence_threshold) {
    const double remaining =
        std::ceil((config_.convergence_threshold - latest) / report.improvement_rate);
    if (std::isfinite(remaining) && remaining <= kMaxConvergenceEstimate) {
      report.convergence_estimate = static_cast<std::size_t>(remaining);
    }
  }
  report.recommendations = TrendRecommendations(report.trend, latest);

  logger_->Info("trend analysis finished",
                {{"batches", std::to_string(report.batch_count)},
                 {"average_score", core::FormatFixedDouble(report.average_score, 4)},
                 {"improvement_rate", core::FormatFixedDouble(report.improvement_rate, 4)},
                 {"trend", ToString(report.trend)},
                 {"convergence", ToString(report.convergence)}});
  return true;
}

HistorySummary Optimizer::SummarizeHistory() const {
  HistorySummary summary;
  summary.count = history_.size();
  if (history_.empty()) {
    return summary;
  }

  std::vector<double> scores;
  scores.reserve(history_.size());
  for (const auto& sample : history_) {
    scores.push_back(sample.score);
  }
  summary.mean = Mean(scores);
  summary.stddev = StdDev(scores);
  summary.min = *std::min_element(scores.begin(), scores.end());
  summary.max = *std::max_element(scores.begin(), scores.end());
  summary.latest = scores.back();
  return summary;
}

std::string ToJson(const OptimizationReport& report) {
  std::ostringstream out;
  out << "{\"average_score\":" << core::JsonNumber(report.average_score)
      << ",\"trend\":" << core::JsonString(ToString(report.trend))
      << ",\"convergence\":" << core::JsonString(ToString(report.convergence))
      << ",\"improvement_rate\":" << core::JsonNumber(report.improvement_rate)
      << ",\"score_stddev\":" << core::JsonNumber(report.score_stddev)
      << ",\"best_score\":" << core::JsonNumber(report.best_score)
      << ",\"worst_score\":" << core::JsonNumber(report.worst_score)
      << ",\"session_count\":" << report.session_count
      << ",\"successful_count\":" << report.successful_count
      << ",\"batch_count\":" << report.batch_count << ",\"convergence_estimate\":";
  if (report.convergence_estimate.has_value()) {
    out << *report.convergence_estimate;
  } else {
    out << "null";
  }
  out << ",\"most_common_weakness\":";
  if (report.most_common_weakness.has_value()) {
    out << core::JsonString(*report.most_common_weakness);
  } else {
    out << "null";
  }
  out << ",\"dimension_metrics\":{";
  bool first = true;
  for (const auto& [dimension, stats] : report.dimension_metrics) {
    if (!first) {
      out << ',';
    }
    first = false;
    out << core::JsonString(dimension) << ":{\"mean\":" << core::JsonNumber(stats.mean)
        << ",\"min\":" << core::JsonNumber(stats.min) << ",\"max\":" << core::JsonNumber(stats.max)
        << ",\"count\":" << stats.count << "}";
  }
  out << "},\"batch_scores\":[";
  for (std::size_t i = 0; i < report.batch_scores.size(); ++i) {
    if (i > 0U) {
      out << ',';
    }
    out << core::JsonNumber(report.batch_scores[i]);
  }
  out << "],\"recommendations\":" << core::JsonStringArray(report.recommendations)
      << ",\"insights\":" << core::JsonStringArray(report.insights) << "}";
  return out.str();
}

} // namespace refinery::optimizer
