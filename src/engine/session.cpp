#include "engine/session.hpp"

#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <string>

namespace refinery::engine {

namespace {

struct ProduceOutcome {
  bool ok = false;
  Artifact artifact;
  std::string error;
};

struct ScoreOutcome {
  bool ok = false;
  ScoreResult evaluation;
  std::string error;
};

ProduceOutcome CallProduce(IWorkflow& workflow, const std::string& input,
                           const ProduceContext& context) {
  ProduceOutcome outcome;
  try {
    outcome.ok = workflow.Produce(input, context, outcome.artifact, outcome.error);
  } catch (const std::exception& e) {
    outcome.ok = false;
    outcome.error = std::string("produce threw: ") + e.what();
  } catch (...) {
    outcome.ok = false;
    outcome.error = "produce threw a non-standard exception";
  }
  if (!outcome.ok && outcome.error.empty()) {
    outcome.error = "produce returned no artifact";
  }
  return outcome;
}

ScoreOutcome CallScore(IWorkflow& workflow, const Artifact& artifact) {
  ScoreOutcome outcome;
  try {
    outcome.evaluation = workflow.Score(artifact);
    outcome.ok = true;
  } catch (const std::exception& e) {
    outcome.error = std::string("score threw: ") + e.what();
    return outcome;
  } catch (...) {
    outcome.error = "score threw a non-standard exception";
    return outcome;
  }

  if (!std::isfinite(outcome.evaluation.overall)) {
    outcome.ok = false;
    outcome.error = "score returned a non-finite overall value";
  }
  return outcome;
}

// Feedback replaces the previous round's hints; caller-supplied hints stay.
std::vector<std::string> BuildHints(const std::vector<std::string>& base_hints,
                                    const ScoreResult& evaluation) {
  std::vector<std::string> hints = base_hints;
  const std::size_t take = std::min(kFeedbackHintLimit, evaluation.recommendations.size());
  hints.insert(hints.end(), evaluation.recommendations.begin(),
               evaluation.recommendations.begin() + static_cast<std::ptrdiff_t>(take));
  return hints;
}

} // namespace

const char* ToString(SessionStatus status) {
  switch (status) {
  case SessionStatus::kRunning:
    return "running";
  case SessionStatus::kConverged:
    return "converged";
  case SessionStatus::kExhausted:
    return "exhausted";
  case SessionStatus::kFailed:
    return "failed";
  }
  return "failed";
}

Session::Session(IWorkflow& workflow, core::logging::Logger& logger)
    : workflow_(&workflow), logger_(&logger) {}

bool Session::Run(const std::string& input, const ProduceContext& context,
                  const config::SessionConfig& config, SessionResult& result,
                  std::string& error) const {
  result = SessionResult{};
  if (!config::ValidateSessionConfig(config, error)) {
    return false;
  }

  const auto started = std::chrono::steady_clock::now();
  result.input = input;
  result.status = SessionStatus::kRunning;
  result.attempts = 1;

  ProduceContext round_context = context;
  std::string last_error;

  for (std::size_t round = 1; round <= config.max_rounds; ++round) {
    SessionRound entry;
    entry.round = round;

    ProduceOutcome produced = CallProduce(*workflow_, input, round_context);
    if (!produced.ok) {
      logger_->Warn("session round produced no artifact",
                    {{"input", input},
                     {"round", std::to_string(round)},
                     {"error", produced.error}});
      entry.error = produced.error;
      last_error = produced.error;
      result.rounds.push_back(std::move(entry));
      continue;
    }
    entry.artifact = produced.artifact;

    ScoreOutcome scored = CallScore(*workflow_, produced.artifact);
    if (!scored.ok) {
      logger_->Warn("session round could not be scored",
                    {{"input", input},
                     {"round", std::to_string(round)},
                     {"error", scored.error}});
      entry.error = scored.error;
      last_error = scored.error;
      result.rounds.push_back(std::move(entry));
      continue;
    }

    const ScoreResult& evaluation = scored.evaluation;
    entry.scored = true;
    entry.score = evaluation.overall;
    entry.dimensions = evaluation.dimensions;
    entry.strengths = evaluation.strengths;
    entry.weaknesses = evaluation.weaknesses;
    entry.recommendations = evaluation.recommendations;
    result.rounds.push_back(std::move(entry));

    if (!result.best_artifact.has_value() || evaluation.overall > result.best_score) {
      result.best_artifact = produced.artifact;
      result.best_score = evaluation.overall;
      result.best_evaluation = evaluation;
      result.best_round = round;
    }

    logger_->Debug("session round scored",
                   {{"input", input},
                    {"round", std::to_string(round)},
                    {"score", core::FormatFixedDouble(evaluation.overall, 4)},
                    {"best_score", core::FormatFixedDouble(result.best_score, 4)}});

    if (evaluation.overall >= config.convergence_threshold) {
      result.converged = true;
      break;
    }

    round_context.hints = BuildHints(context.hints, evaluation);
    round_context.prior_artifacts.push_back(std::move(produced.artifact));
  }

  result.success = result.best_artifact.has_value();
  if (result.converged) {
    result.status = SessionStatus::kConverged;
  } else if (result.success) {
    result.status = SessionStatus::kExhausted;
  } else {
    result.status = SessionStatus::kFailed;
    result.error = "no round produced a scoreable artifact";
    if (!last_error.empty()) {
      result.error += " (last error: " + last_error + ")";
    }
  }
  result.elapsed = core::ElapsedSince(started);

  logger_->Info("session finished",
                {{"input", input},
                 {"status", ToString(result.status)},
                 {"rounds", std::to_string(result.rounds.size())},
                 {"best_score", core::FormatFixedDouble(result.best_score, 4)},
                 {"elapsed_ms", std::to_string(result.elapsed.count())}});
  error.clear();
  return true;
}

} // namespace refinery::engine
