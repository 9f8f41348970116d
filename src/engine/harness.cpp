#include "engine/harness.hpp"

#include "core/json_utils.hpp"
#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <exception>
#include <future>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

namespace refinery::engine {

namespace {

// Keeps `backoff_unit << attempt` far from overflow for large retry budgets.
constexpr std::size_t kMaxBackoffExponent = 20U;

// Ceilings for one chunk's collection wait and one backoff sleep. Both stay
// far below what a steady_clock time point can absorb.
constexpr std::chrono::milliseconds kMaxCollectionWait = std::chrono::hours(24 * 365);
constexpr std::chrono::milliseconds kMaxBackoffSleep = std::chrono::hours(24);

std::chrono::milliseconds CollectionBudget(std::chrono::milliseconds per_session,
                                           std::size_t count) {
  const auto sessions = static_cast<std::int64_t>(count);
  if (sessions == 0 || per_session >= kMaxCollectionWait / sessions) {
    return kMaxCollectionWait;
  }
  return per_session * sessions;
}

const ProduceContext& ContextFor(const BatchRequest& request, std::size_t index) {
  static const ProduceContext kDefaultContext;
  if (!request.contexts.has_value()) {
    return kDefaultContext;
  }
  return (*request.contexts)[index];
}

SessionResult MakeFailedSession(const std::string& input, std::string error,
                                std::size_t attempts) {
  SessionResult failed;
  failed.input = input;
  failed.status = SessionStatus::kFailed;
  failed.success = false;
  failed.attempts = attempts;
  failed.error = std::move(error);
  return failed;
}

} // namespace

Harness::Harness(IWorkflow& workflow, config::SessionConfig session_config,
                 config::HarnessConfig harness_config, core::logging::Logger& logger)
    : session_config_(session_config), config_(harness_config), logger_(&logger) {
  runner_ = [&workflow, &logger, session_config](const std::string& input,
                                                 const ProduceContext& context) {
    const Session session(workflow, logger);
    SessionResult result;
    std::string error;
    if (!session.Run(input, context, session_config, result, error)) {
      throw std::invalid_argument(error);
    }
    return result;
  };
}

Harness::Harness(SessionRunner runner, config::HarnessConfig harness_config,
                 core::logging::Logger& logger)
    : runner_(std::move(runner)), config_(harness_config), logger_(&logger) {}

bool Harness::RunBatch(const BatchRequest& request, HarnessResult& result, std::string& error) {
  result = HarnessResult{};
  error.clear();

  const config::HarnessConfig config = request.config.value_or(config_);
  if (!config::ValidateHarnessConfig(config, error)) {
    return false;
  }
  if (session_config_.has_value() && !config::ValidateSessionConfig(*session_config_, error)) {
    return false;
  }
  if (!runner_) {
    error = "harness has no session runner";
    return false;
  }
  if (request.contexts.has_value() && request.contexts->size() != request.inputs.size()) {
    error = "contexts count (" + std::to_string(request.contexts->size()) +
            ") must match inputs count (" + std::to_string(request.inputs.size()) + ")";
    return false;
  }

  const auto started = std::chrono::steady_clock::now();
  const std::size_t total = request.inputs.size();
  const std::size_t chunk = config.batch_size == 0U ? total : config.batch_size;

  logger_->Info("batch started",
                {{"inputs", std::to_string(total)},
                 {"parallelism", std::to_string(config.parallelism)},
                 {"chunk_size", std::to_string(chunk)},
                 {"max_retries", std::to_string(config.max_retries)}});

  result.sessions.reserve(total);
  for (std::size_t begin = 0; begin < total; begin += chunk) {
    RunChunk(request, config, begin, std::min(begin + chunk, total), result);
  }

  ComputeBatchStatistics(result);
  result.elapsed = core::ElapsedSince(started);

  logger_->Info("batch finished",
                {{"total", std::to_string(result.total)},
                 {"successful", std::to_string(result.successful)},
                 {"failed", std::to_string(result.failed)},
                 {"timed_out", std::to_string(result.timed_out)},
                 {"average_score", core::FormatFixedDouble(result.average_score, 4)},
                 {"convergence_rate", core::FormatFixedDouble(result.convergence_rate, 3)},
                 {"elapsed_ms", std::to_string(result.elapsed.count())}});
  return true;
}

void Harness::RunChunk(const BatchRequest& request, const config::HarnessConfig& config,
                       std::size_t begin, std::size_t end, HarnessResult& result) const {
  const std::size_t count = end - begin;
  std::vector<std::promise<SessionResult>> promises(count);
  std::vector<std::future<SessionResult>> futures;
  futures.reserve(count);
  for (auto& promise : promises) {
    futures.push_back(promise.get_future());
  }

  std::atomic<std::size_t> next_slot{0};
  auto drain = [&]() {
    for (;;) {
      const std::size_t slot = next_slot.fetch_add(1);
      if (slot >= count) {
        return;
      }
      const std::size_t index = begin + slot;
      try {
        promises[slot].set_value(
            RunWithRetry(request.inputs[index], ContextFor(request, index), config));
      } catch (...) {
        promises[slot].set_exception(std::current_exception());
      }
    }
  };

  const std::size_t thread_count = std::min(config.parallelism, count);
  std::vector<std::thread> workers;
  workers.reserve(thread_count);
  for (std::size_t i = 0; i < thread_count; ++i) {
    try {
      workers.emplace_back(drain);
    } catch (const std::system_error& e) {
      logger_->Error("failed to start harness worker",
                     {{"worker", std::to_string(i)}, {"error", e.what()}});
      break;
    }
  }
  if (workers.empty()) {
    drain();
  }

  const auto deadline =
      std::chrono::steady_clock::now() + CollectionBudget(config.timeout_per_session, count);
  for (std::size_t slot = 0; slot < count; ++slot) {
    const std::string& input = request.inputs[begin + slot];
    if (futures[slot].wait_until(deadline) != std::future_status::ready) {
      ++result.timed_out;
      logger_->Warn("session missed batch deadline", {{"input", input}});
      result.sessions.push_back(
          MakeFailedSession(input, "session did not finish within the batch timeout", 0U));
      continue;
    }

    try {
      result.sessions.push_back(futures[slot].get());
    } catch (const std::exception& e) {
      ++result.runner_exceptions;
      logger_->Error("session future raised", {{"input", input}, {"error", e.what()}});
      result.sessions.push_back(MakeFailedSession(input, e.what(), 0U));
    } catch (...) {
      ++result.runner_exceptions;
      logger_->Error("session future raised a non-standard exception", {{"input", input}});
      result.sessions.push_back(MakeFailedSession(input, "non-standard exception", 0U));
    }
  }

  for (auto& worker : workers) {
    worker.join();
  }
}

SessionResult Harness::RunWithRetry(const std::string& input, const ProduceContext& context,
                                    const config::HarnessConfig& config) const {
  std::string last_error;
  if (!config::ValidateHarnessConfig(config, last_error)) {
    return MakeFailedSession(input, last_error, 0U);
  }
  last_error = "no attempt was made";
  for (std::size_t attempt = 0; attempt < config.max_retries; ++attempt) {
    try {
      SessionResult session = runner_(input, context);
      session.attempts = attempt + 1U;
      return session;
    } catch (const std::exception& e) {
      last_error = e.what();
    } catch (...) {
      last_error = "non-standard exception";
    }

    logger_->Warn("session attempt failed",
                  {{"input", input},
                   {"attempt", std::to_string(attempt + 1U)},
                   {"max_retries", std::to_string(config.max_retries)},
                   {"error", last_error}});

    if (attempt + 1U < config.max_retries) {
      const std::size_t exponent = std::min(attempt, kMaxBackoffExponent);
      std::this_thread::sleep_for(
          std::min<std::chrono::milliseconds>(config.backoff_unit * (std::int64_t{1} << exponent),
                                              kMaxBackoffSleep));
    }
  }

  logger_->Error("session retries exhausted",
                 {{"input", input},
                  {"attempts", std::to_string(config.max_retries)},
                  {"error", last_error}});
  return MakeFailedSession(
      input, "all " + std::to_string(config.max_retries) + " attempts failed: " + last_error,
      config.max_retries);
}

void ComputeBatchStatistics(HarnessResult& result) {
  result.total = result.sessions.size();
  result.successful = 0;
  result.failed = 0;
  result.converged = 0;
  result.average_score = 0.0;
  result.best_score = 0.0;
  result.worst_score = 0.0;
  result.convergence_rate = 0.0;
  result.average_rounds = 0.0;
  result.min_rounds = 0;
  result.max_rounds = 0;
  result.dimension_averages.clear();

  double score_sum = 0.0;
  std::size_t round_sum = 0;
  std::map<std::string, std::pair<double, std::size_t>> dimension_totals;

  for (std::size_t i = 0; i < result.sessions.size(); ++i) {
    const SessionResult& session = result.sessions[i];
    const std::size_t rounds = session.rounds.size();
    round_sum += rounds;
    result.min_rounds = i == 0U ? rounds : std::min(result.min_rounds, rounds);
    result.max_rounds = std::max(result.max_rounds, rounds);

    if (session.converged) {
      ++result.converged;
    }
    if (!session.success) {
      ++result.failed;
      continue;
    }

    if (result.successful == 0U) {
      result.best_score = session.best_score;
      result.worst_score = session.best_score;
    } else {
      result.best_score = std::max(result.best_score, session.best_score);
      result.worst_score = std::min(result.worst_score, session.best_score);
    }
    ++result.successful;
    score_sum += session.best_score;

    if (session.best_evaluation.has_value()) {
      for (const auto& [dimension, value] : session.best_evaluation->dimensions) {
        auto& totals = dimension_totals[dimension];
        totals.first += value;
        ++totals.second;
      }
    }
  }

  if (result.successful > 0U) {
    result.average_score = score_sum / static_cast<double>(result.successful);
  }
  if (result.total > 0U) {
    result.convergence_rate =
        static_cast<double>(result.converged) / static_cast<double>(result.total);
    result.average_rounds = static_cast<double>(round_sum) / static_cast<double>(result.total);
  }
  for (const auto& [dimension, totals] : dimension_totals) {
    result.dimension_averages[dimension] = totals.first / static_cast<double>(totals.second);
  }
}

std::string ToJson(const HarnessResult& result) {
  std::ostringstream out;
  out << "{\"total\":" << result.total << ",\"successful\":" << result.successful
      << ",\"failed\":" << result.failed << ",\"converged\":" << result.converged
      << ",\"timed_out\":" << result.timed_out
      << ",\"runner_exceptions\":" << result.runner_exceptions
      << ",\"average_score\":" << core::JsonNumber(result.average_score)
      << ",\"best_score\":" << core::JsonNumber(result.best_score)
      << ",\"worst_score\":" << core::JsonNumber(result.worst_score)
      << ",\"convergence_rate\":" << core::JsonNumber(result.convergence_rate)
      << ",\"average_rounds\":" << core::JsonNumber(result.average_rounds)
      << ",\"min_rounds\":" << result.min_rounds << ",\"max_rounds\":" << result.max_rounds
      << ",\"dimension_averages\":" << core::JsonNumberObject(result.dimension_averages)
      << ",\"elapsed_ms\":" << result.elapsed.count() << "}";
  return out.str();
}

} // namespace refinery::engine
