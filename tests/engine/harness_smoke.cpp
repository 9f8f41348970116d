#include "common/assertions.hpp"
#include "common/scripted_workflow.hpp"
#include "core/logging/logger.hpp"
#include "engine/harness.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using refinery::engine::BatchRequest;
using refinery::engine::Harness;
using refinery::engine::HarnessResult;
using refinery::engine::ProduceContext;
using refinery::engine::SessionResult;
using refinery::engine::SessionStatus;
using refinery::tests::common::AssertContains;
using refinery::tests::common::AssertNear;
using refinery::tests::common::AssertTrue;
using refinery::tests::common::Fail;

refinery::config::HarnessConfig FastConfig() {
  refinery::config::HarnessConfig config;
  config.parallelism = 4;
  config.max_retries = 3;
  config.timeout_per_session = std::chrono::milliseconds(5'000);
  config.batch_size = 0;
  config.backoff_unit = std::chrono::milliseconds(1);
  return config;
}

SessionResult ScoredSession(const std::string& input, double score, std::size_t rounds,
                            bool converged) {
  SessionResult session;
  session.input = input;
  session.success = true;
  session.converged = converged;
  session.status = converged ? SessionStatus::kConverged : SessionStatus::kExhausted;
  session.best_score = score;
  session.best_artifact = refinery::engine::Artifact{input, input, {}};
  refinery::engine::ScoreResult evaluation;
  evaluation.overall = score;
  evaluation.dimensions["clarity"] = score;
  session.best_evaluation = evaluation;
  session.rounds.resize(rounds);
  return session;
}

HarnessResult RunOrFail(Harness& harness, const BatchRequest& request) {
  HarnessResult result;
  std::string error;
  if (!harness.RunBatch(request, result, error)) {
    Fail("RunBatch rejected request: " + error);
  }
  return result;
}

} // namespace

int main() {
  std::ostringstream log_sink;
  refinery::core::logging::Logger logger(refinery::core::logging::LogLevel::kDebug, log_sink);

  // Empty batch is a valid no-op.
  {
    Harness harness([](const std::string& input, const ProduceContext&) {
      return ScoredSession(input, 0.5, 1, false);
    }, FastConfig(), logger);
    const HarnessResult result = RunOrFail(harness, BatchRequest{});
    AssertTrue(result.total == 0U && result.sessions.empty(), "empty batch has no sessions");
    AssertNear(result.average_score, 0.0, "empty average");
    AssertNear(result.convergence_rate, 0.0, "empty convergence rate");
  }

  // Usage errors are rejected before any session runs.
  {
    std::atomic<int> calls{0};
    Harness harness([&calls](const std::string& input, const ProduceContext&) {
      ++calls;
      return ScoredSession(input, 0.5, 1, false);
    }, FastConfig(), logger);

    BatchRequest mismatched;
    mismatched.inputs = {"a", "b"};
    mismatched.contexts = std::vector<ProduceContext>(1);
    HarnessResult result;
    std::string error;
    if (harness.RunBatch(mismatched, result, error)) {
      Fail("expected contexts mismatch to be rejected");
    }
    AssertContains(error, "contexts count (1) must match inputs count (2)");

    BatchRequest bad_override;
    bad_override.inputs = {"a"};
    bad_override.config = FastConfig();
    bad_override.config->parallelism = 0;
    if (harness.RunBatch(bad_override, result, error)) {
      Fail("expected zero parallelism override to be rejected");
    }
    AssertContains(error, "harness.parallelism must be greater than 0");
    AssertTrue(calls.load() == 0, "runner must not run on usage errors");
  }

  // Results keep submission order even when completion order differs.
  {
    Harness harness([](const std::string& input, const ProduceContext&) {
      const int delay = 5 * (5 - std::stoi(input));
      std::this_thread::sleep_for(std::chrono::milliseconds(delay));
      return ScoredSession(input, 0.5, 1, false);
    }, FastConfig(), logger);

    BatchRequest request;
    request.inputs = {"0", "1", "2", "3", "4"};
    const HarnessResult result = RunOrFail(harness, request);
    AssertTrue(result.sessions.size() == 5U, "expected five sessions");
    for (std::size_t i = 0; i < request.inputs.size(); ++i) {
      AssertTrue(result.sessions[i].input == request.inputs[i], "submission order not preserved");
    }
  }

  // A runner that throws twice succeeds on the third attempt in the same worker.
  {
    std::mutex mu;
    std::map<std::string, int> calls;
    Harness harness([&](const std::string& input, const ProduceContext&) {
      {
        std::lock_guard<std::mutex> lock(mu);
        if (++calls[input] < 3) {
          throw std::runtime_error("transient");
        }
      }
      return ScoredSession(input, 0.7, 2, false);
    }, FastConfig(), logger);

    BatchRequest request;
    request.inputs = {"x", "y"};
    const HarnessResult result = RunOrFail(harness, request);
    AssertTrue(result.successful == 2U && result.failed == 0U, "retries should recover");
    for (const auto& session : result.sessions) {
      AssertTrue(session.attempts == 3U, "expected three attempts");
    }
    AssertTrue(calls["x"] == 3 && calls["y"] == 3, "runner call count mismatch");
  }

  // A runner that always throws yields a failed session after exactly max_retries attempts.
  {
    std::atomic<int> calls{0};
    refinery::config::HarnessConfig config = FastConfig();
    config.max_retries = 2;
    Harness harness([&calls](const std::string&, const ProduceContext&) -> SessionResult {
      ++calls;
      throw std::runtime_error("boom");
    }, config, logger);

    BatchRequest request;
    request.inputs = {"only"};
    const HarnessResult result = RunOrFail(harness, request);
    AssertTrue(calls.load() == 2, "expected exactly max_retries runner calls");
    AssertTrue(result.failed == 1U && result.successful == 0U, "expected one failure");
    const SessionResult& session = result.sessions.front();
    AssertTrue(session.status == SessionStatus::kFailed, "expected failed status");
    AssertTrue(session.attempts == 2U, "attempts must equal max_retries");
    AssertContains(session.error, "all 2 attempts failed: boom");
  }

  // Aggregate statistics over mixed outcomes.
  {
    Harness harness([](const std::string& input, const ProduceContext&) {
      if (input == "low") {
        return ScoredSession(input, 0.6, 3, false);
      }
      if (input == "high") {
        return ScoredSession(input, 0.9, 1, true);
      }
      SessionResult failed;
      failed.input = input;
      failed.status = SessionStatus::kFailed;
      failed.rounds.resize(2);
      failed.error = "no round produced a scoreable artifact";
      return failed;
    }, FastConfig(), logger);

    BatchRequest request;
    request.inputs = {"low", "high", "broken"};
    const HarnessResult result = RunOrFail(harness, request);
    AssertTrue(result.total == 3U, "total mismatch");
    AssertTrue(result.successful == 2U, "successful mismatch");
    AssertTrue(result.failed == 1U, "failed mismatch");
    AssertTrue(result.converged == 1U, "converged mismatch");
    AssertNear(result.average_score, 0.75, "average score");
    AssertNear(result.best_score, 0.9, "best score");
    AssertNear(result.worst_score, 0.6, "worst score");
    AssertNear(result.convergence_rate, 1.0 / 3.0, "convergence rate");
    AssertNear(result.average_rounds, 2.0, "average rounds");
    AssertTrue(result.min_rounds == 1U && result.max_rounds == 3U, "round range mismatch");
    AssertNear(result.dimension_averages.at("clarity"), 0.75, "clarity average");

    const std::string json = refinery::engine::ToJson(result);
    AssertContains(json, "\"total\":3");
    AssertContains(json, "\"successful\":2");
    AssertContains(json, "\"dimension_averages\":{\"clarity\":0.750000}");
  }

  // Chunking caps concurrency at batch_size.
  {
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    refinery::config::HarnessConfig config = FastConfig();
    config.batch_size = 2;
    Harness harness([&](const std::string& input, const ProduceContext&) {
      const int now = ++active;
      int observed = peak.load();
      while (now > observed && !peak.compare_exchange_weak(observed, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      --active;
      return ScoredSession(input, 0.5, 1, false);
    }, config, logger);

    BatchRequest request;
    request.inputs = {"a", "b", "c", "d", "e"};
    const HarnessResult result = RunOrFail(harness, request);
    AssertTrue(result.total == 5U && result.successful == 5U, "all chunked sessions must run");
    AssertTrue(peak.load() <= 2, "chunk size must cap concurrency");
  }

  // A session past the batch deadline is reported as timed out.
  {
    refinery::config::HarnessConfig config = FastConfig();
    config.timeout_per_session = std::chrono::milliseconds(30);
    Harness harness([](const std::string& input, const ProduceContext&) {
      if (input == "slow") {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
      }
      return ScoredSession(input, 0.8, 1, false);
    }, config, logger);

    BatchRequest request;
    request.inputs = {"fast", "slow"};
    const HarnessResult result = RunOrFail(harness, request);
    AssertTrue(result.timed_out == 1U, "expected one timed out session");
    AssertTrue(result.successful == 1U && result.failed == 1U, "timeout counts as failure");
    AssertTrue(result.sessions[1].input == "slow", "timed out session keeps its slot");
    AssertContains(result.sessions[1].error, "did not finish within the batch timeout");
  }

  // Default runner drives a Session per input over the workflow.
  {
    refinery::tests::common::ScriptedStep step;
    step.score = 0.9;
    refinery::tests::common::ScriptedWorkflow workflow({step});
    refinery::config::SessionConfig session_config;
    session_config.max_rounds = 3;
    Harness harness(workflow, session_config, FastConfig(), logger);

    BatchRequest request;
    request.inputs = {"p", "q"};
    request.contexts = std::vector<ProduceContext>(2);
    (*request.contexts)[1].domain = "docs";
    const HarnessResult result = RunOrFail(harness, request);
    AssertTrue(result.converged == 2U, "both sessions should converge");
    AssertNear(result.convergence_rate, 1.0, "convergence rate");
    AssertTrue(workflow.ContextsFor("q").front().domain == "docs",
               "per-input context must reach Produce");

    refinery::config::SessionConfig bad_session;
    bad_session.max_rounds = 0;
    Harness bad(workflow, bad_session, FastConfig(), logger);
    HarnessResult rejected;
    std::string error;
    if (bad.RunBatch(request, rejected, error)) {
      Fail("expected invalid session config to be rejected");
    }
    AssertContains(error, "session.max_rounds must be greater than 0");
  }

  // Retries back off exponentially: unit, then twice the unit.
  {
    std::atomic<int> calls{0};
    refinery::config::HarnessConfig config = FastConfig();
    config.max_retries = 3;
    config.backoff_unit = std::chrono::milliseconds(20);
    Harness harness([&calls](const std::string&, const ProduceContext&) -> SessionResult {
      ++calls;
      throw std::runtime_error("still failing");
    }, config, logger);

    const auto started = std::chrono::steady_clock::now();
    const SessionResult session = harness.RunWithRetry("slow", ProduceContext{}, config);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    AssertTrue(calls.load() == 3, "expected three attempts");
    AssertTrue(session.status == SessionStatus::kFailed, "expected failed status");
    AssertTrue(elapsed >= std::chrono::milliseconds(60),
               "backoff must sleep 20ms then 40ms between attempts");
    AssertTrue(elapsed < std::chrono::milliseconds(2'000), "backoff slept far too long");
  }

  // Out-of-range durations are rejected instead of overflowing the deadline.
  {
    std::atomic<int> calls{0};
    Harness harness([&calls](const std::string& input, const ProduceContext&) {
      ++calls;
      return ScoredSession(input, 0.5, 1, false);
    }, FastConfig(), logger);

    refinery::config::HarnessConfig huge = FastConfig();
    huge.timeout_per_session = std::chrono::milliseconds::max();
    BatchRequest request;
    request.inputs = {"a", "b"};
    request.config = huge;
    HarnessResult rejected;
    std::string error;
    if (harness.RunBatch(request, rejected, error)) {
      Fail("expected an unbounded session timeout to be rejected");
    }
    AssertContains(error, "harness.timeout_per_session must be at most 4294967295 ms");

    const SessionResult session = harness.RunWithRetry("a", ProduceContext{}, huge);
    AssertTrue(session.status == SessionStatus::kFailed, "invalid config yields a failed session");
    AssertTrue(session.attempts == 0U, "invalid config must not run the session");
    AssertContains(session.error, "harness.timeout_per_session must be at most");
    AssertTrue(calls.load() == 0, "runner must not be called for an invalid config");

    // The largest accepted timeout still runs to completion.
    refinery::config::HarnessConfig widest = FastConfig();
    widest.timeout_per_session = refinery::config::kMaxDuration;
    request.config = widest;
    const HarnessResult result = RunOrFail(harness, request);
    AssertTrue(result.successful == 2U && result.timed_out == 0U,
               "maximum timeout must not expire immediately");
  }

  AssertContains(log_sink.str(), "msg=\"batch finished\"");
  AssertContains(log_sink.str(), "msg=\"session attempt failed\"");

  std::cout << "harness_smoke: ok\n";
  return 0;
}
