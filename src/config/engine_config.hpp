#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace refinery::config {

// Upper bounds enforced by validation. Durations share the JSON loader's
// uint32 millisecond ceiling so deadline arithmetic cannot overflow.
constexpr std::chrono::milliseconds kMaxDuration{4'294'967'295LL};
constexpr std::size_t kMaxThreads = 1024U;

// Per-input convergence loop limits.
struct SessionConfig {
  std::size_t max_rounds = 10;
  double convergence_threshold = 0.85;
};

// Parallel batch runner settings.
//
// `max_retries` counts whole-session attempts made in the same worker thread.
// The sleep after failed attempt k (0-based) is backoff_unit * 2^k.
// `batch_size` caps how many sessions one pool round submits; 0 disables
// chunking.
struct HarnessConfig {
  std::size_t parallelism = 4;
  std::size_t max_retries = 3;
  std::chrono::milliseconds timeout_per_session{300'000};
  std::size_t batch_size = 10;
  std::chrono::milliseconds backoff_unit{1'000};
};

// Generic worker-pool settings. `heartbeat_interval` is both the queue pop
// timeout and the stall scan period.
struct ProcessorConfig {
  std::size_t num_workers = 4;
  std::size_t max_retries = 3;
  bool enable_fault_tolerance = true;
  std::chrono::milliseconds heartbeat_interval{5'000};
  std::chrono::milliseconds task_timeout{300'000};
};

struct OptimizerConfig {
  std::size_t window_size = 5;
  double min_improvement_rate = 0.01;
  double convergence_threshold = 0.85;
};

struct LoopConfig {
  std::size_t max_cycles = 10;
  bool stop_on_convergence = true;
};

struct EngineConfig {
  SessionConfig session;
  HarnessConfig harness;
  ProcessorConfig processor;
  OptimizerConfig optimizer;
  LoopConfig loop;
};

// Validation contract shared by all records:
// - true: config is usable and `error` is empty.
// - false: `error` names the offending field.
bool ValidateSessionConfig(const SessionConfig& config, std::string& error);
bool ValidateHarnessConfig(const HarnessConfig& config, std::string& error);
bool ValidateProcessorConfig(const ProcessorConfig& config, std::string& error);
bool ValidateOptimizerConfig(const OptimizerConfig& config, std::string& error);
bool ValidateLoopConfig(const LoopConfig& config, std::string& error);
bool ValidateEngineConfig(const EngineConfig& config, std::string& error);

// Parses an engine config document. Sections and keys are optional and start
// from the defaults above; unknown keys and wrong value types are rejected.
//
// {
//   "session":   {"max_rounds": 5, "convergence_threshold": 0.85},
//   "harness":   {"parallelism": 4, "max_retries": 3, "timeout_per_session_ms": 300000,
//                 "batch_size": 10, "backoff_unit_ms": 1000},
//   "processor": {"num_workers": 4, "max_retries": 3, "enable_fault_tolerance": true,
//                 "heartbeat_interval_ms": 5000, "task_timeout_ms": 300000},
//   "optimizer": {"window_size": 5, "min_improvement_rate": 0.01,
//                 "convergence_threshold": 0.85},
//   "loop":      {"max_cycles": 10, "stop_on_convergence": true}
// }
bool ParseEngineConfigText(std::string_view json_text, EngineConfig& config, std::string& error);

bool LoadEngineConfigFile(const std::filesystem::path& path, EngineConfig& config,
                          std::string& error);

} // namespace refinery::config
