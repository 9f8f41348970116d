#include "refinery/cli/router.hpp"

#include "config/engine_config.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/hash_utils.hpp"
#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"
#include "distributed/processor.hpp"
#include "engine/harness.hpp"
#include "optimizer/optimization_loop.hpp"
#include "optimizer/optimizer.hpp"
#include "sim/synthetic_workflow.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <numeric>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace refinery::cli {

namespace {

constexpr std::string_view kVersion = "refinery 0.1.0";

// Caps on generated workloads so a typo cannot exhaust memory.
constexpr std::uint64_t kMaxSimulateInputs = 100'000U;
constexpr std::uint64_t kMaxDistributeItems = 1'000'000U;

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitNotConverged = core::errors::ToInt(core::errors::ExitCode::kNotConverged);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  refinery simulate [--config <engine.json>] [--inputs <n>] [--seed <n>] "
         "[--fail-percent <0-100>] [--require-convergence] [--json] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  refinery distribute [--config <engine.json>] [--items <n>] [--workers <n>] "
         "[--fail-every <n>] [--log-level <debug|info|warn|error>]\n"
      << "  refinery validate-config <engine.json>\n"
      << "  refinery version\n"
      << "  refinery help\n";
}

bool ParseUnsigned(std::string_view flag, std::string_view raw, std::uint64_t& value,
                   std::string& error) {
  std::uint64_t parsed = 0;
  const char* begin = raw.data();
  const char* end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (raw.empty() || ec != std::errc() || ptr != end) {
    error = "invalid value for " + std::string(flag) + ": " + std::string(raw);
    return false;
  }
  value = parsed;
  return true;
}

// Reads the value following `args[i]` and advances `i`.
bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string_view& value,
               std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(args[i]);
    return false;
  }
  value = args[++i];
  return true;
}

// Loads `path` into `config` when given. Returns an exit code; kExitSuccess
// means the config is ready.
int LoadConfigOrReport(const std::optional<std::string>& path, config::EngineConfig& config) {
  if (!path.has_value()) {
    return kExitSuccess;
  }
  std::error_code ec;
  if (!fs::exists(*path, ec) || ec) {
    std::cerr << "error: config file not found: " << *path << '\n';
    return kExitFailure;
  }
  std::string error;
  if (!config::LoadEngineConfigFile(*path, config, error)) {
    std::cerr << "error: invalid config: " << error << '\n';
    return kExitConfigInvalid;
  }
  return kExitSuccess;
}

std::string MakeRunId(std::string_view command) {
  const std::string stamp = core::FormatUtcTimestamp(std::chrono::system_clock::now());
  return std::string(command) + "-" + core::ToHex64(core::Fnv1a64(stamp)).substr(0, 8);
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }
  std::cout << kVersion << '\n';
  return kExitSuccess;
}

int CommandValidateConfig(const std::vector<std::string_view>& args) {
  if (args.size() != 1U) {
    std::cerr << "error: validate-config requires exactly 1 argument: <engine.json>\n";
    return kExitUsage;
  }

  const std::string path(args.front());
  std::error_code ec;
  if (!fs::exists(path, ec) || ec) {
    std::cerr << "error: config file not found: " << path << '\n';
    return kExitFailure;
  }

  config::EngineConfig config;
  std::string error;
  if (!config::LoadEngineConfigFile(path, config, error)) {
    std::cerr << "invalid config: " << path << '\n';
    std::cerr << "  - " << error << '\n';
    return kExitConfigInvalid;
  }
  std::cout << "valid: " << path << '\n';
  return kExitSuccess;
}

struct SimulateOptions {
  std::optional<std::string> config_path;
  std::uint64_t inputs = 6;
  std::uint64_t seed = 1;
  std::uint64_t fail_percent = 0;
  bool require_convergence = false;
  bool json = false;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

bool ParseSimulateOptions(const std::vector<std::string_view>& args, SimulateOptions& options,
                          std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--require-convergence") {
      options.require_convergence = true;
    } else if (token == "--json") {
      options.json = true;
    } else if (token == "--config") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.config_path = std::string(value);
    } else if (token == "--inputs") {
      if (!TakeValue(args, i, value, error) ||
          !ParseUnsigned(token, value, options.inputs, error)) {
        return false;
      }
      if (options.inputs == 0U) {
        error = "--inputs must be greater than 0";
        return false;
      }
      if (options.inputs > kMaxSimulateInputs) {
        error = "--inputs must be at most " + std::to_string(kMaxSimulateInputs);
        return false;
      }
    } else if (token == "--seed") {
      if (!TakeValue(args, i, value, error) || !ParseUnsigned(token, value, options.seed, error)) {
        return false;
      }
    } else if (token == "--fail-percent") {
      if (!TakeValue(args, i, value, error) ||
          !ParseUnsigned(token, value, options.fail_percent, error)) {
        return false;
      }
      if (options.fail_percent > 100U) {
        error = "--fail-percent must be in [0,100]";
        return false;
      }
    } else if (token == "--log-level") {
      if (!TakeValue(args, i, value, error) ||
          !core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
    } else {
      error = "unknown option: " + std::string(token);
      return false;
    }
  }
  return true;
}

int CommandSimulate(const std::vector<std::string_view>& args) {
  SimulateOptions options;
  std::string error;
  if (!ParseSimulateOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  config::EngineConfig config;
  if (const int code = LoadConfigOrReport(options.config_path, config); code != kExitSuccess) {
    return code;
  }

  sim::SyntheticWorkflowConfig workflow_config;
  workflow_config.seed = options.seed;
  workflow_config.fail_percent = static_cast<std::uint32_t>(options.fail_percent);
  if (!sim::ValidateSyntheticWorkflowConfig(workflow_config, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  logger.SetRunId(MakeRunId("simulate"));

  sim::SyntheticWorkflow workflow(workflow_config);
  engine::Harness harness(workflow, config.session, config.harness, logger);
  optimizer::Optimizer optimizer(config.optimizer, logger);

  engine::BatchRequest request;
  for (std::uint64_t i = 0; i < options.inputs; ++i) {
    request.inputs.push_back("input-" + std::to_string(i + 1U));
  }

  optimizer::LoopResult loop;
  if (!optimizer::RunOptimizationLoop(harness, optimizer, request, config.loop, logger, loop,
                                      error)) {
    std::cerr << "error: optimization loop failed: " << error << '\n';
    return kExitFailure;
  }

  const optimizer::CycleRecord& last = loop.cycles.back();
  std::cout << "cycles: " << loop.cycles.size() << '\n';
  std::cout << "sessions_per_cycle: " << last.total << '\n';
  std::cout << "last_cycle_successful: " << last.successful << '\n';
  std::cout << "last_cycle_average_score: " << core::FormatFixedDouble(last.average_score, 4)
            << '\n';
  std::cout << "last_cycle_convergence_rate: "
            << core::FormatFixedDouble(last.convergence_rate, 3) << '\n';
  std::cout << "verdict: " << optimizer::ToString(last.report.convergence) << '\n';
  std::cout << "trend: " << optimizer::ToString(loop.trend_report.trend) << '\n';
  std::cout << "converged: " << (loop.converged ? "true" : "false") << '\n';
  for (const auto& recommendation : last.report.recommendations) {
    std::cout << "recommendation: " << recommendation << '\n';
  }
  if (options.json) {
    std::cout << "report_json: " << optimizer::ToJson(last.report) << '\n';
    std::cout << "trend_json: " << optimizer::ToJson(loop.trend_report) << '\n';
  }

  if (options.require_convergence && !loop.converged) {
    std::cerr << "error: optimization did not converge within " << config.loop.max_cycles
              << " cycles\n";
    return kExitNotConverged;
  }
  return kExitSuccess;
}

struct DistributeOptions {
  std::optional<std::string> config_path;
  std::uint64_t items = 20;
  std::optional<std::uint64_t> workers;
  std::uint64_t fail_every = 0;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

bool ParseDistributeOptions(const std::vector<std::string_view>& args, DistributeOptions& options,
                            std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--config") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.config_path = std::string(value);
    } else if (token == "--items") {
      if (!TakeValue(args, i, value, error) || !ParseUnsigned(token, value, options.items, error)) {
        return false;
      }
      if (options.items > kMaxDistributeItems) {
        error = "--items must be at most " + std::to_string(kMaxDistributeItems);
        return false;
      }
    } else if (token == "--workers") {
      std::uint64_t workers = 0;
      if (!TakeValue(args, i, value, error) || !ParseUnsigned(token, value, workers, error)) {
        return false;
      }
      options.workers = workers;
    } else if (token == "--fail-every") {
      if (!TakeValue(args, i, value, error) ||
          !ParseUnsigned(token, value, options.fail_every, error)) {
        return false;
      }
    } else if (token == "--log-level") {
      if (!TakeValue(args, i, value, error) ||
          !core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
    } else {
      error = "unknown option: " + std::string(token);
      return false;
    }
  }
  return true;
}

int CommandDistribute(const std::vector<std::string_view>& args) {
  DistributeOptions options;
  std::string error;
  if (!ParseDistributeOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  config::EngineConfig config;
  if (const int code = LoadConfigOrReport(options.config_path, config); code != kExitSuccess) {
    return code;
  }
  if (options.workers.has_value()) {
    if (*options.workers > config::kMaxThreads) {
      std::cerr << "error: --workers must be at most " << config::kMaxThreads << '\n';
      return kExitUsage;
    }
    config.processor.num_workers = static_cast<std::size_t>(*options.workers);
  }
  if (!config::ValidateProcessorConfig(config.processor, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  logger.SetRunId(MakeRunId("distribute"));

  std::vector<std::uint64_t> items;
  items.reserve(static_cast<std::size_t>(options.items));
  for (std::uint64_t i = 1; i <= options.items; ++i) {
    items.push_back(i);
  }

  const std::uint64_t fail_every = options.fail_every;
  auto doubler = [fail_every](const std::uint64_t& item) -> std::uint64_t {
    if (fail_every > 0U && item % fail_every == 0U) {
      throw std::runtime_error("injected failure for item " + std::to_string(item));
    }
    return item * 2U;
  };
  auto sum = [](const std::vector<std::uint64_t>& values) {
    return std::accumulate(values.begin(), values.end(), std::uint64_t{0});
  };

  distributed::DistributedProcessor processor(config.processor, logger);
  distributed::DistributedResult<std::uint64_t> result;
  if (!processor.ProcessDistributed(items, doubler, result, error, sum)) {
    std::cerr << "error: distributed run rejected: " << error << '\n';
    return kExitFailure;
  }

  const distributed::ProcessorStatistics stats = processor.GetStatistics();
  std::cout << "tasks: " << result.total_tasks << '\n';
  std::cout << "completed: " << result.completed_tasks << '\n';
  std::cout << "failed: " << result.failed_tasks << '\n';
  std::cout << "retries: " << result.retries << '\n';
  std::cout << "stalls: " << result.stalls_detected << '\n';
  std::cout << "workers: " << stats.num_workers << '\n';
  std::cout << "sum: " << (result.aggregate.has_value() ? std::to_string(*result.aggregate) : "-")
            << '\n';
  for (const auto& failure : result.failures) {
    std::cout << "failure: index=" << failure.index << " task_id=" << failure.task_id
              << " error=" << failure.error << '\n';
  }
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "validate-config") {
    return CommandValidateConfig(args);
  }
  if (command == "simulate") {
    return CommandSimulate(args);
  }
  if (command == "distribute") {
    return CommandDistribute(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace refinery::cli
