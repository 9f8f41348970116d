#include "config/engine_config.hpp"

#include "core/json_dom.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <functional>
#include <iterator>
#include <limits>
#include <map>
#include <string>

namespace fs = std::filesystem;

namespace refinery::config {

namespace {

using JsonValue = core::json::Value;
using FieldReader = std::function<bool(const JsonValue& value, const std::string& path,
                                       std::string& error)>;
using SectionReaders = std::map<std::string, FieldReader>;

bool IsDurationInRange(std::chrono::milliseconds value) {
  return value <= kMaxDuration;
}

std::string DurationCeilingText() {
  return std::to_string(kMaxDuration.count()) + " ms";
}

bool IsUnitInterval(double value) {
  return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

bool TypeError(const std::string& path, std::string_view expected, const JsonValue& value,
               std::string& error) {
  error = path + ": must be " + std::string(expected) + " (got " +
          core::json::ToString(value.type) + ")";
  return false;
}

bool ReadCount(const JsonValue& value, const std::string& path, std::size_t& out,
               std::string& error) {
  if (!value.is_number() || !std::isfinite(value.number_value) || value.number_value < 0.0 ||
      std::floor(value.number_value) != value.number_value ||
      value.number_value > static_cast<double>(std::numeric_limits<std::uint32_t>::max())) {
    return TypeError(path, "a non-negative integer", value, error);
  }
  out = static_cast<std::size_t>(value.number_value);
  return true;
}

bool ReadMillis(const JsonValue& value, const std::string& path, std::chrono::milliseconds& out,
                std::string& error) {
  std::size_t millis = 0;
  if (!ReadCount(value, path, millis, error)) {
    return false;
  }
  out = std::chrono::milliseconds(static_cast<std::int64_t>(millis));
  return true;
}

bool ReadFraction(const JsonValue& value, const std::string& path, double& out,
                  std::string& error) {
  if (!value.is_number() || !std::isfinite(value.number_value)) {
    return TypeError(path, "a finite number", value, error);
  }
  out = value.number_value;
  return true;
}

bool ReadFlag(const JsonValue& value, const std::string& path, bool& out, std::string& error) {
  if (!value.is_bool()) {
    return TypeError(path, "a boolean", value, error);
  }
  out = value.bool_value;
  return true;
}

FieldReader Count(std::size_t& target) {
  return [&target](const JsonValue& v, const std::string& p, std::string& e) {
    return ReadCount(v, p, target, e);
  };
}

FieldReader Millis(std::chrono::milliseconds& target) {
  return [&target](const JsonValue& v, const std::string& p, std::string& e) {
    return ReadMillis(v, p, target, e);
  };
}

FieldReader Fraction(double& target) {
  return [&target](const JsonValue& v, const std::string& p, std::string& e) {
    return ReadFraction(v, p, target, e);
  };
}

FieldReader Flag(bool& target) {
  return [&target](const JsonValue& v, const std::string& p, std::string& e) {
    return ReadFlag(v, p, target, e);
  };
}

bool ReadSection(const JsonValue& root, const std::string& name, const SectionReaders& readers,
                 std::string& error) {
  const JsonValue* section = root.Find(name);
  if (section == nullptr) {
    return true;
  }
  if (!section->is_object()) {
    return TypeError(name, "an object", *section, error);
  }

  for (const auto& [key, value] : section->object_value) {
    const std::string path = name + "." + key;
    const auto reader = readers.find(key);
    if (reader == readers.end()) {
      error = path + ": unknown key";
      return false;
    }
    if (!reader->second(value, path, error)) {
      return false;
    }
  }
  return true;
}

} // namespace

bool ValidateSessionConfig(const SessionConfig& config, std::string& error) {
  if (config.max_rounds == 0U) {
    error = "session.max_rounds must be greater than 0";
    return false;
  }
  if (!IsUnitInterval(config.convergence_threshold)) {
    error = "session.convergence_threshold must be in [0,1]";
    return false;
  }
  error.clear();
  return true;
}

bool ValidateHarnessConfig(const HarnessConfig& config, std::string& error) {
  if (config.parallelism == 0U) {
    error = "harness.parallelism must be greater than 0";
    return false;
  }
  if (config.parallelism > kMaxThreads) {
    error = "harness.parallelism must be at most " + std::to_string(kMaxThreads);
    return false;
  }
  if (config.max_retries == 0U) {
    error = "harness.max_retries must be greater than 0";
    return false;
  }
  if (config.timeout_per_session <= std::chrono::milliseconds::zero()) {
    error = "harness.timeout_per_session must be greater than 0";
    return false;
  }
  if (!IsDurationInRange(config.timeout_per_session)) {
    error = "harness.timeout_per_session must be at most " + DurationCeilingText();
    return false;
  }
  if (config.backoff_unit < std::chrono::milliseconds::zero()) {
    error = "harness.backoff_unit must not be negative";
    return false;
  }
  if (!IsDurationInRange(config.backoff_unit)) {
    error = "harness.backoff_unit must be at most " + DurationCeilingText();
    return false;
  }
  error.clear();
  return true;
}

bool ValidateProcessorConfig(const ProcessorConfig& config, std::string& error) {
  if (config.num_workers == 0U) {
    error = "processor.num_workers must be greater than 0";
    return false;
  }
  if (config.num_workers > kMaxThreads) {
    error = "processor.num_workers must be at most " + std::to_string(kMaxThreads);
    return false;
  }
  if (config.heartbeat_interval <= std::chrono::milliseconds::zero()) {
    error = "processor.heartbeat_interval must be greater than 0";
    return false;
  }
  if (!IsDurationInRange(config.heartbeat_interval)) {
    error = "processor.heartbeat_interval must be at most " + DurationCeilingText();
    return false;
  }
  if (config.task_timeout <= std::chrono::milliseconds::zero()) {
    error = "processor.task_timeout must be greater than 0";
    return false;
  }
  if (!IsDurationInRange(config.task_timeout)) {
    error = "processor.task_timeout must be at most " + DurationCeilingText();
    return false;
  }
  error.clear();
  return true;
}

bool ValidateOptimizerConfig(const OptimizerConfig& config, std::string& error) {
  if (config.window_size < 2U) {
    error = "optimizer.window_size must be at least 2";
    return false;
  }
  if (!std::isfinite(config.min_improvement_rate) || config.min_improvement_rate < 0.0) {
    error = "optimizer.min_improvement_rate must be a non-negative number";
    return false;
  }
  if (!IsUnitInterval(config.convergence_threshold)) {
    error = "optimizer.convergence_threshold must be in [0,1]";
    return false;
  }
  error.clear();
  return true;
}

bool ValidateLoopConfig(const LoopConfig& config, std::string& error) {
  if (config.max_cycles == 0U) {
    error = "loop.max_cycles must be greater than 0";
    return false;
  }
  error.clear();
  return true;
}

bool ValidateEngineConfig(const EngineConfig& config, std::string& error) {
  return ValidateSessionConfig(config.session, error) &&
         ValidateHarnessConfig(config.harness, error) &&
         ValidateProcessorConfig(config.processor, error) &&
         ValidateOptimizerConfig(config.optimizer, error) &&
         ValidateLoopConfig(config.loop, error);
}

bool ParseEngineConfigText(std::string_view json_text, EngineConfig& config, std::string& error) {
  JsonValue root;
  if (!core::json::Parse(json_text, root, error)) {
    return false;
  }
  if (!root.is_object()) {
    return TypeError("$", "an object", root, error);
  }

  EngineConfig parsed;
  const std::map<std::string, SectionReaders> sections = {
      {"session",
       {{"max_rounds", Count(parsed.session.max_rounds)},
        {"convergence_threshold", Fraction(parsed.session.convergence_threshold)}}},
      {"harness",
       {{"parallelism", Count(parsed.harness.parallelism)},
        {"max_retries", Count(parsed.harness.max_retries)},
        {"timeout_per_session_ms", Millis(parsed.harness.timeout_per_session)},
        {"batch_size", Count(parsed.harness.batch_size)},
        {"backoff_unit_ms", Millis(parsed.harness.backoff_unit)}}},
      {"processor",
       {{"num_workers", Count(parsed.processor.num_workers)},
        {"max_retries", Count(parsed.processor.max_retries)},
        {"enable_fault_tolerance", Flag(parsed.processor.enable_fault_tolerance)},
        {"heartbeat_interval_ms", Millis(parsed.processor.heartbeat_interval)},
        {"task_timeout_ms", Millis(parsed.processor.task_timeout)}}},
      {"optimizer",
       {{"window_size", Count(parsed.optimizer.window_size)},
        {"min_improvement_rate", Fraction(parsed.optimizer.min_improvement_rate)},
        {"convergence_threshold", Fraction(parsed.optimizer.convergence_threshold)}}},
      {"loop",
       {{"max_cycles", Count(parsed.loop.max_cycles)},
        {"stop_on_convergence", Flag(parsed.loop.stop_on_convergence)}}},
  };

  for (const auto& member : root.object_value) {
    if (sections.count(member.first) == 0U) {
      error = member.first + ": unknown section";
      return false;
    }
  }
  for (const auto& [name, readers] : sections) {
    if (!ReadSection(root, name, readers, error)) {
      return false;
    }
  }

  if (!ValidateEngineConfig(parsed, error)) {
    return false;
  }
  config = parsed;
  return true;
}

bool LoadEngineConfigFile(const fs::path& path, EngineConfig& config, std::string& error) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec) || ec) {
    error = "config file not found: " + path.string();
    return false;
  }

  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "unable to open config file: " + path.string();
    return false;
  }
  const std::string text((std::istreambuf_iterator<char>(input)),
                         std::istreambuf_iterator<char>());

  if (!ParseEngineConfigText(text, config, error)) {
    error = path.string() + ": " + error;
    return false;
  }
  return true;
}

} // namespace refinery::config
