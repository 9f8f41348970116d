#include "sim/synthetic_workflow.hpp"

#include "core/hash_utils.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace refinery::sim {

namespace {

constexpr std::uint64_t kSplitMixIncrement = 0x9e3779b97f4a7c15ULL;
constexpr std::uint64_t kFailureSalt = 0x6661696c75726521ULL;
constexpr std::uint64_t kNoiseSalt = 0x6e6f6973652d2d31ULL;
constexpr double kWeakDimension = 0.5;
constexpr double kStrongDimension = 0.8;
constexpr double kDimensionSpread = 0.15;

std::uint64_t SplitMix64(std::uint64_t value) {
  std::uint64_t state = value + kSplitMixIncrement;
  state = (state ^ (state >> 30)) * 0xbf58476d1ce4e5b9ULL;
  state = (state ^ (state >> 27)) * 0x94d049bb133111ebULL;
  return state ^ (state >> 31);
}

// Uniform in [0, 1).
double UnitInterval(std::uint64_t mixed) {
  return static_cast<double>(mixed >> 11) * (1.0 / 9007199254740992.0);
}

bool DeterministicPercentHit(std::uint64_t key, std::uint64_t call, std::uint32_t percent) {
  if (percent == 0U) {
    return false;
  }
  if (percent >= 100U) {
    return true;
  }
  const std::uint64_t mixed = SplitMix64((key ^ kFailureSalt) + call * kSplitMixIncrement);
  return (mixed % 100ULL) < static_cast<std::uint64_t>(percent);
}

double Clamp01(double value) {
  return std::clamp(value, 0.0, 1.0);
}

bool ParseQuality(const engine::Artifact& artifact, double& quality) {
  const auto it = artifact.attributes.find("quality");
  if (it == artifact.attributes.end() || it->second.empty()) {
    return false;
  }
  char* end = nullptr;
  quality = std::strtod(it->second.c_str(), &end);
  return end == it->second.c_str() + it->second.size() && std::isfinite(quality);
}

} // namespace

bool ValidateSyntheticWorkflowConfig(const SyntheticWorkflowConfig& config, std::string& error) {
  if (config.base_quality < 0.0 || config.base_quality > 1.0) {
    error = "base_quality must be in [0,1]";
    return false;
  }
  if (config.gain_per_hint < 0.0 || config.gain_per_prior < 0.0) {
    error = "quality gains must be non-negative";
    return false;
  }
  if (config.noise < 0.0 || config.noise > 0.5) {
    error = "noise must be in [0,0.5]";
    return false;
  }
  if (config.fail_percent > 100U) {
    error = "fail_percent must be in [0,100]";
    return false;
  }
  if (config.dimensions.empty()) {
    error = "at least one scoring dimension is required";
    return false;
  }
  error.clear();
  return true;
}

SyntheticWorkflow::SyntheticWorkflow(SyntheticWorkflowConfig config) : config_(std::move(config)) {
  if (!ValidateSyntheticWorkflowConfig(config_, config_error_) && config_error_.empty()) {
    config_error_ = "invalid synthetic workflow config";
  }
}

std::uint64_t SyntheticWorkflow::NextCall(const std::string& input) {
  std::lock_guard<std::mutex> lock(mu_);
  ++total_calls_;
  return calls_by_input_[input]++;
}

std::uint64_t SyntheticWorkflow::produce_calls() const {
  std::lock_guard<std::mutex> lock(mu_);
  return total_calls_;
}

bool SyntheticWorkflow::Produce(const std::string& input, const engine::ProduceContext& context,
                                engine::Artifact& artifact, std::string& error) {
  if (!config_error_.empty()) {
    error = config_error_;
    return false;
  }
  const std::uint64_t key = core::Fnv1a64(input) ^ config_.seed;
  const std::uint64_t call = NextCall(input);

  if (DeterministicPercentHit(key, call, config_.fail_percent)) {
    error = "synthetic produce failure (call " + std::to_string(call) + ")";
    return false;
  }

  const double jitter =
      (UnitInterval(SplitMix64((key ^ kNoiseSalt) + call * kSplitMixIncrement)) * 2.0 - 1.0) *
      config_.noise;
  const double quality =
      Clamp01(config_.base_quality +
              config_.gain_per_hint * static_cast<double>(context.hints.size()) +
              config_.gain_per_prior * static_cast<double>(context.prior_artifacts.size()) +
              jitter);

  artifact = engine::Artifact{};
  artifact.id = core::ToHex64(core::Fnv1a64(input + ":" + std::to_string(call), config_.seed));
  artifact.content = "synthetic artifact for '" + input + "' (call " + std::to_string(call) + ")";
  artifact.attributes["quality"] = core::FormatFixedDouble(quality, 6);
  artifact.attributes["hints"] = std::to_string(context.hints.size());
  if (!context.domain.empty()) {
    artifact.attributes["domain"] = context.domain;
  }
  error.clear();
  return true;
}

engine::ScoreResult SyntheticWorkflow::Score(const engine::Artifact& artifact) {
  if (!config_error_.empty()) {
    throw std::invalid_argument(config_error_);
  }
  double quality = 0.0;
  if (!ParseQuality(artifact, quality)) {
    throw std::invalid_argument("artifact " + artifact.id + " carries no valid quality attribute");
  }

  engine::ScoreResult result;
  result.overall = Clamp01(quality);

  std::vector<std::pair<double, std::string>> ranked;
  for (const auto& dimension : config_.dimensions) {
    const std::uint64_t mixed = SplitMix64(core::Fnv1a64(artifact.id + "/" + dimension));
    const double offset = (UnitInterval(mixed) * 2.0 - 1.0) * kDimensionSpread;
    const double value = Clamp01(quality + offset);
    result.dimensions[dimension] = value;
    ranked.emplace_back(value, dimension);

    if (value < kWeakDimension) {
      result.weaknesses.push_back(dimension);
    } else if (value >= kStrongDimension) {
      result.strengths.push_back(dimension);
    }
  }

  std::sort(ranked.begin(), ranked.end());
  for (const auto& [value, dimension] : ranked) {
    if (value < kStrongDimension) {
      result.recommendations.push_back("Strengthen " + dimension);
    }
  }
  if (result.recommendations.empty() && !ranked.empty()) {
    result.recommendations.push_back("Polish " + ranked.front().second);
  }
  return result;
}

} // namespace refinery::sim
