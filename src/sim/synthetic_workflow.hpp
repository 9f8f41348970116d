#pragma once

#include "engine/workflow.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace refinery::sim {

// Knobs for the synthetic produce/score pair.
//
// Quality of a produced artifact is
//   base_quality + gain_per_hint * hints + gain_per_prior * prior_artifacts
// plus seeded noise in [-noise, +noise], clamped to [0, 1].
struct SyntheticWorkflowConfig {
  std::uint64_t seed = 1;
  double base_quality = 0.45;
  double gain_per_hint = 0.05;
  double gain_per_prior = 0.06;
  double noise = 0.05;
  // Percentage of Produce calls that fail, 0..100.
  std::uint32_t fail_percent = 0;
  std::vector<std::string> dimensions = {"coverage", "consistency", "clarity"};
};

bool ValidateSyntheticWorkflowConfig(const SyntheticWorkflowConfig& config, std::string& error);

// Deterministic, model-free workflow for demos and end-to-end tests.
//
// Given the same seed and the same per-input call sequence, every artifact and
// score is reproducible. Safe for concurrent calls: the only mutable state is
// a per-input call counter behind a mutex, and each input is driven by one
// session at a time.
class SyntheticWorkflow final : public engine::IWorkflow {
public:
  // An invalid config is kept; Produce then fails with the validation error
  // and Score throws std::invalid_argument.
  explicit SyntheticWorkflow(SyntheticWorkflowConfig config);

  bool Produce(const std::string& input, const engine::ProduceContext& context,
               engine::Artifact& artifact, std::string& error) override;

  engine::ScoreResult Score(const engine::Artifact& artifact) override;

  std::uint64_t produce_calls() const;

private:
  std::uint64_t NextCall(const std::string& input);

  SyntheticWorkflowConfig config_;
  std::string config_error_;
  mutable std::mutex mu_;
  std::map<std::string, std::uint64_t> calls_by_input_;
  std::uint64_t total_calls_ = 0;
};

} // namespace refinery::sim
