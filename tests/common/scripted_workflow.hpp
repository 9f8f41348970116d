#ifndef REFINERY_TESTS_COMMON_SCRIPTED_WORKFLOW_HPP_
#define REFINERY_TESTS_COMMON_SCRIPTED_WORKFLOW_HPP_

#include "engine/workflow.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace refinery::tests::common {

// One scripted Produce/Score step. Steps are consumed per input in call order;
// the last step repeats once the script runs out.
struct ScriptedStep {
  double score = 0.0;
  bool produce_fails = false;
  bool produce_throws = false;
  bool score_throws = false;
  std::map<std::string, double> dimensions;
  std::vector<std::string> weaknesses;
  std::vector<std::string> recommendations;
};

class ScriptedWorkflow final : public engine::IWorkflow {
public:
  explicit ScriptedWorkflow(std::vector<ScriptedStep> script) : script_(std::move(script)) {}

  bool Produce(const std::string& input, const engine::ProduceContext& context,
               engine::Artifact& artifact, std::string& error) override {
    std::size_t step_index = 0;
    {
      std::lock_guard<std::mutex> lock(mu_);
      step_index = calls_[input]++;
      contexts_[input].push_back(context);
    }
    if (step_index >= script_.size()) {
      step_index = script_.size() - 1U;
    }

    const ScriptedStep& step = script_[step_index];
    if (step.produce_throws) {
      throw std::runtime_error("scripted produce exception");
    }
    if (step.produce_fails) {
      error = "scripted produce failure";
      return false;
    }
    artifact = engine::Artifact{};
    artifact.id = input + "#" + std::to_string(step_index);
    artifact.content = input;
    artifact.attributes["step"] = std::to_string(step_index);
    return true;
  }

  engine::ScoreResult Score(const engine::Artifact& artifact) override {
    const ScriptedStep& step = script_.at(std::stoul(artifact.attributes.at("step")));
    if (step.score_throws) {
      throw std::runtime_error("scripted score exception");
    }
    engine::ScoreResult result;
    result.overall = step.score;
    result.dimensions = step.dimensions;
    result.weaknesses = step.weaknesses;
    result.recommendations = step.recommendations;
    return result;
  }

  std::vector<engine::ProduceContext> ContextsFor(const std::string& input) const {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = contexts_.find(input);
    return it == contexts_.end() ? std::vector<engine::ProduceContext>{} : it->second;
  }

private:
  std::vector<ScriptedStep> script_;
  mutable std::mutex mu_;
  std::map<std::string, std::size_t> calls_;
  std::map<std::string, std::vector<engine::ProduceContext>> contexts_;
};

} // namespace refinery::tests::common

#endif // REFINERY_TESTS_COMMON_SCRIPTED_WORKFLOW_HPP_
