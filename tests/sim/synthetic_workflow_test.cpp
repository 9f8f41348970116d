#include "sim/synthetic_workflow.hpp"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>

using refinery::engine::Artifact;
using refinery::engine::ProduceContext;
using refinery::sim::SyntheticWorkflow;
using refinery::sim::SyntheticWorkflowConfig;

TEST_CASE("Same seed and call order reproduce artifacts and scores", "[sim]") {
  SyntheticWorkflow a(SyntheticWorkflowConfig{});
  SyntheticWorkflow b(SyntheticWorkflowConfig{});
  const ProduceContext context;

  for (int i = 0; i < 3; ++i) {
    Artifact left;
    Artifact right;
    std::string error;
    REQUIRE(a.Produce("input-a", context, left, error));
    REQUIRE(b.Produce("input-a", context, right, error));
    REQUIRE(left.id == right.id);
    REQUIRE(left.attributes == right.attributes);
    REQUIRE(a.Score(left).dimensions == b.Score(right).dimensions);
  }
  REQUIRE(a.produce_calls() == 3U);
}

TEST_CASE("Different seeds diverge", "[sim]") {
  SyntheticWorkflowConfig other;
  other.seed = 99;
  SyntheticWorkflow a(SyntheticWorkflowConfig{});
  SyntheticWorkflow b(other);

  Artifact left;
  Artifact right;
  std::string error;
  REQUIRE(a.Produce("input", ProduceContext{}, left, error));
  REQUIRE(b.Produce("input", ProduceContext{}, right, error));
  REQUIRE(left.id != right.id);
}

TEST_CASE("fail_percent 100 fails every produce call", "[sim]") {
  SyntheticWorkflowConfig config;
  config.fail_percent = 100;
  SyntheticWorkflow workflow(config);

  Artifact artifact;
  std::string error;
  REQUIRE_FALSE(workflow.Produce("x", ProduceContext{}, artifact, error));
  REQUIRE(error == "synthetic produce failure (call 0)");
  REQUIRE_FALSE(workflow.Produce("x", ProduceContext{}, artifact, error));
  REQUIRE(error == "synthetic produce failure (call 1)");
}

TEST_CASE("Hints and prior artifacts raise quality", "[sim]") {
  SyntheticWorkflowConfig config;
  config.noise = 0.0;
  SyntheticWorkflow workflow(config);

  Artifact bare;
  std::string error;
  REQUIRE(workflow.Produce("x", ProduceContext{}, bare, error));
  const double bare_score = workflow.Score(bare).overall;
  REQUIRE(bare_score > 0.449);
  REQUIRE(bare_score < 0.451);

  ProduceContext guided;
  guided.hints = {"Strengthen clarity", "Strengthen coverage"};
  guided.prior_artifacts.push_back(bare);
  guided.domain = "docs";
  Artifact refined;
  REQUIRE(workflow.Produce("x", guided, refined, error));
  REQUIRE(refined.attributes.at("hints") == "2");
  REQUIRE(refined.attributes.at("domain") == "docs");

  const double refined_score = workflow.Score(refined).overall;
  REQUIRE(refined_score > 0.609);
  REQUIRE(refined_score < 0.611);
}

TEST_CASE("Score derives dimensions near quality and tags weak ones", "[sim]") {
  SyntheticWorkflowConfig config;
  config.noise = 0.0;
  config.base_quality = 0.2;
  SyntheticWorkflow workflow(config);

  Artifact artifact;
  std::string error;
  REQUIRE(workflow.Produce("weak", ProduceContext{}, artifact, error));
  const auto score = workflow.Score(artifact);

  REQUIRE(score.dimensions.size() == 3U);
  for (const auto& [dimension, value] : score.dimensions) {
    REQUIRE(value >= 0.2 - 0.15 - 1e-9);
    REQUIRE(value <= 0.2 + 0.15 + 1e-9);
  }
  REQUIRE(score.weaknesses.size() == 3U);
  REQUIRE(score.strengths.empty());
  REQUIRE(score.recommendations.size() == 3U);
  REQUIRE(score.recommendations.front().rfind("Strengthen ", 0) == 0U);
}

TEST_CASE("Score rejects artifacts without a quality attribute", "[sim]") {
  SyntheticWorkflow workflow(SyntheticWorkflowConfig{});
  Artifact artifact;
  artifact.id = "foreign";
  REQUIRE_THROWS_AS(workflow.Score(artifact), std::invalid_argument);
}

TEST_CASE("Synthetic config validation names the bad knob", "[sim]") {
  std::string error;
  SyntheticWorkflowConfig config;
  REQUIRE(refinery::sim::ValidateSyntheticWorkflowConfig(config, error));

  config.fail_percent = 101;
  REQUIRE_FALSE(refinery::sim::ValidateSyntheticWorkflowConfig(config, error));
  REQUIRE(error == "fail_percent must be in [0,100]");

  config = SyntheticWorkflowConfig{};
  config.dimensions.clear();
  REQUIRE_FALSE(refinery::sim::ValidateSyntheticWorkflowConfig(config, error));
  REQUIRE(error == "at least one scoring dimension is required");
}

TEST_CASE("Workflow built from an invalid config refuses to produce or score", "[sim]") {
  SyntheticWorkflowConfig config;
  config.dimensions.clear();
  SyntheticWorkflow workflow(config);

  Artifact artifact;
  std::string error;
  REQUIRE_FALSE(workflow.Produce("input-a", ProduceContext{}, artifact, error));
  REQUIRE(error == "at least one scoring dimension is required");
  REQUIRE(workflow.produce_calls() == 0U);

  artifact.id = "handmade";
  artifact.attributes["quality"] = "0.900000";
  REQUIRE_THROWS_AS(workflow.Score(artifact), std::invalid_argument);
}
