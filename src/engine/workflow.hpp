#pragma once

#include <map>
#include <string>
#include <vector>

namespace refinery::engine {

// Opaque candidate produced for one input. The engine never interprets
// `content` or `attributes`; they travel from Produce to Score unchanged.
struct Artifact {
  std::string id;
  std::string content;
  std::map<std::string, std::string> attributes;
};

// Per-call context handed to Produce. Sessions append each scored artifact to
// `prior_artifacts` and replace the feedback part of `hints` between rounds.
struct ProduceContext {
  std::string data_type;
  std::string mode;
  std::string domain;
  std::vector<Artifact> prior_artifacts;
  std::vector<std::string> hints;
};

// Evaluation of one artifact. `overall` and every dimension are in [0,1].
struct ScoreResult {
  double overall = 0.0;
  std::map<std::string, double> dimensions;
  std::vector<std::string> strengths;
  std::vector<std::string> weaknesses;
  std::vector<std::string> recommendations;
};

// Produce/score capability pair the engine drives.
//
// Contract:
// - `Produce` returns false with `error` set when it cannot yield an artifact;
//   the session records that round as unsuccessful and moves on.
// - exceptions from either method are caught by the session per round.
// - the harness calls one instance from several threads at once, so
//   implementations must be safe for concurrent calls.
class IWorkflow {
public:
  virtual ~IWorkflow() = default;

  virtual bool Produce(const std::string& input, const ProduceContext& context,
                       Artifact& artifact, std::string& error) = 0;

  virtual ScoreResult Score(const Artifact& artifact) = 0;
};

} // namespace refinery::engine
