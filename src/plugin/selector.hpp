#ifndef CRUSH_SELECTOR_HPP
#define CRUSH_SELECTOR_HPP

#include "plugin/registry.hpp"

#include <optional>
#include <string>
#include <vector>

namespace crush {

// Relative importance of throughput and compression ratio. The pair need not
// sum to one; scoring normalises it.
struct ScoringWeights {
  double throughput_weight = 0.7;
  double ratio_weight = 0.3;

  // Throws CrushError(InvalidWeights) unless both weights are non-negative
  // and at least one is positive.
  static ScoringWeights create(double throughput_weight, double ratio_weight);

  void validate() const;
  ScoringWeights normalized() const;
};

// Process-wide default used when a caller supplies no weights.
void set_default_weights(const ScoringWeights &weights);
ScoringWeights default_weights();

// Score in [0, 1]: throughput is min-max normalised on a log scale, ratio is
// min-max normalised linearly with lower ratios scoring higher. A range of
// zero normalises to 1, so a single candidate always scores 1.
double calculate_score(const AlgorithmMetadata &candidate,
                       const std::vector<AlgorithmMetadata> &all,
                       const ScoringWeights &weights);

struct ScoredAlgorithm {
  AlgorithmMetadata metadata;
  double score = 0.0;
};

struct Selection {
  AlgorithmPtr algorithm;
  AlgorithmMetadata metadata;
  double score = 0.0;
  bool explicit_override = false;
};

class PluginSelector {
public:
  explicit PluginSelector(const PluginRegistry &registry,
                          ScoringWeights weights = default_weights());

  // Highest score wins; equal scores go to the lexically smallest name.
  // Throws EmptyRegistry when nothing is registered.
  Selection select() const;

  // No scoring. Throws AlgorithmNotFound if `name` is not registered.
  Selection select_by_name(const std::string &name) const;

  // select_by_name() when an override is given, else select().
  Selection select(const std::optional<std::string> &override_name) const;

  // Every algorithm with its score, best first.
  std::vector<ScoredAlgorithm> rank() const;

  const ScoringWeights &weights() const { return weights_; }

private:
  const PluginRegistry &registry_;
  ScoringWeights weights_;
};

} // namespace crush

#endif // CRUSH_SELECTOR_HPP
