#include "plugin/selector.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <mutex>
#include <sstream>

namespace crush {

namespace {

constexpr double RANGE_EPSILON = 1e-9;

std::mutex default_weights_mutex;
ScoringWeights process_default_weights;

double normalise(double value, double min, double max) {
  if (std::abs(max - min) < RANGE_EPSILON)
    return 1.0;
  return (value - min) / (max - min);
}

} // namespace

ScoringWeights ScoringWeights::create(double throughput_weight,
                                      double ratio_weight) {
  ScoringWeights weights{throughput_weight, ratio_weight};
  weights.validate();
  return weights;
}

void ScoringWeights::validate() const {
  if (!(throughput_weight >= 0.0) || !(ratio_weight >= 0.0)) {
    std::ostringstream oss;
    oss << "Scoring weights cannot be negative (throughput="
        << throughput_weight << ", ratio=" << ratio_weight << ")";
    throw CrushError(ErrorKind::InvalidWeights, oss.str());
  }
  if (throughput_weight + ratio_weight <= 0.0) {
    throw CrushError(ErrorKind::InvalidWeights,
                     "At least one scoring weight must be greater than zero");
  }
}

ScoringWeights ScoringWeights::normalized() const {
  validate();
  double sum = throughput_weight + ratio_weight;
  return ScoringWeights{throughput_weight / sum, ratio_weight / sum};
}

void set_default_weights(const ScoringWeights &weights) {
  weights.validate();
  std::lock_guard<std::mutex> lock(default_weights_mutex);
  process_default_weights = weights;
}

ScoringWeights default_weights() {
  std::lock_guard<std::mutex> lock(default_weights_mutex);
  return process_default_weights;
}

double calculate_score(const AlgorithmMetadata &candidate,
                       const std::vector<AlgorithmMetadata> &all,
                       const ScoringWeights &weights) {
  if (all.empty())
    return 0.0;
  if (all.size() == 1)
    return 1.0;

  ScoringWeights w = weights.normalized();

  double min_log_tp = std::numeric_limits<double>::infinity();
  double max_log_tp = -std::numeric_limits<double>::infinity();
  double min_ratio = std::numeric_limits<double>::infinity();
  double max_ratio = -std::numeric_limits<double>::infinity();
  for (const auto &meta : all) {
    double log_tp = std::log(meta.throughput_mbps);
    min_log_tp = std::min(min_log_tp, log_tp);
    max_log_tp = std::max(max_log_tp, log_tp);
    min_ratio = std::min(min_ratio, meta.compression_ratio);
    max_ratio = std::max(max_ratio, meta.compression_ratio);
  }

  double norm_tp =
      normalise(std::log(candidate.throughput_mbps), min_log_tp, max_log_tp);
  // Lower ratio is better, so invert: max ratio -> 0, min ratio -> 1
  double norm_ratio =
      std::abs(max_ratio - min_ratio) < RANGE_EPSILON
          ? 1.0
          : (max_ratio - candidate.compression_ratio) / (max_ratio - min_ratio);

  return w.throughput_weight * norm_tp + w.ratio_weight * norm_ratio;
}

PluginSelector::PluginSelector(const PluginRegistry &registry,
                               ScoringWeights weights)
    : registry_(registry), weights_(weights) {
  weights_.validate();
}

std::vector<ScoredAlgorithm> PluginSelector::rank() const {
  auto all = registry_.list();

  std::vector<ScoredAlgorithm> scored;
  scored.reserve(all.size());
  for (const auto &meta : all)
    scored.push_back(ScoredAlgorithm{meta, calculate_score(meta, all, weights_)});

  std::sort(scored.begin(), scored.end(),
            [](const ScoredAlgorithm &a, const ScoredAlgorithm &b) {
              if (a.score != b.score)
                return a.score > b.score;
              return a.metadata.name < b.metadata.name;
            });
  return scored;
}

Selection PluginSelector::select() const {
  auto entries = registry_.entries();
  if (entries.empty()) {
    throw CrushError(ErrorKind::EmptyRegistry,
                     "No compression algorithms are registered; call "
                     "init_plugins() first");
  }

  std::vector<AlgorithmMetadata> all;
  all.reserve(entries.size());
  for (const auto &entry : entries)
    all.push_back(entry.metadata);

  // entries() is ordered by name, so a strict comparison keeps the
  // lexically smallest name on a tie.
  const PluginRegistry::Entry *best = nullptr;
  double best_score = -std::numeric_limits<double>::infinity();
  for (const auto &entry : entries) {
    double score = calculate_score(entry.metadata, all, weights_);
    LOG(LogLevel::TRACE, LogComponent::PLUGIN_SELECTOR,
        "Score for '" << entry.metadata.name << "': " << score);
    if (score > best_score) {
      best_score = score;
      best = &entry;
    }
  }

  LOG(LogLevel::DEBUG, LogComponent::PLUGIN_SELECTOR,
      "Selected '" << best->metadata.name << "' with score " << best_score
                   << " (weights " << weights_.throughput_weight << "/"
                   << weights_.ratio_weight << ")");
  return Selection{best->algorithm, best->metadata, best_score, false};
}

Selection PluginSelector::select_by_name(const std::string &name) const {
  for (const auto &entry : registry_.entries()) {
    if (entry.metadata.name == name) {
      LOG(LogLevel::DEBUG, LogComponent::PLUGIN_SELECTOR,
          "Using explicitly requested algorithm '" << name << "'");
      return Selection{entry.algorithm, entry.metadata, 1.0, true};
    }
  }

  std::ostringstream available;
  bool first = true;
  for (const auto &meta : registry_.list()) {
    available << (first ? "" : ", ") << meta.name;
    first = false;
  }
  throw CrushError(ErrorKind::AlgorithmNotFound,
                   "Algorithm '" + name + "' not found. Available: " +
                       (first ? std::string("none") : available.str()));
}

Selection
PluginSelector::select(const std::optional<std::string> &override_name) const {
  if (override_name)
    return select_by_name(*override_name);
  return select();
}

} // namespace crush
