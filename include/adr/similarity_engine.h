#pragma once

#include <adr/models.h>

#include <chrono>
#include <set>
#include <string>

namespace adr {

// The per-commit view the engine compares: who, when, which files and
// which pattern ids.
struct CommitFeatures {
  std::string sha;
  std::int64_t timestamp = 0;
  std::set<std::string> files;
  std::set<std::string> patterns;
};

CommitFeatures BuildFeatures(const CommitRecord &commit,
                             const CommitSemanticExtraction &extraction);

double JaccardSimilarity(const std::set<std::string> &first,
                         const std::set<std::string> &second);

class SimilarityEngine {
public:
  explicit SimilarityEngine(
      SimilarityWeights weights = {},
      std::chrono::seconds temporal_horizon = std::chrono::hours(4));

  // exp(-ln(20) * |delta| / horizon): 1 at zero, 0.05 at the horizon.
  double TemporalScore(std::int64_t first, std::int64_t second) const;
  double FileOverlapScore(const CommitFeatures &first,
                          const CommitFeatures &second) const;
  double PatternScore(const CommitFeatures &first,
                      const CommitFeatures &second) const;
  double Combine(double temporal, double file_overlap, double pattern) const;

  // Indices of the returned edge are left at zero for the caller to fill.
  SimilarityEdge Score(const CommitFeatures &first,
                       const CommitFeatures &second) const;

  const SimilarityWeights &Weights() const { return weights_; }
  std::chrono::seconds TemporalHorizon() const { return temporal_horizon_; }

private:
  SimilarityWeights weights_;
  std::chrono::seconds temporal_horizon_;
};

SimilarityWeights NormalizeWeights(const SimilarityWeights &weights);

} // namespace adr
