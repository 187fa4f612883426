#include <adr/similarity_engine.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace adr {
namespace {

// ln(20): the decay reaches 0.05 exactly at the horizon.
constexpr double kDecayAtHorizon = 2.995732273553991;

double Clip(double value) { return std::clamp(value, 0.0, 1.0); }

} // namespace

CommitFeatures BuildFeatures(const CommitRecord &commit,
                             const CommitSemanticExtraction &extraction) {
  CommitFeatures features;
  features.sha = commit.sha;
  features.timestamp = commit.timestamp;
  for (const auto &file : commit.files) {
    features.files.insert(file.path);
  }
  for (const auto &pattern : extraction.patterns) {
    features.patterns.insert(pattern.id);
  }
  return features;
}

double JaccardSimilarity(const std::set<std::string> &first,
                         const std::set<std::string> &second) {
  if (first.empty() || second.empty()) {
    return 0.0;
  }
  std::size_t intersection = 0;
  auto left = first.begin();
  auto right = second.begin();
  while (left != first.end() && right != second.end()) {
    if (*left < *right) {
      ++left;
    } else if (*right < *left) {
      ++right;
    } else {
      ++intersection;
      ++left;
      ++right;
    }
  }
  const auto union_size = first.size() + second.size() - intersection;
  return static_cast<double>(intersection) / static_cast<double>(union_size);
}

SimilarityWeights NormalizeWeights(const SimilarityWeights &weights) {
  if (weights.temporal < 0.0 || weights.file_overlap < 0.0 ||
      weights.pattern < 0.0) {
    throw std::invalid_argument("similarity weights must not be negative");
  }
  const auto total = weights.temporal + weights.file_overlap + weights.pattern;
  if (total <= 0.0) {
    throw std::invalid_argument(
        "at least one similarity weight must be positive");
  }
  return SimilarityWeights{weights.temporal / total,
                           weights.file_overlap / total,
                           weights.pattern / total};
}

SimilarityEngine::SimilarityEngine(SimilarityWeights weights,
                                   std::chrono::seconds temporal_horizon)
    : weights_(NormalizeWeights(weights)),
      temporal_horizon_(temporal_horizon) {
  if (temporal_horizon_.count() <= 0) {
    throw std::invalid_argument("temporal horizon must be positive");
  }
}

double SimilarityEngine::TemporalScore(std::int64_t first,
                                       std::int64_t second) const {
  const auto delta = first > second ? first - second : second - first;
  const auto ratio = static_cast<double>(delta) /
                     static_cast<double>(temporal_horizon_.count());
  return Clip(std::exp(-kDecayAtHorizon * ratio));
}

double SimilarityEngine::FileOverlapScore(const CommitFeatures &first,
                                          const CommitFeatures &second) const {
  return JaccardSimilarity(first.files, second.files);
}

double SimilarityEngine::PatternScore(const CommitFeatures &first,
                                      const CommitFeatures &second) const {
  return JaccardSimilarity(first.patterns, second.patterns);
}

double SimilarityEngine::Combine(double temporal, double file_overlap,
                                 double pattern) const {
  return Clip(weights_.temporal * temporal +
              weights_.file_overlap * file_overlap +
              weights_.pattern * pattern);
}

SimilarityEdge SimilarityEngine::Score(const CommitFeatures &first,
                                       const CommitFeatures &second) const {
  SimilarityEdge edge;
  if (!first.sha.empty() && first.sha == second.sha) {
    edge.temporal_score = 1.0;
    edge.file_overlap_score = 1.0;
    edge.pattern_score = 1.0;
    edge.combined_score = 1.0;
    return edge;
  }
  edge.temporal_score = TemporalScore(first.timestamp, second.timestamp);
  edge.file_overlap_score = FileOverlapScore(first, second);
  edge.pattern_score = PatternScore(first, second);
  edge.combined_score = Combine(edge.temporal_score, edge.file_overlap_score,
                                edge.pattern_score);
  return edge;
}

} // namespace adr
