#pragma once

#include <adr/models.h>
#include <adr/similarity_engine.h>

#include <cstddef>
#include <vector>

namespace adr {

struct ClusteringConfig {
  double similarity_floor = 0.3;
  double reason_floor = 0.05;
  std::size_t min_cluster_size = 2;
  double min_confidence = 0.5;
  // Pairs further apart than this many positions are not compared; 0 means
  // every pair.
  std::size_t max_lookback = 0;
  std::size_t jobs = 1;
};

ClusteringConfig MakeClusteringConfig(const MiningOptions &options);

struct ClusteringResult {
  std::vector<CommitCluster> clusters;
  std::size_t pairs_compared = 0;
  std::size_t edges_retained = 0;
  std::size_t components_formed = 0;
  std::size_t commits_clustered = 0;
  std::size_t discarded_by_size = 0;
  std::size_t discarded_by_confidence = 0;
};

class UnionFind {
public:
  explicit UnionFind(std::size_t size);

  std::size_t Find(std::size_t element);
  bool Union(std::size_t first, std::size_t second);

private:
  std::vector<std::size_t> parent_;
  std::vector<std::size_t> rank_;
};

class ClusteringEngine {
public:
  ClusteringEngine(SimilarityEngine similarity, ClusteringConfig config);

  // Surviving edges in (first, second) order with first < second.
  std::vector<SimilarityEdge>
  BuildEdges(const std::vector<CommitFeatures> &features) const;

  // commits and extractions are parallel vectors in walk order.
  ClusteringResult
  Cluster(const std::vector<CommitRecord> &commits,
          const std::vector<CommitSemanticExtraction> &extractions) const;

  const ClusteringConfig &Config() const { return config_; }
  const SimilarityEngine &Similarity() const { return similarity_; }

private:
  std::vector<ClusterReason>
  BuildReasons(const std::vector<SimilarityEdge> &edges) const;

  SimilarityEngine similarity_;
  ClusteringConfig config_;
};

// s + 0.25 * m * (1 - s): significance can close at most a quarter of the
// gap left by the similarity score.
double EstimateConfidence(double similarity_score, double mean_significance);

} // namespace adr
