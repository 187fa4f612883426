#include <adr/clustering_engine.h>

#include <adr/worker_pool.h>

#include <algorithm>
#include <map>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace adr {
namespace {

constexpr double kSignificanceBoost = 0.25;

double Mean(double sum, std::size_t count) {
  return count == 0 ? 0.0 : sum / static_cast<double>(count);
}

} // namespace

ClusteringConfig MakeClusteringConfig(const MiningOptions &options) {
  ClusteringConfig config;
  config.similarity_floor = options.similarity_floor;
  config.reason_floor = options.reason_floor;
  config.min_cluster_size = options.min_cluster_size;
  config.min_confidence = options.min_confidence;
  config.max_lookback = options.max_lookback;
  config.jobs = options.extraction_jobs;
  return config;
}

double EstimateConfidence(double similarity_score, double mean_significance) {
  const auto similarity = std::clamp(similarity_score, 0.0, 1.0);
  const auto significance = std::clamp(mean_significance, 0.0, 1.0);
  return std::clamp(similarity + kSignificanceBoost * significance *
                                     (1.0 - similarity),
                    0.0, 1.0);
}

UnionFind::UnionFind(std::size_t size) : parent_(size), rank_(size, 0) {
  std::iota(parent_.begin(), parent_.end(), std::size_t{0});
}

std::size_t UnionFind::Find(std::size_t element) {
  auto root = element;
  while (parent_[root] != root) {
    root = parent_[root];
  }
  while (parent_[element] != root) {
    const auto next = parent_[element];
    parent_[element] = root;
    element = next;
  }
  return root;
}

bool UnionFind::Union(std::size_t first, std::size_t second) {
  auto first_root = Find(first);
  auto second_root = Find(second);
  if (first_root == second_root) {
    return false;
  }
  if (rank_[first_root] < rank_[second_root]) {
    std::swap(first_root, second_root);
  }
  parent_[second_root] = first_root;
  if (rank_[first_root] == rank_[second_root]) {
    ++rank_[first_root];
  }
  return true;
}

ClusteringEngine::ClusteringEngine(SimilarityEngine similarity,
                                   ClusteringConfig config)
    : similarity_(std::move(similarity)), config_(config) {
  if (config_.min_cluster_size < 2) {
    throw std::invalid_argument("min_cluster_size must be at least 2");
  }
}

std::vector<SimilarityEdge>
ClusteringEngine::BuildEdges(const std::vector<CommitFeatures> &features) const {
  const auto count = features.size();
  std::vector<std::vector<SimilarityEdge>> rows(count);

  ParallelFor(count, config_.jobs, [&](std::size_t i) {
    auto last = count;
    if (config_.max_lookback > 0) {
      last = std::min(count, i + 1 + config_.max_lookback);
    }
    for (std::size_t j = i + 1; j < last; ++j) {
      auto edge = similarity_.Score(features[i], features[j]);
      if (edge.combined_score < config_.similarity_floor) {
        continue;
      }
      edge.first = i;
      edge.second = j;
      rows[i].push_back(edge);
    }
  });

  std::vector<SimilarityEdge> edges;
  for (auto &row : rows) {
    edges.insert(edges.end(), row.begin(), row.end());
  }
  return edges;
}

std::vector<ClusterReason>
ClusteringEngine::BuildReasons(const std::vector<SimilarityEdge> &edges) const {
  double temporal = 0.0;
  double file_overlap = 0.0;
  double pattern = 0.0;
  for (const auto &edge : edges) {
    temporal += edge.temporal_score;
    file_overlap += edge.file_overlap_score;
    pattern += edge.pattern_score;
  }

  const auto &weights = similarity_.Weights();
  const std::vector<ClusterReason> candidates = {
      {ReasonKind::kTemporalProximity, Mean(temporal, edges.size()),
       weights.temporal * Mean(temporal, edges.size())},
      {ReasonKind::kFileOverlap, Mean(file_overlap, edges.size()),
       weights.file_overlap * Mean(file_overlap, edges.size())},
      {ReasonKind::kPatternSimilarity, Mean(pattern, edges.size()),
       weights.pattern * Mean(pattern, edges.size())}};

  std::vector<ClusterReason> reasons;
  for (const auto &candidate : candidates) {
    if (candidate.contribution > config_.reason_floor) {
      reasons.push_back(candidate);
    }
  }
  std::stable_sort(reasons.begin(), reasons.end(),
                   [](const ClusterReason &left, const ClusterReason &right) {
                     return left.contribution > right.contribution;
                   });
  return reasons;
}

ClusteringResult ClusteringEngine::Cluster(
    const std::vector<CommitRecord> &commits,
    const std::vector<CommitSemanticExtraction> &extractions) const {
  if (commits.size() != extractions.size()) {
    throw std::invalid_argument(
        "every commit needs exactly one extraction to be clustered");
  }

  std::vector<CommitFeatures> features;
  features.reserve(commits.size());
  for (std::size_t i = 0; i < commits.size(); ++i) {
    features.push_back(BuildFeatures(commits[i], extractions[i]));
  }

  ClusteringResult result;
  const auto count = commits.size();
  if (config_.max_lookback == 0 || config_.max_lookback >= count) {
    result.pairs_compared = count < 2 ? 0 : count * (count - 1) / 2;
  } else {
    for (std::size_t i = 0; i < count; ++i) {
      result.pairs_compared += std::min(config_.max_lookback, count - i - 1);
    }
  }

  const auto edges = BuildEdges(features);
  result.edges_retained = edges.size();

  UnionFind components(count);
  for (const auto &edge : edges) {
    components.Union(edge.first, edge.second);
  }

  // Keyed by the smallest member index so clusters come out in walk order.
  std::map<std::size_t, std::vector<std::size_t>> members_by_root;
  std::vector<std::size_t> root_to_first(count, count);
  for (std::size_t i = 0; i < count; ++i) {
    const auto root = components.Find(i);
    if (root_to_first[root] == count) {
      root_to_first[root] = i;
    }
    members_by_root[root_to_first[root]].push_back(i);
  }

  std::map<std::size_t, std::vector<SimilarityEdge>> edges_by_component;
  for (const auto &edge : edges) {
    edges_by_component[root_to_first[components.Find(edge.first)]].push_back(
        edge);
  }

  for (const auto &[first_member, members] : members_by_root) {
    if (members.size() < 2) {
      continue;
    }
    if (members.size() < config_.min_cluster_size) {
      ++result.discarded_by_size;
      continue;
    }
    ++result.components_formed;

    const auto &internal_edges = edges_by_component[first_member];
    CommitCluster cluster;
    cluster.edge_count = internal_edges.size();
    cluster.weakest_edge = 1.0;
    double similarity_sum = 0.0;
    for (const auto &edge : internal_edges) {
      similarity_sum += edge.combined_score;
      cluster.strongest_edge =
          std::max(cluster.strongest_edge, edge.combined_score);
      cluster.weakest_edge = std::min(cluster.weakest_edge, edge.combined_score);
    }
    cluster.similarity_score = Mean(similarity_sum, internal_edges.size());

    double significance_sum = 0.0;
    for (const auto member : members) {
      cluster.commits.push_back(commits[member].sha);
      significance_sum += extractions[member].significance;
    }
    cluster.mean_significance = Mean(significance_sum, members.size());
    cluster.reasons = BuildReasons(internal_edges);
    cluster.confidence =
        EstimateConfidence(cluster.similarity_score, cluster.mean_significance);

    if (cluster.confidence < config_.min_confidence) {
      ++result.discarded_by_confidence;
      continue;
    }
    result.commits_clustered += members.size();
    result.clusters.push_back(std::move(cluster));
  }
  return result;
}

} // namespace adr
