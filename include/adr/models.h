#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace adr {

enum class FileStatus { kAdded, kModified, kDeleted, kTypeChanged };

struct FileChange {
  std::string path;
  FileStatus status = FileStatus::kModified;
  int additions = 0;
  int deletions = 0;
};

struct CommitRecord {
  std::string sha;
  std::vector<std::string> parents;
  std::string author;
  std::string author_email;
  std::int64_t timestamp = 0;
  std::string message;
  std::vector<FileChange> files;
  bool is_merge = false;
};

std::vector<std::string> TouchedPaths(const CommitRecord &commit);
std::string Subject(const std::string &message);

enum class ChangeKind { kAdded, kRemoved, kModified, kRenamed };

std::string ChangeKindName(ChangeKind kind);
std::optional<ChangeKind> ParseChangeKind(const std::string &name);

struct PatternChange {
  std::string id;
  ChangeKind kind = ChangeKind::kModified;
};

struct FunctionChange {
  std::string name;
  ChangeKind kind = ChangeKind::kModified;
  std::string previous_name;
};

struct CommitSemanticExtraction {
  std::string sha;
  std::vector<PatternChange> patterns;
  std::vector<FunctionChange> functions;
  std::map<std::string, ChangeKind> dependencies;
  std::set<std::string> message_signals;
  std::vector<std::string> architectural_signals;
  double significance = 0.0;
};

struct SimilarityEdge {
  std::size_t first = 0;
  std::size_t second = 0;
  double temporal_score = 0.0;
  double file_overlap_score = 0.0;
  double pattern_score = 0.0;
  double combined_score = 0.0;
};

enum class ReasonKind { kTemporalProximity, kFileOverlap, kPatternSimilarity };

std::string ReasonKindName(ReasonKind kind);

struct ClusterReason {
  ReasonKind kind = ReasonKind::kTemporalProximity;
  // Mean raw signal score across the cluster's internal edges.
  double value = 0.0;
  // Mean weighted share of the combined score.
  double contribution = 0.0;
};

struct CommitCluster {
  std::vector<std::string> commits;
  std::vector<ClusterReason> reasons;
  std::size_t edge_count = 0;
  double strongest_edge = 0.0;
  double weakest_edge = 0.0;
  double similarity_score = 0.0;
  double mean_significance = 0.0;
  double confidence = 0.0;
};

struct AdrReference {
  enum class Kind { kCommit, kFile };
  Kind kind = Kind::kCommit;
  std::string target;
};

struct EvidenceEntry {
  std::string signal;
  std::string metric;
  double value = 0.0;
  std::string detail;
};

struct SynthesizedAdr {
  std::string context;
  std::string decision;
  std::vector<std::string> consequences;
  std::vector<std::string> alternatives;
  std::vector<AdrReference> references;
  std::vector<EvidenceEntry> evidence;
};

struct MinedDecision {
  std::string id;
  std::string category;
  std::string title;
  CommitCluster cluster;
  SynthesizedAdr adr;
  double confidence = 0.0;
};

enum class MiningErrorKind { kGitError, kCancelled };

std::string MiningErrorKindName(MiningErrorKind kind);

struct MiningError {
  MiningErrorKind kind = MiningErrorKind::kGitError;
  std::string message;
};

struct MiningSummary {
  std::size_t commits_walked = 0;
  std::size_t commits_extracted = 0;
  std::size_t commits_clustered = 0;
  std::size_t clusters_formed = 0;
  std::size_t decisions_synthesized = 0;
  std::size_t discarded_by_threshold = 0;
  std::size_t synthesis_failures = 0;
  std::int64_t duration_ms = 0;
};

struct DecisionMiningResult {
  std::vector<MinedDecision> decisions;
  MiningSummary summary;
  std::vector<MiningError> errors;
  std::vector<std::string> warnings;
};

struct SimilarityWeights {
  double temporal = 1.0;
  double file_overlap = 1.0;
  double pattern = 1.0;
};

struct MiningOptions {
  std::string root_path = ".";
  std::optional<std::int64_t> since;
  std::optional<std::int64_t> until;
  std::size_t max_commits = 1000;
  std::size_t min_cluster_size = 2;
  double min_confidence = 0.5;
  bool include_merge_commits = false;
  std::vector<std::string> exclude_paths;
  bool use_pattern_data = false;
  bool verbose = false;

  SimilarityWeights weights;
  std::chrono::seconds temporal_horizon = std::chrono::hours(4);
  double similarity_floor = 0.3;
  double reason_floor = 0.05;
  std::size_t max_lookback = 0;
  std::size_t extraction_jobs = 1;
  std::size_t synthesis_concurrency = 4;
  std::chrono::milliseconds synthesis_timeout = std::chrono::seconds(60);
};

// Keeps steady_clock deadlines far from overflow.
constexpr std::chrono::milliseconds kMaxSynthesisTimeout =
    std::chrono::hours(24);

void ValidateMiningOptions(const MiningOptions &options);

struct WalkOptions {
  std::string root_path;
  std::optional<std::int64_t> since;
  std::optional<std::int64_t> until;
  std::size_t max_commits = 1000;
  bool include_merge_commits = false;
  std::vector<std::string> exclude_paths;
};

WalkOptions MakeWalkOptions(const MiningOptions &options);

struct EvidenceCommit {
  std::string sha;
  std::string author;
  std::int64_t timestamp = 0;
  std::string message;
  std::vector<std::string> files;
  CommitSemanticExtraction extraction;
};

struct EvidencePackage {
  std::string cluster_id;
  std::string category;
  std::vector<EvidenceCommit> commits;
  std::vector<ClusterReason> reasons;
  double similarity_score = 0.0;
  double confidence = 0.0;
};

struct Narrative {
  std::string context;
  std::string decision;
  std::vector<std::string> consequences;
  std::vector<std::string> alternatives;
};

struct Report {
  std::string markdown;
  std::string json;
};

struct ReportContext {
  std::string root_path;
  std::vector<std::string> formats;
};

} // namespace adr
