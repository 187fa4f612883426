#include <adr/models.h>

#include <cmath>
#include <stdexcept>

namespace adr {

std::vector<std::string> TouchedPaths(const CommitRecord &commit) {
  std::vector<std::string> paths;
  paths.reserve(commit.files.size());
  for (const auto &file : commit.files) {
    paths.push_back(file.path);
  }
  return paths;
}

std::string Subject(const std::string &message) {
  const auto end = message.find('\n');
  auto subject = message.substr(0, end);
  while (!subject.empty() &&
         (subject.back() == '\r' || subject.back() == ' ')) {
    subject.pop_back();
  }
  return subject;
}

std::string ChangeKindName(ChangeKind kind) {
  switch (kind) {
  case ChangeKind::kAdded:
    return "added";
  case ChangeKind::kRemoved:
    return "removed";
  case ChangeKind::kModified:
    return "modified";
  case ChangeKind::kRenamed:
    return "renamed";
  }
  return "unknown";
}

std::optional<ChangeKind> ParseChangeKind(const std::string &name) {
  for (const auto kind : {ChangeKind::kAdded, ChangeKind::kRemoved,
                          ChangeKind::kModified, ChangeKind::kRenamed}) {
    if (ChangeKindName(kind) == name) {
      return kind;
    }
  }
  return std::nullopt;
}

std::string ReasonKindName(ReasonKind kind) {
  switch (kind) {
  case ReasonKind::kTemporalProximity:
    return "temporal-proximity";
  case ReasonKind::kFileOverlap:
    return "file-overlap";
  case ReasonKind::kPatternSimilarity:
    return "pattern-similarity";
  }
  return "unknown";
}

std::string MiningErrorKindName(MiningErrorKind kind) {
  switch (kind) {
  case MiningErrorKind::kGitError:
    return "git-error";
  case MiningErrorKind::kCancelled:
    return "cancelled";
  }
  return "unknown";
}

void ValidateMiningOptions(const MiningOptions &options) {
  const auto within_unit = [](double value) {
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
  };
  if (options.min_cluster_size < 2) {
    throw std::invalid_argument("min_cluster_size must be at least 2");
  }
  if (!within_unit(options.min_confidence)) {
    throw std::invalid_argument("min_confidence must be within [0, 1]");
  }
  if (!within_unit(options.similarity_floor)) {
    throw std::invalid_argument("similarity_floor must be within [0, 1]");
  }
  if (!within_unit(options.reason_floor)) {
    throw std::invalid_argument("reason_floor must be within [0, 1]");
  }
  const auto &weights = options.weights;
  for (const auto weight :
       {weights.temporal, weights.file_overlap, weights.pattern}) {
    if (!std::isfinite(weight) || weight < 0.0) {
      throw std::invalid_argument(
          "similarity weights must be finite and not negative");
    }
  }
  if (weights.temporal + weights.file_overlap + weights.pattern <= 0.0) {
    throw std::invalid_argument("at least one similarity weight must be "
                                "positive");
  }
  if (options.temporal_horizon.count() <= 0) {
    throw std::invalid_argument("temporal_horizon must be positive");
  }
  if (options.extraction_jobs < 1) {
    throw std::invalid_argument("extraction_jobs must be at least 1");
  }
  if (options.synthesis_concurrency < 1) {
    throw std::invalid_argument("synthesis_concurrency must be at least 1");
  }
  if (options.synthesis_timeout.count() <= 0 ||
      options.synthesis_timeout > kMaxSynthesisTimeout) {
    throw std::invalid_argument(
        "synthesis_timeout must be positive and at most 24 hours");
  }
  if (options.since && options.until && *options.since > *options.until) {
    throw std::invalid_argument("since must not be later than until");
  }
}

WalkOptions MakeWalkOptions(const MiningOptions &options) {
  WalkOptions walk;
  walk.root_path = options.root_path;
  walk.since = options.since;
  walk.until = options.until;
  walk.max_commits = options.max_commits;
  walk.include_merge_commits = options.include_merge_commits;
  walk.exclude_paths = options.exclude_paths;
  return walk;
}

} // namespace adr
