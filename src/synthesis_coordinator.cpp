#include <adr/synthesis_coordinator.h>

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace adr {
namespace {

enum class CallState { kPending, kSucceeded, kFailed };

struct CallResult {
  CallState state = CallState::kPending;
  Narrative narrative;
  std::string error;
};

// Shared with detached call threads, which may outlive the coordinator.
struct CallBoard {
  std::mutex mutex;
  std::condition_variable changed;
  std::vector<CallResult> results;
};

struct RunningCall {
  std::size_t index = 0;
  std::chrono::steady_clock::time_point deadline;
};

std::string FormatScore(double value) {
  std::ostringstream stream;
  stream.setf(std::ios::fixed);
  stream.precision(3);
  stream << value;
  return stream.str();
}

void Launch(const std::shared_ptr<NarrativeSynthesizer> &synthesizer,
            const std::shared_ptr<CallBoard> &board, std::size_t index,
            EvidencePackage evidence) {
  std::thread([synthesizer, board, index,
               evidence = std::move(evidence)]() {
    CallResult result;
    try {
      result.narrative = synthesizer->Synthesize(evidence);
      result.state = CallState::kSucceeded;
    } catch (const std::exception &error) {
      result.state = CallState::kFailed;
      result.error = error.what();
    } catch (...) {
      // Nothing may escape a detached thread.
      result.state = CallState::kFailed;
      result.error = "synthesizer threw a non-standard exception";
    }
    {
      std::lock_guard<std::mutex> lock(board->mutex);
      board->results[index] = std::move(result);
    }
    board->changed.notify_all();
  }).detach();
}

} // namespace

EvidencePackage
BuildEvidencePackage(const CommitCluster &cluster,
                     const std::vector<CommitRecord> &commits,
                     const std::vector<CommitSemanticExtraction> &extractions,
                     const DecisionCategorizer &categorizer) {
  std::map<std::string, std::size_t> position;
  for (std::size_t i = 0; i < commits.size(); ++i) {
    position.emplace(commits[i].sha, i);
  }

  EvidencePackage evidence;
  std::vector<std::string> messages;
  std::vector<std::string> files;
  for (const auto &sha : cluster.commits) {
    const auto found = position.find(sha);
    if (found == position.end()) {
      throw std::invalid_argument("cluster member not in commit set: " + sha);
    }
    const auto &commit = commits[found->second];
    EvidenceCommit member;
    member.sha = commit.sha;
    member.author = commit.author;
    member.timestamp = commit.timestamp;
    member.message = commit.message;
    member.files = TouchedPaths(commit);
    if (found->second < extractions.size()) {
      member.extraction = extractions[found->second];
    }
    messages.push_back(commit.message);
    files.insert(files.end(), member.files.begin(), member.files.end());
    evidence.commits.push_back(std::move(member));
  }

  evidence.category = categorizer.Categorize(messages, files).category;
  evidence.cluster_id = DecisionId(
      cluster.commits.empty() ? std::string() : cluster.commits.front(),
      evidence.category);
  evidence.reasons = cluster.reasons;
  evidence.similarity_score = cluster.similarity_score;
  evidence.confidence = cluster.confidence;
  return evidence;
}

std::vector<AdrReference> BuildReferences(const EvidencePackage &evidence) {
  std::vector<AdrReference> references;
  std::set<std::string> files;
  for (const auto &commit : evidence.commits) {
    references.push_back({AdrReference::Kind::kCommit, commit.sha});
    files.insert(commit.files.begin(), commit.files.end());
  }
  for (const auto &file : files) {
    references.push_back({AdrReference::Kind::kFile, file});
  }
  return references;
}

std::vector<EvidenceEntry> BuildEvidence(const CommitCluster &cluster,
                                         const EvidencePackage &evidence) {
  std::vector<EvidenceEntry> entries;
  for (const auto &reason : cluster.reasons) {
    entries.push_back({ReasonKindName(reason.kind), "mean-score", reason.value,
                       "weighted contribution " +
                           FormatScore(reason.contribution)});
  }
  entries.push_back({"cluster", "similarity-score", cluster.similarity_score,
                     std::to_string(cluster.edge_count) + " internal edges"});
  entries.push_back({"cluster", "strongest-edge", cluster.strongest_edge, ""});
  entries.push_back({"cluster", "weakest-edge", cluster.weakest_edge, ""});
  entries.push_back({"cluster", "confidence", cluster.confidence, ""});
  for (const auto &commit : evidence.commits) {
    entries.push_back({"significance", "commit-significance",
                       commit.extraction.significance, commit.sha});
  }
  return entries;
}

SynthesisCoordinator::SynthesisCoordinator(
    std::shared_ptr<NarrativeSynthesizer> synthesizer, SynthesisConfig config,
    std::shared_ptr<Logger> logger)
    : synthesizer_(std::move(synthesizer)), config_(config),
      logger_(EnsureLogger(std::move(logger))) {
  if (!synthesizer_) {
    throw std::invalid_argument("narrative synthesizer must not be null");
  }
  if (config_.concurrency < 1) {
    throw std::invalid_argument("synthesis concurrency must be at least 1");
  }
}

SynthesisOutcome SynthesisCoordinator::Synthesize(
    const std::vector<CommitCluster> &clusters,
    const std::vector<CommitRecord> &commits,
    const std::vector<CommitSemanticExtraction> &extractions) const {
  std::vector<EvidencePackage> packages;
  packages.reserve(clusters.size());
  for (const auto &cluster : clusters) {
    packages.push_back(
        BuildEvidencePackage(cluster, commits, extractions, categorizer_));
  }

  auto board = std::make_shared<CallBoard>();
  board->results.resize(clusters.size());
  // Final per-cluster verdict; an empty optional marks a timeout.
  std::vector<std::optional<CallResult>> verdicts(clusters.size());
  std::vector<bool> timed_out(clusters.size(), false);

  std::vector<RunningCall> running;
  std::size_t next = 0;
  std::unique_lock<std::mutex> lock(board->mutex);
  while (next < clusters.size() || !running.empty()) {
    while (running.size() < config_.concurrency && next < clusters.size()) {
      running.push_back(
          {next, std::chrono::steady_clock::now() + config_.timeout});
      lock.unlock();
      Launch(synthesizer_, board, next, packages[next]);
      lock.lock();
      ++next;
    }

    const auto earliest =
        std::min_element(running.begin(), running.end(),
                         [](const RunningCall &first, const RunningCall &second) {
                           return first.deadline < second.deadline;
                         })
            ->deadline;
    board->changed.wait_until(lock, earliest, [&] {
      return std::any_of(running.begin(), running.end(),
                         [&](const RunningCall &call) {
                           return board->results[call.index].state !=
                                  CallState::kPending;
                         });
    });

    const auto now = std::chrono::steady_clock::now();
    auto retained = running.begin();
    for (auto call = running.begin(); call != running.end(); ++call) {
      auto &result = board->results[call->index];
      if (result.state != CallState::kPending) {
        verdicts[call->index] = std::move(result);
      } else if (now >= call->deadline) {
        timed_out[call->index] = true;
      } else {
        *retained++ = *call;
      }
    }
    running.erase(retained, running.end());
  }
  lock.unlock();

  SynthesisOutcome outcome;
  for (std::size_t i = 0; i < clusters.size(); ++i) {
    const auto &cluster_id = packages[i].cluster_id;
    std::string failure;
    if (timed_out[i]) {
      failure = "timed out after " + std::to_string(config_.timeout.count()) +
                "ms";
    } else if (verdicts[i]->state == CallState::kFailed) {
      failure = "failed";
      if (config_.verbose) {
        failure += ": " + verdicts[i]->error;
      }
    } else if (verdicts[i]->narrative.context.empty() ||
               verdicts[i]->narrative.decision.empty()) {
      failure = "returned an empty context or decision";
    }

    if (!failure.empty()) {
      ++outcome.failures;
      outcome.warnings.push_back("synthesis for cluster " + cluster_id + " " +
                                 failure);
      logger_->Log(LogLevel::kDebug, "Synthesis skipped cluster",
                   {{"cluster", cluster_id}, {"reason", failure}});
      continue;
    }

    auto &narrative = verdicts[i]->narrative;
    MinedDecision decision;
    decision.id = cluster_id;
    decision.category = packages[i].category;
    decision.title = Subject(narrative.decision);
    decision.cluster = clusters[i];
    decision.confidence = clusters[i].confidence;
    decision.adr.context = std::move(narrative.context);
    decision.adr.decision = std::move(narrative.decision);
    decision.adr.consequences = std::move(narrative.consequences);
    decision.adr.alternatives = std::move(narrative.alternatives);
    decision.adr.references = BuildReferences(packages[i]);
    decision.adr.evidence = BuildEvidence(clusters[i], packages[i]);
    outcome.decisions.push_back(std::move(decision));
  }
  return outcome;
}

} // namespace adr
