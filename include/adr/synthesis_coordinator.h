#pragma once

#include <adr/decision_categorizer.h>
#include <adr/interfaces.h>
#include <adr/logging.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace adr {

struct SynthesisConfig {
  std::size_t concurrency = 4;
  std::chrono::milliseconds timeout = std::chrono::seconds(60);
  bool verbose = false;
};

struct SynthesisOutcome {
  // In cluster order.
  std::vector<MinedDecision> decisions;
  std::vector<std::string> warnings;
  std::size_t failures = 0;
};

EvidencePackage
BuildEvidencePackage(const CommitCluster &cluster,
                     const std::vector<CommitRecord> &commits,
                     const std::vector<CommitSemanticExtraction> &extractions,
                     const DecisionCategorizer &categorizer);

// Commit pointers in membership order, then sorted unique file pointers.
std::vector<AdrReference> BuildReferences(const EvidencePackage &evidence);
std::vector<EvidenceEntry> BuildEvidence(const CommitCluster &cluster,
                                         const EvidencePackage &evidence);

// Each narrative call runs on its own thread. A call that outlives the
// timeout is abandoned: its thread is detached and keeps the evidence and
// synthesizer alive until it returns, but its result is discarded.
class SynthesisCoordinator {
public:
  SynthesisCoordinator(std::shared_ptr<NarrativeSynthesizer> synthesizer,
                       SynthesisConfig config, std::shared_ptr<Logger> logger);

  SynthesisOutcome
  Synthesize(const std::vector<CommitCluster> &clusters,
             const std::vector<CommitRecord> &commits,
             const std::vector<CommitSemanticExtraction> &extractions) const;

private:
  std::shared_ptr<NarrativeSynthesizer> synthesizer_;
  SynthesisConfig config_;
  std::shared_ptr<Logger> logger_;
  DecisionCategorizer categorizer_;
};

} // namespace adr
