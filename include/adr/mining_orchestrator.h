#pragma once

#include <adr/cancellation.h>
#include <adr/extraction_cache.h>
#include <adr/interfaces.h>
#include <adr/logging.h>

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace adr {

enum class MiningStage {
  kIdle,
  kWalking,
  kExtracting,
  kClustering,
  kSynthesizing,
  kDone,
  kFailed
};

std::string MiningStageName(MiningStage stage);

struct MiningComponents {
  std::shared_ptr<HistoryWalker> walker;
  std::vector<std::shared_ptr<SemanticExtractor>> extractors;
  // Loaded from <root>/.adr/patterns.tsv when pattern data is requested and
  // none is supplied.
  std::shared_ptr<PatternDataSource> pattern_data;
  std::shared_ptr<NarrativeSynthesizer> synthesizer;
  std::shared_ptr<Logger> logger;
  ExtractionCacheOptions cache;
  CancellationToken cancellation;
};

class MiningOrchestrator : public DecisionMiner {
public:
  explicit MiningOrchestrator(MiningComponents components);

  // Throws std::invalid_argument for invalid options before any stage runs.
  // Stage failures are reported in the result.
  DecisionMiningResult Mine(const MiningOptions &options) override;

  MiningStage Stage() const { return stage_.load(); }
  const CancellationToken &Cancellation() const { return cancellation_; }

private:
  void EnterStage(MiningStage stage);
  bool CheckCancelled(DecisionMiningResult &result, MiningStage next);
  std::shared_ptr<PatternDataSource>
  ResolvePatternData(const MiningOptions &options,
                     std::vector<std::string> &warnings) const;

  std::shared_ptr<HistoryWalker> walker_;
  std::vector<std::shared_ptr<SemanticExtractor>> extractors_;
  std::shared_ptr<PatternDataSource> pattern_data_;
  std::shared_ptr<NarrativeSynthesizer> synthesizer_;
  std::shared_ptr<Logger> logger_;
  ExtractionCacheOptions cache_;
  CancellationToken cancellation_;
  std::atomic<MiningStage> stage_{MiningStage::kIdle};
};

} // namespace adr
