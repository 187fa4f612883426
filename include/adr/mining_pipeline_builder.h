#pragma once

#include <adr/cancellation.h>
#include <adr/component_registry.h>
#include <adr/extraction_cache.h>
#include <adr/interfaces.h>
#include <adr/logging.h>
#include <adr/mining_orchestrator.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace adr {

class MiningPipelineBuilder {
public:
  explicit MiningPipelineBuilder(const ComponentRegistry &registry);

  MiningPipelineBuilder &WithOptions(MiningOptions options);
  MiningPipelineBuilder &WithWalker(std::shared_ptr<HistoryWalker> walker);
  MiningPipelineBuilder &
  WithRevisionReader(std::shared_ptr<RevisionReader> reader);
  // Adds an extractor next to the registered ones.
  MiningPipelineBuilder &
  WithExtractor(std::shared_ptr<SemanticExtractor> extractor);
  // Restricts registered extractors to these names. Empty selects all.
  MiningPipelineBuilder &WithExtractorNames(std::vector<std::string> names);
  MiningPipelineBuilder &
  WithPatternData(std::shared_ptr<PatternDataSource> pattern_data);
  MiningPipelineBuilder &
  WithSynthesizer(std::shared_ptr<NarrativeSynthesizer> synthesizer);
  MiningPipelineBuilder &WithSynthesizerName(std::string name);
  MiningPipelineBuilder &WithLogger(std::shared_ptr<Logger> logger);
  MiningPipelineBuilder &WithCacheOptions(ExtractionCacheOptions options);
  MiningPipelineBuilder &WithCancellation(CancellationToken token);

  // Throws std::invalid_argument for invalid options or unknown component
  // names.
  std::unique_ptr<MiningOrchestrator> Build();

  const MiningOptions &Options() const { return options_; }

private:
  const ComponentRegistry *registry_;
  MiningOptions options_;
  std::shared_ptr<HistoryWalker> walker_;
  std::shared_ptr<RevisionReader> revision_reader_;
  std::vector<std::shared_ptr<SemanticExtractor>> extra_extractors_;
  std::optional<std::vector<std::string>> extractor_names_;
  std::shared_ptr<PatternDataSource> pattern_data_;
  std::shared_ptr<NarrativeSynthesizer> synthesizer_;
  std::string synthesizer_name_;
  std::shared_ptr<Logger> logger_;
  ExtractionCacheOptions cache_;
  CancellationToken cancellation_;
};

} // namespace adr
