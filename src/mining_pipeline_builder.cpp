#include <adr/mining_pipeline_builder.h>

#include <adr/git_history_walker.h>

#include <stdexcept>
#include <utility>

namespace adr {

MiningPipelineBuilder::MiningPipelineBuilder(const ComponentRegistry &registry)
    : registry_(&registry),
      synthesizer_name_(registry.DefaultSynthesizerName()) {}

MiningPipelineBuilder &MiningPipelineBuilder::WithOptions(MiningOptions options) {
  options_ = std::move(options);
  return *this;
}

MiningPipelineBuilder &
MiningPipelineBuilder::WithWalker(std::shared_ptr<HistoryWalker> walker) {
  walker_ = std::move(walker);
  return *this;
}

MiningPipelineBuilder &MiningPipelineBuilder::WithRevisionReader(
    std::shared_ptr<RevisionReader> reader) {
  revision_reader_ = std::move(reader);
  return *this;
}

MiningPipelineBuilder &MiningPipelineBuilder::WithExtractor(
    std::shared_ptr<SemanticExtractor> extractor) {
  if (!extractor) {
    throw std::invalid_argument("extractor must not be null");
  }
  extra_extractors_.push_back(std::move(extractor));
  return *this;
}

MiningPipelineBuilder &
MiningPipelineBuilder::WithExtractorNames(std::vector<std::string> names) {
  extractor_names_ = std::move(names);
  return *this;
}

MiningPipelineBuilder &MiningPipelineBuilder::WithPatternData(
    std::shared_ptr<PatternDataSource> pattern_data) {
  pattern_data_ = std::move(pattern_data);
  return *this;
}

MiningPipelineBuilder &MiningPipelineBuilder::WithSynthesizer(
    std::shared_ptr<NarrativeSynthesizer> synthesizer) {
  synthesizer_ = std::move(synthesizer);
  return *this;
}

MiningPipelineBuilder &
MiningPipelineBuilder::WithSynthesizerName(std::string name) {
  synthesizer_name_ = std::move(name);
  return *this;
}

MiningPipelineBuilder &
MiningPipelineBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  logger_ = std::move(logger);
  return *this;
}

MiningPipelineBuilder &
MiningPipelineBuilder::WithCacheOptions(ExtractionCacheOptions options) {
  cache_ = std::move(options);
  return *this;
}

MiningPipelineBuilder &
MiningPipelineBuilder::WithCancellation(CancellationToken token) {
  cancellation_ = std::move(token);
  return *this;
}

std::unique_ptr<MiningOrchestrator> MiningPipelineBuilder::Build() {
  ValidateMiningOptions(options_);

  MiningComponents components;
  components.logger = EnsureLogger(logger_);
  components.walker =
      walker_ ? walker_ : std::make_shared<GitHistoryWalker>(components.logger);

  ExtractorContext context;
  context.root_path = options_.root_path;
  context.revision_reader =
      revision_reader_
          ? revision_reader_
          : std::make_shared<GitRevisionReader>(options_.root_path);
  context.logger = components.logger;

  const auto names = extractor_names_ && !extractor_names_->empty()
                         ? *extractor_names_
                         : registry_->ExtractorNames();
  for (const auto &name : names) {
    components.extractors.push_back(registry_->CreateExtractor(name, context));
  }
  components.extractors.insert(components.extractors.end(),
                               extra_extractors_.begin(),
                               extra_extractors_.end());

  components.pattern_data = pattern_data_;
  components.synthesizer =
      synthesizer_ ? synthesizer_
                   : std::shared_ptr<NarrativeSynthesizer>(
                         registry_->CreateSynthesizer(synthesizer_name_));
  components.cache = cache_;
  components.cancellation = cancellation_;
  return std::make_unique<MiningOrchestrator>(std::move(components));
}

} // namespace adr
