#include <adr/mining_orchestrator.h>

#include <adr/clustering_engine.h>
#include <adr/extraction_adapter.h>
#include <adr/pattern_data_source.h>
#include <adr/synthesis_coordinator.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <utility>

namespace adr {
namespace {

std::int64_t ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

} // namespace

std::string MiningStageName(MiningStage stage) {
  switch (stage) {
  case MiningStage::kIdle:
    return "idle";
  case MiningStage::kWalking:
    return "walking";
  case MiningStage::kExtracting:
    return "extracting";
  case MiningStage::kClustering:
    return "clustering";
  case MiningStage::kSynthesizing:
    return "synthesizing";
  case MiningStage::kDone:
    return "done";
  case MiningStage::kFailed:
    return "failed";
  }
  return "unknown";
}

MiningOrchestrator::MiningOrchestrator(MiningComponents components)
    : walker_(std::move(components.walker)),
      extractors_(std::move(components.extractors)),
      pattern_data_(std::move(components.pattern_data)),
      synthesizer_(std::move(components.synthesizer)),
      logger_(EnsureLogger(std::move(components.logger))),
      cache_(std::move(components.cache)),
      cancellation_(std::move(components.cancellation)) {
  if (!walker_) {
    throw std::invalid_argument("history walker must not be null");
  }
  if (!synthesizer_) {
    throw std::invalid_argument("narrative synthesizer must not be null");
  }
  for (const auto &extractor : extractors_) {
    if (!extractor) {
      throw std::invalid_argument("extractor must not be null");
    }
  }
}

void MiningOrchestrator::EnterStage(MiningStage stage) {
  stage_.store(stage);
  logger_->Log(LogLevel::kDebug, "mining.stage.enter",
               {{"stage", MiningStageName(stage)}});
}

bool MiningOrchestrator::CheckCancelled(DecisionMiningResult &result,
                                        MiningStage next) {
  if (!cancellation_.IsCancelled()) {
    return false;
  }
  result.errors.push_back({MiningErrorKind::kCancelled,
                           "mining cancelled before " +
                               MiningStageName(next)});
  logger_->Log(LogLevel::kWarn, "mining.cancelled",
               {{"before_stage", MiningStageName(next)}});
  stage_.store(MiningStage::kDone);
  return true;
}

std::shared_ptr<PatternDataSource>
MiningOrchestrator::ResolvePatternData(const MiningOptions &options,
                                       std::vector<std::string> &warnings) const {
  if (!options.use_pattern_data || pattern_data_) {
    return pattern_data_;
  }
  const auto path = DefaultPatternDataPath(options.root_path);
  try {
    return std::make_shared<TsvPatternDataSource>(
        TsvPatternDataSource::Load(path));
  } catch (const std::exception &error) {
    warnings.push_back("pattern data unavailable at " + path.string() + ": " +
                       error.what());
    return nullptr;
  }
}

DecisionMiningResult MiningOrchestrator::Mine(const MiningOptions &options) {
  ValidateMiningOptions(options);

  const auto start = std::chrono::steady_clock::now();
  DecisionMiningResult result;
  const auto finish = [&]() {
    result.summary.duration_ms = ElapsedMs(start);
    for (const auto &warning : result.warnings) {
      logger_->Log(LogLevel::kWarn, "mining.warning", {{"warning", warning}});
    }
    logger_->Log(
        LogLevel::kInfo, "mining.complete",
        {{"duration_ms", std::to_string(result.summary.duration_ms)},
         {"decisions", std::to_string(result.decisions.size())},
         {"errors", std::to_string(result.errors.size())},
         {"warnings", std::to_string(result.warnings.size())}});
    return std::move(result);
  };

  logger_->Log(LogLevel::kInfo, "mining.start",
               {{"root", options.root_path},
                {"max_commits", std::to_string(options.max_commits)},
                {"extractors", std::to_string(extractors_.size())}});

  if (CheckCancelled(result, MiningStage::kWalking)) {
    return finish();
  }
  EnterStage(MiningStage::kWalking);
  std::vector<CommitRecord> commits;
  try {
    commits = walker_->Walk(MakeWalkOptions(options));
  } catch (const std::exception &error) {
    stage_.store(MiningStage::kFailed);
    result.errors.push_back({MiningErrorKind::kGitError, error.what()});
    logger_->Log(LogLevel::kError, "mining.failed",
                 {{"stage", "walking"}, {"error", error.what()}});
    return finish();
  }
  result.summary.commits_walked = commits.size();
  logger_->Log(LogLevel::kInfo, "mining.stage.complete",
               {{"stage", "walking"},
                {"commits", std::to_string(commits.size())}});

  if (CheckCancelled(result, MiningStage::kExtracting)) {
    return finish();
  }
  EnterStage(MiningStage::kExtracting);
  std::shared_ptr<ExtractionCache> cache;
  if (cache_.enabled || cache_.clean) {
    try {
      cache = std::make_shared<ExtractionCache>(cache_, options.root_path,
                                                logger_);
      if (cache_.clean) {
        cache->Clean();
      }
    } catch (const std::exception &error) {
      result.warnings.push_back("extraction cache disabled: " +
                                std::string(error.what()));
      cache.reset();
    }
  }
  auto pattern_data = ResolvePatternData(options, result.warnings);
  ExtractionAdapterConfig adapter_config;
  adapter_config.use_pattern_data = pattern_data != nullptr;
  adapter_config.verbose = options.verbose;
  adapter_config.jobs = options.extraction_jobs;
  const ExtractionAdapter adapter(extractors_, pattern_data, cache,
                                  adapter_config, logger_);
  auto batch = adapter.ExtractAll(commits);
  result.summary.commits_extracted = batch.extractions.size();
  result.warnings.insert(result.warnings.end(), batch.warnings.begin(),
                         batch.warnings.end());
  logger_->Log(LogLevel::kInfo, "mining.stage.complete",
               {{"stage", "extracting"},
                {"commits", std::to_string(batch.extractions.size())},
                {"cache_hits", std::to_string(batch.cache_hits)},
                {"warnings", std::to_string(batch.warnings.size())}});

  if (CheckCancelled(result, MiningStage::kClustering)) {
    return finish();
  }
  EnterStage(MiningStage::kClustering);
  const ClusteringEngine clustering(
      SimilarityEngine(options.weights, options.temporal_horizon),
      MakeClusteringConfig(options));
  auto clustered = clustering.Cluster(commits, batch.extractions);
  result.summary.commits_clustered = clustered.commits_clustered;
  result.summary.clusters_formed = clustered.clusters.size();
  result.summary.discarded_by_threshold =
      clustered.discarded_by_size + clustered.discarded_by_confidence;
  logger_->Log(LogLevel::kInfo, "mining.stage.complete",
               {{"stage", "clustering"},
                {"pairs", std::to_string(clustered.pairs_compared)},
                {"edges", std::to_string(clustered.edges_retained)},
                {"clusters", std::to_string(clustered.clusters.size())},
                {"discarded",
                 std::to_string(result.summary.discarded_by_threshold)}});

  if (CheckCancelled(result, MiningStage::kSynthesizing)) {
    return finish();
  }
  EnterStage(MiningStage::kSynthesizing);
  SynthesisConfig synthesis_config;
  synthesis_config.concurrency = options.synthesis_concurrency;
  synthesis_config.timeout = options.synthesis_timeout;
  synthesis_config.verbose = options.verbose;
  const SynthesisCoordinator coordinator(synthesizer_, synthesis_config,
                                         logger_);
  auto synthesized =
      coordinator.Synthesize(clustered.clusters, commits, batch.extractions);
  result.summary.synthesis_failures = synthesized.failures;
  result.warnings.insert(result.warnings.end(), synthesized.warnings.begin(),
                         synthesized.warnings.end());

  for (auto &decision : synthesized.decisions) {
    if (decision.confidence < options.min_confidence) {
      ++result.summary.discarded_by_threshold;
      continue;
    }
    result.decisions.push_back(std::move(decision));
  }
  result.summary.decisions_synthesized = result.decisions.size();
  logger_->Log(LogLevel::kInfo, "mining.stage.complete",
               {{"stage", "synthesizing"},
                {"decisions", std::to_string(result.decisions.size())},
                {"failures", std::to_string(synthesized.failures)}});

  EnterStage(MiningStage::kDone);
  return finish();
}

} // namespace adr
