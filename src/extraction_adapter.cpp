#include <adr/extraction_adapter.h>

#include <adr/worker_pool.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <optional>
#include <set>
#include <stdexcept>
#include <utility>

namespace adr {

void MergeExtraction(CommitSemanticExtraction &merged,
                     const CommitSemanticExtraction &part) {
  merged.patterns.insert(merged.patterns.end(), part.patterns.begin(),
                         part.patterns.end());
  merged.functions.insert(merged.functions.end(), part.functions.begin(),
                          part.functions.end());
  for (const auto &[name, kind] : part.dependencies) {
    merged.dependencies.emplace(name, kind);
  }
  merged.message_signals.insert(part.message_signals.begin(),
                                part.message_signals.end());
  merged.architectural_signals.insert(merged.architectural_signals.end(),
                                      part.architectural_signals.begin(),
                                      part.architectural_signals.end());
  merged.significance =
      std::max(merged.significance, std::clamp(part.significance, 0.0, 1.0));
}

ExtractionAdapter::ExtractionAdapter(
    std::vector<std::shared_ptr<SemanticExtractor>> extractors,
    std::shared_ptr<PatternDataSource> pattern_data,
    std::shared_ptr<ExtractionCache> cache, ExtractionAdapterConfig config,
    std::shared_ptr<Logger> logger)
    : extractors_(std::move(extractors)),
      pattern_data_(std::move(pattern_data)), cache_(std::move(cache)),
      config_(config), logger_(EnsureLogger(std::move(logger))) {
  for (const auto &extractor : extractors_) {
    if (!extractor) {
      throw std::invalid_argument("extractor must not be null");
    }
  }
  if (config_.use_pattern_data && !pattern_data_) {
    throw std::invalid_argument(
        "pattern data requested without a pattern data source");
  }
  std::stable_sort(extractors_.begin(), extractors_.end(),
                   [](const auto &first, const auto &second) {
                     return first->Name() < second->Name();
                   });
  extractor_key_ = BuildExtractorSetKey(ExtractorNames());
}

std::vector<std::string> ExtractionAdapter::ExtractorNames() const {
  std::vector<std::string> names;
  names.reserve(extractors_.size());
  for (const auto &extractor : extractors_) {
    names.push_back(extractor->Name());
  }
  return names;
}

void ExtractionAdapter::Warn(const std::string &warning,
                             const std::string &sha, const std::string &source,
                             const std::exception &error,
                             std::vector<std::string> &warnings) const {
  auto text = warning;
  if (config_.verbose) {
    text += ": " + std::string(error.what());
  }
  logger_->Log(LogLevel::kDebug, "Extractor failed",
               {{"sha", sha}, {"extractor", source}, {"error", error.what()}});
  warnings.push_back(std::move(text));
}

CommitSemanticExtraction
ExtractionAdapter::RunExtractors(const CommitRecord &commit,
                                 std::vector<std::string> &warnings) const {
  CommitSemanticExtraction merged;
  merged.sha = commit.sha;

  const auto paths = TouchedPaths(commit);
  for (const auto &extractor : extractors_) {
    // CanHandle belongs to the extractor too; a throw there is its failure.
    try {
      const auto handles = std::any_of(
          paths.begin(), paths.end(),
          [&](const std::string &path) { return extractor->CanHandle(path); });
      if (!handles) {
        continue;
      }
      MergeExtraction(merged, extractor->Extract(commit));
    } catch (const std::exception &error) {
      Warn("extractor '" + extractor->Name() + "' failed on commit " +
               commit.sha,
           commit.sha, extractor->Name(), error, warnings);
    }
  }
  return merged;
}

void ExtractionAdapter::AppendPatternData(
    const CommitRecord &commit, CommitSemanticExtraction &extraction,
    std::vector<std::string> &warnings) const {
  if (!config_.use_pattern_data) {
    return;
  }
  std::set<std::string> appended;
  for (const auto &file : commit.files) {
    try {
      for (const auto &id : pattern_data_->PatternsForFile(file.path)) {
        if (appended.insert(id).second) {
          extraction.patterns.push_back({id, ChangeKind::kModified});
        }
      }
    } catch (const std::exception &error) {
      Warn("pattern data lookup failed for " + file.path + " on commit " +
               commit.sha,
           commit.sha, "pattern-data", error, warnings);
    }
  }
}

CommitSemanticExtraction
ExtractionAdapter::Extract(const CommitRecord &commit,
                           std::vector<std::string> &warnings) const {
  bool cache_hit = false;
  return ExtractCached(commit, warnings, cache_hit);
}

CommitSemanticExtraction
ExtractionAdapter::ExtractCached(const CommitRecord &commit,
                                 std::vector<std::string> &warnings,
                                 bool &cache_hit) const {
  std::optional<CommitSemanticExtraction> cached;
  if (cache_ && cache_->Enabled()) {
    cached = cache_->Load(commit.sha, extractor_key_);
  }

  CommitSemanticExtraction extraction;
  cache_hit = cached.has_value();
  if (cached) {
    extraction = std::move(*cached);
  } else {
    const auto warnings_before = warnings.size();
    extraction = RunExtractors(commit, warnings);
    if (cache_ && warnings.size() == warnings_before) {
      cache_->Store(extractor_key_, extraction);
    }
  }
  AppendPatternData(commit, extraction, warnings);
  return extraction;
}

ExtractionBatch
ExtractionAdapter::ExtractAll(const std::vector<CommitRecord> &commits) const {
  std::vector<CommitSemanticExtraction> extractions(commits.size());
  std::vector<std::vector<std::string>> warnings(commits.size());
  std::atomic<std::size_t> cache_hits{0};

  ParallelFor(commits.size(), config_.jobs, [&](std::size_t index) {
    bool cache_hit = false;
    extractions[index] =
        ExtractCached(commits[index], warnings[index], cache_hit);
    if (cache_hit) {
      ++cache_hits;
    }
  });

  ExtractionBatch batch;
  batch.extractions = std::move(extractions);
  batch.cache_hits = cache_hits.load();
  for (auto &commit_warnings : warnings) {
    for (auto &warning : commit_warnings) {
      batch.warnings.push_back(std::move(warning));
    }
  }
  return batch;
}

} // namespace adr
