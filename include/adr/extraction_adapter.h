#pragma once

#include <adr/extraction_cache.h>
#include <adr/interfaces.h>
#include <adr/logging.h>

#include <cstddef>
#include <exception>
#include <memory>
#include <string>
#include <vector>

namespace adr {

struct ExtractionAdapterConfig {
  bool use_pattern_data = false;
  // Adds the exception text to extractor failure warnings.
  bool verbose = false;
  std::size_t jobs = 1;
};

struct ExtractionBatch {
  // Parallel to the input commits.
  std::vector<CommitSemanticExtraction> extractions;
  std::vector<std::string> warnings;
  std::size_t cache_hits = 0;
};

class ExtractionAdapter {
public:
  ExtractionAdapter(std::vector<std::shared_ptr<SemanticExtractor>> extractors,
                    std::shared_ptr<PatternDataSource> pattern_data,
                    std::shared_ptr<ExtractionCache> cache,
                    ExtractionAdapterConfig config,
                    std::shared_ptr<Logger> logger);

  CommitSemanticExtraction Extract(const CommitRecord &commit,
                                   std::vector<std::string> &warnings) const;
  ExtractionBatch ExtractAll(const std::vector<CommitRecord> &commits) const;

  std::vector<std::string> ExtractorNames() const;

private:
  CommitSemanticExtraction ExtractCached(const CommitRecord &commit,
                                         std::vector<std::string> &warnings,
                                         bool &cache_hit) const;
  CommitSemanticExtraction RunExtractors(const CommitRecord &commit,
                                         std::vector<std::string> &warnings) const;
  void AppendPatternData(const CommitRecord &commit,
                         CommitSemanticExtraction &extraction,
                         std::vector<std::string> &warnings) const;
  void Warn(const std::string &warning, const std::string &sha,
            const std::string &source, const std::exception &error,
            std::vector<std::string> &warnings) const;

  std::vector<std::shared_ptr<SemanticExtractor>> extractors_;
  std::shared_ptr<PatternDataSource> pattern_data_;
  std::shared_ptr<ExtractionCache> cache_;
  ExtractionAdapterConfig config_;
  std::shared_ptr<Logger> logger_;
  std::string extractor_key_;
};

// Folds `part` into `merged`: lists concatenate, the first dependency entry
// wins, message signals union and significance keeps the maximum.
void MergeExtraction(CommitSemanticExtraction &merged,
                     const CommitSemanticExtraction &part);

} // namespace adr
