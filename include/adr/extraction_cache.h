#pragma once

#include <adr/logging.h>
#include <adr/models.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace adr {

struct ExtractionCacheOptions {
  bool enabled = false;
  bool clean = false;
  std::filesystem::path directory;
};

// Falls back to <root>/.adr/cache when no directory is configured.
std::filesystem::path
ResolveCacheDirectory(const ExtractionCacheOptions &options,
                      const std::filesystem::path &root);

std::string BuildExtractorSetKey(const std::vector<std::string> &names);

std::string SerializeExtraction(const CommitSemanticExtraction &extraction);
std::optional<CommitSemanticExtraction>
ParseExtraction(const std::string &sha, const std::string &text);

// One file per commit and extractor set. Safe to call from extraction
// workers: entries never share a path.
class ExtractionCache {
public:
  ExtractionCache(ExtractionCacheOptions options, std::filesystem::path root,
                  std::shared_ptr<Logger> logger);

  bool Enabled() const { return options_.enabled; }
  std::optional<CommitSemanticExtraction>
  Load(const std::string &sha, const std::string &extractor_key) const;
  void Store(const std::string &extractor_key,
             const CommitSemanticExtraction &extraction) const;
  void Clean() const;
  const std::filesystem::path &Directory() const { return directory_; }

private:
  std::filesystem::path CachePath(const std::string &sha,
                                  const std::string &extractor_key) const;

  ExtractionCacheOptions options_;
  std::filesystem::path directory_;
  std::shared_ptr<Logger> logger_;
};

} // namespace adr
