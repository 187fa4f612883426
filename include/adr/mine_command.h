#pragma once

#include <adr/cancellation.h>
#include <adr/extraction_cache.h>
#include <adr/logging.h>
#include <adr/models.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace adr {

// Command-line and config-file settings before defaults are applied.
struct MineOptions {
  std::optional<std::filesystem::path> root;
  std::optional<std::filesystem::path> output_directory;
  std::optional<std::filesystem::path> config_file;
  std::optional<std::filesystem::path> cache_directory;
  std::optional<std::filesystem::path> pattern_data;
  std::optional<std::int64_t> since;
  std::optional<std::int64_t> until;
  std::optional<std::size_t> max_commits;
  std::optional<std::size_t> min_cluster_size;
  std::optional<double> min_confidence;
  std::optional<bool> include_merge_commits;
  std::vector<std::string> exclude_paths;
  std::optional<bool> use_pattern_data;
  std::optional<bool> verbose;
  std::vector<std::string> formats;
  std::optional<LogLevel> log_level;
  std::vector<std::string> extractors;
  std::optional<std::string> synthesizer;
  std::optional<std::string> reporter;
  std::optional<bool> enable_cache;
  std::optional<bool> clean_cache;
  std::optional<std::size_t> jobs;
  std::optional<std::size_t> synthesis_concurrency;
  std::optional<std::int64_t> synthesis_timeout_ms;
  std::optional<std::int64_t> temporal_horizon_seconds;
  std::optional<double> similarity_floor;
  std::optional<double> reason_floor;
  std::optional<std::size_t> max_lookback;
  std::optional<double> weight_temporal;
  std::optional<double> weight_file_overlap;
  std::optional<double> weight_pattern;
  bool show_help = false;
};

struct CacheCleanOptions {
  std::optional<std::filesystem::path> root;
  std::optional<std::filesystem::path> cache_directory;
  bool show_help = false;
};

const std::vector<std::string> &SupportedConfigKeys();

MineOptions ParseMineArguments(const std::vector<std::string> &arguments);
MineOptions ParseConfigFile(const std::filesystem::path &path);
MineOptions ParseConfigText(const std::string &yaml);
MineOptions MergeOptions(const MineOptions &config_options,
                         const MineOptions &cli_options);
MineOptions ResolveMineOptions(const MineOptions &cli_options);

MiningOptions BuildMiningOptions(const MineOptions &options,
                                 const std::filesystem::path &root);
ExtractionCacheOptions BuildCacheOptions(const MineOptions &options);

CacheCleanOptions
ParseCacheCleanArguments(const std::vector<std::string> &arguments);

int RunMine(const std::vector<std::string> &arguments,
            const CancellationToken &cancellation = CancellationToken());
int RunCacheClean(const std::vector<std::string> &arguments);
int RunCacheCommand(const std::vector<std::string> &arguments);

} // namespace adr
