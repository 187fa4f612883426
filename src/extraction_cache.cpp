#include <adr/extraction_cache.h>

#include <adr/escaping.h>

#include <fstream>
#include <functional>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace adr {
namespace {

constexpr const char kCacheHeader[] = "# adr extraction cache v1";

std::string FormatDouble(double value) {
  std::ostringstream stream;
  stream << std::setprecision(17) << value;
  return stream.str();
}

} // namespace

std::filesystem::path
ResolveCacheDirectory(const ExtractionCacheOptions &options,
                      const std::filesystem::path &root) {
  if (!options.directory.empty()) {
    return std::filesystem::weakly_canonical(options.directory);
  }
  return std::filesystem::weakly_canonical(root / ".adr" / "cache");
}

std::string BuildExtractorSetKey(const std::vector<std::string> &names) {
  std::string accumulator;
  for (const auto &name : names) {
    accumulator.append(name);
    accumulator.push_back('\n');
  }
  return std::to_string(std::hash<std::string>{}(accumulator));
}

std::string SerializeExtraction(const CommitSemanticExtraction &extraction) {
  std::ostringstream out;
  out << kCacheHeader << '\n';
  out << JoinEscaped({"significance", FormatDouble(extraction.significance)})
      << '\n';
  for (const auto &pattern : extraction.patterns) {
    out << JoinEscaped({"pattern", pattern.id, ChangeKindName(pattern.kind)})
        << '\n';
  }
  for (const auto &function : extraction.functions) {
    out << JoinEscaped({"function", function.name,
                        ChangeKindName(function.kind), function.previous_name})
        << '\n';
  }
  for (const auto &[name, kind] : extraction.dependencies) {
    out << JoinEscaped({"dependency", name, ChangeKindName(kind)}) << '\n';
  }
  for (const auto &signal : extraction.message_signals) {
    out << JoinEscaped({"message-signal", signal}) << '\n';
  }
  for (const auto &signal : extraction.architectural_signals) {
    out << JoinEscaped({"architectural-signal", signal}) << '\n';
  }
  return out.str();
}

std::optional<CommitSemanticExtraction>
ParseExtraction(const std::string &sha, const std::string &text) {
  std::istringstream stream(text);
  std::string line;
  if (!std::getline(stream, line) || line != kCacheHeader) {
    return std::nullopt;
  }

  CommitSemanticExtraction extraction;
  extraction.sha = sha;
  while (std::getline(stream, line)) {
    if (line.empty()) {
      continue;
    }
    const auto fields = SplitEscaped(line);
    const auto &tag = fields.front();
    if (tag == "significance" && fields.size() == 2) {
      try {
        extraction.significance = std::stod(fields[1]);
      } catch (const std::exception &) {
        return std::nullopt;
      }
    } else if (tag == "pattern" && fields.size() == 3) {
      const auto kind = ParseChangeKind(fields[2]);
      if (!kind) {
        return std::nullopt;
      }
      extraction.patterns.push_back({fields[1], *kind});
    } else if (tag == "function" && fields.size() == 4) {
      const auto kind = ParseChangeKind(fields[2]);
      if (!kind) {
        return std::nullopt;
      }
      extraction.functions.push_back({fields[1], *kind, fields[3]});
    } else if (tag == "dependency" && fields.size() == 3) {
      const auto kind = ParseChangeKind(fields[2]);
      if (!kind) {
        return std::nullopt;
      }
      extraction.dependencies.emplace(fields[1], *kind);
    } else if (tag == "message-signal" && fields.size() == 2) {
      extraction.message_signals.insert(fields[1]);
    } else if (tag == "architectural-signal" && fields.size() == 2) {
      extraction.architectural_signals.push_back(fields[1]);
    } else {
      return std::nullopt;
    }
  }
  return extraction;
}

ExtractionCache::ExtractionCache(ExtractionCacheOptions options,
                                 std::filesystem::path root,
                                 std::shared_ptr<Logger> logger)
    : options_(std::move(options)),
      directory_(ResolveCacheDirectory(options_, root)),
      logger_(EnsureLogger(std::move(logger))) {}

std::optional<CommitSemanticExtraction>
ExtractionCache::Load(const std::string &sha,
                      const std::string &extractor_key) const {
  if (!options_.enabled) {
    return std::nullopt;
  }
  const auto path = CachePath(sha, extractor_key);
  std::error_code error;
  if (!std::filesystem::exists(path, error)) {
    return std::nullopt;
  }

  std::ifstream stream(path);
  if (!stream) {
    logger_->Log(LogLevel::kWarn, "Failed to open extraction cache",
                 {{"path", path.string()}});
    return std::nullopt;
  }
  std::ostringstream contents;
  contents << stream.rdbuf();

  auto extraction = ParseExtraction(sha, contents.str());
  if (!extraction) {
    logger_->Log(LogLevel::kWarn, "Ignoring malformed extraction cache entry",
                 {{"path", path.string()}});
    return std::nullopt;
  }
  logger_->Log(LogLevel::kDebug, "Extraction cache hit",
               {{"sha", sha}, {"key", extractor_key}});
  return extraction;
}

void ExtractionCache::Store(const std::string &extractor_key,
                            const CommitSemanticExtraction &extraction) const {
  if (!options_.enabled) {
    return;
  }
  const auto path = CachePath(extraction.sha, extractor_key);
  std::error_code error;
  std::filesystem::create_directories(path.parent_path(), error);
  if (error) {
    logger_->Log(LogLevel::kWarn, "Failed to create extraction cache directory",
                 {{"path", path.parent_path().string()},
                  {"error", error.message()}});
    return;
  }
  std::ofstream stream(path, std::ios::trunc);
  if (!stream) {
    logger_->Log(LogLevel::kWarn, "Failed to write extraction cache",
                 {{"path", path.string()}});
    return;
  }
  stream << SerializeExtraction(extraction);
  logger_->Log(LogLevel::kDebug, "Persisted extraction cache entry",
               {{"path", path.string()}});
}

void ExtractionCache::Clean() const {
  std::error_code error;
  if (!std::filesystem::exists(directory_, error)) {
    return;
  }
  std::filesystem::remove_all(directory_, error);
  if (error) {
    throw std::runtime_error("failed to clear extraction cache at " +
                             directory_.string() + ": " + error.message());
  }
  logger_->Log(LogLevel::kInfo, "Cleared extraction cache",
               {{"directory", directory_.string()}});
}

std::filesystem::path
ExtractionCache::CachePath(const std::string &sha,
                           const std::string &extractor_key) const {
  return directory_ / ("extraction_" + sha + "_" + extractor_key + ".tsv");
}

} // namespace adr
