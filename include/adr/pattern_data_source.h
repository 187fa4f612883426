#pragma once

#include <adr/interfaces.h>

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace adr {

std::filesystem::path DefaultPatternDataPath(const std::filesystem::path &root);

// Pattern ids recorded per file, one `path<TAB>pattern-id` record per line.
// Lines starting with '#' are comments.
class TsvPatternDataSource : public PatternDataSource {
public:
  TsvPatternDataSource() = default;
  explicit TsvPatternDataSource(
      std::map<std::string, std::vector<std::string>> patterns);

  // Throws std::runtime_error when the file cannot be read or a record is
  // malformed.
  static TsvPatternDataSource Load(const std::filesystem::path &path);
  static TsvPatternDataSource Parse(const std::string &text);

  std::vector<std::string>
  PatternsForFile(const std::string &path) const override;
  std::size_t FileCount() const { return patterns_.size(); }

private:
  std::map<std::string, std::vector<std::string>> patterns_;
};

} // namespace adr
