#include <adr/pattern_data_source.h>

#include <adr/escaping.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace adr {

std::filesystem::path DefaultPatternDataPath(const std::filesystem::path &root) {
  return root / ".adr" / "patterns.tsv";
}

TsvPatternDataSource::TsvPatternDataSource(
    std::map<std::string, std::vector<std::string>> patterns)
    : patterns_(std::move(patterns)) {}

TsvPatternDataSource TsvPatternDataSource::Load(
    const std::filesystem::path &path) {
  std::ifstream stream(path);
  if (!stream) {
    throw std::runtime_error("unable to read pattern data: " + path.string());
  }
  std::ostringstream contents;
  contents << stream.rdbuf();
  return Parse(contents.str());
}

TsvPatternDataSource TsvPatternDataSource::Parse(const std::string &text) {
  std::map<std::string, std::vector<std::string>> patterns;
  std::istringstream stream(text);
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(stream, line)) {
    ++line_number;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty() || line[0] == '#') {
      continue;
    }
    const auto fields = SplitEscaped(line);
    if (fields.size() != 2 || fields[0].empty() || fields[1].empty()) {
      throw std::runtime_error("malformed pattern data record on line " +
                               std::to_string(line_number));
    }
    auto &ids = patterns[fields[0]];
    if (std::find(ids.begin(), ids.end(), fields[1]) == ids.end()) {
      ids.push_back(fields[1]);
    }
  }
  return TsvPatternDataSource(std::move(patterns));
}

std::vector<std::string>
TsvPatternDataSource::PatternsForFile(const std::string &path) const {
  const auto found = patterns_.find(path);
  if (found == patterns_.end()) {
    return {};
  }
  return found->second;
}

} // namespace adr
