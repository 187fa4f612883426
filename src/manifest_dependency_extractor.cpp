#include <adr/manifest_dependency_extractor.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace adr {
namespace {

constexpr double kDependencyWeight = 0.2;
constexpr double kBuildSystemWeight = 0.2;

std::string FileName(const std::string &path) {
  return std::filesystem::path(path).filename().string();
}

std::string Trim(const std::string &value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

std::string StripQuotes(std::string value) {
  value = Trim(value);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

std::vector<std::string> Lines(const std::string &contents) {
  std::vector<std::string> lines;
  std::istringstream stream(contents);
  std::string line;
  while (std::getline(stream, line)) {
    lines.push_back(line);
  }
  return lines;
}

// Text between the bracket following `key` and its matching close.
std::string JsonBlock(const std::string &contents, const std::string &key,
                      char open, char close) {
  const auto key_position = contents.find("\"" + key + "\"");
  if (key_position == std::string::npos) {
    return {};
  }
  const auto start = contents.find(open, key_position);
  if (start == std::string::npos) {
    return {};
  }
  int depth = 0;
  for (auto i = start; i < contents.size(); ++i) {
    if (contents[i] == open) {
      ++depth;
    } else if (contents[i] == close && --depth == 0) {
      return contents.substr(start + 1, i - start - 1);
    }
  }
  return {};
}

DeclaredDependencies ParsePackageJson(const std::string &contents) {
  static const std::regex kEntry(R"re("([^"]+)"\s*:\s*"([^"]*)")re");
  DeclaredDependencies dependencies;
  for (const auto *section :
       {"dependencies", "devDependencies", "peerDependencies",
        "optionalDependencies"}) {
    const auto block = JsonBlock(contents, section, '{', '}');
    for (std::sregex_iterator it(block.begin(), block.end(), kEntry), end;
         it != end; ++it) {
      dependencies.emplace((*it)[1].str(), (*it)[2].str());
    }
  }
  return dependencies;
}

DeclaredDependencies ParseRequirements(const std::string &contents) {
  DeclaredDependencies dependencies;
  for (auto line : Lines(contents)) {
    line = Trim(line.substr(0, line.find('#')));
    if (line.empty() || line[0] == '-') {
      continue;
    }
    const auto split = line.find_first_of("=<>!~[; ");
    const auto name = Trim(line.substr(0, split));
    if (name.empty()) {
      continue;
    }
    auto version = split == std::string::npos ? std::string()
                                              : Trim(line.substr(split));
    if (!version.empty() && version[0] == '[') {
      version = Trim(version.substr(version.find(']') + 1));
    }
    dependencies.emplace(name, version);
  }
  return dependencies;
}

DeclaredDependencies ParseGoMod(const std::string &contents) {
  DeclaredDependencies dependencies;
  bool in_block = false;
  for (auto line : Lines(contents)) {
    line = Trim(line.substr(0, line.find("//")));
    if (line.empty()) {
      continue;
    }
    if (in_block) {
      if (line == ")") {
        in_block = false;
        continue;
      }
    } else if (line.rfind("require (", 0) == 0 || line == "require(") {
      in_block = true;
      continue;
    } else if (line.rfind("require ", 0) == 0) {
      line = Trim(line.substr(8));
    } else {
      continue;
    }
    std::istringstream words(line);
    std::string module;
    std::string version;
    words >> module >> version;
    if (!module.empty()) {
      dependencies.emplace(module, version);
    }
  }
  return dependencies;
}

DeclaredDependencies ParseCargoToml(const std::string &contents) {
  static const std::regex kVersion(R"re(version\s*=\s*"([^"]*)")re");
  DeclaredDependencies dependencies;
  bool in_section = false;
  for (auto line : Lines(contents)) {
    line = Trim(line.substr(0, line.find('#')));
    if (line.empty()) {
      continue;
    }
    if (line.front() == '[') {
      in_section = line == "[dependencies]" || line == "[dev-dependencies]" ||
                   line == "[build-dependencies]" ||
                   (line.find("dependencies]") != std::string::npos &&
                    line.rfind("[target.", 0) == 0);
      continue;
    }
    if (!in_section) {
      continue;
    }
    const auto equals = line.find('=');
    if (equals == std::string::npos) {
      continue;
    }
    const auto name = StripQuotes(line.substr(0, equals));
    const auto value = Trim(line.substr(equals + 1));
    std::string version;
    std::smatch match;
    if (!value.empty() && value.front() == '{') {
      if (std::regex_search(value, match, kVersion)) {
        version = match[1].str();
      }
    } else {
      version = StripQuotes(value);
    }
    if (!name.empty()) {
      dependencies.emplace(name, version);
    }
  }
  return dependencies;
}

DeclaredDependencies ParseCMakeLists(const std::string &contents) {
  static const std::regex kFindPackage(
      R"(find_package\s*\(\s*([A-Za-z0-9_.+-]+)\s*([0-9][0-9.]*)?)",
      std::regex::icase);
  DeclaredDependencies dependencies;
  for (std::sregex_iterator it(contents.begin(), contents.end(), kFindPackage),
       end;
       it != end; ++it) {
    dependencies.emplace((*it)[1].str(), (*it)[2].str());
  }
  return dependencies;
}

DeclaredDependencies ParseVcpkgJson(const std::string &contents) {
  static const std::regex kObject(R"re(\{[^{}]*\})re");
  static const std::regex kName(R"re("name"\s*:\s*"([^"]+)")re");
  static const std::regex kVersion(R"re("version>=?"\s*:\s*"([^"]*)")re");
  static const std::regex kString(R"re("([^"]+)")re");
  DeclaredDependencies dependencies;
  const auto block = JsonBlock(contents, "dependencies", '[', ']');
  for (std::sregex_iterator it(block.begin(), block.end(), kObject), end;
       it != end; ++it) {
    const auto object = it->str();
    std::smatch name;
    if (std::regex_search(object, name, kName)) {
      std::smatch version;
      dependencies.emplace(name[1].str(),
                           std::regex_search(object, version, kVersion)
                               ? version[1].str()
                               : std::string());
    }
  }
  const auto plain = std::regex_replace(block, kObject, "");
  for (std::sregex_iterator it(plain.begin(), plain.end(), kString), end;
       it != end; ++it) {
    dependencies.emplace((*it)[1].str(), "");
  }
  return dependencies;
}

DeclaredDependencies ParseConanfile(const std::string &contents) {
  DeclaredDependencies dependencies;
  bool in_requires = false;
  for (auto line : Lines(contents)) {
    line = Trim(line.substr(0, line.find('#')));
    if (line.empty()) {
      continue;
    }
    if (line.front() == '[') {
      in_requires = line == "[requires]" || line == "[tool_requires]" ||
                    line == "[build_requires]";
      continue;
    }
    if (!in_requires) {
      continue;
    }
    // name/version@user/channel
    const auto reference = line.substr(0, line.find('@'));
    const auto slash = reference.find('/');
    const auto name = Trim(reference.substr(0, slash));
    const auto version = slash == std::string::npos
                             ? std::string()
                             : Trim(reference.substr(slash + 1));
    if (!name.empty()) {
      dependencies.emplace(name, version);
    }
  }
  return dependencies;
}

} // namespace

bool IsManifestPath(const std::string &path) {
  static const std::vector<std::string> kManifests = {
      "package.json", "requirements.txt", "go.mod",       "Cargo.toml",
      "CMakeLists.txt", "vcpkg.json",     "conanfile.txt"};
  const auto name = FileName(path);
  return std::find(kManifests.begin(), kManifests.end(), name) !=
         kManifests.end();
}

DeclaredDependencies ParseManifest(const std::string &path,
                                   const std::string &contents) {
  const auto name = FileName(path);
  if (name == "package.json") {
    return ParsePackageJson(contents);
  }
  if (name == "requirements.txt") {
    return ParseRequirements(contents);
  }
  if (name == "go.mod") {
    return ParseGoMod(contents);
  }
  if (name == "Cargo.toml") {
    return ParseCargoToml(contents);
  }
  if (name == "CMakeLists.txt") {
    return ParseCMakeLists(contents);
  }
  if (name == "vcpkg.json") {
    return ParseVcpkgJson(contents);
  }
  if (name == "conanfile.txt") {
    return ParseConanfile(contents);
  }
  throw ExtractionError("not a dependency manifest: " + path);
}

ManifestDependencyExtractor::ManifestDependencyExtractor(
    std::shared_ptr<RevisionReader> reader)
    : reader_(std::move(reader)) {
  if (!reader_) {
    throw std::invalid_argument("revision reader must not be null");
  }
}

bool ManifestDependencyExtractor::CanHandle(const std::string &path) const {
  return IsManifestPath(path);
}

DeclaredDependencies
ManifestDependencyExtractor::Declared(const std::string &revision,
                                      const std::string &path) const {
  const auto contents = reader_->Read(revision, path);
  if (!contents) {
    return {};
  }
  return ParseManifest(path, *contents);
}

CommitSemanticExtraction
ManifestDependencyExtractor::Extract(const CommitRecord &commit) const {
  CommitSemanticExtraction extraction;
  extraction.sha = commit.sha;
  const auto parent =
      commit.parents.empty() ? std::string() : commit.parents.front();

  bool build_system_change = false;
  for (const auto &file : commit.files) {
    if (!CanHandle(file.path)) {
      continue;
    }
    const auto before = file.status == FileStatus::kAdded
                            ? DeclaredDependencies{}
                            : Declared(parent, file.path);
    const auto after = file.status == FileStatus::kDeleted
                           ? DeclaredDependencies{}
                           : Declared(commit.sha, file.path);

    for (const auto &[name, version] : after) {
      const auto found = before.find(name);
      if (found == before.end()) {
        extraction.dependencies.emplace(name, ChangeKind::kAdded);
      } else if (found->second != version) {
        extraction.dependencies.emplace(name, ChangeKind::kModified);
      }
    }
    for (const auto &[name, version] : before) {
      if (after.count(name) == 0) {
        extraction.dependencies.emplace(name, ChangeKind::kRemoved);
      }
    }
    if (FileName(file.path) == "CMakeLists.txt" ||
        file.status == FileStatus::kAdded ||
        file.status == FileStatus::kDeleted) {
      build_system_change = true;
    }
  }

  const auto has_kind = [&](ChangeKind kind) {
    return std::any_of(extraction.dependencies.begin(),
                       extraction.dependencies.end(),
                       [&](const auto &entry) { return entry.second == kind; });
  };
  if (has_kind(ChangeKind::kAdded)) {
    extraction.architectural_signals.push_back("dependency-added");
  }
  if (has_kind(ChangeKind::kRemoved)) {
    extraction.architectural_signals.push_back("dependency-removed");
  }
  if (build_system_change) {
    extraction.architectural_signals.push_back("build-system-change");
  }

  extraction.significance = std::min(
      1.0, kDependencyWeight * static_cast<double>(extraction.dependencies.size()) +
               (build_system_change ? kBuildSystemWeight : 0.0));
  return extraction;
}

} // namespace adr
