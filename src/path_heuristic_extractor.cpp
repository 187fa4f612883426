#include <adr/path_heuristic_extractor.h>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <map>
#include <set>
#include <vector>

namespace adr {
namespace {

constexpr std::size_t kNewModuleFileCount = 3;
constexpr double kSignalWeight = 0.1;
constexpr double kKeywordWeight = 0.1;
constexpr double kMaxChurnScore = 0.5;

std::vector<std::string> PathComponents(const std::string &path) {
  std::vector<std::string> components;
  for (const auto &part : std::filesystem::path(path)) {
    components.push_back(part.string());
  }
  return components;
}

std::string FileName(const std::string &path) {
  return std::filesystem::path(path).filename().string();
}

std::string Directory(const std::string &path) {
  return std::filesystem::path(path).parent_path().string();
}

bool IsModuleEntryPoint(const std::string &path) {
  static const std::set<std::string> kEntryPoints = {
      "index.ts",       "index.js",    "mod.rs",   "lib.rs",
      "__init__.py",    "CMakeLists.txt", "package.json", "go.mod",
      "Cargo.toml"};
  return !Directory(path).empty() && kEntryPoints.count(FileName(path)) != 0;
}

void AddSignal(CommitSemanticExtraction &extraction, const std::string &signal) {
  auto &signals = extraction.architectural_signals;
  if (std::find(signals.begin(), signals.end(), signal) == signals.end()) {
    signals.push_back(signal);
  }
}

} // namespace

std::string LayerPattern(const std::string &path) {
  static const std::set<std::string> kSourceRoots = {
      "src", "lib", "include", "app", "pkg", "packages", "internal", "crates"};
  const auto components = PathComponents(path);
  if (components.size() < 2) {
    return {};
  }
  if (kSourceRoots.count(components[0]) != 0 && components.size() >= 3) {
    return "layer:" + components[0] + "/" + components[1];
  }
  return "layer:" + components[0];
}

bool IsTestPath(const std::string &path) {
  for (const auto &component : PathComponents(path)) {
    if (component == "test" || component == "tests" || component == "spec" ||
        component == "__tests__") {
      return true;
    }
  }
  const auto name = FileName(path);
  return name.find("_test.") != std::string::npos ||
         name.rfind("test_", 0) == 0 ||
         name.find(".test.") != std::string::npos ||
         name.find(".spec.") != std::string::npos;
}

bool IsBuildConfigPath(const std::string &path) {
  static const std::set<std::string> kBuildFiles = {
      "CMakeLists.txt", "Makefile",     "meson.build",  "BUILD",
      "BUILD.bazel",    "WORKSPACE",    "configure.ac", "package.json",
      "Cargo.toml",     "go.mod",       "pom.xml",      "build.gradle",
      "setup.py",       "pyproject.toml", "vcpkg.json", "conanfile.txt"};
  const auto name = FileName(path);
  return kBuildFiles.count(name) != 0 ||
         std::filesystem::path(path).extension() == ".cmake";
}

bool IsCiPath(const std::string &path) {
  static const std::set<std::string> kCiFiles = {
      ".gitlab-ci.yml", "Jenkinsfile", "azure-pipelines.yml", ".travis.yml"};
  return path.rfind(".github/workflows/", 0) == 0 ||
         path.rfind(".circleci/", 0) == 0 || kCiFiles.count(path) != 0;
}

bool PathHeuristicExtractor::CanHandle(const std::string &) const {
  return true;
}

CommitSemanticExtraction
PathHeuristicExtractor::Extract(const CommitRecord &commit) const {
  CommitSemanticExtraction extraction;
  extraction.sha = commit.sha;

  for (const auto &keyword : categorizer_.MessageKeywords(commit.message)) {
    extraction.message_signals.insert(keyword);
  }

  std::set<std::string> patterns;
  std::map<std::string, std::size_t> added_per_directory;
  std::set<std::string> touched_directories;
  long churn = 0;
  for (const auto &file : commit.files) {
    churn += file.additions + file.deletions;
    if (const auto layer = LayerPattern(file.path); !layer.empty()) {
      patterns.insert(layer);
    }
    for (const auto &category : categorizer_.PathCategories(file.path)) {
      patterns.insert("category:" + category);
    }

    const auto directory = Directory(file.path);
    if (file.status == FileStatus::kAdded) {
      ++added_per_directory[directory];
      if (IsModuleEntryPoint(file.path)) {
        AddSignal(extraction, "new-module");
      }
    } else {
      touched_directories.insert(directory);
    }
    if (file.status == FileStatus::kDeleted) {
      AddSignal(extraction, "file-removal");
    }
    if (IsTestPath(file.path)) {
      AddSignal(extraction, "test-change");
    }
    if (IsBuildConfigPath(file.path)) {
      AddSignal(extraction, "build-config-change");
    }
    if (IsCiPath(file.path)) {
      AddSignal(extraction, "ci-change");
    }
  }
  for (const auto &[directory, count] : added_per_directory) {
    if (!directory.empty() && count >= kNewModuleFileCount &&
        touched_directories.count(directory) == 0) {
      AddSignal(extraction, "new-module");
    }
  }
  for (const auto &id : patterns) {
    extraction.patterns.push_back({id, ChangeKind::kModified});
  }

  const auto churn_score = std::min(
      kMaxChurnScore, std::log10(1.0 + static_cast<double>(churn)) / 6.0);
  const auto score =
      churn_score +
      kSignalWeight *
          static_cast<double>(extraction.architectural_signals.size()) +
      (extraction.message_signals.empty() ? 0.0 : kKeywordWeight);
  extraction.significance = std::min(1.0, score);
  return extraction;
}

} // namespace adr
