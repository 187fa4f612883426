#include <adr/decision_categorizer.h>

#include <adr/models.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace adr {
namespace {

constexpr const char kGeneralCategory[] = "general";

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::vector<DecisionCategorizer::Rule> BuildRules() {
  return {
      {"architecture",
       {"architect", "microservice", "monolith", "modular", "layer",
        "decouple", "service mesh", "event-driven", "cqrs", "hexagonal",
        "clean architecture", "domain-driven"},
       {"architecture", "design", "adr/"}},
      {"technology",
       {"migrate", "upgrade", "switch to", "replace", "adopt", "framework",
        "library", "runtime", "engine", "platform"},
       {"package.json", "Cargo.toml", "pom.xml", "go.mod", "Gemfile",
        "CMakeLists.txt", "vcpkg.json", "conanfile.txt"}},
      {"pattern",
       {"pattern", "singleton", "factory", "observer", "strategy",
        "repository", "middleware", "decorator", "adapter"},
       {"patterns/", "utils/", "helpers/"}},
      {"convention",
       {"convention", "naming", "style", "lint", "format", "eslint",
        "prettier", "rustfmt", "clang-format", "standard"},
       {".eslintrc", ".prettierrc", "rustfmt.toml", ".clang-format",
        ".clang-tidy"}},
      {"security",
       {"security", "auth", "csrf", "xss", "injection", "encrypt",
        "vulnerability", "cve", "rate limit", "cors", "sanitize",
        "validate input"},
       {"security/", "auth/", "middleware/"}},
      {"performance",
       {"performance", "optimize", "cache", "lazy load", "bundle", "compress",
        "index", "query optimization", "profil", "benchmark", "throughput",
        "latency"},
       {"cache/", "perf/", "benchmark/"}},
      {"testing",
       {"test", "coverage", "jest", "mocha", "pytest", "junit", "gtest",
        "integration test", "e2e", "snapshot", "mock", "fixture"},
       {"test/", "tests/", "spec/", "__tests__/"}},
      {"deployment",
       {"deploy", "ci/cd", "docker", "kubernetes", "terraform", "pipeline",
        "github action", "jenkins", "helm"},
       {"Dockerfile", ".github/workflows/", "terraform/", "k8s/",
        "docker-compose", "Jenkinsfile"}},
      {"data-model",
       {"schema", "migration", "model", "entity", "table", "column", "index",
        "foreign key", "relation", "database", "orm"},
       {"migrations/", "models/", "entities/", "schema/"}},
      {"api-design",
       {"api", "endpoint", "rest", "graphql", "grpc", "openapi", "swagger",
        "route", "controller", "versioning"},
       {"routes/", "controllers/", "api/", "openapi"}},
      {"error-handling",
       {"error handling", "exception", "retry", "circuit breaker", "fallback",
        "graceful", "recovery", "error boundary"},
       {"errors/", "exceptions/"}},
      {"documentation",
       {"document", "readme", "changelog", "contributing", "api doc",
        "jsdoc", "doxygen", "wiki"},
       {"docs/", "README", "CHANGELOG", "CONTRIBUTING"}},
  };
}

} // namespace

DecisionCategorizer::DecisionCategorizer() : rules_(BuildRules()) {}

bool DecisionCategorizer::IsTrivialMessage(const std::string &message) {
  static const std::vector<std::string> kTrivialPrefixes = {
      "merge branch", "merge pull request", "wip",
      "fixup!",       "squash!",            "revert \"revert"};
  const auto lowered = ToLower(Trim(message));
  return std::any_of(kTrivialPrefixes.begin(), kTrivialPrefixes.end(),
                     [&](const std::string &prefix) {
                       return lowered.rfind(prefix, 0) == 0;
                     });
}

double DecisionCategorizer::ScoreRule(
    const Rule &rule, const std::string &lowered_messages,
    const std::vector<std::string> &files) const {
  const auto keyword_hits = std::count_if(
      rule.keywords.begin(), rule.keywords.end(), [&](const auto &keyword) {
        return lowered_messages.find(keyword) != std::string::npos;
      });
  const auto file_hits = std::count_if(
      rule.file_patterns.begin(), rule.file_patterns.end(),
      [&](const auto &pattern) {
        return std::any_of(files.begin(), files.end(), [&](const auto &file) {
          return file.find(pattern) != std::string::npos;
        });
      });

  const auto score = std::min(0.6, static_cast<double>(keyword_hits) * 0.3) +
                     std::min(0.4, static_cast<double>(file_hits) * 0.2);
  return std::min(score, 1.0);
}

CategoryScore
DecisionCategorizer::Categorize(const std::vector<std::string> &messages,
                                const std::vector<std::string> &files) const {
  std::string lowered;
  for (const auto &message : messages) {
    if (IsTrivialMessage(message)) {
      continue;
    }
    lowered.append(ToLower(message));
    lowered.push_back('\n');
  }

  CategoryScore best{kGeneralCategory, 0.0};
  for (const auto &rule : rules_) {
    const auto score = ScoreRule(rule, lowered, files);
    if (score > rule.min_confidence && score > best.score) {
      best = CategoryScore{rule.category, score};
    }
  }
  return best;
}

std::vector<std::string>
DecisionCategorizer::MessageKeywords(const std::string &message) const {
  std::vector<std::string> keywords;
  if (IsTrivialMessage(message)) {
    return keywords;
  }
  const auto lowered = ToLower(message);
  for (const auto &rule : rules_) {
    for (const auto &keyword : rule.keywords) {
      if (lowered.find(keyword) != std::string::npos &&
          std::find(keywords.begin(), keywords.end(), keyword) ==
              keywords.end()) {
        keywords.push_back(keyword);
      }
    }
  }
  std::sort(keywords.begin(), keywords.end());
  return keywords;
}

std::vector<std::string>
DecisionCategorizer::PathCategories(const std::string &path) const {
  std::vector<std::string> categories;
  for (const auto &rule : rules_) {
    const auto matches = std::any_of(
        rule.file_patterns.begin(), rule.file_patterns.end(),
        [&](const auto &pattern) {
          return path.find(pattern) != std::string::npos;
        });
    if (matches) {
      categories.push_back(rule.category);
    }
  }
  return categories;
}

std::string DecisionId(const std::string &first_sha,
                       const std::string &category) {
  return "dec-" + first_sha.substr(0, std::min<std::size_t>(8, first_sha.size())) +
         "-" + category;
}

std::string DescribeMessage(const std::string &message) {
  auto first_line = Subject(message);
  const auto separator = first_line.find(": ");
  if (separator != std::string::npos) {
    first_line = first_line.substr(separator + 2);
  }
  return Trim(first_line);
}

} // namespace adr
