#pragma once

#include <string>
#include <vector>

namespace adr {

struct CategoryScore {
  std::string category;
  double score = 0.0;
};

class DecisionCategorizer {
public:
  DecisionCategorizer();

  // Highest scoring category above its rule threshold, or "general".
  CategoryScore Categorize(const std::vector<std::string> &messages,
                           const std::vector<std::string> &files) const;

  // Category keywords present in a (non-trivial) commit message.
  std::vector<std::string> MessageKeywords(const std::string &message) const;

  // Categories whose file patterns match the path.
  std::vector<std::string> PathCategories(const std::string &path) const;

  static bool IsTrivialMessage(const std::string &message);

  struct Rule {
    std::string category;
    std::vector<std::string> keywords;
    std::vector<std::string> file_patterns;
    double min_confidence = 0.25;
  };

private:
  double ScoreRule(const Rule &rule, const std::string &lowered_messages,
                   const std::vector<std::string> &files) const;

  std::vector<Rule> rules_;
};

std::string DecisionId(const std::string &first_sha,
                       const std::string &category);
// First line of a message without a conventional-commit prefix.
std::string DescribeMessage(const std::string &message);

} // namespace adr
