#pragma once

#include <adr/decision_categorizer.h>
#include <adr/interfaces.h>

#include <string>

namespace adr {

// Language-agnostic signals from paths, churn and the commit message.
class PathHeuristicExtractor : public SemanticExtractor {
public:
  std::string Name() const override { return "path-heuristics"; }
  bool CanHandle(const std::string &path) const override;
  CommitSemanticExtraction Extract(const CommitRecord &commit) const override;

private:
  DecisionCategorizer categorizer_;
};

// layer:<dir> for the top-level directory, or the first two levels under a
// conventional source root such as src/. Empty for root files.
std::string LayerPattern(const std::string &path);
bool IsTestPath(const std::string &path);
bool IsBuildConfigPath(const std::string &path);
bool IsCiPath(const std::string &path);

} // namespace adr
