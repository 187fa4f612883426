#pragma once

#include <adr/interfaces.h>

#include <map>
#include <string>
#include <vector>

namespace adr {

// Deterministic narrative assembled from the evidence package alone.
class TemplateNarrativeSynthesizer : public NarrativeSynthesizer {
public:
  TemplateNarrativeSynthesizer();

  Narrative Synthesize(const EvidencePackage &evidence) override;

private:
  std::string BuildContext(const EvidencePackage &evidence) const;
  std::string BuildDecision(const EvidencePackage &evidence) const;
  std::vector<std::string>
  BuildConsequences(const EvidencePackage &evidence) const;

  std::map<std::string, std::vector<std::string>> alternatives_;
};

} // namespace adr
