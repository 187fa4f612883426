#pragma once

#include <adr/interfaces.h>

#include <map>
#include <memory>
#include <string>

namespace adr {

// Declared package -> version (empty when unpinned).
using DeclaredDependencies = std::map<std::string, std::string>;

bool IsManifestPath(const std::string &path);
// Throws ExtractionError for an unknown manifest name.
DeclaredDependencies ParseManifest(const std::string &path,
                                   const std::string &contents);

class ManifestDependencyExtractor : public SemanticExtractor {
public:
  explicit ManifestDependencyExtractor(std::shared_ptr<RevisionReader> reader);

  std::string Name() const override { return "manifest"; }
  bool CanHandle(const std::string &path) const override;
  CommitSemanticExtraction Extract(const CommitRecord &commit) const override;

private:
  DeclaredDependencies Declared(const std::string &revision,
                                const std::string &path) const;

  std::shared_ptr<RevisionReader> reader_;
};

} // namespace adr
