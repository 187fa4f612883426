#pragma once

#include <adr/interfaces.h>
#include <adr/logging.h>

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace adr {

// Declarations found in one revision of a C or C++ file.
struct SourceSnapshot {
  // Qualified name -> sorted overload signatures joined by ';'.
  std::map<std::string, std::string> functions;
  // Qualified name -> parameter lists of its overloads, joined by ';'.
  std::map<std::string, std::string> parameters;
  std::set<std::string> records;
  std::set<std::string> abstract_records;
  std::set<std::string> templates;
  std::set<std::string> namespaces;
  std::set<std::string> bases;
  std::set<std::string> system_includes;
};

bool IsCxxSourcePath(const std::string &path);
bool IsCxxHeaderPath(const std::string &path);

// Parses in-memory contents with libclang. Throws ExtractionError when no
// translation unit can be produced.
SourceSnapshot ParseSourceSnapshot(const std::string &path,
                                   const std::string &contents);

// Component name of an angle-bracket include such as <yaml-cpp/yaml.h>.
// Empty for headers without a directory.
std::string IncludeDependency(const std::string &include);

// Diff of two snapshots of `path` merged into `extraction`.
void DiffSnapshots(const std::string &path, const SourceSnapshot &before,
                   const SourceSnapshot &after,
                   CommitSemanticExtraction &extraction);

class ClangSemanticExtractor : public SemanticExtractor {
public:
  ClangSemanticExtractor(std::shared_ptr<RevisionReader> reader,
                         std::shared_ptr<Logger> logger = nullptr);

  std::string Name() const override { return "clang"; }
  bool CanHandle(const std::string &path) const override;
  CommitSemanticExtraction Extract(const CommitRecord &commit) const override;

private:
  SourceSnapshot Snapshot(const std::string &revision,
                          const std::string &path) const;

  std::shared_ptr<RevisionReader> reader_;
  std::shared_ptr<Logger> logger_;
};

} // namespace adr
