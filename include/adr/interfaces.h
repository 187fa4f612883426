#pragma once

#include <adr/models.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace adr {

class HistoryError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class ExtractionError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class SynthesisError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class HistoryWalker {
public:
  virtual ~HistoryWalker() = default;
  virtual std::vector<CommitRecord> Walk(const WalkOptions &options) = 0;
};

class RevisionReader {
public:
  virtual ~RevisionReader() = default;
  virtual std::optional<std::string> Read(const std::string &revision,
                                          const std::string &path) const = 0;
};

// Extract is called concurrently from extraction workers.
class SemanticExtractor {
public:
  virtual ~SemanticExtractor() = default;
  virtual std::string Name() const = 0;
  virtual bool CanHandle(const std::string &path) const = 0;
  virtual CommitSemanticExtraction Extract(const CommitRecord &commit) const = 0;
};

class PatternDataSource {
public:
  virtual ~PatternDataSource() = default;
  virtual std::vector<std::string>
  PatternsForFile(const std::string &path) const = 0;
};

// Synthesize is called concurrently, once per retained cluster.
class NarrativeSynthesizer {
public:
  virtual ~NarrativeSynthesizer() = default;
  virtual Narrative Synthesize(const EvidencePackage &evidence) = 0;
};

class Reporter {
public:
  virtual ~Reporter() = default;
  virtual Report Render(const DecisionMiningResult &result,
                        const ReportContext &context) = 0;
};

class DecisionMiner {
public:
  virtual ~DecisionMiner() = default;
  virtual DecisionMiningResult Mine(const MiningOptions &options) = 0;
};

} // namespace adr
