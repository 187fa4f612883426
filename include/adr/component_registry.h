#pragma once

#include <adr/interfaces.h>
#include <adr/logging.h>

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace adr {

// What extractor factories may need from the run they are built for.
struct ExtractorContext {
  std::string root_path;
  std::shared_ptr<RevisionReader> revision_reader;
  std::shared_ptr<Logger> logger;
};

class ComponentRegistry {
public:
  using ExtractorFactory =
      std::function<std::unique_ptr<SemanticExtractor>(const ExtractorContext &)>;
  using SynthesizerFactory =
      std::function<std::unique_ptr<NarrativeSynthesizer>()>;
  using ReporterFactory = std::function<std::unique_ptr<Reporter>()>;

  void RegisterExtractor(const std::string &name, ExtractorFactory factory);
  void RegisterSynthesizer(const std::string &name, SynthesizerFactory factory,
                           bool set_as_default = false);
  void RegisterReporter(const std::string &name, ReporterFactory factory,
                        bool set_as_default = false);

  std::unique_ptr<SemanticExtractor>
  CreateExtractor(const std::string &name,
                  const ExtractorContext &context) const;
  std::unique_ptr<NarrativeSynthesizer>
  CreateSynthesizer(const std::string &name = "") const;
  std::unique_ptr<Reporter> CreateReporter(const std::string &name = "") const;

  std::vector<std::string> ExtractorNames() const;
  std::vector<std::string> SynthesizerNames() const;
  std::vector<std::string> ReporterNames() const;

  const std::string &DefaultSynthesizerName() const;
  const std::string &DefaultReporterName() const;

  template <typename Factory>
  struct ComponentSet {
    std::unordered_map<std::string, Factory> factories;
    std::string default_name;
  };

private:
  template <typename Factory>
  static std::vector<std::string>
  RegisteredNames(const ComponentSet<Factory> &set);

  template <typename Factory>
  static std::string JoinNames(const ComponentSet<Factory> &set);

  template <typename Factory>
  static const Factory &FindFactory(const std::string &name,
                                    const ComponentSet<Factory> &set,
                                    const std::string &kind,
                                    std::string &resolved_name);

  template <typename Factory>
  void RegisterComponent(const std::string &name, Factory factory,
                         bool set_as_default, ComponentSet<Factory> &set);

  ComponentSet<ExtractorFactory> extractors_;
  ComponentSet<SynthesizerFactory> synthesizers_;
  ComponentSet<ReporterFactory> reporters_;
};

// clang, manifest and path-heuristics extractors; the template synthesizer;
// the markdown reporter.
ComponentRegistry MakeComponentRegistryWithDefaults();

} // namespace adr
