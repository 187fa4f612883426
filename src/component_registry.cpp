#include <adr/component_registry.h>

#include <adr/clang_semantic_extractor.h>
#include <adr/manifest_dependency_extractor.h>
#include <adr/markdown_reporter.h>
#include <adr/path_heuristic_extractor.h>
#include <adr/template_narrative_synthesizer.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace {

constexpr const char kClangExtractor[] = "clang";
constexpr const char kManifestExtractor[] = "manifest";
constexpr const char kPathExtractor[] = "path-heuristics";
constexpr const char kDefaultSynthesizer[] = "template";
constexpr const char kDefaultReporter[] = "markdown";

template <typename Instance>
std::unique_ptr<Instance> RequireInstance(std::unique_ptr<Instance> instance,
                                          const std::string &kind,
                                          const std::string &name) {
  if (!instance) {
    throw std::runtime_error("Factory for " + kind + " '" + name +
                             "' returned null");
  }
  return instance;
}

} // namespace

namespace adr {

template <typename Factory>
std::vector<std::string>
ComponentRegistry::RegisteredNames(const ComponentSet<Factory> &set) {
  std::vector<std::string> names;
  names.reserve(set.factories.size());
  for (const auto &entry : set.factories) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

template <typename Factory>
std::string ComponentRegistry::JoinNames(const ComponentSet<Factory> &set) {
  const auto names = RegisteredNames(set);
  std::string message;
  for (std::size_t i = 0; i < names.size(); ++i) {
    message += names[i];
    if (i + 1 < names.size()) {
      message += ", ";
    }
  }
  return message;
}

template <typename Factory>
const Factory &ComponentRegistry::FindFactory(const std::string &name,
                                              const ComponentSet<Factory> &set,
                                              const std::string &kind,
                                              std::string &resolved_name) {
  resolved_name = name.empty() ? set.default_name : name;
  if (resolved_name.empty()) {
    throw std::invalid_argument("No default " + kind + " registered");
  }
  const auto found = set.factories.find(resolved_name);
  if (found == set.factories.end()) {
    throw std::invalid_argument("Unknown " + kind + " '" + resolved_name +
                                "'. Registered: " + JoinNames(set));
  }
  return found->second;
}

template <typename Factory>
void ComponentRegistry::RegisterComponent(const std::string &name,
                                          Factory factory,
                                          bool set_as_default,
                                          ComponentSet<Factory> &set) {
  if (name.empty()) {
    throw std::invalid_argument("Component name cannot be empty");
  }
  if (!factory) {
    throw std::invalid_argument("Factory for '" + name + "' cannot be null");
  }
  if (set.factories.count(name) != 0) {
    throw std::invalid_argument("Component with name '" + name +
                                "' already registered");
  }
  set.factories.emplace(name, std::move(factory));
  if (set_as_default || set.default_name.empty()) {
    set.default_name = name;
  }
}

void ComponentRegistry::RegisterExtractor(const std::string &name,
                                          ExtractorFactory factory) {
  RegisterComponent(name, std::move(factory), false, extractors_);
}

void ComponentRegistry::RegisterSynthesizer(const std::string &name,
                                            SynthesizerFactory factory,
                                            bool set_as_default) {
  RegisterComponent(name, std::move(factory), set_as_default, synthesizers_);
}

void ComponentRegistry::RegisterReporter(const std::string &name,
                                         ReporterFactory factory,
                                         bool set_as_default) {
  RegisterComponent(name, std::move(factory), set_as_default, reporters_);
}

std::unique_ptr<SemanticExtractor>
ComponentRegistry::CreateExtractor(const std::string &name,
                                   const ExtractorContext &context) const {
  if (name.empty()) {
    throw std::invalid_argument("Extractor name cannot be empty");
  }
  std::string resolved;
  const auto &factory = FindFactory(name, extractors_, "extractor", resolved);
  return RequireInstance(factory(context), "extractor", resolved);
}

std::unique_ptr<NarrativeSynthesizer>
ComponentRegistry::CreateSynthesizer(const std::string &name) const {
  std::string resolved;
  const auto &factory =
      FindFactory(name, synthesizers_, "synthesizer", resolved);
  return RequireInstance(factory(), "synthesizer", resolved);
}

std::unique_ptr<Reporter>
ComponentRegistry::CreateReporter(const std::string &name) const {
  std::string resolved;
  const auto &factory = FindFactory(name, reporters_, "reporter", resolved);
  return RequireInstance(factory(), "reporter", resolved);
}

std::vector<std::string> ComponentRegistry::ExtractorNames() const {
  return RegisteredNames(extractors_);
}

std::vector<std::string> ComponentRegistry::SynthesizerNames() const {
  return RegisteredNames(synthesizers_);
}

std::vector<std::string> ComponentRegistry::ReporterNames() const {
  return RegisteredNames(reporters_);
}

const std::string &ComponentRegistry::DefaultSynthesizerName() const {
  return synthesizers_.default_name;
}

const std::string &ComponentRegistry::DefaultReporterName() const {
  return reporters_.default_name;
}

ComponentRegistry MakeComponentRegistryWithDefaults() {
  ComponentRegistry registry;
  registry.RegisterExtractor(kClangExtractor,
                             [](const ExtractorContext &context) {
                               return std::make_unique<ClangSemanticExtractor>(
                                   context.revision_reader, context.logger);
                             });
  registry.RegisterExtractor(
      kManifestExtractor, [](const ExtractorContext &context) {
        return std::make_unique<ManifestDependencyExtractor>(
            context.revision_reader);
      });
  registry.RegisterExtractor(kPathExtractor, [](const ExtractorContext &) {
    return std::make_unique<PathHeuristicExtractor>();
  });
  registry.RegisterSynthesizer(
      kDefaultSynthesizer,
      []() { return std::make_unique<TemplateNarrativeSynthesizer>(); }, true);
  registry.RegisterReporter(
      kDefaultReporter, []() { return std::make_unique<MarkdownReporter>(); },
      true);
  return registry;
}

} // namespace adr
