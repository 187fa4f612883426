#include <adr/clang_semantic_extractor.h>

#include <clang-c/Index.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace adr {
namespace {

constexpr const char kVirtualRoot[] = "/adr-snapshot/";
constexpr double kFunctionWeight = 0.05;
constexpr double kSignalWeight = 0.15;
constexpr double kDependencyWeight = 0.1;

std::string ToString(CXString value) {
  std::string text;
  if (const auto *cstr = clang_getCString(value); cstr != nullptr) {
    text = cstr;
  }
  clang_disposeString(value);
  return text;
}

std::string Extension(const std::string &path) {
  auto extension = std::filesystem::path(path).extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return extension;
}

std::string QualifiedName(CXCursor cursor) {
  if (clang_Cursor_isNull(cursor)) {
    return {};
  }

  const auto parent = clang_getCursorSemanticParent(cursor);
  if (clang_Cursor_isNull(parent) ||
      clang_getCursorKind(parent) == CXCursor_TranslationUnit) {
    return ToString(clang_getCursorSpelling(cursor));
  }

  const auto parent_name = QualifiedName(parent);
  const auto name = ToString(clang_getCursorSpelling(cursor));
  if (parent_name.empty()) {
    return name;
  }
  if (name.empty()) {
    return parent_name;
  }
  return parent_name + "::" + name;
}

std::string SignatureForCursor(CXCursor cursor) {
  const auto return_type =
      ToString(clang_getTypeSpelling(clang_getCursorResultType(cursor)));
  const auto display = ToString(clang_getCursorDisplayName(cursor));
  if (return_type.empty()) {
    return display;
  }
  return return_type + " " + display;
}

std::string ParameterList(const std::string &display_name) {
  const auto open = display_name.find('(');
  return open == std::string::npos ? std::string() : display_name.substr(open);
}

bool IsFunctionKind(CXCursorKind kind) {
  return kind == CXCursor_FunctionDecl || kind == CXCursor_CXXMethod ||
         kind == CXCursor_Constructor || kind == CXCursor_Destructor ||
         kind == CXCursor_FunctionTemplate;
}

std::string JoinSorted(std::set<std::string> values) {
  std::string joined;
  for (const auto &value : values) {
    if (!joined.empty()) {
      joined.push_back(';');
    }
    joined.append(value);
  }
  return joined;
}

class DeclarationCollector {
public:
  SourceSnapshot Collect(CXCursor root) {
    Traverse(root);
    for (const auto &[name, signatures] : signatures_) {
      snapshot_.functions[name] = JoinSorted(signatures);
    }
    for (const auto &[name, parameters] : parameters_) {
      snapshot_.parameters[name] = JoinSorted(parameters);
    }
    return std::move(snapshot_);
  }

private:
  void Visit(CXCursor cursor) {
    const auto kind = clang_getCursorKind(cursor);
    if (IsFunctionKind(kind)) {
      const auto name = QualifiedName(cursor);
      if (name.empty()) {
        return;
      }
      signatures_[name].insert(SignatureForCursor(cursor));
      parameters_[name].insert(
          ParameterList(ToString(clang_getCursorDisplayName(cursor))));
      if (kind == CXCursor_FunctionTemplate) {
        snapshot_.templates.insert(name);
      }
      if (kind == CXCursor_CXXMethod && clang_CXXMethod_isPureVirtual(cursor)) {
        snapshot_.abstract_records.insert(
            QualifiedName(clang_getCursorSemanticParent(cursor)));
      }
      return;
    }

    switch (kind) {
    case CXCursor_ClassDecl:
    case CXCursor_StructDecl:
      if (clang_isCursorDefinition(cursor)) {
        snapshot_.records.insert(QualifiedName(cursor));
      }
      break;
    case CXCursor_ClassTemplate:
      if (clang_isCursorDefinition(cursor)) {
        const auto name = QualifiedName(cursor);
        snapshot_.records.insert(name);
        snapshot_.templates.insert(name);
      }
      break;
    case CXCursor_Namespace: {
      const auto name = QualifiedName(cursor);
      if (!name.empty()) {
        snapshot_.namespaces.insert(name);
      }
      break;
    }
    case CXCursor_CXXBaseSpecifier: {
      const auto base = ToString(clang_getTypeSpelling(clang_getCursorType(cursor)));
      if (!base.empty()) {
        snapshot_.bases.insert(base);
      }
      break;
    }
    default:
      break;
    }
  }

  void Traverse(CXCursor cursor) {
    clang_visitChildren(
        cursor,
        [](CXCursor child, CXCursor, CXClientData data) {
          if (!clang_Location_isFromMainFile(clang_getCursorLocation(child))) {
            return CXChildVisit_Continue;
          }
          auto *collector = static_cast<DeclarationCollector *>(data);
          collector->Visit(child);
          collector->Traverse(child);
          return CXChildVisit_Continue;
        },
        this);
  }

  SourceSnapshot snapshot_;
  std::map<std::string, std::set<std::string>> signatures_;
  std::map<std::string, std::set<std::string>> parameters_;
};

std::set<std::string> SystemIncludes(const std::string &contents) {
  static const std::regex kInclude(R"(^\s*#\s*include\s*<([^>]+)>)");
  std::set<std::string> includes;
  std::istringstream stream(contents);
  std::string line;
  std::smatch match;
  while (std::getline(stream, line)) {
    if (std::regex_search(line, match, kInclude)) {
      includes.insert(match[1].str());
    }
  }
  return includes;
}

std::set<std::string> PatternIds(const SourceSnapshot &snapshot) {
  std::set<std::string> ids;
  if (!snapshot.abstract_records.empty()) {
    ids.insert("cxx:abstract-interface");
  }
  if (!snapshot.templates.empty()) {
    ids.insert("cxx:template");
  }
  for (const auto &name : snapshot.namespaces) {
    ids.insert("cxx:namespace:" + name);
  }
  for (const auto &base : snapshot.bases) {
    ids.insert("cxx:inheritance:" + base);
  }
  return ids;
}

std::set<std::string> Dependencies(const SourceSnapshot &snapshot) {
  std::set<std::string> dependencies;
  for (const auto &include : snapshot.system_includes) {
    auto dependency = IncludeDependency(include);
    if (!dependency.empty()) {
      dependencies.insert(std::move(dependency));
    }
  }
  return dependencies;
}

bool HasNewEntries(const std::set<std::string> &before,
                   const std::set<std::string> &after) {
  return std::any_of(after.begin(), after.end(), [&](const std::string &name) {
    return before.count(name) == 0;
  });
}

void AddSignal(CommitSemanticExtraction &extraction, const std::string &signal) {
  auto &signals = extraction.architectural_signals;
  if (std::find(signals.begin(), signals.end(), signal) == signals.end()) {
    signals.push_back(signal);
  }
}

} // namespace

bool IsCxxSourcePath(const std::string &path) {
  static const std::set<std::string> kExtensions = {
      ".c", ".cc", ".cpp", ".cxx", ".h", ".hh", ".hpp", ".hxx", ".ipp"};
  return kExtensions.count(Extension(path)) != 0;
}

bool IsCxxHeaderPath(const std::string &path) {
  static const std::set<std::string> kExtensions = {".h", ".hh", ".hpp",
                                                    ".hxx", ".ipp"};
  return kExtensions.count(Extension(path)) != 0;
}

std::string IncludeDependency(const std::string &include) {
  const auto slash = include.find('/');
  if (slash == std::string::npos || slash == 0) {
    return {};
  }
  return include.substr(0, slash);
}

SourceSnapshot ParseSourceSnapshot(const std::string &path,
                                   const std::string &contents) {
  const auto virtual_path = std::string(kVirtualRoot) + path;
  std::vector<const char *> args;
  if (Extension(path) == ".c") {
    args = {"-x", "c", "-std=c11"};
  } else {
    args = {"-x", "c++", "-std=c++17"};
  }

  CXUnsavedFile unsaved{};
  unsaved.Filename = virtual_path.c_str();
  unsaved.Contents = contents.data();
  unsaved.Length = static_cast<unsigned long>(contents.size());

  CXIndex index = clang_createIndex(0, 0);
  CXTranslationUnit translation_unit = nullptr;
  const auto error = clang_parseTranslationUnit2(
      index, virtual_path.c_str(), args.data(), static_cast<int>(args.size()),
      &unsaved, 1,
      CXTranslationUnit_SkipFunctionBodies | CXTranslationUnit_Incomplete |
          CXTranslationUnit_KeepGoing,
      &translation_unit);
  if (error != CXError_Success || translation_unit == nullptr) {
    clang_disposeIndex(index);
    throw ExtractionError("libclang could not parse " + path +
                          " (error code " + std::to_string(error) + ")");
  }

  DeclarationCollector collector;
  auto snapshot =
      collector.Collect(clang_getTranslationUnitCursor(translation_unit));
  clang_disposeTranslationUnit(translation_unit);
  clang_disposeIndex(index);

  snapshot.system_includes = SystemIncludes(contents);
  return snapshot;
}

void DiffSnapshots(const std::string &path, const SourceSnapshot &before,
                   const SourceSnapshot &after,
                   CommitSemanticExtraction &extraction) {
  std::vector<std::string> added;
  std::vector<std::string> removed;
  bool functions_changed = false;
  for (const auto &[name, signature] : after.functions) {
    const auto found = before.functions.find(name);
    if (found == before.functions.end()) {
      added.push_back(name);
    } else if (found->second != signature) {
      extraction.functions.push_back({name, ChangeKind::kModified, ""});
      functions_changed = true;
    }
  }
  for (const auto &[name, signature] : before.functions) {
    if (after.functions.count(name) == 0) {
      removed.push_back(name);
    }
  }

  // A removal and an addition with the same parameter lists is a rename.
  std::vector<bool> matched(added.size(), false);
  std::vector<std::string> unmatched_removals;
  for (const auto &old_name : removed) {
    const auto &old_parameters = before.parameters.at(old_name);
    std::size_t candidate = added.size();
    for (std::size_t i = 0; i < added.size(); ++i) {
      if (!matched[i] && after.parameters.at(added[i]) == old_parameters) {
        candidate = i;
        break;
      }
    }
    if (candidate == added.size()) {
      unmatched_removals.push_back(old_name);
      continue;
    }
    matched[candidate] = true;
    extraction.functions.push_back(
        {added[candidate], ChangeKind::kRenamed, old_name});
  }
  for (std::size_t i = 0; i < added.size(); ++i) {
    if (!matched[i]) {
      extraction.functions.push_back({added[i], ChangeKind::kAdded, ""});
    }
  }
  for (const auto &name : unmatched_removals) {
    extraction.functions.push_back({name, ChangeKind::kRemoved, ""});
  }
  functions_changed = functions_changed || !added.empty() || !removed.empty();

  const auto before_ids = PatternIds(before);
  const auto after_ids = PatternIds(after);
  for (const auto &id : after_ids) {
    extraction.patterns.push_back(
        {id, before_ids.count(id) != 0 ? ChangeKind::kModified
                                       : ChangeKind::kAdded});
  }
  for (const auto &id : before_ids) {
    if (after_ids.count(id) == 0) {
      extraction.patterns.push_back({id, ChangeKind::kRemoved});
    }
  }

  const auto before_dependencies = Dependencies(before);
  const auto after_dependencies = Dependencies(after);
  for (const auto &dependency : after_dependencies) {
    if (before_dependencies.count(dependency) == 0) {
      extraction.dependencies.emplace(dependency, ChangeKind::kAdded);
    }
  }
  for (const auto &dependency : before_dependencies) {
    if (after_dependencies.count(dependency) == 0) {
      extraction.dependencies.emplace(dependency, ChangeKind::kRemoved);
    }
  }

  if (HasNewEntries(before.abstract_records, after.abstract_records)) {
    AddSignal(extraction, "new-interface");
  }
  if (HasNewEntries(before.namespaces, after.namespaces)) {
    AddSignal(extraction, "new-namespace");
  }
  if (IsCxxHeaderPath(path)) {
    if (functions_changed || before.records != after.records) {
      AddSignal(extraction, "public-header-change");
    }
    if (!unmatched_removals.empty()) {
      AddSignal(extraction, "api-removal");
    }
  }
}

ClangSemanticExtractor::ClangSemanticExtractor(
    std::shared_ptr<RevisionReader> reader, std::shared_ptr<Logger> logger)
    : reader_(std::move(reader)), logger_(EnsureLogger(std::move(logger))) {
  if (!reader_) {
    throw std::invalid_argument("revision reader must not be null");
  }
}

bool ClangSemanticExtractor::CanHandle(const std::string &path) const {
  return IsCxxSourcePath(path);
}

SourceSnapshot ClangSemanticExtractor::Snapshot(const std::string &revision,
                                                const std::string &path) const {
  const auto contents = reader_->Read(revision, path);
  if (!contents) {
    return {};
  }
  return ParseSourceSnapshot(path, *contents);
}

CommitSemanticExtraction
ClangSemanticExtractor::Extract(const CommitRecord &commit) const {
  CommitSemanticExtraction extraction;
  extraction.sha = commit.sha;
  const auto parent =
      commit.parents.empty() ? std::string() : commit.parents.front();

  for (const auto &file : commit.files) {
    if (!CanHandle(file.path)) {
      continue;
    }
    const auto before = file.status == FileStatus::kAdded
                            ? SourceSnapshot{}
                            : Snapshot(parent, file.path);
    const auto after = file.status == FileStatus::kDeleted
                           ? SourceSnapshot{}
                           : Snapshot(commit.sha, file.path);
    DiffSnapshots(file.path, before, after, extraction);
  }

  const auto score =
      kFunctionWeight * static_cast<double>(extraction.functions.size()) +
      kSignalWeight *
          static_cast<double>(extraction.architectural_signals.size()) +
      kDependencyWeight * static_cast<double>(extraction.dependencies.size());
  extraction.significance = std::min(1.0, score);
  logger_->Log(LogLevel::kDebug, "Extracted C/C++ declarations",
               {{"sha", commit.sha},
                {"functions", std::to_string(extraction.functions.size())},
                {"patterns", std::to_string(extraction.patterns.size())}});
  return extraction;
}

} // namespace adr
