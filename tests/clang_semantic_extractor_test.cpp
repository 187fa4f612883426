#include <adr/clang_semantic_extractor.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

#include "test_support/map_revision_reader.h"

namespace adr {
namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Key;
using ::testing::Pair;
using ::testing::UnorderedElementsAre;

SourceSnapshot WithFunction(const std::string &name, const std::string &signature,
                            const std::string &parameters) {
  SourceSnapshot snapshot;
  snapshot.functions[name] = signature;
  snapshot.parameters[name] = parameters;
  return snapshot;
}

TEST(CxxPathTest, RecognisesSourcesAndHeaders) {
  EXPECT_TRUE(IsCxxSourcePath("src/engine.cpp"));
  EXPECT_TRUE(IsCxxSourcePath("include/engine.HPP"));
  EXPECT_TRUE(IsCxxSourcePath("lib/legacy.c"));
  EXPECT_FALSE(IsCxxSourcePath("src/engine.rs"));
  EXPECT_TRUE(IsCxxHeaderPath("include/adr/models.h"));
  EXPECT_FALSE(IsCxxHeaderPath("src/models.cpp"));
}

TEST(IncludeDependencyTest, UsesTheLeadingDirectory) {
  EXPECT_EQ("yaml-cpp", IncludeDependency("yaml-cpp/yaml.h"));
  EXPECT_EQ("boost", IncludeDependency("boost/asio/ip/tcp.hpp"));
  EXPECT_EQ("", IncludeDependency("vector"));
  EXPECT_EQ("", IncludeDependency("/usr/include/stdio.h"));
}

TEST(DiffSnapshotsTest, MatchingParameterListsAreRenames) {
  const auto before = WithFunction("auth::Login", "bool Login(int)", "(int)");
  const auto after = WithFunction("auth::SignIn", "bool SignIn(int)", "(int)");
  CommitSemanticExtraction extraction;

  DiffSnapshots("include/auth.h", before, after, extraction);

  ASSERT_EQ(1u, extraction.functions.size());
  EXPECT_EQ("auth::SignIn", extraction.functions[0].name);
  EXPECT_EQ(ChangeKind::kRenamed, extraction.functions[0].kind);
  EXPECT_EQ("auth::Login", extraction.functions[0].previous_name);
  EXPECT_THAT(extraction.architectural_signals, ElementsAre("public-header-change"));
}

TEST(DiffSnapshotsTest, HeaderRemovalIsAnApiRemoval) {
  const auto before = WithFunction("auth::Logout", "void Logout()", "()");
  const auto after = WithFunction("auth::Refresh", "void Refresh(int)", "(int)");
  CommitSemanticExtraction extraction;

  DiffSnapshots("include/auth.hpp", before, after, extraction);

  ASSERT_EQ(2u, extraction.functions.size());
  EXPECT_EQ("auth::Refresh", extraction.functions[0].name);
  EXPECT_EQ(ChangeKind::kAdded, extraction.functions[0].kind);
  EXPECT_EQ("auth::Logout", extraction.functions[1].name);
  EXPECT_EQ(ChangeKind::kRemoved, extraction.functions[1].kind);
  EXPECT_THAT(extraction.architectural_signals,
              ElementsAre("public-header-change", "api-removal"));
}

TEST(DiffSnapshotsTest, SignatureChangesInSourcesCarryNoHeaderSignal) {
  const auto before = WithFunction("Parse", "int Parse(const char *)", "(const char *)");
  const auto after = WithFunction("Parse", "long Parse(const char *)", "(const char *)");
  CommitSemanticExtraction extraction;

  DiffSnapshots("src/parser.cpp", before, after, extraction);

  ASSERT_EQ(1u, extraction.functions.size());
  EXPECT_EQ(ChangeKind::kModified, extraction.functions[0].kind);
  EXPECT_THAT(extraction.architectural_signals, IsEmpty());
}

TEST(DiffSnapshotsTest, ReportsPatternChanges) {
  SourceSnapshot before;
  before.namespaces = {"storage"};
  before.bases = {"Base"};
  SourceSnapshot after;
  after.namespaces = {"storage"};
  after.abstract_records = {"storage::Store"};
  CommitSemanticExtraction extraction;

  DiffSnapshots("src/store.cpp", before, after, extraction);

  ASSERT_EQ(3u, extraction.patterns.size());
  EXPECT_EQ("cxx:abstract-interface", extraction.patterns[0].id);
  EXPECT_EQ(ChangeKind::kAdded, extraction.patterns[0].kind);
  EXPECT_EQ("cxx:namespace:storage", extraction.patterns[1].id);
  EXPECT_EQ(ChangeKind::kModified, extraction.patterns[1].kind);
  EXPECT_EQ("cxx:inheritance:Base", extraction.patterns[2].id);
  EXPECT_EQ(ChangeKind::kRemoved, extraction.patterns[2].kind);
  EXPECT_THAT(extraction.architectural_signals, ElementsAre("new-interface"));
}

TEST(DiffSnapshotsTest, NewNamespaceIsSignalledOnce) {
  SourceSnapshot after;
  after.namespaces = {"net", "net::http"};
  CommitSemanticExtraction extraction;

  DiffSnapshots("src/a.cpp", SourceSnapshot{}, after, extraction);
  DiffSnapshots("src/b.cpp", SourceSnapshot{}, after, extraction);

  EXPECT_THAT(extraction.architectural_signals, ElementsAre("new-namespace"));
}

TEST(DiffSnapshotsTest, IncludeDirectoriesBecomeDependencies) {
  SourceSnapshot before;
  before.system_includes = {"boost/asio.hpp", "vector"};
  SourceSnapshot after;
  after.system_includes = {"yaml-cpp/yaml.h", "vector"};
  CommitSemanticExtraction extraction;

  DiffSnapshots("src/config.cpp", before, after, extraction);

  EXPECT_THAT(extraction.dependencies,
              UnorderedElementsAre(Pair("yaml-cpp", ChangeKind::kAdded),
                                   Pair("boost", ChangeKind::kRemoved)));
}

TEST(ParseSourceSnapshotTest, CollectsDeclarationsFromMemory) {
  const auto snapshot = ParseSourceSnapshot("include/auth/token_store.h", R"(
namespace auth {
class TokenStore {
public:
  virtual ~TokenStore() = default;
  virtual bool Verify(const char *token) const = 0;
};

template <typename T> T Identity(T value) { return value; }
} // namespace auth
)");

  EXPECT_THAT(snapshot.namespaces, ElementsAre("auth"));
  EXPECT_THAT(snapshot.records, ElementsAre("auth::TokenStore"));
  EXPECT_THAT(snapshot.abstract_records, ElementsAre("auth::TokenStore"));
  EXPECT_THAT(snapshot.templates, Contains("auth::Identity"));
  EXPECT_THAT(snapshot.functions, Contains(Key("auth::TokenStore::Verify")));
  EXPECT_THAT(snapshot.parameters,
              Contains(Pair("auth::TokenStore::Verify", "(const char *)")));
}

TEST(ClangSemanticExtractorTest, DiffsAddedHeadersAgainstNothing) {
  auto reader = std::make_shared<test::MapRevisionReader>();
  reader->Put("c2", "include/store.h", R"(
namespace storage {
class Store {
public:
  virtual ~Store() = default;
  virtual void Put(int key) = 0;
};
} // namespace storage
)");
  CommitRecord commit;
  commit.sha = "c2";
  commit.parents = {"c1"};
  commit.files = {FileChange{"include/store.h", FileStatus::kAdded},
                  FileChange{"README.md", FileStatus::kModified}};
  const ClangSemanticExtractor extractor(reader);

  const auto extraction = extractor.Extract(commit);

  EXPECT_EQ("c2", extraction.sha);
  EXPECT_EQ(2u, extraction.functions.size());
  EXPECT_THAT(extraction.architectural_signals,
              ElementsAre("new-interface", "new-namespace", "public-header-change"));
  EXPECT_NEAR(0.55, extraction.significance, 1e-9);
}

TEST(ClangSemanticExtractorTest, HandlesOnlyCxxFiles) {
  const ClangSemanticExtractor extractor(std::make_shared<test::MapRevisionReader>());
  EXPECT_EQ("clang", extractor.Name());
  EXPECT_TRUE(extractor.CanHandle("src/main.cc"));
  EXPECT_FALSE(extractor.CanHandle("package.json"));
}

TEST(ClangSemanticExtractorTest, RejectsNullReader) {
  EXPECT_THROW(ClangSemanticExtractor(nullptr), std::invalid_argument);
}

} // namespace
} // namespace adr
