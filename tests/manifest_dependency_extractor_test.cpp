#include <adr/manifest_dependency_extractor.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

#include "test_support/map_revision_reader.h"

namespace adr {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Pair;
using ::testing::UnorderedElementsAre;

TEST(ManifestParsingTest, ReadsEveryPackageJsonSection) {
  const auto parsed = ParseManifest("web/package.json", R"({
  "name": "web",
  "version": "1.0.0",
  "dependencies": { "express": "^4.18.0", "jsonwebtoken": "9.0.0" },
  "devDependencies": { "jest": "^29.0.0" },
  "peerDependencies": { "react": ">=18" }
})");

  EXPECT_THAT(parsed, UnorderedElementsAre(Pair("express", "^4.18.0"),
                                           Pair("jsonwebtoken", "9.0.0"),
                                           Pair("jest", "^29.0.0"),
                                           Pair("react", ">=18")));
}

TEST(ManifestParsingTest, ReadsRequirementsSkippingCommentsAndOptions) {
  const auto parsed = ParseManifest("requirements.txt",
                                    "# pinned\n"
                                    "requests==2.31.0\n"
                                    "-r base.txt\n"
                                    "uvicorn[standard]>=0.23\n"
                                    "click\n");

  EXPECT_THAT(parsed, UnorderedElementsAre(Pair("requests", "==2.31.0"),
                                           Pair("uvicorn", ">=0.23"),
                                           Pair("click", "")));
}

TEST(ManifestParsingTest, ReadsGoModRequireBlocksAndLines) {
  const auto parsed = ParseManifest("go.mod",
                                    "module example.com/app\n"
                                    "\n"
                                    "go 1.21\n"
                                    "\n"
                                    "require github.com/spf13/cobra v1.8.0\n"
                                    "require (\n"
                                    "\tgolang.org/x/sync v0.5.0 // indirect\n"
                                    ")\n");

  EXPECT_THAT(parsed,
              UnorderedElementsAre(Pair("github.com/spf13/cobra", "v1.8.0"),
                                   Pair("golang.org/x/sync", "v0.5.0")));
}

TEST(ManifestParsingTest, ReadsCargoDependencyTables) {
  const auto parsed = ParseManifest("Cargo.toml",
                                    "[package]\n"
                                    "name = \"tool\"\n"
                                    "version = \"0.1.0\"\n"
                                    "\n"
                                    "[dependencies]\n"
                                    "serde = { version = \"1.0\", features = [\"derive\"] }\n"
                                    "anyhow = \"1\"\n"
                                    "\n"
                                    "[dev-dependencies]\n"
                                    "proptest = \"1.4\"\n");

  EXPECT_THAT(parsed, UnorderedElementsAre(Pair("serde", "1.0"),
                                           Pair("anyhow", "1"),
                                           Pair("proptest", "1.4")));
}

TEST(ManifestParsingTest, ReadsCMakeFindPackageCalls) {
  const auto parsed = ParseManifest("CMakeLists.txt",
                                    "cmake_minimum_required(VERSION 3.16)\n"
                                    "find_package(Threads REQUIRED)\n"
                                    "FIND_PACKAGE(Boost 1.74 COMPONENTS system)\n");

  EXPECT_THAT(parsed, UnorderedElementsAre(Pair("Threads", ""),
                                           Pair("Boost", "1.74")));
}

TEST(ManifestParsingTest, ReadsVcpkgStringsAndObjects) {
  const auto parsed = ParseManifest("vcpkg.json", R"({
  "name": "app",
  "dependencies": [
    "fmt",
    { "name": "yaml-cpp", "version>=": "0.7.0" }
  ]
})");

  EXPECT_THAT(parsed, UnorderedElementsAre(Pair("fmt", ""),
                                           Pair("yaml-cpp", "0.7.0")));
}

TEST(ManifestParsingTest, ReadsConanRequires) {
  const auto parsed = ParseManifest("conanfile.txt",
                                    "[requires]\n"
                                    "zlib/1.3\n"
                                    "openssl/3.2.0@user/stable\n"
                                    "\n"
                                    "[generators]\n"
                                    "CMakeDeps\n");

  EXPECT_THAT(parsed, UnorderedElementsAre(Pair("zlib", "1.3"),
                                           Pair("openssl", "3.2.0")));
}

TEST(ManifestParsingTest, RejectsUnknownFiles) {
  EXPECT_FALSE(IsManifestPath("src/package.js"));
  EXPECT_TRUE(IsManifestPath("services/api/go.mod"));
  EXPECT_THROW(ParseManifest("pom.xml", "<project/>"), ExtractionError);
}

class ManifestDependencyExtractorTest : public ::testing::Test {
protected:
  CommitRecord Commit(FileStatus status,
                      const std::string &path = "package.json") const {
    CommitRecord commit;
    commit.sha = "c2";
    commit.parents = {"c1"};
    commit.files.push_back(FileChange{path, status});
    return commit;
  }

  std::shared_ptr<test::MapRevisionReader> reader_ =
      std::make_shared<test::MapRevisionReader>();
};

TEST_F(ManifestDependencyExtractorTest, ComparesAgainstFirstParent) {
  reader_->Put("c1", "package.json",
               R"({"dependencies": {"express": "4.17.0", "lodash": "4.0.0"}})");
  reader_->Put("c2", "package.json",
               R"({"dependencies": {"express": "4.18.0", "jsonwebtoken": "9.0.0"}})");
  const ManifestDependencyExtractor extractor(reader_);

  const auto extraction = extractor.Extract(Commit(FileStatus::kModified));

  EXPECT_EQ("c2", extraction.sha);
  EXPECT_THAT(extraction.dependencies,
              UnorderedElementsAre(Pair("express", ChangeKind::kModified),
                                   Pair("jsonwebtoken", ChangeKind::kAdded),
                                   Pair("lodash", ChangeKind::kRemoved)));
  EXPECT_THAT(extraction.architectural_signals,
              ElementsAre("dependency-added", "dependency-removed"));
  EXPECT_NEAR(0.6, extraction.significance, 1e-9);
}

TEST_F(ManifestDependencyExtractorTest, AddedManifestIsABuildSystemChange) {
  reader_->Put("c2", "requirements.txt", "flask==3.0\n");
  const ManifestDependencyExtractor extractor(reader_);

  const auto extraction =
      extractor.Extract(Commit(FileStatus::kAdded, "requirements.txt"));

  EXPECT_THAT(extraction.dependencies,
              ElementsAre(Pair("flask", ChangeKind::kAdded)));
  EXPECT_THAT(extraction.architectural_signals,
              ElementsAre("dependency-added", "build-system-change"));
  EXPECT_NEAR(0.4, extraction.significance, 1e-9);
}

TEST_F(ManifestDependencyExtractorTest, DeletedManifestRemovesEverything) {
  reader_->Put("c1", "go.mod", "require example.com/lib v1.0.0\n");
  const ManifestDependencyExtractor extractor(reader_);

  const auto extraction = extractor.Extract(Commit(FileStatus::kDeleted, "go.mod"));

  EXPECT_THAT(extraction.dependencies,
              ElementsAre(Pair("example.com/lib", ChangeKind::kRemoved)));
  EXPECT_THAT(extraction.architectural_signals,
              ElementsAre("dependency-removed", "build-system-change"));
}

TEST_F(ManifestDependencyExtractorTest, IgnoresOtherFilesAndUnchangedManifests) {
  reader_->Put("c1", "Cargo.toml", "[dependencies]\nserde = \"1\"\n");
  reader_->Put("c2", "Cargo.toml", "[dependencies]\nserde = \"1\"\n");
  auto commit = Commit(FileStatus::kModified, "Cargo.toml");
  commit.files.push_back(FileChange{"src/main.rs"});
  const ManifestDependencyExtractor extractor(reader_);

  const auto extraction = extractor.Extract(commit);

  EXPECT_THAT(extraction.dependencies, IsEmpty());
  EXPECT_THAT(extraction.architectural_signals, IsEmpty());
  EXPECT_DOUBLE_EQ(0.0, extraction.significance);
}

TEST_F(ManifestDependencyExtractorTest, RootCommitReadsNoParent) {
  reader_->Put("c2", "CMakeLists.txt", "find_package(yaml-cpp REQUIRED)\n");
  auto commit = Commit(FileStatus::kModified, "CMakeLists.txt");
  commit.parents.clear();
  const ManifestDependencyExtractor extractor(reader_);

  const auto extraction = extractor.Extract(commit);

  EXPECT_THAT(extraction.dependencies,
              ElementsAre(Pair("yaml-cpp", ChangeKind::kAdded)));
  EXPECT_THAT(extraction.architectural_signals,
              ElementsAre("dependency-added", "build-system-change"));
}

TEST(ManifestDependencyExtractorConstructionTest, RejectsNullReader) {
  EXPECT_THROW(ManifestDependencyExtractor(nullptr), std::invalid_argument);
}

} // namespace
} // namespace adr
