#include <adr/git_history_walker.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_repository.h"

namespace adr {
namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

std::string Record(const std::string &sha, const std::string &parents,
                   std::int64_t timestamp, const std::string &message,
                   const std::string &files) {
  std::string record;
  record += kGitRecordSeparator;
  for (const auto &field :
       {sha, parents, std::string("Dev One"), std::string("dev@example.com"),
        std::to_string(timestamp), message}) {
    record += field;
    record += kGitFieldSeparator;
  }
  record += "\n";
  record += files;
  return record;
}

TEST(BuildGitLogCommandTest, AppliesBoundsAndMergePolicy) {
  WalkOptions options;
  options.root_path = "/repo";
  options.max_commits = 50;
  options.since = 1700000000;

  const auto command = BuildGitLogCommand(options);

  EXPECT_EQ("git", command.front());
  EXPECT_THAT(command, Contains("/repo"));
  EXPECT_THAT(command, Contains("--no-merges"));
  EXPECT_THAT(command, Contains("--since=@1700000000"));
  EXPECT_THAT(command, Contains("50"));

  options.include_merge_commits = true;
  options.max_commits = 0;
  const auto unbounded = BuildGitLogCommand(options);
  EXPECT_THAT(unbounded, ::testing::Not(Contains("--no-merges")));
  EXPECT_THAT(unbounded, ::testing::Not(Contains("-n")));
}

TEST(ParseGitLogTest, ParsesHeadersStatusAndChurn) {
  const auto output =
      Record("bbbb", "aaaa", 1700000100, "Add session store\n\nDetails\n",
             "\n:000000 100644 0000000 1234567 A\tsrc/session.ts\n"
             ":100644 100644 1111111 2222222 M\tsrc/auth.ts\n"
             "12\t0\tsrc/session.ts\n"
             "3\t1\tsrc/auth.ts\n") +
      Record("aaaa", "", 1700000000, "Initial commit\n",
             "\n:000000 100644 0000000 3333333 A\tlogo.png\n"
             "-\t-\tlogo.png\n");

  const auto commits = ParseGitLog(output);

  ASSERT_EQ(2u, commits.size());
  const auto &first = commits[0];
  EXPECT_EQ("bbbb", first.sha);
  EXPECT_THAT(first.parents, ElementsAre("aaaa"));
  EXPECT_FALSE(first.is_merge);
  EXPECT_EQ("Dev One", first.author);
  EXPECT_EQ("dev@example.com", first.author_email);
  EXPECT_EQ(1700000100, first.timestamp);
  EXPECT_EQ("Add session store\n\nDetails", first.message);
  ASSERT_EQ(2u, first.files.size());
  EXPECT_EQ("src/session.ts", first.files[0].path);
  EXPECT_EQ(FileStatus::kAdded, first.files[0].status);
  EXPECT_EQ(12, first.files[0].additions);
  EXPECT_EQ(FileStatus::kModified, first.files[1].status);
  EXPECT_EQ(1, first.files[1].deletions);

  EXPECT_THAT(commits[1].parents, IsEmpty());
  EXPECT_EQ(0, commits[1].files[0].additions);
}

TEST(ParseGitLogTest, FlagsMergeCommits) {
  const auto commits =
      ParseGitLog(Record("cccc", "aaaa bbbb", 1, "Merge branch 'x'", ""));

  ASSERT_EQ(1u, commits.size());
  EXPECT_TRUE(commits[0].is_merge);
  EXPECT_THAT(commits[0].files, IsEmpty());
}

TEST(ParseGitLogTest, RejectsMalformedOutput) {
  EXPECT_TRUE(ParseGitLog("").empty());
  std::string truncated;
  truncated += kGitRecordSeparator;
  truncated += "abcd";
  truncated += kGitFieldSeparator;
  EXPECT_THROW(ParseGitLog(truncated), HistoryError);
  EXPECT_THROW(ParseGitLog(Record("abcd", "", 1, "m", "\nbroken line\n")),
               HistoryError);
  EXPECT_THROW(
      ParseGitLog(Record("abcd", "", 1, "m", "\nx\ty\tfile.txt\n")),
      HistoryError);
}

TEST(ExclusionTest, MatchesGlobsAndDirectoryPrefixes) {
  EXPECT_TRUE(IsExcludedPath("vendor/lib.c", {"vendor"}));
  EXPECT_TRUE(IsExcludedPath("vendor/lib.c", {"vendor/"}));
  EXPECT_FALSE(IsExcludedPath("vendored/lib.c", {"vendor"}));
  EXPECT_TRUE(IsExcludedPath("package-lock.json", {"*.json"}));
  EXPECT_TRUE(IsExcludedPath("docs/a.md", {"docs/*.md"}));
  EXPECT_FALSE(IsExcludedPath("src/a.md", {"docs/*.md", ""}));
}

TEST(ExclusionTest, DropsCommitsLeftWithoutFiles) {
  CommitRecord vendored;
  vendored.sha = "v";
  vendored.files = {FileChange{"vendor/a.c"}};
  CommitRecord mixed;
  mixed.sha = "m";
  mixed.files = {FileChange{"vendor/b.c"}, FileChange{"src/b.c"}};
  CommitRecord empty;
  empty.sha = "e";

  const auto kept = ApplyExclusions({vendored, mixed, empty}, {"vendor"});

  ASSERT_EQ(2u, kept.size());
  EXPECT_EQ("m", kept[0].sha);
  ASSERT_EQ(1u, kept[0].files.size());
  EXPECT_EQ("src/b.c", kept[0].files[0].path);
  EXPECT_EQ("e", kept[1].sha);
}

class GitHistoryWalkerTest : public ::testing::Test {
protected:
  void SetUp() override {
    if (!test::GitAvailable()) {
      GTEST_SKIP() << "git is not available";
    }
  }
};

TEST_F(GitHistoryWalkerTest, WalksRealRepositoryNewestFirst) {
  test::TemporaryRepository repository;
  repository.AddFile("src/auth.ts", "export const a = 1;\n");
  repository.Commit("Add auth module", 1700000000);
  repository.AddFile("src/auth.ts", "export const a = 2;\n");
  repository.AddFile("vendor/lib.js", "x\n");
  repository.Commit("Tune auth", 1700000600);
  repository.AddFile("vendor/lib.js", "y\n");
  repository.Commit("Bump vendored lib", 1700001200);

  GitHistoryWalker walker;
  WalkOptions options;
  options.root_path = repository.root().string();
  options.exclude_paths = {"vendor"};

  const auto commits = walker.Walk(options);

  ASSERT_EQ(2u, commits.size());
  EXPECT_EQ("Tune auth", commits[0].message);
  EXPECT_EQ(1700000600, commits[0].timestamp);
  EXPECT_EQ("Test Author", commits[0].author);
  ASSERT_EQ(1u, commits[0].files.size());
  EXPECT_EQ("src/auth.ts", commits[0].files[0].path);
  EXPECT_EQ(FileStatus::kModified, commits[0].files[0].status);
  EXPECT_EQ(FileStatus::kAdded, commits[1].files[0].status);
  EXPECT_EQ(40u, commits[1].sha.size());
}

TEST_F(GitHistoryWalkerTest, HonorsCommitLimitAndTimeWindow) {
  test::TemporaryRepository repository;
  for (int i = 0; i < 4; ++i) {
    repository.AddFile("file.txt", std::to_string(i));
    repository.Commit("Change " + std::to_string(i), 1700000000 + i * 1000);
  }
  GitHistoryWalker walker;
  WalkOptions options;
  options.root_path = repository.root().string();

  options.max_commits = 2;
  const auto limited = walker.Walk(options);
  ASSERT_EQ(2u, limited.size());
  EXPECT_EQ("Change 3", limited[0].message);

  options.max_commits = 0;
  options.since = 1700001000;
  options.until = 1700002000;
  const auto window = walker.Walk(options);
  ASSERT_EQ(2u, window.size());
  EXPECT_EQ("Change 2", window[0].message);
  EXPECT_EQ("Change 1", window[1].message);
}

TEST_F(GitHistoryWalkerTest, EmptyRepositoryHasNoHistory) {
  test::TemporaryRepository repository;
  GitHistoryWalker walker;
  WalkOptions options;
  options.root_path = repository.root().string();

  EXPECT_THAT(walker.Walk(options), IsEmpty());
}

TEST_F(GitHistoryWalkerTest, FailsOutsideRepositories) {
  test::TemporaryDirectory plain;
  GitHistoryWalker walker;
  WalkOptions options;

  options.root_path = plain.root().string();
  EXPECT_THROW(walker.Walk(options), HistoryError);
  options.root_path = (plain.root() / "missing").string();
  EXPECT_THROW(walker.Walk(options), HistoryError);
}

TEST_F(GitHistoryWalkerTest, RevisionReaderReturnsFileAtCommit) {
  test::TemporaryRepository repository;
  repository.AddFile("package.json", "{\"name\": \"demo\"}\n");
  repository.Commit("Add manifest", 1700000000);
  const auto sha = repository.Git({"rev-parse", "HEAD"}).substr(0, 40);
  const GitRevisionReader reader(repository.root());

  EXPECT_EQ(std::optional<std::string>("{\"name\": \"demo\"}\n"),
            reader.Read(sha, "package.json"));
  EXPECT_FALSE(reader.Read(sha, "missing.json"));
  EXPECT_FALSE(reader.Read(sha + "^", "package.json"));
  EXPECT_FALSE(reader.Read("", "package.json"));
}

} // namespace
} // namespace adr
