#include <adr/cli_exit_codes.h>
#include <adr/process.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_repository.h"

namespace adr {
namespace {

using ::testing::HasSubstr;

constexpr std::int64_t kStart = 1709251200;

std::string LoadFile(const std::filesystem::path &path) {
  std::ifstream stream(path);
  return std::string((std::istreambuf_iterator<char>(stream)),
                     std::istreambuf_iterator<char>());
}

ProcessResult RunCli(std::vector<std::string> arguments) {
  arguments.insert(arguments.begin(), ADR_MINE_EXECUTABLE);
  return RunProcess(arguments);
}

// Two commits ten minutes apart that touch the same auth module.
void CommitAuthWork(const test::TemporaryRepository &repository) {
  repository.AddFile("src/auth/index.ts", "export * from './session';\n");
  repository.AddFile("src/auth/session.ts", "export const ttl = 60;\n");
  repository.Commit("Add auth middleware", kStart);
  repository.AddFile("src/auth/index.ts",
                     "export * from './session';\nexport * from './guard';\n");
  repository.AddFile("src/auth/session.ts", "export const ttl = 300;\n");
  repository.Commit("Harden auth session expiry", kStart + 600);
}

TEST(CliIntegrationTest, WritesMarkdownReportIntoTheRepository) {
  if (!test::GitAvailable()) {
    GTEST_SKIP() << "git is not installed";
  }
  test::TemporaryRepository repository;
  CommitAuthWork(repository);

  const auto result = RunCli({"mine", "--root", repository.root().string()});

  ASSERT_EQ(kExitSuccess, result.exit_code) << result.error_output;
  EXPECT_THAT(result.output, HasSubstr("Mined 1 decision(s) from 2 commit(s)"));
  const auto markdown = repository.root() / "decisions.md";
  ASSERT_TRUE(std::filesystem::exists(markdown));
  EXPECT_FALSE(std::filesystem::exists(repository.root() / "decisions.json"));
  const auto report = LoadFile(markdown);
  EXPECT_THAT(report, HasSubstr("# Architectural Decisions"));
  EXPECT_THAT(report, HasSubstr("-security"));
  EXPECT_THAT(report, HasSubstr("| Commits Walked | 2 |"));
}

TEST(CliIntegrationTest, MineIsTheDefaultCommandAndHonoursConfig) {
  if (!test::GitAvailable()) {
    GTEST_SKIP() << "git is not installed";
  }
  test::TemporaryRepository repository;
  CommitAuthWork(repository);
  test::TemporaryDirectory output;
  const auto config = output.AddFile(
      "adr.yml", "format: json\nout: " + output.root().string() + "\n");

  const auto result =
      RunCli({"--root", repository.root().string(), "--config", config.string()});

  ASSERT_EQ(kExitSuccess, result.exit_code) << result.error_output;
  EXPECT_FALSE(std::filesystem::exists(output.root() / "decisions.md"));
  const auto json = output.root() / "decisions.json";
  ASSERT_TRUE(std::filesystem::exists(json));
  EXPECT_THAT(LoadFile(json), HasSubstr("\"commits_walked\": 2"));
}

TEST(CliIntegrationTest, HighThresholdDiscardsEverything) {
  if (!test::GitAvailable()) {
    GTEST_SKIP() << "git is not installed";
  }
  test::TemporaryRepository repository;
  repository.AddFile("docs/intro.md", "hello\n");
  repository.Commit("Write intro", kStart);
  repository.AddFile("scripts/build.sh", "echo build\n");
  repository.Commit("Add build script", kStart + 86400 * 30);

  const auto result = RunCli({"mine", "--root", repository.root().string(),
                              "--min-confidence", "0.99"});

  ASSERT_EQ(kExitSuccess, result.exit_code) << result.error_output;
  EXPECT_THAT(result.output, HasSubstr("Mined 0 decision(s) from 2 commit(s)"));
  EXPECT_THAT(LoadFile(repository.root() / "decisions.md"),
              HasSubstr("| None | - | - | - | - |"));
}

TEST(CliIntegrationTest, NonRepositoryIsAGitError) {
  if (!test::GitAvailable()) {
    GTEST_SKIP() << "git is not installed";
  }
  test::TemporaryDirectory directory;

  const auto result = RunCli({"mine", "--root", directory.root().string()});

  EXPECT_EQ(kExitGitError, result.exit_code);
  EXPECT_THAT(result.output, HasSubstr("git-error"));
}

TEST(CliIntegrationTest, UsageErrorsExitWithOne) {
  EXPECT_EQ(kExitUsageError, RunCli({"mine", "--bogus"}).exit_code);
  EXPECT_EQ(kExitUsageError, RunCli({"publish"}).exit_code);
  EXPECT_EQ(kExitUsageError,
            RunCli({"mine", "--min-confidence", "2"}).exit_code);
  EXPECT_EQ(kExitSuccess, RunCli({"mine", "--help"}).exit_code);
}

TEST(CliIntegrationTest, CacheCleanReportsMissingCache) {
  test::TemporaryDirectory directory;

  const auto result =
      RunCli({"cache", "clean", "--root", directory.root().string()});

  EXPECT_EQ(kExitSuccess, result.exit_code);
  EXPECT_THAT(result.output, HasSubstr("No cache directory found at"));
}

} // namespace
} // namespace adr
