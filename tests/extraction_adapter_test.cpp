#include <adr/extraction_adapter.h>
#include <adr/pattern_data_source.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

#include "test_support/temporary_repository.h"

namespace adr {
namespace {

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Return;
using ::testing::Throw;

class MockExtractor : public SemanticExtractor {
public:
  MOCK_METHOD(std::string, Name, (), (const, override));
  MOCK_METHOD(bool, CanHandle, (const std::string &), (const, override));
  MOCK_METHOD(CommitSemanticExtraction, Extract, (const CommitRecord &),
              (const, override));
};

std::shared_ptr<MockExtractor> MakeExtractor(const std::string &name) {
  auto extractor = std::make_shared<::testing::NiceMock<MockExtractor>>();
  ON_CALL(*extractor, Name()).WillByDefault(Return(name));
  ON_CALL(*extractor, CanHandle(_)).WillByDefault(Return(true));
  return extractor;
}

CommitRecord Commit(const std::string &sha,
                    std::vector<std::string> paths = {"src/auth.ts"}) {
  CommitRecord commit;
  commit.sha = sha;
  commit.message = "Add auth";
  for (auto &path : paths) {
    commit.files.push_back(FileChange{std::move(path)});
  }
  return commit;
}

CommitSemanticExtraction Part(const std::string &pattern, double significance) {
  CommitSemanticExtraction part;
  part.patterns.push_back({pattern, ChangeKind::kAdded});
  part.significance = significance;
  return part;
}

TEST(MergeExtractionTest, ConcatenatesAndKeepsHighestSignificance) {
  CommitSemanticExtraction merged;
  auto first = Part("a", 0.2);
  first.dependencies = {{"lodash", ChangeKind::kAdded}};
  first.message_signals = {"auth"};
  auto second = Part("b", 1.7);
  second.dependencies = {{"lodash", ChangeKind::kRemoved}};
  second.message_signals = {"auth", "cache"};

  MergeExtraction(merged, first);
  MergeExtraction(merged, second);

  ASSERT_EQ(2u, merged.patterns.size());
  EXPECT_EQ("a", merged.patterns[0].id);
  EXPECT_EQ(ChangeKind::kAdded, merged.dependencies.at("lodash"));
  EXPECT_EQ(2u, merged.message_signals.size());
  EXPECT_DOUBLE_EQ(1.0, merged.significance);
}

TEST(ExtractionAdapterTest, MergesExtractorsInNameOrder) {
  auto beta = MakeExtractor("beta");
  auto alpha = MakeExtractor("alpha");
  ON_CALL(*beta, Extract(_)).WillByDefault(Return(Part("from-beta", 0.4)));
  ON_CALL(*alpha, Extract(_)).WillByDefault(Return(Part("from-alpha", 0.1)));
  const ExtractionAdapter adapter({beta, alpha}, nullptr, nullptr, {}, nullptr);
  std::vector<std::string> warnings;

  const auto extraction = adapter.Extract(Commit("c1"), warnings);

  EXPECT_THAT(adapter.ExtractorNames(), ElementsAre("alpha", "beta"));
  EXPECT_EQ("c1", extraction.sha);
  ASSERT_EQ(2u, extraction.patterns.size());
  EXPECT_EQ("from-alpha", extraction.patterns[0].id);
  EXPECT_EQ("from-beta", extraction.patterns[1].id);
  EXPECT_DOUBLE_EQ(0.4, extraction.significance);
  EXPECT_THAT(warnings, IsEmpty());
}

TEST(ExtractionAdapterTest, SkipsExtractorsThatHandleNoTouchedPath) {
  auto extractor = MakeExtractor("clang");
  ON_CALL(*extractor, CanHandle(_)).WillByDefault(Return(false));
  EXPECT_CALL(*extractor, Extract(_)).Times(0);
  const ExtractionAdapter adapter({extractor}, nullptr, nullptr, {}, nullptr);
  std::vector<std::string> warnings;

  const auto extraction = adapter.Extract(Commit("c1"), warnings);

  EXPECT_THAT(extraction.patterns, IsEmpty());
  EXPECT_DOUBLE_EQ(0.0, extraction.significance);
}

TEST(ExtractionAdapterTest, IsolatesExtractorFailures) {
  auto failing = MakeExtractor("broken");
  auto working = MakeExtractor("working");
  ON_CALL(*failing, Extract(_))
      .WillByDefault(Throw(ExtractionError("parse blew up")));
  ON_CALL(*working, Extract(_)).WillByDefault(Return(Part("ok", 0.3)));

  const ExtractionAdapter quiet({failing, working}, nullptr, nullptr, {},
                                nullptr);
  const auto batch = quiet.ExtractAll({Commit("c1"), Commit("c2")});

  ASSERT_EQ(2u, batch.extractions.size());
  EXPECT_EQ("ok", batch.extractions[1].patterns.front().id);
  EXPECT_THAT(batch.warnings,
              ElementsAre("extractor 'broken' failed on commit c1",
                          "extractor 'broken' failed on commit c2"));

  ExtractionAdapterConfig verbose;
  verbose.verbose = true;
  const ExtractionAdapter detailed({failing, working}, nullptr, nullptr,
                                   verbose, nullptr);
  std::vector<std::string> warnings;
  detailed.Extract(Commit("c3"), warnings);
  ASSERT_EQ(1u, warnings.size());
  EXPECT_THAT(warnings.front(), HasSubstr("parse blew up"));
}

TEST(ExtractionAdapterTest, CanHandleFailureIsIsolated) {
  auto failing = MakeExtractor("broken");
  auto working = MakeExtractor("working");
  ON_CALL(*failing, CanHandle(_))
      .WillByDefault(Throw(ExtractionError("cannot inspect path")));
  EXPECT_CALL(*failing, Extract(_)).Times(0);
  ON_CALL(*working, Extract(_)).WillByDefault(Return(Part("ok", 0.3)));
  const ExtractionAdapter adapter({failing, working}, nullptr, nullptr, {},
                                  nullptr);
  std::vector<std::string> warnings;

  CommitSemanticExtraction extraction;
  EXPECT_NO_THROW(extraction = adapter.Extract(Commit("c1"), warnings));

  ASSERT_EQ(1u, extraction.patterns.size());
  EXPECT_EQ("ok", extraction.patterns.front().id);
  EXPECT_THAT(warnings, ElementsAre("extractor 'broken' failed on commit c1"));
}

class ThrowingPatternData : public PatternDataSource {
public:
  std::vector<std::string>
  PatternsForFile(const std::string &path) const override {
    if (path == "src/broken.ts") {
      throw std::runtime_error("index unreadable");
    }
    return {"repository"};
  }
};

TEST(ExtractionAdapterTest, PatternDataFailureIsAWarning) {
  ExtractionAdapterConfig config;
  config.use_pattern_data = true;
  const ExtractionAdapter adapter(
      {}, std::make_shared<ThrowingPatternData>(), nullptr, config, nullptr);
  std::vector<std::string> warnings;

  const auto extraction = adapter.Extract(
      Commit("c1", {"src/broken.ts", "src/auth.ts"}), warnings);

  ASSERT_EQ(1u, extraction.patterns.size());
  EXPECT_EQ("repository", extraction.patterns.front().id);
  EXPECT_THAT(warnings, ElementsAre("pattern data lookup failed for "
                                    "src/broken.ts on commit c1"));
}

TEST(ExtractionAdapterTest, AppendsPatternDataWithoutDuplicates) {
  auto pattern_data = std::make_shared<TsvPatternDataSource>(
      std::map<std::string, std::vector<std::string>>{
          {"src/auth.ts", {"repository", "middleware"}},
          {"src/user.ts", {"repository"}}});
  ExtractionAdapterConfig config;
  config.use_pattern_data = true;
  const ExtractionAdapter adapter({}, pattern_data, nullptr, config, nullptr);
  std::vector<std::string> warnings;

  const auto extraction =
      adapter.Extract(Commit("c1", {"src/auth.ts", "src/user.ts"}), warnings);

  ASSERT_EQ(2u, extraction.patterns.size());
  EXPECT_EQ("repository", extraction.patterns[0].id);
  EXPECT_EQ("middleware", extraction.patterns[1].id);
}

TEST(ExtractionAdapterTest, RejectsInvalidConfiguration) {
  EXPECT_THROW(ExtractionAdapter({nullptr}, nullptr, nullptr, {}, nullptr),
               std::invalid_argument);
  ExtractionAdapterConfig config;
  config.use_pattern_data = true;
  EXPECT_THROW(ExtractionAdapter({}, nullptr, nullptr, config, nullptr),
               std::invalid_argument);
}

TEST(ExtractionAdapterTest, ReusesCachedExtractions) {
  test::TemporaryDirectory root;
  ExtractionCacheOptions options;
  options.enabled = true;
  auto cache = std::make_shared<ExtractionCache>(options, root.root(), nullptr);
  auto extractor = MakeExtractor("path-heuristics");
  EXPECT_CALL(*extractor, Extract(_))
      .Times(1)
      .WillOnce(Return(Part("layer:auth", 0.5)));
  const ExtractionAdapter adapter({extractor}, nullptr, cache, {}, nullptr);

  const auto first = adapter.ExtractAll({Commit("c1")});
  const auto second = adapter.ExtractAll({Commit("c1")});

  EXPECT_EQ(0u, first.cache_hits);
  EXPECT_EQ(1u, second.cache_hits);
  EXPECT_EQ("layer:auth", second.extractions.front().patterns.front().id);
  EXPECT_DOUBLE_EQ(0.5, second.extractions.front().significance);
}

TEST(ExtractionAdapterTest, DoesNotCacheRunsWithFailures) {
  test::TemporaryDirectory root;
  ExtractionCacheOptions options;
  options.enabled = true;
  auto cache = std::make_shared<ExtractionCache>(options, root.root(), nullptr);
  auto extractor = MakeExtractor("flaky");
  EXPECT_CALL(*extractor, Extract(_))
      .WillOnce(Throw(std::runtime_error("transient")))
      .WillOnce(Return(Part("p", 0.2)));
  const ExtractionAdapter adapter({extractor}, nullptr, cache, {}, nullptr);

  const auto first = adapter.ExtractAll({Commit("c1")});
  const auto second = adapter.ExtractAll({Commit("c1")});

  EXPECT_EQ(1u, first.warnings.size());
  EXPECT_EQ(0u, second.cache_hits);
  EXPECT_THAT(second.warnings, IsEmpty());
}

TEST(ExtractionAdapterTest, ParallelExtractionKeepsCommitOrder) {
  auto extractor = MakeExtractor("echo");
  ON_CALL(*extractor, Extract(_))
      .WillByDefault([](const CommitRecord &commit) {
        return Part(commit.sha, 0.1);
      });
  ExtractionAdapterConfig config;
  config.jobs = 4;
  const ExtractionAdapter adapter({extractor}, nullptr, nullptr, config,
                                  nullptr);
  std::vector<CommitRecord> commits;
  for (int i = 0; i < 32; ++i) {
    commits.push_back(Commit("c" + std::to_string(i)));
  }

  const auto batch = adapter.ExtractAll(commits);

  ASSERT_EQ(commits.size(), batch.extractions.size());
  for (std::size_t i = 0; i < commits.size(); ++i) {
    EXPECT_EQ(commits[i].sha, batch.extractions[i].sha);
    EXPECT_EQ(commits[i].sha, batch.extractions[i].patterns.front().id);
  }
}

} // namespace
} // namespace adr
