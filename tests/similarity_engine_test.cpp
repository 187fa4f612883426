#include <adr/similarity_engine.h>

#include <gtest/gtest.h>

#include <stdexcept>

namespace adr {
namespace {

CommitFeatures Features(const std::string &sha, std::int64_t timestamp,
                        std::set<std::string> files,
                        std::set<std::string> patterns = {}) {
  CommitFeatures features;
  features.sha = sha;
  features.timestamp = timestamp;
  features.files = std::move(files);
  features.patterns = std::move(patterns);
  return features;
}

TEST(SimilarityEngineTest, TemporalScoreDecaysToFivePercentAtHorizon) {
  const SimilarityEngine engine({}, std::chrono::hours(4));

  EXPECT_DOUBLE_EQ(1.0, engine.TemporalScore(1000, 1000));
  EXPECT_NEAR(0.05, engine.TemporalScore(0, 4 * 3600), 1e-9);
  EXPECT_NEAR(0.05, engine.TemporalScore(4 * 3600, 0), 1e-9);
  EXPECT_GT(engine.TemporalScore(0, 600), engine.TemporalScore(0, 3600));
}

TEST(SimilarityEngineTest, JaccardOfFileAndPatternSets) {
  EXPECT_DOUBLE_EQ(0.0, JaccardSimilarity({}, {"a"}));
  EXPECT_DOUBLE_EQ(1.0, JaccardSimilarity({"a", "b"}, {"a", "b"}));
  EXPECT_DOUBLE_EQ(1.0 / 3.0, JaccardSimilarity({"a", "b"}, {"b", "c"}));
}

TEST(SimilarityEngineTest, ScoresAreSymmetricAndBounded) {
  const SimilarityEngine engine;
  const auto first = Features("a", 0, {"src/auth.ts", "src/user.ts"},
                              {"layer:auth"});
  const auto second = Features("b", 1800, {"src/auth.ts"}, {"layer:auth"});

  const auto forward = engine.Score(first, second);
  const auto backward = engine.Score(second, first);

  EXPECT_DOUBLE_EQ(forward.combined_score, backward.combined_score);
  EXPECT_DOUBLE_EQ(0.5, forward.file_overlap_score);
  EXPECT_DOUBLE_EQ(1.0, forward.pattern_score);
  EXPECT_GE(forward.combined_score, 0.0);
  EXPECT_LE(forward.combined_score, 1.0);
}

TEST(SimilarityEngineTest, SameCommitIsMaximallySimilar) {
  const SimilarityEngine engine;
  const auto commit = Features("abc", 0, {});

  EXPECT_DOUBLE_EQ(1.0, engine.Score(commit, commit).combined_score);
}

TEST(SimilarityEngineTest, WeightsAreNormalized) {
  const SimilarityEngine engine({2.0, 0.0, 2.0});

  EXPECT_DOUBLE_EQ(0.5, engine.Weights().temporal);
  EXPECT_DOUBLE_EQ(0.0, engine.Weights().file_overlap);
  EXPECT_DOUBLE_EQ(0.5, engine.Combine(1.0, 1.0, 0.0));
}

TEST(SimilarityEngineTest, RejectsInvalidWeightsAndHorizon) {
  EXPECT_THROW(SimilarityEngine({0.0, 0.0, 0.0}), std::invalid_argument);
  EXPECT_THROW(SimilarityEngine({-1.0, 1.0, 1.0}), std::invalid_argument);
  EXPECT_THROW(SimilarityEngine({}, std::chrono::seconds(0)),
               std::invalid_argument);
}

} // namespace
} // namespace adr
