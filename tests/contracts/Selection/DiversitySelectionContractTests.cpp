// Repository: Reelmix
// Component: Diversity Selection Contract Tests
// Purpose: Weighted quality / diversity scoring, scene threshold, fallback
//          to the plain draw, and per-source profiles.
// Copyright (c) 2026 Reelmix contributors

#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

#include "fixtures/FixedFeatureScorer.h"
#include "reelmix/allocation/ResourceTracker.hpp"
#include "reelmix/selection/RandomSource.hpp"
#include "reelmix/selection/SelectionEngine.hpp"
#include "reelmix/util/Logger.hpp"

using namespace reelmix;
using allocation::ResourceTracker;
using allocation::SourceFile;
using selection::FeatureVector;
using selection::SeededRandomSource;
using selection::SelectionConfig;
using selection::SelectionEngine;
using selection::SelectionOutcome;
using selection::SelectionPolicy;
using selection::SelectionStatus;
using tests::fixtures::FixedFeatureScorer;
using tests::fixtures::ThrowingFeatureScorer;

namespace {

constexpr FeatureVector kFeaturesA{0.50, 0.50, 0.50};
constexpr FeatureVector kFeaturesB{0.52, 0.48, 0.51};

std::vector<ResourceTracker> TwoLongSources() {
  std::vector<ResourceTracker> trackers;
  trackers.emplace_back(SourceFile{"a.mp4", 1000.0, 1000}, 1.0);
  trackers.emplace_back(SourceFile{"b.mp4", 1000.0, 2000}, 1.0);
  return trackers;
}

SelectionConfig DiversityConfig(double weight) {
  SelectionConfig config;
  config.policy = SelectionPolicy::kDiversity;
  config.diversity_weight = weight;
  return config;
}

std::map<std::string, int> CountBySource(const SelectionOutcome& outcome) {
  std::map<std::string, int> counts;
  for (const auto& clip : outcome.clips) ++counts[clip.source_uri];
  return counts;
}

}  // namespace

TEST(DiversitySelectionContract, FullDiversityWeightSpreadsAcrossSimilarSources) {
  int zero_weight_a = 0;
  int zero_weight_b = 0;
  int full_weight_a = 0;
  int full_weight_b = 0;

  for (uint64_t seed = 0; seed < 10; ++seed) {
    for (double weight : {0.0, 1.0}) {
      SeededRandomSource random(seed);
      FixedFeatureScorer scorer;
      scorer.Set("a.mp4", kFeaturesA);
      scorer.Set("b.mp4", kFeaturesB);
      auto trackers = TwoLongSources();

      SelectionEngine engine(DiversityConfig(weight), random, scorer);
      auto outcome = engine.Run(trackers);
      ASSERT_EQ(outcome.status, SelectionStatus::kComplete);

      auto counts = CountBySource(outcome);
      if (weight == 0.0) {
        zero_weight_a += counts["a.mp4"];
        zero_weight_b += counts["b.mp4"];
      } else {
        full_weight_a += counts["a.mp4"];
        full_weight_b += counts["b.mp4"];
      }
    }
  }

  // Quality only: b's mean is marginally higher, so it always wins.
  EXPECT_EQ(zero_weight_a, 0);
  EXPECT_EQ(zero_weight_b, 120);

  // Diversity only: whichever source is under-represented wins the slot.
  EXPECT_GE(full_weight_a, 50);
  EXPECT_GE(full_weight_b, 50);
}

TEST(DiversitySelectionContract, FirstSlotTieKeepsFirstEvaluatedCandidate) {
  SeededRandomSource random(4);
  FixedFeatureScorer scorer;
  scorer.Set("a.mp4", kFeaturesA);
  scorer.Set("b.mp4", kFeaturesB);
  auto trackers = TwoLongSources();

  SelectionConfig config = DiversityConfig(1.0);
  config.target_total_sec = 5.0;
  SelectionEngine engine(config, random, scorer);
  auto outcome = engine.Run(trackers);

  // Nothing selected yet: every candidate scores 0.
  ASSERT_EQ(outcome.clips.size(), 1u);
  EXPECT_EQ(outcome.clips[0].source_uri, "a.mp4");
}

TEST(DiversitySelectionContract, SceneThresholdFiltersCandidates) {
  SeededRandomSource random(6);
  FixedFeatureScorer scorer;
  scorer.Set("a.mp4", FeatureVector{0.2, 0.95, 0.95});  // best quality, low scene
  scorer.Set("b.mp4", FeatureVector{0.8, 0.3, 0.3});
  auto trackers = TwoLongSources();

  SelectionConfig config = DiversityConfig(0.0);
  config.min_scene_score = 0.5;
  SelectionEngine engine(config, random, scorer);
  auto outcome = engine.Run(trackers);

  ASSERT_EQ(outcome.status, SelectionStatus::kComplete);
  EXPECT_EQ(CountBySource(outcome)["b.mp4"], 12);
}

TEST(DiversitySelectionContract, AllCandidatesFilteredFallsBackToPlainDraw) {
  SeededRandomSource random(6);
  FixedFeatureScorer scorer(FeatureVector{0.4, 0.4, 0.4});
  auto trackers = TwoLongSources();

  SelectionConfig config = DiversityConfig(0.5);
  config.min_scene_score = 0.9;
  SelectionEngine engine(config, random, scorer);
  auto outcome = engine.Run(trackers);

  EXPECT_EQ(outcome.status, SelectionStatus::kComplete);
  ASSERT_EQ(outcome.clips.size(), 12u);
  for (const auto& clip : outcome.clips) {
    // Fallback placements are still scored.
    EXPECT_DOUBLE_EQ(clip.features.scene, 0.4);
  }
}

TEST(DiversitySelectionContract, FailingAnalysisNeverAbortsRun) {
  std::vector<std::string> warnings;
  util::Logger::SetWarnSink([&](const std::string& line) { warnings.push_back(line); });

  SeededRandomSource random(12);
  ThrowingFeatureScorer scorer;
  auto trackers = TwoLongSources();
  SelectionEngine engine(DiversityConfig(0.5), random, scorer);

  SelectionOutcome outcome;
  EXPECT_NO_THROW(outcome = engine.Run(trackers));
  util::Logger::SetWarnSink(nullptr);

  EXPECT_EQ(outcome.status, SelectionStatus::kComplete);
  EXPECT_EQ(outcome.clips.size(), 12u);
  for (const auto& clip : outcome.clips) {
    EXPECT_GE(clip.features.scene, selection::kDefaultFeatureMin);
    EXPECT_LE(clip.features.scene, selection::kDefaultFeatureMax);
  }
  EXPECT_GT(scorer.calls(), 0);
  EXPECT_FALSE(warnings.empty());
}

TEST(DiversitySelectionContract, ProfilesSampleEachSource) {
  SeededRandomSource random(8);
  FixedFeatureScorer scorer;
  scorer.Set("a.mp4", kFeaturesA);
  scorer.Set("b.mp4", kFeaturesB);

  std::vector<ResourceTracker> trackers;
  trackers.emplace_back(SourceFile{"a.mp4", 300.0, 1}, 1.0);
  trackers.emplace_back(SourceFile{"b.mp4", 300.0, 2}, 1.0);
  trackers.emplace_back(SourceFile{"dead.mp4", 0.0, 3}, 1.0);

  SelectionEngine engine(DiversityConfig(0.5), random, scorer);
  auto outcome = engine.Run(trackers);

  ASSERT_EQ(outcome.source_profiles.size(), 3u);
  EXPECT_EQ(outcome.source_profiles[0].source_uri, "a.mp4");
  EXPECT_EQ(outcome.source_profiles[0].sample_count, selection::kDefaultProfileSampleWindows);
  EXPECT_NEAR(outcome.source_profiles[0].mean_features.scene, 0.50, 1e-12);
  EXPECT_NEAR(outcome.source_profiles[1].mean_features.motion, 0.48, 1e-12);
  EXPECT_EQ(outcome.source_profiles[2].sample_count, 0);
}

TEST(DiversitySelectionContract, CandidateDrawsBoundedPerSource) {
  SeededRandomSource random(8);
  FixedFeatureScorer scorer;
  auto trackers = TwoLongSources();

  SelectionConfig config = DiversityConfig(0.5);
  config.target_total_sec = 5.0;
  SelectionEngine engine(config, random, scorer);
  engine.Run(trackers);

  // Profiles: 5 windows x 2 sources. One slot: 5 draws x 2 sources.
  EXPECT_EQ(scorer.calls(), 2 * selection::kDefaultProfileSampleWindows +
                                2 * selection::kDefaultCandidateDrawsPerSource);
}

TEST(DiversitySelectionContract, ShortfallReportedLikePlainPolicy) {
  SeededRandomSource random(1);
  FixedFeatureScorer scorer;
  std::vector<ResourceTracker> trackers;
  trackers.emplace_back(SourceFile{"only.mp4", 11.0, 1}, 1.0);

  SelectionEngine engine(DiversityConfig(0.5), random, scorer);
  auto outcome = engine.Run(trackers);

  EXPECT_EQ(outcome.status, SelectionStatus::kShortfall);
  EXPECT_GE(outcome.clips.size(), 1u);
  EXPECT_LE(outcome.clips.size(), 2u);
  EXPECT_DOUBLE_EQ(outcome.shortfall_sec, 60.0 - 5.0 * outcome.clips.size());
}
