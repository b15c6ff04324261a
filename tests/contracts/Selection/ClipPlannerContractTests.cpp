// Repository: Reelmix
// Component: Clip Planner Contract Tests
// Copyright (c) 2026 Reelmix contributors

#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <stdexcept>
#include <vector>

#include "reelmix/selection/ClipPlanner.hpp"
#include "reelmix/selection/FeatureScorer.hpp"
#include "reelmix/selection/RandomSource.hpp"

using namespace reelmix;
using allocation::SourceFile;
using selection::SeededRandomSource;
using selection::SelectionConfig;
using selection::SelectionStatus;

namespace {

std::vector<SourceFile> Sources() {
  return {
      SourceFile{"/media/GX010003.MP4", 48.0, 3000},
      SourceFile{"/media/GX010001.MP4", 95.5, 1000},
      SourceFile{"/media/GX010002.MP4", 30.0, 2000},
  };
}

}  // namespace

TEST(ClipPlannerContract, TransitionShiftsStayInsideReservations) {
  for (uint64_t seed = 0; seed < 30; ++seed) {
    SeededRandomSource random(seed);
    selection::RandomFeatureScorer scorer(random);
    SelectionConfig config;
    config.optimize_transitions = true;
    config.policy = seed % 2 == 0 ? selection::SelectionPolicy::kPlain
                                  : selection::SelectionPolicy::kDiversity;

    const auto sources = Sources();
    auto outcome = selection::PlanClips(sources, config, random, scorer);
    ASSERT_TRUE(outcome.ok());

    std::map<int32_t, std::vector<selection::Clip>> by_source;
    for (const auto& clip : outcome.clips) {
      const auto& source = sources[static_cast<size_t>(clip.source_index)];
      EXPECT_GE(clip.start_sec, clip.reserved_start_sec);
      EXPECT_LE(clip.EndSec(), clip.reserved_end_sec + 1e-9);
      EXPECT_LE(clip.EndSec(), source.duration_sec + 1e-9);
      by_source[clip.source_index].push_back(clip);
    }

    // Clips of one source never overlap and keep the minimum gap.
    for (auto& entry : by_source) {
      auto& clips = entry.second;
      std::sort(clips.begin(), clips.end(),
                [](const selection::Clip& a, const selection::Clip& b) {
                  return a.start_sec < b.start_sec;
                });
      for (size_t i = 1; i < clips.size(); ++i) {
        EXPECT_GE(clips[i].start_sec - clips[i - 1].EndSec(), config.min_gap_sec - 1e-9);
      }
    }
  }
}

TEST(ClipPlannerContract, ResultSortedAfterOptimization) {
  SeededRandomSource random(77);
  selection::RandomFeatureScorer scorer(random);
  SelectionConfig config;
  config.optimize_transitions = true;

  auto outcome = selection::PlanClips(Sources(), config, random, scorer);
  for (size_t i = 1; i < outcome.clips.size(); ++i) {
    EXPECT_FALSE(selection::ClipOrderLess(outcome.clips[i], outcome.clips[i - 1]));
  }
}

TEST(ClipPlannerContract, MinGapComesFromConfig) {
  SeededRandomSource random(5);
  selection::RandomFeatureScorer scorer(random);
  SelectionConfig config;
  config.min_gap_sec = 0.0;
  config.target_total_sec = 20.0;

  // Exactly four back-to-back clips fit only without a gap.
  std::vector<SourceFile> sources = {SourceFile{"a.mp4", 20.0, 1}};
  auto outcome = selection::PlanClips(sources, config, random, scorer);
  EXPECT_GE(outcome.clips.size(), 1u);

  config.min_gap_sec = 100.0;
  SeededRandomSource random2(5);
  selection::RandomFeatureScorer scorer2(random2);
  auto gapped = selection::PlanClips(sources, config, random2, scorer2);
  EXPECT_EQ(gapped.clips.size(), 1u);
  EXPECT_EQ(gapped.status, SelectionStatus::kShortfall);
}

TEST(ClipPlannerContract, InvalidConfigThrows) {
  SeededRandomSource random(1);
  selection::RandomFeatureScorer scorer(random);
  SelectionConfig config;
  config.target_total_sec = 0.0;
  EXPECT_THROW(selection::PlanClips(Sources(), config, random, scorer),
               std::invalid_argument);
}
