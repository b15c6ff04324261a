// Repository: Reelmix
// Component: Resource Tracker Contract Tests
// Purpose: Free-gap queries, two-stage placement draw, and the gap / overlap
//          guarantees of committed ranges within one source file.
// Copyright (c) 2026 Reelmix contributors

#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <vector>

#include "reelmix/allocation/ResourceTracker.hpp"
#include "reelmix/selection/RandomSource.hpp"
#include "support/ScriptedRandomSource.hpp"

using namespace reelmix;
using allocation::Interval;
using allocation::NoCapacityError;
using allocation::ResourceTracker;
using allocation::SourceFile;
using selection::SeededRandomSource;

namespace {

SourceFile MakeSource(const std::string& uri, double duration_sec) {
  SourceFile s;
  s.uri = uri;
  s.duration_sec = duration_sec;
  return s;
}

// Every pair of neighbouring committed ranges: no overlap, gap >= min_gap.
void ExpectWellSpaced(const ResourceTracker& tracker) {
  const auto& c = tracker.committed();
  for (size_t i = 0; i < c.size(); ++i) {
    EXPECT_GE(c[i].start_sec, 0.0);
    EXPECT_LE(c[i].end_sec, tracker.source().duration_sec + 1e-9);
    if (i > 0) {
      EXPECT_LE(c[i - 1].start_sec, c[i].start_sec);
      EXPECT_GE(c[i].start_sec - c[i - 1].end_sec, tracker.min_gap_sec() - 1e-9)
          << "ranges " << i - 1 << " and " << i << " closer than min_gap";
    }
  }
}

}  // namespace

// =============================================================================
// AvailableDuration
// =============================================================================

TEST(ResourceTrackerContract, FreshTrackerReportsWholeDuration) {
  ResourceTracker tracker(MakeSource("a.mp4", 42.0));
  EXPECT_DOUBLE_EQ(tracker.AvailableDuration(), 42.0);
  EXPECT_DOUBLE_EQ(tracker.min_gap_sec(), allocation::kDefaultMinGapSec);
}

TEST(ResourceTrackerContract, AvailableDurationSubtractsLengthsAndInnerGaps) {
  ResourceTracker tracker(MakeSource("a.mp4", 100.0), 1.0);
  tracker.Commit(0.0, 10.0);
  EXPECT_DOUBLE_EQ(tracker.AvailableDuration(), 90.0);

  tracker.Commit(50.0, 10.0);
  tracker.Commit(20.0, 10.0);
  // 100 - 30 committed - 2 inner gaps
  EXPECT_DOUBLE_EQ(tracker.AvailableDuration(), 68.0);
}

TEST(ResourceTrackerContract, AvailableDurationNeverNegative) {
  ResourceTracker tracker(MakeSource("a.mp4", 10.0), 5.0);
  tracker.Commit(0.0, 5.0);
  tracker.Commit(5.0, 5.0);
  EXPECT_DOUBLE_EQ(tracker.AvailableDuration(), 0.0);
}

TEST(ResourceTrackerContract, AvailableDurationIsIdempotent) {
  ResourceTracker tracker(MakeSource("a.mp4", 73.5), 1.0);
  tracker.Commit(12.0, 5.0);
  tracker.Commit(40.0, 5.0);
  const double first = tracker.AvailableDuration();
  const double second = tracker.AvailableDuration();
  EXPECT_EQ(first, second);
}

// =============================================================================
// FreeRanges / CanFit
// =============================================================================

TEST(ResourceTrackerContract, FileEdgesNeedNoBuffer) {
  ResourceTracker tracker(MakeSource("a.mp4", 20.0), 1.0);
  tracker.Commit(5.0, 5.0);

  auto ranges = tracker.FreeRanges(4.0);
  ASSERT_EQ(ranges.size(), 2u);
  EXPECT_DOUBLE_EQ(ranges[0].start_sec, 0.0);
  EXPECT_DOUBLE_EQ(ranges[0].end_sec, 4.0);
  EXPECT_DOUBLE_EQ(ranges[1].start_sec, 11.0);
  EXPECT_DOUBLE_EQ(ranges[1].end_sec, 20.0);
}

TEST(ResourceTrackerContract, InnerGapNeedsBufferOnBothSides) {
  ResourceTracker tracker(MakeSource("a.mp4", 30.0), 1.0);
  tracker.Commit(0.0, 10.0);
  tracker.Commit(17.0, 13.0);
  // Gap [10, 17) minus a buffer on each side leaves exactly 5 s.
  EXPECT_TRUE(tracker.CanFit(5.0));
  EXPECT_FALSE(tracker.CanFit(5.01));
}

TEST(ResourceTrackerContract, CannotFitLongerThanFile) {
  ResourceTracker tracker(MakeSource("a.mp4", 4.0));
  EXPECT_TRUE(tracker.CanFit(4.0));
  EXPECT_FALSE(tracker.CanFit(4.5));
}

TEST(ResourceTrackerContract, NonPositiveLengthNeverFits) {
  ResourceTracker tracker(MakeSource("a.mp4", 10.0));
  EXPECT_FALSE(tracker.CanFit(0.0));
  EXPECT_FALSE(tracker.CanFit(-1.0));
}

TEST(ResourceTrackerContract, ZeroDurationSourceHasNoCapacity) {
  ResourceTracker tracker(MakeSource("broken.mp4", 0.0));
  SeededRandomSource random(1);
  EXPECT_FALSE(tracker.CanFit(1.0));
  EXPECT_DOUBLE_EQ(tracker.AvailableDuration(), 0.0);
  try {
    tracker.ProposeStart(1.0, random);
    FAIL() << "expected NoCapacityError";
  } catch (const NoCapacityError& e) {
    EXPECT_EQ(e.uri(), "broken.mp4");
    EXPECT_DOUBLE_EQ(e.length_sec(), 1.0);
  }
}

TEST(ResourceTrackerContract, NegativeDurationTreatedAsZero) {
  ResourceTracker tracker(MakeSource("a.mp4", -3.0));
  EXPECT_DOUBLE_EQ(tracker.source().duration_sec, 0.0);
  EXPECT_FALSE(tracker.CanFit(0.5));
}

TEST(ResourceTrackerContract, NonFiniteDurationTreatedAsZero) {
  SeededRandomSource random(1);
  for (double duration : {std::numeric_limits<double>::infinity(),
                          std::numeric_limits<double>::quiet_NaN()}) {
    ResourceTracker tracker(MakeSource("inf.mp4", duration), 0.0);
    EXPECT_DOUBLE_EQ(tracker.source().duration_sec, 0.0);
    EXPECT_FALSE(tracker.CanFit(1.0));
    EXPECT_TRUE(tracker.FreeRanges(1.0).empty());
    EXPECT_THROW(tracker.ProposeStart(1.0, random), NoCapacityError);
  }
}

// =============================================================================
// ProposeStart
// =============================================================================

TEST(ResourceTrackerContract, FreshTrackerStartWithinBounds) {
  SeededRandomSource random(7);
  for (double length : {0.5, 3.0, 9.99, 10.0}) {
    ResourceTracker tracker(MakeSource("a.mp4", 10.0));
    for (int i = 0; i < 200; ++i) {
      const double start = tracker.ProposeStart(length, random);
      EXPECT_GE(start, 0.0);
      EXPECT_LE(start, 10.0 - length);
    }
  }
}

TEST(ResourceTrackerContract, ProposeStartDoesNotCommit) {
  SeededRandomSource random(3);
  ResourceTracker tracker(MakeSource("a.mp4", 30.0));
  tracker.ProposeStart(5.0, random);
  EXPECT_TRUE(tracker.committed().empty());
}

TEST(ResourceTrackerContract, CanFitAgreesWithProposeStart) {
  SeededRandomSource random(2024);
  for (int trial = 0; trial < 200; ++trial) {
    const double duration = random.Uniform(0.0, 50.0);
    ResourceTracker tracker(MakeSource("a.mp4", duration), 1.0);

    // Random valid state.
    const int commits = random.UniformInt(0, 5);
    for (int i = 0; i < commits; ++i) {
      const double length = random.Uniform(1.0, 8.0);
      if (!tracker.CanFit(length)) break;
      tracker.Commit(tracker.ProposeStart(length, random), length);
    }

    for (double length = 0.5; length <= 20.0; length += 0.5) {
      const bool fits = tracker.CanFit(length);
      bool proposed = true;
      try {
        const double start = tracker.ProposeStart(length, random);
        EXPECT_GE(start, 0.0);
        EXPECT_LE(start + length, duration + 1e-9);
      } catch (const NoCapacityError&) {
        proposed = false;
      }
      EXPECT_EQ(fits, proposed) << "duration=" << duration << " length=" << length;
    }
  }
}

TEST(ResourceTrackerContract, RandomCommitsStayWellSpaced) {
  SeededRandomSource random(99);
  for (int trial = 0; trial < 100; ++trial) {
    ResourceTracker tracker(MakeSource("a.mp4", 120.0), 1.0);
    const double length = random.Uniform(1.0, 10.0);
    while (tracker.CanFit(length)) {
      tracker.Commit(tracker.ProposeStart(length, random), length);
    }
    ExpectWellSpaced(tracker);
    EXPECT_FALSE(tracker.committed().empty());
  }
}

TEST(ResourceTrackerContract, TwoFourSecondClipsInTenSecondFile) {
  int two_clip_layouts = 0;
  for (uint64_t seed = 0; seed < 1000; ++seed) {
    SeededRandomSource random(seed);
    ResourceTracker tracker(MakeSource("a.mp4", 10.0), 1.0);
    for (int clip = 0; clip < 2; ++clip) {
      if (!tracker.CanFit(4.0)) break;
      tracker.Commit(tracker.ProposeStart(4.0, random), 4.0);
    }
    ASSERT_GE(tracker.committed().size(), 1u);
    ExpectWellSpaced(tracker);

    if (tracker.committed().size() == 2) {
      ++two_clip_layouts;
      const Interval& left = tracker.committed()[0];
      const Interval& right = tracker.committed()[1];
      // Only one slack second to share: left hugs the start, right the end.
      EXPECT_LE(left.start_sec, 1.0 + 1e-9);
      EXPECT_GE(right.start_sec, 5.0 - 1e-9);
      EXPECT_LE(right.end_sec, 10.0 + 1e-9);
    }
  }
  EXPECT_GT(two_clip_layouts, 0);
}

TEST(ResourceTrackerContract, ScriptedDrawPicksRangeThenOffset) {
  ResourceTracker tracker(MakeSource("a.mp4", 40.0), 0.0);
  tracker.Commit(10.0, 20.0);  // free: [0,10) and [30,40)

  ScriptedRandomSource random;
  random.PushIndex(1);
  random.PushFraction(0.5);
  // Second range, halfway between 30 and 40 - 4.
  EXPECT_DOUBLE_EQ(tracker.ProposeStart(4.0, random), 33.0);
}

TEST(ResourceTrackerContract, EveryEligibleGapHasEqualWeight) {
  ResourceTracker tracker(MakeSource("a.mp4", 100.0), 0.0);
  tracker.Commit(20.0, 75.0);  // free: [0,20) wide, [95,100) exactly 5 s

  SeededRandomSource random(5);
  int small_gap_hits = 0;
  constexpr int kTrials = 2000;
  for (int i = 0; i < kTrials; ++i) {
    if (tracker.ProposeStart(5.0, random) >= 95.0) ++small_gap_hits;
  }
  // A draw proportional to free start positions would essentially never
  // land in the exact-fit gap.
  EXPECT_GT(small_gap_hits, kTrials * 4 / 10);
  EXPECT_LT(small_gap_hits, kTrials * 6 / 10);
}

// =============================================================================
// Commit
// =============================================================================

TEST(ResourceTrackerContract, CommitKeepsRangesOrderedByStart) {
  ResourceTracker tracker(MakeSource("a.mp4", 100.0));
  tracker.Commit(60.0, 5.0);
  tracker.Commit(10.0, 5.0);
  tracker.Commit(30.0, 5.0);

  const auto& c = tracker.committed();
  ASSERT_EQ(c.size(), 3u);
  EXPECT_DOUBLE_EQ(c[0].start_sec, 10.0);
  EXPECT_DOUBLE_EQ(c[1].start_sec, 30.0);
  EXPECT_DOUBLE_EQ(c[2].start_sec, 60.0);
  EXPECT_DOUBLE_EQ(c[2].end_sec, 65.0);
}
