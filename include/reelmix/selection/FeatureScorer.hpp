// Repository: Reelmix
// Component: Feature Scorer
// Purpose: Heuristic visual scores for a candidate window
// Copyright (c) 2026 Reelmix contributors

#ifndef REELMIX_SELECTION_FEATURE_SCORER_HPP_
#define REELMIX_SELECTION_FEATURE_SCORER_HPP_

#include "reelmix/allocation/AllocationTypes.hpp"
#include "reelmix/selection/SelectionTypes.hpp"

namespace reelmix::selection {

class IRandomSource;

// Bounds of the stand-in score range used when no real analysis is available
// (and whenever analysis fails).
constexpr double kDefaultFeatureMin = 0.1;
constexpr double kDefaultFeatureMax = 0.9;

class IFeatureScorer {
 public:
  virtual ~IFeatureScorer() = default;

  // Scores [start_sec, start_sec + duration_sec) of source. May throw on
  // analysis failure; callers go through ScoreOrDefault().
  virtual FeatureVector Score(const allocation::SourceFile& source,
                              double start_sec, double duration_sec) = 0;
};

// Placeholder analyzer: each component drawn independently from
// [kDefaultFeatureMin, kDefaultFeatureMax]. Deterministic for a fixed seed.
class RandomFeatureScorer : public IFeatureScorer {
 public:
  explicit RandomFeatureScorer(IRandomSource& random) : random_(random) {}

  FeatureVector Score(const allocation::SourceFile& source,
                      double start_sec, double duration_sec) override;

 private:
  IRandomSource& random_;
};

// Default-range random vector. Used as the substitute for failed analysis.
FeatureVector DefaultRangeFeatures(IRandomSource& random);

// Runs scorer; on any exception logs a warning and returns
// DefaultRangeFeatures(random). Out-of-range components are clamped to [0, 1].
// Scoring never aborts selection.
FeatureVector ScoreOrDefault(IFeatureScorer& scorer,
                             IRandomSource& random,
                             const allocation::SourceFile& source,
                             double start_sec, double duration_sec);

}  // namespace reelmix::selection

#endif  // REELMIX_SELECTION_FEATURE_SCORER_HPP_
