// Repository: Reelmix
// Component: Feature Scorer Implementation
// Copyright (c) 2026 Reelmix contributors

#include "reelmix/selection/FeatureScorer.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <sstream>

#include "reelmix/selection/RandomSource.hpp"
#include "reelmix/util/Logger.hpp"

namespace reelmix::selection {

using util::Logger;

namespace {

double ClampUnit(double v) {
  if (!std::isfinite(v)) return 0.0;
  return std::clamp(v, 0.0, 1.0);
}

}  // namespace

FeatureVector DefaultRangeFeatures(IRandomSource& random) {
  FeatureVector f;
  f.scene = random.Uniform(kDefaultFeatureMin, kDefaultFeatureMax);
  f.motion = random.Uniform(kDefaultFeatureMin, kDefaultFeatureMax);
  f.color = random.Uniform(kDefaultFeatureMin, kDefaultFeatureMax);
  return f;
}

FeatureVector RandomFeatureScorer::Score(const allocation::SourceFile& /*source*/,
                                         double /*start_sec*/,
                                         double /*duration_sec*/) {
  return DefaultRangeFeatures(random_);
}

FeatureVector ScoreOrDefault(IFeatureScorer& scorer,
                             IRandomSource& random,
                             const allocation::SourceFile& source,
                             double start_sec, double duration_sec) {
  try {
    FeatureVector f = scorer.Score(source, start_sec, duration_sec);
    f.scene = ClampUnit(f.scene);
    f.motion = ClampUnit(f.motion);
    f.color = ClampUnit(f.color);
    return f;
  } catch (const std::exception& e) {
    std::ostringstream oss;
    oss << "[FeatureScorer] SCORE_FAILED uri=" << source.uri
        << " start_sec=" << start_sec
        << " duration_sec=" << duration_sec
        << " reason=" << e.what()
        << " fallback=default_range";
    Logger::Warn(oss.str());
  }
  return DefaultRangeFeatures(random);
}

}  // namespace reelmix::selection
