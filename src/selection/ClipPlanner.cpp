// Repository: Reelmix
// Component: Clip Planner Implementation
// Copyright (c) 2026 Reelmix contributors

#include "reelmix/selection/ClipPlanner.hpp"

#include "reelmix/allocation/ResourceTracker.hpp"
#include "reelmix/selection/SelectionEngine.hpp"
#include "reelmix/selection/TransitionOptimizer.hpp"

namespace reelmix::selection {

SelectionOutcome PlanClips(const std::vector<allocation::SourceFile>& sources,
                           const SelectionConfig& config,
                           IRandomSource& random,
                           IFeatureScorer& scorer) {
  SelectionEngine engine(config, random, scorer);

  std::vector<allocation::ResourceTracker> trackers;
  trackers.reserve(sources.size());
  for (const auto& source : sources) {
    trackers.emplace_back(source, config.min_gap_sec);
  }

  SelectionOutcome outcome = engine.Run(trackers);
  if (config.optimize_transitions && !outcome.clips.empty()) {
    TransitionOptimizer optimizer(random, config.max_transition_candidates,
                                  config.max_shift_fraction);
    outcome.clips = optimizer.Optimize(outcome.clips);
  }
  return outcome;
}

}  // namespace reelmix::selection
