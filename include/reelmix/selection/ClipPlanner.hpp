// Repository: Reelmix
// Component: Clip Planner
// Purpose: One selection run: trackers → engine → transition optimizer
// Copyright (c) 2026 Reelmix contributors

#ifndef REELMIX_SELECTION_CLIP_PLANNER_HPP_
#define REELMIX_SELECTION_CLIP_PLANNER_HPP_

#include <vector>

#include "reelmix/allocation/AllocationTypes.hpp"
#include "reelmix/selection/SelectionConfig.hpp"
#include "reelmix/selection/SelectionTypes.hpp"

namespace reelmix::selection {

class IFeatureScorer;
class IRandomSource;

// Builds a fresh tracker per source (min_gap from config), runs the
// configured policy and, when enabled, the transition optimizer.
// Throws std::invalid_argument for an invalid config.
SelectionOutcome PlanClips(const std::vector<allocation::SourceFile>& sources,
                           const SelectionConfig& config,
                           IRandomSource& random,
                           IFeatureScorer& scorer);

}  // namespace reelmix::selection

#endif  // REELMIX_SELECTION_CLIP_PLANNER_HPP_
