// Repository: Reelmix
// Component: Transition Optimizer
// Purpose: Nudges clip starts toward a nearby cut point within a tolerance
// Copyright (c) 2026 Reelmix contributors

#ifndef REELMIX_SELECTION_TRANSITION_OPTIMIZER_HPP_
#define REELMIX_SELECTION_TRANSITION_OPTIMIZER_HPP_

#include <cstdint>
#include <vector>

#include "reelmix/selection/SelectionConfig.hpp"
#include "reelmix/selection/SelectionTypes.hpp"

namespace reelmix::selection {

class IRandomSource;

// =============================================================================
// TransitionOptimizer
// For each clip, draws 1..max_candidates cut points uniformly in
// [0, duration), keeps the one closest to the midpoint, and moves the clip
// start there when |offset - duration/2| <= max_shift_fraction * duration
// (boundary inclusive). Only start_sec changes; order and count are kept.
//
// The optimizer does not talk to the resource trackers. A shift is applied
// only if the moved window still ends inside the clip's reservation, so the
// caller must reserve headroom (SelectionConfig::ReservationLengthSec()).
// =============================================================================

class TransitionOptimizer {
 public:
  explicit TransitionOptimizer(IRandomSource& random,
                               int32_t max_candidates = kDefaultMaxTransitionCandidates,
                               double max_shift_fraction = kDefaultMaxShiftFraction);

  // Returns a copy of clips with accepted shifts applied.
  std::vector<Clip> Optimize(const std::vector<Clip>& clips);

  // Candidate cut point (offset from clip start) closest to the midpoint.
  double ProposeCutOffset(const Clip& clip);

  // Applies offset to clip if it is within tolerance and the moved window
  // stays inside the reservation. Returns true when clip was modified.
  bool TryShift(Clip& clip, double offset_sec) const;

  // |offset - duration/2| <= max_shift_fraction * duration.
  static bool WithinTolerance(double offset_sec, double duration_sec,
                              double max_shift_fraction);

 private:
  IRandomSource& random_;
  int32_t max_candidates_;
  double max_shift_fraction_;
};

}  // namespace reelmix::selection

#endif  // REELMIX_SELECTION_TRANSITION_OPTIMIZER_HPP_
