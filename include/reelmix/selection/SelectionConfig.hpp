// Repository: Reelmix
// Component: Selection Config
// Purpose: Tunables for a selection run, with the heuristic constants named
// Copyright (c) 2026 Reelmix contributors

#ifndef REELMIX_SELECTION_CONFIG_HPP_
#define REELMIX_SELECTION_CONFIG_HPP_

#include <cstdint>
#include <string>

#include "reelmix/allocation/AllocationTypes.hpp"
#include "reelmix/selection/SelectionTypes.hpp"

namespace reelmix::selection {

constexpr double kDefaultClipLengthSec = 5.0;
constexpr double kDefaultTargetTotalSec = 60.0;
constexpr double kDefaultDiversityWeight = 0.5;
constexpr double kDefaultMinSceneScore = 0.0;

// Plain policy: keep this fraction of eligible sources (by remaining
// capacity, largest first) before the uniform draw. At least one is kept.
constexpr double kDefaultTopCandidateFraction = 0.5;

// Diversity policy: placements drawn per eligible source per slot.
constexpr int32_t kDefaultCandidateDrawsPerSource = 5;

// Diversity policy: windows sampled per source for its profile.
constexpr int32_t kDefaultProfileSampleWindows = 5;

// Transition optimizer: candidate cut points per clip, and the accepted
// distance from the clip midpoint as a fraction of its duration.
constexpr int32_t kDefaultMaxTransitionCandidates = 3;
constexpr double kDefaultMaxShiftFraction = 0.2;

struct SelectionConfig {
  double clip_length_sec = kDefaultClipLengthSec;
  double target_total_sec = kDefaultTargetTotalSec;
  SelectionPolicy policy = SelectionPolicy::kPlain;

  double diversity_weight = kDefaultDiversityWeight;
  double min_scene_score = kDefaultMinSceneScore;
  double min_gap_sec = allocation::kDefaultMinGapSec;

  double top_candidate_fraction = kDefaultTopCandidateFraction;
  int32_t candidate_draws_per_source = kDefaultCandidateDrawsPerSource;
  int32_t profile_sample_windows = kDefaultProfileSampleWindows;

  bool optimize_transitions = false;
  int32_t max_transition_candidates = kDefaultMaxTransitionCandidates;
  double max_shift_fraction = kDefaultMaxShiftFraction;

  uint64_t seed = 0;

  // ceil(target_total_sec / clip_length_sec). Config must be valid.
  int32_t RequestedClipCount() const;

  // Length reserved in the source per clip. With transition optimization the
  // reservation covers every start the optimizer may accept.
  double ReservationLengthSec() const;
};

struct ConfigValidationResult {
  bool valid;
  std::string detail;

  static ConfigValidationResult Success() { return {true, ""}; }
  static ConfigValidationResult Failure(const std::string& detail) {
    return {false, detail};
  }
};

// Fails fast on the first bad field.
ConfigValidationResult ValidateSelectionConfig(const SelectionConfig& config);

}  // namespace reelmix::selection

#endif  // REELMIX_SELECTION_CONFIG_HPP_
