// Repository: Reelmix
// Component: Selection Types
// Purpose: Clips, feature vectors and the outcome of a selection run
// Copyright (c) 2026 Reelmix contributors

#ifndef REELMIX_SELECTION_TYPES_HPP_
#define REELMIX_SELECTION_TYPES_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace reelmix::selection {

// =============================================================================
// FeatureVector
// Heuristic visual descriptors of one time window, each in [0, 1].
// =============================================================================

struct FeatureVector {
  double scene = 0.0;   // scene-change likelihood
  double motion = 0.0;
  double color = 0.0;   // color variety

  // Mean of the three components.
  double Mean() const { return (scene + motion + color) / 3.0; }

  // Mean absolute component-wise difference.
  double MeanAbsDifference(const FeatureVector& other) const;
};

// =============================================================================
// Clip
// A window [start_sec, start_sec + duration_sec) of one source. The window was
// reserved in the source's tracker as [reserved_start_sec, reserved_end_sec)
// when the clip was created; the transition optimizer may move start_sec but
// never past the reservation.
// =============================================================================

struct Clip {
  int32_t source_index = -1;   // index into the run's source list
  std::string source_uri;
  double start_sec = 0.0;
  double duration_sec = 0.0;
  int64_t timestamp_ms = 0;    // copied from the source at selection time
  FeatureVector features;

  double reserved_start_sec = 0.0;
  double reserved_end_sec = 0.0;

  double EndSec() const { return start_sec + duration_sec; }
};

// Lexicographic (timestamp, start) order of the final list.
bool ClipOrderLess(const Clip& a, const Clip& b);

// Average features of a source over evenly spaced sample windows.
struct SourceProfile {
  int32_t source_index = -1;
  std::string source_uri;
  FeatureVector mean_features;
  int32_t sample_count = 0;
};

enum class SelectionPolicy {
  kPlain,
  kDiversity,
};

const char* SelectionPolicyName(SelectionPolicy policy);

enum class SelectionStatus {
  // Requested clip count reached.
  kComplete,

  // Capacity ran out early; a non-empty list was produced.
  kShortfall,

  // Nothing could be selected. Reported as a failure.
  kNoClips,
};

const char* SelectionStatusToString(SelectionStatus status);

// =============================================================================
// SelectionOutcome
// Built once per run. clips is sorted by (timestamp, start).
// =============================================================================

struct SelectionOutcome {
  SelectionStatus status = SelectionStatus::kNoClips;
  SelectionPolicy policy = SelectionPolicy::kPlain;
  std::vector<Clip> clips;

  int32_t requested_clip_count = 0;
  double requested_duration_sec = 0.0;
  double selected_duration_sec = 0.0;
  double shortfall_sec = 0.0;

  // Diversity-aware runs only.
  std::vector<SourceProfile> source_profiles;

  bool ok() const { return status != SelectionStatus::kNoClips; }
};

}  // namespace reelmix::selection

#endif  // REELMIX_SELECTION_TYPES_HPP_
