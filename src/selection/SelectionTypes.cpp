// Repository: Reelmix
// Component: Selection Types Implementation
// Copyright (c) 2026 Reelmix contributors

#include "reelmix/selection/SelectionTypes.hpp"

#include <cmath>

namespace reelmix::selection {

double FeatureVector::MeanAbsDifference(const FeatureVector& other) const {
  return (std::fabs(scene - other.scene) +
          std::fabs(motion - other.motion) +
          std::fabs(color - other.color)) / 3.0;
}

bool ClipOrderLess(const Clip& a, const Clip& b) {
  if (a.timestamp_ms != b.timestamp_ms) {
    return a.timestamp_ms < b.timestamp_ms;
  }
  return a.start_sec < b.start_sec;
}

const char* SelectionPolicyName(SelectionPolicy policy) {
  switch (policy) {
    case SelectionPolicy::kPlain:
      return "plain";
    case SelectionPolicy::kDiversity:
      return "diversity";
  }
  return "unknown";
}

const char* SelectionStatusToString(SelectionStatus status) {
  switch (status) {
    case SelectionStatus::kComplete:
      return "COMPLETE";
    case SelectionStatus::kShortfall:
      return "SHORTFALL";
    case SelectionStatus::kNoClips:
      return "NO_CLIPS";
  }
  return "UNKNOWN";
}

}  // namespace reelmix::selection
