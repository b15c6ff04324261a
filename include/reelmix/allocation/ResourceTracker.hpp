// Repository: Reelmix
// Component: Resource Tracker
// Purpose: Per-source bookkeeping of committed ranges and free-gap queries
// Copyright (c) 2026 Reelmix contributors

#ifndef REELMIX_ALLOCATION_RESOURCE_TRACKER_HPP_
#define REELMIX_ALLOCATION_RESOURCE_TRACKER_HPP_

#include <vector>

#include "reelmix/allocation/AllocationTypes.hpp"

namespace reelmix::selection {
class IRandomSource;
}  // namespace reelmix::selection

namespace reelmix::allocation {

// =============================================================================
// ResourceTracker
// Treats one source file as a bounded 1-D resource. Committed ranges are kept
// sorted by start. Any two committed ranges are at least min_gap apart; the
// file's own boundaries need no gap.
//
// The selection engine is the sole writer. Commit() trusts the caller: the
// placement must come from ProposeStart() (or have passed CanFit()).
// =============================================================================

class ResourceTracker {
 public:
  explicit ResourceTracker(SourceFile source, double min_gap_sec = kDefaultMinGapSec);

  const SourceFile& source() const { return source_; }
  double min_gap_sec() const { return min_gap_sec_; }
  const std::vector<Interval>& committed() const { return committed_; }

  // Total duration minus committed lengths minus one min_gap per pair of
  // neighbouring ranges. Never negative.
  double AvailableDuration() const;

  // True iff some free range (after the gap buffers next to existing ranges)
  // is at least length_sec wide. Non-positive lengths never fit.
  bool CanFit(double length_sec) const;

  // Two-stage draw: pick one eligible free range uniformly, then a uniform
  // start inside it. Every eligible gap gets equal weight regardless of size.
  // Throws NoCapacityError when CanFit(length_sec) is false.
  double ProposeStart(double length_sec, selection::IRandomSource& random) const;

  // Records [start_sec, start_sec + length_sec). No overlap re-validation.
  void Commit(double start_sec, double length_sec);

  // Maximal free ranges that can hold length_sec. Exposed for diagnostics.
  std::vector<Interval> FreeRanges(double length_sec) const;

 private:
  SourceFile source_;
  double min_gap_sec_;
  std::vector<Interval> committed_;
};

}  // namespace reelmix::allocation

#endif  // REELMIX_ALLOCATION_RESOURCE_TRACKER_HPP_
