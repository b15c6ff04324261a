// Repository: Reelmix
// Component: Selection Engine
// Purpose: Assembles an ordered clip list from per-source resource trackers
// Copyright (c) 2026 Reelmix contributors

#ifndef REELMIX_SELECTION_ENGINE_HPP_
#define REELMIX_SELECTION_ENGINE_HPP_

#include <cstddef>
#include <optional>
#include <vector>

#include "reelmix/allocation/ResourceTracker.hpp"
#include "reelmix/selection/SelectionConfig.hpp"
#include "reelmix/selection/SelectionTypes.hpp"

namespace reelmix::selection {

class IFeatureScorer;
class IRandomSource;

// =============================================================================
// SelectionEngine
// Sole writer of the trackers it is given. Each slot commits before the next
// slot is evaluated, so every committed range is valid on its own and a run
// may be abandoned between slots.
//
// Plain policy: eligible sources, largest remaining capacity first, cut to the
// top fraction, one drawn uniformly, start from ProposeStart().
//
// Diversity policy: up to N placements per eligible source are scored; the
// best (1 - w) * quality + w * diversity wins. Falls back to the plain draw
// for a slot when no candidate could be evaluated.
// =============================================================================

class SelectionEngine {
 public:
  // Throws std::invalid_argument if config fails ValidateSelectionConfig().
  SelectionEngine(SelectionConfig config, IRandomSource& random, IFeatureScorer& scorer);

  const SelectionConfig& config() const { return config_; }

  // Runs the configured policy against trackers (mutated: clips are
  // committed). Never throws for capacity problems; see outcome.status.
  SelectionOutcome Run(std::vector<allocation::ResourceTracker>& trackers);

  // Mean features over evenly spaced sample windows of each source.
  std::vector<SourceProfile> ComputeSourceProfiles(
      const std::vector<allocation::ResourceTracker>& trackers);

 private:
  struct Placement {
    size_t source_index;
    double start_sec;
    FeatureVector features;
    double score = 0.0;
  };

  // Indices of trackers that can still hold one reservation.
  std::vector<size_t> EligibleSources(
      const std::vector<allocation::ResourceTracker>& trackers) const;

  std::optional<Placement> DrawPlain(std::vector<allocation::ResourceTracker>& trackers);

  std::optional<Placement> DrawBestCandidate(
      std::vector<allocation::ResourceTracker>& trackers,
      const std::optional<FeatureVector>& selected_mean);

  Clip CommitPlacement(std::vector<allocation::ResourceTracker>& trackers,
                       const Placement& placement);

  void Finalize(SelectionOutcome& outcome) const;

  SelectionConfig config_;
  IRandomSource& random_;
  IFeatureScorer& scorer_;
};

}  // namespace reelmix::selection

#endif  // REELMIX_SELECTION_ENGINE_HPP_
