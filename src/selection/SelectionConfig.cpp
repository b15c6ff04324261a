// Repository: Reelmix
// Component: Selection Config Implementation
// Copyright (c) 2026 Reelmix contributors

#include "reelmix/selection/SelectionConfig.hpp"

#include <cmath>
#include <limits>
#include <sstream>

namespace reelmix::selection {

int32_t SelectionConfig::RequestedClipCount() const {
  if (clip_length_sec <= 0.0 || target_total_sec <= 0.0) return 0;
  return static_cast<int32_t>(std::ceil(target_total_sec / clip_length_sec));
}

double SelectionConfig::ReservationLengthSec() const {
  if (!optimize_transitions) return clip_length_sec;
  // Accepted cut points lie at most (0.5 + max_shift_fraction) * length past
  // the drawn start; the shifted window keeps its full length.
  return clip_length_sec * (1.0 + 0.5 + max_shift_fraction);
}

ConfigValidationResult ValidateSelectionConfig(const SelectionConfig& config) {
  auto fail = [](const char* field, double value, const char* rule) {
    std::ostringstream detail;
    detail << field << " (" << value << ") " << rule;
    return ConfigValidationResult::Failure(detail.str());
  };

  if (!std::isfinite(config.clip_length_sec) || config.clip_length_sec <= 0.0) {
    return fail("clip_length_sec", config.clip_length_sec, "must be > 0");
  }
  if (!std::isfinite(config.target_total_sec) || config.target_total_sec <= 0.0) {
    return fail("target_total_sec", config.target_total_sec, "must be > 0");
  }
  if (std::ceil(config.target_total_sec / config.clip_length_sec) >
      static_cast<double>(std::numeric_limits<int32_t>::max())) {
    return fail("target_total_sec", config.target_total_sec,
                "needs more clips than a run can hold");
  }
  if (!(config.diversity_weight >= 0.0 && config.diversity_weight <= 1.0)) {
    return fail("diversity_weight", config.diversity_weight, "must be in [0, 1]");
  }
  if (!(config.min_scene_score >= 0.0 && config.min_scene_score <= 1.0)) {
    return fail("min_scene_score", config.min_scene_score, "must be in [0, 1]");
  }
  if (!std::isfinite(config.min_gap_sec) || config.min_gap_sec < 0.0) {
    return fail("min_gap_sec", config.min_gap_sec, "must be >= 0");
  }
  if (!(config.top_candidate_fraction > 0.0 && config.top_candidate_fraction <= 1.0)) {
    return fail("top_candidate_fraction", config.top_candidate_fraction, "must be in (0, 1]");
  }
  if (config.candidate_draws_per_source < 1) {
    return fail("candidate_draws_per_source", config.candidate_draws_per_source, "must be >= 1");
  }
  if (config.profile_sample_windows < 1) {
    return fail("profile_sample_windows", config.profile_sample_windows, "must be >= 1");
  }
  if (config.max_transition_candidates < 1) {
    return fail("max_transition_candidates", config.max_transition_candidates, "must be >= 1");
  }
  if (!(config.max_shift_fraction >= 0.0 && config.max_shift_fraction <= 0.5)) {
    return fail("max_shift_fraction", config.max_shift_fraction, "must be in [0, 0.5]");
  }
  return ConfigValidationResult::Success();
}

}  // namespace reelmix::selection
