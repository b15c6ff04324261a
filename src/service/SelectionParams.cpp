// Repository: Reelmix
// Component: Selection Params Mapping Implementation
// Copyright (c) 2026 Reelmix contributors

#include "reelmix/service/SelectionParams.hpp"

#include <cmath>
#include <filesystem>

#include "reelmix/media/DurationProbe.hpp"
#include "reelmix/media/SourceScanner.hpp"

namespace reelmix::service {

selection::SelectionConfig ConfigFromParams(const v1::SelectionParams& params) {
  selection::SelectionConfig config;
  if (params.clip_length_sec() != 0.0) config.clip_length_sec = params.clip_length_sec();
  if (params.target_total_sec() != 0.0) config.target_total_sec = params.target_total_sec();
  config.policy = params.policy() == v1::SELECTION_POLICY_DIVERSITY
                      ? selection::SelectionPolicy::kDiversity
                      : selection::SelectionPolicy::kPlain;
  if (params.has_diversity_weight()) config.diversity_weight = params.diversity_weight();
  config.min_scene_score = params.min_scene_score();
  if (params.has_min_gap_sec()) config.min_gap_sec = params.min_gap_sec();
  config.optimize_transitions = params.optimize_transitions();
  config.seed = params.seed();
  return config;
}

output::RationalFps FpsFromParams(const v1::SelectionParams& params) {
  if (!params.has_fps()) return output::FPS_2997;
  output::RationalFps fps{params.fps().num(), params.fps().den()};
  return fps.IsValid() ? fps : output::FPS_2997;
}

allocation::SourceFile ResolveSourceSpec(const v1::SourceSpec& spec,
                                         media::IDurationProbe& probe) {
  allocation::SourceFile source;
  if (std::isfinite(spec.duration_sec()) && spec.duration_sec() > 0.0) {
    source.uri = spec.uri();
    source.duration_sec = spec.duration_sec();
    if (auto ts = media::ParseTimestampFromName(
            std::filesystem::path(spec.uri()).stem().string())) {
      source.timestamp_ms = *ts;
    }
  } else {
    source = media::ResolveSource(spec.uri(), probe);
  }
  if (spec.timestamp_ms() != 0) {
    source.timestamp_ms = spec.timestamp_ms();
  }
  return source;
}

}  // namespace reelmix::service
