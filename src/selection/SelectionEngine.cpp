// Repository: Reelmix
// Component: Selection Engine Implementation
// Copyright (c) 2026 Reelmix contributors

#include "reelmix/selection/SelectionEngine.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

#include "reelmix/selection/FeatureScorer.hpp"
#include "reelmix/selection/RandomSource.hpp"
#include "reelmix/util/Logger.hpp"

namespace reelmix::selection {

using allocation::NoCapacityError;
using allocation::ResourceTracker;
using util::Logger;

namespace {

SelectionConfig RequireValid(SelectionConfig config) {
  auto result = ValidateSelectionConfig(config);
  if (!result.valid) {
    throw std::invalid_argument("SelectionConfig: " + result.detail);
  }
  return config;
}

// Running mean of the features of every clip selected so far.
class FeatureAccumulator {
 public:
  void Add(const FeatureVector& f) {
    sum_.scene += f.scene;
    sum_.motion += f.motion;
    sum_.color += f.color;
    ++count_;
  }

  std::optional<FeatureVector> Mean() const {
    if (count_ == 0) return std::nullopt;
    const double n = static_cast<double>(count_);
    return FeatureVector{sum_.scene / n, sum_.motion / n, sum_.color / n};
  }

 private:
  FeatureVector sum_;
  size_t count_ = 0;
};

}  // namespace

SelectionEngine::SelectionEngine(SelectionConfig config,
                                 IRandomSource& random,
                                 IFeatureScorer& scorer)
    : config_(RequireValid(std::move(config))), random_(random), scorer_(scorer) {}

std::vector<size_t> SelectionEngine::EligibleSources(
    const std::vector<ResourceTracker>& trackers) const {
  const double reservation = config_.ReservationLengthSec();
  std::vector<size_t> eligible;
  for (size_t i = 0; i < trackers.size(); ++i) {
    if (trackers[i].CanFit(reservation)) {
      eligible.push_back(i);
    }
  }
  return eligible;
}

std::optional<SelectionEngine::Placement> SelectionEngine::DrawPlain(
    std::vector<ResourceTracker>& trackers) {
  const double reservation = config_.ReservationLengthSec();
  std::vector<size_t> eligible = EligibleSources(trackers);

  while (!eligible.empty()) {
    // Largest remaining capacity first; stable keeps input order on ties.
    std::stable_sort(eligible.begin(), eligible.end(), [&](size_t a, size_t b) {
      return trackers[a].AvailableDuration() > trackers[b].AvailableDuration();
    });
    const size_t keep = std::max<size_t>(
        1, static_cast<size_t>(std::floor(
               static_cast<double>(eligible.size()) * config_.top_candidate_fraction)));
    const size_t pick = random_.UniformIndex(std::min(keep, eligible.size()));
    const size_t index = eligible[pick];

    try {
      Placement p;
      p.source_index = index;
      p.start_sec = trackers[index].ProposeStart(reservation, random_);
      return p;
    } catch (const NoCapacityError& e) {
      std::ostringstream oss;
      oss << "[SelectionEngine] PLAIN_DRAW_NO_CAPACITY uri=" << e.uri()
          << " length_sec=" << e.length_sec();
      Logger::Debug(oss.str());
      eligible.erase(eligible.begin() + static_cast<std::ptrdiff_t>(pick));
    }
  }
  return std::nullopt;
}

std::optional<SelectionEngine::Placement> SelectionEngine::DrawBestCandidate(
    std::vector<ResourceTracker>& trackers,
    const std::optional<FeatureVector>& selected_mean) {
  const double reservation = config_.ReservationLengthSec();
  const double w = config_.diversity_weight;
  std::optional<Placement> best;

  for (size_t index : EligibleSources(trackers)) {
    const ResourceTracker& tracker = trackers[index];
    for (int32_t draw = 0; draw < config_.candidate_draws_per_source; ++draw) {
      double start = 0.0;
      try {
        start = tracker.ProposeStart(reservation, random_);
      } catch (const NoCapacityError&) {
        continue;
      }

      FeatureVector f = ScoreOrDefault(scorer_, random_, tracker.source(), start,
                                       config_.clip_length_sec);
      if (f.scene < config_.min_scene_score) {
        continue;
      }

      const double diversity = selected_mean ? f.MeanAbsDifference(*selected_mean) : 0.0;
      const double quality = f.Mean();
      const double score = (1.0 - w) * quality + w * diversity;

      // Strictly greater: ties keep the first-evaluated candidate.
      if (!best || score > best->score) {
        best = Placement{index, start, f, score};
      }
    }
  }
  return best;
}

Clip SelectionEngine::CommitPlacement(std::vector<ResourceTracker>& trackers,
                                      const Placement& placement) {
  ResourceTracker& tracker = trackers[placement.source_index];
  const double reservation = config_.ReservationLengthSec();
  tracker.Commit(placement.start_sec, reservation);

  Clip clip;
  clip.source_index = static_cast<int32_t>(placement.source_index);
  clip.source_uri = tracker.source().uri;
  clip.start_sec = placement.start_sec;
  clip.duration_sec = config_.clip_length_sec;
  clip.timestamp_ms = tracker.source().timestamp_ms;
  clip.features = placement.features;
  clip.reserved_start_sec = placement.start_sec;
  clip.reserved_end_sec = placement.start_sec + reservation;
  return clip;
}

std::vector<SourceProfile> SelectionEngine::ComputeSourceProfiles(
    const std::vector<ResourceTracker>& trackers) {
  std::vector<SourceProfile> profiles;
  profiles.reserve(trackers.size());
  const int32_t samples = config_.profile_sample_windows;

  for (size_t i = 0; i < trackers.size(); ++i) {
    const auto& source = trackers[i].source();
    SourceProfile profile;
    profile.source_index = static_cast<int32_t>(i);
    profile.source_uri = source.uri;

    const double duration = source.duration_sec;
    if (duration > 0.0) {
      const double window = std::min(config_.clip_length_sec, duration);
      FeatureVector sum;
      for (int32_t s = 0; s < samples; ++s) {
        const double center = (static_cast<double>(s) + 0.5) * duration / samples;
        const double start = std::clamp(center - window / 2.0, 0.0, duration - window);
        FeatureVector f = ScoreOrDefault(scorer_, random_, source, start, window);
        sum.scene += f.scene;
        sum.motion += f.motion;
        sum.color += f.color;
      }
      profile.sample_count = samples;
      profile.mean_features = FeatureVector{sum.scene / samples, sum.motion / samples,
                                            sum.color / samples};
    }

    std::ostringstream oss;
    oss << "[SelectionEngine] SOURCE_PROFILE uri=" << source.uri
        << " samples=" << profile.sample_count
        << " scene=" << profile.mean_features.scene
        << " motion=" << profile.mean_features.motion
        << " color=" << profile.mean_features.color;
    Logger::Debug(oss.str());
    profiles.push_back(std::move(profile));
  }
  return profiles;
}

SelectionOutcome SelectionEngine::Run(std::vector<ResourceTracker>& trackers) {
  SelectionOutcome outcome;
  outcome.policy = config_.policy;
  outcome.requested_clip_count = config_.RequestedClipCount();
  outcome.requested_duration_sec = config_.target_total_sec;

  {
    std::ostringstream oss;
    oss << "[SelectionEngine] RUN_START policy=" << SelectionPolicyName(config_.policy)
        << " sources=" << trackers.size()
        << " clip_length_sec=" << config_.clip_length_sec
        << " reservation_sec=" << config_.ReservationLengthSec()
        << " requested_clips=" << outcome.requested_clip_count;
    Logger::Info(oss.str());
  }

  const bool diversity = (config_.policy == SelectionPolicy::kDiversity);
  FeatureAccumulator selected_features;
  if (diversity) {
    outcome.source_profiles = ComputeSourceProfiles(trackers);
  }

  for (int32_t slot = 0; slot < outcome.requested_clip_count; ++slot) {
    std::optional<Placement> placement;
    bool fallback = false;

    if (diversity) {
      placement = DrawBestCandidate(trackers, selected_features.Mean());
      if (!placement) {
        fallback = true;
        placement = DrawPlain(trackers);
        if (placement) {
          placement->features = ScoreOrDefault(
              scorer_, random_, trackers[placement->source_index].source(),
              placement->start_sec, config_.clip_length_sec);
        }
      }
    } else {
      placement = DrawPlain(trackers);
    }

    if (!placement) {
      // Global capacity exhausted: the clip count shrinks to what fit.
      break;
    }

    Clip clip = CommitPlacement(trackers, *placement);
    if (diversity) {
      selected_features.Add(clip.features);
    }

    std::ostringstream oss;
    oss << "[SelectionEngine] CLIP_SELECTED slot=" << slot
        << " uri=" << clip.source_uri
        << " start_sec=" << clip.start_sec
        << " duration_sec=" << clip.duration_sec;
    if (diversity) {
      oss << " score=" << placement->score
          << " fallback=" << (fallback ? "Y" : "N");
    }
    Logger::Info(oss.str());
    outcome.clips.push_back(std::move(clip));
  }

  Finalize(outcome);
  return outcome;
}

void SelectionEngine::Finalize(SelectionOutcome& outcome) const {
  std::stable_sort(outcome.clips.begin(), outcome.clips.end(), ClipOrderLess);

  double selected = 0.0;
  for (const auto& clip : outcome.clips) {
    selected += clip.duration_sec;
  }
  outcome.selected_duration_sec = selected;
  outcome.shortfall_sec = std::max(0.0, outcome.requested_duration_sec - selected);

  const auto count = static_cast<int32_t>(outcome.clips.size());
  if (count == 0) {
    outcome.status = SelectionStatus::kNoClips;
    outcome.shortfall_sec = outcome.requested_duration_sec;
  } else if (count < outcome.requested_clip_count) {
    outcome.status = SelectionStatus::kShortfall;
  } else {
    outcome.status = SelectionStatus::kComplete;
  }

  std::ostringstream oss;
  oss << "[SelectionEngine] RUN_END status=" << SelectionStatusToString(outcome.status)
      << " clips=" << count << "/" << outcome.requested_clip_count
      << " selected_sec=" << outcome.selected_duration_sec
      << " shortfall_sec=" << outcome.shortfall_sec;
  if (outcome.status == SelectionStatus::kComplete) {
    Logger::Info(oss.str());
  } else {
    Logger::Warn(oss.str());
  }
}

}  // namespace reelmix::selection
