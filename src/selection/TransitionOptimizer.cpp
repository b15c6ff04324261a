// Repository: Reelmix
// Component: Transition Optimizer Implementation
// Copyright (c) 2026 Reelmix contributors

#include "reelmix/selection/TransitionOptimizer.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "reelmix/selection/RandomSource.hpp"
#include "reelmix/util/Logger.hpp"

namespace reelmix::selection {

using util::Logger;

namespace {

// Float slack when comparing a shifted end against the reservation end.
constexpr double kReservationEpsilonSec = 1e-9;

}  // namespace

TransitionOptimizer::TransitionOptimizer(IRandomSource& random,
                                         int32_t max_candidates,
                                         double max_shift_fraction)
    : random_(random),
      max_candidates_(std::max(1, max_candidates)),
      max_shift_fraction_(max_shift_fraction) {}

bool TransitionOptimizer::WithinTolerance(double offset_sec, double duration_sec,
                                          double max_shift_fraction) {
  const double midpoint = duration_sec / 2.0;
  const double max_shift = max_shift_fraction * duration_sec;
  return std::fabs(offset_sec - midpoint) <= max_shift;
}

double TransitionOptimizer::ProposeCutOffset(const Clip& clip) {
  const double midpoint = clip.duration_sec / 2.0;
  const int count = random_.UniformInt(1, max_candidates_);

  double best = 0.0;
  double best_distance = 0.0;
  for (int i = 0; i < count; ++i) {
    double offset = random_.Uniform(0.0, clip.duration_sec);
    if (clip.duration_sec > 0.0 && offset >= clip.duration_sec) {
      offset = std::nextafter(clip.duration_sec, 0.0);
    }
    const double distance = std::fabs(offset - midpoint);
    if (i == 0 || distance < best_distance) {
      best = offset;
      best_distance = distance;
    }
  }
  return best;
}

bool TransitionOptimizer::TryShift(Clip& clip, double offset_sec) const {
  if (!WithinTolerance(offset_sec, clip.duration_sec, max_shift_fraction_)) {
    return false;
  }
  const double new_start = clip.start_sec + offset_sec;
  if (new_start + clip.duration_sec > clip.reserved_end_sec + kReservationEpsilonSec) {
    std::ostringstream oss;
    oss << "[TransitionOptimizer] SHIFT_OUTSIDE_RESERVATION uri=" << clip.source_uri
        << " start_sec=" << clip.start_sec
        << " offset_sec=" << offset_sec
        << " reserved_end_sec=" << clip.reserved_end_sec;
    Logger::Debug(oss.str());
    return false;
  }
  clip.start_sec = new_start;
  return true;
}

std::vector<Clip> TransitionOptimizer::Optimize(const std::vector<Clip>& clips) {
  std::vector<Clip> out = clips;
  int32_t shifted = 0;
  for (auto& clip : out) {
    if (clip.duration_sec <= 0.0) continue;
    const double offset = ProposeCutOffset(clip);
    if (TryShift(clip, offset)) {
      ++shifted;
    }
  }

  std::ostringstream oss;
  oss << "[TransitionOptimizer] OPTIMIZED clips=" << out.size()
      << " shifted=" << shifted;
  Logger::Info(oss.str());
  return out;
}

}  // namespace reelmix::selection
