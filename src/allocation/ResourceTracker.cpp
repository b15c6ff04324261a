// Repository: Reelmix
// Component: Resource Tracker Implementation
// Copyright (c) 2026 Reelmix contributors

#include "reelmix/allocation/ResourceTracker.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "reelmix/selection/RandomSource.hpp"

namespace reelmix::allocation {

namespace {

std::string NoCapacityMessage(const std::string& uri, double length_sec) {
  std::ostringstream oss;
  oss << "no placement for " << length_sec << "s in " << uri;
  return oss.str();
}

}  // namespace

NoCapacityError::NoCapacityError(const std::string& uri, double length_sec)
    : std::runtime_error(NoCapacityMessage(uri, length_sec)),
      uri_(uri),
      length_sec_(length_sec) {}

ResourceTracker::ResourceTracker(SourceFile source, double min_gap_sec)
    : source_(std::move(source)),
      min_gap_sec_(std::isfinite(min_gap_sec) ? std::max(0.0, min_gap_sec) : 0.0) {
  if (!std::isfinite(source_.duration_sec) || source_.duration_sec < 0.0) {
    source_.duration_sec = 0.0;
  }
}

double ResourceTracker::AvailableDuration() const {
  double remaining = source_.duration_sec;
  for (const auto& iv : committed_) {
    remaining -= iv.Length();
  }
  if (committed_.size() > 1) {
    remaining -= min_gap_sec_ * static_cast<double>(committed_.size() - 1);
  }
  return std::max(0.0, remaining);
}

std::vector<Interval> ResourceTracker::FreeRanges(double length_sec) const {
  std::vector<Interval> ranges;
  if (length_sec <= 0.0 || source_.duration_sec < length_sec) {
    return ranges;
  }

  auto consider = [&](double lo, double hi) {
    if (hi - lo >= length_sec) {
      ranges.push_back({lo, hi});
    }
  };

  if (committed_.empty()) {
    consider(0.0, source_.duration_sec);
    return ranges;
  }

  // Leading gap: file start needs no buffer, the first range does.
  consider(0.0, committed_.front().start_sec - min_gap_sec_);

  for (size_t i = 1; i < committed_.size(); ++i) {
    consider(committed_[i - 1].end_sec + min_gap_sec_,
             committed_[i].start_sec - min_gap_sec_);
  }

  // Trailing gap: buffer after the last range only.
  consider(committed_.back().end_sec + min_gap_sec_, source_.duration_sec);
  return ranges;
}

bool ResourceTracker::CanFit(double length_sec) const {
  return !FreeRanges(length_sec).empty();
}

double ResourceTracker::ProposeStart(double length_sec,
                                     selection::IRandomSource& random) const {
  const auto ranges = FreeRanges(length_sec);
  if (ranges.empty()) {
    throw NoCapacityError(source_.uri, length_sec);
  }

  // Stage 1: every eligible gap is equally likely.
  const Interval& range = ranges[random.UniformIndex(ranges.size())];

  // Stage 2: uniform start inside the chosen gap.
  const double latest_start = range.end_sec - length_sec;
  double start = random.Uniform(range.start_sec, latest_start);
  return std::clamp(start, range.start_sec, latest_start);
}

void ResourceTracker::Commit(double start_sec, double length_sec) {
  Interval iv{start_sec, start_sec + length_sec};
  auto pos = std::upper_bound(
      committed_.begin(), committed_.end(), iv,
      [](const Interval& a, const Interval& b) { return a.start_sec < b.start_sec; });
  committed_.insert(pos, iv);
}

}  // namespace reelmix::allocation
