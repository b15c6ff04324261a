// Repository: Reelmix
// Component: Allocation Types
// Purpose: Source file identity, committed intervals and the capacity error
// Copyright (c) 2026 Reelmix contributors

#ifndef REELMIX_ALLOCATION_TYPES_HPP_
#define REELMIX_ALLOCATION_TYPES_HPP_

#include <cstdint>
#include <stdexcept>
#include <string>

namespace reelmix::allocation {

// Minimum seconds between two committed ranges of the same source.
constexpr double kDefaultMinGapSec = 1.0;

// =============================================================================
// SourceFile
// One input media file. duration_sec == 0 means the duration could not be
// resolved; such a file never fits a clip but stays in the pool.
// =============================================================================

struct SourceFile {
  std::string uri;
  double duration_sec = 0.0;

  // Ordering key (epoch milliseconds, UTC). Only used to order the final list.
  int64_t timestamp_ms = 0;
};

// Half-open [start_sec, end_sec) reservation inside a source.
struct Interval {
  double start_sec;
  double end_sec;

  double Length() const { return end_sec - start_sec; }
};

// =============================================================================
// NoCapacityError
// Thrown by ResourceTracker::ProposeStart when no placement exists for the
// requested length. Never escapes the selection engine.
// =============================================================================

class NoCapacityError : public std::runtime_error {
 public:
  NoCapacityError(const std::string& uri, double length_sec);

  const std::string& uri() const { return uri_; }
  double length_sec() const { return length_sec_; }

 private:
  std::string uri_;
  double length_sec_;
};

}  // namespace reelmix::allocation

#endif  // REELMIX_ALLOCATION_TYPES_HPP_
