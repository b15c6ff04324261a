// Repository: Reelmix
// Component: Duration Probe
// Purpose: Resolves the total duration of a media file. Used by the source
//          scanner and the selection service before trackers are built.
// Copyright (c) 2026 Reelmix contributors

#ifndef REELMIX_MEDIA_DURATION_PROBE_HPP_
#define REELMIX_MEDIA_DURATION_PROBE_HPP_

#include <map>
#include <optional>
#include <string>

namespace reelmix::media {

class IDurationProbe {
 public:
  virtual ~IDurationProbe() = default;

  // Duration in seconds, or nullopt when it cannot be determined.
  virtual std::optional<double> ProbeDurationSec(const std::string& uri) = 0;
};

// Probes with libavformat. Container duration first, then the first video
// stream's own duration. Results (including failures) are cached per URI.
class FFmpegDurationProbe : public IDurationProbe {
 public:
  std::optional<double> ProbeDurationSec(const std::string& uri) override;

  // Check if uri has been probed
  bool HasAsset(const std::string& uri) const;

 private:
  std::optional<double> ProbeUncached(const std::string& uri) const;

  std::map<std::string, std::optional<double>> cache_;
};

}  // namespace reelmix::media

#endif  // REELMIX_MEDIA_DURATION_PROBE_HPP_
