// Repository: Reelmix
// Component: Source Scanner
// Purpose: Turns a directory of media files into SourceFile records
// Copyright (c) 2026 Reelmix contributors

#ifndef REELMIX_MEDIA_SOURCE_SCANNER_HPP_
#define REELMIX_MEDIA_SOURCE_SCANNER_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "reelmix/allocation/AllocationTypes.hpp"

namespace reelmix::media {

class IDurationProbe;

struct ScanOptions {
  // Lower-case, with the dot. Matched case-insensitively.
  std::vector<std::string> extensions = {".mp4", ".mov", ".m4v"};
};

struct ScanResult {
  bool ok;
  std::string detail;
  std::vector<allocation::SourceFile> sources;

  // Files kept with duration 0 because the probe could not resolve them.
  int32_t unresolved_count = 0;

  static ScanResult Success(std::vector<allocation::SourceFile> sources, int32_t unresolved) {
    return {true, "", std::move(sources), unresolved};
  }
  static ScanResult Failure(const std::string& detail) {
    return {false, detail, {}, 0};
  }
};

// Lists matching regular files of dir (non-recursive) in path order, probes
// each duration and derives its timestamp key. Unknown durations become 0.
ScanResult ScanSourceDirectory(const std::string& dir,
                               IDurationProbe& probe,
                               const ScanOptions& options = ScanOptions{});

// Builds one SourceFile for uri. Unknown / invalid durations become 0 and are
// logged; the timestamp comes from the name, else the modification time.
allocation::SourceFile ResolveSource(const std::string& uri, IDurationProbe& probe);

// First YYYYMMDDhhmmss (also YYYYMMDD_hhmmss, YYYYMMDD-hhmmss) in stem, as
// epoch milliseconds UTC. nullopt if no valid calendar time is found.
std::optional<int64_t> ParseTimestampFromName(const std::string& stem);

// File modification time as epoch milliseconds; nullopt if unreadable.
std::optional<int64_t> ModificationTimeMs(const std::string& path);

}  // namespace reelmix::media

#endif  // REELMIX_MEDIA_SOURCE_SCANNER_HPP_
