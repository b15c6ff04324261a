// Repository: Reelmix
// Component: Clip List Export
// Purpose: Hands the final clip list to timeline assembly (JSON / concat)
// Copyright (c) 2026 Reelmix contributors

#ifndef REELMIX_OUTPUT_CLIP_LIST_EXPORT_HPP_
#define REELMIX_OUTPUT_CLIP_LIST_EXPORT_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "reelmix/clip_selection.pb.h"
#include "reelmix/output/RationalFps.hpp"
#include "reelmix/selection/SelectionTypes.hpp"

namespace reelmix::output {

// Frame placement of one clip on the assembled timeline.
struct TimelineEntry {
  std::string source_uri;
  int64_t source_start_frame = 0;
  int64_t source_end_frame = 0;
  int64_t record_start_frame = 0;
  int64_t record_end_frame = 0;
};

// source frames: floor(start * fps) .. floor((start + duration) * fps);
// record frames laid end to end from 0 in list order.
std::vector<TimelineEntry> ToTimelineEntries(const std::vector<selection::Clip>& clips,
                                             const RationalFps& fps);

v1::ClipSelectionResult ToProto(const selection::SelectionOutcome& outcome,
                                const RationalFps& fps);

struct ExportResult {
  bool ok;
  std::string detail;

  static ExportResult Success() { return {true, ""}; }
  static ExportResult Failure(const std::string& detail) { return {false, detail}; }
};

// ClipSelectionResult as pretty-printed JSON (proto field names).
ExportResult WriteClipListJson(const selection::SelectionOutcome& outcome,
                               const RationalFps& fps,
                               const std::string& path);

// ffconcat script: one file/inpoint/outpoint group per clip.
std::string FormatConcatList(const std::vector<selection::Clip>& clips);
ExportResult WriteConcatList(const std::vector<selection::Clip>& clips,
                             const std::string& path);

}  // namespace reelmix::output

#endif  // REELMIX_OUTPUT_CLIP_LIST_EXPORT_HPP_
