// Repository: Reelmix
// Component: Clip List Export Implementation
// Copyright (c) 2026 Reelmix contributors

#include "reelmix/output/ClipListExport.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

#include <google/protobuf/util/json_util.h>

#include "reelmix/util/Logger.hpp"

namespace reelmix::output {

using selection::Clip;
using selection::SelectionOutcome;
using util::Logger;

namespace {

v1::SelectionStatus ToProtoStatus(selection::SelectionStatus status) {
  switch (status) {
    case selection::SelectionStatus::kComplete:
      return v1::SELECTION_STATUS_COMPLETE;
    case selection::SelectionStatus::kShortfall:
      return v1::SELECTION_STATUS_SHORTFALL;
    case selection::SelectionStatus::kNoClips:
      return v1::SELECTION_STATUS_NO_CLIPS;
  }
  return v1::SELECTION_STATUS_NO_CLIPS;
}

void FillFeatures(const selection::FeatureVector& f, v1::FeatureScores* out) {
  out->set_scene(f.scene);
  out->set_motion(f.motion);
  out->set_color(f.color);
}

// ffconcat quoting: close the quote, escape the apostrophe, reopen.
std::string QuoteConcatPath(const std::string& path) {
  std::string out = "'";
  for (char c : path) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out += c;
    }
  }
  out += "'";
  return out;
}

ExportResult WriteText(const std::string& path, const std::string& text) {
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    return ExportResult::Failure("cannot open " + path);
  }
  out << text;
  out.flush();
  if (!out.good()) {
    return ExportResult::Failure("write failed for " + path);
  }
  return ExportResult::Success();
}

}  // namespace

std::vector<TimelineEntry> ToTimelineEntries(const std::vector<Clip>& clips,
                                             const RationalFps& fps) {
  std::vector<TimelineEntry> entries;
  entries.reserve(clips.size());
  int64_t record = 0;
  for (const auto& clip : clips) {
    TimelineEntry e;
    e.source_uri = clip.source_uri;
    e.source_start_frame = fps.FramesFromSecondsFloor(clip.start_sec);
    e.source_end_frame = fps.FramesFromSecondsFloor(clip.EndSec());
    e.record_start_frame = record;
    e.record_end_frame = record + (e.source_end_frame - e.source_start_frame);
    record = e.record_end_frame;
    entries.push_back(std::move(e));
  }
  return entries;
}

v1::ClipSelectionResult ToProto(const SelectionOutcome& outcome, const RationalFps& fps) {
  v1::ClipSelectionResult result;
  result.set_status(ToProtoStatus(outcome.status));
  result.set_policy(outcome.policy == selection::SelectionPolicy::kDiversity
                        ? v1::SELECTION_POLICY_DIVERSITY
                        : v1::SELECTION_POLICY_PLAIN);
  result.set_requested_clip_count(outcome.requested_clip_count);
  result.set_requested_duration_sec(outcome.requested_duration_sec);
  result.set_selected_duration_sec(outcome.selected_duration_sec);
  result.set_shortfall_sec(outcome.shortfall_sec);
  result.mutable_fps()->set_num(fps.num);
  result.mutable_fps()->set_den(fps.den);

  const auto entries = ToTimelineEntries(outcome.clips, fps);
  for (size_t i = 0; i < outcome.clips.size(); ++i) {
    const Clip& clip = outcome.clips[i];
    v1::Clip* pc = result.add_clips();
    pc->set_source_uri(clip.source_uri);
    pc->set_start_sec(clip.start_sec);
    pc->set_duration_sec(clip.duration_sec);
    pc->set_timestamp_ms(clip.timestamp_ms);
    FillFeatures(clip.features, pc->mutable_features());
    pc->set_source_start_frame(entries[i].source_start_frame);
    pc->set_source_end_frame(entries[i].source_end_frame);
    pc->set_record_start_frame(entries[i].record_start_frame);
    pc->set_record_end_frame(entries[i].record_end_frame);
  }

  for (const auto& profile : outcome.source_profiles) {
    v1::SourceProfile* pp = result.add_source_profiles();
    pp->set_source_uri(profile.source_uri);
    FillFeatures(profile.mean_features, pp->mutable_mean_features());
    pp->set_sample_count(profile.sample_count);
  }
  return result;
}

ExportResult WriteClipListJson(const SelectionOutcome& outcome,
                               const RationalFps& fps,
                               const std::string& path) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto status = google::protobuf::util::MessageToJsonString(ToProto(outcome, fps), &json,
                                                            options);
  if (!status.ok()) {
    return ExportResult::Failure("json encode failed: " + status.ToString());
  }

  auto result = WriteText(path, json);
  if (result.ok) {
    Logger::Info("[ClipListExport] JSON_WRITTEN path=" + path +
                 " clips=" + std::to_string(outcome.clips.size()));
  }
  return result;
}

std::string FormatConcatList(const std::vector<Clip>& clips) {
  std::ostringstream oss;
  oss << "ffconcat version 1.0\n";
  oss << std::fixed << std::setprecision(6);
  for (const auto& clip : clips) {
    // The demuxer resolves relative entries against the list file's directory.
    std::error_code ec;
    const std::filesystem::path absolute = std::filesystem::absolute(clip.source_uri, ec);
    oss << "file " << QuoteConcatPath(ec ? clip.source_uri : absolute.string()) << "\n";
    oss << "inpoint " << clip.start_sec << "\n";
    oss << "outpoint " << clip.EndSec() << "\n";
  }
  return oss.str();
}

ExportResult WriteConcatList(const std::vector<Clip>& clips, const std::string& path) {
  auto result = WriteText(path, FormatConcatList(clips));
  if (result.ok) {
    Logger::Info("[ClipListExport] CONCAT_WRITTEN path=" + path +
                 " clips=" + std::to_string(clips.size()));
  }
  return result;
}

}  // namespace reelmix::output
