// Repository: Reelmix
// Component: Duration Probe Implementation
// Purpose: Probes real media files for duration using FFmpeg
// Copyright (c) 2026 Reelmix contributors

#include "reelmix/media/DurationProbe.hpp"

#include <chrono>
#include <sstream>

#include "reelmix/util/Logger.hpp"

#ifdef REELMIX_FFMPEG_AVAILABLE
extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
}
#endif

namespace reelmix::media {

using util::Logger;

std::optional<double> FFmpegDurationProbe::ProbeDurationSec(const std::string& uri) {
  auto it = cache_.find(uri);
  if (it != cache_.end()) return it->second;

  auto duration = ProbeUncached(uri);
  cache_[uri] = duration;
  return duration;
}

bool FFmpegDurationProbe::HasAsset(const std::string& uri) const {
  return cache_.find(uri) != cache_.end();
}

std::optional<double> FFmpegDurationProbe::ProbeUncached(const std::string& uri) const {
#ifdef REELMIX_FFMPEG_AVAILABLE
  AVFormatContext* fmt_ctx = nullptr;

  auto open_start = std::chrono::steady_clock::now();
  if (avformat_open_input(&fmt_ctx, uri.c_str(), nullptr, nullptr) < 0) {
    Logger::Warn("[DurationProbe] OPEN_FAILED uri=" + uri);
    return std::nullopt;
  }

  if (avformat_find_stream_info(fmt_ctx, nullptr) < 0) {
    avformat_close_input(&fmt_ctx);
    Logger::Warn("[DurationProbe] STREAM_INFO_FAILED uri=" + uri);
    return std::nullopt;
  }
  auto probe_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - open_start).count();

  std::optional<double> duration_sec;
  if (fmt_ctx->duration != AV_NOPTS_VALUE && fmt_ctx->duration > 0) {
    // AV_TIME_BASE is microseconds
    duration_sec = static_cast<double>(fmt_ctx->duration) / AV_TIME_BASE;
  } else {
    // Container did not say; ask the first video stream.
    for (unsigned i = 0; i < fmt_ctx->nb_streams; ++i) {
      const AVStream* st = fmt_ctx->streams[i];
      if (st->codecpar->codec_type != AVMEDIA_TYPE_VIDEO) continue;
      if (st->duration != AV_NOPTS_VALUE && st->duration > 0) {
        duration_sec = static_cast<double>(st->duration) * av_q2d(st->time_base);
      }
      break;
    }
  }

  avformat_close_input(&fmt_ctx);

  std::ostringstream oss;
  if (!duration_sec) {
    oss << "[DurationProbe] DURATION_UNKNOWN uri=" << uri;
    Logger::Warn(oss.str());
    return std::nullopt;
  }
  oss << "[DurationProbe] PROBED uri=" << uri
      << " duration_sec=" << *duration_sec
      << " probe_ms=" << probe_ms;
  Logger::Debug(oss.str());
  return duration_sec;
#else
  Logger::Warn("[DurationProbe] FFMPEG_UNAVAILABLE uri=" + uri);
  return std::nullopt;
#endif
}

}  // namespace reelmix::media
