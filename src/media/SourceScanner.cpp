// Repository: Reelmix
// Component: Source Scanner Implementation
// Copyright (c) 2026 Reelmix contributors

#include "reelmix/media/SourceScanner.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <sstream>
#include <system_error>

#include "reelmix/media/DurationProbe.hpp"
#include "reelmix/util/Logger.hpp"

namespace fs = std::filesystem;

namespace reelmix::media {

using allocation::SourceFile;
using util::Logger;

namespace {

std::string ToLower(std::string s) {
  for (auto& c : s) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return s;
}

bool AllDigits(const std::string& s, size_t pos, size_t len) {
  if (pos + len > s.size()) return false;
  for (size_t i = pos; i < pos + len; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
  }
  return true;
}

int ToInt(const std::string& s, size_t pos, size_t len) {
  int v = 0;
  for (size_t i = pos; i < pos + len; ++i) {
    v = v * 10 + (s[i] - '0');
  }
  return v;
}

bool IsLeapYear(int y) {
  return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
}

int DaysInMonth(int y, int m) {
  static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return (m == 2 && IsLeapYear(y)) ? 29 : kDays[m - 1];
}

// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t DaysFromCivil(int y, int m, int d) {
  y -= m <= 2 ? 1 : 0;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const int64_t yoe = y - era * 400;
  const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

std::optional<int64_t> ParseAt(const std::string& stem, size_t pos) {
  if (!AllDigits(stem, pos, 8)) return std::nullopt;
  size_t time_pos = pos + 8;
  if (time_pos < stem.size() && (stem[time_pos] == '_' || stem[time_pos] == '-')) {
    ++time_pos;
  }
  if (!AllDigits(stem, time_pos, 6)) return std::nullopt;
  // A longer digit run is some other number, not a timestamp.
  if (time_pos + 6 < stem.size() &&
      std::isdigit(static_cast<unsigned char>(stem[time_pos + 6]))) {
    return std::nullopt;
  }

  const int year = ToInt(stem, pos, 4);
  const int month = ToInt(stem, pos + 4, 2);
  const int day = ToInt(stem, pos + 6, 2);
  const int hour = ToInt(stem, time_pos, 2);
  const int minute = ToInt(stem, time_pos + 2, 2);
  const int second = ToInt(stem, time_pos + 4, 2);

  if (year < 1970 || month < 1 || month > 12) return std::nullopt;
  if (day < 1 || day > DaysInMonth(year, month)) return std::nullopt;
  if (hour > 23 || minute > 59 || second > 59) return std::nullopt;

  const int64_t days = DaysFromCivil(year, month, day);
  const int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second;
  return secs * 1000;
}

}  // namespace

std::optional<int64_t> ParseTimestampFromName(const std::string& stem) {
  for (size_t pos = 0; pos + 14 <= stem.size(); ++pos) {
    // Only start at the beginning of a digit run.
    if (pos > 0 && std::isdigit(static_cast<unsigned char>(stem[pos - 1]))) continue;
    if (auto ts = ParseAt(stem, pos)) return ts;
  }
  return std::nullopt;
}

std::optional<int64_t> ModificationTimeMs(const std::string& path) {
  std::error_code ec;
  auto ftime = fs::last_write_time(path, ec);
  if (ec) return std::nullopt;
  // file_clock has no portable to_sys in C++17; rebase through now().
  auto sys = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
      ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      sys.time_since_epoch()).count();
}

SourceFile ResolveSource(const std::string& uri, IDurationProbe& probe) {
  SourceFile source;
  source.uri = uri;

  auto duration = probe.ProbeDurationSec(uri);
  if (duration && std::isfinite(*duration) && *duration >= 0.0) {
    source.duration_sec = *duration;
  } else {
    source.duration_sec = 0.0;
    std::ostringstream oss;
    oss << "[SourceScanner] DURATION_UNRESOLVED uri=" << uri
        << " effect=excluded_from_allocation";
    Logger::Warn(oss.str());
  }

  const std::string stem = fs::path(uri).stem().string();
  if (auto ts = ParseTimestampFromName(stem)) {
    source.timestamp_ms = *ts;
  } else if (auto mtime = ModificationTimeMs(uri)) {
    source.timestamp_ms = *mtime;
  } else {
    source.timestamp_ms = 0;
    Logger::Debug("[SourceScanner] TIMESTAMP_UNKNOWN uri=" + uri);
  }
  return source;
}

ScanResult ScanSourceDirectory(const std::string& dir,
                               IDurationProbe& probe,
                               const ScanOptions& options) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return ScanResult::Failure("input directory not found: " + dir);
  }

  std::vector<fs::path> files;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file(ec)) continue;
    const std::string ext = ToLower(it->path().extension().string());
    if (std::find(options.extensions.begin(), options.extensions.end(), ext) !=
        options.extensions.end()) {
      files.push_back(it->path());
    }
  }
  if (ec) {
    return ScanResult::Failure("cannot list " + dir + ": " + ec.message());
  }
  std::sort(files.begin(), files.end());

  std::vector<SourceFile> sources;
  sources.reserve(files.size());
  int32_t unresolved = 0;
  for (const auto& path : files) {
    // Absolute so list consumers resolve it from any working directory.
    std::error_code abs_ec;
    const fs::path absolute = fs::absolute(path, abs_ec);
    SourceFile source = ResolveSource((abs_ec ? path : absolute).lexically_normal().string(),
                                      probe);
    if (source.duration_sec <= 0.0) ++unresolved;
    sources.push_back(std::move(source));
  }

  std::ostringstream oss;
  oss << "[SourceScanner] SCANNED dir=" << dir
      << " files=" << sources.size()
      << " unresolved=" << unresolved;
  Logger::Info(oss.str());
  return ScanResult::Success(std::move(sources), unresolved);
}

}  // namespace reelmix::media
