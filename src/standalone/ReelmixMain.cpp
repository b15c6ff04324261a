// Repository: Reelmix
// Component: reelmix CLI
// Purpose: Scans a folder of clips, selects a target-length sequence and
//          writes the clip list for timeline assembly.
// Copyright (c) 2026 Reelmix contributors
//
// Exit codes: 0 complete or shortfall (warning printed), 1 usage / input
// error, 2 no clips could be selected.

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>

#include "reelmix/media/DurationProbe.hpp"
#include "reelmix/media/SourceScanner.hpp"
#include "reelmix/output/ClipListExport.hpp"
#include "reelmix/output/RationalFps.hpp"
#include "reelmix/selection/ClipPlanner.hpp"
#include "reelmix/selection/FeatureScorer.hpp"
#include "reelmix/selection/RandomSource.hpp"
#include "reelmix/selection/SelectionConfig.hpp"
#include "reelmix/util/Logger.hpp"

namespace {

using reelmix::util::Logger;
namespace selection = reelmix::selection;
namespace output = reelmix::output;

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitNoClips = 2;

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  std::string input_dir;
  selection::SelectionConfig config;
  bool seed_given = false;
  output::RationalFps fps = output::FPS_2997;

  std::string output_json_path;
  std::string output_concat_path;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " INPUT_DIR [OPTIONS]\n"
            << "\n"
            << "Selects non-overlapping clips from the videos in INPUT_DIR.\n"
            << "\n"
            << "SELECTION:\n"
            << "  --clip-duration S      Length of each clip in seconds (default: 5)\n"
            << "  --total-duration S     Target sequence length in seconds (default: 60)\n"
            << "  --policy NAME          plain | diversity (default: plain)\n"
            << "  --diversity-weight W   0..1, diversity vs quality (default: 0.5)\n"
            << "  --min-scene-score S    Skip diversity candidates below S (default: 0)\n"
            << "  --min-gap S            Seconds between clips of one file (default: 1)\n"
            << "  --optimize-transitions Nudge clip starts toward cut points\n"
            << "  --seed N               Reproducible run\n"
            << "\n"
            << "OUTPUT:\n"
            << "  --fps NUM/DEN          Frame rate for frame indices (default: 30000/1001)\n"
            << "  --output-json PATH     Write the clip list as JSON\n"
            << "  --output-concat PATH   Write an ffconcat script\n"
            << "  --help                 Show this help message\n"
            << "\n"
            << "Set REELMIX_DEBUG=1 for verbose logs.\n";
}

bool ParseDouble(const std::string& text, double& out) {
  try {
    size_t used = 0;
    out = std::stod(text, &used);
    return used == text.size();
  } catch (const std::exception&) {
    return false;
  }
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto next_double = [&](double& field) {
      if (i + 1 >= argc || !ParseDouble(argv[++i], field)) {
        args.error = arg + " requires a number";
        return false;
      }
      return true;
    };

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--clip-duration") {
      if (!next_double(args.config.clip_length_sec)) return args;
    } else if (arg == "--total-duration") {
      if (!next_double(args.config.target_total_sec)) return args;
    } else if (arg == "--diversity-weight") {
      if (!next_double(args.config.diversity_weight)) return args;
    } else if (arg == "--min-scene-score") {
      if (!next_double(args.config.min_scene_score)) return args;
    } else if (arg == "--min-gap") {
      if (!next_double(args.config.min_gap_sec)) return args;
    } else if (arg == "--policy" && i + 1 < argc) {
      std::string name = argv[++i];
      if (name == "plain") {
        args.config.policy = selection::SelectionPolicy::kPlain;
      } else if (name == "diversity") {
        args.config.policy = selection::SelectionPolicy::kDiversity;
      } else {
        args.error = "Unknown policy: " + name;
        return args;
      }
    } else if (arg == "--optimize-transitions") {
      args.config.optimize_transitions = true;
    } else if (arg == "--seed" && i + 1 < argc) {
      try {
        args.config.seed = std::stoull(argv[++i]);
      } catch (const std::exception&) {
        args.error = "--seed requires an unsigned integer";
        return args;
      }
      args.seed_given = true;
    } else if (arg == "--fps" && i + 1 < argc) {
      auto fps = output::ParseRationalFps(argv[++i]);
      if (!fps) {
        args.error = "Invalid --fps value";
        return args;
      }
      args.fps = *fps;
    } else if (arg == "--output-json" && i + 1 < argc) {
      args.output_json_path = argv[++i];
    } else if (arg == "--output-concat" && i + 1 < argc) {
      args.output_concat_path = argv[++i];
    } else if (!arg.empty() && arg[0] != '-' && args.input_dir.empty()) {
      args.input_dir = arg;
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (args.input_dir.empty()) {
    args.error = "Must specify INPUT_DIR";
    return args;
  }

  auto check = selection::ValidateSelectionConfig(args.config);
  if (!check.valid) {
    args.error = check.detail;
    return args;
  }

  args.valid = true;
  return args;
}

void PrintClipList(const selection::SelectionOutcome& outcome, const output::RationalFps& fps) {
  const auto entries = output::ToTimelineEntries(outcome.clips, fps);
  std::cout << std::fixed << std::setprecision(3);
  for (size_t i = 0; i < outcome.clips.size(); ++i) {
    const auto& clip = outcome.clips[i];
    std::cout << std::setw(3) << (i + 1) << "  " << clip.source_uri
              << "  start=" << clip.start_sec << "s"
              << "  duration=" << clip.duration_sec << "s"
              << "  frames=" << entries[i].source_start_frame << "-"
              << entries[i].source_end_frame << "\n";
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return kExitOk;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return kExitUsage;
  }

  if (!args.seed_given) {
    args.config.seed = std::random_device{}();
  }

  reelmix::media::FFmpegDurationProbe probe;
  auto scan = reelmix::media::ScanSourceDirectory(args.input_dir, probe);
  if (!scan.ok) {
    Logger::Error("[reelmix] SCAN_FAILED " + scan.detail);
    return kExitUsage;
  }
  if (scan.sources.empty()) {
    Logger::Error("[reelmix] NO_VIDEO_FILES dir=" + args.input_dir);
    return kExitUsage;
  }

  Logger::Info("[reelmix] SEED " + std::to_string(args.config.seed));
  selection::SeededRandomSource random(args.config.seed);
  selection::RandomFeatureScorer scorer(random);
  auto outcome = selection::PlanClips(scan.sources, args.config, random, scorer);

  PrintClipList(outcome, args.fps);

  if (!args.output_json_path.empty()) {
    auto written = output::WriteClipListJson(outcome, args.fps, args.output_json_path);
    if (!written.ok) {
      Logger::Error("[reelmix] EXPORT_FAILED " + written.detail);
      return kExitUsage;
    }
  }
  if (!args.output_concat_path.empty() && !outcome.clips.empty()) {
    auto written = output::WriteConcatList(outcome.clips, args.output_concat_path);
    if (!written.ok) {
      Logger::Error("[reelmix] EXPORT_FAILED " + written.detail);
      return kExitUsage;
    }
  }

  switch (outcome.status) {
    case selection::SelectionStatus::kComplete:
      return kExitOk;
    case selection::SelectionStatus::kShortfall:
      std::cerr << "Warning: selected " << outcome.clips.size() << "/"
                << outcome.requested_clip_count << " clips, short by "
                << outcome.shortfall_sec << "s\n";
      return kExitOk;
    case selection::SelectionStatus::kNoClips:
      std::cerr << "Error: no clip of " << args.config.clip_length_sec
                << "s fits any source\n";
      return kExitNoClips;
  }
  return kExitNoClips;
}
