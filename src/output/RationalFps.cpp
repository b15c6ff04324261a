// Repository: Reelmix
// Component: Rational frame rate parsing
// Copyright (c) 2026 Reelmix contributors

#include "reelmix/output/RationalFps.hpp"

#include <cctype>

namespace reelmix::output {

namespace {

std::optional<int64_t> ParsePositiveInt(const std::string& s) {
  if (s.empty() || s.size() > 9) return std::nullopt;
  int64_t v = 0;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    v = v * 10 + (c - '0');
  }
  if (v <= 0) return std::nullopt;
  return v;
}

struct NamedRate {
  const char* name;
  RationalFps fps;
};

// Editor frame-rate names.
constexpr NamedRate kNamedRates[] = {
    {"23.976", FPS_23976}, {"24", FPS_24}, {"25", FPS_25},   {"29.97", FPS_2997},
    {"30", FPS_30},        {"59.94", FPS_5994}, {"60", FPS_60},
};

}  // namespace

std::optional<RationalFps> ParseRationalFps(const std::string& text) {
  for (const auto& rate : kNamedRates) {
    if (text == rate.name) return rate.fps;
  }

  const auto slash = text.find('/');
  if (slash == std::string::npos) {
    auto n = ParsePositiveInt(text);
    if (!n) return std::nullopt;
    return RationalFps{*n, 1};
  }
  auto n = ParsePositiveInt(text.substr(0, slash));
  auto d = ParsePositiveInt(text.substr(slash + 1));
  if (!n || !d) return std::nullopt;
  RationalFps fps{*n, *d};
  if (!fps.IsValid()) return std::nullopt;
  return fps;
}

}  // namespace reelmix::output
