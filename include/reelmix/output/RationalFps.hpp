// Repository: Reelmix
// Component: Rational frame rate
// Purpose: Exact frame-rate arithmetic for converting clip offsets to frames
// Copyright (c) 2026 Reelmix contributors

#ifndef REELMIX_OUTPUT_RATIONAL_FPS_HPP_
#define REELMIX_OUTPUT_RATIONAL_FPS_HPP_

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>

namespace reelmix::output {

constexpr int64_t FpsAbs64(int64_t v) { return v < 0 ? -v : v; }

constexpr int64_t FpsGcd64(int64_t a, int64_t b) {
  a = FpsAbs64(a);
  b = FpsAbs64(b);
  while (b != 0) {
    const int64_t t = a % b;
    a = b;
    b = t;
  }
  return a == 0 ? 1 : a;
}

struct RationalFps {
  int64_t num;
  int64_t den;

  constexpr RationalFps(int64_t n = 0, int64_t d = 1) : num(n), den(d) {
    NormalizeInPlace();
  }

  constexpr bool IsValid() const { return num > 0 && den > 0; }

  constexpr void NormalizeInPlace() {
    if (den == 0) {
      num = 0;
      den = 1;
      return;
    }
    if (den < 0) {
      den = -den;
      num = -num;
    }
    if (num <= 0 || den <= 0) {
      num = 0;
      den = 1;
      return;
    }
    const int64_t g = FpsGcd64(num, den);
    num /= g;
    den /= g;
  }

  constexpr double ToDouble() const { return static_cast<double>(num) / static_cast<double>(den); }

  // Frame index containing the instant seconds (floor). The consumer owns
  // this conversion; the selection core never assumes a frame rate.
  int64_t FramesFromSecondsFloor(double seconds) const {
    if (!IsValid() || !(seconds > 0.0)) return 0;
    // Nudge by a tiny epsilon so exact frame boundaries (e.g. 1001/30000 s)
    // are not lost to binary rounding.
    return static_cast<int64_t>(std::floor(seconds * num / den + 1e-9));
  }

  constexpr bool operator==(const RationalFps& other) const {
    return num == other.num && den == other.den;
  }
  constexpr bool operator!=(const RationalFps& other) const {
    return !(*this == other);
  }
};

constexpr RationalFps FPS_23976{24000, 1001};
constexpr RationalFps FPS_2997{30000, 1001};
constexpr RationalFps FPS_5994{60000, 1001};
constexpr RationalFps FPS_24{24, 1};
constexpr RationalFps FPS_25{25, 1};
constexpr RationalFps FPS_30{30, 1};
constexpr RationalFps FPS_60{60, 1};

// Accepts "NUM/DEN", an integer rate, or one of the NTSC shorthands
// ("23.976", "29.97", "59.94"). nullopt for anything else.
std::optional<RationalFps> ParseRationalFps(const std::string& text);

}  // namespace reelmix::output

#endif  // REELMIX_OUTPUT_RATIONAL_FPS_HPP_
