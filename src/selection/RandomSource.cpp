// Repository: Reelmix
// Component: Random Source Implementation
// Copyright (c) 2026 Reelmix contributors

#include "reelmix/selection/RandomSource.hpp"

namespace reelmix::selection {

double SeededRandomSource::Uniform(double lo, double hi) {
  if (!(hi > lo)) return lo;
  std::uniform_real_distribution<double> dist(lo, hi);
  return dist(engine_);
}

size_t SeededRandomSource::UniformIndex(size_t n) {
  if (n <= 1) return 0;
  std::uniform_int_distribution<size_t> dist(0, n - 1);
  return dist(engine_);
}

int SeededRandomSource::UniformInt(int lo, int hi) {
  if (hi <= lo) return lo;
  std::uniform_int_distribution<int> dist(lo, hi);
  return dist(engine_);
}

}  // namespace reelmix::selection
