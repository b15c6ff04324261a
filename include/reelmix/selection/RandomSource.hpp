// Repository: Reelmix
// Component: Random Source
// Purpose: Injected, seedable randomness shared by every selection component
// Copyright (c) 2026 Reelmix contributors

#ifndef REELMIX_SELECTION_RANDOM_SOURCE_HPP_
#define REELMIX_SELECTION_RANDOM_SOURCE_HPP_

#include <cstddef>
#include <cstdint>
#include <random>

namespace reelmix::selection {

class IRandomSource {
 public:
  virtual ~IRandomSource() = default;

  // Uniform in [lo, hi]. Returns lo when hi <= lo.
  virtual double Uniform(double lo, double hi) = 0;

  // Uniform in [0, n). n must be > 0.
  virtual size_t UniformIndex(size_t n) = 0;

  // Uniform in [lo, hi], inclusive. Returns lo when hi <= lo.
  virtual int UniformInt(int lo, int hi) = 0;
};

// Production source: a single mt19937_64 stream. Same seed → same run.
class SeededRandomSource : public IRandomSource {
 public:
  explicit SeededRandomSource(uint64_t seed) : engine_(seed) {}

  double Uniform(double lo, double hi) override;
  size_t UniformIndex(size_t n) override;
  int UniformInt(int lo, int hi) override;

 private:
  std::mt19937_64 engine_;
};

}  // namespace reelmix::selection

#endif  // REELMIX_SELECTION_RANDOM_SOURCE_HPP_
