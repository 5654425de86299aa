// SPDX-License-Identifier: MIT

#pragma once
#include <random>
#include <cstddef>
#include <cstdint>

namespace psx {
class Rng {
  std::mt19937_64 gen;
  std::uniform_real_distribution<double> dist;
public:
  explicit Rng(uint64_t seed) : gen(seed), dist(0.0, 1.0) {}
  double uniform() { return dist(gen); }
  double uniform(double lo, double hi) { return lo + (hi - lo) * dist(gen); }
  // Uniform in [0, n)
  std::size_t index(std::size_t n) { return std::uniform_int_distribution<std::size_t>(0, n-1)(gen); }
};
}
