// SPDX-License-Identifier: MIT

#pragma once
#include <cstdint>
#include <random>

namespace qth {

// Source of measurement outcomes. Seeded per composite state so runs are reproducible.
class Rng {
  std::mt19937_64 engine_;
  std::uniform_real_distribution<double> unit_{0.0, 1.0};

public:
  explicit Rng(uint64_t seed) : engine_(seed) {}

  // Uniform in [0, 1).
  double uniform() { return unit_(engine_); }
  // True with probability p.
  bool bernoulli(double p) { return uniform() < p; }
};

} // namespace qth
