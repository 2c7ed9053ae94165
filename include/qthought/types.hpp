// SPDX-License-Identifier: MIT

#pragma once
#include <complex>
#include <vector>
#include <string>
#include <map>
#include <cstdint>
#include <limits>

namespace qth {
  using c64 = std::complex<double>;
  using vec_c64 = std::vector<c64>;

  // Basis label of the full qubit array, printed MSB first: label[k] is qubit n-1-k.
  using BasisLabel = std::string;
  // Label -> amplitude. Sparse maps are allowed; missing labels have amplitude zero.
  using Wavefunction = std::map<BasisLabel, c64>;
  using Subspace = std::vector<BasisLabel>;

  inline constexpr double kTolerance = 1e-7;

  // Largest composite state (and so largest single register) that can be allocated.
  inline constexpr std::size_t kMaxQubits = 24;

  inline constexpr int kTimeMin = std::numeric_limits<int>::min();
  inline constexpr int kTimeMax = std::numeric_limits<int>::max();
}
