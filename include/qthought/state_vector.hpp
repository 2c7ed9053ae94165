// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include "gates.hpp"
#include "random.hpp"
#include <span>

namespace qth {

// Dense state-vector backend. Qubit q is bit q of the amplitude index (LSB = qubit 0).
class StateVector {
  std::size_t n_;
  vec_c64 amp_;
  std::size_t applied_ = 0;
  void normalize_();
  // Zeroes every amplitude whose index disagrees with `value` on `mask`, then renormalizes.
  void collapse_(std::size_t mask, std::size_t value);

public:
  explicit StateVector(std::size_t n);
  std::size_t num_qubits() const { return n_; }
  std::size_t dimension() const { return amp_.size(); }
  const vec_c64& amplitudes() const { return amp_; }

  // Replaces all amplitudes; size must equal dimension().
  void set_amplitudes(vec_c64 amp);

  // Single-qubit gate on target, applied only where every control qubit is 1.
  void apply_gate_1q(std::size_t target, const Gate1q& u, std::span<const std::size_t> controls = {});
  void apply_x(std::size_t target) { apply_gate_1q(target, gates::X()); }

  // dst += src (mod 2^|dst|), or dst -= src when subtract is set, on every basis state
  // whose control qubits are all 1. Registers are LSB first and must be disjoint.
  void apply_add(std::span<const std::size_t> src, std::span<const std::size_t> dst,
                 std::span<const std::size_t> controls = {}, bool subtract = false);

  // Measures one qubit and collapses the state onto the outcome.
  int measure(std::size_t qubit, Rng& rng);
  std::vector<int> measure_all(Rng& rng, bool collapse=true);
  double probability_of_basis(std::size_t basis_index) const;
  double probability_of_one(std::size_t qubit) const;
};

} // namespace qth
