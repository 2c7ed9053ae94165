// SPDX-License-Identifier: MIT

#include "qthought/state_vector.hpp"
#include "qthought/errors.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#ifdef QTH_OPENMP
#include <omp.h>
#endif

namespace qth {

static std::size_t mask_of(std::span<const std::size_t> qubits) {
  std::size_t m = 0;
  for (auto q : qubits) m |= std::size_t(1) << q;
  return m;
}

static std::size_t gather(std::size_t i, std::span<const std::size_t> reg) {
  std::size_t v = 0;
  for (std::size_t k = 0; k < reg.size(); ++k) v |= ((i >> reg[k]) & 1) << k;
  return v;
}

static std::size_t scatter(std::size_t i, std::span<const std::size_t> reg, std::size_t v) {
  for (std::size_t k = 0; k < reg.size(); ++k) {
    const std::size_t m = std::size_t(1) << reg[k];
    i = ((v >> k) & 1) ? (i | m) : (i & ~m);
  }
  return i;
}

StateVector::StateVector(std::size_t n) : n_(n), amp_(std::size_t(1) << n, c64{0.0, 0.0}) {
  amp_[0] = {1.0, 0.0};
}

void StateVector::normalize_() {
  const double norm2 = std::accumulate(amp_.begin(), amp_.end(), 0.0,
                                       [](double acc, const c64& a) { return acc + std::norm(a); });
  if (norm2 <= 0.0) return;
  const double inv = 1.0 / std::sqrt(norm2);
  for (auto& a : amp_) a *= inv;
}

void StateVector::collapse_(std::size_t mask, std::size_t value) {
  for (std::size_t i = 0; i < amp_.size(); ++i)
    if ((i & mask) != value) amp_[i] = {0.0, 0.0};
  normalize_();
}

void StateVector::set_amplitudes(vec_c64 amp) {
  if (amp.size() != amp_.size())
    throw PreconditionError("Amplitude vector of size " + std::to_string(amp.size()) +
                            " does not match dimension " + std::to_string(amp_.size()));
  amp_ = std::move(amp);
}

void StateVector::apply_gate_1q(std::size_t target, const Gate1q& u, std::span<const std::size_t> controls) {
  const std::size_t N = amp_.size();
  const std::size_t mask = std::size_t(1) << target;
  const std::size_t cm = mask_of(controls);
  if (cm & mask) return;
#ifdef QTH_OPENMP
#pragma omp parallel for schedule(static)
#endif
  for (std::size_t i = 0; i < N; ++i) {
    if ((i & mask) == 0 && (i & cm) == cm) {
      const std::size_t j = i | mask;
      c64 a0 = amp_[i];
      c64 a1 = amp_[j];
      amp_[i] = u.u00 * a0 + u.u01 * a1;
      amp_[j] = u.u10 * a0 + u.u11 * a1;
    }
  }
  if ((++applied_ & 255) == 0) normalize_();
}

void StateVector::apply_add(std::span<const std::size_t> src, std::span<const std::size_t> dst,
                            std::span<const std::size_t> controls, bool subtract) {
  if (dst.empty()) return;
  if (mask_of(src) & mask_of(dst)) throw PreconditionError("apply_add: source and destination registers overlap");
  const std::size_t cm = mask_of(controls);
  if (cm & mask_of(dst)) throw PreconditionError("apply_add: control qubits overlap the destination register");
  const std::size_t N = amp_.size();
  const std::size_t modulus = std::size_t(1) << dst.size();
  // Permutation of basis states.
  vec_c64 out(N, c64{0.0, 0.0});
#ifdef QTH_OPENMP
#pragma omp parallel for schedule(static)
#endif
  for (std::size_t i = 0; i < N; ++i) {
    std::size_t j = i;
    if ((i & cm) == cm) {
      const std::size_t a = gather(i, src) % modulus;
      const std::size_t b = gather(i, dst);
      const std::size_t r = subtract ? (b + modulus - a) % modulus : (b + a) % modulus;
      j = scatter(i, dst, r);
    }
    out[j] = amp_[i];
  }
  amp_.swap(out);
}

double StateVector::probability_of_basis(std::size_t basis_index) const {
  return std::norm(amp_.at(basis_index));
}

double StateVector::probability_of_one(std::size_t qubit) const {
  const std::size_t m = std::size_t(1) << qubit;
  double p = 0.0;
  for (std::size_t i = 0; i < amp_.size(); ++i) if (i & m) p += std::norm(amp_[i]);
  return p;
}

int StateVector::measure(std::size_t qubit, Rng& rng) {
  const std::size_t m = std::size_t(1) << qubit;
  const int outcome = rng.bernoulli(probability_of_one(qubit)) ? 1 : 0;
  collapse_(m, outcome ? m : 0);
  return outcome;
}

std::vector<int> StateVector::measure_all(Rng& rng, bool collapse) {
  // Inverse-CDF sampling of one basis index; rounding leftovers fall on the last populated one.
  const double r = rng.uniform();
  double acc = 0.0;
  std::size_t idx = 0;
  for (std::size_t i = 0; i < amp_.size(); ++i) {
    const double p = std::norm(amp_[i]);
    if (p == 0.0) continue;
    idx = i;
    acc += p;
    if (r < acc) break;
  }
  std::vector<int> bits(n_);
  for (std::size_t q = 0; q < n_; ++q) bits[q] = int((idx >> q) & 1);
  if (collapse) {
    collapse_(amp_.size() - 1, idx);
    amp_[idx] = {1.0, 0.0};  // drop the global phase
  }
  return bits;
}

} // namespace qth
