// SPDX-License-Identifier: MIT

#include "qthought/subspace.hpp"
#include "qthought/errors.hpp"
#include "qthought/log.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace qth {

Wavefunction filter_subspace(const Wavefunction& wf, const Subspace& subspace) {
  std::unordered_set<std::string> keep(subspace.begin(), subspace.end());
  Wavefunction out = wf;
  for (auto& [label, amp] : out) {
    if (!keep.count(label)) amp = {0.0, 0.0};
  }
  return out;
}

double norm(const Wavefunction& wf) {
  double s = 0.0;
  for (const auto& [label, amp] : wf) s += std::norm(amp);
  return std::sqrt(s);
}

std::optional<Wavefunction> renormalize(Wavefunction wf, double tol) {
  const double state_norm = norm(wf);
  if (state_norm < tol) {
    log::warn("Wavefunction norm smaller than tolerance. Likely there is no overlap or a bug in your protocol.");
    return std::nullopt;
  }
  for (auto& [label, amp] : wf) amp /= state_norm;
  return wf;
}

c64 overlap(const Wavefunction& psi, const Wavefunction& phi) {
  if (psi.size() < phi.size())
    throw PreconditionError("overlap: psi has " + std::to_string(psi.size()) + " labels, phi has " +
                            std::to_string(phi.size()) + "; compare states of the same length");
  c64 acc{0.0, 0.0};
  for (const auto& [label, amp] : psi) {
    auto it = phi.find(label);
    if (it != phi.end()) acc += amp * std::conj(it->second);
  }
  return acc;
}

bool overlaps_with_subspace(const Wavefunction& wf, const Subspace& subspace, double tol) {
  for (const auto& basisvector : subspace) {
    auto it = wf.find(basisvector);
    if (it != wf.end() && std::abs(it->second) > tol) return true;
  }
  return false;
}

double probability_in_subspace(const Wavefunction& wf, const Subspace& subspace) {
  double p = 0.0;
  for (const auto& basisvector : subspace) {
    auto it = wf.find(basisvector);
    if (it != wf.end()) p += std::norm(it->second);
  }
  return p;
}

std::optional<Wavefunction> project_wavefunction(const Wavefunction& wf, const Subspace& subspace, double tol) {
  return renormalize(filter_subspace(wf, subspace), tol);
}

Subspace outer_subspace_product(const Subspace& a, const Subspace& b, bool reverse) {
  if (a.empty()) return b;
  if (b.empty()) return a;
  Subspace out;
  out.reserve(a.size() * b.size());
  for (const auto& va : a)
    for (const auto& vb : b)
      out.push_back(reverse ? vb + va : va + vb);
  return out;
}

Subspace all_basis_vectors(std::size_t n) {
  const Subspace basis_1dim = {"0", "1"};
  Subspace current;
  for (std::size_t i = 0; i < n; ++i) current = outer_subspace_product(basis_1dim, current);
  return current;
}

std::string int_to_bitstring(std::size_t value, std::size_t width) {
  if (width < 64 && (value >> width) != 0)
    throw ConfigError("Value " + std::to_string(value) + " does not fit into " + std::to_string(width) + " bits");
  std::string s(width, '0');
  for (std::size_t k = 0; k < width; ++k)
    if ((value >> k) & 1) s[width - 1 - k] = '1';
  return s;
}

std::size_t bitstring_to_int(const std::string& bits) {
  std::size_t v = 0;
  for (char c : bits) v = (v << 1) | (c == '1' ? 1 : 0);
  return v;
}

Wavefunction to_wavefunction(const vec_c64& amp, std::size_t n) {
  Wavefunction wf;
  for (std::size_t i = 0; i < amp.size(); ++i) wf.emplace_hint(wf.end(), int_to_bitstring(i, n), amp[i]);
  return wf;
}

vec_c64 to_amplitudes(const Wavefunction& wf, std::size_t n) {
  vec_c64 amp(std::size_t(1) << n, c64{0.0, 0.0});
  for (const auto& [label, a] : wf) {
    if (label.size() != n) throw PreconditionError("Basis label '" + label + "' has wrong length for " + std::to_string(n) + " qubits");
    amp[bitstring_to_int(label)] = a;
  }
  return amp;
}

} // namespace qth
