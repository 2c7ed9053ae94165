// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include <optional>

namespace qth {

// Born-rule arithmetic over computational-basis aligned subspaces. Labels are MSB first.

// Zeroes every amplitude whose label is not in `subspace`. The discarded mass is not redistributed.
Wavefunction filter_subspace(const Wavefunction& wf, const Subspace& subspace);

// Divides by the norm. Returns nullopt (and warns) if the norm is below `tol`.
std::optional<Wavefunction> renormalize(Wavefunction wf, double tol = kTolerance);

double norm(const Wavefunction& wf);

// <phi|psi>, treating labels missing from phi as zero. Requires |psi| >= |phi|.
c64 overlap(const Wavefunction& psi, const Wavefunction& phi);

bool overlaps_with_subspace(const Wavefunction& wf, const Subspace& subspace, double tol = kTolerance);
double probability_in_subspace(const Wavefunction& wf, const Subspace& subspace);

// filter_subspace followed by renormalize.
std::optional<Wavefunction> project_wavefunction(const Wavefunction& wf, const Subspace& subspace,
                                                 double tol = kTolerance);

// Cartesian product A x B of label sets (B x A if reversed). The empty list is the identity.
Subspace outer_subspace_product(const Subspace& a, const Subspace& b, bool reverse = false);

// All 2^n labels of length n; n == 0 gives the empty list.
Subspace all_basis_vectors(std::size_t n);

// Binary representation of value, MSB first, padded to `width` characters.
std::string int_to_bitstring(std::size_t value, std::size_t width);
std::size_t bitstring_to_int(const std::string& bits);

// Dense amplitude vector <-> labelled wavefunction (index bit q is qubit q).
Wavefunction to_wavefunction(const vec_c64& amp, std::size_t n);
vec_c64 to_amplitudes(const Wavefunction& wf, std::size_t n);

} // namespace qth
