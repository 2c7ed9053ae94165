// SPDX-License-Identifier: MIT

#include "qthought/errors.hpp"
#include "qthought/state_vector.hpp"
#include <cmath>
#include <iostream>
#include <vector>

using namespace qth;

static int tests_failed = 0;
#define CHECK(c) do{ if (!(c)) { std::cerr << "CHECK failed at " << __LINE__ << ": " #c "\n"; ++tests_failed; } }while(0)
#define EXPECT_NEAR(a,b,eps) do{ if (std::fabs((a)-(b))>(eps)) { std::cerr << "EXPECT_NEAR failed at " << __LINE__ << ": " << (a) << " vs " << (b) << "\n"; ++tests_failed; } }while(0)
#define EXPECT_THROW(stmt, E) do{ bool thrown_ = false; try { stmt; } catch (const E&) { thrown_ = true; } if (!thrown_) { std::cerr << "EXPECT_THROW failed at " << __LINE__ << ": " #stmt "\n"; ++tests_failed; } }while(0)

// Basis index holding all the probability, or dimension() if the state is not a basis state.
static std::size_t basis_of(const StateVector& sv) {
  for (std::size_t i = 0; i < sv.dimension(); ++i)
    if (sv.probability_of_basis(i) > 1.0 - 1e-9) return i;
  return sv.dimension();
}

int main(){
  // Bell state via H and a controlled X
  {
    StateVector sv(2);
    sv.apply_gate_1q(0, gates::H());
    std::vector<std::size_t> ctrl{0};
    sv.apply_gate_1q(1, gates::X(), ctrl);
    EXPECT_NEAR(sv.probability_of_basis(0), 0.5, 1e-12);
    EXPECT_NEAR(sv.probability_of_basis(3), 0.5, 1e-12);
    EXPECT_NEAR(sv.probability_of_basis(1), 0.0, 1e-12);
    EXPECT_NEAR(sv.probability_of_one(1), 0.5, 1e-12);
  }

  // Modular addition on 2-qubit registers: dst = 3, src = 3 -> dst = 2
  const std::vector<std::size_t> src{0, 1}, dst{2, 3};
  {
    StateVector sv(4);
    for (std::size_t q = 0; q < 4; ++q) sv.apply_x(q);
    sv.apply_add(src, dst);
    CHECK(basis_of(sv) == (3u | (2u << 2)));
    sv.apply_add(src, dst, {}, true);
    CHECK(basis_of(sv) == 15u);
  }

  // Controlled addition only acts where the control is set
  {
    StateVector sv(5);
    sv.apply_x(0);                       // src = 1
    std::vector<std::size_t> ctrl{4};
    sv.apply_add(src, dst, ctrl);
    CHECK(basis_of(sv) == 1u);
    sv.apply_x(4);
    sv.apply_add(src, dst, ctrl);
    CHECK(basis_of(sv) == (1u | (1u << 2) | (1u << 4)));
  }

  // Addition is a permutation: it undoes exactly on superpositions
  {
    StateVector sv(4);
    sv.apply_gate_1q(0, gates::H());
    sv.apply_gate_1q(1, gates::RY(0.7));
    sv.apply_gate_1q(2, gates::H());
    const auto before = sv.amplitudes();
    sv.apply_add(src, dst);
    sv.apply_add(src, dst, {}, true);
    double diff = 0.0;
    for (std::size_t i = 0; i < before.size(); ++i) diff += std::abs(before[i] - sv.amplitudes()[i]);
    EXPECT_NEAR(diff, 0.0, 1e-12);
  }

  // Overlapping registers are rejected
  {
    StateVector sv(3);
    std::vector<std::size_t> a{0, 1}, b{1, 2}, c{2};
    EXPECT_THROW(sv.apply_add(a, b), PreconditionError);
    EXPECT_THROW(sv.apply_add(std::vector<std::size_t>{0}, c, c), PreconditionError);
    EXPECT_THROW(sv.set_amplitudes(vec_c64(4)), PreconditionError);
  }

  // Measurement collapses
  {
    Rng rng(7);
    StateVector sv(1);
    sv.apply_gate_1q(0, gates::H());
    const int bit = sv.measure(0, rng);
    EXPECT_NEAR(sv.probability_of_one(0), bit == 1 ? 1.0 : 0.0, 1e-12);
    CHECK(sv.measure(0, rng) == bit);
  }

  // Sampling every qubit only returns populated basis states and collapses onto them
  {
    for (uint64_t seed = 1; seed <= 20; ++seed) {
      Rng rng(seed);
      StateVector sv(3);
      sv.apply_x(0);
      sv.apply_gate_1q(2, gates::H());
      sv.apply_gate_1q(2, gates::S());
      const auto bits = sv.measure_all(rng);
      CHECK(bits.size() == 3 && bits[0] == 1 && bits[1] == 0);
      const std::size_t idx = std::size_t(bits[0]) | (std::size_t(bits[2]) << 2);
      CHECK(basis_of(sv) == idx);
      EXPECT_NEAR(sv.amplitudes()[idx].real(), 1.0, 1e-12);
    }
    Rng rng(3);
    StateVector sv(2);
    sv.apply_gate_1q(1, gates::H());
    const auto peek = sv.measure_all(rng, false);
    CHECK(peek[0] == 0);
    EXPECT_NEAR(sv.probability_of_one(1), 0.5, 1e-12);
  }

  // Rotation preparing a biased qubit
  {
    StateVector sv(1);
    sv.apply_gate_1q(0, gates::prepare(0.25));
    EXPECT_NEAR(sv.probability_of_basis(0), 0.25, 1e-12);
    EXPECT_NEAR(sv.probability_of_one(0), 0.75, 1e-12);
    sv.apply_gate_1q(0, gates::prepare(0.25).adjoint());
    EXPECT_NEAR(sv.probability_of_basis(0), 1.0, 1e-12);
  }

  if (tests_failed==0){ std::cout << "OK\n"; }
  return tests_failed == 0 ? 0 : 1;
}
