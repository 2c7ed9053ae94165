// SPDX-License-Identifier: MIT

#include "qthought/errors.hpp"
#include "qthought/log.hpp"
#include "qthought/quantum_system.hpp"
#include <cmath>
#include <iostream>

using namespace qth;

static int tests_failed = 0;
#define CHECK(c) do{ if (!(c)) { std::cerr << "CHECK failed at " << __LINE__ << ": " #c "\n"; ++tests_failed; } }while(0)
#define EXPECT_NEAR(a,b,eps) do{ if (std::fabs((a)-(b))>(eps)) { std::cerr << "EXPECT_NEAR failed at " << __LINE__ << ": " << (a) << " vs " << (b) << "\n"; ++tests_failed; } }while(0)
#define EXPECT_THROW(stmt, E) do{ bool thrown_ = false; try { stmt; } catch (const E&) { thrown_ = true; } if (!thrown_) { std::cerr << "EXPECT_THROW failed at " << __LINE__ << ": " #stmt "\n"; ++tests_failed; } }while(0)

static Requirements small_lab() {
  Requirements r;
  r += Domain{{ResourceSpec::qubit(), {"s"}}};
  r += Domain{{ResourceSpec::reg(2), {"r"}}};
  r += Domain{{ResourceSpec::agent(1, 1), {"Alice"}}};
  return r;
}

int main(){
  log::set_level(log::Level::Quiet);

  // Allocation: s -> 0, r -> 1..2, Alice -> 3..6
  {
    QuantumSystem q(small_lab());
    CHECK(q.n_qubits() == 7);
    CHECK((q.subsystems() == std::vector<std::string>{"s", "r", "Alice"}));
    CHECK((q.get_position("r") == std::vector<std::size_t>{1, 2}));
    CHECK(q["Alice"].offset == 3 && q["Alice"].width == 4);
    CHECK((q.get_position("Alice_memory") == std::vector<std::size_t>{3}));
    CHECK((q.get_position("Alice_prediction") == std::vector<std::size_t>{4}));
    CHECK((q.get_position("Alice_inference") == std::vector<std::size_t>{5, 6}));
    CHECK(q.has("Alice_memory") && !q.has("Bob"));
    EXPECT_THROW(q["Bob"], UnknownSubsystem);
    try { q.width("Bob"); } catch (const UnknownSubsystem& e) { CHECK(e.name() == "Bob"); }
    const auto wf = q.get_wavefunction();
    CHECK(wf.size() == 128);
    EXPECT_NEAR(std::abs(wf.at("0000000")), 1.0, 1e-12);
  }

  // Subspace of a value: the named bits are fixed, all others free
  {
    QuantumSystem q(small_lab());
    auto sub = q.subspace_of_state_n("r", 1);
    CHECK(sub.size() == 32);
    for (const auto& label : sub) CHECK(label.substr(4, 2) == "01");
    auto ss = q.subspace_of_state_n("s", 1);
    CHECK(ss.size() == 64);
    for (const auto& label : ss) CHECK(label.back() == '1');
    EXPECT_THROW(q.subspace_of_state_n("r", 4), ConfigError);
  }

  // Readout of definite values in both bit orders
  {
    QuantumSystem q(small_lab());
    q.prepare_value("r", 1);
    CHECK(q.readout_value("r") == 1);
    CHECK(q.readout("r", BitOrder::Print) == "01");
    CHECK(q.readout("r") == "10");
    CHECK(q.readout("s") == "0");
    q.apply(gates::H(), "s");
    EXPECT_THROW(q.readout("s"), PreconditionError);
    CHECK((q.possible_values("s") == std::vector<std::size_t>{0, 1}));
  }

  // Preparing a value flips bits: from |0> it sets the value, otherwise it XORs
  {
    QuantumSystem q(small_lab());
    q.prepare_value("r", 1);
    q.prepare_value("r", 3);
    CHECK(q.readout_value("r") == 2);
    EXPECT_THROW(q.prepare_value("r", 4), ConfigError);
  }

  // Projection onto a subspace and the zero-overlap no-op
  {
    QuantumSystem q(small_lab());
    q.apply(gates::H(), "s");
    q.apply(gates::X(), "r", {"s"});
    CHECK((q.possible_values("r") == std::vector<std::size_t>{0, 3}));
    auto p = q.project_to_subspace(q.subspace_of_state_n("s", 1));
    CHECK(p.has_value());
    CHECK(q.readout_value("r") == 3);
    const auto before = q.get_wavefunction();
    CHECK(!q.project_to_subspace(q.subspace_of_state_n("s", 0)).has_value());
    CHECK(q.get_wavefunction() == before);
  }

  // Measuring collapses one subsystem; reset returns to all zeros
  {
    QuantumSystem q(small_lab());
    q.apply(gates::H(), "r");
    const std::size_t v = q.measure("r");
    CHECK(v < 4);
    CHECK(q.readout_value("r") == v);
    q.apply(gates::H(), "s");
    q.reset();
    CHECK(q.readout_value("s") == 0);
    CHECK(q.readout_value("r") == 0);
    EXPECT_NEAR(std::abs(q.get_wavefunction().at("0000000")), 1.0, 1e-12);
  }

  // Custom wavefunctions
  {
    Requirements r(Domain{{ResourceSpec::qubit(), {"a", "b"}}});
    QuantumSystem q(r);
    const double s = 1.0/std::sqrt(2.0);
    q.set_wavefunction({{"00",{1,0}}, {"01",{0,0}}, {"10",{0,0}}, {"11",{1,0}}});
    EXPECT_NEAR(std::abs(q.get_wavefunction().at("11")), s, 1e-12);
    CHECK((q.possible_values("b") == std::vector<std::size_t>{0, 1}));
    EXPECT_THROW(q.set_wavefunction({{"00",{1,0}}}), PreconditionError);
    EXPECT_THROW(q.set_wavefunction({{"00",{0,0}}, {"01",{0,0}}, {"10",{0,0}}, {"11",{0,0}}}), PreconditionError);
    CHECK(q.print_wavefunction() == "0.71|00> + 0.71|11>");
    CHECK(q.str().find("['b', 'a']") != std::string::npos);
  }

  // Gate targets may not overlap their controls
  {
    QuantumSystem q(small_lab());
    EXPECT_THROW(q.apply(gates::X(), "Alice", {"Alice_memory"}), PreconditionError);
  }

  // Invalid layouts
  {
    Requirements big;
    big += Domain{{ResourceSpec::agent(3, 1), {"A", "B"}}, {ResourceSpec::qubit(), {"s"}}};
    EXPECT_THROW(QuantumSystem{big}, ConfigError);
    Requirements many;
    many += Domain{{ResourceSpec::reg(kMaxQubits), {"a", "b"}}};
    EXPECT_THROW(QuantumSystem{many}, ConfigError);
    Requirements clash;
    clash += Domain{{ResourceSpec::qubit(), {"A_memory"}}, {ResourceSpec::agent(1, 1), {"A"}}};
    EXPECT_THROW(QuantumSystem{clash}, ConfigError);
  }

  // Copies evolve independently
  {
    QuantumSystem a(small_lab());
    QuantumSystem b = a;
    b.apply(gates::X(), "s");
    CHECK(a.readout_value("s") == 0);
    CHECK(b.readout_value("s") == 1);
  }

  if (tests_failed==0){ std::cout << "OK\n"; }
  return tests_failed == 0 ? 0 : 1;
}
