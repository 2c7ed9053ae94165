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

static Requirements lab(std::size_t n_mem, std::size_t n_pred) {
  Requirements r;
  r += Domain{{ResourceSpec::qubit(), {"s"}}, {ResourceSpec::agent(n_mem, n_pred), {"A"}}};
  return r;
}

int main(){
  log::set_level(log::Level::Quiet);

  // Layout of the three agent registers
  {
    Agent a("A", 5, 2, 1);
    CHECK(a.n_inference() == 4);
    CHECK(a.n_qubits() == 7);
    CHECK((a.memory() == std::vector<std::size_t>{5, 6}));
    CHECK((a.prediction() == std::vector<std::size_t>{7}));
    CHECK((a.inference_slice(0) == std::vector<std::size_t>{8}));
    CHECK((a.inference_slice(3) == std::vector<std::size_t>{11}));
    EXPECT_THROW(a.inference_slice(4), PreconditionError);
    EXPECT_THROW(Agent("B", 0, 1, 2), ConfigError);
    EXPECT_THROW(Agent("B", 0, 1, 1, 2), ConfigError);
    EXPECT_THROW(Agent("B", 0, 64, 1), ConfigError);
  }

  // Table validation and resolution of ambiguous entries
  {
    Agent a("A", 0, 2, 2);
    EXPECT_THROW(a.set_inference_table(InferenceMapping{{4, {0}}}, 0), ConfigError);
    EXPECT_THROW(a.set_inference_table(InferenceMapping{{0, {4}}}, 0), ConfigError);
    EXPECT_THROW(a.set_inference_table(InferenceMapping{{0, {1}}}, 4), ConfigError);
    a.set_inference_table(InferenceMapping{{0, {2}}, {1, {1, 3}}, {3, {3}}}, 0);
    CHECK((a.inference_table() == std::vector<std::size_t>{2, 0, 0, 3}));
    a.set_inference_table(InferenceMapping{{1, {1, 3}}}, 2);
    CHECK((a.inference_table() == std::vector<std::size_t>{2, 2, 2, 2}));
    CHECK(a.no_prediction_state() == 2);
  }

  // Memory 1 predicts 1; the reverse inference clears the prediction again
  {
    QuantumSystem q(lab(1, 1));
    q.set_inference_table("A", InferenceTable("s", 1, "s", 2, {{0, {0}}, {1, {1}}}));
    q.prepare_value("A_memory", 1);
    q.prep_inference("A");
    CHECK(q.agent("A").inference_prepared());
    CHECK(q.readout_value("A_inference") == 2);
    q.make_inference("A");
    CHECK(q.agent("A").inference_made());
    auto [mem, pred] = q.agent("A").readout(q);
    CHECK(mem == 1 && pred == 1);
    q.make_inference("A", true);
    CHECK(q.readout_value("A_prediction") == 0);
    CHECK(q.readout_value("A_memory") == 1);
    CHECK(q.readout_value("A_inference") == 2);
  }

  // Loading the inference system twice is a no-op; the table is frozen afterwards
  {
    QuantumSystem q(lab(1, 1));
    q.set_inference_table("A", InferenceTable("s", 1, "s", 2, {{1, {1}}}));
    q.prep_inference("A");
    q.prep_inference("A");
    CHECK(q.readout_value("A_inference") == 2);
    EXPECT_THROW(q.set_inference_table("A", InferenceTable("s", 1, "s", 2, {{0, {1}}})), PreconditionError);
    q.reset();
    CHECK(!q.agent("A").inference_prepared());
    CHECK(q.readout_value("A_inference") == 0);
  }

  // Inference on a memory in superposition stays correlated with it
  {
    QuantumSystem q(lab(1, 1));
    q.set_inference_table("A", InferenceTable("s", 1, "s", 2, {{0, {1}}, {1, {0}}}));
    q.apply(gates::H(), "s");
    observe(q, "A_memory", "s");
    q.prep_inference("A");
    q.make_inference("A");
    CHECK((q.possible_values("A_prediction") == std::vector<std::size_t>{0, 1}));
    auto s1 = q.subspace_of_state_n("s", 1);
    q.project_to_subspace(s1);
    CHECK(q.readout_value("A_memory") == 1);
    CHECK(q.readout_value("A_prediction") == 0);
  }

  // Forward then reverse inference restores the state exactly
  {
    QuantumSystem q(lab(2, 1));
    q.set_inference_table("A", InferenceTable("s", 1, "s", 2, {{0, {1}}, {1, {0}}, {2, {1}}, {3, {0, 1}}}));
    q.apply(gates::H(), "A_memory");
    q.apply(gates::RY(0.4), "A_prediction");
    q.prep_inference("A");
    const auto before = q.get_wavefunction();
    q.make_inference("A");
    q.make_inference("A", true);
    const auto after = q.get_wavefunction();
    double diff = 0.0;
    for (const auto& [label, amp] : before) diff += std::abs(amp - after.at(label));
    EXPECT_NEAR(diff, 0.0, 1e-12);
  }

  if (tests_failed==0){ std::cout << "OK\n"; }
  return tests_failed == 0 ? 0 : 1;
}
