// SPDX-License-Identifier: MIT

#pragma once
#include "agent.hpp"
#include "config.hpp"
#include "gates.hpp"
#include "random.hpp"
#include "requirements.hpp"
#include "state_vector.hpp"
#include "subspace.hpp"
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qth {

enum class SubsystemKind { Qubit, Register, AgentMemory, Agent, AgentPrediction, AgentInference };

// A named, contiguous qubit range [offset, offset + width) of the backend.
struct Subsystem {
  std::string name;
  SubsystemKind kind;
  std::size_t offset;
  std::size_t width;
};

// Internal: LSB first. Print: MSB first.
enum class BitOrder { Internal, Print };

// Named subsystems over one state-vector backend.
//
// Subsystems are allocated contiguously in the iteration order of the consolidated
// requirements. An Agent "A" also exposes "A_memory", "A_prediction" and "A_inference";
// a bare AgentMemory "B" is named "B_memory". Copies are fully independent.
class QuantumSystem {
  std::vector<Declaration> reqs_;
  Config cfg_;
  StateVector sv_;
  Rng rng_;
  std::vector<std::string> order_;
  std::map<std::string, Subsystem, std::less<>> handles_;
  std::map<std::string, Agent, std::less<>> agents_;

  void add_handle_(Subsystem s);

public:
  explicit QuantumSystem(Requirements reqs, const Config& cfg = {});

  std::size_t n_qubits() const { return sv_.num_qubits(); }
  const std::vector<Declaration>& requirements() const { return reqs_; }
  // Top-level subsystems in allocation (internal) order; reverse for print order.
  const std::vector<std::string>& subsystems() const { return order_; }
  const Config& config() const { return cfg_; }

  bool has(std::string_view name) const { return handles_.count(name) != 0; }
  // Throws UnknownSubsystem.
  const Subsystem& operator[](std::string_view name) const;
  std::size_t width(std::string_view name) const { return (*this)[name].width; }
  // Backend qubit indices of `name`, LSB first.
  std::vector<std::size_t> get_position(std::string_view name) const;

  Agent& agent(std::string_view name);
  const Agent& agent(std::string_view name) const;

  StateVector& backend() { return sv_; }
  const StateVector& backend() const { return sv_; }

  Wavefunction get_wavefunction() const;
  // Requires all 2^n labels; renormalizes. Throws PreconditionError on an invalid state.
  void set_wavefunction(const Wavefunction& wf);

  // Labels in which `name` holds value n while every other qubit is free.
  Subspace subspace_of_state_n(std::string_view name, std::size_t n) const;
  // Projects and renormalizes. On zero overlap warns, leaves the state untouched and returns nullopt.
  std::optional<Wavefunction> project_to_subspace(const Subspace& subspace);

  // Values of `name` with nonzero overlap with the current state, ascending.
  std::vector<std::size_t> possible_values(std::string_view name) const;
  // Throws PreconditionError unless exactly one value of `name` is populated.
  std::size_t readout_value(std::string_view name) const;
  std::string readout(std::string_view name, BitOrder order = BitOrder::Internal) const;

  // Collapses `name` onto a measured value and returns it.
  std::size_t measure(std::string_view name);
  // Measures everything, flips ones back to zero and measures again.
  void reset();

  // Applies `gate` to every qubit of `target`, controlled on all qubits of `controls`.
  void apply(const Gate1q& gate, std::string_view target, const std::vector<std::string>& controls = {});
  // Flips the qubits of `name` whose bit in `value` is set; from |0..0> this prepares |value>.
  void prepare_value(std::string_view name, std::size_t value);

  void set_inference_table(std::string_view agent_name, const InferenceTable& table) { agent(agent_name).set_inference_table(table); }
  void prep_inference(std::string_view agent_name) { agent(agent_name).prep_inference(sv_); }
  void make_inference(std::string_view agent_name, bool reverse = false) { agent(agent_name).make_inference(sv_, reverse); }

  std::string print_wavefunction() const;
  std::string str() const;
};

// memory += observed (mod 2^|memory|); the exact inverse when reverse is set.
// Requires |memory| >= |observed|.
void observe(QuantumSystem& qsys, std::string_view memory, std::string_view observed, bool reverse = false);

} // namespace qth
