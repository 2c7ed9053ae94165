// SPDX-License-Identifier: MIT

#pragma once
#include "inference_table.hpp"
#include <string>
#include <utility>
#include <vector>

namespace qth {

class StateVector;
class QuantumSystem;

// An observer made of three contiguous registers on the backend:
//   memory (n_memory), prediction (n_pred), inference system (2^n_memory * n_pred).
// Slice i of the inference system holds the prediction for memory value i.
class Agent {
  std::string name_;
  std::size_t offset_;
  std::size_t n_memory_;
  std::size_t n_pred_;
  std::size_t no_prediction_state_;
  std::vector<std::size_t> inference_table_;
  bool inference_made_ = false;
  bool inf_sys_prepared_ = false;

  std::vector<std::size_t> range_(std::size_t first, std::size_t len) const;

public:
  Agent(std::string name, std::size_t offset, std::size_t n_memory, std::size_t n_pred, std::size_t no_prediction_state = 0);

  const std::string& name() const { return name_; }
  std::size_t offset() const { return offset_; }
  std::size_t n_memory() const { return n_memory_; }
  std::size_t n_pred() const { return n_pred_; }
  std::size_t n_inference() const { return (std::size_t(1) << n_memory_) * n_pred_; }
  std::size_t n_qubits() const { return n_memory_ + n_pred_ + n_inference(); }

  // Backend qubit indices, LSB first.
  std::vector<std::size_t> memory() const { return range_(offset_, n_memory_); }
  std::vector<std::size_t> prediction() const { return range_(offset_ + n_memory_, n_pred_); }
  std::vector<std::size_t> inference_slice(std::size_t i) const;

  // Stores one prediction per memory value. Inputs with more than one candidate
  // output get `no_prediction_state`. Throws ConfigError if a key or value does not fit,
  // PreconditionError once the table has been loaded into the inference system.
  void set_inference_table(const InferenceTable& table);
  void set_inference_table(const InferenceTable& table, std::size_t no_prediction_state);
  void set_inference_table(const InferenceMapping& table, std::size_t no_prediction_state);
  const std::vector<std::size_t>& inference_table() const { return inference_table_; }
  std::size_t no_prediction_state() const { return no_prediction_state_; }

  // Writes the resolved table into the inference system. A second call does nothing.
  void prep_inference(StateVector& sv);

  // For every memory value i: map |i> to |1..1> on the memory, add (or subtract when
  // reversed) slice i into the prediction register controlled on the memory, map back.
  // make_inference(sv, true) undoes make_inference(sv) exactly.
  void make_inference(StateVector& sv, bool reverse = false);

  // The backend was reset to |0..0>: the inference system no longer holds the table.
  void workspace_cleared() { inference_made_ = false; inf_sys_prepared_ = false; }

  bool inference_made() const { return inference_made_; }
  bool inference_prepared() const { return inf_sys_prepared_; }

  // Definite (memory, prediction) values. Throws PreconditionError if either is not definite.
  std::pair<std::size_t, std::size_t> readout(const QuantumSystem& qsys) const;
};

// Flips every qubit of `reg` whose bit in i is 0, mapping |i> to |1..1> and back.
void state_i_to_1(StateVector& sv, std::size_t i, const std::vector<std::size_t>& reg);

} // namespace qth
