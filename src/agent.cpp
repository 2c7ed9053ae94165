// SPDX-License-Identifier: MIT

#include "qthought/agent.hpp"
#include "qthought/errors.hpp"
#include "qthought/log.hpp"
#include "qthought/quantum_system.hpp"
#include "qthought/state_vector.hpp"

namespace qth {

Agent::Agent(std::string name, std::size_t offset, std::size_t n_memory, std::size_t n_pred, std::size_t no_prediction_state)
  : name_(std::move(name)), offset_(offset), n_memory_(n_memory), n_pred_(n_pred), no_prediction_state_(no_prediction_state) {
  if (n_memory_ > kMaxQubits) throw ConfigError("Memory of " + name_ + " exceeds " + std::to_string(kMaxQubits) + " qubits");
  if (n_pred_ > n_memory_) throw ConfigError("Cannot make more different predictions than observed memory states");
  if (no_prediction_state_ >= (std::size_t(1) << n_pred_))
    throw ConfigError("No-prediction state " + std::to_string(no_prediction_state_) + " does not fit the prediction register of " + name_);
  inference_table_.assign(std::size_t(1) << n_memory_, no_prediction_state_);
}

std::vector<std::size_t> Agent::range_(std::size_t first, std::size_t len) const {
  std::vector<std::size_t> r(len);
  for (std::size_t k = 0; k < len; ++k) r[k] = first + k;
  return r;
}

std::vector<std::size_t> Agent::inference_slice(std::size_t i) const {
  if (i >= (std::size_t(1) << n_memory_)) throw PreconditionError("No inference slice " + std::to_string(i) + " in agent " + name_);
  return range_(offset_ + n_memory_ + n_pred_ + i * n_pred_, n_pred_);
}

void Agent::set_inference_table(const InferenceTable& table) {
  set_inference_table(table.table(), no_prediction_state_);
}

void Agent::set_inference_table(const InferenceTable& table, std::size_t no_prediction_state) {
  set_inference_table(table.table(), no_prediction_state);
}

void Agent::set_inference_table(const InferenceMapping& table, std::size_t no_prediction_state) {
  if (inf_sys_prepared_)
    throw PreconditionError("Inference table of " + name_ + " is already loaded into its inference system");
  const std::size_t n_mem_states = std::size_t(1) << n_memory_;
  const std::size_t n_pred_states = std::size_t(1) << n_pred_;
  if (table.size() > n_mem_states)
    throw ConfigError("Your inference table is too long and cannot be stored in the " + std::to_string(n_memory_) +
                      " memory qubits of " + name_);
  if (no_prediction_state >= n_pred_states)
    throw ConfigError("No-prediction state " + std::to_string(no_prediction_state) + " does not fit the prediction register of " + name_);
  for (const auto& [key, predictions] : table) {
    if (key >= n_mem_states)
      throw ConfigError("Inference table key " + std::to_string(key) + " exceeds the memory of " + name_);
    if (predictions.empty())
      throw ConfigError("Inference table entry " + std::to_string(key) + " of " + name_ + " has no prediction");
    for (auto p : predictions) {
      if (p >= n_pred_states)
        throw ConfigError("Inference value " + std::to_string(p) + " is higher than the prediction qubits of " + name_ + " can store");
    }
  }
  std::vector<std::size_t> resolved(n_mem_states, no_prediction_state);
  for (const auto& [key, predictions] : table)
    resolved[key] = predictions.size() > 1 ? no_prediction_state : predictions.front();
  inference_table_ = std::move(resolved);
  no_prediction_state_ = no_prediction_state;
}

void Agent::prep_inference(StateVector& sv) {
  if (inf_sys_prepared_) return;
  for (std::size_t i = 0; i < inference_table_.size(); ++i) {
    const auto slice = inference_slice(i);
    for (std::size_t k = 0; k < slice.size(); ++k)
      if ((inference_table_[i] >> k) & 1) sv.apply_x(slice[k]);
  }
  inf_sys_prepared_ = true;
}

void state_i_to_1(StateVector& sv, std::size_t i, const std::vector<std::size_t>& reg) {
  for (std::size_t k = 0; k < reg.size(); ++k)
    if (((i >> k) & 1) == 0) sv.apply_x(reg[k]);
}

void Agent::make_inference(StateVector& sv, bool reverse) {
  if (!inf_sys_prepared_) log::warn("make_inference called on " + name_ + " without loading an inference table");
  const auto mem = memory();
  const auto pred = prediction();
  for (std::size_t i = 0; i < inference_table_.size(); ++i) {
    state_i_to_1(sv, i, mem);
    sv.apply_add(inference_slice(i), pred, mem, reverse);
    state_i_to_1(sv, i, mem);
  }
  inference_made_ = true;
}

std::pair<std::size_t, std::size_t> Agent::readout(const QuantumSystem& qsys) const {
  return {qsys.readout_value(name_ + "_memory"), qsys.readout_value(name_ + "_prediction")};
}

} // namespace qth
