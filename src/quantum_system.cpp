// SPDX-License-Identifier: MIT

#include "qthought/quantum_system.hpp"
#include "qthought/errors.hpp"
#include "qthought/log.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace qth {

static std::size_t agent_qubits(const ResourceSpec& s) {
  return s.width + s.pred_width + (std::size_t(1) << s.width) * s.pred_width;
}

static std::size_t total_qubits(const std::vector<Declaration>& reqs) {
  auto too_many = [](std::size_t n) {
    return ConfigError("Requirements need " + std::to_string(n) + " qubits; at most " + std::to_string(kMaxQubits) + " are supported");
  };
  std::size_t n = 0;
  for (const auto& d : reqs) {
    d.spec.validate();
    const std::size_t per = d.spec.kind == ResourceKind::Agent ? agent_qubits(d.spec) : d.spec.width;
    if (per > kMaxQubits) throw too_many(per);
    for (std::size_t k = 0; k < d.names.size(); ++k) {
      n += per;
      if (n > kMaxQubits) throw too_many(n);
    }
  }
  return n;
}

static std::vector<Declaration> resolved(Requirements& reqs) { return reqs.get(); }

QuantumSystem::QuantumSystem(Requirements reqs, const Config& cfg)
  : reqs_(resolved(reqs)), cfg_(cfg), sv_(total_qubits(reqs_)), rng_(cfg.seed) {
  std::size_t offset = 0;
  for (const auto& d : reqs_) {
    for (const auto& name : d.names) {
      switch (d.spec.kind) {
        case ResourceKind::Qubit:
          add_handle_({name, SubsystemKind::Qubit, offset, 1});
          order_.push_back(name);
          offset += 1;
          break;
        case ResourceKind::Register:
          add_handle_({name, SubsystemKind::Register, offset, d.spec.width});
          order_.push_back(name);
          offset += d.spec.width;
          break;
        case ResourceKind::AgentMemory:
          add_handle_({name + "_memory", SubsystemKind::AgentMemory, offset, d.spec.width});
          order_.push_back(name + "_memory");
          offset += d.spec.width;
          break;
        case ResourceKind::Agent: {
          Agent a(name, offset, d.spec.width, d.spec.pred_width, cfg_.no_prediction_state);
          add_handle_({name, SubsystemKind::Agent, offset, a.n_qubits()});
          add_handle_({name + "_memory", SubsystemKind::AgentMemory, offset, a.n_memory()});
          add_handle_({name + "_prediction", SubsystemKind::AgentPrediction, offset + a.n_memory(), a.n_pred()});
          add_handle_({name + "_inference", SubsystemKind::AgentInference, offset + a.n_memory() + a.n_pred(), a.n_inference()});
          order_.push_back(name);
          offset += a.n_qubits();
          agents_.emplace(name, std::move(a));
          break;
        }
      }
      if (!cfg_.silent) log::info("Require " + d.spec.str() + " " + name);
    }
  }
}

void QuantumSystem::add_handle_(Subsystem s) {
  if (handles_.count(s.name)) throw ConfigError("Subsystem name '" + s.name + "' is declared twice");
  std::string key = s.name;
  handles_.emplace(std::move(key), std::move(s));
}

const Subsystem& QuantumSystem::operator[](std::string_view name) const {
  auto it = handles_.find(name);
  if (it == handles_.end()) throw UnknownSubsystem(std::string(name));
  return it->second;
}

std::vector<std::size_t> QuantumSystem::get_position(std::string_view name) const {
  const auto& s = (*this)[name];
  std::vector<std::size_t> pos(s.width);
  for (std::size_t k = 0; k < s.width; ++k) pos[k] = s.offset + k;
  return pos;
}

Agent& QuantumSystem::agent(std::string_view name) {
  auto it = agents_.find(name);
  if (it == agents_.end()) throw UnknownSubsystem(std::string(name));
  return it->second;
}

const Agent& QuantumSystem::agent(std::string_view name) const {
  auto it = agents_.find(name);
  if (it == agents_.end()) throw UnknownSubsystem(std::string(name));
  return it->second;
}

Wavefunction QuantumSystem::get_wavefunction() const {
  return to_wavefunction(sv_.amplitudes(), n_qubits());
}

void QuantumSystem::set_wavefunction(const Wavefunction& wf) {
  const std::size_t dim = std::size_t(1) << n_qubits();
  if (wf.size() != dim)
    throw PreconditionError("Please provide all " + std::to_string(dim) + " basis states, even if they have 0 amplitude");
  auto wf_norm = renormalize(wf, cfg_.tolerance);
  if (!wf_norm) throw PreconditionError("Invalid wavefunction");
  sv_.set_amplitudes(to_amplitudes(*wf_norm, n_qubits()));
  if (!cfg_.silent) log::info("Wavefunction set to custom state.");
}

Subspace QuantumSystem::subspace_of_state_n(std::string_view name, std::size_t n) const {
  const auto& s = (*this)[name];
  const std::size_t post_len = s.offset;
  const std::size_t pre_len = n_qubits() - post_len - s.width;
  Subspace subspace = outer_subspace_product(all_basis_vectors(pre_len), {int_to_bitstring(n, s.width)});
  return outer_subspace_product(subspace, all_basis_vectors(post_len));
}

std::optional<Wavefunction> QuantumSystem::project_to_subspace(const Subspace& subspace) {
  auto proj = project_wavefunction(get_wavefunction(), subspace, cfg_.tolerance);
  if (!proj) {
    log::warn("No overlap. No projection was performed.");
    return std::nullopt;
  }
  sv_.set_amplitudes(to_amplitudes(*proj, n_qubits()));
  return proj;
}

std::vector<std::size_t> QuantumSystem::possible_values(std::string_view name) const {
  const std::size_t w = width(name);
  const auto wf = get_wavefunction();
  std::vector<std::size_t> values;
  for (std::size_t j = 0; j < (std::size_t(1) << w); ++j) {
    if (overlaps_with_subspace(wf, subspace_of_state_n(name, j), cfg_.tolerance)) values.push_back(j);
  }
  return values;
}

std::size_t QuantumSystem::readout_value(std::string_view name) const {
  const auto values = possible_values(name);
  if (values.size() != 1)
    throw PreconditionError("Subsystem " + std::string(name) + " is not in a definite state (" +
                            std::to_string(values.size()) + " possible values). It has not been measured yet");
  return values.front();
}

std::string QuantumSystem::readout(std::string_view name, BitOrder order) const {
  std::string bits = int_to_bitstring(readout_value(name), width(name));
  if (order == BitOrder::Internal) std::reverse(bits.begin(), bits.end());
  return bits;
}

std::size_t QuantumSystem::measure(std::string_view name) {
  std::size_t value = 0;
  const auto pos = get_position(name);
  for (std::size_t k = 0; k < pos.size(); ++k)
    value |= std::size_t(sv_.measure(pos[k], rng_)) << k;
  return value;
}

void QuantumSystem::reset() {
  const auto bits = sv_.measure_all(rng_);
  for (std::size_t q = 0; q < bits.size(); ++q)
    if (bits[q]) sv_.apply_x(q);
  sv_.measure_all(rng_);
  for (auto& [name, a] : agents_) a.workspace_cleared();
  if (!cfg_.silent) log::info("Quantum system reset to: " + std::string(n_qubits(), '0'));
}

void QuantumSystem::apply(const Gate1q& gate, std::string_view target, const std::vector<std::string>& controls) {
  std::vector<std::size_t> ctrl;
  for (const auto& c : controls) {
    const auto pos = get_position(c);
    ctrl.insert(ctrl.end(), pos.begin(), pos.end());
  }
  const auto tgt = get_position(target);
  for (auto q : tgt) {
    if (std::find(ctrl.begin(), ctrl.end(), q) != ctrl.end())
      throw PreconditionError("Target " + std::string(target) + " overlaps its control qubits");
  }
  for (auto q : tgt) sv_.apply_gate_1q(q, gate, ctrl);
}

void QuantumSystem::prepare_value(std::string_view name, std::size_t value) {
  const auto pos = get_position(name);
  if (pos.size() < 64 && (value >> pos.size()) != 0)
    throw ConfigError("State " + std::to_string(value) + " does not fit into register " + std::string(name));
  for (std::size_t k = 0; k < pos.size(); ++k)
    if ((value >> k) & 1) sv_.apply_x(pos[k]);
}

static std::string cround(c64 v) {
  auto r2 = [](double x){ double r = std::round(x * 100.0) / 100.0; return r == 0.0 ? 0.0 : r; };
  const double re = r2(v.real()), im = r2(v.imag());
  std::ostringstream os;
  if (im == 0.0) os << re;
  else if (re == 0.0) os << im << "j";
  else os << "(" << re << (im < 0 ? "" : "+") << im << "j)";
  return os.str();
}

std::string QuantumSystem::print_wavefunction() const {
  std::string out;
  for (const auto& [key, value] : get_wavefunction()) {
    if (std::abs(value) <= cfg_.tolerance) continue;
    if (!out.empty()) out += " + ";
    out += cround(value) + "|" + key + ">";
  }
  return out;
}

std::string QuantumSystem::str() const {
  std::ostringstream os;
  os << "QuantumSystem object: \n";
  os << std::left << std::setw(14) << "Nqubits:" << n_qubits() << " \n";
  os << std::left << std::setw(14) << "Print order:" << "[";
  for (auto it = order_.rbegin(); it != order_.rend(); ++it) os << (it == order_.rbegin() ? "" : ", ") << "'" << *it << "'";
  os << "]\n";
  os << "Wavefunction: \n" << print_wavefunction();
  return os.str();
}

void observe(QuantumSystem& qsys, std::string_view memory, std::string_view observed, bool reverse) {
  const auto mem = qsys.get_position(memory);
  const auto obs = qsys.get_position(observed);
  if (mem.size() < obs.size())
    throw PreconditionError("Invalid observe. Observed system " + std::string(observed) +
                            " is larger than what memory " + std::string(memory) + " can hold.");
  qsys.backend().apply_add(obs, mem, {}, reverse);
}

} // namespace qth
