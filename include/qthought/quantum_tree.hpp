// SPDX-License-Identifier: MIT

#pragma once
#include "quantum_system.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace qth {

// Outcomes of measuring one subsystem: the populated values, the state projected
// onto each of them, and the Born probability of each.
struct BranchDecomposition {
  std::vector<std::size_t> values;
  std::vector<Wavefunction> states;
  std::vector<double> probabilities;
};

BranchDecomposition find_possible_branches(const QuantumSystem& qsys, std::string_view subsys);

// Weighted set of independent composite states ("worlds"). Probabilities sum to 1.
class QuantumTree {
  std::vector<QuantumSystem> branches_;
  std::vector<double> probabilities_;

public:
  explicit QuantumTree(QuantumSystem root);

  // Replaces every branch by one child per populated value of `subsys`, weighted by
  // parent probability times Born probability. Parents are reset.
  void branch_out(std::string_view subsys);

  // New tree rooted at a copy of branch `index`.
  QuantumTree split_branch(std::size_t index) const;

  std::size_t size() const { return branches_.size(); }
  QuantumSystem& operator[](std::size_t index) { return branches_.at(index); }
  const QuantumSystem& operator[](std::size_t index) const { return branches_.at(index); }
  const std::vector<QuantumSystem>& branches() const { return branches_; }
  const std::vector<double>& probabilities() const { return probabilities_; }
  double probability(std::size_t index) const { return probabilities_.at(index); }

  auto begin() { return branches_.begin(); }
  auto end() { return branches_.end(); }
  auto begin() const { return branches_.begin(); }
  auto end() const { return branches_.end(); }

  const std::vector<std::string>& subsystems(std::size_t index = 0) const { return branches_.at(index).subsystems(); }
  std::vector<std::size_t> get_position(std::size_t branch, std::string_view subsys) const {
    return branches_.at(branch).get_position(subsys);
  }
  std::string readout(std::size_t branch, std::string_view subsys, BitOrder order = BitOrder::Internal) const {
    return branches_.at(branch).readout(subsys, order);
  }

  std::string str() const;
};

// Runs f on every branch, then branches out along `collapse` if given.
// Returns the per-branch results (in branch order) unless f returns void.
template <class F>
auto for_each_branch(QuantumTree& tree, F&& f, const std::optional<std::string>& collapse = std::nullopt) {
  using R = std::invoke_result_t<F&, QuantumSystem&>;
  if constexpr (std::is_void_v<R>) {
    for (auto& branch : tree) f(branch);
    if (collapse) tree.branch_out(*collapse);
  } else {
    std::vector<R> outputs;
    outputs.reserve(tree.size());
    for (auto& branch : tree) outputs.push_back(f(branch));
    if (collapse) tree.branch_out(*collapse);
    return outputs;
  }
}

std::vector<std::size_t> get_possible_outcomes(const QuantumSystem& qsys, std::string_view subsys);
std::vector<std::vector<std::size_t>> get_possible_outcomes(QuantumTree& tree, std::string_view subsys,
                                                            const std::optional<std::string>& collapse = std::nullopt);

void reset(QuantumSystem& qsys);
void reset(QuantumTree& tree, const std::optional<std::string>& collapse = std::nullopt);

} // namespace qth
