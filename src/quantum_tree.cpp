// SPDX-License-Identifier: MIT

#include "qthought/quantum_tree.hpp"
#include "qthought/log.hpp"
#include <sstream>

namespace qth {

BranchDecomposition find_possible_branches(const QuantumSystem& qsys, std::string_view subsys) {
  BranchDecomposition out;
  const auto wf = qsys.get_wavefunction();
  const double tol = qsys.config().tolerance;
  for (std::size_t n = 0; n < (std::size_t(1) << qsys.width(subsys)); ++n) {
    const auto branch_n = qsys.subspace_of_state_n(subsys, n);
    if (!overlaps_with_subspace(wf, branch_n, tol)) continue;
    auto state = project_wavefunction(wf, branch_n, tol);
    if (!state) continue;
    out.values.push_back(n);
    out.states.push_back(std::move(*state));
    out.probabilities.push_back(probability_in_subspace(wf, branch_n));
  }
  return out;
}

QuantumTree::QuantumTree(QuantumSystem root) {
  branches_.push_back(std::move(root));
  probabilities_.push_back(1.0);
}

void QuantumTree::branch_out(std::string_view subsys) {
  std::vector<QuantumSystem> new_branches;
  std::vector<double> new_probabilities;
  for (std::size_t b = 0; b < branches_.size(); ++b) {
    auto& branch = branches_[b];
    const auto split = find_possible_branches(branch, subsys);
    for (std::size_t k = 0; k < split.values.size(); ++k) {
      QuantumSystem child = branch;
      child.set_wavefunction(split.states[k]);
      new_branches.push_back(std::move(child));
      new_probabilities.push_back(probabilities_[b] * split.probabilities[k]);
    }
    branch.reset();
  }
  if (!branches_.empty() && !branches_.front().config().silent)
    log::info("Branching along subsystem " + std::string(subsys) + ": " + std::to_string(new_branches.size()) + " branches");
  branches_ = std::move(new_branches);
  probabilities_ = std::move(new_probabilities);
}

QuantumTree QuantumTree::split_branch(std::size_t index) const {
  return QuantumTree(branches_.at(index));
}

std::string QuantumTree::str() const {
  std::ostringstream os;
  for (std::size_t i = 0; i < branches_.size(); ++i) {
    if (i == 0) {
      os << "Print order:   [";
      const auto& order = branches_[i].subsystems();
      for (auto it = order.rbegin(); it != order.rend(); ++it) os << (it == order.rbegin() ? "" : ", ") << "'" << *it << "'";
      os << "]\n";
    }
    os << "---- Branch " << i << " (p=" << probabilities_[i] << ") ----\n";
    os << branches_[i].print_wavefunction() << "\n";
  }
  return os.str();
}

std::vector<std::size_t> get_possible_outcomes(const QuantumSystem& qsys, std::string_view subsys) {
  return qsys.possible_values(subsys);
}

std::vector<std::vector<std::size_t>> get_possible_outcomes(QuantumTree& tree, std::string_view subsys,
                                                            const std::optional<std::string>& collapse) {
  return for_each_branch(tree, [&](QuantumSystem& branch) { return get_possible_outcomes(branch, subsys); }, collapse);
}

void reset(QuantumSystem& qsys) { qsys.reset(); }

void reset(QuantumTree& tree, const std::optional<std::string>& collapse) {
  for_each_branch(tree, [](QuantumSystem& branch) { branch.reset(); }, collapse);
}

} // namespace qth
