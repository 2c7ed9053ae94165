// SPDX-License-Identifier: MIT

#include "qthought/inference.hpp"
#include "qthought/errors.hpp"
#include "qthought/log.hpp"
#include "qthought/quantum_system.hpp"
#include "qthought/quantum_tree.hpp"
#include <map>
#include <set>

namespace qth {

static void require_time(const Protocol& protocol, int t) {
  if (!protocol.has_time(t))
    throw PreconditionError("Time " + std::to_string(t) + " is not a step time of the protocol");
}

static InferenceMapping forward_direct(const Protocol& protocol, const std::string& x, int t_x,
                                       const std::string& y, int t_y, const Config& cfg) {
  InferenceMapping tbl;
  const Requirements reqs = protocol.requirements();
  QuantumSystem probe(reqs, cfg);
  const std::size_t n_x = std::size_t(1) << probe.width(x);
  if (!probe.has(y)) throw UnknownSubsystem(y);

  for (std::size_t i = 0; i < n_x; ++i) {
    QuantumSystem qsys(reqs, cfg);
    protocol.run(qsys, kTimeMin, t_x);
    const auto branch_i = qsys.subspace_of_state_n(x, i);
    if (!overlaps_with_subspace(qsys.get_wavefunction(), branch_i, cfg.tolerance)) continue;
    if (!qsys.project_to_subspace(branch_i)) continue;
    if (t_x < kTimeMax) protocol.run(qsys, t_x + 1, t_y);
    tbl[i] = qsys.possible_values(y);
    qsys.reset();
  }
  return tbl;
}

static InferenceMapping forward_tree(const Protocol& protocol, const std::string& x, int t_x,
                                     const std::string& y, int t_y, const Config& cfg) {
  std::map<std::size_t, std::set<std::size_t>> acc;
  QuantumTree tree(QuantumSystem(protocol.requirements(), cfg));
  protocol.run_manual(tree, kTimeMin, t_x);
  tree.branch_out(x);

  for (std::size_t b = 0; b < tree.size(); ++b) {
    const std::size_t value = tree[b].readout_value(x);
    QuantumTree sub = tree.split_branch(b);
    if (t_x < kTimeMax) protocol.run_manual(sub, t_x + 1, t_y);
    for (const auto& outcomes : get_possible_outcomes(sub, y))
      acc[value].insert(outcomes.begin(), outcomes.end());
    reset(sub);
  }
  reset(tree);

  InferenceMapping tbl;
  for (const auto& [value, outs] : acc) tbl[value] = std::vector<std::size_t>(outs.begin(), outs.end());
  return tbl;
}

InferenceTable forward_inference(const Protocol& protocol, const std::string& x, int t_x,
                                 const std::string& y, int t_y, Strategy strategy, const Config& cfg) {
  require_time(protocol, t_x);
  require_time(protocol, t_y);
  if (!cfg.silent) log::info("Forward inference " + x + "@" + std::to_string(t_x) + " -> " + y + "@" + std::to_string(t_y));
  auto tbl = strategy == Strategy::Tree ? forward_tree(protocol, x, t_x, y, t_y, cfg)
                                        : forward_direct(protocol, x, t_x, y, t_y, cfg);
  return InferenceTable(x, t_x, y, t_y, std::move(tbl));
}

InferenceTable backward_inference(const InferenceTable& table) {
  InferenceMapping inv;
  for (const auto& [in, outs] : table.table())
    for (auto out : outs) inv[out].push_back(in);
  return InferenceTable(table.output_name(), table.output_time(), table.input_name(), table.input_time(), std::move(inv));
}

InferenceTable backward_inference(const Protocol& protocol, const std::string& x, int t_x,
                                  const std::string& y, int t_y, Strategy strategy, const Config& cfg) {
  return backward_inference(forward_inference(protocol, x, t_x, y, t_y, strategy, cfg));
}

InferenceTable consistency(const InferenceTable& pre, const InferenceTable& post) {
  if (pre.output() != post.input())
    throw PreconditionError("Cannot compose tables: " + pre.output_name() + "@" + std::to_string(pre.output_time()) +
                            " does not match " + post.input_name() + "@" + std::to_string(post.input_time()));
  InferenceMapping tbl;
  for (const auto& [in, mids] : pre.table()) {
    std::set<std::size_t> outs;
    for (auto mid : mids) {
      auto it = post.table().find(mid);
      if (it == post.table().end())
        throw PreconditionError("Value " + std::to_string(mid) + " of " + post.input_name() +
                                " has no entry in the second table");
      outs.insert(it->second.begin(), it->second.end());
    }
    tbl[in] = std::vector<std::size_t>(outs.begin(), outs.end());
  }
  return InferenceTable(pre.input_name(), pre.input_time(), post.output_name(), post.output_time(), std::move(tbl));
}

} // namespace qth
