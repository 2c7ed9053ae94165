// SPDX-License-Identifier: MIT

#pragma once
#include "requirements.hpp"
#include "types.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace qth {

class QuantumSystem;
class QuantumTree;
class Protocol;

using Action = std::function<void(QuantumSystem&)>;

// One timed operation of a thought experiment together with the resources it touches.
// `branch_on` names the subsystem a tree run splits along once the step has been applied.
class ProtocolStep {
  Domain domain_;
  std::string descr_;
  int time_;
  Action action_;
  std::optional<std::string> branch_on_;

public:
  // Throws ConfigError on an invalid domain or an empty action.
  ProtocolStep(Domain domain, std::string descr, int time, Action action,
               std::optional<std::string> branch_on = std::nullopt);

  const Domain& domain() const { return domain_; }
  const std::string& descr() const { return descr_; }
  int time() const { return time_; }
  const Action& action() const { return action_; }
  const std::optional<std::string>& branch_on() const { return branch_on_; }

  std::string str() const;
};

Protocol operator+(const ProtocolStep& a, const ProtocolStep& b);

// Steps ordered by time; steps sharing a time keep their insertion order.
class Protocol {
  struct Entry {
    std::size_t id;
    ProtocolStep step;
  };
  std::vector<Entry> steps_;
  Requirements requires_;
  std::size_t next_id_ = 0;

public:
  Protocol() = default;

  // Returns the sequential id of the step.
  std::size_t add_step(ProtocolStep step);
  Protocol& operator+=(ProtocolStep step) { add_step(std::move(step)); return *this; }
  Protocol& operator+=(const Protocol& other);

  std::size_t size() const { return steps_.size(); }
  bool empty() const { return steps_.empty(); }
  const ProtocolStep& step(std::size_t index) const { return steps_.at(index).step; }

  // Consolidated union of all step domains.
  Requirements requirements() const;

  // Applies every step with t_start <= time <= t_end in order.
  void run(QuantumSystem& qsys, int t_start = kTimeMin, int t_end = kTimeMax) const;
  // Same on every branch; steps with branch_on split the tree afterwards.
  void run_manual(QuantumTree& tree, int t_start = kTimeMin, int t_end = kTimeMax) const;

  // Time of every step, ascending (repeated for steps sharing a time).
  std::vector<int> get_times() const;
  bool has_time(int t) const;

  std::string str() const;
};

} // namespace qth
