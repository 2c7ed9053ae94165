// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <compare>

namespace qth {

enum class ResourceKind { Qubit, Register, AgentMemory, Agent };

// A resource shape: Qubit, Register(width), AgentMemory(width) or Agent(width, pred_width).
struct ResourceSpec {
  ResourceKind kind = ResourceKind::Qubit;
  std::size_t width = 1;       // register / memory width
  std::size_t pred_width = 0;  // agents only

  static ResourceSpec qubit() { return {ResourceKind::Qubit, 1, 0}; }
  static ResourceSpec reg(std::size_t n) { return {ResourceKind::Register, n, 0}; }
  static ResourceSpec agent_memory(std::size_t n) { return {ResourceKind::AgentMemory, n, 0}; }
  static ResourceSpec agent(std::size_t n_memory, std::size_t n_pred) { return {ResourceKind::Agent, n_memory, n_pred}; }

  // Parses "Qubit", "Qureg(n)", "AgentMemory(n)" or "Agent(n,m)". Throws ConfigError.
  static ResourceSpec parse(std::string_view key);

  // Throws ConfigError on a non-positive width, a width above kMaxQubits or an agent
  // predicting more than it remembers.
  void validate() const;

  std::string str() const;
  bool operator==(const ResourceSpec&) const = default;
};

struct Declaration {
  ResourceSpec spec;
  std::vector<std::string> names;
};

// The resources touched by one protocol step.
using Domain = std::vector<Declaration>;

// Union of declared resources. Declarations with the same spec are merged; iteration
// order is first-declaration order and fixes the qubit allocation order.
class Requirements {
  std::vector<Declaration> decls_;

public:
  Requirements() = default;
  Requirements(const Domain& domain) { add(domain); }

  // Validates every declaration first, then merges; nothing is applied on error.
  void add(const Domain& domain);
  void add(const Declaration& decl) { add(Domain{decl}); }
  Requirements& operator+=(const Domain& domain) { add(domain); return *this; }

  // Drops bare AgentMemory names that are also declared as full Agents.
  // Only a single memory width per folded name is supported.
  void consolidate();
  const std::vector<Declaration>& get() { consolidate(); return decls_; }
  const std::vector<Declaration>& declarations() const { return decls_; }

  bool empty() const { return decls_.empty(); }
  std::string str() const;
};

} // namespace qth
