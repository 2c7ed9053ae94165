// SPDX-License-Identifier: MIT

#include "qthought/protocol.hpp"
#include "qthought/errors.hpp"
#include "qthought/log.hpp"
#include "qthought/quantum_system.hpp"
#include "qthought/quantum_tree.hpp"
#include <algorithm>
#include <sstream>

namespace qth {

ProtocolStep::ProtocolStep(Domain domain, std::string descr, int time, Action action,
                           std::optional<std::string> branch_on)
  : domain_(std::move(domain)), descr_(std::move(descr)), time_(time), action_(std::move(action)),
    branch_on_(std::move(branch_on)) {
  for (const auto& d : domain_) {
    d.spec.validate();
    if (d.names.empty()) throw ConfigError("Step '" + descr_ + "' declares " + d.spec.str() + " without names");
  }
  if (!action_) throw ConfigError("Step '" + descr_ + "' has no action");
}

std::string ProtocolStep::str() const {
  std::ostringstream os;
  os << "ProtocolStep: " << descr_ << " (t=" << time_ << ")";
  if (branch_on_) os << " [branch on " << *branch_on_ << "]";
  os << "\n  Domain: ";
  for (std::size_t i = 0; i < domain_.size(); ++i) {
    os << (i ? ", " : "") << domain_[i].spec.str() << ": [";
    for (std::size_t k = 0; k < domain_[i].names.size(); ++k) os << (k ? ", " : "") << domain_[i].names[k];
    os << "]";
  }
  return os.str();
}

Protocol operator+(const ProtocolStep& a, const ProtocolStep& b) {
  Protocol p;
  p += a;
  p += b;
  return p;
}

std::size_t Protocol::add_step(ProtocolStep step) {
  requires_.add(step.domain());
  const int t = step.time();
  auto pos = std::upper_bound(steps_.begin(), steps_.end(), t,
                              [](int time, const Entry& e) { return time < e.step.time(); });
  const std::size_t id = next_id_++;
  steps_.insert(pos, Entry{id, std::move(step)});
  return id;
}

Protocol& Protocol::operator+=(const Protocol& other) {
  // other.steps_ is already time ordered, so insertion order among equal times is preserved.
  // Copied first: `other` may be this protocol.
  const std::vector<Entry> appended = other.steps_;
  for (const auto& e : appended) add_step(e.step);
  return *this;
}

Requirements Protocol::requirements() const {
  Requirements r = requires_;
  r.consolidate();
  return r;
}

static void trace(const QuantumSystem& qsys, std::size_t id, const ProtocolStep& step) {
  if (qsys.config().silent) return;
  log::info("Step " + std::to_string(id) + " at t=" + std::to_string(step.time()) + ": " + step.descr());
}

void Protocol::run(QuantumSystem& qsys, int t_start, int t_end) const {
  for (const auto& e : steps_) {
    if (e.step.time() < t_start || e.step.time() > t_end) continue;
    trace(qsys, e.id, e.step);
    e.step.action()(qsys);
    if (!qsys.config().silent) log::info("  " + qsys.print_wavefunction());
  }
}

void Protocol::run_manual(QuantumTree& tree, int t_start, int t_end) const {
  for (const auto& e : steps_) {
    if (e.step.time() < t_start || e.step.time() > t_end) continue;
    if (tree.size() > 0) trace(tree[0], e.id, e.step);
    for_each_branch(tree, e.step.action(), e.step.branch_on());
  }
}

std::vector<int> Protocol::get_times() const {
  std::vector<int> times;
  times.reserve(steps_.size());
  for (const auto& e : steps_) times.push_back(e.step.time());
  return times;
}

bool Protocol::has_time(int t) const {
  return std::any_of(steps_.begin(), steps_.end(), [t](const Entry& e) { return e.step.time() == t; });
}

std::string Protocol::str() const {
  std::ostringstream os;
  os << "Protocol with " << steps_.size() << " steps\n";
  for (const auto& e : steps_) os << "[" << e.id << "] " << e.step.str() << "\n";
  os << requirements().str();
  return os.str();
}

} // namespace qth
