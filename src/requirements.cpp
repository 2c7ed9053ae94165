// SPDX-License-Identifier: MIT

#include "qthought/requirements.hpp"
#include "qthought/errors.hpp"
#include <algorithm>
#include <sstream>
#include <iomanip>
#include <charconv>

namespace qth {

static std::size_t parse_width(std::string_view s, std::string_view key) {
  std::size_t v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || ptr != s.data() + s.size())
    throw ConfigError("Invalid size '" + std::string(s) + "' in " + std::string(key));
  return v;
}

ResourceSpec ResourceSpec::parse(std::string_view key) {
  const auto open = key.find('(');
  const std::string_view prefix = key.substr(0, open);
  std::string_view args;
  if (open != std::string_view::npos) {
    if (key.back() != ')') throw ConfigError("Unbalanced parentheses in " + std::string(key));
    args = key.substr(open + 1, key.size() - open - 2);
  }
  ResourceSpec spec;
  if (prefix == "Qubit") {
    if (open != std::string_view::npos) throw ConfigError("Qubit takes no size: " + std::string(key));
    spec = qubit();
  } else if (prefix == "Qureg" || prefix == "Register") {
    spec = reg(parse_width(args, key));
  } else if (prefix == "AgentMemory") {
    spec = agent_memory(parse_width(args, key));
  } else if (prefix == "Agent") {
    const auto comma = args.find(',');
    if (comma == std::string_view::npos) throw ConfigError("Agent requires two sizes: " + std::string(key));
    auto trim = [](std::string_view s) {
      while (!s.empty() && s.front() == ' ') s.remove_prefix(1);
      while (!s.empty() && s.back() == ' ') s.remove_suffix(1);
      return s;
    };
    spec = agent(parse_width(trim(args.substr(0, comma)), key), parse_width(trim(args.substr(comma + 1)), key));
  } else {
    throw ConfigError("Allowed Keys: Qubit, Qureg(n), AgentMemory(n), Agent(n,m) not " + std::string(key));
  }
  spec.validate();
  return spec;
}

void ResourceSpec::validate() const {
  if (width > kMaxQubits || pred_width > kMaxQubits)
    throw ConfigError("Invalid size for " + str() + ": at most " + std::to_string(kMaxQubits) + " qubits are supported");
  switch (kind) {
    case ResourceKind::Qubit:
      if (width != 1) throw ConfigError("A Qubit has width 1, not " + std::to_string(width));
      break;
    case ResourceKind::Register:
    case ResourceKind::AgentMemory:
      if (width == 0) throw ConfigError("Invalid size 0 for " + str());
      break;
    case ResourceKind::Agent:
      if (width == 0 || pred_width == 0) throw ConfigError("Invalid size 0 for " + str());
      if (pred_width > width)
        throw ConfigError("Cannot make more different predictions than observed memory states: " + str());
      break;
  }
}

std::string ResourceSpec::str() const {
  switch (kind) {
    case ResourceKind::Qubit: return "Qubit";
    case ResourceKind::Register: return "Qureg(" + std::to_string(width) + ")";
    case ResourceKind::AgentMemory: return "AgentMemory(" + std::to_string(width) + ")";
    case ResourceKind::Agent: return "Agent(" + std::to_string(width) + "," + std::to_string(pred_width) + ")";
  }
  return "?";
}

void Requirements::add(const Domain& domain) {
  for (const auto& d : domain) {
    d.spec.validate();
    for (const auto& name : d.names)
      if (name.empty()) throw ConfigError("Empty resource name in " + d.spec.str());
  }
  for (const auto& d : domain) {
    auto it = std::find_if(decls_.begin(), decls_.end(), [&](const Declaration& e){ return e.spec == d.spec; });
    if (it == decls_.end()) {
      decls_.push_back({d.spec, {}});
      it = std::prev(decls_.end());
    }
    for (const auto& name : d.names) {
      if (std::find(it->names.begin(), it->names.end(), name) == it->names.end()) it->names.push_back(name);
    }
  }
}

void Requirements::consolidate() {
  for (auto& mem : decls_) {
    if (mem.spec.kind != ResourceKind::AgentMemory) continue;
    std::vector<std::string> kept;
    for (const auto& name : mem.names) {
      const Declaration* owner = nullptr;
      for (const auto& a : decls_) {
        if (a.spec.kind == ResourceKind::Agent &&
            std::find(a.names.begin(), a.names.end(), name) != a.names.end()) { owner = &a; break; }
      }
      if (!owner) { kept.push_back(name); continue; }
      if (owner->spec.width != mem.spec.width)
        throw ConfigError("AgentMemory(" + std::to_string(mem.spec.width) + ") of '" + name +
                          "' does not match its " + owner->spec.str());
    }
    mem.names = std::move(kept);
  }
  decls_.erase(std::remove_if(decls_.begin(), decls_.end(),
                              [](const Declaration& d){ return d.names.empty(); }),
               decls_.end());
}

std::string Requirements::str() const {
  Requirements copy = *this;
  copy.consolidate();
  std::ostringstream os;
  os << "Requirements: \n" << std::string(30, '-') << "\n";
  for (const auto& d : copy.decls_) {
    os << std::left << std::setw(18) << d.spec.str() << "[";
    for (std::size_t i = 0; i < d.names.size(); ++i) os << (i ? ", " : "") << "'" << d.names[i] << "'";
    os << "]\n";
  }
  return os.str();
}

} // namespace qth
