// SPDX-License-Identifier: MIT

#include "qthought/inference.hpp"
#include "qthought/log.hpp"
#include "qthought/quantum_system.hpp"
#include <chrono>
#include <iostream>
#include <string>

using namespace qth;

// A chain of observers: agent k copies the memory of agent k-1 at time k+1.
static Protocol chain(int n_agents) {
  Protocol p;
  p += ProtocolStep({{ResourceSpec::qubit(), {"s"}}}, "prepare s", 1,
                    [](QuantumSystem& q) { q.apply(gates::H(), "s"); });
  std::string prev = "s";
  Declaration observed{ResourceSpec::qubit(), {"s"}};
  for (int k = 0; k < n_agents; ++k) {
    const std::string name = "A" + std::to_string(k);
    p += ProtocolStep({{ResourceSpec::agent(1, 1), {name}}, observed}, name + " observes", k + 2,
                      [name, prev](QuantumSystem& q) { observe(q, name + "_memory", prev); });
    prev = name + "_memory";
    observed = {ResourceSpec::agent_memory(1), {name}};
  }
  return p;
}

int main(){
  log::set_level(log::Level::Quiet);
  const int n = 3;
  const Protocol p = chain(n);
  for (auto strategy : {Strategy::Direct, Strategy::Tree}) {
    auto t0 = std::chrono::steady_clock::now();
    auto table = forward_inference(p, "A0_memory", 2, "A" + std::to_string(n - 1) + "_memory", n + 1, strategy);
    auto t1 = std::chrono::steady_clock::now();
    std::chrono::duration<double> dt = t1 - t0;
    std::cout << (strategy == Strategy::Direct ? "direct" : "tree") << " (" << table.size() << " rows) "
              << "elapsed seconds: " << dt.count() << "\n";
  }
  return 0;
}
