// SPDX-License-Identifier: MIT

#include "qthought/config.hpp"
#include "qthought/errors.hpp"
#include "qthought/inference.hpp"
#include "qthought/log.hpp"
#include "qthought/quantum_system.hpp"
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

using namespace qth;

#ifndef QTH_VERSION
#define QTH_VERSION "0.0.0"
#endif

static void usage() {
  std::cout << "qthought [--version|--build-info] demo [--config file.cfg] [--strategy direct|tree] [--seed S] [--verbose]\n";
}

// s is put in superposition, then Alice and Bob observe it one after the other.
static Protocol simple_protocol() {
  Protocol p;
  p += ProtocolStep({{ResourceSpec::qubit(), {"s"}}}, "Prepare s", 1,
                    [](QuantumSystem& q) { q.apply(gates::H(), "s"); });
  p += ProtocolStep({{ResourceSpec::agent(1, 1), {"Alice"}}, {ResourceSpec::qubit(), {"s"}}}, "Alice observes s", 2,
                    [](QuantumSystem& q) { observe(q, "Alice_memory", "s"); });
  p += ProtocolStep({{ResourceSpec::agent(1, 1), {"Bob"}}, {ResourceSpec::qubit(), {"s"}}}, "Bob observes s", 3,
                    [](QuantumSystem& q) { observe(q, "Bob_memory", "s"); });
  return p;
}

static int run_demo(const Config& cfg, Strategy strategy) {
  const Protocol p = simple_protocol();
  std::cout << p.str() << "\n";

  QuantumSystem q(p.requirements(), cfg);
  p.run(q);
  std::cout << q.str() << "\n\n";

  auto ab = forward_inference(p, "Alice_memory", 2, "Bob_memory", 3, strategy, cfg);
  std::cout << "Forward: what does Alice at t=2 know about Bob at t=3?\n" << ab.str() << "\n\n";
  auto ba = backward_inference(ab);
  std::cout << "Backward:\n" << ba.str() << "\n\n";
  auto aa = consistency(ab, ba);
  std::cout << "Alice about herself through Bob:\n" << aa.str() << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 2) { usage(); return 1; }
  std::string first = argv[1];
  if (first == "--version") { std::cout << QTH_VERSION << "\n"; return 0; }
  if (first == "--build-info") {
    std::cout << "version=" << QTH_VERSION << "\n";
#ifdef QTH_OPENMP
    std::cout << "openmp=on\n";
#else
    std::cout << "openmp=off\n";
#endif
    std::cout << "max_qubits=" << kMaxQubits << "\n";
    return 0;
  }
  if (first != "demo") { usage(); return 1; }

  std::string config_path, strategy_name = "direct";
  std::optional<uint64_t> seed;
  bool verbose = false;
  for (int i = 2; i < argc; i++) {
    std::string a = argv[i];
    auto nx = [&](const char* n) -> std::optional<std::string> {
      if (i + 1 >= argc) { std::cerr << "Missing value for " << n << "\n"; return std::nullopt; }
      return std::string(argv[++i]);
    };
    if (a == "--config") { auto v = nx("--config"); if (!v) return 2; config_path = *v; }
    else if (a == "--strategy") { auto v = nx("--strategy"); if (!v) return 2; strategy_name = *v; }
    else if (a == "--seed") {
      auto v = nx("--seed"); if (!v) return 2;
      try { seed = std::stoull(*v); } catch (const std::exception&) { std::cerr << "Invalid seed: " << *v << "\n"; return 2; }
    }
    else if (a == "--verbose") verbose = true;
    else if (a == "--help" || a == "-h") { usage(); return 0; }
    else { std::cerr << "Unknown arg: " << a << "\n"; return 2; }
  }

  Config cfg;
  if (!config_path.empty()) {
    std::string err;
    auto loaded = load_config(config_path, err);
    if (!loaded) { std::cerr << err << "\n"; return 11; }
    cfg = *loaded;
  }
  if (seed) cfg.seed = *seed;
  if (verbose) { cfg.silent = false; cfg.verbosity = log::Level::Info; }
  log::set_level(cfg.verbosity);

  Strategy strategy;
  if (strategy_name == "direct") strategy = Strategy::Direct;
  else if (strategy_name == "tree") strategy = Strategy::Tree;
  else { std::cerr << "--strategy must be direct or tree\n"; return 2; }

  try {
    return run_demo(cfg, strategy);
  } catch (const ConfigError& e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    return 3;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 10;
  }
}
