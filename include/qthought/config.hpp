// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include "log.hpp"
#include <optional>
#include <string>

namespace qth {

struct Config {
  double tolerance = kTolerance;        // zero-overlap / zero-norm threshold
  uint64_t seed = 12345;                // measurement RNG of each composite state
  bool silent = true;                   // per-step protocol tracing off
  std::size_t no_prediction_state = 0;  // agents' "I do not know" value
  log::Level verbosity = log::Level::Warn;
};

// key=value lines; '#' starts a comment line. Unknown keys and bad values are errors.
//   tolerance=1e-7
//   seed=42
//   silent=false
//   no_prediction_state=0
//   verbosity=quiet|warn|info
std::optional<Config> parse_config(const std::string& text, std::string& err);
std::optional<Config> load_config(const std::string& path, std::string& err);

} // namespace qth
