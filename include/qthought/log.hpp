// SPDX-License-Identifier: MIT

#pragma once
#include <iostream>
#include <string>

namespace qth::log {

enum class Level { Quiet, Warn, Info };

inline Level& level() {
  static Level lvl = Level::Warn;
  return lvl;
}

inline void set_level(Level l) { level() = l; }

inline void warn(const std::string& msg) {
  if (level() >= Level::Warn) std::cerr << "qthought: warning: " << msg << "\n";
}

inline void info(const std::string& msg) {
  if (level() >= Level::Info) std::cout << msg << "\n";
}

} // namespace qth::log
