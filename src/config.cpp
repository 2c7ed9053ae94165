// SPDX-License-Identifier: MIT

#include "qthought/config.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>

namespace qth {

static std::string trim(const std::string& s){
  auto l = std::find_if(s.begin(), s.end(), [](unsigned char c){return !std::isspace(c);} );
  auto r = std::find_if(s.rbegin(), s.rend(), [](unsigned char c){return !std::isspace(c);} ).base();
  if (l>=r) return "";
  return std::string(l,r);
}

static bool parse_u64(const std::string& s, uint64_t& out) {
  if (s.empty() || s[0] == '-') return false;
  try {
    std::size_t pos=0;
    unsigned long long v = std::stoull(s, &pos, 10);
    if (pos != s.size()) return false;
    out = static_cast<uint64_t>(v);
    return true;
  } catch (const std::exception&) { return false; }
}

static bool parse_double(const std::string& s, double& out) {
  try {
    std::size_t pos=0;
    out = std::stod(s, &pos);
    return pos == s.size();
  } catch (const std::exception&) { return false; }
}

static bool parse_bool(const std::string& s, bool& out) {
  if (s == "true" || s == "1" || s == "yes" || s == "on") { out = true; return true; }
  if (s == "false" || s == "0" || s == "no" || s == "off") { out = false; return true; }
  return false;
}

std::optional<Config> parse_config(const std::string& text, std::string& err) {
  Config cfg;
  std::istringstream in(text);
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    line = trim(line);
    if (line.empty() || line[0] == '#') continue;
    auto p = line.find('=');
    if (p == std::string::npos) { err = "Expected key=value at line " + std::to_string(lineno); return std::nullopt; }
    const std::string key = trim(line.substr(0, p));
    const std::string val = trim(line.substr(p + 1));
    bool ok = true;
    if (key == "tolerance") {
      ok = parse_double(val, cfg.tolerance) && cfg.tolerance > 0.0;
    } else if (key == "seed") {
      ok = parse_u64(val, cfg.seed);
    } else if (key == "silent") {
      ok = parse_bool(val, cfg.silent);
    } else if (key == "no_prediction_state") {
      uint64_t v = 0;
      ok = parse_u64(val, v);
      cfg.no_prediction_state = static_cast<std::size_t>(v);
    } else if (key == "verbosity") {
      if (val == "quiet") cfg.verbosity = log::Level::Quiet;
      else if (val == "warn") cfg.verbosity = log::Level::Warn;
      else if (val == "info") cfg.verbosity = log::Level::Info;
      else ok = false;
    } else {
      err = "Unknown key '" + key + "' at line " + std::to_string(lineno);
      return std::nullopt;
    }
    if (!ok) { err = "Invalid value '" + val + "' for " + key + " at line " + std::to_string(lineno); return std::nullopt; }
  }
  return cfg;
}

std::optional<Config> load_config(const std::string& path, std::string& err) {
  std::ifstream in(path);
  if (!in) { err = "Cannot open config file: " + path; return std::nullopt; }
  std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return parse_config(text, err);
}

} // namespace qth
