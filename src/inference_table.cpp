// SPDX-License-Identifier: MIT

#include "qthought/inference_table.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace qth {

InferenceTable::InferenceTable(std::string input, int input_time, std::string output, int output_time, InferenceMapping tbl)
  : input_(std::move(input)), input_time_(input_time), output_(std::move(output)), output_time_(output_time), tbl_(std::move(tbl)) {
  for (auto& [key, vals] : tbl_) {
    std::sort(vals.begin(), vals.end());
    vals.erase(std::unique(vals.begin(), vals.end()), vals.end());
  }
}

const std::vector<std::size_t>& InferenceTable::operator[](std::size_t in) const {
  static const std::vector<std::size_t> none;
  auto it = tbl_.find(in);
  return it == tbl_.end() ? none : it->second;
}

std::string InferenceTable::str() const {
  std::ostringstream head;
  head << std::left << std::setw(22) << ("In:(" + input_ + ":t" + std::to_string(input_time_) + ")")
       << "|  Out: (" << output_ << ":t" << output_time_ << ")";
  std::string full = head.str();
  std::ostringstream os;
  os << full << "\n" << std::string(full.size() + 7, '-');
  for (const auto& [key, vals] : tbl_) {
    os << "\n" << std::left << std::setw(22) << ("    " + std::to_string(key)) << "|  [";
    for (std::size_t i = 0; i < vals.size(); ++i) os << (i ? ", " : "") << vals[i];
    os << "]";
  }
  return os.str();
}

} // namespace qth
