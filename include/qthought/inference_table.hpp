// SPDX-License-Identifier: MIT

#pragma once
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace qth {

// input value -> compatible output values (sorted, without duplicates)
using InferenceMapping = std::map<std::size_t, std::vector<std::size_t>>;

// Relation between the values of `input` observed at `input_time` and the values
// `output` can take at `output_time`. Immutable.
class InferenceTable {
  std::string input_;
  int input_time_;
  std::string output_;
  int output_time_;
  InferenceMapping tbl_;

public:
  InferenceTable(std::string input, int input_time, std::string output, int output_time, InferenceMapping tbl);

  std::pair<std::string, int> input() const { return {input_, input_time_}; }
  std::pair<std::string, int> output() const { return {output_, output_time_}; }
  const std::string& input_name() const { return input_; }
  const std::string& output_name() const { return output_; }
  int input_time() const { return input_time_; }
  int output_time() const { return output_time_; }
  const InferenceMapping& table() const { return tbl_; }
  std::size_t size() const { return tbl_.size(); }

  // Values compatible with `in`; empty if `in` never occurs.
  const std::vector<std::size_t>& operator[](std::size_t in) const;

  std::string str() const;
  bool operator==(const InferenceTable&) const = default;
};

} // namespace qth
