// SPDX-License-Identifier: MIT

#pragma once
#include "config.hpp"
#include "inference_table.hpp"
#include "protocol.hpp"
#include <string>

namespace qth {

enum class Strategy {
  Direct,  // one fresh composite state per value of the input subsystem
  Tree     // a single tree branched on the input subsystem
};

// For every value x of `x` that can occur at t_x, the values `y` can take at t_y.
// t_x and t_y must be step times of the protocol (PreconditionError otherwise).
InferenceTable forward_inference(const Protocol& protocol, const std::string& x, int t_x,
                                 const std::string& y, int t_y, Strategy strategy = Strategy::Direct,
                                 const Config& cfg = {});

// Inverts a table: for each value y, all x that can lead to it.
InferenceTable backward_inference(const InferenceTable& table);

InferenceTable backward_inference(const Protocol& protocol, const std::string& x, int t_x,
                                  const std::string& y, int t_y, Strategy strategy = Strategy::Direct,
                                  const Config& cfg = {});

// Composes two tables whose boundary subsystem and time match.
// Throws PreconditionError on a mismatching boundary or a value missing from `post`.
InferenceTable consistency(const InferenceTable& pre, const InferenceTable& post);

} // namespace qth
