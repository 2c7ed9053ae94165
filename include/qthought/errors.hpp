// SPDX-License-Identifier: MIT

#pragma once
#include <stdexcept>
#include <string>

namespace qth {

// Invalid declarations, widths or tables. Raised before anything is applied.
struct ConfigError : std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

// Logic errors in a protocol or query (non-definite readout, missing time, bad boundary...).
struct PreconditionError : std::logic_error {
  using std::logic_error::logic_error;
};

class UnknownSubsystem : public PreconditionError {
  std::string name_;
public:
  explicit UnknownSubsystem(const std::string& name)
    : PreconditionError("Your quantum system has no subsystem '" + name + "'"), name_(name) {}
  const std::string& name() const { return name_; }
};

} // namespace qth
