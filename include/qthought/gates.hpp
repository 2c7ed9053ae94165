// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include <cmath>
#include <numbers>

namespace qth {

// Row-major 2x2 unitary acting on one qubit.
struct Gate1q {
  c64 u00, u01, u10, u11;

  Gate1q adjoint() const {
    return {std::conj(u00), std::conj(u10), std::conj(u01), std::conj(u11)};
  }
};

} // namespace qth

namespace qth::gates {
  inline Gate1q X() { return {{0,0}, {1,0}, {1,0}, {0,0}}; }
  inline Gate1q H() {
    double s = 1.0/std::sqrt(2.0);
    return {{s,0}, {s,0}, {s,0}, {-s,0}};
  }
  inline Gate1q Y() {
    // [[0, -i],[i,0]]
    return {{0,0}, {0,-1}, {0,1}, {0,0}};
  }
  inline Gate1q Z() { return {{1,0}, {0,0}, {0,0}, {-1,0}}; }
  inline Gate1q S() { return {{1,0}, {0,0}, {0,0}, {0,1}}; } // diag(1, i)
  inline Gate1q RX(double theta) {
    double c = std::cos(theta/2.0);
    double s = std::sin(theta/2.0);
    return {{c,0}, {0,-s}, {0,-s}, {c,0}};
  }
  inline Gate1q RY(double theta) {
    double c = std::cos(theta/2.0);
    double s = std::sin(theta/2.0);
    return {{c,0}, {-s,0}, {s,0}, {c,0}};
  }
  inline Gate1q RZ(double theta) {
    // diag(e^{-iθ/2}, e^{iθ/2})
    double half = theta/2.0;
    return {{std::cos(-half), std::sin(-half)}, {0,0}, {0,0}, {std::cos(half), std::sin(half)}};
  }
  // Real rotation taking |0> to sqrt(p0)|0> + sqrt(1-p0)|1>.
  inline Gate1q prepare(double p0) {
    double a = std::sqrt(p0), b = std::sqrt(1.0 - p0);
    return {{a,0}, {-b,0}, {b,0}, {a,0}};
  }
}
