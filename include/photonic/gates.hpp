// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include "error.hpp"
#include <cmath>
#include <string>
#include <type_traits>
#include <variant>

namespace psx {

// Variable beamsplitter. R is the reflectivity (probability of leaving through
// the other mode), phi the relative phase.
struct Beamsplitter {
  double R = 0.5;
  double phi = 0.0;
  bool operator==(const Beamsplitter&) const = default;
};

// Single-mode phase shifter, multiplies the mode amplitude by e^{i phi}.
struct PhaseShifter {
  double phi = 0.0;
  bool operator==(const PhaseShifter&) const = default;
};

using Gate = std::variant<Beamsplitter, PhaseShifter>;

} // namespace psx

namespace psx::gates {
  inline c64 phase(double phi) { return { std::cos(phi), std::sin(phi) }; }

  inline void check_beamsplitter(double R, double phi) {
    if (!std::isfinite(R) || R < 0.0 || R > 1.0)
      throw Error(ErrorCode::InvalidParameter, "beamsplitter reflectivity " + std::to_string(R) + " outside [0,1]");
    if (!std::isfinite(phi))
      throw Error(ErrorCode::InvalidParameter, "beamsplitter phase is not finite");
  }

  // [[t, r e^{i phi}], [r e^{i phi}, -t e^{2 i phi}]] with t = sqrt(1-R), r = sqrt(R).
  // R=1/2, phi=0 is the Hadamard matrix; R=1/2, phi=pi/2 the symmetric splitter.
  inline void BS_coeffs(double R, double phi, c64& u00, c64& u01, c64& u10, c64& u11) {
    check_beamsplitter(R, phi);
    double t = std::sqrt(1.0 - R);
    double r = std::sqrt(R);
    c64 e1 = phase(phi);
    c64 e2 = phase(2.0*phi);
    u00 = {t, 0.0};
    u01 = r * e1;
    u10 = r * e1;
    u11 = -t * e2;
  }

  inline void PS_coeffs(double phi, c64& u00) {
    if (!std::isfinite(phi))
      throw Error(ErrorCode::InvalidParameter, "phase shifter phase is not finite");
    u00 = phase(phi);
  }
}

namespace psx {

inline std::size_t arity(const Gate& g) {
  return std::holds_alternative<Beamsplitter>(g) ? 2 : 1;
}

inline const char* gate_name(const Gate& g) {
  return std::holds_alternative<Beamsplitter>(g) ? "BS" : "PS";
}

// Small unitary of the gate, row-major, arity x arity.
inline vec_c64 gate_matrix(const Gate& g) {
  return std::visit([](const auto& gate) -> vec_c64 {
    using T = std::decay_t<decltype(gate)>;
    if constexpr (std::is_same_v<T, Beamsplitter>) {
      c64 u00,u01,u10,u11;
      gates::BS_coeffs(gate.R, gate.phi, u00,u01,u10,u11);
      return {u00,u01,u10,u11};
    } else {
      c64 u00;
      gates::PS_coeffs(gate.phi, u00);
      return {u00};
    }
  }, g);
}

} // namespace psx
