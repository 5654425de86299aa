// SPDX-License-Identifier: MIT

#pragma once
#include "distribution.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace psx {

using Bits = std::vector<int>;

// Path encoding: qubit q is one photon in qubits[q].first (|0>) or
// qubits[q].second (|1>). Auxiliary modes carry no photon in a logical state.
class PathEncoding {
  std::size_t modes_;
  std::vector<std::pair<std::size_t, std::size_t>> qubits_;
  std::vector<std::size_t> aux_;

public:
  // Throws InvalidModeAssignment if a mode is outside [0, modes) or used twice.
  PathEncoding(std::size_t modes,
               std::vector<std::pair<std::size_t, std::size_t>> qubits,
               std::vector<std::size_t> aux = {});

  std::size_t modes() const { return modes_; }
  std::size_t num_qubits() const { return qubits_.size(); }
  const std::vector<std::pair<std::size_t, std::size_t>>& qubits() const { return qubits_; }
  const std::vector<std::size_t>& aux() const { return aux_; }

  // Throws InvalidParameter if bits has the wrong length or a value other than 0/1.
  FockState encode(const Bits& bits) const;

  // Empty when an auxiliary or unassigned mode is occupied, a qubit pair does
  // not hold exactly one photon, or the state has the wrong length.
  std::optional<Bits> decode(const FockState& s, std::string& err) const;
  std::optional<Bits> decode(const FockState& s) const { std::string err; return decode(s, err); }

  // All 2^q logical tuples, first qubit most significant: 00..0, 00..1, ...
  std::vector<Bits> all_logical_states() const;

  LabelMap label_map(const std::vector<Bits>& states) const;
  LabelMap label_map() const { return label_map(all_logical_states()); }
};

// "1101"
std::string bits_to_string(const Bits& bits);

} // namespace psx
