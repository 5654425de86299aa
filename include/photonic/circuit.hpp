// SPDX-License-Identifier: MIT

#pragma once
#include "gates.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace psx {

struct GatePlacement {
  Gate gate;
  std::vector<std::size_t> modes; // global modes, in the gate's own row order
  bool operator==(const GatePlacement&) const = default;
};

// Linear optical circuit over a fixed number of modes. Placements are applied
// to the input in the order they were added; see compose() for how that maps
// onto the matrix product.
class Circuit {
  std::size_t modes_;
  std::vector<GatePlacement> placements_;

public:
  explicit Circuit(std::size_t modes);

  std::size_t modes() const { return modes_; }
  const std::vector<GatePlacement>& placements() const { return placements_; }
  std::size_t size() const { return placements_.size(); }

  // Appends a gate wired to the given modes. Throws InvalidModeAssignment on
  // out-of-range, duplicate or wrong-count modes and InvalidParameter on bad
  // gate parameters; the circuit is left unchanged on failure.
  Circuit& add(const Gate& gate, std::vector<std::size_t> modes);

  Circuit& beamsplitter(double R, double phi, std::size_t a, std::size_t b) {
    return add(Beamsplitter{R, phi}, {a, b});
  }
  Circuit& phase_shifter(double phi, std::size_t mode) {
    return add(PhaseShifter{phi}, {mode});
  }

  // FNV-1a over the mode count, gate kinds, parameter bits and wiring.
  uint64_t hash() const;

  // Same mode count and the same placements in the same order.
  bool operator==(const Circuit&) const = default;
};

// Throws InvalidModeAssignment unless modes has arity(gate) distinct entries in [0, m).
void check_placement(const Gate& gate, const std::vector<std::size_t>& modes, std::size_t m);

std::string describe(const GatePlacement& p);

} // namespace psx
