// SPDX-License-Identifier: MIT

#pragma once
#include "circuit.hpp"
#include "codec.hpp"
#include <cstdint>
#include <utility>

namespace psx {

using ModePair = std::pair<std::size_t, std::size_t>; // (|0> mode, |1> mode)

// 50/50 beamsplitter with phi = 0: the Hadamard gate on a path-encoded qubit.
Circuit& add_hadamard(Circuit& c, ModePair qubit);

// Post-selected controlled-phase block from three R = 2/3 beamsplitters:
// control |0> with aux0, the two |1> modes with phi = pi/2, target |0> with
// aux1. On the logical subspace it acts as CZ / 3 (success probability 1/9);
// everything else leaks out of the subspace and never returns.
Circuit& add_cz(Circuit& c, ModePair control, ModePair target, std::size_t aux0, std::size_t aux1);

// Hadamard on the target, CZ, Hadamard on the target: CNOT / 3.
Circuit& add_cnot(Circuit& c, ModePair control, ModePair target, std::size_t aux0, std::size_t aux1);

// Two-register oracle validation circuit on 12 modes: x1=(0,1), x2=(2,3),
// f1=(7,8), f2=(9,10), auxiliary modes 4,5,6,11. Hadamards put x1, x2 in
// superposition, then f1 ^= x1 and f2 ^= x2 through two post-selected CNOTs.
// From input (x1,x2,f1,f2) = (1,1,0,1) every output with f1 = x1 and
// f2 = 1 - x2 has amplitude +-1/18; all other logical outputs vanish.
struct OracleScenario {
  Circuit circuit;
  PathEncoding encoding;
  FockState input;
};
OracleScenario make_oracle_scenario();

// Random beamsplitter/phase-shifter mesh of `depth` gates on `modes` modes.
Circuit random_circuit(std::size_t modes, std::size_t depth, uint64_t seed);

} // namespace psx
