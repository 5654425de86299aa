// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include <string>
#include <vector>

namespace psx {

// Total photon number, summed in 64 bits so large occupations cannot wrap.
long long photon_count(const FockState& s);

// Throws DimensionMismatch if s.size() != modes, InvalidParameter on a negative entry.
void check_fock_state(const FockState& s, std::size_t modes);

// Every Fock state with n photons in m modes, in descending lexicographic
// order ([n,0,...,0] first). There are C(n+m-1, n) of them.
std::vector<FockState> enumerate_fock_states(std::size_t modes, int photons);

// "|0,1,0,1>"
std::string to_string(const FockState& s);

// prod_i n_i!
double occupation_factorial(const FockState& s);

} // namespace psx
