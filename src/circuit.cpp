// SPDX-License-Identifier: MIT

#include "photonic/circuit.hpp"
#include <cstring>
#include <sstream>

namespace psx {

Circuit::Circuit(std::size_t modes) : modes_(modes) {
  if (modes == 0) throw Error(ErrorCode::InvalidModeAssignment, "circuit needs at least one mode");
}

void check_placement(const Gate& gate, const std::vector<std::size_t>& modes, std::size_t m) {
  if (modes.size() != arity(gate)) {
    throw Error(ErrorCode::InvalidModeAssignment,
                std::string(gate_name(gate)) + " expects " + std::to_string(arity(gate)) +
                " modes, got " + std::to_string(modes.size()));
  }
  for (std::size_t i=0;i<modes.size();++i) {
    if (modes[i] >= m)
      throw Error(ErrorCode::InvalidModeAssignment,
                  "mode " + std::to_string(modes[i]) + " outside [0," + std::to_string(m) + ")");
    for (std::size_t j=0;j<i;++j)
      if (modes[j] == modes[i])
        throw Error(ErrorCode::InvalidModeAssignment, "mode " + std::to_string(modes[i]) + " wired twice");
  }
}

Circuit& Circuit::add(const Gate& gate, std::vector<std::size_t> modes) {
  check_placement(gate, modes, modes_);
  gate_matrix(gate); // parameter validation
  placements_.push_back({gate, std::move(modes)});
  return *this;
}

uint64_t Circuit::hash() const {
  uint64_t h = 1469598103934665603ULL; // FNV offset
  auto fnv = [&](uint64_t x){ h ^= x; h *= 1099511628211ULL; };
  auto fnv_double = [&](double d){ uint64_t u; std::memcpy(&u, &d, sizeof(u)); fnv(u); };
  fnv(modes_);
  for (const auto& p : placements_) {
    fnv(p.gate.index());
    if (const auto* bs = std::get_if<Beamsplitter>(&p.gate)) { fnv_double(bs->R); fnv_double(bs->phi); }
    else fnv_double(std::get<PhaseShifter>(p.gate).phi);
    for (auto m : p.modes) fnv(m);
  }
  return h;
}

std::string describe(const GatePlacement& p) {
  std::ostringstream os;
  os << gate_name(p.gate);
  if (const auto* bs = std::get_if<Beamsplitter>(&p.gate)) os << "(R=" << bs->R << ", phi=" << bs->phi << ")";
  else os << "(phi=" << std::get<PhaseShifter>(p.gate).phi << ")";
  os << " on";
  for (auto m : p.modes) os << " " << m;
  return os.str();
}

} // namespace psx
