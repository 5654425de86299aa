// SPDX-License-Identifier: MIT

#include "photonic/components.hpp"
#include "photonic/random.hpp"
#include <numbers>

namespace psx {

Circuit& add_hadamard(Circuit& c, ModePair qubit){
  return c.beamsplitter(0.5, 0.0, qubit.first, qubit.second);
}

Circuit& add_cz(Circuit& c, ModePair control, ModePair target, std::size_t aux0, std::size_t aux1){
  const double R = 2.0/3.0;
  c.beamsplitter(R, 0.0, control.first, aux0);
  // both photons on the |1> modes: perm = e^{i pi}(R - (1-R)) = -1/3
  c.beamsplitter(R, std::numbers::pi/2, control.second, target.second);
  c.beamsplitter(R, 0.0, target.first, aux1);
  return c;
}

Circuit& add_cnot(Circuit& c, ModePair control, ModePair target, std::size_t aux0, std::size_t aux1){
  add_hadamard(c, target);
  add_cz(c, control, target, aux0, aux1);
  return add_hadamard(c, target);
}

OracleScenario make_oracle_scenario(){
  const ModePair x1{0,1}, x2{2,3}, f1{7,8}, f2{9,10};
  Circuit c(12);
  add_hadamard(c, x1);
  add_hadamard(c, x2);
  add_cnot(c, x1, f1, 4, 5);
  add_cnot(c, x2, f2, 6, 11);
  PathEncoding enc(12, {x1, x2, f1, f2}, {4, 5, 6, 11});
  FockState input = enc.encode({1, 1, 0, 1}); // |0,1,0,1,0,0,0,1,0,0,1,0>
  return {std::move(c), std::move(enc), std::move(input)};
}

Circuit random_circuit(std::size_t modes, std::size_t depth, uint64_t seed){
  Rng rng(seed);
  Circuit c(modes);
  for (std::size_t i=0;i<depth;++i){
    if (modes < 2 || rng.uniform() < 0.3){
      c.phase_shifter(rng.uniform(0.0, 2*std::numbers::pi), rng.index(modes));
    } else {
      std::size_t a = rng.index(modes);
      std::size_t b = (a + 1 + rng.index(modes - 1)) % modes;
      c.beamsplitter(rng.uniform(), rng.uniform(0.0, 2*std::numbers::pi), a, b);
    }
  }
  return c;
}

} // namespace psx
