// SPDX-License-Identifier: MIT

#include "photonic/components.hpp"
#include "photonic/simulator.hpp"
#include <chrono>
#include <iostream>

using namespace psx;

int main(){
  const std::size_t m = 32;
  Simulator sim(random_circuit(m, 400, 42));
  for (int n = 4; n <= 20; n += 4){
    FockState in(m, 0), out(m, 0);
    for (int k=0;k<n;++k){ in[k] = 1; out[m-1-k] = 1; }
    auto t0 = std::chrono::steady_clock::now();
    auto a = sim.amplitude(in, out); (void)a;
    auto t1 = std::chrono::steady_clock::now();
    std::chrono::duration<double> dt = t1 - t0;
    std::cout << "photons=" << n << " elapsed seconds: " << dt.count() << "\n";
  }
  return 0;
}
