// SPDX-License-Identifier: MIT

#include "photonic/simulator.hpp"
#include "photonic/fock.hpp"

namespace psx {

Simulator::Simulator(Circuit c, EngineOptions opts, UnitaryCache& cache)
  : circuit_(std::move(c)), opts_(opts), hash_(circuit_.hash()), unitary_(cache.get(circuit_)) {}

c64 Simulator::amplitude(const FockState& in, const FockState& out, const CancelToken* cancel) const {
  if (!opts_.cache_amplitudes) return psx::amplitude(*unitary_, in, out, opts_, cancel);
  check_fock_state(in, circuit_.modes());
  check_fock_state(out, circuit_.modes());
  if (auto hit = amplitudes_.find(hash_, in, out)) return *hit;
  c64 a = psx::amplitude(*unitary_, in, out, opts_, cancel);
  amplitudes_.store(hash_, in, out, a);
  return a;
}

DistributionTable Simulator::distribution(const LabelMap& inputs, const LabelMap& outputs,
                                          Normalization mode, const CancelToken* cancel) const {
  AmplitudeFn amp = [this, cancel](const FockState& in, const FockState& out){
    return amplitude(in, out, cancel);
  };
  return analyse_with(amp, circuit_.modes(), inputs, outputs, mode, opts_.threads);
}

c64 amplitude(const Circuit& c, const FockState& in, const FockState& out, const EngineOptions& opts){
  auto U = UnitaryCache::global().get(c);
  return amplitude(*U, in, out, opts);
}

DistributionTable distribution(const Circuit& c, const LabelMap& inputs, const LabelMap& outputs,
                               Normalization mode, const EngineOptions& opts){
  auto U = UnitaryCache::global().get(c);
  return analyse(*U, inputs, outputs, mode, opts);
}

} // namespace psx
