// SPDX-License-Identifier: MIT

#pragma once
#include "amplitude.hpp"
#include "circuit.hpp"
#include "config.hpp"
#include "distribution.hpp"
#include "unitary.hpp"
#include <memory>

namespace psx {

// Query front end for one circuit. The global unitary is fetched once from the
// unitary cache when the simulator is built; amplitudes are memoised per
// (input, output) when opts.cache_amplitudes is set. All queries are const
// and safe to run from several threads.
class Simulator {
  Circuit circuit_;
  EngineOptions opts_;
  uint64_t hash_;
  std::shared_ptr<const Unitary> unitary_;
  mutable AmplitudeCache amplitudes_;

public:
  explicit Simulator(Circuit c, EngineOptions opts = {}, UnitaryCache& cache = UnitaryCache::global());

  const Circuit& circuit() const { return circuit_; }
  const Unitary& unitary() const { return *unitary_; }
  const EngineOptions& options() const { return opts_; }
  const AmplitudeCache& amplitude_cache() const { return amplitudes_; }

  c64 amplitude(const FockState& in, const FockState& out, const CancelToken* cancel = nullptr) const;
  double probability(const FockState& in, const FockState& out) const { return std::norm(amplitude(in, out)); }

  DistributionTable distribution(const LabelMap& inputs, const LabelMap& outputs,
                                 Normalization mode, const CancelToken* cancel = nullptr) const;
};

// One-shot queries against the process-wide unitary cache.
c64 amplitude(const Circuit& c, const FockState& in, const FockState& out, const EngineOptions& opts = {});
DistributionTable distribution(const Circuit& c, const LabelMap& inputs, const LabelMap& outputs,
                               Normalization mode, const EngineOptions& opts = {});

} // namespace psx
