// SPDX-License-Identifier: MIT

#pragma once
#include "config.hpp"
#include "permanent.hpp"
#include "types.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <tuple>

namespace psx {

// n x n matrix with column i of U repeated in[i] times and row j repeated
// out[j] times, modes visited in ascending order. Requires equal photon counts.
vec_c64 transition_submatrix(const Unitary& U, const FockState& in, const FockState& out);

// <out| U |in> = perm(S) / sqrt(prod in_i! prod out_j!).
// Exactly zero when the photon counts differ. Throws DimensionMismatch,
// InvalidParameter (negative occupation), PhotonBudgetExceeded or Cancelled.
// Results that are mathematically zero usually come back as ~1e-16.
c64 amplitude(const Unitary& U, const FockState& in, const FockState& out,
              const EngineOptions& opts = {}, const CancelToken* cancel = nullptr);

inline double probability(const c64& a) { return std::norm(a); }

// Amplitudes keyed by (circuit hash, input, output); shared between threads.
class AmplitudeCache {
  using Key = std::tuple<uint64_t, FockState, FockState>;
  mutable std::mutex mtx_;
  std::map<Key, c64> entries_;
  std::size_t hits_ = 0;
public:
  std::optional<c64> find(uint64_t circuit, const FockState& in, const FockState& out);
  void store(uint64_t circuit, const FockState& in, const FockState& out, c64 value);
  std::size_t size() const;
  std::size_t hits() const;
  void clear();
};

} // namespace psx
