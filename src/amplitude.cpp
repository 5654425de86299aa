// SPDX-License-Identifier: MIT

#include "photonic/amplitude.hpp"
#include "photonic/error.hpp"
#include "photonic/fock.hpp"
#include <algorithm>
#include <cmath>

namespace psx {

vec_c64 transition_submatrix(const Unitary& U, const FockState& in, const FockState& out){
  std::vector<std::size_t> cols, rows;
  for (std::size_t i=0;i<in.size();++i)
    for (int k=0;k<in[i];++k) cols.push_back(i);
  for (std::size_t j=0;j<out.size();++j)
    for (int k=0;k<out[j];++k) rows.push_back(j);
  if (rows.size() != cols.size())
    throw Error(ErrorCode::DimensionMismatch, "photon counts differ: " + to_string(in) + " vs " + to_string(out));
  const std::size_t n = rows.size();
  vec_c64 S(n*n);
  for (std::size_t r=0;r<n;r++)
    for (std::size_t c=0;c<n;c++)
      S[r*n + c] = U(rows[r], cols[c]);
  return S;
}

c64 amplitude(const Unitary& U, const FockState& in, const FockState& out,
              const EngineOptions& opts, const CancelToken* cancel){
  check_fock_state(in, U.modes);
  check_fock_state(out, U.modes);
  const long long n = photon_count(in);
  if (n != photon_count(out)) return {0.0, 0.0};
  const std::size_t budget = std::min(opts.max_photons, kMaxPermanentSize);
  if (static_cast<unsigned long long>(n) > budget)
    throw Error(ErrorCode::PhotonBudgetExceeded,
                std::to_string(n) + " photons, budget is " + std::to_string(budget));
  auto S = transition_submatrix(U, in, out);
  c64 p = permanent(S, std::size_t(n), cancel);
  return p / std::sqrt(occupation_factorial(in) * occupation_factorial(out));
}

std::optional<c64> AmplitudeCache::find(uint64_t circuit, const FockState& in, const FockState& out){
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = entries_.find(Key{circuit, in, out});
  if (it == entries_.end()) return std::nullopt;
  ++hits_;
  return it->second;
}

void AmplitudeCache::store(uint64_t circuit, const FockState& in, const FockState& out, c64 value){
  std::lock_guard<std::mutex> lk(mtx_);
  entries_.emplace(Key{circuit, in, out}, value);
}

std::size_t AmplitudeCache::size() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return entries_.size();
}

std::size_t AmplitudeCache::hits() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return hits_;
}

void AmplitudeCache::clear(){
  std::lock_guard<std::mutex> lk(mtx_);
  entries_.clear();
  hits_ = 0;
}

} // namespace psx
