// SPDX-License-Identifier: MIT

#include "photonic/permanent.hpp"
#include "photonic/error.hpp"
#include <algorithm>
#include <bit>
#include <numeric>
#include <vector>

namespace psx {

c64 permanent(const vec_c64& S, std::size_t n, const CancelToken* cancel){
  if (S.size() != n*n)
    throw Error(ErrorCode::DimensionMismatch, "permanent expects " + std::to_string(n*n) + " entries");
  if (n == 0) return {1.0, 0.0};
  if (n == 1) return S[0];
  if (n > kMaxPermanentSize)
    throw Error(ErrorCode::PhotonBudgetExceeded, "permanent of size " + std::to_string(n));

  // row_sums[r] = sum_{c in T} S[r][c] for the current subset T
  vec_c64 row_sums(n, c64{0.0, 0.0});
  c64 total{0.0, 0.0};
  const uint64_t subsets = uint64_t(1) << n;
  uint64_t gray = 0;
  for (uint64_t k = 1; k < subsets; ++k){
    if (cancel && cancel->cancelled())
      throw Error(ErrorCode::Cancelled, "permanent cancelled after " + std::to_string(k-1) + " subsets");
    const std::size_t col = std::size_t(std::countr_zero(k));
    const uint64_t bit = uint64_t(1) << col;
    gray ^= bit;
    if (gray & bit) for (std::size_t r=0;r<n;r++) row_sums[r] += S[r*n + col];
    else            for (std::size_t r=0;r<n;r++) row_sums[r] -= S[r*n + col];
    c64 prod{1.0, 0.0};
    for (std::size_t r=0;r<n;r++) prod *= row_sums[r];
    if (std::popcount(gray) & 1) total -= prod;
    else total += prod;
  }
  return (n & 1) ? -total : total;
}

c64 permanent_naive(const vec_c64& S, std::size_t n){
  if (S.size() != n*n)
    throw Error(ErrorCode::DimensionMismatch, "permanent expects " + std::to_string(n*n) + " entries");
  std::vector<std::size_t> perm(n);
  std::iota(perm.begin(), perm.end(), std::size_t(0));
  c64 total{0.0, 0.0};
  do {
    c64 prod{1.0, 0.0};
    for (std::size_t r=0;r<n;r++) prod *= S[r*n + perm[r]];
    total += prod;
  } while (std::next_permutation(perm.begin(), perm.end()));
  return total;
}

} // namespace psx
