// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include <atomic>

namespace psx {

// Cooperative cancellation flag, polled once per Ryser subset.
class CancelToken {
  std::atomic<bool> flag_{false};
public:
  void cancel() { flag_.store(true, std::memory_order_relaxed); }
  void reset() { flag_.store(false, std::memory_order_relaxed); }
  bool cancelled() const { return flag_.load(std::memory_order_relaxed); }
};

// Largest matrix size the subset enumeration can index.
inline constexpr std::size_t kMaxPermanentSize = 62;

// Permanent of the n x n row-major matrix S by Ryser's formula,
//   perm(S) = (-1)^n sum_{T} (-1)^{|T|} prod_r sum_{c in T} S[r][c],
// visiting subsets in Gray-code order: O(2^n n) time, O(n) extra space.
// n == 0 gives 1. Throws Cancelled if `cancel` fires; no partial value escapes.
c64 permanent(const vec_c64& S, std::size_t n, const CancelToken* cancel = nullptr);

// Sum over all n! permutations. Reference for small matrices.
c64 permanent_naive(const vec_c64& S, std::size_t n);

} // namespace psx
