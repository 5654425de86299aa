// SPDX-License-Identifier: MIT

#pragma once
#include "circuit.hpp"
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace psx {

// M x M identity except the rows/columns of `modes`, which hold the gate's
// own matrix in the order the modes are listed.
Unitary embed(const Gate& gate, const std::vector<std::size_t>& modes, std::size_t m);

// Global unitary of the circuit. Placements g1..gk (in the order they were
// added) compose as U = E(gk) * ... * E(g1): each later gate multiplies on the
// left, so U applied to an input amplitude vector reproduces running the gates
// from first to last. A photon entering mode j leaves through mode i with
// amplitude U(i, j).
Unitary compose(const Circuit& c);

Unitary multiply(const Unitary& A, const Unitary& B);

// max |(U^dagger U - I)_ij|
double unitarity_error(const Unitary& U);

// Writes re+imi cells, one matrix row per line.
bool export_unitary_csv(const Unitary& U, const std::string& path);

// Composed unitaries looked up by circuit content hash. Each entry keeps its
// circuit, so a hash collision composes instead of returning the wrong matrix.
// Holds at most `capacity` entries and drops the oldest first. Safe to share
// between threads.
class UnitaryCache {
  struct Entry {
    Circuit circuit;
    std::shared_ptr<const Unitary> unitary;
  };
  mutable std::mutex mtx_;
  std::unordered_multimap<uint64_t, std::shared_ptr<const Entry>> entries_;
  std::deque<std::pair<uint64_t, const Entry*>> order_; // insertion order
  std::size_t capacity_;
  std::size_t compositions_ = 0;
public:
  explicit UnitaryCache(std::size_t capacity = 256);

  std::shared_ptr<const Unitary> get(const Circuit& c);
  std::size_t size() const;
  std::size_t capacity() const { return capacity_; }
  std::size_t compositions() const; // number of compose() calls made so far
  void clear();

  static UnitaryCache& global();
};

} // namespace psx
