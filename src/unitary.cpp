// SPDX-License-Identifier: MIT

#include "photonic/unitary.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#ifdef PSX_OPENMP
#include <omp.h>
#endif

namespace psx {

Unitary embed(const Gate& gate, const std::vector<std::size_t>& modes, std::size_t m){
  check_placement(gate, modes, m);
  auto G = gate_matrix(gate);
  const std::size_t k = modes.size();
  Unitary E = Unitary::identity(m);
  for (std::size_t i=0;i<k;i++)
    for (std::size_t j=0;j<k;j++)
      E(modes[i], modes[j]) = G[i*k+j];
  return E;
}

Unitary multiply(const Unitary& A, const Unitary& B){
  const std::size_t d = A.modes;
  Unitary C(d);
#ifdef PSX_OPENMP
#pragma omp parallel for schedule(static) if(d >= 64)
#endif
  for (long long ii=0; ii<(long long)d; ii++){
    const std::size_t i = std::size_t(ii);
    for (std::size_t k=0;k<d;k++){
      auto aik = A(i,k);
      if (aik == c64{0.0,0.0}) continue;
      for (std::size_t j=0;j<d;j++)
        C(i,j) += aik * B(k,j);
    }
  }
  return C;
}

Unitary compose(const Circuit& c){
  const std::size_t m = c.modes();
  Unitary U = Unitary::identity(m);
  for (const auto& p : c.placements()){
    auto E = embed(p.gate, p.modes, m);
    U = multiply(E, U);
  }
  return U;
}

double unitarity_error(const Unitary& U){
  const std::size_t d = U.modes;
  double worst = 0.0;
  for (std::size_t i=0;i<d;i++)
    for (std::size_t j=0;j<d;j++){
      c64 s{0.0,0.0};
      for (std::size_t k=0;k<d;k++) s += std::conj(U(k,i)) * U(k,j);
      if (i==j) s -= c64{1.0,0.0};
      worst = std::max(worst, std::abs(s));
    }
  return worst;
}

bool export_unitary_csv(const Unitary& U, const std::string& path){
  const std::size_t d = U.modes;
  std::ofstream out(path);
  if (!out) return false;
  out.precision(17);
  for (std::size_t i=0;i<d;i++){
    for (std::size_t j=0;j<d;j++){
      auto z = U(i,j);
      out << std::real(z) << (std::imag(z) < 0 ? "" : "+") << std::imag(z) << "i";
      if (j+1<d) out << ",";
    }
    out << "\n";
  }
  return bool(out);
}

UnitaryCache::UnitaryCache(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {}

std::shared_ptr<const Unitary> UnitaryCache::get(const Circuit& c){
  const uint64_t key = c.hash();
  std::lock_guard<std::mutex> lk(mtx_);
  auto [first, last] = entries_.equal_range(key);
  for (auto it = first; it != last; ++it)
    if (it->second->circuit == c) return it->second->unitary;

  auto entry = std::make_shared<const Entry>(Entry{c, std::make_shared<const Unitary>(compose(c))});
  ++compositions_;
  entries_.emplace(key, entry);
  order_.emplace_back(key, entry.get());
  while (entries_.size() > capacity_){
    auto [old_key, old_entry] = order_.front();
    order_.pop_front();
    auto [b, e] = entries_.equal_range(old_key);
    for (auto it = b; it != e; ++it)
      if (it->second.get() == old_entry) { entries_.erase(it); break; }
  }
  return entry->unitary;
}

std::size_t UnitaryCache::size() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return entries_.size();
}

std::size_t UnitaryCache::compositions() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return compositions_;
}

void UnitaryCache::clear(){
  std::lock_guard<std::mutex> lk(mtx_);
  entries_.clear();
  order_.clear();
}

UnitaryCache& UnitaryCache::global(){
  static UnitaryCache cache;
  return cache;
}

} // namespace psx
