// SPDX-License-Identifier: MIT

#include "photonic/codec.hpp"
#include "photonic/error.hpp"
#include "photonic/fock.hpp"

namespace psx {

PathEncoding::PathEncoding(std::size_t modes,
                           std::vector<std::pair<std::size_t, std::size_t>> qubits,
                           std::vector<std::size_t> aux)
  : modes_(modes), qubits_(std::move(qubits)), aux_(std::move(aux)) {
  std::vector<bool> used(modes_, false);
  auto claim = [&](std::size_t m){
    if (m >= modes_)
      throw Error(ErrorCode::InvalidModeAssignment, "encoding mode " + std::to_string(m) + " outside [0," + std::to_string(modes_) + ")");
    if (used[m])
      throw Error(ErrorCode::InvalidModeAssignment, "encoding uses mode " + std::to_string(m) + " twice");
    used[m] = true;
  };
  for (const auto& [zero, one] : qubits_) { claim(zero); claim(one); }
  for (auto m : aux_) claim(m);
}

FockState PathEncoding::encode(const Bits& bits) const {
  if (bits.size() != qubits_.size())
    throw Error(ErrorCode::InvalidParameter, "expected " + std::to_string(qubits_.size()) + " bits, got " + std::to_string(bits.size()));
  FockState s(modes_, 0);
  for (std::size_t q=0;q<bits.size();++q){
    if (bits[q] != 0 && bits[q] != 1)
      throw Error(ErrorCode::InvalidParameter, "bit " + std::to_string(q) + " is " + std::to_string(bits[q]));
    s[bits[q] ? qubits_[q].second : qubits_[q].first] = 1;
  }
  return s;
}

std::optional<Bits> PathEncoding::decode(const FockState& s, std::string& err) const {
  if (s.size() != modes_) { err = "state has " + std::to_string(s.size()) + " modes, encoding has " + std::to_string(modes_); return std::nullopt; }
  for (auto m : aux_){
    if (s[m] != 0) { err = "auxiliary mode " + std::to_string(m) + " occupied in " + to_string(s); return std::nullopt; }
  }
  std::vector<bool> qubit_mode(modes_, false);
  for (const auto& [zero, one] : qubits_) { qubit_mode[zero] = true; qubit_mode[one] = true; }
  for (std::size_t m=0;m<modes_;++m){
    if (!qubit_mode[m] && s[m] != 0) { err = "unassigned mode " + std::to_string(m) + " occupied in " + to_string(s); return std::nullopt; }
  }
  Bits bits(qubits_.size(), 0);
  for (std::size_t q=0;q<qubits_.size();++q){
    long long n0 = s[qubits_[q].first], n1 = s[qubits_[q].second];
    if (n0 < 0 || n1 < 0 || n0 + n1 != 1) {
      err = "qubit " + std::to_string(q) + " holds " + std::to_string(n0 + n1) + " photons in " + to_string(s);
      return std::nullopt;
    }
    bits[q] = int(n1);
  }
  return bits;
}

std::vector<Bits> PathEncoding::all_logical_states() const {
  const std::size_t q = qubits_.size();
  std::vector<Bits> out;
  out.reserve(std::size_t(1) << q);
  for (std::size_t i=0; i < (std::size_t(1) << q); ++i){
    Bits b(q, 0);
    for (std::size_t k=0;k<q;++k) b[k] = int((i >> (q-1-k)) & 1);
    out.push_back(b);
  }
  return out;
}

LabelMap PathEncoding::label_map(const std::vector<Bits>& states) const {
  LabelMap m;
  m.reserve(states.size());
  for (const auto& b : states) m.emplace_back(bits_to_string(b), encode(b));
  return m;
}

std::string bits_to_string(const Bits& bits){
  std::string s; s.reserve(bits.size());
  for (int b : bits) s.push_back(b ? '1' : '0');
  return s;
}

} // namespace psx
