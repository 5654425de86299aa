// SPDX-License-Identifier: MIT

#include "photonic/fock.hpp"
#include "photonic/error.hpp"
#include <numeric>

namespace psx {

long long photon_count(const FockState& s){
  return std::accumulate(s.begin(), s.end(), 0LL);
}

void check_fock_state(const FockState& s, std::size_t modes){
  if (s.size() != modes)
    throw Error(ErrorCode::DimensionMismatch,
                "Fock state " + to_string(s) + " has " + std::to_string(s.size()) +
                " modes, circuit has " + std::to_string(modes));
  for (int n : s)
    if (n < 0) throw Error(ErrorCode::InvalidParameter, "negative occupation in " + to_string(s));
}

static void fill_states(std::vector<FockState>& out, FockState& cur, std::size_t mode, int left){
  if (mode + 1 == cur.size()){
    cur[mode] = left;
    out.push_back(cur);
    return;
  }
  for (int k = left; k >= 0; --k){
    cur[mode] = k;
    fill_states(out, cur, mode + 1, left - k);
  }
  cur[mode] = 0;
}

std::vector<FockState> enumerate_fock_states(std::size_t modes, int photons){
  std::vector<FockState> out;
  if (modes == 0 || photons < 0) return out;
  FockState cur(modes, 0);
  fill_states(out, cur, 0, photons);
  return out;
}

std::string to_string(const FockState& s){
  std::string r = "|";
  for (std::size_t i=0;i<s.size();++i){
    if (i) r += ",";
    r += std::to_string(s[i]);
  }
  return r + ">";
}

double occupation_factorial(const FockState& s){
  double f = 1.0;
  for (int n : s)
    for (int k=2;k<=n;++k) f *= k;
  return f;
}

} // namespace psx
