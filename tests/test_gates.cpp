// SPDX-License-Identifier: MIT

#include "photonic/gates.hpp"
#include <cmath>
#include <iostream>
#include <numbers>

using namespace psx;

static int fails=0;
#define CHECK(cond) do{ if (!(cond)) { std::cerr << "CHECK failed at " << __LINE__ << ": " #cond "\n"; ++fails; } }while(0)
#define CHECK_NEAR(a,b,e) do{ if (std::abs((a)-(b))>(e)) { std::cerr << "Mismatch at " << __LINE__ << ": " << (a) << " vs " << (b) << "\n"; ++fails; } }while(0)

static bool throws_code(ErrorCode code, double R, double phi){
  try { gate_matrix(Beamsplitter{R, phi}); }
  catch (const Error& e) { return e.code() == code; }
  return false;
}

int main(){
  const double pi = std::numbers::pi;
  // 2x2 unitarity over a parameter grid, including R = 0 and R = 1
  for (int i=0;i<=10;++i){
    for (int k=-4;k<=4;++k){
      double R = i / 10.0, phi = k * pi / 3.0;
      auto G = gate_matrix(Beamsplitter{R, phi});
      c64 n0 = std::norm(G[0]) + std::norm(G[2]);
      c64 n1 = std::norm(G[1]) + std::norm(G[3]);
      c64 dot = std::conj(G[0])*G[1] + std::conj(G[2])*G[3];
      CHECK_NEAR(n0, c64(1.0), 1e-14);
      CHECK_NEAR(n1, c64(1.0), 1e-14);
      CHECK_NEAR(dot, c64(0.0), 1e-14);
      CHECK_NEAR(std::norm(G[1]), R, 1e-14);
    }
  }

  // R=1/2, phi=0 is the Hadamard matrix
  const double s = 1.0/std::sqrt(2.0);
  auto H = gate_matrix(Beamsplitter{0.5, 0.0});
  CHECK_NEAR(H[0], c64(s), 1e-15);
  CHECK_NEAR(H[1], c64(s), 1e-15);
  CHECK_NEAR(H[2], c64(s), 1e-15);
  CHECK_NEAR(H[3], c64(-s), 1e-15);

  // R=1/2, phi=pi/2 is the symmetric splitter (1/sqrt2)[[1,i],[i,1]]
  auto B = gate_matrix(Beamsplitter{0.5, pi/2});
  CHECK_NEAR(B[0], c64(s, 0.0), 1e-15);
  CHECK_NEAR(B[1], c64(0.0, s), 1e-15);
  CHECK_NEAR(B[2], c64(0.0, s), 1e-15);
  CHECK_NEAR(B[3], c64(s, 0.0), 1e-15);

  auto P = gate_matrix(PhaseShifter{pi/3});
  CHECK(P.size() == 1);
  CHECK_NEAR(P[0], c64(0.5, std::sqrt(3.0)/2), 1e-15);

  CHECK(arity(Gate{Beamsplitter{}}) == 2);
  CHECK(arity(Gate{PhaseShifter{}}) == 1);

  CHECK(throws_code(ErrorCode::InvalidParameter, -0.01, 0.0));
  CHECK(throws_code(ErrorCode::InvalidParameter, 1.0001, 0.0));
  CHECK(throws_code(ErrorCode::InvalidParameter, std::nan(""), 0.0));
  CHECK(throws_code(ErrorCode::InvalidParameter, 0.5, INFINITY));
  bool ps_throws = false;
  try { gate_matrix(PhaseShifter{NAN}); } catch (const Error& e) { ps_throws = e.code() == ErrorCode::InvalidParameter; }
  CHECK(ps_throws);

  if (fails==0) std::cout << "OK\n";
  return fails==0?0:1;
}
