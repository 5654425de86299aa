// SPDX-License-Identifier: MIT

#include "photonic/c_api.h"
#include <climits>
#include <cmath>
#include <cstring>
#include <iostream>
#include <numbers>

static int fails=0;
#define CHECK(cond) do{ if (!(cond)) { std::cerr << "CHECK failed at " << __LINE__ << ": " #cond "\n"; ++fails; } }while(0)

int main(){
  CHECK(std::strlen(psx_version()) > 0);

  psx_circuit* c = nullptr;
  CHECK(psx_circuit_new(2, &c) == PSX_OK && c != nullptr);
  CHECK(psx_circuit_add_beamsplitter(c, 0.5, std::numbers::pi/2, 0, 1) == PSX_OK);
  CHECK(std::strlen(psx_last_error()) == 0);

  int in[2] = {1,1}, coinc[2] = {1,1}, bunched[2] = {2,0}, single[2] = {1,0};
  double re = -1.0, im = -1.0;
  CHECK(psx_amplitude(c, in, coinc, 2, &re, &im) == PSX_OK);
  CHECK(std::abs(re) < 1e-14 && std::abs(im) < 1e-14);
  CHECK(psx_amplitude(c, in, bunched, 2, &re, &im) == PSX_OK);
  CHECK(std::abs(re) < 1e-14 && std::abs(im - 1.0/std::sqrt(2.0)) < 1e-14);
  CHECK(psx_amplitude(c, in, single, 2, &re, &im) == PSX_OK);
  CHECK(re == 0.0 && im == 0.0);

  // failures come back as codes with a message; the circuit is untouched
  CHECK(psx_circuit_add_beamsplitter(c, 2.0, 0.0, 0, 1) == PSX_ERR_INVALID_PARAMETER);
  CHECK(std::strlen(psx_last_error()) > 0);
  CHECK(psx_circuit_add_beamsplitter(c, 0.5, 0.0, 0, 0) == PSX_ERR_INVALID_MODE_ASSIGNMENT);
  CHECK(psx_circuit_add_phase_shifter(c, 0.3, 5) == PSX_ERR_INVALID_MODE_ASSIGNMENT);
  int wide[3] = {1,1,0};
  CHECK(psx_amplitude(c, wide, wide, 3, &re, &im) == PSX_ERR_DIMENSION_MISMATCH);
  int negative[2] = {-1,2};
  CHECK(psx_amplitude(c, negative, in, 2, &re, &im) == PSX_ERR_INVALID_PARAMETER);
  CHECK(psx_amplitude(c, in, nullptr, 2, &re, &im) == PSX_ERR_NULL);
  int huge[2] = {INT_MAX, INT_MAX};
  CHECK(psx_amplitude(c, huge, huge, 2, &re, &im) == PSX_ERR_PHOTON_BUDGET);
  CHECK(psx_circuit_add_phase_shifter(nullptr, 0.3, 0) == PSX_ERR_NULL);

  // a phase on mode 1 leaves the coincidence suppressed only up to the phase
  CHECK(psx_circuit_add_phase_shifter(c, std::numbers::pi, 1) == PSX_OK);
  CHECK(psx_amplitude(c, in, bunched, 2, &re, &im) == PSX_OK);
  CHECK(std::abs(std::hypot(re, im) - 1.0/std::sqrt(2.0)) < 1e-14);
  psx_circuit_free(c);

  psx_circuit* empty = nullptr;
  CHECK(psx_circuit_new(0, &empty) == PSX_ERR_INVALID_MODE_ASSIGNMENT && empty == nullptr);
  CHECK(psx_circuit_new(3, nullptr) == PSX_ERR_NULL);

  if (fails==0) std::cout << "OK\n";
  return fails==0?0:1;
}
