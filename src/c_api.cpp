// SPDX-License-Identifier: MIT

#include "photonic/c_api.h"
#include "photonic/circuit.hpp"
#include "photonic/simulator.hpp"
#include <new>
#include <string>

struct psx_circuit {
  psx::Circuit circuit;
};

static thread_local std::string g_last_error;

static int code_for(psx::ErrorCode code){
  switch (code){
    case psx::ErrorCode::InvalidParameter: return PSX_ERR_INVALID_PARAMETER;
    case psx::ErrorCode::InvalidModeAssignment: return PSX_ERR_INVALID_MODE_ASSIGNMENT;
    case psx::ErrorCode::DimensionMismatch: return PSX_ERR_DIMENSION_MISMATCH;
    case psx::ErrorCode::EmptySupport: return PSX_ERR_EMPTY_SUPPORT;
    case psx::ErrorCode::PhotonBudgetExceeded: return PSX_ERR_PHOTON_BUDGET;
    case psx::ErrorCode::Cancelled: return PSX_ERR_CANCELLED;
  }
  return PSX_ERR_INTERNAL;
}

// Runs f, mapping exceptions onto status codes and the thread's last error.
template <class F>
static int guarded(F&& f){
  try {
    f();
    g_last_error.clear();
    return PSX_OK;
  } catch (const psx::Error& e) {
    g_last_error = e.what();
    return code_for(e.code());
  } catch (const std::bad_alloc&) {
    g_last_error = "out of memory";
    return PSX_ERR_INTERNAL;
  } catch (const std::exception& e) {
    g_last_error = e.what();
    return PSX_ERR_INTERNAL;
  }
}

extern "C" {

int psx_circuit_new(size_t modes, psx_circuit** out){
  if (!out) { g_last_error = "null output handle"; return PSX_ERR_NULL; }
  *out = nullptr;
  return guarded([&]{ *out = new psx_circuit{psx::Circuit(modes)}; });
}

void psx_circuit_free(psx_circuit* c){ delete c; }

int psx_circuit_add_beamsplitter(psx_circuit* c, double R, double phi, size_t mode_a, size_t mode_b){
  if (!c) { g_last_error = "null circuit"; return PSX_ERR_NULL; }
  return guarded([&]{ c->circuit.beamsplitter(R, phi, mode_a, mode_b); });
}

int psx_circuit_add_phase_shifter(psx_circuit* c, double phi, size_t mode){
  if (!c) { g_last_error = "null circuit"; return PSX_ERR_NULL; }
  return guarded([&]{ c->circuit.phase_shifter(phi, mode); });
}

int psx_amplitude(const psx_circuit* c, const int* input, const int* output, size_t modes,
                  double* re, double* im){
  if (!c || !input || !output || !re || !im) { g_last_error = "null argument"; return PSX_ERR_NULL; }
  return guarded([&]{
    psx::FockState in(input, input + modes), out(output, output + modes);
    auto a = psx::amplitude(c->circuit, in, out);
    *re = a.real();
    *im = a.imag();
  });
}

const char* psx_last_error(void){ return g_last_error.c_str(); }

const char* psx_version(void){
#ifdef PSX_VERSION
  return PSX_VERSION;
#else
  return "unknown";
#endif
}

} // extern "C"
