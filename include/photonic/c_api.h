// SPDX-License-Identifier: MIT

#pragma once
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Status codes returned by every call; PSX_OK is 0.
enum {
  PSX_OK = 0,
  PSX_ERR_NULL = 1,
  PSX_ERR_INVALID_PARAMETER = 2,
  PSX_ERR_INVALID_MODE_ASSIGNMENT = 3,
  PSX_ERR_DIMENSION_MISMATCH = 4,
  PSX_ERR_EMPTY_SUPPORT = 5,
  PSX_ERR_PHOTON_BUDGET = 6,
  PSX_ERR_CANCELLED = 7,
  PSX_ERR_INTERNAL = 8
};

typedef struct psx_circuit psx_circuit;

// Creates an empty circuit on `modes` modes; free with psx_circuit_free().
int psx_circuit_new(size_t modes, psx_circuit** out);
void psx_circuit_free(psx_circuit* c);

int psx_circuit_add_beamsplitter(psx_circuit* c, double R, double phi, size_t mode_a, size_t mode_b);
int psx_circuit_add_phase_shifter(psx_circuit* c, double phi, size_t mode);

// <output| U |input> for occupation arrays of length `modes`.
int psx_amplitude(const psx_circuit* c, const int* input, const int* output, size_t modes,
                  double* re, double* im);

// Message of the last failing call on this thread ("" if none).
const char* psx_last_error(void);

// Returns the compiled library version string.
const char* psx_version(void);

#ifdef __cplusplus
}
#endif
