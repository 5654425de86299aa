// SPDX-License-Identifier: MIT

#pragma once
#include <complex>
#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>

namespace psx {
  using c64 = std::complex<double>;
  using vec_c64 = std::vector<c64>;

  // Occupation number per mode; the sum is the photon count.
  using FockState = std::vector<int>;

  // Square complex matrix over the optical modes, row-major.
  struct Unitary {
    std::size_t modes{};
    vec_c64 data; // size modes*modes

    Unitary() = default;
    explicit Unitary(std::size_t m) : modes(m), data(m*m, c64{0.0, 0.0}) {}

    c64& operator()(std::size_t row, std::size_t col) { return data[row*modes + col]; }
    const c64& operator()(std::size_t row, std::size_t col) const { return data[row*modes + col]; }

    bool operator==(const Unitary&) const = default;

    static Unitary identity(std::size_t m) {
      Unitary u(m);
      for (std::size_t i=0;i<m;i++) u(i,i) = {1.0, 0.0};
      return u;
    }
  };
}
