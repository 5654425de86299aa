// SPDX-License-Identifier: MIT

#pragma once
#include "amplitude.hpp"
#include "config.hpp"
#include "types.hpp"
#include <functional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace psx {

// Ordered (label, state) pairs; labels and states must both be unique.
using LabelMap = std::vector<std::pair<std::string, FockState>>;

enum class Normalization {
  Raw,          // |amplitude|^2 as computed; rows need not sum to 1
  Renormalized  // each input row divided by its sum over the listed outputs
};

struct DistributionTable {
  std::vector<std::string> inputs;
  std::vector<std::string> outputs;
  std::vector<double> probabilities; // row-major, inputs x outputs
  vec_c64 amplitudes;                // same layout, before normalisation
  Normalization mode = Normalization::Raw;
  double seconds = 0.0;

  std::size_t rows() const { return inputs.size(); }
  std::size_t cols() const { return outputs.size(); }
  double operator()(std::size_t row, std::size_t col) const { return probabilities[row*cols() + col]; }
  double row_sum(std::size_t row) const;

  // Throws std::out_of_range for an unknown label.
  double at(const std::string& input, const std::string& output) const;
  c64 amplitude_at(const std::string& input, const std::string& output) const;

  void write_json(std::ostream& os) const;
  bool export_csv(const std::string& path) const;
};

using AmplitudeFn = std::function<c64(const FockState&, const FockState&)>;

// Throws DimensionMismatch for a state of the wrong length and InvalidParameter
// for repeated labels or states.
void check_label_map(const LabelMap& labels, std::size_t modes);

// Evaluates every (input, output) pair with `amp` on `threads` workers. Cells
// are filled by index, so the table follows the label order regardless of
// which worker finishes first. The first worker exception is rethrown after
// all workers stop. Renormalized mode throws EmptySupport for a row whose raw
// sum is exactly zero.
DistributionTable analyse_with(const AmplitudeFn& amp, std::size_t modes,
                               const LabelMap& inputs, const LabelMap& outputs,
                               Normalization mode, unsigned threads);

DistributionTable analyse(const Unitary& U, const LabelMap& inputs, const LabelMap& outputs,
                          Normalization mode, const EngineOptions& opts = {},
                          const CancelToken* cancel = nullptr);

} // namespace psx
