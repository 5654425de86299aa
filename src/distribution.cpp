// SPDX-License-Identifier: MIT

#include "photonic/distribution.hpp"
#include "photonic/error.hpp"
#include "photonic/fock.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <fstream>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

namespace psx {

void check_label_map(const LabelMap& labels, std::size_t modes){
  std::set<std::string> seen_labels;
  std::set<FockState> seen_states;
  for (const auto& [label, state] : labels){
    check_fock_state(state, modes);
    if (!seen_labels.insert(label).second)
      throw Error(ErrorCode::InvalidParameter, "label '" + label + "' listed twice");
    if (!seen_states.insert(state).second)
      throw Error(ErrorCode::InvalidParameter, "state " + to_string(state) + " mapped by two labels");
  }
}

static std::size_t index_of(const std::vector<std::string>& v, const std::string& label){
  auto it = std::find(v.begin(), v.end(), label);
  if (it == v.end()) throw std::out_of_range("unknown label '" + label + "'");
  return std::size_t(it - v.begin());
}

double DistributionTable::row_sum(std::size_t row) const {
  double s = 0.0;
  for (std::size_t j=0;j<cols();++j) s += (*this)(row, j);
  return s;
}

double DistributionTable::at(const std::string& input, const std::string& output) const {
  return (*this)(index_of(inputs, input), index_of(outputs, output));
}

c64 DistributionTable::amplitude_at(const std::string& input, const std::string& output) const {
  return amplitudes[index_of(inputs, input)*cols() + index_of(outputs, output)];
}

void DistributionTable::write_json(std::ostream& os) const {
  auto quoted = [](const std::string& s){ return "\"" + s + "\""; };
  os << "{\n  \"mode\": \"" << (mode == Normalization::Raw ? "raw" : "renormalized") << "\",\n";
  os << "  \"timings\": { \"seconds\": " << seconds << " },\n";
  os << "  \"inputs\": [";
  for (std::size_t i=0;i<inputs.size();++i){ os << quoted(inputs[i]); if (i+1<inputs.size()) os << ", "; }
  os << "],\n  \"outputs\": [";
  for (std::size_t j=0;j<outputs.size();++j){ os << quoted(outputs[j]); if (j+1<outputs.size()) os << ", "; }
  os << "],\n  \"probabilities\": [\n";
  for (std::size_t i=0;i<rows();++i){
    os << "    [";
    for (std::size_t j=0;j<cols();++j){ os << (*this)(i,j); if (j+1<cols()) os << ", "; }
    os << "]" << (i+1<rows() ? "," : "") << "\n";
  }
  os << "  ],\n  \"amplitudes\": [\n";
  for (std::size_t i=0;i<rows();++i){
    os << "    [";
    for (std::size_t j=0;j<cols();++j){
      auto a = amplitudes[i*cols()+j];
      os << "[" << a.real() << ", " << a.imag() << "]";
      if (j+1<cols()) os << ", ";
    }
    os << "]" << (i+1<rows() ? "," : "") << "\n";
  }
  os << "  ]\n}\n";
}

bool DistributionTable::export_csv(const std::string& path) const {
  std::ofstream out(path);
  if (!out) return false;
  out << "input";
  for (const auto& o : outputs) out << "," << o;
  out << "\n";
  for (std::size_t i=0;i<rows();++i){
    out << inputs[i];
    for (std::size_t j=0;j<cols();++j) out << "," << (*this)(i,j);
    out << "\n";
  }
  return bool(out);
}

DistributionTable analyse_with(const AmplitudeFn& amp, std::size_t modes,
                               const LabelMap& inputs, const LabelMap& outputs,
                               Normalization mode, unsigned threads){
  check_label_map(inputs, modes);
  check_label_map(outputs, modes);

  DistributionTable t;
  t.mode = mode;
  for (const auto& in : inputs) t.inputs.push_back(in.first);
  for (const auto& out : outputs) t.outputs.push_back(out.first);
  const std::size_t cols = outputs.size();
  const std::size_t cells = inputs.size() * cols;
  t.amplitudes.assign(cells, c64{0.0, 0.0});
  t.probabilities.assign(cells, 0.0);

  std::exception_ptr first_error;
  std::mutex mtx;
  std::atomic<bool> failed{false};

  if (threads < 1) threads = 1;
  threads = unsigned(std::min<std::size_t>(threads, std::max<std::size_t>(cells, 1)));
  auto worker = [&](unsigned w){
    std::size_t start = (cells * w) / threads;
    std::size_t end   = (cells * (w+1)) / threads;
    for (std::size_t k=start; k<end && !failed.load(std::memory_order_relaxed); ++k){
      try {
        c64 a = amp(inputs[k / cols].second, outputs[k % cols].second);
        t.amplitudes[k] = a;
        t.probabilities[k] = probability(a);
      } catch (...) {
        std::lock_guard<std::mutex> lk(mtx);
        if (!first_error) first_error = std::current_exception();
        failed.store(true, std::memory_order_relaxed);
      }
    }
  };

  auto t0 = std::chrono::steady_clock::now();
  if (threads == 1) worker(0);
  else {
    std::vector<std::thread> pool; pool.reserve(threads);
    for (unsigned w=0; w<threads; ++w) pool.emplace_back(worker, w);
    for (auto& th : pool) th.join();
  }
  if (first_error) std::rethrow_exception(first_error);

  if (mode == Normalization::Renormalized){
    for (std::size_t i=0;i<t.rows();++i){
      double s = t.row_sum(i);
      if (s == 0.0)
        throw Error(ErrorCode::EmptySupport, "input '" + t.inputs[i] + "' has zero probability on every listed output");
      for (std::size_t j=0;j<cols;++j) t.probabilities[i*cols + j] /= s;
    }
  }
  auto t1 = std::chrono::steady_clock::now();
  t.seconds = std::chrono::duration<double>(t1 - t0).count();
  return t;
}

DistributionTable analyse(const Unitary& U, const LabelMap& inputs, const LabelMap& outputs,
                          Normalization mode, const EngineOptions& opts, const CancelToken* cancel){
  AmplitudeFn amp = [&](const FockState& in, const FockState& out){
    return amplitude(U, in, out, opts, cancel);
  };
  return analyse_with(amp, U.modes, inputs, outputs, mode, opts.threads);
}

} // namespace psx
