// SPDX-License-Identifier: MIT

#include "photonic/components.hpp"
#include "photonic/distribution.hpp"
#include "photonic/error.hpp"
#include "photonic/fock.hpp"
#include "photonic/simulator.hpp"
#include "photonic/unitary.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <numbers>
#include <sstream>
#include <stdexcept>

using namespace psx;

static int fails=0;
#define CHECK(cond) do{ if (!(cond)) { std::cerr << "CHECK failed at " << __LINE__ << ": " #cond "\n"; ++fails; } }while(0)
#define CHECK_NEAR(a,b,e) do{ if (std::abs((a)-(b))>(e)) { std::cerr << "Mismatch at " << __LINE__ << ": " << (a) << " vs " << (b) << "\n"; ++fails; } }while(0)

template <class F>
static bool throws_code(ErrorCode code, F&& f){
  try { f(); } catch (const Error& e) { return e.code() == code; }
  return false;
}

static LabelMap fock_labels(std::size_t modes, int photons){
  LabelMap m;
  for (const auto& s : enumerate_fock_states(modes, photons)) m.emplace_back(to_string(s), s);
  return m;
}

int main(){
  // HOM on the full two-photon space: rows follow the caller's label order.
  {
    Circuit c(2);
    c.beamsplitter(0.5, std::numbers::pi/2, 0, 1);
    auto U = compose(c);
    LabelMap in = {{"11", {1,1}}};
    LabelMap out = {{"02", {0,2}}, {"11", {1,1}}, {"20", {2,0}}};
    auto t = analyse(U, in, out, Normalization::Raw);
    CHECK(t.rows() == 1 && t.cols() == 3);
    CHECK(t.outputs[0] == "02" && t.outputs[2] == "20");
    CHECK_NEAR(t(0,0), 0.5, 1e-14);
    CHECK_NEAR(t(0,1), 0.0, 1e-14);
    CHECK_NEAR(t.at("11", "20"), 0.5, 1e-14);
    CHECK_NEAR(t.row_sum(0), 1.0, 1e-14);
    CHECK_NEAR(t.amplitude_at("11", "02"), c64(0.0, 1.0/std::sqrt(2.0)), 1e-14);
    bool oor = false;
    try { (void)t.at("11", "00"); } catch (const std::out_of_range&) { oor = true; }
    CHECK(oor);
  }

  // Raw rows over a subset need not sum to 1; renormalized rows do.
  {
    auto U = compose(random_circuit(4, 40, 77));
    LabelMap in = {{"a", {1,1,0,0}}, {"b", {0,0,1,1}}, {"c", {1,0,1,0}}};
    LabelMap out = {{"x", {0,1,0,1}}, {"y", {1,0,0,1}}, {"z", {0,0,2,0}}};
    auto raw = analyse(U, in, out, Normalization::Raw);
    auto ren = analyse(U, in, out, Normalization::Renormalized);
    CHECK(ren.mode == Normalization::Renormalized);
    for (std::size_t i=0;i<3;++i){
      CHECK(raw.row_sum(i) < 1.0);
      CHECK_NEAR(ren.row_sum(i), 1.0, 1e-12);
      for (std::size_t j=0;j<3;++j){
        CHECK_NEAR(ren(i,j), raw(i,j) / raw.row_sum(i), 1e-12);
        CHECK(ren.amplitudes[i*3+j] == raw.amplitudes[i*3+j]);
      }
    }
  }

  // Worker count changes neither the order nor the values.
  {
    auto c = random_circuit(5, 60, 99);
    auto U = compose(c);
    auto labels = fock_labels(5, 2);
    EngineOptions one, many;
    many.threads = 4;
    auto t1 = analyse(U, labels, labels, Normalization::Raw, one);
    auto t4 = analyse(U, labels, labels, Normalization::Raw, many);
    CHECK(t1.inputs == t4.inputs && t1.outputs == t4.outputs);
    CHECK(t1.probabilities == t4.probabilities);
    for (std::size_t i=0;i<t1.rows();++i) CHECK_NEAR(t1.row_sum(i), 1.0, 1e-9);
    // the cached simulator path gives the same table
    Simulator sim(c, many);
    auto ts = sim.distribution(labels, labels, Normalization::Raw);
    CHECK(ts.probabilities == t1.probabilities);
    CHECK(sim.amplitude_cache().size() == labels.size() * labels.size());
    auto tf = distribution(c, labels, labels, Normalization::Raw, many);
    CHECK(tf.probabilities == t1.probabilities);
  }

  // An input with no support on the listed outputs cannot be renormalized.
  {
    Circuit c(3);
    c.beamsplitter(0.5, 0.0, 0, 1);
    auto U = compose(c);
    LabelMap in = {{"p", {1,0,0}}, {"q", {0,0,1}}};
    LabelMap out = {{"u", {1,0,0}}, {"v", {0,1,0}}};
    auto raw = analyse(U, in, out, Normalization::Raw);
    CHECK(raw.row_sum(1) == 0.0);
    CHECK(throws_code(ErrorCode::EmptySupport, [&]{ analyse(U, in, out, Normalization::Renormalized); }));
    // photon-number mismatch on every output gives the same failure
    LabelMap two = {{"pp", {1,1,0}}};
    CHECK(throws_code(ErrorCode::EmptySupport, [&]{ analyse(U, two, out, Normalization::Renormalized); }));
  }

  // Label maps must be injective and match the circuit width.
  {
    auto U = compose(random_circuit(3, 10, 4));
    LabelMap ok = {{"a", {1,0,0}}, {"b", {0,1,0}}};
    LabelMap dup_label = {{"a", {1,0,0}}, {"a", {0,1,0}}};
    LabelMap dup_state = {{"a", {1,0,0}}, {"b", {1,0,0}}};
    LabelMap wide = {{"a", {1,0,0,0}}};
    CHECK(throws_code(ErrorCode::InvalidParameter, [&]{ analyse(U, dup_label, ok, Normalization::Raw); }));
    CHECK(throws_code(ErrorCode::InvalidParameter, [&]{ analyse(U, ok, dup_state, Normalization::Raw); }));
    CHECK(throws_code(ErrorCode::DimensionMismatch, [&]{ analyse(U, wide, ok, Normalization::Raw); }));
  }

  // A failing amplitude stops the analysis and reaches the caller.
  {
    LabelMap in = {{"a", {1,0}}, {"b", {0,1}}};
    AmplitudeFn failing = [](const FockState& i, const FockState& o) -> c64 {
      if (i[1] == 1 && o[1] == 1) throw Error(ErrorCode::PhotonBudgetExceeded, "too many");
      return {0.5, 0.0};
    };
    CHECK(throws_code(ErrorCode::PhotonBudgetExceeded, [&]{ analyse_with(failing, 2, in, in, Normalization::Raw, 3); }));
    CancelToken tok;
    tok.cancel();
    auto U = compose(random_circuit(4, 20, 8));
    EngineOptions opts; opts.threads = 2;
    auto labels = fock_labels(4, 3);
    CHECK(throws_code(ErrorCode::Cancelled, [&]{ analyse(U, labels, labels, Normalization::Raw, opts, &tok); }));
  }

  // JSON and CSV carry the labels in table order.
  {
    LabelMap in = {{"10", {1,0}}, {"01", {0,1}}};
    AmplitudeFn amp = [](const FockState& i, const FockState& o) -> c64 {
      return i == o ? c64(0.6, 0.0) : c64(0.0, 0.8);
    };
    auto t = analyse_with(amp, 2, in, in, Normalization::Raw, 1);
    CHECK_NEAR(t.at("10", "01"), 0.64, 1e-15);
    std::ostringstream os;
    t.write_json(os);
    auto js = os.str();
    CHECK(js.find("\"mode\": \"raw\"") != std::string::npos);
    CHECK(js.find("\"inputs\": [\"10\", \"01\"]") != std::string::npos);
    CHECK(js.find("\"probabilities\"") != std::string::npos);

    const std::string path = "test_distribution_table.csv";
    CHECK(t.export_csv(path));
    std::ifstream f(path);
    std::string header, row;
    std::getline(f, header);
    std::getline(f, row);
    CHECK(header == "input,10,01");
    CHECK(row.rfind("10,", 0) == 0);
    f.close();
    std::remove(path.c_str());
  }

  if (fails==0) std::cout << "OK\n";
  return fails==0?0:1;
}
