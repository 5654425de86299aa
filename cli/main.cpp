// SPDX-License-Identifier: MIT

#include "photonic/components.hpp"
#include "photonic/config.hpp"
#include "photonic/fock.hpp"
#include "photonic/simulator.hpp"
#include "photonic/unitary.hpp"
#include <cmath>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <map>
#include <numbers>
#include <optional>
#include <string>
#include <vector>

using namespace psx;

#ifndef PSX_VERSION
#define PSX_VERSION "unknown"
#endif

static void usage() {
  std::cout << "photon-simx [--version] <command> [options]\n"
               "  hom                        two-photon interference on a 50/50 beamsplitter\n"
               "  oracle [--renormalize] [--all-inputs] [--threads T] [--max-photons N]\n"
               "         [--config file] [--out file.json] [--csv file.csv]\n"
               "  amplitude --scenario hom|oracle --input n0,n1,... --output n0,n1,...\n"
               "  unitary --scenario hom|oracle [--out unitary.csv]\n"
               "  selftest\n";
}

static std::optional<FockState> parse_fock(const std::string& s, std::string& err){
  FockState st;
  std::size_t p = 0;
  while (p <= s.size()){
    auto q = s.find(',', p);
    auto tok = s.substr(p, q == std::string::npos ? std::string::npos : q - p);
    try {
      std::size_t pos = 0;
      int v = std::stoi(tok, &pos);
      if (pos != tok.size() || v < 0) { err = "Invalid occupation '" + tok + "'"; return std::nullopt; }
      st.push_back(v);
    } catch (const std::exception&) { err = "Invalid occupation '" + tok + "'"; return std::nullopt; }
    if (q == std::string::npos) break;
    p = q + 1;
  }
  return st;
}

static Circuit hom_circuit(){
  Circuit c(2);
  c.beamsplitter(0.5, std::numbers::pi/2, 0, 1);
  return c;
}

static std::optional<Circuit> scenario_circuit(const std::string& name){
  if (name == "hom") return hom_circuit();
  if (name == "oracle") return make_oracle_scenario().circuit;
  return std::nullopt;
}

static void print_amp(std::ostream& os, const c64& a){
  os << "[" << a.real() << ", " << a.imag() << "]";
}

int main(int argc, char** argv) {
  if (argc < 2) { usage(); return 1; }
  std::string cmd = argv[1];
  if (cmd == "--version") { std::cout << PSX_VERSION << "\n"; return 0; }
  if (cmd == "--help" || cmd == "-h") { usage(); return 0; }

  try {
    if (cmd == "hom") {
      Simulator sim(hom_circuit());
      const FockState in{1,1};
      std::cout << "{\n  \"input\": \"" << to_string(in) << "\",\n  \"outputs\": {\n";
      auto outs = enumerate_fock_states(2, 2);
      for (std::size_t k=0;k<outs.size();++k){
        auto a = sim.amplitude(in, outs[k]);
        std::cout << "    \"" << to_string(outs[k]) << "\": { \"amplitude\": "; print_amp(std::cout, a);
        std::cout << ", \"probability\": " << std::norm(a) << " }" << (k+1<outs.size() ? "," : "") << "\n";
      }
      std::cout << "  }\n}\n";
      return 0;
    }

    if (cmd == "oracle") {
      EngineOptions opts;
      bool renormalize = false, all_inputs = false;
      std::string outp, csvp, cfg;
      std::map<std::string,std::string> overrides;
      for (int i=2;i<argc;i++){
        std::string a = argv[i];
        auto nx = [&](const char* n){ if (i+1>=argc) { std::cerr << "Missing value for " << n << "\n"; std::exit(2); } return std::string(argv[++i]); };
        if (a == "--renormalize") renormalize = true;
        else if (a == "--all-inputs") all_inputs = true;
        else if (a == "--threads") overrides["threads"] = nx("--threads");
        else if (a == "--max-photons") overrides["max_photons"] = nx("--max-photons");
        else if (a == "--config") cfg = nx("--config");
        else if (a == "--out") outp = nx("--out");
        else if (a == "--csv") csvp = nx("--csv");
        else if (a == "--help" || a == "-h") { usage(); return 0; }
        else { std::cerr << "Unknown arg: " << a << "\n"; return 2; }
      }
      std::string err;
      if (!cfg.empty()){
        std::map<std::string,std::string> extra;
        if (!load_options_kv(cfg, opts, extra, err)) { std::cerr << err << "\n"; return 11; }
        if (extra.count("renormalize")) renormalize = (extra["renormalize"] == "true" || extra["renormalize"] == "1");
        if (extra.count("out") && outp.empty()) outp = extra["out"];
      }
      // command line wins over the config file
      for (const auto& [k, v] : overrides)
        if (!apply_option(opts, k, v, err)) { std::cerr << err << "\n"; return 2; }

      auto sc = make_oracle_scenario();
      Simulator sim(sc.circuit, opts);
      LabelMap inputs = all_inputs ? sc.encoding.label_map()
                                   : LabelMap{{bits_to_string(*sc.encoding.decode(sc.input)), sc.input}};
      auto table = sim.distribution(inputs, sc.encoding.label_map(),
                                    renormalize ? Normalization::Renormalized : Normalization::Raw);
      std::cerr << "evaluated " << table.rows()*table.cols() << " amplitudes on "
                << opts.threads << " thread(s) in " << table.seconds << " s\n";
      if (!csvp.empty() && !table.export_csv(csvp)) { std::cerr << "Cannot write " << csvp << "\n"; return 4; }
      if (outp.empty()) { table.write_json(std::cout); return 0; }
      std::ofstream of(outp);
      if (!of) { std::cerr << "Cannot open out file " << outp << "\n"; return 4; }
      table.write_json(of);
      return of ? 0 : 4;
    }

    if (cmd == "amplitude") {
      std::string scenario = "oracle", ins, outs;
      for (int i=2;i<argc;i++){
        std::string a = argv[i];
        auto nx = [&](const char* n){ if (i+1>=argc) { std::cerr << "Missing value for " << n << "\n"; std::exit(2); } return std::string(argv[++i]); };
        if (a == "--scenario") scenario = nx("--scenario");
        else if (a == "--input") ins = nx("--input");
        else if (a == "--output") outs = nx("--output");
        else { std::cerr << "Unknown arg: " << a << "\n"; return 2; }
      }
      if (ins.empty() || outs.empty()) { std::cerr << "Missing --input or --output\n"; return 2; }
      auto c = scenario_circuit(scenario);
      if (!c) { std::cerr << "Unknown scenario '" << scenario << "'\n"; return 2; }
      std::string err;
      auto in = parse_fock(ins, err);
      auto out = in ? parse_fock(outs, err) : std::nullopt;
      if (!in || !out) { std::cerr << err << "\n"; return 3; }
      auto a = amplitude(*c, *in, *out);
      std::cout << "{ \"amplitude\": "; print_amp(std::cout, a);
      std::cout << ", \"probability\": " << std::norm(a) << " }\n";
      return 0;
    }

    if (cmd == "unitary") {
      std::string scenario = "oracle", outp = "unitary.csv";
      for (int i=2;i<argc;i++){
        std::string a = argv[i];
        auto nx = [&](const char* n){ if (i+1>=argc) { std::cerr << "Missing value for " << n << "\n"; std::exit(2); } return std::string(argv[++i]); };
        if (a == "--scenario") scenario = nx("--scenario");
        else if (a == "--out") outp = nx("--out");
        else { std::cerr << "Unknown arg: " << a << "\n"; return 2; }
      }
      auto c = scenario_circuit(scenario);
      if (!c) { std::cerr << "Unknown scenario '" << scenario << "'\n"; return 2; }
      auto U = compose(*c);
      if (!export_unitary_csv(U, outp)) { std::cerr << "Cannot write " << outp << "\n"; return 4; }
      std::cout << "{\n  \"modes\": " << U.modes << ",\n  \"gates\": [";
      for (std::size_t k=0;k<c->size();++k)
        std::cout << (k ? ", " : "") << "\"" << describe(c->placements()[k]) << "\"";
      std::cout << "],\n  \"unitarity_error\": " << unitarity_error(U) << "\n}\n";
      return 0;
    }

    if (cmd == "selftest") {
      int fails = 0;
      auto expect = [&](bool ok, const std::string& what){ if (!ok) { std::cerr << "FAIL: " << what << "\n"; ++fails; } };
      Simulator hom(hom_circuit());
      expect(std::abs(hom.amplitude({1,1},{1,1})) < 1e-12, "HOM coincidence suppressed");
      expect(std::fabs(hom.probability({1,1},{2,0}) - 0.5) < 1e-12, "HOM bunching probability");
      auto sc = make_oracle_scenario();
      Simulator sim(sc.circuit);
      expect(unitarity_error(sim.unitary()) < 1e-9, "oracle unitary");
      auto a = sim.amplitude(sc.input, sc.encoding.encode({1,1,1,0}));
      expect(std::fabs(std::abs(a) - 1.0/18.0) < 1e-12, "oracle amplitude 1/18");
      std::cout << (fails == 0 ? "OK\n" : "FAILED\n");
      return fails == 0 ? 0 : 1;
    }
  } catch (const Error& e) {
    std::cerr << e.what() << "\n";
    return 5;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 5;
  }

  std::cerr << "Unknown command '" << cmd << "'\n";
  usage();
  return 2;
}
