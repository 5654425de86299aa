// SPDX-License-Identifier: MIT

#include "photonic/config.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>

using namespace psx;

static int fails=0;
#define CHECK(cond) do{ if (!(cond)) { std::cerr << "CHECK failed at " << __LINE__ << ": " #cond "\n"; ++fails; } }while(0)

static std::string write_file(const std::string& name, const std::string& text){
  std::ofstream f(name);
  f << text;
  return name;
}

int main(){
  EngineOptions d;
  CHECK(d.max_photons == 24 && d.threads == 1 && d.cache_amplitudes);

  {
    EngineOptions o;
    std::string err;
    CHECK(apply_option(o, "threads", "8", err) && o.threads == 8);
    CHECK(apply_option(o, "max_photons", "30", err) && o.max_photons == 30);
    CHECK(apply_option(o, "cache_amplitudes", "false", err) && !o.cache_amplitudes);
    CHECK(apply_option(o, "cache_amplitudes", "1", err) && o.cache_amplitudes);
    CHECK(!apply_option(o, "threads", "0", err));
    CHECK(!apply_option(o, "threads", "-2", err));
    CHECK(!apply_option(o, "max_photons", "12x", err));
    CHECK(!apply_option(o, "cache_amplitudes", "maybe", err));
    CHECK(!apply_option(o, "colour", "blue", err) && err.find("colour") != std::string::npos);
    CHECK(o.threads == 8 && o.max_photons == 30);
  }

  {
    auto path = write_file("test_config_ok.cfg",
      "# engine\n"
      "threads = 3\n"
      "\n"
      "  max_photons=10  \n"
      "cache_amplitudes=false\n"
      "out = result.json\n"
      "mode=renormalized\n");
    EngineOptions o;
    std::map<std::string,std::string> extra;
    std::string err;
    CHECK(load_options_kv(path, o, extra, err));
    CHECK(o.threads == 3 && o.max_photons == 10 && !o.cache_amplitudes);
    CHECK(extra.size() == 2);
    CHECK(extra["out"] == "result.json");
    CHECK(extra["mode"] == "renormalized");
    std::remove(path.c_str());
  }

  {
    auto path = write_file("test_config_bad.cfg", "threads=2\nmax_photons\n");
    EngineOptions o;
    std::map<std::string,std::string> extra;
    std::string err;
    CHECK(!load_options_kv(path, o, extra, err));
    CHECK(err.find("line 2") != std::string::npos);
    std::remove(path.c_str());

    path = write_file("test_config_bad.cfg", "threads=none\n");
    CHECK(!load_options_kv(path, o, extra, err));
    CHECK(err.find("line 1") != std::string::npos);
    std::remove(path.c_str());

    CHECK(!load_options_kv("does_not_exist.cfg", o, extra, err));
  }

  if (fails==0) std::cout << "OK\n";
  return fails==0?0:1;
}
