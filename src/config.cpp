// SPDX-License-Identifier: MIT

#include "photonic/config.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>

namespace psx {

static std::string trim(const std::string& s){
  auto notspace = [](unsigned char ch){ return !std::isspace(ch); };
  auto l = std::find_if(s.begin(), s.end(), notspace);
  auto r = std::find_if(s.rbegin(), s.rend(), notspace).base();
  return l < r ? std::string(l, r) : std::string();
}

static bool parse_size_t(const std::string& s, std::size_t& out) {
  if (s.empty() || s[0] == '-') return false;
  try {
    std::size_t pos=0;
    unsigned long long v = std::stoull(s, &pos, 10);
    if (pos != s.size()) return false;
    out = static_cast<std::size_t>(v);
    return true;
  } catch(const std::exception&) { return false; }
}

bool apply_option(EngineOptions& opts, const std::string& key, const std::string& value, std::string& err){
  std::size_t v = 0;
  if (key == "max_photons"){
    if (!parse_size_t(value, v)) { err = "Invalid max_photons: " + value; return false; }
    opts.max_photons = v;
  } else if (key == "threads"){
    if (!parse_size_t(value, v) || v == 0) { err = "Invalid threads: " + value; return false; }
    opts.threads = static_cast<unsigned>(v);
  } else if (key == "cache_amplitudes"){
    if (value == "true" || value == "1") opts.cache_amplitudes = true;
    else if (value == "false" || value == "0") opts.cache_amplitudes = false;
    else { err = "Invalid cache_amplitudes: " + value; return false; }
  } else {
    err = "Unknown option '" + key + "'";
    return false;
  }
  return true;
}

bool load_options_kv(const std::string& path, EngineOptions& opts,
                     std::map<std::string,std::string>& extra, std::string& err){
  std::ifstream in(path);
  if (!in) { err = "Cannot open config file: " + path; return false; }
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)){
    ++lineno;
    line = trim(line);
    if (line.empty() || line[0] == '#') continue;
    auto p = line.find('=');
    if (p == std::string::npos) { err = "Expected key=value at line " + std::to_string(lineno); return false; }
    std::string key = trim(line.substr(0, p));
    std::string value = trim(line.substr(p+1));
    if (key == "max_photons" || key == "threads" || key == "cache_amplitudes"){
      if (!apply_option(opts, key, value, err)) { err += " at line " + std::to_string(lineno); return false; }
    } else {
      extra[key] = value;
    }
  }
  return true;
}

} // namespace psx
