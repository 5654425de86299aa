// SPDX-License-Identifier: MIT

#pragma once
#include <cstddef>
#include <map>
#include <string>

namespace psx {

struct EngineOptions {
  std::size_t max_photons = 24;  // larger queries fail with PhotonBudgetExceeded
  unsigned threads = 1;          // distribution workers
  bool cache_amplitudes = true;  // Simulator keeps (input, output) results
};

// Sets one option from its textual form. Known keys: max_photons, threads,
// cache_amplitudes (true/false/1/0).
bool apply_option(EngineOptions& opts, const std::string& key, const std::string& value, std::string& err);

// key=value file, '#' starts a comment line. Unknown keys are kept in `extra`
// for the caller (the CLI reads its own keys from there).
bool load_options_kv(const std::string& path, EngineOptions& opts,
                     std::map<std::string,std::string>& extra, std::string& err);

} // namespace psx
