// SPDX-License-Identifier: MIT

#pragma once
#include <stdexcept>
#include <string>

namespace psx {

enum class ErrorCode {
  InvalidParameter,       // malformed gate parameter or state entry
  InvalidModeAssignment,  // out-of-range, duplicate or arity-mismatched wiring
  DimensionMismatch,      // Fock state length differs from the mode count
  EmptySupport,           // renormalising a row whose probabilities are all zero
  PhotonBudgetExceeded,   // photon count above the configured permanent budget
  Cancelled               // cancellation requested during a permanent
};

inline const char* to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::InvalidParameter: return "InvalidParameter";
    case ErrorCode::InvalidModeAssignment: return "InvalidModeAssignment";
    case ErrorCode::DimensionMismatch: return "DimensionMismatch";
    case ErrorCode::EmptySupport: return "EmptySupport";
    case ErrorCode::PhotonBudgetExceeded: return "PhotonBudgetExceeded";
    case ErrorCode::Cancelled: return "Cancelled";
  }
  return "Unknown";
}

class Error : public std::runtime_error {
  ErrorCode code_;
public:
  Error(ErrorCode code, const std::string& what)
    : std::runtime_error(std::string(to_string(code)) + ": " + what), code_(code) {}
  ErrorCode code() const { return code_; }
};

} // namespace psx
