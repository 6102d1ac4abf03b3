#pragma once
#include <stdexcept>
#include <string>
#include <vector>

#include "types.hpp"

enum class ErrorCode {
  OversizedInput,
  MalformedInput,
  ModelIntegrityViolation,
  PromptInjectionAttempt,  // non-fatal, logged
  BudgetExceeded,          // tier-scoped, non-fatal
  BackendTimeout,
  BackendFailure,
  AllBackendsFailed,
  Cancelled
};

std::string to_string(ErrorCode c);

// Terminal failure of one analysis; the only error the facade reports.
class AnalysisError : public std::runtime_error {
public:
  AnalysisError(ErrorCode code, const std::string& what,
                std::vector<AttemptRecord> provenance = {})
      : std::runtime_error(what), code_(code), provenance_(std::move(provenance)) {}

  ErrorCode code() const { return code_; }
  const std::vector<AttemptRecord>& provenance() const { return provenance_; }

private:
  ErrorCode code_;
  std::vector<AttemptRecord> provenance_;
};

// Raised by a backend for transport/protocol failures; absorbed by the coordinator.
class BackendError : public std::runtime_error {
public:
  explicit BackendError(const std::string& what) : std::runtime_error(what) {}
};

inline bool is_security_rejection(ErrorCode c) {
  return c == ErrorCode::OversizedInput || c == ErrorCode::MalformedInput ||
         c == ErrorCode::ModelIntegrityViolation;
}
