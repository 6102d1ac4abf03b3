#include "errors.hpp"

std::string to_string(ErrorCode c) {
  switch (c) {
    case ErrorCode::OversizedInput: return "OversizedInput";
    case ErrorCode::MalformedInput: return "MalformedInput";
    case ErrorCode::ModelIntegrityViolation: return "ModelIntegrityViolation";
    case ErrorCode::PromptInjectionAttempt: return "PromptInjectionAttempt";
    case ErrorCode::BudgetExceeded: return "BudgetExceeded";
    case ErrorCode::BackendTimeout: return "BackendTimeout";
    case ErrorCode::BackendFailure: return "BackendFailure";
    case ErrorCode::AllBackendsFailed: return "AllBackendsFailed";
    case ErrorCode::Cancelled: return "Cancelled";
  }
  return "BackendFailure";
}
