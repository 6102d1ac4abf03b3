#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include <opencv2/core.hpp>

#include "errors.hpp"
#include "events.hpp"
#include "image.hpp"
#include "types.hpp"

struct SecurityConfig {
  size_t max_image_bytes = 50ULL * 1024 * 1024;  // 50MB
  int64_t max_pixels = 40'000'000;               // decompression-bomb guard
  size_t max_note_length = 500;
  // model artifact path -> pinned SHA-256 (lowercase hex)
  std::unordered_map<std::string, std::string> trusted_models;
  std::vector<std::string> injection_phrases = {
      "ignore previous instructions", "ignore all previous", "disregard the above",
      "system prompt", "you are now", "### instruction", "new instructions"};
};

struct ValidationVerdict {
  bool ok{false};
  std::optional<ErrorCode> rejection;
  std::string detail;
  ImageEncoding encoding{ImageEncoding::Unknown};
  cv::Mat image;  // decoded BGR, shared with backends read-only
  std::string sanitized_note;
  bool injection_detected{false};
};

enum class ModelTrust { Trusted, Missing, Violation };

class SecurityValidator {
public:
  explicit SecurityValidator(SecurityConfig cfg, std::shared_ptr<EventSink> events = nullptr);

  // Synchronous input gate; never throws for bad input, reports via the verdict.
  ValidationVerdict validate(const AnalysisRequest& request) const;

  // Checks the artifact digest once per process lifetime. A mismatch disables the
  // tier permanently and throws AnalysisError(ModelIntegrityViolation).
  ModelTrust ensure_model_trusted(const BackendDescriptor& d, const std::string& model_path);

  bool is_tier_disabled(Tier t) const;
  std::set<Tier> disabled_tiers() const;

  std::string sanitize_prompt_text(const std::string& text, bool* injection_detected) const;

  const SecurityConfig& config() const { return cfg_; }

private:
  ValidationVerdict reject(const AnalysisRequest& r, ErrorCode code, std::string detail) const;
  void emit_verdict(const AnalysisRequest& r, const ValidationVerdict& v) const;

  SecurityConfig cfg_;
  std::shared_ptr<EventSink> events_;

  mutable std::mutex mu_;
  std::set<std::string> verified_models_;
  std::set<Tier> disabled_tiers_;
};
