#include "security_validator.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace {

std::string lowercase(const std::string& s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

// Drops a trailing partial UTF-8 sequence left by byte truncation.
void trim_utf8_tail(std::string& s) {
  size_t i = s.size();
  size_t cont = 0;
  while (i > 0 && (static_cast<unsigned char>(s[i - 1]) & 0xC0) == 0x80) {
    --i;
    ++cont;
  }
  if (i == 0) return;
  const auto lead = static_cast<unsigned char>(s[i - 1]);
  size_t need = 0;
  if ((lead & 0xE0) == 0xC0) need = 1;
  else if ((lead & 0xF0) == 0xE0) need = 2;
  else if ((lead & 0xF8) == 0xF0) need = 3;
  if (lead >= 0x80 && cont < need) s.resize(i - 1);
}

}  // namespace

SecurityValidator::SecurityValidator(SecurityConfig cfg, std::shared_ptr<EventSink> events)
    : cfg_(std::move(cfg)), events_(std::move(events)) {
  for (auto& kv : cfg_.trusted_models) kv.second = lowercase(kv.second);
  for (auto& p : cfg_.injection_phrases) p = lowercase(p);
}

ValidationVerdict SecurityValidator::reject(const AnalysisRequest& r, ErrorCode code,
                                            std::string detail) const {
  ValidationVerdict v;
  v.ok = false;
  v.rejection = code;
  v.detail = std::move(detail);
  spdlog::warn("Request {} rejected: {} ({})", r.id, to_string(code), v.detail);
  emit_verdict(r, v);
  return v;
}

void SecurityValidator::emit_verdict(const AnalysisRequest& r, const ValidationVerdict& v) const {
  if (!events_) return;
  nlohmann::json data{{"ok", v.ok}, {"encoding", to_string(v.encoding)}};
  if (v.rejection) data["rejection"] = to_string(*v.rejection);
  if (!v.detail.empty()) data["detail"] = v.detail;
  if (v.injection_detected) data["prompt_injection"] = true;
  events_->emit(make_event(EventKind::SecurityVerdict, r.id, std::move(data)));
}

ValidationVerdict SecurityValidator::validate(const AnalysisRequest& r) const {
  if (!r.bytes || r.bytes->empty()) {
    return reject(r, ErrorCode::MalformedInput, "empty image payload");
  }
  const auto& bytes = *r.bytes;
  if (bytes.size() > cfg_.max_image_bytes) {
    return reject(r, ErrorCode::OversizedInput,
                  fmt::format("{} bytes exceeds ceiling of {}", bytes.size(),
                              cfg_.max_image_bytes));
  }
  if (r.width <= 0 || r.height <= 0) {
    return reject(r, ErrorCode::MalformedInput,
                  fmt::format("invalid declared size {}x{}", r.width, r.height));
  }
  const int64_t pixels = static_cast<int64_t>(r.width) * static_cast<int64_t>(r.height);
  if (pixels > cfg_.max_pixels) {
    return reject(r, ErrorCode::OversizedInput,
                  fmt::format("{} pixels exceeds ceiling of {}", pixels, cfg_.max_pixels));
  }

  const ImageEncoding enc = sniff_encoding(bytes);
  if (enc == ImageEncoding::Unknown) {
    return reject(r, ErrorCode::MalformedInput, "unrecognised image encoding");
  }

  // Header dimensions are checked before any pixel buffer is allocated.
  const std::optional<cv::Size> header = read_image_dimensions(bytes);
  if (!header) {
    return reject(r, ErrorCode::MalformedInput, "unreadable " + to_string(enc) + " header");
  }
  const int64_t header_pixels = static_cast<int64_t>(header->width) * header->height;
  if (header_pixels > cfg_.max_pixels) {
    return reject(r, ErrorCode::OversizedInput,
                  fmt::format("encoded {}x{} exceeds ceiling of {} pixels", header->width,
                              header->height, cfg_.max_pixels));
  }
  if (header->width != r.width || header->height != r.height) {
    return reject(r, ErrorCode::MalformedInput,
                  fmt::format("encoded size {}x{} does not match declared {}x{}", header->width,
                              header->height, r.width, r.height));
  }

  cv::Mat image = decode_image(bytes);
  if (image.empty()) {
    return reject(r, ErrorCode::MalformedInput, "image failed to decode as " + to_string(enc));
  }
  if (image.cols != r.width || image.rows != r.height) {
    return reject(r, ErrorCode::MalformedInput,
                  fmt::format("decoded size {}x{} does not match declared {}x{}", image.cols,
                              image.rows, r.width, r.height));
  }

  ValidationVerdict v;
  v.ok = true;
  v.encoding = enc;
  v.image = std::move(image);
  v.sanitized_note = sanitize_prompt_text(r.note, &v.injection_detected);
  if (v.injection_detected) {
    spdlog::warn("Request {}: {} in user note, sanitised text substituted", r.id,
                 to_string(ErrorCode::PromptInjectionAttempt));
  }
  emit_verdict(r, v);
  return v;
}

std::string SecurityValidator::sanitize_prompt_text(const std::string& text,
                                                    bool* injection_detected) const {
  bool suspicious = false;
  std::string out;
  out.reserve(text.size());

  for (size_t i = 0; i < text.size(); ++i) {
    const auto c = static_cast<unsigned char>(text[i]);
    if (c == 0x1B) {
      // ANSI/CSI escape: skip ESC [ params final-byte
      suspicious = true;
      if (i + 1 < text.size() && text[i + 1] == '[') {
        i += 2;
        while (i < text.size() && !(text[i] >= 0x40 && text[i] <= 0x7E)) ++i;
      }
      continue;
    }
    if (c == '\n' || c == '\r' || c == '\t') {
      out.push_back(' ');
      continue;
    }
    if (c < 0x20 || c == 0x7F) {
      suspicious = true;
      continue;
    }
    switch (c) {
      case '`': suspicious = true; out.push_back('\''); break;
      case '"': out.push_back('\''); break;
      case '{': suspicious = true; out.push_back('('); break;
      case '}': suspicious = true; out.push_back(')'); break;
      case '\\': out.push_back('/'); break;
      default: out.push_back(static_cast<char>(c)); break;
    }
  }

  std::string lowered = lowercase(out);
  for (const auto& phrase : cfg_.injection_phrases) {
    if (phrase.empty()) continue;
    size_t pos = 0;
    while ((pos = lowered.find(phrase, pos)) != std::string::npos) {
      suspicious = true;
      out.replace(pos, phrase.size(), "[removed]");
      lowered.replace(pos, phrase.size(), "[removed]");
      pos += 9;
    }
  }

  if (out.size() > cfg_.max_note_length) {
    out.resize(cfg_.max_note_length);
    trim_utf8_tail(out);
  }

  if (injection_detected) *injection_detected = suspicious;
  return out;
}

ModelTrust SecurityValidator::ensure_model_trusted(const BackendDescriptor& d,
                                                   const std::string& model_path) {
  if (model_path.empty()) return ModelTrust::Trusted;  // injected detector, no artifact

  {
    std::lock_guard<std::mutex> g(mu_);
    if (disabled_tiers_.count(d.tier)) {
      throw AnalysisError(ErrorCode::ModelIntegrityViolation,
                          "tier " + to_string(d.tier) + " disabled after integrity failure");
    }
    if (verified_models_.count(model_path)) return ModelTrust::Trusted;
  }

  std::error_code ec;
  if (!std::filesystem::exists(model_path, ec)) {
    spdlog::warn("Model artifact for {} not found: {}", d.name, model_path);
    return ModelTrust::Missing;
  }

  std::string digest;
  try {
    digest = sha256_file(model_path);
  } catch (const std::exception& e) {
    spdlog::warn("Model artifact for {} unreadable: {}", d.name, e.what());
    return ModelTrust::Missing;
  }

  std::lock_guard<std::mutex> g(mu_);
  auto it = cfg_.trusted_models.find(model_path);
  if (it == cfg_.trusted_models.end() || it->second != digest) {
    disabled_tiers_.insert(d.tier);
    const std::string detail =
        it == cfg_.trusted_models.end()
            ? fmt::format("{} has no pinned digest", model_path)
            : fmt::format("{} digest {} does not match pinned {}", model_path, digest, it->second);
    spdlog::error("{}: {}; tier {} disabled for process lifetime",
                  to_string(ErrorCode::ModelIntegrityViolation), detail, to_string(d.tier));
    if (events_) {
      events_->emit(make_event(EventKind::SecurityVerdict, 0,
                               {{"ok", false},
                                {"rejection", to_string(ErrorCode::ModelIntegrityViolation)},
                                {"backend", d.name},
                                {"tier", to_string(d.tier)},
                                {"detail", detail}}));
    }
    throw AnalysisError(ErrorCode::ModelIntegrityViolation, detail);
  }
  verified_models_.insert(model_path);
  spdlog::info("Model artifact verified for {} ({})", d.name, model_path);
  return ModelTrust::Trusted;
}

bool SecurityValidator::is_tier_disabled(Tier t) const {
  std::lock_guard<std::mutex> g(mu_);
  return disabled_tiers_.count(t) > 0;
}

std::set<Tier> SecurityValidator::disabled_tiers() const {
  std::lock_guard<std::mutex> g(mu_);
  return disabled_tiers_;
}
