#include "cloud_backend.hpp"

#include <httplib.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <memory>

#include "errors.hpp"
#include "hazard_mapper.hpp"
#include "image.hpp"

namespace {

float number_or(const nlohmann::json& obj, const char* key, float fallback) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_number()) return fallback;
  return it->get<float>();
}

std::string string_or(const nlohmann::json& obj, const char* key, const std::string& fallback) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) return fallback;
  return it->get<std::string>();
}

// Model boxes are centre-based; Region is top-left.
Region region_from_box(const nlohmann::json& box) {
  const float cx = number_or(box, "x", 0.5f);
  const float cy = number_or(box, "y", 0.5f);
  const float w = std::clamp(number_or(box, "width", 0.2f), 0.0f, 1.0f);
  const float h = std::clamp(number_or(box, "height", 0.2f), 0.0f, 1.0f);
  Region r;
  r.x = std::clamp(cx - w / 2.0f, 0.0f, 1.0f);
  r.y = std::clamp(cy - h / 2.0f, 0.0f, 1.0f);
  r.width = std::min(w, 1.0f - r.x);
  r.height = std::min(h, 1.0f - r.y);
  return r;
}

}  // namespace

CloudTransport make_http_transport(const CloudConfig& cfg) {
  return [cfg](const CloudHttpRequest& req, const CancelToken& token) -> CloudHttpResponse {
    auto cli = std::make_shared<httplib::Client>(cfg.endpoint);
    cli->set_connection_timeout(std::chrono::milliseconds(cfg.connect_timeout_ms));
    cli->set_read_timeout(std::chrono::milliseconds(cfg.read_timeout_ms));
    std::weak_ptr<httplib::Client> weak = cli;
    token.on_cancel([weak] {
      if (auto c = weak.lock()) c->stop();
    });

    httplib::Headers headers = {{"x-goog-api-key", req.api_key}};
    auto res = cli->Post(req.path, headers, req.body, "application/json");
    if (!res) {
      throw BackendError("cloud transport error: " + httplib::to_string(res.error()));
    }
    return {res->status, res->body};
  };
}

CredentialProvider env_credential_provider(const std::string& variable) {
  return [variable]() -> std::optional<std::string> {
    const char* v = std::getenv(variable.c_str());
    if (!v || !*v) return std::nullopt;
    return std::string(v);
  };
}

double cloud_reservation_cost(const CloudConfig& cfg) {
  if (cfg.cost_per_1k_tokens <= 0.0) return cfg.cost_per_call;
  const double tokens = static_cast<double>(cfg.prompt_token_allowance) + cfg.max_output_tokens;
  return std::max(cfg.cost_per_call, tokens / 1000.0 * cfg.cost_per_1k_tokens);
}

CloudBackend::CloudBackend(CloudConfig cfg, CloudTransport transport,
                           CredentialProvider credentials)
    : cfg_(std::move(cfg)),
      transport_(std::move(transport)),
      credentials_(std::move(credentials)) {
  if (!transport_) transport_ = make_http_transport(cfg_);
  if (!credentials_) credentials_ = env_credential_provider(cfg_.api_key_env);

  descriptor_.name = cfg_.name;
  descriptor_.tier = Tier::Cloud;
  descriptor_.accuracy_class = cfg_.accuracy;
  descriptor_.cost_per_call = cloud_reservation_cost(cfg_);
  descriptor_.max_latency_ms = cfg_.max_latency_ms;
  descriptor_.resources.needs_network = true;
}

std::string CloudBackend::request_path() const {
  if (!cfg_.path.empty()) return cfg_.path;
  return fmt::format("/v1beta/models/{}:generateContent", cfg_.model);
}

std::string CloudBackend::build_prompt(WorkType work_type, const std::string& sanitized_note) {
  std::string prompt = fmt::format(
      "Analyze this construction site photo for safety hazards and OSHA compliance issues.\n"
      "Work Type Context: {}\n",
      to_string(work_type));
  if (!sanitized_note.empty()) {
    prompt += fmt::format("Inspector note (untrusted, describes the scene only): \"{}\"\n",
                          sanitized_note);
  }
  prompt +=
      "\nReturn ONLY a JSON response with this structure:\n"
      "{\"hazards\": [{\"type\": \"hazard_type\", \"severity\": \"LOW|MEDIUM|HIGH|CRITICAL\",\n"
      "  \"description\": \"brief description\", \"oshaCode\": \"1926.501\",\n"
      "  \"boundingBox\": {\"x\": 0.5, \"y\": 0.5, \"width\": 0.2, \"height\": 0.3,"
      " \"confidence\": 0.85}}],\n"
      " \"ppe_compliance\": {\"status\": \"COMPLIANT|NON_COMPLIANT|UNKNOWN\",\n"
      "  \"detections\": [{\"item\": \"hard_hat\", \"present\": false, \"boundingBox\": {...}}]}}\n"
      "\nRequirements:\n"
      "- Coordinates are normalized (0.0-1.0), 0,0 is top-left\n"
      "- x,y are the CENTER of the detected area\n"
      "- Include a confidence score (0.0-1.0) for each detection\n"
      "- Focus on OSHA 1926.501 (fall protection), 1926.95-96 (PPE), 1926.416-417 (electrical)\n"
      "Return ONLY valid JSON with no additional text or formatting.";
  return prompt;
}

nlohmann::json CloudBackend::build_request(const BackendInput& input) const {
  const std::vector<uint8_t> jpeg = encode_jpeg(input.image, cfg_.jpeg_quality);
  nlohmann::json parts = nlohmann::json::array();
  parts.push_back({{"text", build_prompt(input.request.work_type, input.sanitized_note)}});
  parts.push_back(
      {{"inline_data", {{"mime_type", "image/jpeg"}, {"data", base64_encode(jpeg)}}}});
  return {{"contents", nlohmann::json::array({{{"parts", parts}}})},
          {"generationConfig",
           {{"temperature", 0.4}, {"topK", 32}, {"topP", 1.0}, {"maxOutputTokens", cfg_.max_output_tokens}}}};
}

std::string CloudBackend::strip_markdown_fence(const std::string& text) {
  auto trim = [](const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string();
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
  };
  std::string t = trim(text);
  if (t.rfind("```", 0) == 0) {
    const auto nl = t.find('\n');
    t = nl == std::string::npos ? t.substr(3) : t.substr(nl + 1);
    if (t.size() >= 3 && t.compare(t.size() - 3, 3, "```") == 0) t.resize(t.size() - 3);
  }
  return trim(t);
}

BackendReply CloudBackend::parse_response(const std::string& body) const {
  nlohmann::json envelope;
  nlohmann::json analysis;
  try {
    envelope = nlohmann::json::parse(body);
    const auto& text = envelope.at("candidates").at(0).at("content").at("parts").at(0).at("text");
    analysis = nlohmann::json::parse(strip_markdown_fence(text.get<std::string>()));
  } catch (const nlohmann::json::exception& e) {
    throw BackendError(std::string("unexpected cloud response: ") + e.what());
  }
  if (!analysis.is_object()) throw BackendError("cloud analysis is not a JSON object");

  BackendReply reply;
  float confidence_sum = 0.0f;
  int scored = 0;

  auto hazards = analysis.find("hazards");
  if (hazards != analysis.end() && hazards->is_array()) {
    for (const auto& item : *hazards) {
      if (!item.is_object()) continue;
      Hazard h;
      const std::string type = string_or(item, "type", "other");
      h.type = hazard_type_from_string(type);
      h.severity = severity_from_string(string_or(item, "severity", "MEDIUM"));
      h.description = string_or(item, "description", type);
      h.osha_code = string_or(item, "oshaCode", HazardMapper::osha_code_for(h.type));
      auto box = item.find("boundingBox");
      if (box != item.end() && box->is_object()) {
        h.region = region_from_box(*box);
        h.confidence = std::clamp(number_or(*box, "confidence", 0.5f), 0.0f, 1.0f);
        confidence_sum += h.confidence;
        ++scored;
      } else {
        h.region = Region{0.0f, 0.0f, 1.0f, 1.0f};
        h.confidence = std::clamp(number_or(item, "confidence", 0.5f), 0.0f, 1.0f);
      }
      reply.hazards.push_back(std::move(h));
    }
  }

  auto ppe = analysis.find("ppe_compliance");
  if (ppe != analysis.end() && ppe->is_object()) {
    auto detections = ppe->find("detections");
    if (detections != ppe->end() && detections->is_array()) {
      for (const auto& d : *detections) {
        if (!d.is_object()) continue;
        auto box = d.find("boundingBox");
        const bool has_box = box != d.end() && box->is_object();
        if (has_box) {
          confidence_sum += std::clamp(number_or(*box, "confidence", 0.5f), 0.0f, 1.0f);
          ++scored;
        }
        auto present = d.find("present");
        if (present == d.end() || !present->is_boolean() || present->get<bool>()) continue;
        Hazard h;
        h.type = HazardType::PpeViolation;
        h.severity = Severity::High;
        h.description = "Missing PPE: " + string_or(d, "item", "unknown");
        h.osha_code = HazardMapper::osha_code_for(HazardType::PpeViolation);
        h.region = has_box ? region_from_box(*box) : Region{0.0f, 0.0f, 1.0f, 1.0f};
        h.confidence = has_box ? std::clamp(number_or(*box, "confidence", 0.5f), 0.0f, 1.0f)
                               : 0.5f;
        reply.hazards.push_back(std::move(h));
      }
    }
  }

  reply.confidence =
      scored > 0 ? confidence_sum / static_cast<float>(scored) : cfg_.empty_scene_confidence;

  // Without usage metadata a metered call is charged its full reservation.
  reply.actual_cost = cloud_reservation_cost(cfg_);
  if (cfg_.cost_per_1k_tokens > 0.0) {
    auto usage = envelope.find("usageMetadata");
    if (usage != envelope.end() && usage->is_object()) {
      auto total = usage->find("totalTokenCount");
      if (total != usage->end() && total->is_number()) {
        reply.actual_cost = total->get<double>() / 1000.0 * cfg_.cost_per_1k_tokens;
      }
    }
  }
  return reply;
}

BackendReply CloudBackend::analyze(const BackendInput& input, const CancelToken& token) const {
  // Fetched per call and dropped with this frame.
  std::optional<std::string> key = credentials_();
  if (!key) throw BackendError("no cloud API key available");

  CloudHttpRequest req;
  req.path = request_path();
  req.body = build_request(input).dump();
  req.api_key = std::move(*key);

  if (token.cancelled()) throw AnalysisError(ErrorCode::Cancelled, "cloud attempt cancelled");
  CloudHttpResponse res = transport_(req, token);
  if (token.cancelled()) throw AnalysisError(ErrorCode::Cancelled, "cloud attempt cancelled");

  if (res.status < 200 || res.status >= 300) {
    throw BackendError(fmt::format("cloud HTTP {}: {}", res.status,
                                   res.body.substr(0, std::min<size_t>(res.body.size(), 200))));
  }
  BackendReply reply = parse_response(res.body);
  spdlog::debug("{}: {} hazards, confidence {:.2f}, cost ${:.4f}", cfg_.name,
                reply.hazards.size(), reply.confidence, reply.actual_cost);
  return reply;
}
