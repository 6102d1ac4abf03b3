#pragma once
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "backend_io.hpp"
#include "concurrency.hpp"
#include "types.hpp"

struct CloudConfig {
  bool enabled{true};
  std::string name{"cloud-vision"};
  std::string endpoint{"https://generativelanguage.googleapis.com"};
  std::string path;  // empty: /v1beta/models/<model>:generateContent
  std::string model{"gemini-1.5-flash"};
  double cost_per_call{0.05};
  double cost_per_1k_tokens{0.0};  // 0 = flat cost_per_call
  int max_output_tokens{2048};
  int prompt_token_allowance{1024};  // prompt text plus image tokens, for reservations
  std::string api_key_env{"HAZARDSCOPE_API_KEY"};
  int max_concurrent_requests{4};
  int connect_timeout_ms{5000};
  int read_timeout_ms{15000};
  int max_latency_ms{15000};
  int accuracy{100};
  int jpeg_quality{85};
  float empty_scene_confidence{0.8f};
};

struct CloudHttpRequest {
  std::string path;
  std::string body;
  std::string api_key;
};

struct CloudHttpResponse {
  int status{0};
  std::string body;
};

// Performs one POST; throws BackendError on transport failure.
using CloudTransport =
    std::function<CloudHttpResponse(const CloudHttpRequest&, const CancelToken&)>;

// Returns the decrypted API key on demand; nullopt when none is provisioned.
using CredentialProvider = std::function<std::optional<std::string>()>;

// Upper bound reserved before a call: the flat cost, or under per-token pricing
// the allowance plus max_output_tokens at the configured rate, whichever is larger.
double cloud_reservation_cost(const CloudConfig& cfg);

CloudTransport make_http_transport(const CloudConfig& cfg);
CredentialProvider env_credential_provider(const std::string& variable);

class CloudBackend {
public:
  CloudBackend(CloudConfig cfg, CloudTransport transport, CredentialProvider credentials);

  const BackendDescriptor& descriptor() const { return descriptor_; }

  BackendReply analyze(const BackendInput& input, const CancelToken& token) const;

  static std::string build_prompt(WorkType work_type, const std::string& sanitized_note);
  nlohmann::json build_request(const BackendInput& input) const;

  // Throws BackendError when the payload is not the expected shape.
  BackendReply parse_response(const std::string& body) const;

  // Removes a surrounding ```json ... ``` fence if present.
  static std::string strip_markdown_fence(const std::string& text);

private:
  std::string request_path() const;

  CloudConfig cfg_;
  CloudTransport transport_;
  CredentialProvider credentials_;
  BackendDescriptor descriptor_;
};
