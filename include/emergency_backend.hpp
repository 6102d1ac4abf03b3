#pragma once
#include <string>

#include "backend_io.hpp"
#include "concurrency.hpp"
#include "types.hpp"

struct EmergencyConfig {
  std::string name{"emergency-heuristic"};
  float confidence{0.3f};
  int max_latency_ms{2000};
  double clutter_edge_density{0.12};  // Canny edge pixels / total
  double hivis_min_coverage{0.002};   // hi-vis pixels / total
};

// Deterministic OpenCV heuristic with no model, network or accelerator
// dependency. Always returns a result flagged for manual review.
class EmergencyBackend {
public:
  explicit EmergencyBackend(EmergencyConfig cfg = {});

  const BackendDescriptor& descriptor() const { return descriptor_; }

  BackendReply analyze(const BackendInput& input, const CancelToken& token) const;

private:
  EmergencyConfig cfg_;
  BackendDescriptor descriptor_;
};
