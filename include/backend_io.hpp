#pragma once
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "types.hpp"

// Everything a backend sees of a request. Held by value: abandoned attempts may
// outlive the caller that launched them.
struct BackendInput {
  AnalysisRequest request;
  cv::Mat image;               // decoded BGR, read-only
  std::string sanitized_note;  // safe to interpolate into a prompt
};

struct BackendReply {
  std::vector<Hazard> hazards;
  float confidence{0.0f};
  double actual_cost{0.0};
};
