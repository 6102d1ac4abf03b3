#include "emergency_backend.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include <opencv2/imgproc.hpp>

EmergencyBackend::EmergencyBackend(EmergencyConfig cfg) : cfg_(std::move(cfg)) {
  descriptor_.name = cfg_.name;
  descriptor_.tier = Tier::Emergency;
  descriptor_.accuracy_class = 0;
  descriptor_.cost_per_call = 0.0;
  descriptor_.max_latency_ms = cfg_.max_latency_ms;
}

BackendReply EmergencyBackend::analyze(const BackendInput& input, const CancelToken&) const {
  BackendReply reply;
  reply.confidence = cfg_.confidence;

  Hazard review;
  review.type = HazardType::ManualReview;
  review.region = Region{0.0f, 0.0f, 1.0f, 1.0f};
  review.confidence = cfg_.confidence;
  review.severity = Severity::Medium;
  review.description = "Automated analysis unavailable; manual safety review required";

  if (input.image.empty()) {
    reply.hazards.push_back(review);
    return reply;
  }

  try {
    cv::Mat small;
    const double s = std::min(1.0, 640.0 / std::max(input.image.cols, input.image.rows));
    cv::resize(input.image, small, cv::Size(), s, s, cv::INTER_AREA);
    const double total = static_cast<double>(small.total());

    cv::Mat gray, edges;
    cv::cvtColor(small, gray, cv::COLOR_BGR2GRAY);
    cv::GaussianBlur(gray, gray, cv::Size(5, 5), 1.5);
    cv::Canny(gray, edges, 50, 150);
    const double edge_density = cv::countNonZero(edges) / total;
    if (edge_density >= cfg_.clutter_edge_density) {
      Hazard h;
      h.type = HazardType::Housekeeping;
      h.region = Region{0.0f, 0.0f, 1.0f, 1.0f};
      h.confidence = cfg_.confidence;
      h.severity = Severity::Low;
      h.description = "High visual clutter; check housekeeping and walkways";
      h.osha_code = "1926.25";
      reply.hazards.push_back(std::move(h));
    }

    // Fluorescent yellow/orange/lime as worn on hi-vis vests.
    cv::Mat hsv, orange, yellow, mask;
    cv::cvtColor(small, hsv, cv::COLOR_BGR2HSV);
    cv::inRange(hsv, cv::Scalar(5, 150, 150), cv::Scalar(20, 255, 255), orange);
    cv::inRange(hsv, cv::Scalar(25, 150, 150), cv::Scalar(45, 255, 255), yellow);
    cv::bitwise_or(orange, yellow, mask);
    const double coverage = cv::countNonZero(mask) / total;
    if (coverage >= cfg_.hivis_min_coverage) {
      const cv::Rect r = cv::boundingRect(mask);
      Hazard h;
      h.type = HazardType::ManualReview;
      h.region = Region{static_cast<float>(r.x) / small.cols, static_cast<float>(r.y) / small.rows,
                        static_cast<float>(r.width) / small.cols,
                        static_cast<float>(r.height) / small.rows};
      h.confidence = cfg_.confidence;
      h.severity = Severity::Medium;
      h.description = "Workers likely present (hi-vis detected); verify PPE and clearances";
      reply.hazards.push_back(std::move(h));
    }
    spdlog::debug("Emergency heuristic: edge density {:.3f}, hi-vis coverage {:.4f}",
                  edge_density, coverage);
  } catch (const cv::Exception& e) {
    spdlog::warn("Emergency heuristic degraded to manual review: {}", e.what());
  }

  reply.hazards.push_back(review);
  return reply;
}
