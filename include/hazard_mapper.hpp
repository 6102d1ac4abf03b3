#pragma once
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <opencv2/core.hpp>

#include "types.hpp"

// Raw detector output in source-image pixels.
struct Detection {
  int class_id{-1};
  float confidence{0.0f};
  cv::Rect bbox;
  std::string label;
  cv::Point2f center() const {
    return cv::Point2f(static_cast<float>(bbox.x) + static_cast<float>(bbox.width) / 2.0f,
                       static_cast<float>(bbox.y) + static_cast<float>(bbox.height) / 2.0f);
  }
};

struct HazardRule {
  HazardType type{HazardType::Other};
  Severity severity{Severity::Medium};
  std::string osha_code;
  std::string description;
};

struct HazardMapperConfig {
  // Person/equipment centre distance, as a fraction of the image diagonal,
  // below which a struck-by hazard is raised.
  float proximity_threshold{0.25f};
  std::unordered_set<std::string> equipment_labels = {
      "truck", "car", "bus", "train", "forklift", "excavator", "bulldozer", "loader",
      "backhoe", "dump_truck", "crane", "skid_steer"};
};

// Turns detector labels into construction hazards with OSHA references.
class HazardMapper {
public:
  explicit HazardMapper(HazardMapperConfig cfg = {});

  std::vector<Hazard> map(const std::vector<Detection>& detections, const cv::Size& image_size,
                          WorkType work_type) const;

  const HazardRule* rule_for(const std::string& label) const;

  static std::string osha_code_for(HazardType t);

private:
  Region normalise(const cv::Rect& r, const cv::Size& image_size) const;
  Severity adjust_for_work_type(HazardType t, Severity s, WorkType w) const;

  HazardMapperConfig cfg_;
  std::unordered_map<std::string, HazardRule> rules_;
};

// Averages hazard confidences; empty scenes report `empty_scene_confidence`.
float aggregate_confidence(const std::vector<Hazard>& hazards, float empty_scene_confidence);
